#pragma once
#ifndef S3DROP_UPLOADER_MANAGER_HPP_
#define S3DROP_UPLOADER_MANAGER_HPP_

#include "api_binder.hpp"
#include "uploader/adi.hpp"
#include "uploader/progress_channel.hpp"
#include "storage/client.hpp"
#include <system_error>

namespace s3drop::uploader{
	class manager{
		class impl;
		std::unique_ptr<impl>			m_impl;
	public:
		// settings are validated here, settings_error when they are unusable
		manager(settings cfg, storage::credentials creds);
		manager(settings cfg, std::shared_ptr<storage::client> client);
		manager(const manager&) = delete;
		manager(manager&&) = delete;
		manager& operator=(const manager&) = delete;
		manager& operator=(manager&&) = delete;
		// cancels whatever runs and waits for it
		~manager();

		void run();
		void stop();

		// number of tasks accepted, device_or_resource_busy while another batch runs
		api::variant<std::size_t, std::error_condition>
			start_batch(std::vector<task::request> requests, batch::completion_handler done);
		api::variant<std::size_t, std::error_condition>
			start_files(const std::vector<api::fs::path>& files, batch::completion_handler done);

		// blocking forms, return once every task of the batch is terminal
		api::variant<batch::report, std::error_condition> upload(std::vector<task::request> requests);
		api::variant<batch::report, std::error_condition> upload_files(const std::vector<api::fs::path>& files);

		static api::variant<task::request, std::error_condition> make_request(const api::fs::path& file);

		void cancel_all();
		progress_channel& progress();

		api::optional<std::uint32_t> install_progress_monitor(task::progress::listener lst);
		api::optional<std::uint32_t> install_history_listener(history::record::listener lst);
		bool remove_listener(std::uint32_t key);
	};
}

#endif
