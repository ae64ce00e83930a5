#pragma once
#ifndef S3DROP_UPLOADER_DETAIL_UPLOAD_TASK_HPP_
#define S3DROP_UPLOADER_DETAIL_UPLOAD_TASK_HPP_

#include "uploader/detail/task_context.hpp"
#include "uploader/detail/chunk_plan.hpp"
#include "uploader/detail/multipart_session.hpp"
#include <fstream>
#include <mutex>

namespace s3drop {
	namespace uploader {
		namespace detail {
			class upload_task : public std::enable_shared_from_this<upload_task> {
				struct private_ctor_tag{};
				enum class phase {
					pending,
					strategy_selected,
					uploading,
					completed,
					failed,
					cancelled
				};
			public:
				using finish_handler = std::function<void (const task::progress&)>;

				upload_task(task_context& context, task::id id, task::request req,
					finish_handler on_finish, private_ctor_tag tag);
				upload_task(const upload_task&) = delete;
				upload_task& operator=(const upload_task&) = delete;
				~upload_task();

				static std::shared_ptr<upload_task> create(task_context& context, task::id id,
					task::request req, finish_handler on_finish);

				// at or above the threshold goes multipart
				static task::strategy select_strategy(std::uint64_t size, const settings& cfg);

				void run();
				task::id id() const;
			private:
				task_context&							m_context;
				const task::id							m_id;
				const task::request						m_request;
				const std::string						m_content_type;
				finish_handler							m_on_finish;

				std::mutex								m_state_mutex;
				phase									m_phase = phase::pending;
				std::uint64_t							m_bytes_transferred = 0u;

				// disk unit only
				std::ifstream							m_file_stream;

				api::optional<chunk_plan>				m_plan;
				std::shared_ptr<multipart_session>		m_session;
				std::uint32_t							m_next_part = 1u;
				std::size_t								m_parts_in_flight = 0u;
				api::optional<storage::error>			m_first_error;

				void do_single_put();
				void do_open_session();
				void do_schedule_parts();
				void do_upload_part(std::uint32_t part_number);
				void do_complete();

				void on_part_done(std::uint32_t part_number, std::uint64_t length, const storage::error& err);
				// runs with m_state_mutex held, nullopt when the task already was terminal
				api::optional<task::progress> schedule_parts_locked();
				api::optional<task::progress> finish_locked(const storage::error& err);
				task::progress emit_locked(task::status st, std::string reason = {});
				void notify_finished(const api::optional<task::progress>& terminal);

				storage::error read_range(std::uint64_t offset, std::uint64_t length, blob& out);
				bool is_terminal_locked() const;
			};
		}
	}
}

#endif
