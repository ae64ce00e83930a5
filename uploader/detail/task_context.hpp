#pragma once
#ifndef S3DROP_UPLOADER_DETAIL_TASK_CONTEXT_HPP_
#define S3DROP_UPLOADER_DETAIL_TASK_CONTEXT_HPP_

#include "uploader/adi.hpp"
#include "storage/client.hpp"
#include "uploader/detail/cancellation_token.hpp"
#include "uploader/detail/retry_policy.hpp"
#include "detail/progress_notification.hpp"

namespace s3drop {
	namespace uploader {
		namespace detail {
			// what every task of one manager shares, outlives all of them
			struct task_context {
				boost::asio::io_context&					net_io_ctx;
				boost::asio::io_context&					disk_io_ctx;
				std::shared_ptr<storage::client>			client;
				const settings								config;
				const retry_policy							policy;
				cancellation_handle							token;
				core::detail::progress_notification&		notifier;

				task_context(boost::asio::io_context& net, boost::asio::io_context& disk,
					std::shared_ptr<storage::client> storage_client, settings cfg,
					core::detail::progress_notification& notify);
				task_context(const task_context&) = delete;
				task_context(task_context&&) = delete;
				task_context& operator=(const task_context&) = delete;
				task_context& operator=(task_context&&) = delete;
				~task_context();
			};
		}
	}
}

#endif
