#include "uploader/detail/task_context.hpp"

namespace s3drop {
	namespace uploader {
		namespace detail {
			task_context::task_context(boost::asio::io_context& net, boost::asio::io_context& disk,
				std::shared_ptr<storage::client> storage_client, settings cfg,
				core::detail::progress_notification& notify)
				: net_io_ctx(net), disk_io_ctx(disk),
				client(std::move(storage_client)),
				config(std::move(cfg)),
				policy(config.max_attempts, config.base_delay, config.max_delay),
				token(std::make_shared<cancellation_token>()),
				notifier(notify){}

			task_context::~task_context() = default;
		}
	}
}
