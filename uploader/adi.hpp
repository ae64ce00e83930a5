// ADI is short for Application Data Interface
#pragma once
#ifndef S3DROP_UPLOADER_ADI_HPP_
#define S3DROP_UPLOADER_ADI_HPP_

#include "api_binder.hpp"
#include "detail/common.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace s3drop {
	namespace uploader {
		// immutable snapshot handed over at manager construction
		struct settings{
			std::string					endpoint;
			std::string					bucket;
			std::string					region;
			std::size_t					parallel_uploads = 3u;
			std::uint64_t				multipart_threshold = 5u * Mega;
			std::uint64_t				multipart_chunk_size = 5u * Mega;
			std::size_t					parts_in_flight = 2u;
			std::uint32_t				max_attempts = 3u;
			std::chrono::milliseconds	base_delay = std::chrono::milliseconds(200);
			std::chrono::milliseconds	max_delay = std::chrono::seconds(5);
		};

		namespace task {
			using id = std::uint64_t;

			struct request{
				api::fs::path	source_path;
				std::string		destination_key;
				std::uint64_t	size = 0u;
			};

			struct single_put{};
			struct multipart{
				std::uint64_t	chunk_size;
			};
			using strategy = api::variant<single_put, multipart>;

			enum class status{
				started,
				in_progress,
				completed,
				failed,
				cancelled
			};

			struct progress{
				id				task_id = 0u;
				std::uint64_t	bytes_transferred = 0u;
				std::uint64_t	total_bytes = 0u;
				status			current_status = status::started;
				// why the task failed, empty otherwise
				std::string		reason;
				using listener = std::function<void (const progress&)>;

				bool is_terminal() const;
			};

			const char* to_string(status s);
		}

		namespace history {
			// what the history keeper gets for every completed upload
			struct record{
				task::id								task_id = 0u;
				api::fs::path							source_path;
				std::string								object_key;
				std::string								url;
				std::uint64_t							size = 0u;
				std::chrono::system_clock::time_point	uploaded_at;
				using listener = std::function<void (const record&)>;
			};
		}

		namespace batch {
			struct report{
				std::size_t						completed = 0u;
				std::size_t						failed = 0u;
				std::size_t						cancelled = 0u;
				// terminal event of every task, in the order the tasks finished
				std::vector<task::progress>		outcomes;
			};
			using completion_handler = std::function<void (const report&)>;
		}
	}
}

#endif
