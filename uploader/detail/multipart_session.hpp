#pragma once
#ifndef S3DROP_UPLOADER_DETAIL_MULTIPART_SESSION_HPP_
#define S3DROP_UPLOADER_DETAIL_MULTIPART_SESSION_HPP_

#include "storage/client.hpp"
#include "uploader/detail/cancellation_token.hpp"
#include "uploader/detail/retry_policy.hpp"
#include <memory>
#include <mutex>
#include <vector>

namespace s3drop {
	namespace uploader {
		namespace detail {
			// Owns one open multipart upload. Whoever drops the last reference without a
			// successful complete() gets the upload aborted, exactly once, from the
			// detached jobs unit.
			class multipart_session : public std::enable_shared_from_this<multipart_session> {
				struct private_ctor_tag {};
				enum class state {
					open,
					completing,
					completed,
					aborted
				};

				std::shared_ptr<storage::client>	m_client;
				storage::object_key					m_key;
				storage::upload_id					m_id;
				boost::asio::io_context&			m_net_io_ctx;
				retry_policy						m_policy;
				cancellation_handle					m_token;
				mutable std::mutex					m_state_mutex;
				state								m_state = state::open;
				// in the order the transfers finished
				std::vector<storage::completed_part>	m_parts;

				static void release(std::shared_ptr<storage::client> client,
					storage::object_key key, storage::upload_id id);
			public:
				using open_handler = std::function<void (const storage::error&, std::shared_ptr<multipart_session>)>;

				multipart_session(std::shared_ptr<storage::client> client, storage::object_key key,
					storage::upload_id id, boost::asio::io_context& net_io_ctx, retry_policy policy,
					cancellation_handle token, private_ctor_tag tag);
				multipart_session(const multipart_session&) = delete;
				multipart_session& operator=(const multipart_session&) = delete;
				~multipart_session();

				static void open(std::shared_ptr<storage::client> client, storage::object_key key,
					std::string content_type, boost::asio::io_context& net_io_ctx, retry_policy policy,
					cancellation_handle token, open_handler done);

				void upload_part(std::uint32_t part_number, blob body, storage::handler<storage::etag> done);
				// fails without a network call when the recorded parts are not 1..n
				void complete(storage::handler<storage::nothing> done);
				void abort();

				const storage::upload_id& id() const;
				const storage::object_key& key() const;
				std::vector<storage::completed_part> sorted_parts() const;
				bool completed() const;
			};
		}
	}
}

#endif
