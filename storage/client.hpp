#pragma once
#ifndef S3DROP_STORAGE_CLIENT_HPP_
#define S3DROP_STORAGE_CLIENT_HPP_

#include "storage/adi.hpp"
#include "storage/error.hpp"
#include "detail/common.hpp"
#include "boost/asio/io_context.hpp"
#include <functional>
#include <memory>

namespace s3drop {
	namespace storage {
		template<typename T>
		using handler = std::function<void(const error&, T)>;

		// Every operation is exactly one round trip to the object store and completes
		// its handler exactly once, on a thread of the client's choosing. Failures are
		// classified here; retrying is up to the caller.
		class client {
		public:
			virtual void put_object(const object_key& key, blob body,
				const std::string& content_type, handler<etag> done) = 0;
			virtual void create_multipart(const object_key& key,
				const std::string& content_type, handler<upload_id> done) = 0;
			virtual void upload_part(const object_key& key, const upload_id& id,
				std::uint32_t part_number, blob body, handler<etag> done) = 0;
			virtual void complete_multipart(const object_key& key, const upload_id& id,
				std::vector<completed_part> parts, handler<nothing> done) = 0;
			virtual void abort_multipart(const object_key& key, const upload_id& id,
				handler<nothing> done) = 0;

			virtual std::string object_url(const object_key& key) const = 0;
			virtual ~client();
		};

		std::shared_ptr<client> make_http_client(boost::asio::io_context& net_io_ctx,
			endpoint_config endpoint, credentials creds);
	}
}

#endif
