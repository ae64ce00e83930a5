#pragma once
#ifndef S3DROP_STORAGE_DETAIL_HTTP_CLIENT_HPP_
#define S3DROP_STORAGE_DETAIL_HTTP_CLIENT_HPP_

#include "storage/client.hpp"
#include "storage/detail/http_exchange.hpp"
#include "storage/detail/request_signer.hpp"

namespace s3drop {
	namespace storage {
		namespace detail {
			struct parsed_endpoint{
				bool			use_tls = true;
				std::string		host;
				std::string		port;
				// path prefix of the endpoint url, without trailing '/'
				std::string		base_path;
				// what the Host header carries, port included when not the default one
				std::string		host_header;
			};

			api::optional<parsed_endpoint> parse_endpoint(const std::string& url);

			// S3 REST over Beast, path-style addressing, SigV4 signed
			class http_client : public client, public std::enable_shared_from_this<http_client> {
				using response_handler = std::function<void(const error&, http_response)>;

				boost::asio::io_context&	m_net_io_ctx;
				boost::asio::ssl::context	m_ssl_ctx;
				endpoint_config				m_config;
				parsed_endpoint				m_endpoint;
				request_signer				m_signer;
				struct private_ctor_tag{};

				std::string object_path(const object_key& key) const;
				void execute(boost::beast::http::verb method, const object_key& key,
					query_parameters query, std::string body, const std::string& content_type,
					response_handler done);
			public:
				http_client(boost::asio::io_context& net_io_ctx, endpoint_config endpoint,
					parsed_endpoint parsed, credentials creds, private_ctor_tag tag);
				http_client(const http_client&) = delete;
				http_client& operator=(const http_client&) = delete;

				static std::shared_ptr<http_client> create(boost::asio::io_context& net_io_ctx,
					endpoint_config endpoint, credentials creds);

				void put_object(const object_key& key, blob body,
					const std::string& content_type, handler<etag> done) override;
				void create_multipart(const object_key& key,
					const std::string& content_type, handler<upload_id> done) override;
				void upload_part(const object_key& key, const upload_id& id,
					std::uint32_t part_number, blob body, handler<etag> done) override;
				void complete_multipart(const object_key& key, const upload_id& id,
					std::vector<completed_part> parts, handler<nothing> done) override;
				void abort_multipart(const object_key& key, const upload_id& id,
					handler<nothing> done) override;

				std::string object_url(const object_key& key) const override;
				~http_client() override;
			};
		}
	}
}

#endif
