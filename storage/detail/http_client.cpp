#include "storage/detail/http_client.hpp"
#include "storage/detail/xml_document.hpp"
#include "detail/logger.hpp"

#include <stdexcept>

namespace s3drop {
	namespace storage {
		client::~client() = default;

		std::shared_ptr<client> make_http_client(boost::asio::io_context& net_io_ctx,
			endpoint_config endpoint, credentials creds){
			return detail::http_client::create(net_io_ctx, std::move(endpoint), std::move(creds));
		}

		namespace detail {
			namespace http = boost::beast::http;

			namespace {
				std::string to_std_string(boost::beast::string_view sv){
					return std::string(sv.data(), sv.size());
				}
			}

			api::optional<parsed_endpoint> parse_endpoint(const std::string& url){
				auto result = parsed_endpoint{};
				auto rest = std::string{};
				if (url.compare(0, 8, "https://") == 0){
					result.use_tls = true;
					rest = url.substr(8);
				}
				else if (url.compare(0, 7, "http://") == 0){
					result.use_tls = false;
					rest = url.substr(7);
				}
				else
					return api::nullopt;

				auto slash = rest.find('/');
				auto authority = rest.substr(0, slash);
				if (slash != std::string::npos)
					result.base_path = rest.substr(slash);
				while (not result.base_path.empty() and result.base_path.back() == '/')
					result.base_path.pop_back();
				if (authority.empty())
					return api::nullopt;

				auto colon = authority.rfind(':');
				if (colon != std::string::npos and authority.find(']', colon) == std::string::npos){
					result.host = authority.substr(0, colon);
					result.port = authority.substr(colon + 1);
					if (result.port.empty() or result.host.empty())
						return api::nullopt;
				}
				else{
					result.host = authority;
					result.port = result.use_tls ? "443" : "80";
				}
				auto default_port = result.use_tls ? "443" : "80";
				result.host_header = (result.port == default_port) ? result.host : result.host + ':' + result.port;
				return result;
			}

			http_client::http_client(boost::asio::io_context& net_io_ctx, endpoint_config endpoint,
				parsed_endpoint parsed, credentials creds, private_ctor_tag tag)
				: m_net_io_ctx(net_io_ctx),
				m_ssl_ctx(boost::asio::ssl::context::tls_client),
				m_config(std::move(endpoint)),
				m_endpoint(std::move(parsed)),
				m_signer(std::move(creds), m_config.region){
				m_ssl_ctx.set_default_verify_paths();
				m_ssl_ctx.set_verify_mode(boost::asio::ssl::verify_peer);
				while (not m_config.endpoint.empty() and m_config.endpoint.back() == '/')
					m_config.endpoint.pop_back();
			}

			std::shared_ptr<http_client> http_client::create(boost::asio::io_context& net_io_ctx,
				endpoint_config endpoint, credentials creds){
				auto parsed = parse_endpoint(endpoint.endpoint);
				if (not parsed)
					throw std::invalid_argument("unsupported storage endpoint: " + endpoint.endpoint);
				return std::make_shared<http_client>(net_io_ctx, std::move(endpoint), std::move(parsed.value()),
					std::move(creds), private_ctor_tag{});
			}

			http_client::~http_client() = default;

			std::string http_client::object_path(const object_key& key) const {
				return m_endpoint.base_path + '/' + uri_encode(m_config.bucket, false) + '/' + uri_encode(key, true);
			}

			void http_client::execute(http::verb method, const object_key& key,
				query_parameters query, std::string body, const std::string& content_type,
				response_handler done){
				auto path = object_path(key);
				auto query_string = canonical_query(query);

				auto req = http_request{method, query_string.empty() ? path : path + '?' + query_string, 11};
				auto input = request_signer::signing_input{};
				input.method = to_std_string(http::to_string(method));
				input.canonical_uri = path;
				input.query = std::move(query);
				input.host = m_endpoint.host_header;
				input.payload_hash = sha256_hex(api::string_view{body});
				input.when = std::chrono::system_clock::now();
				auto sig = m_signer.sign(input);

				req.set(http::field::host, m_endpoint.host_header);
				req.set(http::field::user_agent, "s3drop");
				req.set("x-amz-date", sig.amz_date);
				req.set("x-amz-content-sha256", sig.content_sha256);
				req.set(http::field::authorization, sig.authorization);
				if (not content_type.empty())
					req.set(http::field::content_type, content_type);
				req.body() = std::move(body);
				req.prepare_payload();
				log::get().debug("{} {} ({} bytes)", input.method, to_std_string(req.target()), req.body().size());

				auto on_exchanged = [this_client = shared_from_this(), done = std::move(done)]
					(const boost::system::error_code& ec, const char* stage, http_response resp){
					if (ec){
						done(make_transport_error(ec, stage), http_response{});
						return;
					}
					auto status = resp.result_int();
					if (status < 200u or status >= 300u){
						auto err_doc = parse_error_document(resp.body());
						if (err_doc)
							done(make_http_error(status, err_doc->code, err_doc->message), http_response{});
						else
							done(make_http_error(status, "", to_std_string(resp.reason())), http_response{});
						return;
					}
					done(error{}, std::move(resp));
				};

				if (m_endpoint.use_tls)
					http_exchange<tls_stream>::create(m_net_io_ctx, std::move(req), m_endpoint.host,
						m_endpoint.port, m_ssl_ctx)->run(std::move(on_exchanged));
				else
					http_exchange<plain_stream>::create(m_net_io_ctx, std::move(req), m_endpoint.host,
						m_endpoint.port)->run(std::move(on_exchanged));
			}

			void http_client::put_object(const object_key& key, blob body,
				const std::string& content_type, handler<etag> done){
				auto payload = body ? std::string{body->begin(), body->end()} : std::string{};
				execute(http::verb::put, key, {}, std::move(payload), content_type,
					[done = std::move(done)](const error& err, http_response resp){
						if (err)
							return done(err, etag{});
						done(error{}, to_std_string(resp[http::field::etag]));
					});
			}

			void http_client::create_multipart(const object_key& key,
				const std::string& content_type, handler<upload_id> done){
				execute(http::verb::post, key, {{"uploads", ""}}, std::string{}, content_type,
					[done = std::move(done)](const error& err, http_response resp){
						if (err)
							return done(err, upload_id{});
						auto id = parse_upload_id(resp.body());
						if (not id)
							return done(make_http_error(resp.result_int(), "", "no UploadId in InitiateMultipartUpload response"), upload_id{});
						done(error{}, std::move(id.value()));
					});
			}

			void http_client::upload_part(const object_key& key, const upload_id& id,
				std::uint32_t part_number, blob body, handler<etag> done){
				auto payload = body ? std::string{body->begin(), body->end()} : std::string{};
				execute(http::verb::put, key,
					{{"partNumber", std::to_string(part_number)}, {"uploadId", id}},
					std::move(payload), std::string{},
					[done = std::move(done), part_number](const error& err, http_response resp){
						if (err)
							return done(err, etag{});
						auto tag = to_std_string(resp[http::field::etag]);
						if (tag.empty())
							return done(make_http_error(resp.result_int(), "",
								"no ETag for part " + std::to_string(part_number)), etag{});
						done(error{}, std::move(tag));
					});
			}

			void http_client::complete_multipart(const object_key& key, const upload_id& id,
				std::vector<completed_part> parts, handler<nothing> done){
				execute(http::verb::post, key, {{"uploadId", id}},
					make_complete_multipart_body(parts), "application/xml",
					[done = std::move(done)](const error& err, http_response resp){
						if (err)
							return done(err, nothing{});
						// the service may answer 200 and still report a failure in the body
						auto err_doc = parse_error_document(resp.body());
						if (err_doc)
							return done(make_http_error(resp.result_int(), err_doc->code, err_doc->message), nothing{});
						done(error{}, nothing{});
					});
			}

			void http_client::abort_multipart(const object_key& key, const upload_id& id,
				handler<nothing> done){
				execute(http::verb::delete_, key, {{"uploadId", id}}, std::string{}, std::string{},
					[done = std::move(done)](const error& err, http_response){
						done(err, nothing{});
					});
			}

			std::string http_client::object_url(const object_key& key) const {
				return m_config.endpoint + '/' + m_config.bucket + '/' + uri_encode(key, true);
			}
		}
	}
}
