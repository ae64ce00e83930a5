#pragma once
#ifndef S3DROP_STORAGE_DETAIL_HTTP_EXCHANGE_HPP_
#define S3DROP_STORAGE_DETAIL_HTTP_EXCHANGE_HPP_

#include "boost/asio.hpp"
#include "boost/asio/ssl.hpp"
#include "boost/beast/core.hpp"
#include "boost/beast/http.hpp"
#include "boost/beast/ssl.hpp"
#include <functional>
#include <memory>
#include <string>
#include <type_traits>

namespace s3drop {
	namespace storage {
		namespace detail {
			using http_request = boost::beast::http::request<boost::beast::http::string_body>;
			using http_response = boost::beast::http::response<boost::beast::http::string_body>;
			// stage names the step that failed, nullptr on success
			using exchange_handler = std::function<void(const boost::system::error_code&, const char* stage, http_response)>;

			using plain_stream = boost::beast::tcp_stream;
			using tls_stream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

			// one request, one response, one connection
			template<typename Stream>
			class http_exchange : public std::enable_shared_from_this<http_exchange<Stream>> {
				static constexpr bool is_tls = std::is_same<Stream, tls_stream>::value;
				struct private_ctor_tag{};

				boost::asio::ip::tcp::resolver	m_resolver;
				Stream							m_stream;
				boost::beast::flat_buffer		m_buffer;
				http_request					m_request;
				http_response					m_response;
				std::string						m_host;
				std::string						m_port;
				exchange_handler				m_done;

				void fail(const boost::system::error_code& ec, const char* stage){
					auto done = std::move(m_done);
					m_done = nullptr;
					if (done)
						done(ec, stage, http_response{});
				}

				void on_resolve(const boost::system::error_code& ec,
					boost::asio::ip::tcp::resolver::results_type results){
					if (ec)
						return fail(ec, "resolve");
					boost::beast::get_lowest_layer(m_stream).async_connect(results,
						[this_exchange = this->shared_from_this()](const boost::system::error_code& ec,
							const boost::asio::ip::tcp::endpoint&){
							this_exchange->on_connect(ec);
						});
				}

				void on_connect(const boost::system::error_code& ec){
					if (ec)
						return fail(ec, "connect");
					if constexpr (is_tls){
						m_stream.async_handshake(boost::asio::ssl::stream_base::client,
							[this_exchange = this->shared_from_this()](const boost::system::error_code& ec){
								if (ec)
									return this_exchange->fail(ec, "handshake");
								this_exchange->do_write();
							});
					}
					else
						do_write();
				}

				void do_write(){
					boost::beast::http::async_write(m_stream, m_request,
						[this_exchange = this->shared_from_this()](const boost::system::error_code& ec, std::size_t){
							if (ec)
								return this_exchange->fail(ec, "write");
							this_exchange->do_read();
						});
				}

				void do_read(){
					boost::beast::http::async_read(m_stream, m_buffer, m_response,
						[this_exchange = this->shared_from_this()](const boost::system::error_code& ec, std::size_t){
							if (ec)
								return this_exchange->fail(ec, "read");
							this_exchange->on_response();
						});
				}

				void on_response(){
					// the answer is in, how the connection goes down does not matter anymore
					auto ignored = boost::system::error_code{};
					boost::beast::get_lowest_layer(m_stream).socket().shutdown(
						boost::asio::ip::tcp::socket::shutdown_both, ignored);
					auto done = std::move(m_done);
					m_done = nullptr;
					if (done)
						done(boost::system::error_code{}, nullptr, std::move(m_response));
				}

			public:
				template<typename... StreamArgs>
				http_exchange(boost::asio::io_context& net_io_ctx, http_request req,
					std::string host, std::string port, private_ctor_tag, StreamArgs&&... stream_args)
					: m_resolver(net_io_ctx),
					m_stream(net_io_ctx, std::forward<StreamArgs>(stream_args)...),
					m_request(std::move(req)),
					m_host(std::move(host)),
					m_port(std::move(port)){}

				template<typename... StreamArgs>
				static std::shared_ptr<http_exchange> create(boost::asio::io_context& net_io_ctx, http_request req,
					std::string host, std::string port, StreamArgs&&... stream_args){
					return std::make_shared<http_exchange>(net_io_ctx, std::move(req), std::move(host),
						std::move(port), private_ctor_tag{}, std::forward<StreamArgs>(stream_args)...);
				}

				void run(exchange_handler done){
					m_done = std::move(done);
					if constexpr (is_tls){
						if (not SSL_set_tlsext_host_name(m_stream.native_handle(), m_host.c_str())){
							auto ec = boost::system::error_code{static_cast<int>(::ERR_get_error()),
								boost::asio::error::get_ssl_category()};
							return fail(ec, "sni");
						}
						m_stream.set_verify_callback(boost::asio::ssl::host_name_verification(m_host));
					}
					m_resolver.async_resolve(m_host, m_port,
						[this_exchange = this->shared_from_this()](const boost::system::error_code& ec,
							boost::asio::ip::tcp::resolver::results_type results){
							this_exchange->on_resolve(ec, std::move(results));
						});
				}
			};
		}
	}
}

#endif
