#pragma once
#ifndef S3DROP_UPLOADER_DETAIL_RETRYING_CALL_HPP_
#define S3DROP_UPLOADER_DETAIL_RETRYING_CALL_HPP_

#include "storage/client.hpp"
#include "uploader/detail/cancellation_token.hpp"
#include "uploader/detail/retry_policy.hpp"
#include "detail/logger.hpp"
#include "boost/asio/steady_timer.hpp"
#include <functional>
#include <memory>
#include <string>

namespace s3drop {
	namespace uploader {
		namespace detail {
			// Drives one storage call through the retry policy. The token is looked at before
			// every attempt, an attempt already issued is always allowed to finish.
			template<typename T>
			class retrying_call : public std::enable_shared_from_this<retrying_call<T>> {
				struct private_ctor_tag {};
			public:
				using attempt = std::function<void (storage::handler<T>)>;

				retrying_call(boost::asio::io_context& net_io_ctx, retry_policy policy,
					cancellation_handle token, std::string what, attempt fn,
					storage::handler<T> done, private_ctor_tag tag)
					: m_backoff_timer(net_io_ctx),
					m_policy(std::move(policy)),
					m_token(std::move(token)),
					m_what(std::move(what)),
					m_attempt(std::move(fn)),
					m_done(std::move(done)),
					m_state(m_policy.initial_state()){}

				static void start(boost::asio::io_context& net_io_ctx, retry_policy policy,
					cancellation_handle token, std::string what, attempt fn, storage::handler<T> done){
					auto call = std::make_shared<retrying_call>(net_io_ctx, std::move(policy), std::move(token),
						std::move(what), std::move(fn), std::move(done), private_ctor_tag{});
					call->do_attempt();
				}

			private:
				boost::asio::steady_timer	m_backoff_timer;
				retry_policy				m_policy;
				cancellation_handle			m_token;
				std::string					m_what;
				attempt						m_attempt;
				storage::handler<T>			m_done;
				retry_state					m_state;

				void do_attempt(){
					if (m_token and m_token->is_cancelled()){
						m_done(storage::make_cancelled_error(), T{});
						return;
					}
					m_state.attempt_count++;
					m_attempt([self = this->shared_from_this()](const storage::error& err, T value){
						self->on_attempt_done(err, std::move(value));
					});
				}

				void on_attempt_done(const storage::error& err, T value){
					if (not err){
						m_done(err, std::move(value));
						return;
					}
					auto decision = m_policy.decide(m_state, err);
					if (auto retry = api::get_if<retry_after>(&decision)){
						log::get().warn("{} failed on attempt {}/{}: {}, retrying in {} ms", m_what,
							m_state.attempt_count, m_state.max_attempts, err.describe(), retry->delay.count());
						m_backoff_timer.expires_after(retry->delay);
						m_backoff_timer.async_wait([self = this->shared_from_this()](const boost::system::error_code&){
							self->do_attempt();
						});
					}
					else{
						m_done(api::get<give_up>(decision).reason, T{});
					}
				}
			};
		}
	}
}

#endif
