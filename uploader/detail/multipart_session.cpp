#include "uploader/detail/multipart_session.hpp"
#include "uploader/detail/retrying_call.hpp"
#include "detail/core.hpp"
#include "detail/logger.hpp"
#include <algorithm>

namespace s3drop {
	namespace uploader {
		namespace detail {
			multipart_session::multipart_session(std::shared_ptr<storage::client> client, storage::object_key key,
				storage::upload_id id, boost::asio::io_context& net_io_ctx, retry_policy policy,
				cancellation_handle token, private_ctor_tag tag)
				: m_client(std::move(client)),
				m_key(std::move(key)),
				m_id(std::move(id)),
				m_net_io_ctx(net_io_ctx),
				m_policy(std::move(policy)),
				m_token(std::move(token)){}

			multipart_session::~multipart_session(){
				if (m_state == state::open or m_state == state::completing){
					log::get().debug("multipart upload {} of {} abandoned, aborting", m_id, m_key);
					release(m_client, m_key, m_id);
				}
			}

			void multipart_session::open(std::shared_ptr<storage::client> client, storage::object_key key,
				std::string content_type, boost::asio::io_context& net_io_ctx, retry_policy policy,
				cancellation_handle token, open_handler done){
				auto what = "create multipart upload of " + key;
				retrying_call<storage::upload_id>::start(net_io_ctx, policy, token, std::move(what),
					[client, key, content_type](storage::handler<storage::upload_id> h){
						client->create_multipart(key, content_type, std::move(h));
					},
					[client, key, &net_io_ctx, policy, token, done = std::move(done)](const storage::error& err, storage::upload_id id){
						if (err){
							done(err, nullptr);
							return;
						}
						log::get().debug("multipart upload {} opened for {}", id, key);
						done(err, std::make_shared<multipart_session>(client, key, std::move(id),
							net_io_ctx, policy, token, private_ctor_tag{}));
					});
			}

			void multipart_session::upload_part(std::uint32_t part_number, blob body, storage::handler<storage::etag> done){
				auto closed = false;
				{
					std::lock_guard state_lock(m_state_mutex);
					closed = m_state != state::open;
				}
				if (closed){
					done(storage::make_cancelled_error(), storage::etag{});
					return;
				}
				auto what = "part " + std::to_string(part_number) + " of " + m_key;
				retrying_call<storage::etag>::start(m_net_io_ctx, m_policy, m_token, std::move(what),
					[self = shared_from_this(), part_number, body](storage::handler<storage::etag> h){
						self->m_client->upload_part(self->m_key, self->m_id, part_number, body, std::move(h));
					},
					[self = shared_from_this(), part_number, done = std::move(done)](const storage::error& err, storage::etag tag){
						if (not err){
							std::lock_guard state_lock(self->m_state_mutex);
							self->m_parts.push_back(storage::completed_part{part_number, tag});
						}
						done(err, std::move(tag));
					});
			}

			void multipart_session::complete(storage::handler<storage::nothing> done){
				auto parts = std::vector<storage::completed_part>{};
				auto refusal = storage::error{};
				{
					std::lock_guard state_lock(m_state_mutex);
					parts = m_parts;
					std::sort(parts.begin(), parts.end(),
						[](const auto& a, const auto& b){ return a.part_number < b.part_number; });
					auto contiguous = not parts.empty();
					for (auto i = std::size_t{0}; contiguous and i < parts.size(); ++i)
						contiguous = parts[i].part_number == i + 1;
					if (m_state != state::open)
						refusal = storage::make_local_error(std::make_error_code(std::errc::operation_not_permitted),
							"multipart upload " + m_id + " is no longer open");
					else if (not contiguous)
						refusal = storage::make_local_error(std::make_error_code(std::errc::invalid_argument),
							"parts of " + m_key + " are not numbered 1.." + std::to_string(parts.size()));
					else
						m_state = state::completing;
				}
				if (refusal){
					done(refusal, storage::nothing{});
					return;
				}

				auto what = "complete multipart upload of " + m_key;
				retrying_call<storage::nothing>::start(m_net_io_ctx, m_policy, m_token, std::move(what),
					[self = shared_from_this(), parts](storage::handler<storage::nothing> h){
						self->m_client->complete_multipart(self->m_key, self->m_id, parts, std::move(h));
					},
					[self = shared_from_this(), done = std::move(done)](const storage::error& err, storage::nothing n){
						{
							std::lock_guard state_lock(self->m_state_mutex);
							// a failed complete leaves the upload open, the guard still owes an abort
							self->m_state = err ? state::open : state::completed;
						}
						done(err, n);
					});
			}

			void multipart_session::abort(){
				{
					std::lock_guard state_lock(m_state_mutex);
					if (m_state != state::open)
						return;
					m_state = state::aborted;
				}
				release(m_client, m_key, m_id);
			}

			void multipart_session::release(std::shared_ptr<storage::client> client,
				storage::object_key key, storage::upload_id id){
				auto& detached = core::detail::execution_unit::get_for_detached_jobs();
				boost::asio::post(detached.context(), [&detached, client = std::move(client), key = std::move(key), id = std::move(id)](){
					// the outcome is logged back on the detached unit, whatever thread the client answers on
					client->abort_multipart(key, id, [&detached, key, id](const storage::error& err, storage::nothing){
						boost::asio::post(detached.context(), [key, id, err](){
							if (err)
								log::get().warn("abort of multipart upload {} for {} failed, parts stay behind "
									"until the bucket lifecycle rule removes them: {}", id, key, err.describe());
							else
								log::get().info("multipart upload {} for {} aborted", id, key);
						});
					});
				});
			}

			const storage::upload_id& multipart_session::id() const {
				return m_id;
			}

			const storage::object_key& multipart_session::key() const {
				return m_key;
			}

			std::vector<storage::completed_part> multipart_session::sorted_parts() const {
				std::lock_guard state_lock(m_state_mutex);
				auto parts = m_parts;
				std::sort(parts.begin(), parts.end(),
					[](const auto& a, const auto& b){ return a.part_number < b.part_number; });
				return parts;
			}

			bool multipart_session::completed() const {
				std::lock_guard state_lock(m_state_mutex);
				return m_state == state::completed;
			}
		}
	}
}
