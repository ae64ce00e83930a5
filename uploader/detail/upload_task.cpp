#include "uploader/detail/upload_task.hpp"
#include "uploader/detail/object_key.hpp"
#include "uploader/detail/retrying_call.hpp"
#include "boost/asio/post.hpp"
#include "detail/logger.hpp"
#include <algorithm>

namespace s3drop {
	namespace uploader {
		namespace detail {
			upload_task::upload_task(task_context& context, task::id id, task::request req,
				finish_handler on_finish, private_ctor_tag tag)
				: m_context(context), m_id(id), m_request(std::move(req)),
				m_content_type(guess_content_type(m_request.destination_key)),
				m_on_finish(std::move(on_finish)){}

			upload_task::~upload_task() = default;

			std::shared_ptr<upload_task> upload_task::create(task_context& context, task::id id,
				task::request req, finish_handler on_finish){
				return std::make_shared<upload_task>(context, id, std::move(req), std::move(on_finish), private_ctor_tag{});
			}

			task::strategy upload_task::select_strategy(std::uint64_t size, const settings& cfg){
				if (size >= cfg.multipart_threshold)
					return task::multipart{chunk_plan(size, cfg.multipart_chunk_size).chunk_size()};
				return task::single_put{};
			}

			task::id upload_task::id() const {
				return m_id;
			}

			void upload_task::run(){
				auto terminal = api::optional<task::progress>{};
				auto multipart = false;
				{
					std::lock_guard state_lock(m_state_mutex);
					if (m_phase != phase::pending)
						return;
					emit_locked(task::status::started);
					if (m_context.token->is_cancelled()){
						terminal = finish_locked(storage::make_cancelled_error());
					}
					else{
						auto strategy = select_strategy(m_request.size, m_context.config);
						m_phase = phase::strategy_selected;
						if (auto mp = api::get_if<task::multipart>(&strategy)){
							m_plan.emplace(m_request.size, mp->chunk_size);
							multipart = true;
						}
						m_phase = phase::uploading;
					}
				}
				if (terminal){
					notify_finished(terminal);
					return;
				}

				if (multipart){
					log::get().info("task {}: {} ({} bytes) to {} in {} parts of {} bytes", m_id,
						to_u8string(m_request.source_path), m_request.size, m_request.destination_key,
						m_plan->part_count(), m_plan->chunk_size());
					do_open_session();
				}
				else{
					log::get().info("task {}: {} ({} bytes) to {} in a single PUT", m_id,
						to_u8string(m_request.source_path), m_request.size, m_request.destination_key);
					boost::asio::post(m_context.disk_io_ctx, [self = shared_from_this()](){
						self->do_single_put();
					});
				}
			}

			void upload_task::do_single_put(){
				auto body = blob{};
				auto err = read_range(0u, m_request.size, body);
				if (err){
					auto terminal = api::optional<task::progress>{};
					{
						std::lock_guard state_lock(m_state_mutex);
						terminal = finish_locked(err);
					}
					notify_finished(terminal);
					return;
				}

				boost::asio::post(m_context.net_io_ctx, [self = shared_from_this(), body](){
					auto& ctx = self->m_context;
					retrying_call<storage::etag>::start(ctx.net_io_ctx, ctx.policy, ctx.token,
						"PUT of " + self->m_request.destination_key,
						[client = ctx.client, key = self->m_request.destination_key, body, ct = self->m_content_type]
						(storage::handler<storage::etag> h){
							client->put_object(key, body, ct, std::move(h));
						},
						[self](const storage::error& err, storage::etag){
							auto terminal = api::optional<task::progress>{};
							{
								std::lock_guard state_lock(self->m_state_mutex);
								if (not err)
									self->m_bytes_transferred = self->m_request.size;
								terminal = self->finish_locked(err);
							}
							self->notify_finished(terminal);
						});
				});
			}

			void upload_task::do_open_session(){
				boost::asio::post(m_context.net_io_ctx, [self = shared_from_this()](){
					auto& ctx = self->m_context;
					multipart_session::open(ctx.client, self->m_request.destination_key, self->m_content_type,
						ctx.net_io_ctx, ctx.policy, ctx.token,
						[self](const storage::error& err, std::shared_ptr<multipart_session> session){
							auto terminal = api::optional<task::progress>{};
							{
								std::lock_guard state_lock(self->m_state_mutex);
								if (err)
									terminal = self->finish_locked(err);
								else{
									self->m_session = std::move(session);
									terminal = self->schedule_parts_locked();
								}
							}
							self->notify_finished(terminal);
						});
				});
			}

			api::optional<task::progress> upload_task::schedule_parts_locked(){
				if (is_terminal_locked())
					return api::nullopt;
				auto window = std::max<std::size_t>(m_context.config.parts_in_flight, 1u);
				while (not m_first_error and m_parts_in_flight < window and m_next_part <= m_plan->part_count()){
					if (m_context.token->is_cancelled()){
						m_first_error = storage::make_cancelled_error();
						break;
					}
					auto part_number = m_next_part++;
					m_parts_in_flight++;
					boost::asio::post(m_context.disk_io_ctx, [self = shared_from_this(), part_number](){
						self->do_upload_part(part_number);
					});
				}

				if (m_parts_in_flight > 0u)
					return api::nullopt;
				if (m_first_error){
					if (m_session)
						m_session->abort();
					m_session.reset();
					return finish_locked(*m_first_error);
				}
				if (m_next_part > m_plan->part_count()){
					boost::asio::post(m_context.net_io_ctx, [self = shared_from_this()](){
						self->do_complete();
					});
				}
				return api::nullopt;
			}

			void upload_task::do_upload_part(std::uint32_t part_number){
				auto [offset, length] = m_plan->part_extent(part_number);
				auto body = blob{};
				auto err = read_range(offset, length, body);
				if (err){
					on_part_done(part_number, 0u, err);
					return;
				}

				auto session = std::shared_ptr<multipart_session>{};
				{
					std::lock_guard state_lock(m_state_mutex);
					session = m_session;
				}
				if (session == nullptr){
					on_part_done(part_number, 0u, storage::make_cancelled_error());
					return;
				}
				session->upload_part(part_number, std::move(body),
					[self = shared_from_this(), part_number, length = length](const storage::error& err, storage::etag){
						self->on_part_done(part_number, length, err);
					});
			}

			void upload_task::on_part_done(std::uint32_t part_number, std::uint64_t length, const storage::error& err){
				auto terminal = api::optional<task::progress>{};
				{
					std::lock_guard state_lock(m_state_mutex);
					m_parts_in_flight--;
					if (err){
						if (not m_first_error){
							if (not err.cancelled())
								log::get().error("task {}: part {} of {} failed: {}", m_id, part_number,
									m_request.destination_key, err.describe());
							m_first_error = err;
						}
					}
					else{
						m_bytes_transferred += length;
						emit_locked(task::status::in_progress);
					}
					terminal = schedule_parts_locked();
				}
				notify_finished(terminal);
			}

			void upload_task::do_complete(){
				auto session = std::shared_ptr<multipart_session>{};
				{
					std::lock_guard state_lock(m_state_mutex);
					session = m_session;
				}
				if (session == nullptr)
					return;
				session->complete([self = shared_from_this()](const storage::error& err, storage::nothing){
					auto terminal = api::optional<task::progress>{};
					{
						std::lock_guard state_lock(self->m_state_mutex);
						if (err and self->m_session)
							self->m_session->abort();
						self->m_session.reset();
						terminal = self->finish_locked(err);
					}
					self->notify_finished(terminal);
				});
			}

			api::optional<task::progress> upload_task::finish_locked(const storage::error& err){
				if (is_terminal_locked())
					return api::nullopt;
				if (not err){
					m_phase = phase::completed;
					m_bytes_transferred = m_request.size;
					auto pg = emit_locked(task::status::completed);
					log::get().info("task {}: {} completed", m_id, m_request.destination_key);
					m_context.notifier.post_completion(history::record{m_id, m_request.source_path,
						m_request.destination_key, m_context.client->object_url(m_request.destination_key),
						m_request.size, std::chrono::system_clock::now()});
					return pg;
				}
				if (err.cancelled()){
					m_phase = phase::cancelled;
					log::get().info("task {}: {} cancelled", m_id, m_request.destination_key);
					return emit_locked(task::status::cancelled);
				}
				m_phase = phase::failed;
				log::get().error("task {}: {} failed: {}", m_id, m_request.destination_key, err.describe());
				return emit_locked(task::status::failed, err.describe());
			}

			task::progress upload_task::emit_locked(task::status st, std::string reason){
				auto pg = task::progress{};
				pg.task_id = m_id;
				pg.bytes_transferred = m_bytes_transferred;
				pg.total_bytes = m_request.size;
				pg.current_status = st;
				pg.reason = std::move(reason);
				m_context.notifier.post_progress(pg);
				return pg;
			}

			void upload_task::notify_finished(const api::optional<task::progress>& terminal){
				if (terminal and m_on_finish)
					m_on_finish(*terminal);
			}

			storage::error upload_task::read_range(std::uint64_t offset, std::uint64_t length, blob& out){
				if (not m_file_stream.is_open()){
					m_file_stream.open(m_request.source_path, std::ios::binary);
					if (not m_file_stream.is_open())
						return storage::make_local_error(std::make_error_code(std::errc::no_such_file_or_directory),
							"cannot open " + to_u8string(m_request.source_path));
				}
				out = make_blob(static_cast<std::size_t>(length));
				m_file_stream.clear();
				m_file_stream.seekg(static_cast<std::streamoff>(offset));
				m_file_stream.read(reinterpret_cast<char*>(out->data()), static_cast<std::streamsize>(length));
				if (static_cast<std::uint64_t>(m_file_stream.gcount()) != length){
					m_file_stream.clear();
					return storage::make_local_error(std::make_error_code(std::errc::io_error),
						"short read of " + to_u8string(m_request.source_path) + " at offset " + std::to_string(offset));
				}
				return storage::error{};
			}

			bool upload_task::is_terminal_locked() const {
				return m_phase == phase::completed or m_phase == phase::failed or m_phase == phase::cancelled;
			}
		}
	}
}
