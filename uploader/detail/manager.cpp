#include "uploader/manager.hpp"
#include "uploader/settings.hpp"

#include "detail/core.hpp"
#include "detail/logger.hpp"
#include "detail/progress_notification.hpp"
#include "uploader/detail/object_key.hpp"
#include "uploader/detail/task_context.hpp"
#include "uploader/detail/upload_task.hpp"
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include "boost/asio.hpp"

namespace s3drop::uploader{
	class manager::impl{
		struct rejected_file{
			api::fs::path			source_path;
			std::error_condition	reason;
		};

		static settings checked(settings cfg){
			validate(cfg);
			return cfg;
		}

		const settings						m_settings;
		core::detail::execution_unit&		m_net_exec_unit;
		core::detail::execution_unit&		m_disk_exec_unit;
		progress_channel					m_channel;
		core::detail::progress_notification	m_notifier;
		detail::task_context				m_context;

		std::mutex							m_batch_mutex;
		std::condition_variable				m_batch_drained;
		bool								m_batch_active = false;
		task::id							m_next_task_id = 1u;
		std::size_t							m_unfinished_tasks = 0u;
		batch::report						m_report;
		batch::completion_handler			m_batch_done;
		std::deque<std::pair<task::id, task::request>>					m_waiting_queue;
		std::map<task::id, std::shared_ptr<detail::upload_task>>		m_active_tasks;

		std::vector<std::shared_ptr<detail::upload_task>> launch_waiting_locked(){
			auto launched = std::vector<std::shared_ptr<detail::upload_task>>{};
			while (m_active_tasks.size() < m_settings.parallel_uploads and not m_waiting_queue.empty()){
				auto [id, req] = std::move(m_waiting_queue.front());
				m_waiting_queue.pop_front();
				auto new_task = detail::upload_task::create(m_context, id, std::move(req),
					[this](const task::progress& terminal){ on_task_finished(terminal); });
				m_active_tasks.emplace(id, new_task);
				launched.emplace_back(std::move(new_task));
			}
			return launched;
		}

		void launch(std::vector<std::shared_ptr<detail::upload_task>> tasks){
			for (auto& t : tasks){
				boost::asio::post(m_net_exec_unit.context(), [t](){ t->run(); });
			}
		}

		void record_outcome_locked(const task::progress& terminal){
			switch (terminal.current_status){
			case task::status::completed:
				m_report.completed++;
				break;
			case task::status::cancelled:
				m_report.cancelled++;
				break;
			default:
				m_report.failed++;
				break;
			}
			m_report.outcomes.push_back(terminal);
		}

		// touches nothing of the manager, which may already be gone once the batch drained
		static void report_batch(batch::report final_report, batch::completion_handler done){
			log::get().info("batch finished: {} completed, {} failed, {} cancelled",
				final_report.completed, final_report.failed, final_report.cancelled);
			if (done){
				// behind every listener event of the batch
				auto& reporter = core::detail::execution_unit::get_for_event_report();
				boost::asio::post(reporter.context(), [done = std::move(done), rep = std::move(final_report)](){
					done(rep);
				});
			}
		}

		void on_task_finished(const task::progress& terminal){
			auto launched = std::vector<std::shared_ptr<detail::upload_task>>{};
			{
				std::lock_guard batch_lock(m_batch_mutex);
				m_active_tasks.erase(terminal.task_id);
				record_outcome_locked(terminal);
				m_unfinished_tasks--;
				launched = launch_waiting_locked();
				if (m_unfinished_tasks == 0u){
					m_batch_active = false;
					// reported before the lock goes, so it is queued ahead of anything a woken stop() posts
					report_batch(std::move(m_report), std::move(m_batch_done));
					m_report = batch::report{};
					m_batch_done = nullptr;
					m_batch_drained.notify_all();
					return;
				}
			}
			launch(std::move(launched));
		}

		void flush_event_reports(){
			auto& reporter = core::detail::execution_unit::get_for_event_report();
			if (reporter.context().get_executor().running_in_this_thread())
				return;
			auto flushed = std::promise<void>{};
			auto barrier = flushed.get_future();
			boost::asio::post(reporter.context(), [&flushed](){ flushed.set_value(); });
			barrier.wait();
		}

	public:
		impl(settings cfg, std::shared_ptr<storage::client> client)
			: m_settings(checked(std::move(cfg))),
			m_net_exec_unit(core::detail::execution_unit::get_for_next_job(core::detail::execution_unit::type::network_io)),
			m_disk_exec_unit(core::detail::execution_unit::get_for_next_job(core::detail::execution_unit::type::disk_io)),
			m_notifier(m_channel),
			m_context(m_net_exec_unit.context(), m_disk_exec_unit.context(), std::move(client), m_settings, m_notifier){
			if (m_context.client == nullptr)
				throw std::invalid_argument("no storage client");
		}

		impl(settings cfg, storage::credentials creds)
			: m_settings(checked(std::move(cfg))),
			m_net_exec_unit(core::detail::execution_unit::get_for_next_job(core::detail::execution_unit::type::network_io)),
			m_disk_exec_unit(core::detail::execution_unit::get_for_next_job(core::detail::execution_unit::type::disk_io)),
			m_notifier(m_channel),
			m_context(m_net_exec_unit.context(), m_disk_exec_unit.context(),
				storage::make_http_client(m_net_exec_unit.context(),
					storage::endpoint_config{m_settings.endpoint, m_settings.bucket, m_settings.region}, std::move(creds)),
				m_settings, m_notifier){}

		~impl(){
			stop();
			flush_event_reports();
		}

		void run(){
			m_net_exec_unit.start();
			m_disk_exec_unit.start();
		}

		void stop(){
			std::unique_lock batch_lock(m_batch_mutex);
			if (not m_batch_active)
				return;
			m_context.token->cancel();
			log::get().info("stopping, waiting for {} unfinished tasks", m_unfinished_tasks);
			m_batch_drained.wait(batch_lock, [this](){ return not m_batch_active; });
		}

		api::variant<std::size_t, std::error_condition>
			start(std::vector<task::request> requests, std::vector<rejected_file> rejected,
				batch::completion_handler done){
			auto launched = std::vector<std::shared_ptr<detail::upload_task>>{};
			auto final_report = api::optional<batch::report>{};
			{
				std::lock_guard batch_lock(m_batch_mutex);
				if (m_batch_active)
					return std::make_error_condition(std::errc::device_or_resource_busy);
				if (not m_net_exec_unit.running())
					m_net_exec_unit.start();
				if (not m_disk_exec_unit.running())
					m_disk_exec_unit.start();

				m_context.token->reset();
				m_report = batch::report{};
				for (auto& r : rejected){
					auto pg = task::progress{};
					pg.task_id = m_next_task_id++;
					m_notifier.post_progress(pg);
					pg.current_status = task::status::failed;
					pg.reason = to_u8string(r.source_path) + ": " + r.reason.message();
					log::get().error("task {}: {}", pg.task_id, pg.reason);
					m_notifier.post_progress(pg);
					record_outcome_locked(pg);
				}
				for (auto& req : requests){
					m_waiting_queue.emplace_back(m_next_task_id++, std::move(req));
				}
				m_unfinished_tasks = m_waiting_queue.size();
				log::get().info("batch of {} uploads started, {} rejected", m_unfinished_tasks, rejected.size());
				if (m_unfinished_tasks == 0u){
					final_report = std::move(m_report);
					m_report = batch::report{};
				}
				else{
					m_batch_active = true;
					m_batch_done = std::move(done);
					launched = launch_waiting_locked();
				}
			}
			launch(std::move(launched));
			if (final_report)
				report_batch(std::move(*final_report), std::move(done));
			return requests.size();
		}

		api::variant<std::size_t, std::error_condition>
			start_files(const std::vector<api::fs::path>& files, batch::completion_handler done){
			auto requests = std::vector<task::request>{};
			auto rejected = std::vector<rejected_file>{};
			for (auto& f : files){
				auto req = make_request(f);
				if (auto valid = api::get_if<task::request>(&req))
					requests.emplace_back(std::move(*valid));
				else
					rejected.push_back(rejected_file{f, api::get<std::error_condition>(req)});
			}
			return start(std::move(requests), std::move(rejected), std::move(done));
		}

		static api::variant<task::request, std::error_condition> make_request(const api::fs::path& file){
			auto ec = api::error_code{};
			if (not api::fs::exists(file, ec))
				return std::make_error_condition(std::errc::no_such_file_or_directory);
			if (api::fs::is_directory(file, ec))
				return std::make_error_condition(std::errc::is_a_directory);
			if (not api::fs::is_regular_file(file, ec))
				return std::make_error_condition(std::errc::not_supported);
			auto size = api::fs::file_size(file, ec);
			if (ec)
				return ec.default_error_condition();
			return task::request{file, detail::derive_destination_key(file), static_cast<std::uint64_t>(size)};
		}

		void cancel_all(){
			if (m_context.token->cancel())
				log::get().info("cancellation requested");
		}

		progress_channel& progress(){
			return m_channel;
		}

		core::detail::progress_notification& notifier(){
			return m_notifier;
		}
	};

	namespace {
		template<typename Starter>
		api::variant<batch::report, std::error_condition> wait_for_report(Starter&& starter){
			auto finished = std::promise<batch::report>{};
			auto report = finished.get_future();
			auto started = starter([&finished](const batch::report& rep){ finished.set_value(rep); });
			if (auto refused = api::get_if<std::error_condition>(&started))
				return *refused;
			return report.get();
		}
	}

	manager::manager(settings cfg, storage::credentials creds)
		: m_impl(std::make_unique<impl>(std::move(cfg), std::move(creds))){}

	manager::manager(settings cfg, std::shared_ptr<storage::client> client)
		: m_impl(std::make_unique<impl>(std::move(cfg), std::move(client))){}

	manager::~manager() = default;

	void manager::run(){
		m_impl->run();
	}

	void manager::stop(){
		m_impl->stop();
	}

	api::variant<std::size_t, std::error_condition>
		manager::start_batch(std::vector<task::request> requests, batch::completion_handler done){
		return m_impl->start(std::move(requests), {}, std::move(done));
	}

	api::variant<std::size_t, std::error_condition>
		manager::start_files(const std::vector<api::fs::path>& files, batch::completion_handler done){
		return m_impl->start_files(files, std::move(done));
	}

	api::variant<batch::report, std::error_condition> manager::upload(std::vector<task::request> requests){
		return wait_for_report([this, &requests](batch::completion_handler done){
			return m_impl->start(std::move(requests), {}, std::move(done));
		});
	}

	api::variant<batch::report, std::error_condition> manager::upload_files(const std::vector<api::fs::path>& files){
		return wait_for_report([this, &files](batch::completion_handler done){
			return m_impl->start_files(files, std::move(done));
		});
	}

	api::variant<task::request, std::error_condition> manager::make_request(const api::fs::path& file){
		return impl::make_request(file);
	}

	void manager::cancel_all(){
		m_impl->cancel_all();
	}

	progress_channel& manager::progress(){
		return m_impl->progress();
	}

	api::optional<std::uint32_t> manager::install_progress_monitor(task::progress::listener lst){
		return m_impl->notifier().add_listener(std::move(lst));
	}

	api::optional<std::uint32_t> manager::install_history_listener(history::record::listener lst){
		return m_impl->notifier().add_listener(std::move(lst));
	}

	bool manager::remove_listener(std::uint32_t key){
		return m_impl->notifier().remove_listener(key);
	}
}
