#include "detail/core.hpp"
#include "detail/logger.hpp"

namespace s3drop {
	namespace core {
		namespace detail {
			std::mutex									execution_unit::m_units_mutex;
			std::vector<std::unique_ptr<execution_unit>> execution_unit::m_net_exec_units;
			std::vector<std::unique_ptr<execution_unit>> execution_unit::m_disk_exec_units;
			std::unique_ptr<execution_unit> execution_unit::m_event_report_unit;
			std::unique_ptr<execution_unit> execution_unit::m_detached_jobs_unit;
			std::size_t									execution_unit::m_max_thread_count = std::thread::hardware_concurrency();

			namespace {
				struct units_reaper {
					~units_reaper(){
						execution_unit::stop_all();
					}
				};

				// the reaper is created after the logger, so it is destroyed (and the unit
				// threads joined) before the logger is
				void arm_units_reaper(){
					log::get();
					static auto reaper = units_reaper{};
				}
			}

			execution_unit::execution_unit(private_ctor_tag tag) :
				m_work_guard(boost::asio::make_work_guard<boost::asio::io_context::executor_type>(m_work_ctx.get_executor())) {

			}

			void execution_unit::start() {
				std::lock_guard work_guard_lock(m_guard_mutex);
				if (not m_work_thread.joinable()) {
					if (not m_work_guard)
						m_work_guard.emplace(boost::asio::make_work_guard<boost::asio::io_context::executor_type>(m_work_ctx.get_executor()));
					if (m_work_ctx.stopped())
						m_work_ctx.restart();

					m_work_thread = std::thread{ [this]() {
						std::unique_lock work_guard_lock(m_guard_mutex);
						do {
							work_guard_lock.unlock();
							m_work_ctx.run_one();
							m_busy_count++;
							work_guard_lock.lock();
						} while (m_work_guard);
						work_guard_lock.unlock();
						// drain whatever was posted before the guard went away
						m_work_ctx.poll();
						m_busy_count = 0u;
					} };
				}
			}

			void execution_unit::stop() {
				{
					std::lock_guard work_guard_lock(m_guard_mutex);
					m_work_guard = api::nullopt;
				}
				if (m_work_thread.joinable() and m_work_thread.get_id() != std::this_thread::get_id())
					m_work_thread.join();
			}

			boost::asio::io_context& execution_unit::context(){
				return m_work_ctx;
			}

			std::uint64_t execution_unit::busy_count() const {
				return m_busy_count.load();
			}

			execution_unit::~execution_unit() {
				stop();
			}

			bool execution_unit::running() const {
				return m_work_thread.joinable() and not m_work_ctx.stopped();
			}

			void execution_unit::set_max_thread_count(api::optional<std::size_t> count) {
				std::lock_guard units_lock(m_units_mutex);
				if (count and count.value() > 0) {
					m_max_thread_count = count.value();
				}
				else
					m_max_thread_count = std::thread::hardware_concurrency();
				if (m_max_thread_count == 0)
					m_max_thread_count = 1;
			}

			execution_unit& execution_unit::get_for_next_job(type t) {
				arm_units_reaper();
				std::lock_guard units_lock(m_units_mutex);
				auto& exec_units = (t == type::disk_io) ? m_disk_exec_units : m_net_exec_units;
				if (exec_units.size() < m_max_thread_count) {
					exec_units.emplace_back(std::make_unique<execution_unit>(private_ctor_tag{}));
					return *exec_units.back();
				}
				// every slot taken, share the least busy one
				auto winner = exec_units.front().get();
				for (auto& eu : exec_units) {
					if (eu->busy_count() < winner->busy_count())
						winner = eu.get();
				}
				return *winner;
			}

			execution_unit& execution_unit::get_for_event_report()
			{
				arm_units_reaper();
				std::lock_guard units_lock(m_units_mutex);
				if (m_event_report_unit == nullptr){
					m_event_report_unit = std::make_unique<execution_unit>(private_ctor_tag{});
				}
				m_event_report_unit->start();
				return *m_event_report_unit;
			}

			execution_unit& execution_unit::get_for_detached_jobs()
			{
				arm_units_reaper();
				std::lock_guard units_lock(m_units_mutex);
				if (m_detached_jobs_unit == nullptr){
					m_detached_jobs_unit = std::make_unique<execution_unit>(private_ctor_tag{});
				}
				m_detached_jobs_unit->start();
				return *m_detached_jobs_unit;
			}

			void execution_unit::stop_all()
			{
				auto units = std::vector<execution_unit*>{};
				{
					std::lock_guard units_lock(m_units_mutex);
					for (auto& eu : m_net_exec_units)
						units.push_back(eu.get());
					for (auto& eu : m_disk_exec_units)
						units.push_back(eu.get());
					if (m_event_report_unit)
						units.push_back(m_event_report_unit.get());
					if (m_detached_jobs_unit)
						units.push_back(m_detached_jobs_unit.get());
				}
				for (auto eu : units)
					eu->stop();
			}
		}
	}
}
