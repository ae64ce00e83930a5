#include "uploader/progress_channel.hpp"
#include <iterator>

namespace s3drop {
	namespace uploader {
		namespace task {
			bool progress::is_terminal() const {
				return current_status == status::completed or
					current_status == status::failed or
					current_status == status::cancelled;
			}

			const char* to_string(status s){
				switch (s){
				case status::started:
					return "started";
				case status::in_progress:
					return "in progress";
				case status::completed:
					return "completed";
				case status::failed:
					return "failed";
				case status::cancelled:
					return "cancelled";
				}
				return "unknown";
			}
		}

		progress_channel::progress_channel() = default;
		progress_channel::~progress_channel() = default;

		void progress_channel::push(task::progress pg){
			std::lock_guard queue_lock(m_queue_mutex);
			m_queue.emplace_back(std::move(pg));
		}

		api::optional<task::progress> progress_channel::try_receive(){
			std::lock_guard queue_lock(m_queue_mutex);
			if (m_queue.empty())
				return api::nullopt;
			auto pg = std::move(m_queue.front());
			m_queue.pop_front();
			return pg;
		}

		std::vector<task::progress> progress_channel::drain(){
			std::lock_guard queue_lock(m_queue_mutex);
			auto all = std::vector<task::progress>{std::make_move_iterator(m_queue.begin()),
				std::make_move_iterator(m_queue.end())};
			m_queue.clear();
			return all;
		}

		std::size_t progress_channel::pending() const {
			std::lock_guard queue_lock(m_queue_mutex);
			return m_queue.size();
		}
	}
}
