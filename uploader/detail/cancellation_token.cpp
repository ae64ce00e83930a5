#include "uploader/detail/cancellation_token.hpp"

namespace s3drop {
	namespace uploader {
		namespace detail {
			bool cancellation_token::cancel(){
				std::lock_guard state_lock(m_state_mutex);
				if (m_cancelled)
					return false;
				m_cancelled = true;
				return true;
			}

			bool cancellation_token::is_cancelled() const {
				std::lock_guard state_lock(m_state_mutex);
				return m_cancelled;
			}

			void cancellation_token::reset(){
				std::lock_guard state_lock(m_state_mutex);
				m_cancelled = false;
			}
		}
	}
}
