#include "uploader/detail/retry_policy.hpp"
#include <algorithm>
#include <random>

namespace s3drop {
	namespace uploader {
		namespace detail {
			retry_policy::retry_policy(std::uint32_t max_attempts, std::chrono::milliseconds base_delay,
				std::chrono::milliseconds max_delay)
				: m_max_attempts(std::max(max_attempts, 1u)),
				m_base_delay(base_delay),
				m_max_delay(std::max(max_delay, base_delay)){}

			retry_state retry_policy::initial_state() const {
				return retry_state{0u, m_max_attempts, m_base_delay};
			}

			retry_decision retry_policy::decide(const retry_state& state, const storage::error& err, double jitter) const {
				if (not err or err.cancelled())
					return give_up{err};
				if (err.classification() == storage::error_class::permanent)
					return give_up{err};
				if (state.attempt_count >= state.max_attempts)
					return give_up{err};
				return retry_after{backoff(state.attempt_count, jitter)};
			}

			retry_decision retry_policy::decide(const retry_state& state, const storage::error& err) const {
				thread_local auto generator = std::mt19937{std::random_device{}()};
				auto dist = std::uniform_real_distribution<double>{0.0, 1.0};
				return decide(state, err, dist(generator));
			}

			std::chrono::milliseconds retry_policy::backoff(std::uint32_t attempt_count, double jitter) const {
				auto delay = m_base_delay;
				for (auto i = 1u; i < attempt_count and delay < m_max_delay; ++i)
					delay *= 2;
				delay = std::min(delay, m_max_delay);

				jitter = std::clamp(jitter, 0.0, 1.0);
				auto half = delay / 2;
				auto spread = static_cast<std::chrono::milliseconds::rep>(
					static_cast<double>((delay - half).count()) * jitter);
				return half + std::chrono::milliseconds(spread);
			}
		}
	}
}
