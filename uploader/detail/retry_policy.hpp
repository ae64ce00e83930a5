#pragma once
#ifndef S3DROP_UPLOADER_DETAIL_RETRY_POLICY_HPP_
#define S3DROP_UPLOADER_DETAIL_RETRY_POLICY_HPP_

#include "api_binder.hpp"
#include "storage/error.hpp"
#include <chrono>

namespace s3drop {
	namespace uploader {
		namespace detail {
			// budget of one storage call: one chunk, the single PUT, create or complete
			struct retry_state {
				// attempts already made
				std::uint32_t				attempt_count = 0u;
				std::uint32_t				max_attempts = 1u;
				std::chrono::milliseconds	base_delay{0};
			};

			struct retry_after {
				std::chrono::milliseconds	delay;
			};

			struct give_up {
				storage::error				reason;
			};

			using retry_decision = api::variant<retry_after, give_up>;

			class retry_policy {
				std::uint32_t				m_max_attempts;
				std::chrono::milliseconds	m_base_delay;
				std::chrono::milliseconds	m_max_delay;
			public:
				retry_policy(std::uint32_t max_attempts, std::chrono::milliseconds base_delay,
					std::chrono::milliseconds max_delay);

				retry_state initial_state() const;

				// jitter is expected in [0, 1), it places the delay inside [d/2, d]
				retry_decision decide(const retry_state& state, const storage::error& err, double jitter) const;
				retry_decision decide(const retry_state& state, const storage::error& err) const;

				std::chrono::milliseconds backoff(std::uint32_t attempt_count, double jitter) const;
			};
		}
	}
}

#endif
