#pragma once
#ifndef S3DROP_UPLOADER_DETAIL_CANCELLATION_TOKEN_HPP_
#define S3DROP_UPLOADER_DETAIL_CANCELLATION_TOKEN_HPP_

#include <memory>
#include <mutex>

namespace s3drop {
	namespace uploader {
		namespace detail {
			// Shared by every task of one batch. Once cancelled it stays cancelled until the
			// owner resets it, which only happens while no batch is running.
			class cancellation_token {
				mutable std::mutex	m_state_mutex;
				bool				m_cancelled = false;
			public:
				cancellation_token() = default;
				cancellation_token(const cancellation_token&) = delete;
				cancellation_token& operator=(const cancellation_token&) = delete;

				// true when this call flipped the state
				bool cancel();
				bool is_cancelled() const;
				void reset();
			};

			using cancellation_handle = std::shared_ptr<cancellation_token>;
		}
	}
}

#endif
