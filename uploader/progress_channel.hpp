#pragma once
#ifndef S3DROP_UPLOADER_PROGRESS_CHANNEL_HPP_
#define S3DROP_UPLOADER_PROGRESS_CHANNEL_HPP_

#include "uploader/adi.hpp"
#include <deque>
#include <mutex>

namespace s3drop {
	namespace uploader {
		// Many producers, one consumer pulling at its own pace. Unbounded: the consumer is
		// local and trusted, a server facing variant would need backpressure here.
		class progress_channel{
			mutable std::mutex				m_queue_mutex;
			std::deque<task::progress>		m_queue;
		public:
			progress_channel();
			progress_channel(const progress_channel&) = delete;
			progress_channel& operator=(const progress_channel&) = delete;
			~progress_channel();

			void push(task::progress pg);
			// never blocks, nullopt when nothing is pending
			api::optional<task::progress> try_receive();
			std::vector<task::progress> drain();
			std::size_t pending() const;
		};
	}
}

#endif
