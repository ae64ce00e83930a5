#pragma once
#ifndef S3DROP_DETAIL_PROGRESS_NOTIFICATION_HPP_
#define S3DROP_DETAIL_PROGRESS_NOTIFICATION_HPP_

#include "uploader/adi.hpp"
#include "uploader/progress_channel.hpp"
#include <map>
#include <mutex>

namespace s3drop {
    namespace core {
        namespace detail {
            // Fan-in point of one manager: events land in the channel right away, in the
            // order they are posted, listeners get them later on the event report thread.
            class progress_notification {
                std::mutex m_listener_mutex;
                std::uint32_t m_next_key = 0u;
                std::map<std::uint32_t, uploader::task::progress::listener> m_progress_listeners;
                std::map<std::uint32_t, uploader::history::record::listener> m_history_listeners;
                uploader::progress_channel& m_channel;

              public:
                explicit progress_notification(uploader::progress_channel& channel);
                progress_notification(const progress_notification&) = delete;
                progress_notification& operator=(const progress_notification&) = delete;

                void post_progress(uploader::task::progress pg);
                api::optional<std::uint32_t> add_listener(uploader::task::progress::listener lst);

                void post_completion(uploader::history::record rec);
                api::optional<std::uint32_t> add_listener(uploader::history::record::listener lst);

                bool remove_listener(std::uint32_t key);
            };
        } // namespace detail
    }
}
#endif
