#include "detail/progress_notification.hpp"
#include "detail/core.hpp"
#include "detail/logger.hpp"

namespace s3drop {
    namespace core {
        namespace detail {
            progress_notification::progress_notification(uploader::progress_channel& channel)
                : m_channel(channel)
            {
            }

            void progress_notification::post_progress(uploader::task::progress pg)
            {
                m_channel.push(pg);
                {
                    std::lock_guard lsts_lock(m_listener_mutex);
                    if (m_progress_listeners.empty())
                        return;
                }
                auto &progress_executor = execution_unit::get_for_event_report();
                boost::asio::post(progress_executor.context(), [this, prog = std::move(pg)]() {
                    std::lock_guard lsts_lock(m_listener_mutex);
                    for (auto &[key, lst] : m_progress_listeners)
                    {
                        lst(prog);
                    }
                });
            }

            api::optional<std::uint32_t> progress_notification::add_listener(uploader::task::progress::listener lst)
            {
                auto lst_key = api::optional<std::uint32_t>{};
                if (lst)
                {
                    std::lock_guard lsts_lock(m_listener_mutex);
                    auto [iter, inserted] = m_progress_listeners.emplace(m_next_key, std::move(lst));
                    if (inserted)
                        lst_key = m_next_key++;
                }

                return lst_key;
            }

            void progress_notification::post_completion(uploader::history::record rec)
            {
                log::get().info("task {} stored {} as {}", rec.task_id, to_u8string(rec.source_path), rec.url);
                auto &progress_executor = execution_unit::get_for_event_report();
                boost::asio::post(progress_executor.context(), [this, record = std::move(rec)]() {
                    std::lock_guard lsts_lock(m_listener_mutex);
                    for (auto &[key, lst] : m_history_listeners)
                    {
                        lst(record);
                    }
                });
            }

            api::optional<std::uint32_t> progress_notification::add_listener(uploader::history::record::listener lst)
            {
                auto lst_key = api::optional<std::uint32_t>{};
                if (lst)
                {
                    std::lock_guard lsts_lock(m_listener_mutex);
                    auto [iter, inserted] = m_history_listeners.emplace(m_next_key, std::move(lst));
                    if (inserted)
                        lst_key = m_next_key++;
                }

                return lst_key;
            }

            bool progress_notification::remove_listener(std::uint32_t key)
            {
                std::lock_guard lsts_lock(m_listener_mutex);
                return m_progress_listeners.erase(key) > 0 or m_history_listeners.erase(key) > 0;
            }
        } // namespace detail
    } // namespace core
}
