// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_MESSAGEQUEUE_HXX
#define SIHOA_MESSAGEQUEUE_HXX
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace sihoa
{
    /**
     * @brief Multi-producer / single-consumer FIFO with timed receive.
     * A capacity of 0 means unbounded.
     */
    template <typename T>
    class MessageQueue {
    public:
        explicit MessageQueue(const size_t capacity = 0) : m_capacity(capacity) {}

        MessageQueue(const MessageQueue&) = delete;
        MessageQueue& operator=(const MessageQueue&) = delete;

        /**
         * @brief Never blocks. Returns false when the queue is full.
         */
        bool send(T item) {
            {
                std::lock_guard lock(m_mutex);
                if (m_capacity != 0 && m_items.size() >= m_capacity) {
                    return false;
                }
                m_items.push_back(std::move(item));
            }
            m_cv.notify_one();
            return true;
        }

        /**
         * @brief Waits up to timeout for an item. Returns false on timeout.
         */
        bool receive(T& out, const std::chrono::milliseconds timeout) {
            std::unique_lock lock(m_mutex);
            if (!m_cv.wait_for(lock, timeout, [this] { return !m_items.empty(); })) {
                return false;
            }
            out = std::move(m_items.front());
            m_items.pop_front();
            return true;
        }

        [[nodiscard]] size_t size() const {
            std::lock_guard lock(m_mutex);
            return m_items.size();
        }

        [[nodiscard]] bool empty() const {
            return size() == 0;
        }

    private:
        const size_t m_capacity;
        std::deque<T> m_items;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
    };
} // sihoa

#endif //SIHOA_MESSAGEQUEUE_HXX
