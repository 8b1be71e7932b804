// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARDX_SRC_COMMON_BLOCKING_QUEUE_H_
#define SHARDX_SRC_COMMON_BLOCKING_QUEUE_H_

#include <condition_variable>
#include <mutex>
#include <queue>

namespace shardx {
    /// Thread-safe producer-consumer FIFO queue. Consumers block in pop()
    /// until an element is available or the queue is cleared.
    /// \tparam T type of queued elements.
    template<typename T>
    class blocking_queue {
      public:
        blocking_queue() = default;
        ~blocking_queue() {
            clear();
        }

        blocking_queue(const blocking_queue&) = delete;
        auto operator=(const blocking_queue&) -> blocking_queue& = delete;
        blocking_queue(blocking_queue&&) = delete;
        auto operator=(blocking_queue&&) -> blocking_queue& = delete;

        /// Pushes an element onto the queue and wakes one consumer.
        /// \param item element to push.
        void push(const T& item) {
            {
                std::unique_lock<std::mutex> lck(m_mut);
                m_queue.push(item);
            }
            m_cv.notify_one();
        }

        /// \copydoc push(const T&)
        void push(T&& item) {
            {
                std::unique_lock<std::mutex> lck(m_mut);
                m_queue.push(std::move(item));
            }
            m_cv.notify_one();
        }

        /// Pops an element from the queue, blocking until one is available.
        /// \param item reference to store the popped element.
        /// \return true if an element was popped, false if the queue was
        ///         cleared while waiting.
        auto pop(T& item) -> bool {
            std::unique_lock<std::mutex> lck(m_mut);
            m_cv.wait(lck, [&]() {
                return !m_queue.empty() || !m_running;
            });
            if(!m_running) {
                return false;
            }
            item = std::move(m_queue.front());
            m_queue.pop();
            return true;
        }

        /// Drops all queued elements and releases any blocked consumers.
        /// Subsequent calls to pop() return false immediately.
        void clear() {
            {
                std::unique_lock<std::mutex> lck(m_mut);
                m_running = false;
                m_queue = std::queue<T>();
            }
            m_cv.notify_all();
        }

        /// Returns the number of queued elements.
        [[nodiscard]] auto size() const -> size_t {
            std::unique_lock<std::mutex> lck(m_mut);
            return m_queue.size();
        }

      private:
        std::queue<T> m_queue;
        mutable std::mutex m_mut;
        std::condition_variable m_cv;
        bool m_running{true};
    };
}

#endif
