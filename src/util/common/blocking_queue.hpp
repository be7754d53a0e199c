// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_UTIL_COMMON_BLOCKING_QUEUE_H_
#define AGENTPAY_SRC_UTIL_COMMON_BLOCKING_QUEUE_H_

#include <condition_variable>
#include <mutex>
#include <queue>

namespace agentpay {
    /// Thread-safe producer-consumer FIFO queue. Consumers block in pop()
    /// until an item is available or the queue is cleared.
    /// \tparam T type of item stored in the queue.
    template<typename T>
    class blocking_queue {
      public:
        /// Pushes an item onto the queue and notifies one waiting consumer.
        /// \param item item to push.
        void push(T item) {
            {
                std::unique_lock l(m_mut);
                m_buffer.push(std::move(item));
            }
            m_cv.notify_one();
        }

        /// Pops an item from the queue, blocking until one is available.
        /// \param item set to the popped item.
        /// \return true if an item was popped, false if the queue was
        ///         cleared while waiting.
        auto pop(T& item) -> bool {
            std::unique_lock l(m_mut);
            m_cv.wait(l, [&]() {
                return !m_buffer.empty() || !m_running;
            });
            if(!m_running) {
                return false;
            }
            item = std::move(m_buffer.front());
            m_buffer.pop();
            return true;
        }

        /// Discards all queued items and releases all blocked consumers.
        void clear() {
            {
                std::unique_lock l(m_mut);
                m_running = false;
                m_buffer = std::queue<T>();
            }
            m_cv.notify_all();
        }

      private:
        std::queue<T> m_buffer;
        std::mutex m_mut;
        std::condition_variable m_cv;
        bool m_running{true};
    };
}

#endif
