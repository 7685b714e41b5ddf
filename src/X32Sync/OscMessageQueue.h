#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "OscTypes.h"

namespace X32Sync
{
    /**
     * @brief Thread-safe FIFO between the inbound dispatcher and the correlator
     *
     * Single consumer by contract. With a non-zero capacity the oldest message
     * is dropped when a new one arrives on a full queue.
     */
    class OscMessageQueue
    {
    public:
        explicit OscMessageQueue(size_t capacity = 0) : m_capacity(capacity), m_dropped(0) {}

        /**
         * @brief Enqueue a message
         *
         * @return true if an older message had to be dropped to make room
         */
        bool enqueue(InboundMessage message)
        {
            bool dropped = false;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_capacity > 0 && m_queue.size() >= m_capacity)
                {
                    m_queue.pop_front();
                    m_dropped++;
                    dropped = true;
                }
                m_queue.push_back(std::move(message));
            }
            m_cv.notify_one();
            return dropped;
        }

        /**
         * @brief Dequeue a message with timeout
         *
         * @param message Output parameter for the message
         * @param timeout Maximum time to wait, zero for a non-blocking check
         * @return true if a message was dequeued, false if timeout
         */
        bool dequeue(InboundMessage &message, std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(m_mutex);

            if (timeout.count() <= 0)
            {
                if (m_queue.empty())
                {
                    return false;
                }
            }
            else if (!m_cv.wait_for(lock, timeout, [this]
                                    { return !m_queue.empty(); }))
            {
                return false;
            }

            message = std::move(m_queue.front());
            m_queue.pop_front();
            return true;
        }

        bool empty() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.empty();
        }

        size_t size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

        /**
         * @brief Discard everything queued so far
         *
         * @return Number of discarded messages
         */
        size_t clear()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            size_t count = m_queue.size();
            m_queue.clear();
            return count;
        }

        /**
         * @brief Messages dropped because the queue was full
         */
        size_t droppedCount() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_dropped;
        }

    private:
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::deque<InboundMessage> m_queue;
        size_t m_capacity;
        size_t m_dropped;
    };

} // namespace X32Sync
