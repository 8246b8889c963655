#ifndef TIER_LOG_EVENT_QUEUE_HPP
#define TIER_LOG_EVENT_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>

namespace tierlog {

    /// Unbounded FIFO of tasks handed from logging threads to one consumer
    /// thread (typically the UI/main loop).
    ///
    /// post() never waits for the consumer.  dispatchPending() runs what
    /// was queued at the time of the call, in enqueue order, on the calling
    /// thread.  A task that throws is counted and skipped.
    class EventQueue {
    public:
        typedef std::function<void()> Task;

        EventQueue() : m_failedCount(0) {}

        EventQueue(const EventQueue &) = delete;
        EventQueue &operator=(const EventQueue &) = delete;

        void post(Task task) {
            if (!task) return;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_tasks.push_back(std::move(task));
            }
            m_cv.notify_one();
        }

        /// @return number of tasks run, including ones that threw
        size_t dispatchPending() {
            std::deque<Task> batch;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                batch.swap(m_tasks);
            }

            for (auto &task : batch) {
                try {
                    task();
                } catch (const std::exception &) {
                    m_failedCount.fetch_add(1, std::memory_order_relaxed);
                }
            }
            return batch.size();
        }

        /// Block the consumer until something is queued or the timeout
        /// expires.  Returns true if tasks are pending.
        bool waitForEvents(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(m_mutex);
            return m_cv.wait_for(lock, timeout, [this] { return !m_tasks.empty(); });
        }

        size_t pendingCount() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_tasks.size();
        }

        size_t failedCount() const {
            return m_failedCount.load(std::memory_order_relaxed);
        }

    private:
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::deque<Task> m_tasks;
        std::atomic<size_t> m_failedCount;
    };

} // namespace tierlog

#endif // TIER_LOG_EVENT_QUEUE_HPP
