#ifndef TIER_LOG_EVENT_SINK_HPP
#define TIER_LOG_EVENT_SINK_HPP

#include "sink_interface.hpp"
#include "../core/event_queue.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace tierlog {

    /// Delivers entries as events on the thread that drains an EventQueue.
    ///
    /// write() only enqueues, so producers never wait for the consumer.
    /// On dispatch the handler registered for the entry's level runs; if
    /// there is none, the catch-all message handler runs instead.
    ///
    /// Handlers live in shared state captured by each queued task, so
    /// destroying the sink with events still queued is safe.
    class EventSink : public ISink {
    public:
        typedef std::function<void(const LogEntry&)> Handler;

        /// @throws std::invalid_argument if queue is null
        explicit EventSink(std::shared_ptr<EventQueue> queue)
            : m_queue(std::move(queue))
            , m_state(std::make_shared<State>()) {
            if (!m_queue) {
                throw std::invalid_argument("EventSink requires an EventQueue");
            }
        }

        void setHandler(LogLevel level, Handler handler) {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->levelHandlers[static_cast<int>(level)] = std::move(handler);
        }

        void setMessageHandler(Handler handler) {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->messageHandler = std::move(handler);
        }

        void write(const LogEntry& entry) override {
            std::shared_ptr<State> state = m_state;
            m_queue->post([state, entry]() {
                Handler handler;
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    handler = state->levelHandlers[static_cast<int>(entry.level)];
                    if (!handler) {
                        handler = state->messageHandler;
                    }
                }
                if (handler) {
                    handler(entry);
                }
            });
        }

    private:
        struct State {
            std::mutex mutex;
            Handler levelHandlers[6];
            Handler messageHandler;
        };

        std::shared_ptr<EventQueue> m_queue;
        std::shared_ptr<State> m_state;
    };

} // namespace tierlog

#endif // TIER_LOG_EVENT_SINK_HPP
