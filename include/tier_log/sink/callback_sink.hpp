#ifndef TIER_LOG_CALLBACK_SINK_HPP
#define TIER_LOG_CALLBACK_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/human_readable_formatter.hpp"
#include <functional>
#include <string>
#include <memory>

namespace tierlog {

    /// Hands each accepted entry to a user function, either as the raw
    /// LogEntry or as the line produced by the sink's formatter.
    ///
    /// The callback runs on the logging thread and its exceptions reach
    /// the log call.
    class CallbackSink : public ISink {
    public:
        typedef std::function<void(const LogEntry&)> EntryCallback;
        typedef std::function<void(const std::string&)> StringCallback;

        /// Wrap lambdas in the typedef to pick the overload:
        /// @code
        ///   CallbackSink(CallbackSink::EntryCallback([](const LogEntry& e) { ... }))
        /// @endcode
        explicit CallbackSink(EntryCallback callback)
            : m_callback(std::move(callback)) {}

        /// @param fmt HumanReadableFormatter if null
        explicit CallbackSink(StringCallback callback, std::unique_ptr<IFormatter> fmt = nullptr) {
            if (!fmt) {
                fmt = detail::make_unique<HumanReadableFormatter>();
            }
            setFormatter(std::move(fmt));
            if (callback) {
                m_callback = [this, callback](const LogEntry& entry) {
                    callback(formatter()->format(entry));
                };
            }
        }

        CallbackSink(const CallbackSink&) = delete;
        CallbackSink& operator=(const CallbackSink&) = delete;

        void write(const LogEntry& entry) override {
            if (m_callback) {
                m_callback(entry);
            }
        }

    private:
        EntryCallback m_callback;
    };

} // namespace tierlog

#endif // TIER_LOG_CALLBACK_SINK_HPP
