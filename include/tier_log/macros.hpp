#ifndef TIER_LOG_MACROS_HPP
#define TIER_LOG_MACROS_HPP

#ifndef TIER_LOG_NO_MACROS

// Arguments are not evaluated when no node in the logger's chain takes the level.
// The reload check still runs first, so a configuration change that enables
// the level is seen by the same call.
// `logger` is anything dereferenceable to a tierlog::Logger (shared_ptr or raw pointer).
#define TIER_LOG(logger, level, ...) \
    do { \
        auto &tier_log_ref_ = *(logger); \
        auto  tier_log_lvl_ = (level); \
        tier_log_ref_.checkReload(); \
        if (tier_log_ref_.isEnabledInChain(tier_log_lvl_)) { \
            tier_log_ref_.log(tier_log_lvl_, ::tierlog::detail::formatMessage(__VA_ARGS__)); \
        } \
    } while (0)

#define TIER_TRACE(logger, ...) TIER_LOG((logger), ::tierlog::LogLevel::TRACE, __VA_ARGS__)
#define TIER_DEBUG(logger, ...) TIER_LOG((logger), ::tierlog::LogLevel::DEBUG, __VA_ARGS__)
#define TIER_INFO(logger, ...)  TIER_LOG((logger), ::tierlog::LogLevel::INFO,  __VA_ARGS__)
#define TIER_WARN(logger, ...)  TIER_LOG((logger), ::tierlog::LogLevel::WARN,  __VA_ARGS__)
#define TIER_ERROR(logger, ...) TIER_LOG((logger), ::tierlog::LogLevel::ERROR, __VA_ARGS__)
#define TIER_FATAL(logger, ...) TIER_LOG((logger), ::tierlog::LogLevel::FATAL, __VA_ARGS__)

// Exception variants
#define TIER_LOG_EX(logger, level, ex, ...) \
    do { \
        auto &tier_log_ref_ = *(logger); \
        auto  tier_log_lvl_ = (level); \
        tier_log_ref_.checkReload(); \
        if (tier_log_ref_.isEnabledInChain(tier_log_lvl_)) { \
            tier_log_ref_.log(tier_log_lvl_, ::tierlog::detail::formatExceptionMessage( \
                ::tierlog::detail::formatMessage(__VA_ARGS__), (ex))); \
        } \
    } while (0)

#define TIER_TRACE_EX(logger, ex, ...) TIER_LOG_EX((logger), ::tierlog::LogLevel::TRACE, (ex), __VA_ARGS__)
#define TIER_DEBUG_EX(logger, ex, ...) TIER_LOG_EX((logger), ::tierlog::LogLevel::DEBUG, (ex), __VA_ARGS__)
#define TIER_INFO_EX(logger, ex, ...)  TIER_LOG_EX((logger), ::tierlog::LogLevel::INFO,  (ex), __VA_ARGS__)
#define TIER_WARN_EX(logger, ex, ...)  TIER_LOG_EX((logger), ::tierlog::LogLevel::WARN,  (ex), __VA_ARGS__)
#define TIER_ERROR_EX(logger, ex, ...) TIER_LOG_EX((logger), ::tierlog::LogLevel::ERROR, (ex), __VA_ARGS__)
#define TIER_FATAL_EX(logger, ex, ...) TIER_LOG_EX((logger), ::tierlog::LogLevel::FATAL, (ex), __VA_ARGS__)

#endif // TIER_LOG_NO_MACROS

#endif // TIER_LOG_MACROS_HPP
