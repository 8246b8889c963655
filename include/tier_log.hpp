#ifndef TIER_LOG_HPP
#define TIER_LOG_HPP

#include "tier_log/core/log_common.hpp"
#include "tier_log/core/log_entry.hpp"
#include "tier_log/core/log_level.hpp"
#include "tier_log/core/event_queue.hpp"
#include "tier_log/config/config_error.hpp"
#include "tier_log/config/level_config.hpp"
#include "tier_log/config/config_locator.hpp"
#include "tier_log/formatter/formatter_interface.hpp"
#include "tier_log/formatter/human_readable_formatter.hpp"
#include "tier_log/formatter/json_formatter.hpp"
#include "tier_log/transport/transport_interface.hpp"
#include "tier_log/transport/file_transport.hpp"
#include "tier_log/transport/stdout_transport.hpp"
#include "tier_log/sink/sink_interface.hpp"
#include "tier_log/sink/console_sink.hpp"
#include "tier_log/sink/debug_sink.hpp"
#include "tier_log/sink/file_sink.hpp"
#include "tier_log/sink/null_sink.hpp"
#include "tier_log/sink/callback_sink.hpp"
#include "tier_log/sink/event_sink.hpp"
#include "tier_log/logger.hpp"
#include "tier_log/composite_logger.hpp"
#include "tier_log/logger_factory.hpp"
#include "tier_log/global.hpp"
#include "tier_log/macros.hpp"

#endif // TIER_LOG_HPP
