#ifndef TIER_LOG_FILE_SINK_HPP
#define TIER_LOG_FILE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/human_readable_formatter.hpp"
#include "../transport/file_transport.hpp"

namespace tierlog {
    class FileSink : public BaseSink {
    public:
        explicit FileSink(const std::string &filename) {
            setFormatter(detail::make_unique<HumanReadableFormatter>());
            setTransport(detail::make_unique<FileTransport>(filename));
        }
    };
} // namespace tierlog

#endif // TIER_LOG_FILE_SINK_HPP
