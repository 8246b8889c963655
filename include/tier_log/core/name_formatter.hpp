#ifndef TIER_LOG_NAME_FORMATTER_HPP
#define TIER_LOG_NAME_FORMATTER_HPP

#include <string>
#include <vector>

namespace tierlog {

    /// Logback-style abbreviation of dotted logger names.
    ///
    /// Package segments collapse to their first character and the last
    /// segment is kept whole when it fits:
    ///   "App.Database.Repository.Orders", 40  ->  "A.D.R.Orders"
    ///   "A.B.C.VeryLongClassNameExceedsWidth", 20  ->  "A.B.C.VeryLongCla..."
    /// Names already within the width are left alone.
    inline std::string abbreviateLoggerName(const std::string &name, size_t width) {
        if (name.empty() || name.size() <= width) {
            return name;
        }

        std::vector<std::string> segments;
        size_t start = 0;
        while (true) {
            size_t dot = name.find('.', start);
            if (dot == std::string::npos) {
                segments.push_back(name.substr(start));
                break;
            }
            segments.push_back(name.substr(start, dot - start));
            start = dot + 1;
        }

        if (segments.size() == 1) {
            if (width <= 3) return std::string("...").substr(0, width);
            return name.substr(0, width - 3) + "...";
        }

        std::string prefix;
        for (size_t i = 0; i + 1 < segments.size(); ++i) {
            if (!segments[i].empty()) prefix += segments[i][0];
            prefix += '.';
        }

        const std::string &last = segments.back();
        if (prefix.size() + last.size() <= width) {
            return prefix + last;
        }

        size_t remaining = width > prefix.size() ? width - prefix.size() : 0;
        if (remaining > 3) {
            return prefix + last.substr(0, remaining - 3) + "...";
        }
        return prefix + "...";
    }

} // namespace tierlog

#endif // TIER_LOG_NAME_FORMATTER_HPP
