#ifndef TIER_LOG_MESSAGE_FORMAT_HPP
#define TIER_LOG_MESSAGE_FORMAT_HPP

#include <string>
#include <sstream>
#include <vector>

namespace tierlog {
namespace detail {

    template<typename T>
    std::string toString(const T &value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    inline std::string toString(const std::string &value) {
        return value;
    }

    inline std::string toString(const char *value) {
        return value ? std::string(value) : std::string("(null)");
    }

    inline std::string toString(bool value) {
        return value ? "true" : "false";
    }

    /// Substitutes values into {placeholder} slots in order of appearance.
    /// Placeholder names are documentation only.  "{{" and "}}" produce
    /// literal braces; placeholders without a value stay verbatim.
    inline std::string substitutePlaceholders(const std::string &messageTemplate,
                                              const std::vector<std::string> &values) {
        std::string result;
        result.reserve(messageTemplate.length());
        size_t valueIndex = 0;

        for (size_t i = 0; i < messageTemplate.length(); ++i) {
            if (messageTemplate[i] == '{') {
                if (i + 1 < messageTemplate.length() && messageTemplate[i + 1] == '{') {
                    result += '{';
                    ++i;
                } else {
                    size_t endPos = messageTemplate.find('}', i);
                    if (endPos == std::string::npos) {
                        result += messageTemplate[i];
                    } else if (valueIndex < values.size()) {
                        result += values[valueIndex++];
                        i = endPos;
                    } else {
                        result += messageTemplate.substr(i, endPos - i + 1);
                        i = endPos;
                    }
                }
            } else if (messageTemplate[i] == '}') {
                if (i + 1 < messageTemplate.length() && messageTemplate[i + 1] == '}') {
                    result += '}';
                    ++i;
                } else {
                    result += messageTemplate[i];
                }
            } else {
                result += messageTemplate[i];
            }
        }
        return result;
    }

    template<typename... Args>
    std::string formatMessage(const std::string &messageTemplate, const Args &... args) {
        std::vector<std::string> values{toString(args)...};
        return substitutePlaceholders(messageTemplate, values);
    }

} // namespace detail
} // namespace tierlog

#endif // TIER_LOG_MESSAGE_FORMAT_HPP
