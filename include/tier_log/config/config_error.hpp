#ifndef TIER_LOG_CONFIG_ERROR_HPP
#define TIER_LOG_CONFIG_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tierlog {

    /// Raised by explicit configuration loads.  Automatic reloads never
    /// surface it.
    class ConfigError : public std::runtime_error {
    public:
        ConfigError(const std::string &message, const std::string &path)
            : std::runtime_error(message), m_path(path) {}

        const std::string &path() const { return m_path; }

    private:
        std::string m_path;
    };

    class ConfigFileNotFound : public ConfigError {
    public:
        explicit ConfigFileNotFound(const std::string &path)
            : ConfigError("Logger configuration file not found: " + path, path) {}
    };

} // namespace tierlog

#endif // TIER_LOG_CONFIG_ERROR_HPP
