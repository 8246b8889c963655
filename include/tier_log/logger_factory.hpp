#ifndef TIER_LOG_LOGGER_FACTORY_HPP
#define TIER_LOG_LOGGER_FACTORY_HPP

#include "logger.hpp"
#include "config/config_locator.hpp"
#include "config/level_config.hpp"
#include "config/rule_set.hpp"
#include "core/file_system.hpp"
#include "sink/console_sink.hpp"
#include "sink/null_sink.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tierlog {

    class FactoryConfiguration;

    /// Hands out named loggers whose levels come from a LevelConfig.
    ///
    /// Loggers are cached by lower-cased name, so "App.Db" and "app.db"
    /// are the same logger.  Every logger created or registered here gets a
    /// reload hook that runs checkConfigReload() on each log call; when the
    /// configuration file changed on disk, the new levels are pushed into
    /// all cached loggers.
    ///
    /// Usage:
    /// @code
    ///   auto factory = tierlog::LoggerFactory::create();
    ///   factory->loadConfig("logging.properties");
    ///   auto log = factory->getLogger("App.Database.Connection");
    ///   log->debug("Connected to {host}", host);
    /// @endcode
    class LoggerFactory : public std::enable_shared_from_this<LoggerFactory> {
    public:
        typedef std::function<std::unique_ptr<ISink>(const std::string &)> SinkFactory;

        /// @param config shared rule store; a fresh LevelConfig if null
        static std::shared_ptr<LoggerFactory> create(std::shared_ptr<LevelConfig> config = nullptr) {
            if (!config) {
                config = std::make_shared<LevelConfig>();
            }
            return std::shared_ptr<LoggerFactory>(new LoggerFactory(std::move(config)));
        }

        /// Fluent builder; defined in factory_configuration.hpp.
        static FactoryConfiguration configure();

        LoggerFactory(const LoggerFactory &) = delete;
        LoggerFactory &operator=(const LoggerFactory &) = delete;

        // ------------------------------------------------------------------
        //  Loggers
        // ------------------------------------------------------------------

        /// Cached logger for the name, created with the configured level on
        /// first use.  The empty name is the root logger.
        std::shared_ptr<Logger> getLogger(const std::string &name = "") {
            std::string key = RuleSet::normalizeName(name);
            SinkFactory sinkFactory;
            LogLevel fallback;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_loggers.find(key);
                if (it != m_loggers.end()) {
                    return it->second;
                }
                sinkFactory = m_sinkFactory;
                fallback = m_defaultLevel;
            }

            LogLevel level = m_config->getLevelForLogger(name, fallback);
            std::unique_ptr<ISink> sink;
            if (sinkFactory) {
                sink = sinkFactory(name);
            }
            auto logger = std::make_shared<Logger>(name, level, std::move(sink));
            installReloadHook(logger);

            std::lock_guard<std::mutex> lock(m_mutex);
            auto inserted = m_loggers.insert(std::make_pair(key, logger));
            return inserted.first->second;
        }

        /// Register a logger built by the caller under a name.  Its level is
        /// set from the configuration and it takes part in reload propagation.
        /// @throws std::invalid_argument if logger is null
        void setLogger(const std::string &name, std::shared_ptr<Logger> logger) {
            if (!logger) {
                throw std::invalid_argument("Logger instance cannot be null");
            }
            logger->setLevel(m_config->getLevelForLogger(name, defaultLevel()));
            installReloadHook(logger);

            std::lock_guard<std::mutex> lock(m_mutex);
            m_loggers[RuleSet::normalizeName(name)] = std::move(logger);
        }

        bool hasLogger(const std::string &name) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_loggers.find(RuleSet::normalizeName(name)) != m_loggers.end();
        }

        size_t loggerCount() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_loggers.size();
        }

        // ------------------------------------------------------------------
        //  Backends for loggers created from now on
        // ------------------------------------------------------------------

        void setSinkFactory(SinkFactory factory) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sinkFactory = std::move(factory);
        }

        void useConsoleSink(bool useColors = true) {
            setSinkFactory([useColors](const std::string &) -> std::unique_ptr<ISink> {
                return detail::make_unique<ConsoleSink>(useColors);
            });
        }

        void useNullSink() {
            setSinkFactory([](const std::string &) -> std::unique_ptr<ISink> {
                return detail::make_unique<NullSink>();
            });
        }

        // ------------------------------------------------------------------
        //  Levels and configuration
        // ------------------------------------------------------------------

        /// Level used for names no rule matches.  Re-applied to cached loggers.
        void setDefaultLevel(LogLevel level) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_defaultLevel = level;
            }
            applyLevels();
        }

        LogLevel defaultLevel() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_defaultLevel;
        }

        std::shared_ptr<LevelConfig> config() const { return m_config; }

        /// @throws ConfigFileNotFound, ConfigError
        void loadConfig(const std::string &path) {
            m_config->loadFromFile(path);
            applyLevels();
        }

        void loadConfigText(const std::string &content) {
            m_config->loadFromText(content);
            applyLevels();
        }

        /// Look for the default configuration file next to the process and
        /// load the first one found.
        /// @return false if no candidate exists
        bool loadDefaultConfig(const std::string &exeDir = executableDirectory()) {
            PosixFileSystem fileSystem;
            std::string path = findConfigFile(fileSystem, defaultConfigFileName(),
                                              currentDirectory(), exeDir);
            if (path.empty()) {
                return false;
            }
            loadConfig(path);
            return true;
        }

        void setLoggerLevel(const std::string &name, LogLevel level) {
            m_config->setLoggerLevel(name, level);
            applyLevels();
        }

        /// Reload the configuration file if its scan period elapsed and it
        /// changed, then push the new levels into cached loggers.
        void checkConfigReload() {
            m_config->checkAndReloadIfNeeded();
            if (m_config->wasConfigReloaded()) {
                applyLevels();
            }
        }

        // ------------------------------------------------------------------
        //  Chain helpers on the root logger
        // ------------------------------------------------------------------

        std::shared_ptr<Logger> addToChain(const std::shared_ptr<Logger> &logger) {
            return getLogger()->addToChain(logger);
        }

        bool removeFromChain(const std::shared_ptr<Logger> &logger) {
            return getLogger()->removeFromChain(logger);
        }

        size_t chainCount() {
            return getLogger()->chainCount();
        }

        void clearChain() {
            getLogger()->clearChain();
        }

        /// Drop cached loggers and go back to console output.  The
        /// configuration is left alone.
        void reset() {
            std::map<std::string, std::shared_ptr<Logger> > old;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                old.swap(m_loggers);
                m_sinkFactory = defaultSinkFactory();
            }
        }

    private:
        explicit LoggerFactory(std::shared_ptr<LevelConfig> config)
            : m_config(std::move(config))
            , m_defaultLevel(LogLevel::INFO)
            , m_sinkFactory(defaultSinkFactory()) {}

        static SinkFactory defaultSinkFactory() {
            return [](const std::string &) -> std::unique_ptr<ISink> {
                return detail::make_unique<ConsoleSink>();
            };
        }

        void installReloadHook(const std::shared_ptr<Logger> &logger) {
            std::weak_ptr<LoggerFactory> weak = shared_from_this();
            logger->setReloadHook([weak]() {
                std::shared_ptr<LoggerFactory> factory = weak.lock();
                if (factory) {
                    factory->checkConfigReload();
                }
            });
        }

        void applyLevels() {
            std::vector<std::pair<std::string, std::shared_ptr<Logger> > > loggers;
            LogLevel fallback;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                loggers.assign(m_loggers.begin(), m_loggers.end());
                fallback = m_defaultLevel;
            }
            for (size_t i = 0; i < loggers.size(); ++i) {
                loggers[i].second->setLevel(m_config->getLevelForLogger(loggers[i].first, fallback));
            }
        }

        const std::shared_ptr<LevelConfig> m_config;
        mutable std::mutex m_mutex;
        LogLevel m_defaultLevel;
        SinkFactory m_sinkFactory;
        std::map<std::string, std::shared_ptr<Logger> > m_loggers;
    };

} // namespace tierlog

#include "factory_configuration.hpp"

#endif // TIER_LOG_LOGGER_FACTORY_HPP
