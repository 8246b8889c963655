#ifndef TIER_LOG_FACTORY_CONFIGURATION_HPP
#define TIER_LOG_FACTORY_CONFIGURATION_HPP

// Included by logger_factory.hpp after the LoggerFactory definition.

#include "logger_factory.hpp"
#include "formatter/formatter_interface.hpp"
#include "sink/sink_interface.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tierlog {

    namespace detail {
        template<typename SinkType, typename... Args>
        std::unique_ptr<ISink> makeSink(const Args &... args) {
            return make_unique<SinkType>(args...);
        }

        template<typename SinkType, typename FormatterType, typename... Args>
        std::unique_ptr<ISink> makeSinkWithFormatter(const Args &... args) {
            std::unique_ptr<ISink> sink = make_unique<SinkType>(args...);
            sink->setFormatter(make_unique<FormatterType>());
            return sink;
        }
    } // namespace detail

    /// Fluent builder for a configured LoggerFactory.
    ///
    /// Usage:
    /// @code
    ///   auto factory = LoggerFactory::configure()
    ///       .defaultLevel(LogLevel::DEBUG)
    ///       .configFile("logging.properties")
    ///       .level("App.Database.*", LogLevel::TRACE)
    ///       .writeTo<FileSink, JsonFormatter>("app.jsonl")
    ///       .build();
    /// @endcode
    ///
    /// build() applies settings in a fixed order: backend and default level,
    /// then the configuration source, then explicit level rules, then scan
    /// overrides.  A configuration that sets scan keys would otherwise win
    /// over the builder, so the overrides come last.
    class FactoryConfiguration {
    public:
        FactoryConfiguration()
            : m_defaultLevel(LogLevel::INFO)
            , m_source(Source::None)
            , m_hasScanEnabled(false)
            , m_scanEnabled(false)
            , m_hasScanPeriod(false)
            , m_scanPeriodMs(0) {}

        FactoryConfiguration(const FactoryConfiguration &) = delete;
        FactoryConfiguration &operator=(const FactoryConfiguration &) = delete;
        FactoryConfiguration(FactoryConfiguration &&) = default;
        FactoryConfiguration &operator=(FactoryConfiguration &&) = default;

        FactoryConfiguration &defaultLevel(LogLevel level) {
            m_defaultLevel = level;
            return *this;
        }

        /// Load a .properties file on build().  Throws from build() if missing.
        FactoryConfiguration &configFile(const std::string &path) {
            m_source = Source::File;
            m_sourceValue = path;
            return *this;
        }

        FactoryConfiguration &configText(const std::string &content) {
            m_source = Source::Text;
            m_sourceValue = content;
            return *this;
        }

        /// Search for the default configuration file on build(); finding
        /// none is not an error.
        FactoryConfiguration &defaultConfig(const std::string &exeDir = executableDirectory()) {
            m_source = Source::Search;
            m_sourceValue = exeDir;
            return *this;
        }

        FactoryConfiguration &level(const std::string &pattern, LogLevel level) {
            m_levels.push_back(std::make_pair(pattern, level));
            return *this;
        }

        FactoryConfiguration &scan(bool enabled) {
            m_hasScanEnabled = true;
            m_scanEnabled = enabled;
            return *this;
        }

        FactoryConfiguration &scanPeriod(std::chrono::milliseconds period) {
            m_hasScanPeriod = true;
            m_scanPeriodMs = static_cast<long long>(period.count());
            return *this;
        }

        FactoryConfiguration &sinkFactory(LoggerFactory::SinkFactory factory) {
            m_sinkFactory = std::move(factory);
            return *this;
        }

        /// Backend for every logger the factory creates.  Arguments are
        /// copied and used to construct one sink per logger.  The last
        /// writeTo() or sinkFactory() call wins.
        template<typename SinkType, typename... Args>
        typename std::enable_if<
            std::is_base_of<ISink, SinkType>::value &&
            std::is_constructible<SinkType, const typename std::decay<Args>::type &...>::value,
            FactoryConfiguration &
        >::type
        writeTo(Args &&... args) {
            std::function<std::unique_ptr<ISink>()> maker = std::bind(
                &detail::makeSink<SinkType, typename std::decay<Args>::type...>,
                std::forward<Args>(args)...);
            m_sinkFactory = [maker](const std::string &) { return maker(); };
            return *this;
        }

        template<typename SinkType, typename FormatterType, typename... Args>
        typename std::enable_if<
            std::is_base_of<ISink, SinkType>::value &&
            std::is_base_of<IFormatter, FormatterType>::value &&
            std::is_constructible<SinkType, const typename std::decay<Args>::type &...>::value,
            FactoryConfiguration &
        >::type
        writeTo(Args &&... args) {
            std::function<std::unique_ptr<ISink>()> maker = std::bind(
                &detail::makeSinkWithFormatter<SinkType, FormatterType, typename std::decay<Args>::type...>,
                std::forward<Args>(args)...);
            m_sinkFactory = [maker](const std::string &) { return maker(); };
            return *this;
        }

        std::shared_ptr<LoggerFactory> build() {
            std::shared_ptr<LoggerFactory> factory = LoggerFactory::create();
            if (m_sinkFactory) {
                factory->setSinkFactory(m_sinkFactory);
            }
            factory->setDefaultLevel(m_defaultLevel);

            switch (m_source) {
                case Source::File:
                    factory->loadConfig(m_sourceValue);
                    break;
                case Source::Text:
                    factory->loadConfigText(m_sourceValue);
                    break;
                case Source::Search:
                    factory->loadDefaultConfig(m_sourceValue);
                    break;
                case Source::None:
                    break;
            }

            for (size_t i = 0; i < m_levels.size(); ++i) {
                factory->setLoggerLevel(m_levels[i].first, m_levels[i].second);
            }

            std::shared_ptr<LevelConfig> config = factory->config();
            if (m_hasScanEnabled) {
                config->setScanEnabled(m_scanEnabled);
            }
            if (m_hasScanPeriod) {
                config->setScanPeriod(std::chrono::milliseconds(m_scanPeriodMs));
            }
            return factory;
        }

    private:
        enum class Source { None, File, Text, Search };

        LogLevel m_defaultLevel;
        Source m_source;
        std::string m_sourceValue;
        std::vector<std::pair<std::string, LogLevel> > m_levels;
        LoggerFactory::SinkFactory m_sinkFactory;
        bool m_hasScanEnabled;
        bool m_scanEnabled;
        bool m_hasScanPeriod;
        long long m_scanPeriodMs;
    };

    inline FactoryConfiguration LoggerFactory::configure() {
        return FactoryConfiguration();
    }

} // namespace tierlog

#endif // TIER_LOG_FACTORY_CONFIGURATION_HPP
