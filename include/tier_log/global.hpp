#ifndef TIER_LOG_GLOBAL_HPP
#define TIER_LOG_GLOBAL_HPP

#include "logger_factory.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace tierlog {

    class GlobalFactoryConfiguration;

    /// Static global facade over one LoggerFactory.
    ///
    /// Usage:
    /// @code
    ///   tierlog::Log::configure()
    ///       .configFile("logging.properties")
    ///       .build();   // sets the global factory
    ///
    ///   tierlog::Log::info("Hello {name}", "world");
    ///   auto db = tierlog::Log::getLogger("App.Database");
    ///   tierlog::Log::shutdown();
    /// @endcode
    ///
    /// Thread safety: the mutex is held only to copy the shared_ptr to the
    /// factory.  Logging runs outside it, and calls that already hold the
    /// factory finish safely even if shutdown() runs concurrently.
    class Log {
    public:
        Log() = delete;

        /// Builder whose build() also installs the result as the global factory.
        static GlobalFactoryConfiguration configure();

        /// Replace the global factory.  The previous one is released
        /// outside the lock.
        /// @throws std::invalid_argument if factory is null
        static void init(std::shared_ptr<LoggerFactory> factory) {
            if (!factory) {
                throw std::invalid_argument("tierlog::Log::init() requires a factory");
            }
            {
                std::lock_guard<std::mutex> lock(mutex());
                storage().swap(factory);
            }
        }

        /// Clear the global factory.  Afterwards every method except init(),
        /// configure() and isInitialized() throws std::logic_error.
        static void shutdown() {
            std::shared_ptr<LoggerFactory> old;
            {
                std::lock_guard<std::mutex> lock(mutex());
                old = std::move(storage());
            }
        }

        static bool isInitialized() {
            std::lock_guard<std::mutex> lock(mutex());
            return storage() != nullptr;
        }

        /// @throws std::logic_error if not initialized.
        static std::shared_ptr<LoggerFactory> factory() {
            return requireInit();
        }

        /// @throws std::logic_error if not initialized.
        static std::shared_ptr<Logger> getLogger(const std::string &name = "") {
            return requireInit()->getLogger(name);
        }

        // --- Logging through the root logger ---

        template<typename... Args>
        static void trace(Args &&... args) {
            requireInit()->getLogger()->trace(std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void debug(Args &&... args) {
            requireInit()->getLogger()->debug(std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void info(Args &&... args) {
            requireInit()->getLogger()->info(std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void warn(Args &&... args) {
            requireInit()->getLogger()->warn(std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void error(Args &&... args) {
            requireInit()->getLogger()->error(std::forward<Args>(args)...);
        }

        template<typename... Args>
        static void fatal(Args &&... args) {
            requireInit()->getLogger()->fatal(std::forward<Args>(args)...);
        }

    private:
        static std::shared_ptr<LoggerFactory> &storage() {
            static std::shared_ptr<LoggerFactory> s_factory;
            return s_factory;
        }

        static std::mutex &mutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }

        static std::shared_ptr<LoggerFactory> requireInit() {
            std::shared_ptr<LoggerFactory> ptr;
            {
                std::lock_guard<std::mutex> lock(mutex());
                ptr = storage();
            }
            if (!ptr) {
                throw std::logic_error(
                    "tierlog::Log not initialized. Call Log::init() or "
                    "Log::configure().build() first.");
            }
            return ptr;
        }
    };

    // -----------------------------------------------------------------
    //  GlobalFactoryConfiguration
    // -----------------------------------------------------------------

    /// Builder returned by Log::configure().  Forwards to
    /// FactoryConfiguration and calls Log::init() from build().
    class GlobalFactoryConfiguration {
    public:
        GlobalFactoryConfiguration() = default;
        GlobalFactoryConfiguration(const GlobalFactoryConfiguration &) = delete;
        GlobalFactoryConfiguration &operator=(const GlobalFactoryConfiguration &) = delete;
        GlobalFactoryConfiguration(GlobalFactoryConfiguration &&) = default;
        GlobalFactoryConfiguration &operator=(GlobalFactoryConfiguration &&) = default;

        GlobalFactoryConfiguration &defaultLevel(LogLevel level) {
            m_config.defaultLevel(level); return *this;
        }
        GlobalFactoryConfiguration &configFile(const std::string &path) {
            m_config.configFile(path); return *this;
        }
        GlobalFactoryConfiguration &configText(const std::string &content) {
            m_config.configText(content); return *this;
        }
        GlobalFactoryConfiguration &defaultConfig(const std::string &exeDir = executableDirectory()) {
            m_config.defaultConfig(exeDir); return *this;
        }
        GlobalFactoryConfiguration &level(const std::string &pattern, LogLevel level) {
            m_config.level(pattern, level); return *this;
        }
        GlobalFactoryConfiguration &scan(bool enabled) {
            m_config.scan(enabled); return *this;
        }
        GlobalFactoryConfiguration &scanPeriod(std::chrono::milliseconds period) {
            m_config.scanPeriod(period); return *this;
        }
        GlobalFactoryConfiguration &sinkFactory(LoggerFactory::SinkFactory factory) {
            m_config.sinkFactory(std::move(factory)); return *this;
        }

        template<typename SinkType, typename... Args>
        typename std::enable_if<
            std::is_base_of<ISink, SinkType>::value &&
            std::is_constructible<SinkType, const typename std::decay<Args>::type &...>::value,
            GlobalFactoryConfiguration &
        >::type
        writeTo(Args &&... args) {
            m_config.writeTo<SinkType>(std::forward<Args>(args)...);
            return *this;
        }

        template<typename SinkType, typename FormatterType, typename... Args>
        typename std::enable_if<
            std::is_base_of<ISink, SinkType>::value &&
            std::is_base_of<IFormatter, FormatterType>::value &&
            std::is_constructible<SinkType, const typename std::decay<Args>::type &...>::value,
            GlobalFactoryConfiguration &
        >::type
        writeTo(Args &&... args) {
            m_config.writeTo<SinkType, FormatterType>(std::forward<Args>(args)...);
            return *this;
        }

        /// Build the factory, install it globally and return it.
        std::shared_ptr<LoggerFactory> build() {
            std::shared_ptr<LoggerFactory> factory = m_config.build();
            Log::init(factory);
            return factory;
        }

    private:
        FactoryConfiguration m_config;
    };

    inline GlobalFactoryConfiguration Log::configure() {
        return GlobalFactoryConfiguration();
    }

} // namespace tierlog

#ifndef TIER_LOG_NO_GLOBAL_MACROS

#define TIER_GTRACE(...) ::tierlog::Log::trace(__VA_ARGS__)
#define TIER_GDEBUG(...) ::tierlog::Log::debug(__VA_ARGS__)
#define TIER_GINFO(...)  ::tierlog::Log::info(__VA_ARGS__)
#define TIER_GWARN(...)  ::tierlog::Log::warn(__VA_ARGS__)
#define TIER_GERROR(...) ::tierlog::Log::error(__VA_ARGS__)
#define TIER_GFATAL(...) ::tierlog::Log::fatal(__VA_ARGS__)

#endif // TIER_LOG_NO_GLOBAL_MACROS

#endif // TIER_LOG_GLOBAL_HPP
