#ifndef TIER_LOG_LEVEL_CONFIG_HPP
#define TIER_LOG_LEVEL_CONFIG_HPP

#include "rule_set.hpp"
#include "config_error.hpp"
#include "scan_period.hpp"
#include "../core/clock.hpp"
#include "../core/file_system.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace tierlog {

    /// Logback-style level configuration for hierarchical logger names.
    ///
    /// Properties format:
    /// @code
    ///   # comment, "!" also starts a comment
    ///   root=WARN
    ///   mqtt.transport=DEBUG
    ///   mqtt.*=INFO
    ///   scan=true
    ///   scan.period=30 seconds
    /// @endcode
    ///
    /// Lookups resolve an exact rule first, then the most specific wildcard,
    /// then the root level.  Names are case-insensitive.
    ///
    /// Thread safety: every method may be called concurrently.  Rules are
    /// guarded by one mutex; parsing and file I/O happen outside it.
    /// checkAndReloadIfNeeded() only touches atomics until the scan period
    /// has elapsed, so it is cheap enough to call on every log statement.
    class LevelConfig {
    public:
        LevelConfig()
            : LevelConfig(std::make_shared<SteadyClock>(), std::make_shared<PosixFileSystem>()) {}

        LevelConfig(std::shared_ptr<IClock> clock, std::shared_ptr<IFileSystem> fileSystem)
            : m_clock(std::move(clock))
            , m_fileSystem(std::move(fileSystem))
            , m_configFileModTime(0)
            , m_configReloaded(false)
            , m_hasConfigFile(false)
            , m_scanEnabled(false)
            , m_scanPeriodMs(kDefaultScanPeriodMs)
            , m_lastCheckNs(0) {
            if (!m_clock) m_clock = std::make_shared<SteadyClock>();
            if (!m_fileSystem) m_fileSystem = std::make_shared<PosixFileSystem>();
        }

        LevelConfig(const LevelConfig &) = delete;
        LevelConfig &operator=(const LevelConfig &) = delete;

        /// Replace all rules and the root level with the content of a
        /// properties string.  Scan settings change only where the text
        /// sets "scan" or "scan.period".
        void loadFromText(const std::string &content) {
            apply(RuleSet::parse(content));
        }

        /// Load a properties file and remember it for reload().
        /// @throws ConfigFileNotFound if the file does not exist.
        /// @throws ConfigError if it exists but cannot be read.
        void loadFromFile(const std::string &path) {
            if (!m_fileSystem->exists(path)) {
                throw ConfigFileNotFound(path);
            }

            std::string content;
            try {
                content = m_fileSystem->readAll(path);
            } catch (const std::runtime_error &e) {
                throw ConfigError(std::string("Failed to read logger configuration: ") + e.what(), path);
            }
            std::int64_t modTime = m_fileSystem->lastWriteTime(path);

            RuleSet parsed = RuleSet::parse(content);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                applyLocked(parsed);
                m_configFile = path;
                m_configFileModTime = modTime;
            }
            m_lastCheckNs.store(nowNs(), std::memory_order_release);
            m_hasConfigFile.store(true, std::memory_order_release);
        }

        /// @param name logger name, case-insensitive
        /// @param defaultLevel returned when no rule matches and the root
        ///        level is still INFO
        LogLevel getLevelForLogger(const std::string &name,
                                   LogLevel defaultLevel = LogLevel::INFO) const {
            std::string normalized = RuleSet::normalizeName(name);
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_rules.resolve(normalized, defaultLevel);
        }

        /// Runtime override.  "root" or "*" sets the root level, patterns
        /// containing '*' replace any identical wildcard rule.
        void setLoggerLevel(const std::string &name, LogLevel level) {
            std::string normalized = RuleSet::normalizeName(name);
            std::lock_guard<std::mutex> lock(m_mutex);
            m_rules.setRule(normalized, level);
            m_rules.sortWildcards();
        }

        LogLevel getRootLevel() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_rules.rootLevel();
        }

        void setRootLevel(LogLevel level) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_rules.setRootLevel(level);
        }

        /// Re-read the file given to the last loadFromFile().
        /// @throws std::logic_error if no file was ever loaded.
        void reload() {
            std::string path = configFile();
            if (path.empty()) {
                throw std::logic_error("No configuration file loaded. Cannot reload.");
            }
            loadFromFile(path);
        }

        /// Drop all rules and reset the root level.  Scan settings and the
        /// remembered file survive.
        void clear() {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_rules.clearRules();
        }

        std::string configFile() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_configFile;
        }

        bool isScanEnabled() const {
            return m_scanEnabled.load(std::memory_order_acquire);
        }

        void setScanEnabled(bool enabled) {
            m_scanEnabled.store(enabled, std::memory_order_release);
        }

        std::chrono::milliseconds scanPeriod() const {
            return std::chrono::milliseconds(m_scanPeriodMs.load(std::memory_order_acquire));
        }

        void setScanPeriod(std::chrono::milliseconds period) {
            m_scanPeriodMs.store(clampScanPeriod(period).count(), std::memory_order_release);
        }

        /// Opportunistic reload.  Returns immediately unless scanning is on,
        /// a file is loaded and the scan period has elapsed since the last
        /// check.  Past that gate exactly one caller stats the file and, if
        /// it changed, re-parses it.  Failures keep the current rules.
        void checkAndReloadIfNeeded() {
            if (!m_scanEnabled.load(std::memory_order_acquire) ||
                !m_hasConfigFile.load(std::memory_order_acquire)) {
                return;
            }

            long long now = nowNs();
            long long lastCheck = m_lastCheckNs.load(std::memory_order_acquire);
            long long periodNs = m_scanPeriodMs.load(std::memory_order_acquire) * 1000000LL;
            if (now - lastCheck < periodNs) {
                return;
            }

            // Claim this check; the stamp moves even if the reload below fails.
            if (!m_lastCheckNs.compare_exchange_strong(lastCheck, now, std::memory_order_acq_rel)) {
                return;
            }

            std::string path;
            std::int64_t knownModTime;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                path = m_configFile;
                knownModTime = m_configFileModTime;
            }

            try {
                std::int64_t modTime = m_fileSystem->lastWriteTime(path);
                if (modTime == knownModTime) {
                    return;
                }

                RuleSet parsed = RuleSet::parse(m_fileSystem->readAll(path));

                std::lock_guard<std::mutex> lock(m_mutex);
                applyLocked(parsed);
                m_configFileModTime = modTime;
                m_configReloaded = true;
            } catch (const std::exception &) {
                // Keep the previous configuration; logging must not fail
                // because the file is missing or half-written.
            }
        }

        /// True once after each successful automatic reload.
        bool wasConfigReloaded() {
            std::lock_guard<std::mutex> lock(m_mutex);
            bool reloaded = m_configReloaded;
            m_configReloaded = false;
            return reloaded;
        }

    private:
        std::shared_ptr<IClock> m_clock;
        std::shared_ptr<IFileSystem> m_fileSystem;

        mutable std::mutex m_mutex;
        RuleSet m_rules;
        std::string m_configFile;
        std::int64_t m_configFileModTime;
        bool m_configReloaded;

        std::atomic<bool> m_hasConfigFile;
        std::atomic<bool> m_scanEnabled;
        std::atomic<long long> m_scanPeriodMs;
        std::atomic<long long> m_lastCheckNs;

        long long nowNs() const {
            return std::chrono::duration_cast<std::chrono::nanoseconds>(
                m_clock->now().time_since_epoch()).count();
        }

        void apply(const RuleSet &parsed) {
            std::lock_guard<std::mutex> lock(m_mutex);
            applyLocked(parsed);
        }

        // Scan settings the text leaves out keep their current values.
        void applyLocked(const RuleSet &parsed) {
            m_rules = parsed;
            if (parsed.hasScanEnabled()) {
                m_scanEnabled.store(parsed.scanEnabled(), std::memory_order_release);
            }
            if (parsed.hasScanPeriod()) {
                m_scanPeriodMs.store(parsed.scanPeriod().count(), std::memory_order_release);
            }
        }
    };

} // namespace tierlog

#endif // TIER_LOG_LEVEL_CONFIG_HPP
