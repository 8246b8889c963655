#ifndef TIER_LOG_RULE_SET_HPP
#define TIER_LOG_RULE_SET_HPP

#include "../core/log_level.hpp"
#include "../core/log_common.hpp"
#include "scan_period.hpp"
#include <algorithm>
#include <chrono>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tierlog {

    /// Rules parsed from one configuration source.
    ///
    /// Not synchronized; LevelConfig parses into a fresh RuleSet outside its
    /// lock and swaps it in.  All names and patterns are stored normalized
    /// (trimmed, lower-case).
    class RuleSet {
    public:
        typedef std::pair<std::string, LogLevel> WildcardRule;

        RuleSet()
            : m_rootLevel(LogLevel::INFO)
            , m_scanEnabled(false)
            , m_scanPeriod(kDefaultScanPeriodMs)
            , m_hasScanEnabled(false)
            , m_hasScanPeriod(false) {}

        /// Parse properties text.  Never throws on malformed content:
        /// lines without '=' or with an empty key/value are skipped and
        /// unknown level names become INFO.
        static RuleSet parse(const std::string &content) {
            RuleSet rules;
            size_t pos = 0;
            // UTF-8 byte order mark
            if (detail::startsWith(content, "\xEF\xBB\xBF")) {
                pos = 3;
            }

            while (pos <= content.size()) {
                size_t eol = content.find('\n', pos);
                if (eol == std::string::npos) eol = content.size();
                std::string key;
                std::string value;
                if (parseLine(content.substr(pos, eol - pos), key, value)) {
                    rules.applyProperty(detail::toLower(key), value);
                }
                pos = eol + 1;
            }

            rules.sortWildcards();
            return rules;
        }

        static std::string normalizeName(const std::string &name) {
            return detail::toLower(detail::trim(name));
        }

        /// Segments before the wildcard: "mqtt.transport.*" scores 2,
        /// "mqtt.*" scores 1, a bare "*" scores 0.
        static int specificity(const std::string &pattern) {
            int parts = static_cast<int>(std::count(pattern.begin(), pattern.end(), '.')) + 1;
            if (pattern.find('*') != std::string::npos) {
                --parts;
            }
            return parts;
        }

        /// "mqtt.*" matches "mqtt.transport" but not "mqtt"; "*" matches
        /// everything.  A pattern with an inner '*' only matches itself.
        static bool matchesWildcard(const std::string &name, const std::string &pattern) {
            if (detail::endsWith(pattern, "*")) {
                std::string prefix = pattern.substr(0, pattern.size() - 1);
                return prefix.empty() || detail::startsWith(name, prefix);
            }
            return name == pattern;
        }

        static bool isRootKey(const std::string &normalizedName) {
            return normalizedName == "root" || normalizedName == "*";
        }

        /// Classify and store one rule.  Wildcard patterns replace an
        /// existing identical pattern; callers re-sort afterwards.
        void setRule(const std::string &normalizedName, LogLevel level) {
            if (isRootKey(normalizedName)) {
                m_rootLevel = level;
            } else if (normalizedName.find('*') != std::string::npos) {
                m_wildcardRules.erase(
                    std::remove_if(m_wildcardRules.begin(), m_wildcardRules.end(),
                                   [&normalizedName](const WildcardRule &rule) {
                                       return rule.first == normalizedName;
                                   }),
                    m_wildcardRules.end());
                m_wildcardRules.push_back(WildcardRule(normalizedName, level));
            } else {
                m_exactRules[normalizedName] = level;
            }
        }

        /// Most specific first.  Stable, so equal specificity keeps
        /// insertion order and the earlier rule wins.
        void sortWildcards() {
            std::stable_sort(m_wildcardRules.begin(), m_wildcardRules.end(),
                             [](const WildcardRule &a, const WildcardRule &b) {
                                 return specificity(a.first) > specificity(b.first);
                             });
        }

        /// Exact rule, then wildcards, then root when it differs from INFO,
        /// then the caller's default.
        LogLevel resolve(const std::string &normalizedName, LogLevel defaultLevel) const {
            auto exact = m_exactRules.find(normalizedName);
            if (exact != m_exactRules.end()) {
                return exact->second;
            }

            for (const auto &rule : m_wildcardRules) {
                if (matchesWildcard(normalizedName, rule.first)) {
                    return rule.second;
                }
            }

            if (m_rootLevel != LogLevel::INFO) {
                return m_rootLevel;
            }
            return defaultLevel;
        }

        void clearRules() {
            m_exactRules.clear();
            m_wildcardRules.clear();
            m_rootLevel = LogLevel::INFO;
        }

        LogLevel rootLevel() const { return m_rootLevel; }
        void setRootLevel(LogLevel level) { m_rootLevel = level; }

        bool scanEnabled() const { return m_scanEnabled; }
        std::chrono::milliseconds scanPeriod() const { return m_scanPeriod; }

        /// Whether the parsed text carried a "scan" / "scan.period" key.
        bool hasScanEnabled() const { return m_hasScanEnabled; }
        bool hasScanPeriod() const { return m_hasScanPeriod; }

        const std::unordered_map<std::string, LogLevel> &exactRules() const { return m_exactRules; }
        const std::vector<WildcardRule> &wildcardRules() const { return m_wildcardRules; }

    private:
        LogLevel m_rootLevel;
        std::unordered_map<std::string, LogLevel> m_exactRules;
        std::vector<WildcardRule> m_wildcardRules;
        bool m_scanEnabled;
        std::chrono::milliseconds m_scanPeriod;
        bool m_hasScanEnabled;
        bool m_hasScanPeriod;

        static bool parseLine(const std::string &rawLine, std::string &key, std::string &value) {
            std::string line = detail::trim(rawLine);
            if (line.empty() || line[0] == '#' || line[0] == '!') {
                return false;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                return false;
            }

            key = detail::trim(line.substr(0, equalPos));
            value = detail::trim(line.substr(equalPos + 1));
            return !key.empty() && !value.empty();
        }

        void applyProperty(const std::string &normalizedKey, const std::string &value) {
            if (normalizedKey == "scan") {
                m_scanEnabled = detail::toLower(value) == "true";
                m_hasScanEnabled = true;
                return;
            }
            if (normalizedKey == "scan.period") {
                m_scanPeriod = parseScanPeriod(value);
                m_hasScanPeriod = true;
                return;
            }
            setRule(normalizedKey, parseLevel(value));
        }
    };

} // namespace tierlog

#endif // TIER_LOG_RULE_SET_HPP
