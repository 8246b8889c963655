#ifndef TIER_LOG_CONFIG_LOCATOR_HPP
#define TIER_LOG_CONFIG_LOCATOR_HPP

#include "../core/file_system.hpp"
#include <climits>
#include <string>
#include <vector>
#include <unistd.h>

namespace tierlog {

    /// logging-debug.properties in builds without NDEBUG, logging.properties otherwise.
    inline const char *defaultConfigFileName() {
#ifdef NDEBUG
        return "logging.properties";
#else
        return "logging-debug.properties";
#endif
    }

    namespace detail {
        inline std::string parentDirectory(const std::string &dir) {
            std::string trimmed = dir;
            while (trimmed.size() > 1 && trimmed[trimmed.size() - 1] == '/') {
                trimmed.erase(trimmed.size() - 1);
            }
            size_t slash = trimmed.rfind('/');
            if (slash == std::string::npos) return "";
            if (slash == 0) return "/";
            return trimmed.substr(0, slash);
        }

        inline std::string joinPath(const std::string &dir, const std::string &file) {
            if (dir.empty()) return file;
            if (dir[dir.size() - 1] == '/') return dir + file;
            return dir + "/" + file;
        }
    } // namespace detail

    /// Directory of the running executable, empty if it cannot be determined.
    inline std::string executableDirectory() {
#if defined(__linux__)
        char buffer[PATH_MAX];
        ssize_t length = ::readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
        if (length <= 0) return "";
        buffer[length] = '\0';
        return detail::parentDirectory(std::string(buffer));
#else
        return "";
#endif
    }

    inline std::string currentDirectory() {
        char buffer[PATH_MAX];
        if (::getcwd(buffer, sizeof(buffer)) == nullptr) return "";
        return std::string(buffer);
    }

    /// Candidate paths in search order: current directory, executable
    /// directory, then the executable's parent.  Duplicates are dropped.
    inline std::vector<std::string> configSearchPaths(const std::string &fileName,
                                                      const std::string &currentDir,
                                                      const std::string &exeDir) {
        std::vector<std::string> dirs;
        dirs.push_back(currentDir);
        if (!exeDir.empty()) {
            dirs.push_back(exeDir);
            std::string parent = detail::parentDirectory(exeDir);
            if (!parent.empty()) dirs.push_back(parent);
        }

        std::vector<std::string> paths;
        for (size_t i = 0; i < dirs.size(); ++i) {
            std::string candidate = detail::joinPath(dirs[i], fileName);
            bool seen = false;
            for (size_t j = 0; j < paths.size(); ++j) {
                if (paths[j] == candidate) { seen = true; break; }
            }
            if (!seen) paths.push_back(candidate);
        }
        return paths;
    }

    /// First existing candidate, or an empty string.
    inline std::string findConfigFile(const IFileSystem &fileSystem,
                                      const std::string &fileName,
                                      const std::string &currentDir,
                                      const std::string &exeDir) {
        std::vector<std::string> paths = configSearchPaths(fileName, currentDir, exeDir);
        for (size_t i = 0; i < paths.size(); ++i) {
            if (fileSystem.exists(paths[i])) {
                return paths[i];
            }
        }
        return "";
    }

} // namespace tierlog

#endif // TIER_LOG_CONFIG_LOCATOR_HPP
