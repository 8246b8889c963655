#ifndef TIER_LOG_FILE_SYSTEM_HPP
#define TIER_LOG_FILE_SYSTEM_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <sys/stat.h>

namespace tierlog {

    /// The few file operations the configuration layer needs.
    class IFileSystem {
    public:
        virtual ~IFileSystem() = default;

        virtual bool exists(const std::string &path) const = 0;

        /// Modification time in nanoseconds since the epoch, 0 if the file
        /// cannot be stat'ed.
        virtual std::int64_t lastWriteTime(const std::string &path) const = 0;

        /// @throws std::runtime_error if the file cannot be read.
        virtual std::string readAll(const std::string &path) const = 0;
    };

    class PosixFileSystem : public IFileSystem {
    public:
        bool exists(const std::string &path) const override {
            struct stat buffer;
            return ::stat(path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode);
        }

        std::int64_t lastWriteTime(const std::string &path) const override {
            struct stat buffer;
            if (::stat(path.c_str(), &buffer) != 0) {
                return 0;
            }
#if defined(__APPLE__)
            return static_cast<std::int64_t>(buffer.st_mtimespec.tv_sec) * 1000000000LL +
                   buffer.st_mtimespec.tv_nsec;
#elif defined(_WIN32)
            return static_cast<std::int64_t>(buffer.st_mtime) * 1000000000LL;
#else
            return static_cast<std::int64_t>(buffer.st_mtim.tv_sec) * 1000000000LL +
                   buffer.st_mtim.tv_nsec;
#endif
        }

        std::string readAll(const std::string &path) const override {
            std::ifstream file(path, std::ios::in | std::ios::binary);
            if (!file.is_open()) {
                throw std::runtime_error("Failed to open file: " + path);
            }
            std::ostringstream buffer;
            buffer << file.rdbuf();
            if (file.bad()) {
                throw std::runtime_error("Failed to read file: " + path);
            }
            return buffer.str();
        }
    };

} // namespace tierlog

#endif // TIER_LOG_FILE_SYSTEM_HPP
