#include "test_utils.hpp"
#include "tier_log/core/log_common.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

std::string TestUtils::readLogFile(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void TestUtils::writeTextFile(const std::string &filename, const std::string &content) {
    std::ofstream file(filename, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create file: " + filename);
    }
    file << content;
}

std::string TestUtils::tempPath(const std::string &name) {
    const char *dir = std::getenv("TMPDIR");
    std::string base = (dir && dir[0] != '\0') ? dir : "/tmp";
    std::ostringstream oss;
    oss << base << "/tier_log_" << ::getpid() << "_" << name;
    return oss.str();
}

void TestUtils::removeFile(const std::string &filename) {
    std::remove(filename.c_str());
}

bool TestUtils::fileExists(const std::string &filename) {
    struct stat buffer;
    return stat(filename.c_str(), &buffer) == 0;
}

std::vector<std::string> TestUtils::splitLines(const std::string &text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

std::shared_ptr<tierlog::Logger> makeRecordingLogger(const std::string &name,
                                                     tierlog::LogLevel level,
                                                     std::shared_ptr<RecordingSink::Records> &records) {
    records = std::make_shared<RecordingSink::Records>();
    return std::make_shared<tierlog::Logger>(
        name, level, tierlog::detail::make_unique<RecordingSink>(records));
}
