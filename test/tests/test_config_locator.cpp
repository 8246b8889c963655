#include <gtest/gtest.h>
#include "tier_log.hpp"
#include "utils/test_utils.hpp"
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

using tierlog::LogLevel;

TEST(ConfigLocatorTest, DefaultFileNameFollowsBuildType) {
#ifdef NDEBUG
    EXPECT_STREQ(tierlog::defaultConfigFileName(), "logging.properties");
#else
    EXPECT_STREQ(tierlog::defaultConfigFileName(), "logging-debug.properties");
#endif
}

TEST(ConfigLocatorTest, SearchOrder) {
    std::vector<std::string> paths =
        tierlog::configSearchPaths("logging.properties", "/work", "/opt/app/bin");

    std::vector<std::string> expected = {
        "/work/logging.properties",
        "/opt/app/bin/logging.properties",
        "/opt/app/logging.properties"
    };
    EXPECT_EQ(paths, expected);
}

TEST(ConfigLocatorTest, DuplicateDirectoriesCollapse) {
    std::vector<std::string> paths =
        tierlog::configSearchPaths("logging.properties", "/opt/app", "/opt/app/bin/");

    std::vector<std::string> expected = {
        "/opt/app/logging.properties",
        "/opt/app/bin/logging.properties"
    };
    EXPECT_EQ(paths, expected);
}

TEST(ConfigLocatorTest, UnknownExecutableDirectory) {
    std::vector<std::string> paths = tierlog::configSearchPaths("x.properties", "/work", "");
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], "/work/x.properties");
}

TEST(ConfigLocatorTest, ParentDirectory) {
    EXPECT_EQ(tierlog::detail::parentDirectory("/opt/app/bin"), "/opt/app");
    EXPECT_EQ(tierlog::detail::parentDirectory("/opt/app/bin/"), "/opt/app");
    EXPECT_EQ(tierlog::detail::parentDirectory("/opt"), "/");
    EXPECT_EQ(tierlog::detail::parentDirectory("relative"), "");
}

TEST(ConfigLocatorTest, FindReturnsFirstExisting) {
    SpyFileSystem fs;
    fs.setFile("/opt/app/logging.properties", "root=WARN\n");
    fs.setFile("/opt/app/bin/logging.properties", "root=ERROR\n");

    EXPECT_EQ(tierlog::findConfigFile(fs, "logging.properties", "/work", "/opt/app/bin"),
              "/opt/app/bin/logging.properties");

    fs.setFile("/work/logging.properties", "root=DEBUG\n");
    EXPECT_EQ(tierlog::findConfigFile(fs, "logging.properties", "/work", "/opt/app/bin"),
              "/work/logging.properties");
}

TEST(ConfigLocatorTest, FindReturnsEmptyWhenNothingExists) {
    SpyFileSystem fs;
    EXPECT_EQ(tierlog::findConfigFile(fs, "logging.properties", "/work", "/opt/app/bin"), "");
}

TEST(ConfigLocatorTest, CurrentAndExecutableDirectoriesAreAbsolute) {
    std::string cwd = tierlog::currentDirectory();
    ASSERT_FALSE(cwd.empty());
    EXPECT_EQ(cwd[0], '/');
#if defined(__linux__)
    std::string exeDir = tierlog::executableDirectory();
    ASSERT_FALSE(exeDir.empty());
    EXPECT_EQ(exeDir[0], '/');
#endif
}

class DefaultConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = TestUtils::tempPath("locator");
        bin = root + "/bin";
        ::mkdir(root.c_str(), 0755);
        ::mkdir(bin.c_str(), 0755);
        configPath = root + "/" + tierlog::defaultConfigFileName();
        TestUtils::removeFile(configPath);
    }

    void TearDown() override {
        TestUtils::removeFile(configPath);
        ::rmdir(bin.c_str());
        ::rmdir(root.c_str());
    }

    std::string root;
    std::string bin;
    std::string configPath;
};

TEST_F(DefaultConfigTest, FactoryLoadsFromExecutableParent) {
    TestUtils::writeTextFile(configPath, "app.located=DEBUG\n");

    auto factory = tierlog::LoggerFactory::create();
    factory->useNullSink();
    EXPECT_TRUE(factory->loadDefaultConfig(bin));
    EXPECT_EQ(factory->config()->configFile(), configPath);
    EXPECT_EQ(factory->getLogger("App.Located")->getLevel(), LogLevel::DEBUG);
}

TEST_F(DefaultConfigTest, FactoryReportsMissingDefault) {
    auto factory = tierlog::LoggerFactory::create();
    factory->useNullSink();
    EXPECT_FALSE(factory->loadDefaultConfig(bin));
    EXPECT_TRUE(factory->config()->configFile().empty());
}

TEST_F(DefaultConfigTest, BuilderDefaultConfig) {
    TestUtils::writeTextFile(configPath, "app.built=ERROR\n");

    auto factory = tierlog::LoggerFactory::configure()
        .defaultConfig(bin)
        .writeTo<tierlog::NullSink>()
        .build();
    EXPECT_EQ(factory->getLogger("App.Built")->getLevel(), LogLevel::ERROR);
}
