#include <gtest/gtest.h>
#include "tier_log.hpp"
#include "utils/test_utils.hpp"
#include <utility>

using tierlog::LoggerFactory;
using tierlog::LogLevel;

class FluentBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        logPath = TestUtils::tempPath("fluent_builder.log");
        configPath = TestUtils::tempPath("fluent_builder.properties");
        TestUtils::removeFile(logPath);
        TestUtils::removeFile(configPath);
    }

    void TearDown() override {
        TestUtils::removeFile(logPath);
        TestUtils::removeFile(configPath);
    }

    std::string logPath;
    std::string configPath;
};

TEST_F(FluentBuilderTest, DefaultsBuildConsoleFactory) {
    auto factory = LoggerFactory::configure().build();
    ASSERT_NE(factory, nullptr);
    EXPECT_EQ(factory->defaultLevel(), LogLevel::INFO);
    EXPECT_NE(dynamic_cast<tierlog::ConsoleSink *>(factory->getLogger("x")->sink()), nullptr);
}

TEST_F(FluentBuilderTest, DefaultLevelAndRules) {
    auto factory = LoggerFactory::configure()
        .defaultLevel(LogLevel::WARN)
        .level("App.Db", LogLevel::TRACE)
        .level("App.Net.*", LogLevel::ERROR)
        .writeTo<tierlog::NullSink>()
        .build();

    EXPECT_EQ(factory->getLogger("App.Db")->getLevel(), LogLevel::TRACE);
    EXPECT_EQ(factory->getLogger("App.Net.Http")->getLevel(), LogLevel::ERROR);
    EXPECT_EQ(factory->getLogger("App.Other")->getLevel(), LogLevel::WARN);
}

TEST_F(FluentBuilderTest, ConfigTextThenRuleOverrides) {
    auto factory = LoggerFactory::configure()
        .configText("app=DEBUG\nnet=ERROR\n")
        .level("net", LogLevel::TRACE)
        .writeTo<tierlog::NullSink>()
        .build();

    EXPECT_EQ(factory->getLogger("app")->getLevel(), LogLevel::DEBUG);
    EXPECT_EQ(factory->getLogger("net")->getLevel(), LogLevel::TRACE);
}

TEST_F(FluentBuilderTest, ConfigFileAndScanOverrides) {
    TestUtils::writeTextFile(configPath, "scan=false\nbuilder.file=FATAL\n");

    auto factory = LoggerFactory::configure()
        .configFile(configPath)
        .scan(true)
        .scanPeriod(std::chrono::milliseconds(2500))
        .writeTo<tierlog::NullSink>()
        .build();

    EXPECT_EQ(factory->getLogger("Builder.File")->getLevel(), LogLevel::FATAL);
    EXPECT_EQ(factory->config()->configFile(), configPath);
    EXPECT_TRUE(factory->config()->isScanEnabled());
    EXPECT_EQ(factory->config()->scanPeriod(), std::chrono::milliseconds(2500));
}

TEST_F(FluentBuilderTest, MissingConfigFileThrowsFromBuild) {
    auto config = std::move(LoggerFactory::configure().configFile(configPath));
    EXPECT_THROW(config.build(), tierlog::ConfigFileNotFound);
}

TEST_F(FluentBuilderTest, WriteToFileSinkWithFormatter) {
    auto factory = LoggerFactory::configure()
        .writeTo<tierlog::FileSink, tierlog::JsonFormatter>(logPath)
        .build();

    auto logger = factory->getLogger("Builder.Json");
    logger->info("structured");
    logger->flush();

    std::vector<std::string> lines = TestUtils::splitLines(TestUtils::readLogFile(logPath));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("\"logger\":\"Builder.Json\""), std::string::npos) << lines[0];
    EXPECT_NE(lines[0].find("\"message\":\"structured\""), std::string::npos) << lines[0];
}

TEST_F(FluentBuilderTest, EachLoggerGetsItsOwnSink) {
    auto factory = LoggerFactory::configure()
        .writeTo<tierlog::ConsoleSink>(false)
        .build();

    auto a = factory->getLogger("a");
    auto b = factory->getLogger("b");
    ASSERT_NE(a->sink(), nullptr);
    EXPECT_NE(a->sink(), b->sink());
    EXPECT_FALSE(dynamic_cast<tierlog::ConsoleSink *>(a->sink())->isColorEnabled());
}

TEST_F(FluentBuilderTest, SinkFactoryReceivesLoggerName) {
    std::vector<std::string> names;
    auto factory = LoggerFactory::configure()
        .sinkFactory([&names](const std::string &name) -> std::unique_ptr<tierlog::ISink> {
            names.push_back(name);
            return tierlog::detail::make_unique<tierlog::NullSink>();
        })
        .build();

    factory->getLogger("App.One");
    factory->getLogger("App.Two");
    factory->getLogger("app.one");

    std::vector<std::string> expected = {"App.One", "App.Two"};
    EXPECT_EQ(names, expected);
}
