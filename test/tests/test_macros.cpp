#include <gtest/gtest.h>
#include "tier_log.hpp"
#include "utils/test_utils.hpp"
#include <stdexcept>
#include <string>

using tierlog::LogLevel;

namespace {

int g_evaluations = 0;

std::string expensive() {
    ++g_evaluations;
    return "computed";
}

} // namespace

class MacroTest : public ::testing::Test {
protected:
    void SetUp() override {
        g_evaluations = 0;
        head = makeRecordingLogger("head", LogLevel::ERROR, headRecords);
        tail = makeRecordingLogger("tail", LogLevel::FATAL, tailRecords);
        head->addToChain(tail);
    }

    std::shared_ptr<RecordingSink::Records> headRecords;
    std::shared_ptr<RecordingSink::Records> tailRecords;
    std::shared_ptr<tierlog::Logger> head;
    std::shared_ptr<tierlog::Logger> tail;
};

TEST_F(MacroTest, DisabledChainSkipsArgumentEvaluation) {
    TIER_INFO(head, "value {v}", expensive());
    TIER_DEBUG(head, "value {v}", expensive());

    EXPECT_EQ(g_evaluations, 0);
    EXPECT_EQ(headRecords->size(), 0u);
    EXPECT_EQ(tailRecords->size(), 0u);
}

TEST_F(MacroTest, DownstreamNodeEnablesEvaluation) {
    tail->setLevel(LogLevel::INFO);

    TIER_INFO(head, "value {v}", expensive());

    EXPECT_EQ(g_evaluations, 1);
    EXPECT_EQ(headRecords->size(), 0u);
    std::vector<std::string> expected = {"value computed"};
    EXPECT_EQ(tailRecords->messages(), expected);
}

TEST_F(MacroTest, EnabledLevelsReachEveryAcceptingNode) {
    TIER_ERROR(head, "error {code}", 42);
    TIER_FATAL(head, "fatal");

    std::vector<std::string> headExpected = {"error 42", "fatal"};
    std::vector<std::string> tailExpected = {"fatal"};
    EXPECT_EQ(headRecords->messages(), headExpected);
    EXPECT_EQ(tailRecords->messages(), tailExpected);
}

TEST_F(MacroTest, WorksWithRawPointers) {
    tierlog::Logger *raw = head.get();
    TIER_WARN(raw, "dropped");
    TIER_ERROR(raw, "kept");
    EXPECT_EQ(headRecords->size(), 1u);
}

TEST_F(MacroTest, MacroFormatsEvenWithoutArguments) {
    TIER_ERROR(head, "literal {{braces}}");
    head->error("literal {{braces}}");

    std::vector<std::string> expected = {"literal {braces}", "literal {{braces}}"};
    EXPECT_EQ(headRecords->messages(), expected);
}

TEST_F(MacroTest, GenericLevelMacro) {
    LogLevel level = LogLevel::FATAL;
    TIER_LOG(head, level, "generic {n}", 7);
    std::vector<std::string> expected = {"generic 7"};
    EXPECT_EQ(tailRecords->messages(), expected);
}

TEST_F(MacroTest, ExceptionVariants) {
    std::runtime_error ex("connection reset");

    TIER_ERROR_EX(head, ex, "request {id} failed", 17);
    TIER_INFO_EX(head, ex, "dropped {x}", expensive());

    EXPECT_EQ(g_evaluations, 0);
    ASSERT_EQ(headRecords->size(), 1u);
    EXPECT_EQ(headRecords->messages()[0],
              "request 17 failed - Exception: std::runtime_error: connection reset");
}

TEST_F(MacroTest, NestedExceptionInMacro) {
    try {
        try {
            throw std::invalid_argument("bad port");
        } catch (...) {
            std::throw_with_nested(std::runtime_error("connect failed"));
        }
    } catch (const std::exception &ex) {
        TIER_FATAL_EX(head, ex, "startup");
    }

    ASSERT_EQ(headRecords->size(), 1u);
    std::string message = headRecords->messages()[0];
    EXPECT_EQ(message.find("startup - Exception: "), 0u) << message;
    EXPECT_NE(message.find(": connect failed\nCaused by: std::invalid_argument: bad port"),
              std::string::npos) << message;
}

TEST(MacroReloadTest, DisabledMacroCallPicksUpConfigChange) {
    auto clock = std::make_shared<ManualClock>();
    auto fs = std::make_shared<SpyFileSystem>();
    auto factory = tierlog::LoggerFactory::create(std::make_shared<tierlog::LevelConfig>(clock, fs));
    auto records = std::make_shared<RecordingSink::Records>();
    factory->setSinkFactory([records](const std::string &) -> std::unique_ptr<tierlog::ISink> {
        return tierlog::detail::make_unique<RecordingSink>(records);
    });

    fs->setFile("logging.properties", "scan=true\nscan.period=1 second\nroot=WARN\n");
    factory->loadConfig("logging.properties");
    auto logger = factory->getLogger("App.Worker");
    EXPECT_EQ(logger->getLevel(), LogLevel::WARN);

    g_evaluations = 0;
    TIER_DEBUG(logger, "value {v}", expensive());
    EXPECT_EQ(g_evaluations, 0);
    EXPECT_EQ(records->size(), 0u);

    fs->setFile("logging.properties", "scan=true\nscan.period=1 second\nroot=DEBUG\n");
    clock->advance(std::chrono::milliseconds(5000));
    fs->resetCounters();

    TIER_DEBUG(logger, "value {v}", expensive());

    EXPECT_EQ(fs->statCalls(), 1);
    EXPECT_EQ(logger->getLevel(), LogLevel::DEBUG);
    EXPECT_EQ(g_evaluations, 1);
    std::vector<std::string> expected = {"value computed"};
    EXPECT_EQ(records->messages(), expected);
}
