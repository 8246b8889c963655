#include <gtest/gtest.h>
#include "tier_log/config/scan_period.hpp"

using std::chrono::milliseconds;
using tierlog::parseScanPeriod;

TEST(ScanPeriodTest, ParsesEveryUnit) {
    EXPECT_EQ(parseScanPeriod("1500 ms"), milliseconds(1500));
    EXPECT_EQ(parseScanPeriod("2000 millisecond"), milliseconds(2000));
    EXPECT_EQ(parseScanPeriod("2500 milliseconds"), milliseconds(2500));
    EXPECT_EQ(parseScanPeriod("5 s"), milliseconds(5000));
    EXPECT_EQ(parseScanPeriod("1 second"), milliseconds(1000));
    EXPECT_EQ(parseScanPeriod("30 seconds"), milliseconds(30000));
    EXPECT_EQ(parseScanPeriod("2 m"), milliseconds(120000));
    EXPECT_EQ(parseScanPeriod("1 minute"), milliseconds(60000));
    EXPECT_EQ(parseScanPeriod("3 minutes"), milliseconds(180000));
    EXPECT_EQ(parseScanPeriod("1 h"), milliseconds(3600000));
    EXPECT_EQ(parseScanPeriod("2 hours"), milliseconds(7200000));
    EXPECT_EQ(parseScanPeriod("1 d"), milliseconds(86400000));
    EXPECT_EQ(parseScanPeriod("1 day"), milliseconds(86400000));
}

TEST(ScanPeriodTest, UnitsAreCaseInsensitive) {
    EXPECT_EQ(parseScanPeriod("10 SECONDS"), milliseconds(10000));
    EXPECT_EQ(parseScanPeriod("10 Ms"), milliseconds(1000));
}

TEST(ScanPeriodTest, FractionalNumbers) {
    EXPECT_EQ(parseScanPeriod("1.5 seconds"), milliseconds(1500));
    EXPECT_EQ(parseScanPeriod("0.5 h"), milliseconds(1800000));
}

TEST(ScanPeriodTest, FlooredAtOneSecond) {
    EXPECT_EQ(parseScanPeriod("10 ms"), milliseconds(1000));
    EXPECT_EQ(parseScanPeriod("0 seconds"), milliseconds(1000));
    EXPECT_EQ(parseScanPeriod("-5 seconds"), milliseconds(1000));
}

TEST(ScanPeriodTest, MalformedFallsBackToDefault) {
    EXPECT_EQ(parseScanPeriod(""), milliseconds(60000));
    EXPECT_EQ(parseScanPeriod("30"), milliseconds(60000));
    EXPECT_EQ(parseScanPeriod("thirty seconds"), milliseconds(60000));
    EXPECT_EQ(parseScanPeriod("30 fortnights"), milliseconds(60000));
    EXPECT_EQ(parseScanPeriod("30 seconds please"), milliseconds(60000));
    EXPECT_EQ(parseScanPeriod("30x seconds"), milliseconds(60000));
    EXPECT_EQ(parseScanPeriod("inf seconds"), milliseconds(60000));
}

TEST(ScanPeriodTest, HugeValuesFallBackToDefault) {
    EXPECT_EQ(parseScanPeriod("1e300 days"), milliseconds(60000));
}

TEST(ScanPeriodTest, ClampOnlyRaises) {
    EXPECT_EQ(tierlog::clampScanPeriod(milliseconds(5)), milliseconds(1000));
    EXPECT_EQ(tierlog::clampScanPeriod(milliseconds(45000)), milliseconds(45000));
}
