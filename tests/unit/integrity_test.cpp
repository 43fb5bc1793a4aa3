/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * Unit tests for the ping count and navigation gap checks
 */

#include <gtest/gtest.h>
#include <IntegrityChecker.hpp>
#include <KmallFile.hpp>
#include <QuantizedDatagram.hpp>
#include <stdexcept>
#include <vector>

#include "TestDatagrams.hpp"

using namespace kmall;
using namespace kmall_test;

// ============================================================================
// Ping count arithmetic
// ============================================================================

TEST(PingCountTest, MissingPingAndMissingFan) {
    std::vector<PingSample> samples = {{10, 2, 0}, {10, 2, 1}, {12, 2, 0}};
    PingReport report = checkPingCount(samples);

    EXPECT_EQ(report.pingsMissed, 1u);
    EXPECT_EQ(report.totalPings, 3u);
    EXPECT_EQ(report.missingMrzRecords, 1u);
    EXPECT_EQ(report.duplicateMrzRecords, 0u);
    EXPECT_EQ(report.minPingCount, 10);
    EXPECT_EQ(report.maxPingCount, 12);
    EXPECT_EQ(report.errorCount, 0u);
}

TEST(PingCountTest, ContiguousPingsReportNothing) {
    std::vector<PingSample> samples;
    for (uint16_t ping = 100; ping < 110; ++ping) {
        samples.push_back({ping, 1, 0});
    }
    PingReport report = checkPingCount(samples);
    EXPECT_EQ(report.pingsMissed, 0u);
    EXPECT_EQ(report.totalPings, 10u);
    EXPECT_EQ(report.missingMrzRecords, 0u);
}

TEST(PingCountTest, EmptyInput) {
    PingReport report = checkPingCount(std::vector<PingSample>{});
    EXPECT_EQ(report.totalPings, 0u);
    EXPECT_EQ(report.pingsMissed, 0u);
}

TEST(PingCountTest, CounterWrapIsUnwrapped) {
    std::vector<PingSample> samples = {{65534, 1, 0}, {65535, 1, 0}, {0, 1, 0}, {1, 1, 0}};
    PingReport report = checkPingCount(samples);
    EXPECT_EQ(report.pingsMissed, 0u);
    EXPECT_EQ(report.totalPings, 4u);
    EXPECT_EQ(report.minPingCount, 65534);
    EXPECT_EQ(report.maxPingCount, 65537);
}

TEST(PingCountTest, GapAcrossWrap) {
    std::vector<PingSample> samples = {{65535, 1, 0}, {2, 1, 0}};
    PingReport report = checkPingCount(samples);
    EXPECT_EQ(report.pingsMissed, 2u);
    EXPECT_EQ(report.totalPings, 4u);
}

TEST(PingCountTest, DuplicateFanIsCounted) {
    std::vector<PingSample> samples = {{5, 2, 0}, {5, 2, 1}, {5, 2, 1}};
    PingReport report = checkPingCount(samples);
    EXPECT_EQ(report.duplicateMrzRecords, 1u);
    EXPECT_EQ(report.missingMrzRecords, 0u);
}

TEST(PingCountTest, FanIndexOutOfRangeIsAnError) {
    std::vector<PingSample> samples = {{5, 2, 0}, {5, 2, 2}};
    PingReport report = checkPingCount(samples);
    EXPECT_EQ(report.errorCount, 1u);
    EXPECT_EQ(report.missingMrzRecords, 1u);
}

TEST(PingCountTest, ExpectedIncrementIsHonoured) {
    std::vector<PingSample> samples = {{0, 1, 0}, {2, 1, 0}, {4, 1, 0}, {8, 1, 0}};
    PingReport report = checkPingCount(samples, 2);
    EXPECT_EQ(report.pingsMissed, 1u);
    EXPECT_EQ(report.totalPings, 5u);
}

TEST(PingCountTest, NonPositiveIncrementThrows) {
    std::vector<PingSample> samples = {{0, 1, 0}};
    EXPECT_THROW((void)checkPingCount(samples, 0), std::invalid_argument);
    EXPECT_THROW((void)checkPingCount(samples, -1), std::invalid_argument);
}

// ============================================================================
// Navigation gap arithmetic
// ============================================================================

TEST(NavigationGapTest, Statistics) {
    NavigationReport report = checkNavigationGaps({0.0, 0.1, 0.2, 1.7, 1.8});
    EXPECT_EQ(report.sampleCount, 5u);
    EXPECT_NEAR(report.minDelta, 0.1, 1e-9);
    EXPECT_NEAR(report.maxDelta, 1.5, 1e-9);
    EXPECT_NEAR(report.meanDelta, 0.45, 1e-9);
    EXPECT_NEAR(report.meanFrequency, 1.0 / 0.45, 1e-9);
    EXPECT_EQ(report.gapCount, 1u);
}

TEST(NavigationGapTest, ThresholdIsInclusive) {
    NavigationReport report = checkNavigationGaps({0.0, 1.0, 1.5, 3.5}, 1.0);
    EXPECT_EQ(report.gapCount, 2u);
    EXPECT_DOUBLE_EQ(report.gapThreshold, 1.0);
}

TEST(NavigationGapTest, BackwardStepCountsAsSmallMagnitude) {
    NavigationReport report = checkNavigationGaps({10.0, 9.95, 10.5});
    EXPECT_NEAR(report.minDelta, 0.05, 1e-9);
    EXPECT_NEAR(report.maxDelta, 0.55, 1e-9);
    EXPECT_EQ(report.gapCount, 0u);
}

TEST(NavigationGapTest, FewerThanTwoSamples) {
    NavigationReport none = checkNavigationGaps(std::vector<double>{});
    EXPECT_EQ(none.sampleCount, 0u);
    NavigationReport one = checkNavigationGaps({42.0});
    EXPECT_EQ(one.sampleCount, 1u);
    EXPECT_EQ(one.gapCount, 0u);
    EXPECT_DOUBLE_EQ(one.meanFrequency, 0.0);
}

// ============================================================================
// File-level checks
// ============================================================================

class FileIntegrityTest : public ::testing::Test {
protected:
    TempDir dir;

    std::filesystem::path writeSurvey() {
        Bytes bytes = concat({
            makeAttitude(1000, 0),
            makeDepth(7, 2, 0),
            makeDepth(7, 2, 1),
            makePosition(1000, 500000000u),
            makeAttitude(1001, 0),
            makeDepth(9, 2, 0),
            makeOpaque("#SHA", 1001),
            makeAttitude(1003, 0),
            makeWaterColumn(9),
        });
        return dir.write("survey.kmall", bytes);
    }
};

TEST_F(FileIntegrityTest, PingCountFromFile) {
    auto file = KmallFile::open(writeSurvey());
    PingReport report = checkPingCount(file);
    EXPECT_EQ(report.pingsMissed, 1u);
    EXPECT_EQ(report.totalPings, 3u);
    EXPECT_EQ(report.missingMrzRecords, 1u);
    EXPECT_TRUE(report.indexComplete);
}

TEST_F(FileIntegrityTest, PingCountReadsQuantizedDatagrams) {
    Bytes bytes = concat({makeCompressed(makeDepth(7, 2, 0), 0), makeCompressed(makeDepth(7, 2, 1), 0),
                          makeCompressed(makeDepth(9, 2, 0), 1), makeCompressed(makeWaterColumn(9), 0)});
    auto file = KmallFile::open(dir.write("compressed.kmall", bytes));
    PingReport report = checkPingCount(file);
    EXPECT_EQ(report.totalPings, 3u);
    EXPECT_EQ(report.pingsMissed, 1u);
    EXPECT_EQ(report.missingMrzRecords, 1u);
}

TEST_F(FileIntegrityTest, NavigationGapsFromFile) {
    auto file = KmallFile::open(writeSurvey());
    NavigationReport all = checkNavigationGaps(file);
    EXPECT_EQ(all.sampleCount, 4u);
    EXPECT_EQ(all.gapCount, 1u);
    EXPECT_NEAR(all.maxDelta, 2.0, 1e-9);

    NavigationReport attitude = checkNavigationGaps(file, 1.0, std::string("#SKM"));
    EXPECT_EQ(attitude.sampleCount, 3u);
    EXPECT_EQ(attitude.gapCount, 2u);
}

TEST_F(FileIntegrityTest, AttitudeGapsUseSampleTimes) {
    auto file = KmallFile::open(writeSurvey());
    NavigationReport report = checkAttitudeGaps(file);
    EXPECT_EQ(report.sampleCount, 6u);
    EXPECT_EQ(report.gapCount, 1u);
    EXPECT_NEAR(report.minDelta, 0.01, 1e-6);
    EXPECT_NEAR(report.maxDelta, 1.99, 1e-6);
    EXPECT_EQ(report.errorCount, 0u);
}

TEST_F(FileIntegrityTest, AttitudeGapInsideOneDatagram) {
    AttitudeDatagram skm = makeAttitude(2000, 0, 3);
    skm.samples[2].kmBinary.time_sec = 2002;
    auto file = KmallFile::open(dir.write("stall.kmall", concat({skm})));

    EXPECT_EQ(checkNavigationGaps(file).sampleCount, 1u);
    NavigationReport report = checkAttitudeGaps(file, 1.0);
    EXPECT_EQ(report.sampleCount, 3u);
    EXPECT_EQ(report.gapCount, 1u);
}

TEST_F(FileIntegrityTest, SkippedRecordsAreReported) {
    Bytes first = encode(makeDepth(10));
    Bytes second = encode(makeDepth(11));
    Bytes bytes = first;
    append(bytes, second);
    append(bytes, encode(makeAttitude(1011)));
    append(bytes, encode(makeDepth(12)));
    bytes[first.size() + second.size() - LENGTH_FIELD_SIZE] ^= 0x01;

    auto file = KmallFile::open(dir.write("skipped.kmall", bytes));
    ASSERT_EQ(file.index().issues.size(), 1u);

    PingReport ping = checkPingCount(file);
    EXPECT_EQ(ping.pingsMissed, 1u);
    EXPECT_EQ(ping.indexIssueCount, 1u);
    EXPECT_EQ(ping.errorCount, 0u);

    NavigationReport nav = checkNavigationGaps(file);
    EXPECT_EQ(nav.sampleCount, 1u);
    EXPECT_EQ(nav.indexIssueCount, 1u);
}

TEST_F(FileIntegrityTest, CleanFileHasNoSkippedRecords) {
    auto file = KmallFile::open(writeSurvey());
    EXPECT_EQ(checkPingCount(file).indexIssueCount, 0u);
    EXPECT_EQ(checkNavigationGaps(file).indexIssueCount, 0u);
    EXPECT_TRUE(checkAttitudeGaps(file).indexComplete);
}

TEST_F(FileIntegrityTest, TypeSummary) {
    auto file = KmallFile::open(writeSurvey());
    auto summary = summarizeTypes(file.index());

    ASSERT_EQ(summary.size(), 5u);
    EXPECT_EQ(summary[0].tag, "#MRZ");
    EXPECT_EQ(summary[0].count, 3u);
    EXPECT_EQ(summary[1].tag, "#MWC");
    EXPECT_EQ(summary[2].tag, "#SHA");
    EXPECT_FALSE(summary[2].description.empty());
    EXPECT_EQ(summary[3].tag, "#SKM");
    EXPECT_EQ(summary[3].count, 3u);
    EXPECT_EQ(summary[3].minSize, summary[3].maxSize);
    EXPECT_EQ(summary[3].totalBytes, 3u * summary[3].minSize);
    EXPECT_EQ(summary[4].tag, "#SPO");
}

TEST_F(FileIntegrityTest, TypeSummaryOfUnknownTag) {
    auto file = KmallFile::open(dir.write("unknown.kmall", concat({makeOpaque("#ZZZ", 1, 4)})));
    auto summary = summarizeTypes(file.index());
    ASSERT_EQ(summary.size(), 1u);
    EXPECT_EQ(summary[0].tag, "#ZZZ");
    EXPECT_TRUE(summary[0].description.empty());
    EXPECT_EQ(summary[0].totalBytes, 28u);
}
