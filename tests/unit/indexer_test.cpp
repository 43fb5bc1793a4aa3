/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * Unit tests for the stream indexer
 */

#include <gtest/gtest.h>
#include <FileIndex.hpp>
#include <KmallError.hpp>
#include <sstream>
#include <string>

#include "TestDatagrams.hpp"

using namespace kmall;
using namespace kmall_test;

namespace {

FileIndex indexBytes(const Bytes &bytes) {
    std::stringstream stream(std::string(bytes.begin(), bytes.end()), std::ios::in | std::ios::binary);
    return buildIndex(stream);
}

Bytes sampleStream() {
    return concat({makeAttitude(100), makePosition(100, 500000000u), makeDepth(1), makeWaterColumn(1),
                   makeOpaque("#SHI", 101), makeAttitude(101)});
}

}  // anonymous namespace

// ============================================================================
// Clean streams
// ============================================================================

TEST(StreamIndexerTest, EmptyStreamIsCompleteAndEmpty) {
    FileIndex index = indexBytes(Bytes{});
    EXPECT_TRUE(index.complete);
    EXPECT_TRUE(index.entries.empty());
    EXPECT_TRUE(index.issues.empty());
    EXPECT_EQ(index.fileSize, 0u);
}

TEST(StreamIndexerTest, EntriesTileTheStream) {
    Bytes bytes = sampleStream();
    FileIndex index = indexBytes(bytes);

    ASSERT_EQ(index.entries.size(), 6u);
    EXPECT_TRUE(index.complete);
    EXPECT_TRUE(index.issues.empty());
    EXPECT_EQ(index.fileSize, bytes.size());

    EXPECT_EQ(index.entries.front().offset, 0u);
    for (size_t i = 1; i < index.entries.size(); ++i) {
        const auto &prev = index.entries[i - 1];
        EXPECT_EQ(index.entries[i].offset, prev.offset + prev.size);
    }
    const auto &last = index.entries.back();
    EXPECT_EQ(last.offset + last.size, bytes.size());
}

TEST(StreamIndexerTest, EntriesCarryTagAndTime) {
    FileIndex index = indexBytes(sampleStream());
    ASSERT_EQ(index.entries.size(), 6u);
    EXPECT_EQ(index.entries[0].tag, "#SKM");
    EXPECT_EQ(index.entries[1].tag, "#SPO");
    EXPECT_DOUBLE_EQ(index.entries[1].time, 100.5);
    EXPECT_EQ(index.entries[4].tag, "#SHI");
}

TEST(StreamIndexerTest, EntriesWithTagFilters) {
    FileIndex index = indexBytes(sampleStream());
    auto attitude = index.entriesWithTag("#SKM");
    ASSERT_EQ(attitude.size(), 2u);
    EXPECT_LT(attitude[0].offset, attitude[1].offset);
    EXPECT_TRUE(index.entriesWithTag("#XYZ").empty());
}

// ============================================================================
// Damaged streams
// ============================================================================

TEST(StreamIndexerTest, TruncatedFinalDatagramLeavesIndexIncomplete) {
    Bytes bytes = sampleStream();
    FileIndex whole = indexBytes(bytes);
    bytes.resize(whole.entries.back().offset + whole.entries.back().size / 2);

    FileIndex index = indexBytes(bytes);
    EXPECT_FALSE(index.complete);
    EXPECT_EQ(index.entries.size(), whole.entries.size() - 1);
    ASSERT_EQ(index.issues.size(), 1u);
    EXPECT_EQ(index.issues[0].code, ErrorCode::TruncatedStream);
    EXPECT_EQ(index.issues[0].offset, whole.entries.back().offset);
}

TEST(StreamIndexerTest, ShortTailLeavesIndexIncomplete) {
    Bytes bytes = sampleStream();
    size_t cleanSize = bytes.size();
    bytes.insert(bytes.end(), 10, 0x23);

    FileIndex index = indexBytes(bytes);
    EXPECT_FALSE(index.complete);
    EXPECT_EQ(index.entries.size(), 6u);
    ASSERT_FALSE(index.issues.empty());
    EXPECT_EQ(index.issues.back().code, ErrorCode::TruncatedStream);
    EXPECT_EQ(index.issues.back().offset, cleanSize);
}

TEST(StreamIndexerTest, ResynchronizesPastGarbage) {
    Bytes first = encode(makeAttitude(100));
    Bytes rest = concat({makeDepth(1), makeAttitude(101)});

    Bytes bytes = first;
    bytes.insert(bytes.end(), {0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x11, 0x22});
    append(bytes, rest);

    FileIndex index = indexBytes(bytes);
    EXPECT_TRUE(index.complete);
    ASSERT_EQ(index.entries.size(), 3u);
    EXPECT_EQ(index.entries[1].offset, first.size() + 7);
    EXPECT_EQ(index.entries[1].tag, "#MRZ");
    ASSERT_EQ(index.issues.size(), 1u);
    EXPECT_EQ(index.issues[0].code, ErrorCode::MalformedHeader);
    EXPECT_EQ(index.issues[0].offset, first.size());
}

TEST(StreamIndexerTest, TrailingLengthMismatchIsSkipped) {
    Bytes a = encode(makeAttitude(100));
    Bytes b = encode(makePosition(101));
    Bytes c = encode(makeAttitude(102));
    b[b.size() - 1] = 0x7F;

    Bytes bytes = a;
    append(bytes, b);
    append(bytes, c);

    FileIndex index = indexBytes(bytes);
    ASSERT_EQ(index.entries.size(), 2u);
    EXPECT_EQ(index.entries[0].tag, "#SKM");
    EXPECT_EQ(index.entries[1].tag, "#SKM");
    EXPECT_EQ(index.entries[1].offset, a.size() + b.size());
    ASSERT_EQ(index.issues.size(), 1u);
    EXPECT_EQ(index.issues[0].code, ErrorCode::MalformedHeader);
    EXPECT_TRUE(index.complete);
}

TEST(StreamIndexerTest, GarbageWithoutFurtherDatagramsStops) {
    Bytes bytes = encode(makeAttitude(100));
    bytes.insert(bytes.end(), 100, 0x55);

    FileIndex index = indexBytes(bytes);
    EXPECT_FALSE(index.complete);
    EXPECT_EQ(index.entries.size(), 1u);
    ASSERT_EQ(index.issues.size(), 2u);
    EXPECT_EQ(index.issues[0].code, ErrorCode::MalformedHeader);
    EXPECT_EQ(index.issues[1].code, ErrorCode::TruncatedStream);
}
