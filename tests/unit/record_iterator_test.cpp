/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Unit tests for KmallFile and the record iterator API
 */

#include <gtest/gtest.h>

#include "DatagramDecoder.hpp"
#include "KmallError.hpp"
#include "KmallFile.hpp"
#include "RecordIterator.hpp"
#include "TestDatagrams.hpp"

#include <iterator>
#include <string>
#include <variant>
#include <vector>

using namespace kmall;
using namespace kmall_test;

class RecordIteratorTest : public ::testing::Test
{
  protected:
    TempDir dir;

    std::filesystem::path writeFile()
    {
        return dir.write("records.kmall", concat({makeAttitude(100), makeDepth(1), makePosition(100),
                                                  makeDepth(2), makeAttitude(101), makeDepth(3)}));
    }
};

TEST_F(RecordIteratorTest, OpenMissingFileThrowsIOFailure)
{
    try {
        (void)KmallFile::open(dir.path() / "missing.kmall");
        FAIL() << "expected KmallError";
    } catch (const KmallError &ex) {
        EXPECT_EQ(ex.code(), ErrorCode::IOFailure);
    }
}

TEST_F(RecordIteratorTest, IteratesEveryRecordInOrder)
{
    auto file = KmallFile::open(writeFile());
    std::vector<std::string> tags;
    for (const auto &record : file.records()) {
        tags.push_back(record.tag());
    }
    EXPECT_EQ(tags, (std::vector<std::string>{"#SKM", "#MRZ", "#SPO", "#MRZ", "#SKM", "#MRZ"}));
}

TEST_F(RecordIteratorTest, FiltersByTagAndDecodes)
{
    auto file = KmallFile::open(writeFile());
    std::vector<uint16_t> pings;
    for (const auto &record : file.records(std::string(TAG_RANGE_AND_DEPTH))) {
        auto mrz = std::get<DepthDatagram>(record.decode());
        pings.push_back(mrz.cmnPart.pingCnt);
    }
    EXPECT_EQ(pings, (std::vector<uint16_t>{1, 2, 3}));
}

TEST_F(RecordIteratorTest, UnmatchedTagGivesEmptyRange)
{
    auto file = KmallFile::open(writeFile());
    auto range = file.records(std::string("#MWC"));
    EXPECT_TRUE(range.begin() == range.end());
}

TEST_F(RecordIteratorTest, RecordBytesMatchIndexEntry)
{
    auto file = KmallFile::open(writeFile());
    for (const auto &record : file.records()) {
        Bytes bytes = record.bytes();
        EXPECT_EQ(bytes.size(), record.entry().size);
        EXPECT_EQ(decodeHeader(bytes).dgmType, record.tag());
    }
}

TEST_F(RecordIteratorTest, PostIncrementReturnsPreviousPosition)
{
    auto file = KmallFile::open(writeFile());
    auto range = file.records();
    auto it = range.begin();
    auto previous = it++;
    EXPECT_EQ(previous->tag(), "#SKM");
    EXPECT_EQ(it->tag(), "#MRZ");
    EXPECT_EQ(std::distance(range.begin(), range.end()), 6);
}

TEST_F(RecordIteratorTest, ReadOutsideFileThrowsIOFailure)
{
    auto file = KmallFile::open(writeFile());
    IndexEntry bogus;
    bogus.offset = file.fileSize() - 10;
    bogus.size = 100;
    bogus.tag = "#SKM";
    try {
        (void)file.readDatagram(bogus);
        FAIL() << "expected KmallError";
    } catch (const KmallError &ex) {
        EXPECT_EQ(ex.code(), ErrorCode::IOFailure);
    }
}

TEST_F(RecordIteratorTest, IndexCoversWholeFile)
{
    auto path = writeFile();
    auto file = KmallFile::open(path);
    EXPECT_EQ(file.index().entries.size(), 6u);
    EXPECT_TRUE(file.index().complete);
    EXPECT_EQ(file.path(), path);
    EXPECT_EQ(file.index().fileSize, file.fileSize());

    const FileIndex &rebuilt = file.rebuildIndex();
    EXPECT_EQ(rebuilt.entries.size(), 6u);
}
