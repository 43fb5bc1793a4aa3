/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * Unit tests for DatagramDecoder and DatagramEncoder
 */

#include <gtest/gtest.h>
#include <DatagramDecoder.hpp>
#include <DatagramEncoder.hpp>
#include <KmallError.hpp>
#include <stdexcept>
#include <variant>

#include "TestDatagrams.hpp"

using namespace kmall;
using namespace kmall_test;

namespace {

ErrorCode decodeError(const Bytes &bytes, const std::string &tag = std::string()) {
    try {
        (void)decode(bytes, tag);
    } catch (const KmallError &ex) {
        return ex.code();
    }
    ADD_FAILURE() << "decode did not throw";
    return ErrorCode::IOFailure;
}

/// Decoding and re-encoding must reproduce the bytes exactly
void expectByteIdentical(const Bytes &bytes) {
    Datagram dg = decode(bytes);
    EXPECT_EQ(encode(dg), bytes);
}

}  // anonymous namespace

// ============================================================================
// Header decoding
// ============================================================================

TEST(DecodeHeaderTest, ReadsAllFields) {
    Bytes bytes = encode(makePosition(1700000123u, 500000000u));
    DatagramHeader header = decodeHeader(bytes);

    EXPECT_EQ(header.numBytesDgm, bytes.size());
    EXPECT_EQ(header.dgmType, "#SPO");
    EXPECT_EQ(header.dgmVersion, 1);
    EXPECT_EQ(header.systemID, 40);
    EXPECT_EQ(header.echoSounderID, 2040);
    EXPECT_EQ(header.time_sec, 1700000123u);
    EXPECT_EQ(header.time_nanosec, 500000000u);
    EXPECT_DOUBLE_EQ(header.time(), 1700000123.5);
}

TEST(DecodeHeaderTest, ShortBufferIsTruncated) {
    Bytes bytes(MIN_DATAGRAM_SIZE - 1);
    try {
        (void)decodeHeader(bytes);
        FAIL() << "expected KmallError";
    } catch (const KmallError &ex) {
        EXPECT_EQ(ex.code(), ErrorCode::TruncatedRecord);
    }
}

TEST(DecodeHeaderTest, DeclaredLengthBeyondBufferIsTruncated) {
    Bytes bytes = encode(makePosition(10));
    bytes.resize(bytes.size() - 1);
    try {
        (void)decodeHeader(bytes);
        FAIL() << "expected KmallError";
    } catch (const KmallError &ex) {
        EXPECT_EQ(ex.code(), ErrorCode::TruncatedRecord);
    }
}

TEST(DecodeHeaderTest, MissingTagMarkerIsMalformed) {
    Bytes bytes = encode(makePosition(10));
    bytes[4] = 'X';
    EXPECT_EQ(decodeError(bytes), ErrorCode::MalformedHeader);
}

TEST(DecodeHeaderTest, LengthBelowMinimumIsMalformed) {
    Bytes bytes = encode(makePosition(10));
    bytes[0] = 20;
    bytes[1] = bytes[2] = bytes[3] = 0;
    EXPECT_EQ(decodeError(bytes), ErrorCode::MalformedHeader);
}

// ============================================================================
// Framing
// ============================================================================

TEST(DecodeFramingTest, TrailingLengthMismatchIsMalformed) {
    Bytes bytes = encode(makeAttitude(10));
    bytes[bytes.size() - 4] ^= 0x01;
    EXPECT_EQ(decodeError(bytes), ErrorCode::MalformedHeader);
}

TEST(DecodeFramingTest, DeclaredTagMismatchIsMalformed) {
    Bytes bytes = encode(makeAttitude(10));
    EXPECT_EQ(decodeError(bytes, "#MRZ"), ErrorCode::MalformedHeader);
    EXPECT_NO_THROW((void)decode(bytes, "#SKM"));
}

TEST(DecodeFramingTest, StructOverrunningDatagramIsTruncatedRecord) {
    // Claim one sounding more than the datagram holds; the trailing length still matches
    Bytes bytes = encode(makeDepth(1, 1, 0, 2, 0));
    size_t maxMainOffset = DATAGRAM_HEADER_SIZE + M_PARTITION_SIZE + M_BODY_SIZE + MRZ_PING_INFO_SIZE +
                           MRZ_TX_SECTOR_INFO_SIZE + 2;
    ASSERT_EQ(bytes[maxMainOffset], 2);
    bytes[maxMainOffset] = 3;
    EXPECT_EQ(decodeError(bytes), ErrorCode::TruncatedRecord);
}

TEST(DecodeFramingTest, BlockSmallerThanKnownSizeIsMalformed) {
    Bytes bytes = encode(makeDepth(1));
    // The common part size field follows the 4-byte partition
    size_t cmnSizeOffset = DATAGRAM_HEADER_SIZE + M_PARTITION_SIZE;
    ASSERT_EQ(bytes[cmnSizeOffset], M_BODY_SIZE);
    bytes[cmnSizeOffset] = M_BODY_SIZE - 2;
    EXPECT_EQ(decodeError(bytes), ErrorCode::MalformedHeader);
}

// ============================================================================
// Opaque fallback
// ============================================================================

TEST(DecodeOpaqueTest, UnknownTagDecodesOpaque) {
    Bytes bytes = encode(makeOpaque("#XYZ", 77, 10));
    Datagram dg = decode(bytes);
    ASSERT_TRUE(std::holds_alternative<OpaqueDatagram>(dg));
    const auto &opaque = std::get<OpaqueDatagram>(dg);
    EXPECT_EQ(opaque.header.dgmType, "#XYZ");
    EXPECT_EQ(opaque.body.size(), 10u);
    EXPECT_EQ(encode(dg), bytes);
}

TEST(DecodeOpaqueTest, SchemaLessTagDecodesOpaque) {
    Bytes bytes = encode(makeOpaque(TAG_HEADING, 77, 30));
    Datagram dg = decode(bytes);
    EXPECT_TRUE(std::holds_alternative<OpaqueDatagram>(dg));
    EXPECT_EQ(headerOf(dg).dgmType, "#SHA");
}

// ============================================================================
// Typed decoding
// ============================================================================

TEST(DecodeTypedTest, DepthDatagramFields) {
    DepthDatagram mrz = makeDepth(42, 2, 1, 5, 4);
    Datagram dg = decode(encode(mrz));
    ASSERT_TRUE(std::holds_alternative<DepthDatagram>(dg));
    const auto &decoded = std::get<DepthDatagram>(dg);

    EXPECT_EQ(decoded.cmnPart.pingCnt, 42);
    EXPECT_EQ(decoded.cmnPart.rxFansPerPing, 2);
    EXPECT_EQ(decoded.cmnPart.rxFanIndex, 1);
    EXPECT_EQ(decoded.txSectors.size(), 1u);
    ASSERT_EQ(decoded.soundings.size(), 5u);
    EXPECT_FLOAT_EQ(decoded.soundings[3].z_reRefPoint_m, 36.5f);
    EXPECT_DOUBLE_EQ(decoded.pingInfo.latitude_deg, 59.9123456789);
    EXPECT_EQ(decoded.SIsample_desidB.size(), 20u);
}

TEST(DecodeTypedTest, SeabedImageSplitsPerSounding) {
    DepthDatagram mrz = makeDepth(1, 1, 0, 3, 0);
    mrz.soundings[0].SInumSamples = 2;
    mrz.soundings[2].SInumSamples = 3;
    mrz.SIsample_desidB = {1, 2, 3, 4, 5};
    const auto decoded = std::get<DepthDatagram>(decode(encode(mrz)));

    EXPECT_EQ(decoded.seabedImageOffsets(), (std::vector<size_t>{0, 2, 2, 5}));
    EXPECT_EQ(decoded.seabedImage(0), (std::vector<int16_t>{1, 2}));
    EXPECT_TRUE(decoded.seabedImage(1).empty());
    EXPECT_EQ(decoded.seabedImage(2), (std::vector<int16_t>{3, 4, 5}));
    EXPECT_THROW((void)decoded.seabedImage(3), std::out_of_range);
}

TEST(DecodeTypedTest, WaterColumnPhaseVariants) {
    for (uint8_t phase : {MWC_PHASE_NONE, MWC_PHASE_LOW_RES, MWC_PHASE_HIGH_RES}) {
        WaterColumnDatagram mwc = makeWaterColumn(9, phase, 2, 6);
        const auto decoded = std::get<WaterColumnDatagram>(decode(encode(mwc)));
        ASSERT_EQ(decoded.beams.size(), 2u);
        EXPECT_EQ(decoded.beams[1].sampleAmplitude05dB.size(), 6u);
        EXPECT_EQ(decoded.beams[1].rxBeamPhase8.size(), phase == MWC_PHASE_LOW_RES ? 6u : 0u);
        EXPECT_EQ(decoded.beams[1].rxBeamPhase16.size(), phase == MWC_PHASE_HIGH_RES ? 6u : 0u);
    }
}

TEST(DecodeTypedTest, InvalidPhaseFlagIsMalformed) {
    WaterColumnDatagram mwc = makeWaterColumn(9, MWC_PHASE_NONE);
    mwc.rxInfo.phaseFlag = 3;
    EXPECT_THROW((void)encode(mwc), KmallError);
}

TEST(DecodeTypedTest, AttitudeSamples) {
    const auto decoded = std::get<AttitudeDatagram>(decode(encode(makeAttitude(100, 0, 3))));
    ASSERT_EQ(decoded.samples.size(), 3u);
    EXPECT_EQ(decoded.samples[2].kmBinary.dgmType, "#KMB");
    EXPECT_FLOAT_EQ(decoded.samples[2].kmBinary.roll_deg, 1.0f);
}

TEST(DecodeTypedTest, PositionKeepsSensorString) {
    PositionDatagram spo = makePosition(100);
    const auto decoded = std::get<PositionDatagram>(decode(encode(spo)));
    EXPECT_EQ(decoded.posDataFromSensor, spo.posDataFromSensor);
    EXPECT_DOUBLE_EQ(decoded.correctedLat_deg, 59.9123);
}

TEST(DecodeTypedTest, SensorDepthFields) {
    SensorDepthDatagram sde;
    sde.header = makeHeader(TAG_DEPTH, 100);
    sde.cmnPart.sensorSystem = 1;
    sde.depthUsed_m = 152.25f;
    sde.offset = 0.5f;
    sde.scale = 1.0f;
    sde.latitude_deg = UNAVAILABLE_LATITUDE;
    sde.longitude_deg = UNAVAILABLE_LONGITUDE;
    sde.dataFromSensor = "$PDEP,152.3";

    Bytes bytes = encode(sde);
    EXPECT_EQ(bytes.size(), DATAGRAM_HEADER_SIZE + S_COMMON_SIZE + 28 + sde.dataFromSensor.size() + LENGTH_FIELD_SIZE);
    const auto decoded = std::get<SensorDepthDatagram>(decode(bytes, TAG_DEPTH));
    EXPECT_FLOAT_EQ(decoded.depthUsed_m, 152.25f);
    EXPECT_FLOAT_EQ(decoded.offset, 0.5f);
    EXPECT_DOUBLE_EQ(decoded.latitude_deg, UNAVAILABLE_LATITUDE);
    EXPECT_EQ(decoded.dataFromSensor, sde.dataFromSensor);
}

TEST(DecodeTypedTest, HeightFields) {
    HeightDatagram shi;
    shi.header = makeHeader(TAG_HEIGHT, 100);
    shi.sensorType = 3;
    shi.heightUsed_m = -1.75f;
    shi.dataFromSensor = "$GPGGA";

    Bytes bytes = encode(shi);
    EXPECT_EQ(bytes.size(), DATAGRAM_HEADER_SIZE + S_COMMON_SIZE + 8 + shi.dataFromSensor.size() + LENGTH_FIELD_SIZE);
    const auto decoded = std::get<HeightDatagram>(decode(bytes, TAG_HEIGHT));
    EXPECT_EQ(decoded.sensorType, 3);
    EXPECT_FLOAT_EQ(decoded.heightUsed_m, -1.75f);
    EXPECT_EQ(decoded.dataFromSensor, "$GPGGA");
}

TEST(DecodeTypedTest, CompatibilityHeaveCarriesMultibeamBody) {
    CompatibilityHeaveDatagram che;
    che.header = makeHeader(TAG_COMPATIBILITY_HEAVE, 100);
    che.cmnPart.pingCnt = 4321;
    che.cmnPart.rxFansPerPing = 2;
    che.heave_m = 0.42f;

    Bytes bytes = encode(che);
    EXPECT_EQ(bytes.size(), DATAGRAM_HEADER_SIZE + M_BODY_SIZE + 4 + LENGTH_FIELD_SIZE);
    const auto decoded = std::get<CompatibilityHeaveDatagram>(decode(bytes));
    EXPECT_EQ(decoded.cmnPart.pingCnt, 4321);
    EXPECT_EQ(decoded.cmnPart.rxFansPerPing, 2);
    EXPECT_FLOAT_EQ(decoded.heave_m, 0.42f);
    EXPECT_TRUE(decoded.trailer.empty());
}

TEST(DecodeTypedTest, TruncatedSensorDepthIsTruncatedRecord) {
    OpaqueDatagram shortSde = makeOpaque(TAG_DEPTH, 100, S_COMMON_SIZE + 10);
    shortSde.body[0] = static_cast<uint8_t>(S_COMMON_SIZE);
    shortSde.body[1] = 0;
    EXPECT_EQ(decodeError(encode(shortSde)), ErrorCode::TruncatedRecord);
}

// ============================================================================
// Byte-identical re-encoding
// ============================================================================

TEST(ReencodeTest, EveryTypedKindIsByteIdentical) {
    InstallationParameters iip;
    iip.header = makeHeader(TAG_INSTALLATION_PARAM, 5);
    iip.text = "OSCV:Empty,EMXV:EM2040,PU_0=10,SN=1234,\n";
    iip.trailer = {0, 0};

    RuntimeParameters iop;
    iop.header = makeHeader(TAG_RUNTIME_PARAM, 6);
    iop.text = "Max angle Port: 70.0\n";

    SoundVelocityProfile svp;
    svp.header = makeHeader(TAG_SOUND_VELOCITY_PROFILE, 7);
    svp.sensorFormat = "S00";
    svp.latitude_deg = UNAVAILABLE_LATITUDE;
    svp.longitude_deg = UNAVAILABLE_LONGITUDE;
    svp.points.resize(3);
    svp.points[1].depth_m = 10.0f;
    svp.points[1].soundVelocity_mPerSec = 1490.5f;

    SoundVelocityTransducer svt;
    svt.header = makeHeader(TAG_SOUND_VELOCITY_TRANSDUCER, 8);
    svt.samples.resize(2);
    svt.samples[0].soundVelocity_mPerSec = 1500.25f;

    ClockDatagram scl;
    scl.header = makeHeader(TAG_CLOCK, 9);
    scl.offset_sec = 0.001f;
    scl.clockDevPU_nanosec = -1500;
    scl.dataFromSensor = "ZDA";

    CompatibilityPosition cpo;
    static_cast<PositionData &>(cpo) = makePosition(11);
    cpo.header.dgmType = TAG_COMPATIBILITY_POSITION;

    SensorDepthDatagram sde;
    sde.header = makeHeader(TAG_DEPTH, 16);
    sde.depthUsed_m = 20.5f;
    sde.dataFromSensor = std::string("raw\0depth", 9);

    HeightDatagram shi;
    shi.header = makeHeader(TAG_HEIGHT, 17);
    shi.padding = 0xBEEF;
    shi.heightUsed_m = 3.0f;

    CompatibilityHeaveDatagram che;
    che.header = makeHeader(TAG_COMPATIBILITY_HEAVE, 18);
    che.cmnPart.extra = {0x11};
    che.heave_m = -0.2f;
    che.trailer = {0, 0, 0};

    for (const Datagram &dg :
         std::vector<Datagram>{iip, iop, svp, svt, scl, cpo, sde, shi, che, makeAttitude(12), makePosition(13),
                               makeDepth(14), makeWaterColumn(15, 2)}) {
        SCOPED_TRACE(headerOf(dg).dgmType);
        expectByteIdentical(encode(dg));
    }
}

TEST(ReencodeTest, UnknownStructExtensionsArePreserved) {
    DepthDatagram mrz = makeDepth(3);
    mrz.cmnPart.extra = {0xAA, 0xBB};
    mrz.pingInfo.extra = {1, 2, 3, 4};
    mrz.txSectors[0].extra = {9, 9};
    mrz.rxInfo.extra = {7};
    for (auto &s : mrz.soundings) {
        s.extra = {5, 6, 7, 8};
    }
    mrz.trailer = {0, 0, 0, 0};

    Bytes bytes = encode(mrz);
    const auto decoded = std::get<DepthDatagram>(decode(bytes));
    EXPECT_EQ(decoded.pingInfo.extra, (Bytes{1, 2, 3, 4}));
    EXPECT_EQ(decoded.soundings[2].extra, (Bytes{5, 6, 7, 8}));
    EXPECT_EQ(decoded.trailer.size(), 4u);
    EXPECT_EQ(encode(decoded), bytes);
}

TEST(ReencodeTest, MismatchedElementExtrasAreRejected) {
    DepthDatagram mrz = makeDepth(3);
    mrz.soundings[0].extra = {1};
    EXPECT_THROW((void)encode(mrz), KmallError);
}

TEST(ReencodeTest, SoundingCountMustMatchRxInfo) {
    DepthDatagram mrz = makeDepth(3, 1, 0, 4, 0);
    mrz.soundings.pop_back();
    EXPECT_THROW((void)encode(mrz), KmallError);
}

// ============================================================================
// Multibeam prefix
// ============================================================================

TEST(MultibeamPrefixTest, ReadsCommonPartOfVendorDatagram) {
    MultibeamPrefix prefix = decodeMultibeamCommon(encode(makeDepth(321, 2, 1)));
    EXPECT_EQ(prefix.originalTag, "#MRZ");
    EXPECT_EQ(prefix.cmnPart.pingCnt, 321);
    EXPECT_EQ(prefix.cmnPart.rxFansPerPing, 2);
    EXPECT_EQ(prefix.cmnPart.rxFanIndex, 1);
}

TEST(MultibeamPrefixTest, RejectsOtherDatagrams) {
    EXPECT_THROW((void)decodeMultibeamCommon(encode(makeAttitude(1))), KmallError);
}
