/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Builders for synthetic KMALL datagrams and files used by the unit tests.
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

#include "DatagramEncoder.hpp"
#include "Datagrams.hpp"
#include "ProtocolConstants.hpp"

namespace kmall_test {

using namespace kmall;

inline DatagramHeader makeHeader(const std::string &tag, uint32_t sec, uint32_t nanosec = 0)
{
    DatagramHeader header;
    header.dgmType = tag;
    header.dgmVersion = 1;
    header.systemID = 40;
    header.echoSounderID = 2040;
    header.time_sec = sec;
    header.time_nanosec = nanosec;
    return header;
}

/// #MRZ with @p numSoundings soundings; every sounding carries @p siPerSounding seabed samples
inline DepthDatagram makeDepth(uint16_t pingCnt, uint8_t fansPerPing = 1, uint8_t fanIndex = 0,
                               uint16_t numSoundings = 4, uint16_t siPerSounding = 3)
{
    DepthDatagram dg;
    dg.header = makeHeader(TAG_RANGE_AND_DEPTH, 1700000000u + pingCnt, 250000000u);
    dg.cmnPart.pingCnt = pingCnt;
    dg.cmnPart.rxFansPerPing = fansPerPing;
    dg.cmnPart.rxFanIndex = fanIndex;

    dg.pingInfo.pingRate_Hz = 2.5f;
    dg.pingInfo.frequencyMode_Hz = 300000.0f;
    dg.pingInfo.absCoeff_dBPerkm = 61.25f;
    dg.pingInfo.headingVessel_deg = 123.4567f;
    dg.pingInfo.soundSpeedAtTxDepth_mPerSec = 1502.125f;
    dg.pingInfo.txTransducerDepth_m = 4.75f;
    dg.pingInfo.latitude_deg = 59.9123456789;
    dg.pingInfo.longitude_deg = 10.7654321098;
    dg.pingInfo.ellipsoidHeightReRefPoint_m = 41.5f;

    MrzTxSector tx;
    tx.txSectorNumb = 0;
    tx.tiltAngleReTx_deg = -1.25f;
    tx.txNominalSourceLevel_dB = 210.5f;
    tx.centreFreq_Hz = 300000.0f;
    tx.totalSignalLength_sec = 0.0002f;
    dg.txSectors.push_back(tx);

    dg.rxInfo.numSoundingsMaxMain = numSoundings;
    dg.rxInfo.numSoundingsValidMain = numSoundings;
    dg.rxInfo.WCSampleRate = 15000.0f;
    dg.rxInfo.seabedImageSampleRate = 30000.0f;
    dg.rxInfo.BSnormal_dB = -20.5f;
    dg.rxInfo.BSoblique_dB = -31.75f;

    for (uint16_t i = 0; i < numSoundings; ++i) {
        MrzSounding s;
        s.soundingIndex = i;
        s.detectionType = 1;
        s.rangeFactor = 1.0f;
        s.qualityFactor = 0.25f;
        s.reflectivity1_dB = -25.5f + static_cast<float>(i);
        s.beamAngleReRx_deg = -60.0f + 10.0f * static_cast<float>(i);
        s.twoWayTravelTime_sec = 0.05f + 0.001f * static_cast<float>(i);
        s.deltaLatitude_deg = 0.0001f * static_cast<float>(i);
        s.deltaLongitude_deg = -0.0002f * static_cast<float>(i);
        s.z_reRefPoint_m = 35.0f + 0.5f * static_cast<float>(i);
        s.y_reRefPoint_m = -40.0f + 20.0f * static_cast<float>(i);
        s.x_reRefPoint_m = 0.125f;
        s.SIstartRange_samples = 100;
        s.SIcentreSample = siPerSounding / 2;
        s.SInumSamples = siPerSounding;
        dg.soundings.push_back(s);
    }
    for (size_t i = 0; i < static_cast<size_t>(numSoundings) * siPerSounding; ++i) {
        dg.SIsample_desidB.push_back(static_cast<int16_t>(-300 + static_cast<int>(i)));
    }
    return dg;
}

inline WaterColumnDatagram makeWaterColumn(uint16_t pingCnt, uint8_t phaseFlag = MWC_PHASE_NONE,
                                           uint16_t numBeams = 3, uint16_t samplesPerBeam = 5)
{
    WaterColumnDatagram dg;
    dg.header = makeHeader(TAG_WATER_COLUMN, 1700000000u + pingCnt, 260000000u);
    dg.cmnPart.pingCnt = pingCnt;
    dg.txInfo.heave_m = 0.35f;

    MwcTxSector sector;
    sector.tiltAngleReTx_deg = 0.5f;
    sector.centreFreq_Hz = 300000.0f;
    sector.txBeamWidthAlong_deg = 1.0f;
    dg.txSectors.push_back(sector);

    dg.rxInfo.phaseFlag = phaseFlag;
    dg.rxInfo.TVGfunctionApplied = 30;
    dg.rxInfo.TVGoffset_dB = -6;
    dg.rxInfo.sampleFreq_Hz = 15000.0f;
    dg.rxInfo.soundVelocity_mPerSec = 1500.0f;

    for (uint16_t b = 0; b < numBeams; ++b) {
        MwcBeam beam;
        beam.beamPointAngReVertical_deg = -45.0f + 45.0f * static_cast<float>(b);
        beam.detectedRangeInSamples = 200;
        for (uint16_t i = 0; i < samplesPerBeam; ++i) {
            beam.sampleAmplitude05dB.push_back(static_cast<int8_t>(-100 + i));
            if (phaseFlag == MWC_PHASE_LOW_RES) {
                beam.rxBeamPhase8.push_back(static_cast<int8_t>(i));
            } else if (phaseFlag == MWC_PHASE_HIGH_RES) {
                beam.rxBeamPhase16.push_back(static_cast<int16_t>(1000 * i));
            }
        }
        dg.beams.push_back(beam);
    }
    return dg;
}

inline AttitudeDatagram makeAttitude(uint32_t sec, uint32_t nanosec = 0, uint16_t numSamples = 2)
{
    AttitudeDatagram dg;
    dg.header = makeHeader(TAG_KM_BINARY, sec, nanosec);
    dg.info.sensorSystem = 1;
    dg.info.sensorInputFormat = 1;
    for (uint16_t i = 0; i < numSamples; ++i) {
        SkmSample sample;
        sample.kmBinary.time_sec = sec;
        sample.kmBinary.time_nanosec = nanosec + i * 10000000u;
        sample.kmBinary.latitude_deg = 59.9;
        sample.kmBinary.longitude_deg = 10.7;
        sample.kmBinary.roll_deg = 0.5f * static_cast<float>(i);
        sample.kmBinary.heading_deg = 123.0f;
        sample.delayedHeave.time_sec = sec;
        sample.delayedHeave.delayedHeave_m = 0.1f;
        dg.samples.push_back(sample);
    }
    return dg;
}

inline PositionDatagram makePosition(uint32_t sec, uint32_t nanosec = 0)
{
    PositionDatagram dg;
    dg.header = makeHeader(TAG_POSITION, sec, nanosec);
    dg.cmnPart.sensorSystem = 1;
    dg.timeFromSensor_sec = sec;
    dg.timeFromSensor_nanosec = nanosec;
    dg.posFixQuality_m = 0.5f;
    dg.correctedLat_deg = 59.9123;
    dg.correctedLong_deg = 10.7654;
    dg.speedOverGround_mPerSec = 4.2f;
    dg.courseOverGround_deg = 87.0f;
    dg.posDataFromSensor = "$GPGGA,120000.00,5954.738,N,01045.924,E,4,12,0.8,41.5,M,,,,*6A\r\n";
    return dg;
}

inline OpaqueDatagram makeOpaque(const std::string &tag, uint32_t sec, size_t bodySize = 16)
{
    OpaqueDatagram dg;
    dg.header = makeHeader(tag, sec);
    for (size_t i = 0; i < bodySize; ++i) {
        dg.body.push_back(static_cast<uint8_t>(i * 7));
    }
    return dg;
}

inline void append(Bytes &stream, const Bytes &datagram) { stream.insert(stream.end(), datagram.begin(), datagram.end()); }

inline Bytes concat(const std::vector<Datagram> &datagrams)
{
    Bytes stream;
    for (const auto &dg : datagrams) {
        append(stream, encode(dg));
    }
    return stream;
}

/// Float fields go through a float after dequantizing, which can add one float ulp
inline double quantizedTolerance(double scale, double value) { return scale / 2.0 + 1e-6 * std::fabs(value); }

/// A file in a private temporary directory, removed with everything next to it
class TempDir
{
  public:
    TempDir()
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string("kmall_") + info->test_suite_name() + "_" + info->name();
        m_path = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    [[nodiscard]] const std::filesystem::path &path() const { return m_path; }

    std::filesystem::path write(const std::string &filename, const Bytes &bytes) const
    {
        std::filesystem::path file = m_path / filename;
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return file;
    }

  private:
    std::filesystem::path m_path;
};

} // namespace kmall_test
