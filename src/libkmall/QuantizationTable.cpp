/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief The quantization scale table.
 *
 * Scale conventions: positions and offsets 1e-4 m, angles 1e-4 deg, levels
 * 0.01 dB, times 1e-7 s, frequencies 0.01 Hz, sample rates and sound speed
 * 1e-3, sounding position deltas 1e-9 deg, vessel position 1e-10 deg.
 */

#include <cmath>
#include <limits>
#include <sstream>

#include "KmallError.hpp"
#include "QuantizationTable.hpp"

namespace kmall {

namespace {

// Field ranges
constexpr double ANGLE_MAX_DEG = 360.0;
constexpr double LEVEL_MAX_DB = 320.0;
constexpr double TIME_MAX_SEC = 200.0;
constexpr double DISTANCE_MAX_M = 20000.0;
constexpr double FREQUENCY_MAX_HZ = 2.0e7;
constexpr double SAMPLE_RATE_MAX_HZ = 2.0e6;
constexpr double SOUND_SPEED_MAX = 1.0e5;
constexpr double ATTENUATION_MAX = 1.0e5;
constexpr double RATIO_MAX = 300.0;
constexpr double QUALITY_MAX = 1.0e5;
constexpr double DELTA_POSITION_MAX_DEG = 2.0;
constexpr double FOCUS_RANGE_MAX_M = 1.0e6;

template <typename T> FieldBinding<T> f32(const char *name, double scale, IntWidth width, double maxAbs, float T::*m)
{
    return FieldBinding<T>{QuantizedField{name, scale, width, maxAbs}, m, nullptr};
}

template <typename T>
FieldBinding<T> f64(const char *name, double scale, IntWidth width, double maxAbs, double T::*m)
{
    return FieldBinding<T>{QuantizedField{name, scale, width, maxAbs}, nullptr, m};
}

int64_t widthMax(IntWidth width)
{
    switch (width) {
    case IntWidth::I16:
        return std::numeric_limits<int16_t>::max();
    case IntWidth::I32:
        return std::numeric_limits<int32_t>::max();
    case IntWidth::I64:
        return std::numeric_limits<int64_t>::max();
    }
    return 0;
}

} // namespace

using W = IntWidth;

// clang-format off

const std::vector<FieldBinding<MrzPingInfo>> &pingInfoFields()
{
    using T = MrzPingInfo;
    static const std::vector<FieldBinding<T>> fields = {
        f32<T>("pingRate_Hz",                 1e-3,  W::I32, SAMPLE_RATE_MAX_HZ, &T::pingRate_Hz),
        f32<T>("frequencyMode_Hz",            0.01,  W::I32, FREQUENCY_MAX_HZ,   &T::frequencyMode_Hz),
        f32<T>("freqRangeLowLim_Hz",          0.01,  W::I32, FREQUENCY_MAX_HZ,   &T::freqRangeLowLim_Hz),
        f32<T>("freqRangeHighLim_Hz",         0.01,  W::I32, FREQUENCY_MAX_HZ,   &T::freqRangeHighLim_Hz),
        f32<T>("maxTotalTxPulseLength_sec",   1e-7,  W::I32, TIME_MAX_SEC,       &T::maxTotalTxPulseLength_sec),
        f32<T>("maxEffTxPulseLength_sec",     1e-7,  W::I32, TIME_MAX_SEC,       &T::maxEffTxPulseLength_sec),
        f32<T>("maxEffTxBandWidth_Hz",        0.01,  W::I32, FREQUENCY_MAX_HZ,   &T::maxEffTxBandWidth_Hz),
        f32<T>("absCoeff_dBPerkm",            1e-3,  W::I32, ATTENUATION_MAX,    &T::absCoeff_dBPerkm),
        f32<T>("portSectorEdge_deg",          1e-4,  W::I32, ANGLE_MAX_DEG,      &T::portSectorEdge_deg),
        f32<T>("starbSectorEdge_deg",         1e-4,  W::I32, ANGLE_MAX_DEG,      &T::starbSectorEdge_deg),
        f32<T>("portMeanCov_deg",             1e-4,  W::I32, ANGLE_MAX_DEG,      &T::portMeanCov_deg),
        f32<T>("starbMeanCov_deg",            1e-4,  W::I32, ANGLE_MAX_DEG,      &T::starbMeanCov_deg),
        f32<T>("transmitArraySizeUsed_deg",   1e-4,  W::I32, ANGLE_MAX_DEG,      &T::transmitArraySizeUsed_deg),
        f32<T>("receiveArraySizeUsed_deg",    1e-4,  W::I32, ANGLE_MAX_DEG,      &T::receiveArraySizeUsed_deg),
        f32<T>("transmitPower_dB",            0.01,  W::I16, LEVEL_MAX_DB,       &T::transmitPower_dB),
        f32<T>("yawAngle_deg",                1e-4,  W::I32, ANGLE_MAX_DEG,      &T::yawAngle_deg),
        f32<T>("headingVessel_deg",           1e-4,  W::I32, ANGLE_MAX_DEG,      &T::headingVessel_deg),
        f32<T>("soundSpeedAtTxDepth_mPerSec", 1e-3,  W::I32, SOUND_SPEED_MAX,    &T::soundSpeedAtTxDepth_mPerSec),
        f32<T>("txTransducerDepth_m",         1e-4,  W::I32, DISTANCE_MAX_M,     &T::txTransducerDepth_m),
        f32<T>("z_waterLevelReRefPoint_m",    1e-4,  W::I32, DISTANCE_MAX_M,     &T::z_waterLevelReRefPoint_m),
        f32<T>("x_kmallToall_m",              1e-4,  W::I32, DISTANCE_MAX_M,     &T::x_kmallToall_m),
        f32<T>("y_kmallToall_m",              1e-4,  W::I32, DISTANCE_MAX_M,     &T::y_kmallToall_m),
        f64<T>("latitude_deg",                1e-10, W::I64, ANGLE_MAX_DEG,      &T::latitude_deg),
        f64<T>("longitude_deg",               1e-10, W::I64, ANGLE_MAX_DEG,      &T::longitude_deg),
        f32<T>("ellipsoidHeightReRefPoint_m", 1e-4,  W::I32, DISTANCE_MAX_M,     &T::ellipsoidHeightReRefPoint_m),
    };
    return fields;
}

const std::vector<FieldBinding<MrzTxSector>> &mrzTxSectorFields()
{
    using T = MrzTxSector;
    static const std::vector<FieldBinding<T>> fields = {
        f32<T>("sectorTransmitDelay_sec", 1e-7, W::I32, TIME_MAX_SEC,      &T::sectorTransmitDelay_sec),
        f32<T>("tiltAngleReTx_deg",       1e-4, W::I32, ANGLE_MAX_DEG,     &T::tiltAngleReTx_deg),
        f32<T>("txNominalSourceLevel_dB", 0.01, W::I16, LEVEL_MAX_DB,      &T::txNominalSourceLevel_dB),
        f32<T>("txFocusRange_m",          1e-3, W::I32, FOCUS_RANGE_MAX_M, &T::txFocusRange_m),
        f32<T>("centreFreq_Hz",           0.01, W::I32, FREQUENCY_MAX_HZ,  &T::centreFreq_Hz),
        f32<T>("signalBandWidth_Hz",      0.01, W::I32, FREQUENCY_MAX_HZ,  &T::signalBandWidth_Hz),
        f32<T>("totalSignalLength_sec",   1e-7, W::I32, TIME_MAX_SEC,      &T::totalSignalLength_sec),
    };
    return fields;
}

const std::vector<FieldBinding<MrzRxInfo>> &mrzRxInfoFields()
{
    using T = MrzRxInfo;
    static const std::vector<FieldBinding<T>> fields = {
        f32<T>("WCSampleRate",          1e-3, W::I32, SAMPLE_RATE_MAX_HZ, &T::WCSampleRate),
        f32<T>("seabedImageSampleRate", 1e-3, W::I32, SAMPLE_RATE_MAX_HZ, &T::seabedImageSampleRate),
        f32<T>("BSnormal_dB",           0.01, W::I16, LEVEL_MAX_DB,       &T::BSnormal_dB),
        f32<T>("BSoblique_dB",          0.01, W::I16, LEVEL_MAX_DB,       &T::BSoblique_dB),
    };
    return fields;
}

const std::vector<FieldBinding<MrzSounding>> &soundingFields()
{
    using T = MrzSounding;
    static const std::vector<FieldBinding<T>> fields = {
        f32<T>("rangeFactor",                    0.01, W::I16, RATIO_MAX,              &T::rangeFactor),
        f32<T>("qualityFactor",                  1e-4, W::I32, QUALITY_MAX,            &T::qualityFactor),
        f32<T>("detectionUncertaintyVer_m",      1e-4, W::I32, DISTANCE_MAX_M,         &T::detectionUncertaintyVer_m),
        f32<T>("detectionUncertaintyHor_m",      1e-4, W::I32, DISTANCE_MAX_M,         &T::detectionUncertaintyHor_m),
        f32<T>("detectionWindowLength_sec",      1e-7, W::I32, TIME_MAX_SEC,           &T::detectionWindowLength_sec),
        f32<T>("echoLength_sec",                 1e-7, W::I32, TIME_MAX_SEC,           &T::echoLength_sec),
        f32<T>("WCNomBeamAngleAcross_deg",       1e-4, W::I32, ANGLE_MAX_DEG,          &T::WCNomBeamAngleAcross_deg),
        f32<T>("meanAbsCoeff_dBPerkm",           1e-3, W::I32, ATTENUATION_MAX,        &T::meanAbsCoeff_dBPerkm),
        f32<T>("reflectivity1_dB",               0.01, W::I16, LEVEL_MAX_DB,           &T::reflectivity1_dB),
        f32<T>("reflectivity2_dB",               0.01, W::I16, LEVEL_MAX_DB,           &T::reflectivity2_dB),
        f32<T>("receiverSensitivityApplied_dB",  0.01, W::I16, LEVEL_MAX_DB,           &T::receiverSensitivityApplied_dB),
        f32<T>("sourceLevelApplied_dB",          0.01, W::I16, LEVEL_MAX_DB,           &T::sourceLevelApplied_dB),
        f32<T>("BScalibration_dB",               0.01, W::I16, LEVEL_MAX_DB,           &T::BScalibration_dB),
        f32<T>("TVG_dB",                         0.01, W::I16, LEVEL_MAX_DB,           &T::TVG_dB),
        f32<T>("beamAngleReRx_deg",              1e-4, W::I32, ANGLE_MAX_DEG,          &T::beamAngleReRx_deg),
        f32<T>("beamAngleCorrection_deg",        1e-4, W::I32, ANGLE_MAX_DEG,          &T::beamAngleCorrection_deg),
        f32<T>("twoWayTravelTime_sec",           1e-7, W::I32, TIME_MAX_SEC,           &T::twoWayTravelTime_sec),
        f32<T>("twoWayTravelTimeCorrection_sec", 1e-7, W::I32, TIME_MAX_SEC,           &T::twoWayTravelTimeCorrection_sec),
        f32<T>("deltaLatitude_deg",              1e-9, W::I32, DELTA_POSITION_MAX_DEG, &T::deltaLatitude_deg),
        f32<T>("deltaLongitude_deg",             1e-9, W::I32, DELTA_POSITION_MAX_DEG, &T::deltaLongitude_deg),
        f32<T>("z_reRefPoint_m",                 1e-4, W::I32, DISTANCE_MAX_M,         &T::z_reRefPoint_m),
        f32<T>("y_reRefPoint_m",                 1e-4, W::I32, DISTANCE_MAX_M,         &T::y_reRefPoint_m),
        f32<T>("x_reRefPoint_m",                 1e-4, W::I32, DISTANCE_MAX_M,         &T::x_reRefPoint_m),
        f32<T>("beamIncAngleAdj_deg",            1e-4, W::I32, ANGLE_MAX_DEG,          &T::beamIncAngleAdj_deg),
    };
    return fields;
}

const std::vector<FieldBinding<MwcTxInfo>> &mwcTxInfoFields()
{
    using T = MwcTxInfo;
    static const std::vector<FieldBinding<T>> fields = {
        f32<T>("heave_m", 1e-4, W::I32, DISTANCE_MAX_M, &T::heave_m),
    };
    return fields;
}

const std::vector<FieldBinding<MwcTxSector>> &mwcTxSectorFields()
{
    using T = MwcTxSector;
    static const std::vector<FieldBinding<T>> fields = {
        f32<T>("tiltAngleReTx_deg",    1e-4, W::I32, ANGLE_MAX_DEG,    &T::tiltAngleReTx_deg),
        f32<T>("centreFreq_Hz",        0.01, W::I32, FREQUENCY_MAX_HZ, &T::centreFreq_Hz),
        f32<T>("txBeamWidthAlong_deg", 1e-4, W::I32, ANGLE_MAX_DEG,    &T::txBeamWidthAlong_deg),
    };
    return fields;
}

const std::vector<FieldBinding<MwcRxInfo>> &mwcRxInfoFields()
{
    using T = MwcRxInfo;
    static const std::vector<FieldBinding<T>> fields = {
        f32<T>("sampleFreq_Hz",         1e-3, W::I32, SAMPLE_RATE_MAX_HZ, &T::sampleFreq_Hz),
        f32<T>("soundVelocity_mPerSec", 1e-3, W::I32, SOUND_SPEED_MAX,    &T::soundVelocity_mPerSec),
    };
    return fields;
}

const std::vector<FieldBinding<MwcBeam>> &mwcBeamFields()
{
    using T = MwcBeam;
    static const std::vector<FieldBinding<T>> fields = {
        f32<T>("beamPointAngReVertical_deg", 1e-4, W::I32, ANGLE_MAX_DEG, &T::beamPointAngReVertical_deg),
    };
    return fields;
}

// clang-format on

int64_t nanSentinel(IntWidth width)
{
    switch (width) {
    case IntWidth::I16:
        return std::numeric_limits<int16_t>::min();
    case IntWidth::I32:
        return std::numeric_limits<int32_t>::min();
    case IntWidth::I64:
        return std::numeric_limits<int64_t>::min();
    }
    return 0;
}

int64_t quantize(const QuantizedField &field, double value)
{
    if (std::isnan(value)) {
        return nanSentinel(field.width);
    }
    if (std::isinf(value) || std::fabs(value) > field.maxAbs) {
        std::stringstream msg;
        msg << "value " << value << " of " << field.name << " exceeds the quantized range of +/-" << field.maxAbs;
        throw KmallError(ErrorCode::QuantizationOverflow, msg.str());
    }

    auto stored = static_cast<int64_t>(std::llround(value / field.scale));
    if (stored > widthMax(field.width) || stored <= nanSentinel(field.width)) {
        std::stringstream msg;
        msg << "value " << value << " of " << field.name << " does not fit its integer width";
        throw KmallError(ErrorCode::QuantizationOverflow, msg.str());
    }
    return stored;
}

double dequantize(const QuantizedField &field, int64_t stored)
{
    if (stored == nanSentinel(field.width)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    double value = static_cast<double>(stored) * field.scale;
    if (std::fabs(value) > field.maxAbs + field.tolerance()) {
        std::stringstream msg;
        msg << "stored value " << stored << " of " << field.name << " decodes to " << value
            << ", outside the range of +/-" << field.maxAbs;
        throw KmallError(ErrorCode::CorruptCompressedStream, msg.str());
    }
    return value;
}

} // namespace kmall
