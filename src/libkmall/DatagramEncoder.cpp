/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <limits>
#include <sstream>

#include "DatagramEncoder.hpp"
#include "KmallError.hpp"
#include "ProtocolConstants.hpp"
#include "QuantizedDatagram.hpp"

namespace kmall {

namespace {

template <typename U> U checkedCount(size_t value, const char *what)
{
    if (value > std::numeric_limits<U>::max()) {
        std::stringstream msg;
        msg << what << " value " << value << " does not fit its " << (8 * sizeof(U)) << "-bit field";
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }
    return static_cast<U>(value);
}

/// Per-element byte count: known struct size plus the shared extra bytes
template <typename T> size_t elementSize(const std::vector<T> &elements, size_t known, const char *what)
{
    if (elements.empty()) {
        return known;
    }
    size_t extra = elements.front().extra.size();
    for (const auto &element : elements) {
        if (element.extra.size() != extra) {
            std::stringstream msg;
            msg << what << " elements carry differing extra byte counts (" << extra << " vs "
                << element.extra.size() << ")";
            throw KmallError(ErrorCode::MalformedHeader, msg.str());
        }
    }
    return known + extra;
}

/// Starts a block with a u16 size field; returns the field position
size_t beginBlock(ByteWriter &out)
{
    size_t pos = out.size();
    out.write<uint16_t>(0);
    return pos;
}

void endBlock(ByteWriter &out, size_t pos, const char *what)
{
    out.patchU16(pos, checkedCount<uint16_t>(out.size() - pos, what));
}

void writeSensorCommon(ByteWriter &out, const SensorCommon &cmn)
{
    size_t pos = beginBlock(out);
    out.write(cmn.sensorSystem);
    out.write(cmn.sensorStatus);
    out.write(cmn.padding);
    out.writeBytes(cmn.extra);
    endBlock(out, pos, "sensor common part");
}

Bytes encodeParameterText(const ParameterText &dg)
{
    ByteWriter out;
    detail::beginDatagram(out, dg.header);
    out.write(checkedCount<uint16_t>(I_PARAM_FIXED_SIZE + dg.text.size(), "parameter text length"));
    out.write(dg.info);
    out.write(dg.status);
    out.writeString(dg.text);
    out.writeBytes(dg.trailer);
    return detail::finishDatagram(out);
}

Bytes encodePositionData(const PositionData &dg)
{
    ByteWriter out;
    detail::beginDatagram(out, dg.header);
    writeSensorCommon(out, dg.cmnPart);
    out.write(dg.timeFromSensor_sec);
    out.write(dg.timeFromSensor_nanosec);
    out.write(dg.posFixQuality_m);
    out.write(dg.correctedLat_deg);
    out.write(dg.correctedLong_deg);
    out.write(dg.speedOverGround_mPerSec);
    out.write(dg.courseOverGround_deg);
    out.write(dg.ellipsoidHeightReRefPoint_m);
    out.writeString(dg.posDataFromSensor);
    return detail::finishDatagram(out);
}

Bytes encodeClock(const ClockDatagram &dg)
{
    ByteWriter out;
    detail::beginDatagram(out, dg.header);
    writeSensorCommon(out, dg.cmnPart);
    out.write(dg.offset_sec);
    out.write(dg.clockDevPU_nanosec);
    out.writeString(dg.dataFromSensor);
    return detail::finishDatagram(out);
}

Bytes encodeSensorDepth(const SensorDepthDatagram &dg)
{
    ByteWriter out;
    detail::beginDatagram(out, dg.header);
    writeSensorCommon(out, dg.cmnPart);
    out.write(dg.depthUsed_m);
    out.write(dg.offset);
    out.write(dg.scale);
    out.write(dg.latitude_deg);
    out.write(dg.longitude_deg);
    out.writeString(dg.dataFromSensor);
    return detail::finishDatagram(out);
}

Bytes encodeHeight(const HeightDatagram &dg)
{
    ByteWriter out;
    detail::beginDatagram(out, dg.header);
    writeSensorCommon(out, dg.cmnPart);
    out.write(dg.sensorType);
    out.write(dg.padding);
    out.write(dg.heightUsed_m);
    out.writeString(dg.dataFromSensor);
    return detail::finishDatagram(out);
}

void writeKmBinary(ByteWriter &out, const KmBinary &kmb)
{
    out.writeString(kmb.dgmType, DATAGRAM_TAG_LENGTH);
    out.write(kmb.numBytesDgm);
    out.write(kmb.dgmVersion);
    out.write(kmb.time_sec);
    out.write(kmb.time_nanosec);
    out.write(kmb.status);
    out.write(kmb.latitude_deg);
    out.write(kmb.longitude_deg);
    out.write(kmb.ellipsoidHeight_m);
    out.write(kmb.roll_deg);
    out.write(kmb.pitch_deg);
    out.write(kmb.heading_deg);
    out.write(kmb.heave_m);
    out.write(kmb.rollRate);
    out.write(kmb.pitchRate);
    out.write(kmb.yawRate);
    out.write(kmb.velNorth);
    out.write(kmb.velEast);
    out.write(kmb.velDown);
    out.write(kmb.latitudeError_m);
    out.write(kmb.longitudeError_m);
    out.write(kmb.ellipsoidHeightError_m);
    out.write(kmb.rollError_deg);
    out.write(kmb.pitchError_deg);
    out.write(kmb.headingError_deg);
    out.write(kmb.heaveError_m);
    out.write(kmb.northAcceleration);
    out.write(kmb.eastAcceleration);
    out.write(kmb.downAcceleration);
}

Bytes encodeAttitude(const AttitudeDatagram &dg)
{
    ByteWriter out;
    detail::beginDatagram(out, dg.header);

    size_t sampleSize = elementSize(dg.samples, SKM_KM_BINARY_SIZE + SKM_DELAYED_HEAVE_SIZE, "#SKM sample");
    size_t pos = beginBlock(out);
    out.write(dg.info.sensorSystem);
    out.write(dg.info.sensorStatus);
    out.write(dg.info.sensorInputFormat);
    out.write(checkedCount<uint16_t>(dg.samples.size(), "#SKM sample count"));
    out.write(checkedCount<uint16_t>(sampleSize, "#SKM sample size"));
    out.write(dg.info.sensorDataContents);
    out.writeBytes(dg.info.extra);
    endBlock(out, pos, "#SKM info");

    for (const auto &sample : dg.samples) {
        writeKmBinary(out, sample.kmBinary);
        out.write(sample.delayedHeave.time_sec);
        out.write(sample.delayedHeave.time_nanosec);
        out.write(sample.delayedHeave.delayedHeave_m);
        out.writeBytes(sample.extra);
    }
    out.writeBytes(dg.trailer);
    return detail::finishDatagram(out);
}

Bytes encodeSoundVelocityProfile(const SoundVelocityProfile &dg)
{
    ByteWriter out;
    detail::beginDatagram(out, dg.header);

    size_t pos = beginBlock(out);
    out.write(checkedCount<uint16_t>(dg.points.size(), "#SVP sample count"));
    out.writeString(dg.sensorFormat, DATAGRAM_TAG_LENGTH);
    out.write(dg.time_sec);
    out.write(dg.latitude_deg);
    out.write(dg.longitude_deg);
    out.writeBytes(dg.commonExtra);
    endBlock(out, pos, "#SVP common part");

    for (const auto &point : dg.points) {
        out.write(point.depth_m);
        out.write(point.soundVelocity_mPerSec);
        out.write(point.padding);
        out.write(point.temp_C);
        out.write(point.salinity);
    }
    out.writeBytes(dg.trailer);
    return detail::finishDatagram(out);
}

Bytes encodeSoundVelocityTransducer(const SoundVelocityTransducer &dg)
{
    ByteWriter out;
    detail::beginDatagram(out, dg.header);

    size_t sampleSize = elementSize(dg.samples, SVT_SAMPLE_SIZE, "#SVT sample");
    size_t pos = beginBlock(out);
    out.write(dg.info.sensorStatus);
    out.write(dg.info.sensorInputFormat);
    out.write(checkedCount<uint16_t>(dg.samples.size(), "#SVT sample count"));
    out.write(checkedCount<uint16_t>(sampleSize, "#SVT sample size"));
    out.write(dg.info.sensorDataContents);
    out.write(dg.info.filterTime_sec);
    out.write(dg.info.soundVelocity_mPerSec_offset);
    out.writeBytes(dg.info.extra);
    endBlock(out, pos, "#SVT info");

    for (const auto &sample : dg.samples) {
        out.write(sample.time_sec);
        out.write(sample.time_nanosec);
        out.write(sample.soundVelocity_mPerSec);
        out.write(sample.temp_C);
        out.write(sample.pressure_Pa);
        out.write(sample.salinity);
        out.writeBytes(sample.extra);
    }
    out.writeBytes(dg.trailer);
    return detail::finishDatagram(out);
}

Bytes encodeOpaque(const OpaqueDatagram &dg)
{
    ByteWriter out;
    detail::beginDatagram(out, dg.header);
    out.writeBytes(dg.body);
    return detail::finishDatagram(out);
}

} // namespace

// ============================================================================
// Framing
// ============================================================================

namespace detail {

void beginDatagram(ByteWriter &out, const DatagramHeader &header)
{
    if (header.dgmType.size() != DATAGRAM_TAG_LENGTH || header.dgmType[0] != DATAGRAM_TAG_MARKER) {
        throw KmallError(ErrorCode::MalformedHeader, "cannot encode datagram tag '" + header.dgmType + "'");
    }
    out.write<uint32_t>(0);
    out.writeString(header.dgmType, DATAGRAM_TAG_LENGTH);
    out.write(header.dgmVersion);
    out.write(header.systemID);
    out.write(header.echoSounderID);
    out.write(header.time_sec);
    out.write(header.time_nanosec);
}

Bytes finishDatagram(ByteWriter &out)
{
    size_t total = out.size() + LENGTH_FIELD_SIZE;
    if (total > MAX_DATAGRAM_SIZE) {
        std::stringstream msg;
        msg << "encoded datagram of " << total << " bytes exceeds the limit of " << MAX_DATAGRAM_SIZE;
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }
    out.write(static_cast<uint32_t>(total));
    out.patchU32(0, static_cast<uint32_t>(total));
    return out.release();
}

void writeMultibeamPrefix(ByteWriter &out, const MultibeamPartition &partition, const MultibeamCommon &cmnPart)
{
    out.write(partition.numOfDgms);
    out.write(partition.dgmNum);
    writeMultibeamBody(out, cmnPart);
}

void writeMultibeamBody(ByteWriter &out, const MultibeamCommon &cmnPart)
{
    size_t pos = beginBlock(out);
    out.write(cmnPart.pingCnt);
    out.write(cmnPart.rxFansPerPing);
    out.write(cmnPart.rxFanIndex);
    out.write(cmnPart.swathsPerPing);
    out.write(cmnPart.swathAlongPosition);
    out.write(cmnPart.txTransducerInd);
    out.write(cmnPart.rxTransducerInd);
    out.write(cmnPart.numRxTransducers);
    out.write(cmnPart.algorithmType);
    out.writeBytes(cmnPart.extra);
    endBlock(out, pos, "multibeam common part");
}

Bytes encodeCompatibilityHeave(const CompatibilityHeaveDatagram &dg)
{
    ByteWriter out;
    beginDatagram(out, dg.header);
    writeMultibeamBody(out, dg.cmnPart);
    out.write(dg.heave_m);
    out.writeBytes(dg.trailer);
    return finishDatagram(out);
}

// ============================================================================
// #MRZ
// ============================================================================

Bytes encodeDepth(const DepthDatagram &dg)
{
    size_t numSoundings = static_cast<size_t>(dg.rxInfo.numSoundingsMaxMain) + dg.rxInfo.numExtraDetections;
    if (numSoundings != dg.soundings.size()) {
        std::stringstream msg;
        msg << "#MRZ rx info declares " << numSoundings << " soundings but " << dg.soundings.size()
            << " are present";
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }
    size_t numSeabedSamples = dg.seabedImageOffsets().back();
    if (numSeabedSamples != dg.SIsample_desidB.size()) {
        std::stringstream msg;
        msg << "#MRZ soundings declare " << numSeabedSamples << " seabed image samples but "
            << dg.SIsample_desidB.size() << " are present";
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }

    ByteWriter out;
    beginDatagram(out, dg.header);
    writeMultibeamPrefix(out, dg.partition, dg.cmnPart);

    const MrzPingInfo &info = dg.pingInfo;
    size_t txSectorSize = elementSize(dg.txSectors, MRZ_TX_SECTOR_INFO_SIZE, "#MRZ tx sector");
    size_t pos = beginBlock(out);
    out.write(info.padding0);
    out.write(info.pingRate_Hz);
    out.write(info.beamSpacing);
    out.write(info.depthMode);
    out.write(info.subDepthMode);
    out.write(info.distanceBtwSwath);
    out.write(info.detectionMode);
    out.write(info.pulseForm);
    out.write(info.padding1);
    out.write(info.frequencyMode_Hz);
    out.write(info.freqRangeLowLim_Hz);
    out.write(info.freqRangeHighLim_Hz);
    out.write(info.maxTotalTxPulseLength_sec);
    out.write(info.maxEffTxPulseLength_sec);
    out.write(info.maxEffTxBandWidth_Hz);
    out.write(info.absCoeff_dBPerkm);
    out.write(info.portSectorEdge_deg);
    out.write(info.starbSectorEdge_deg);
    out.write(info.portMeanCov_deg);
    out.write(info.starbMeanCov_deg);
    out.write(info.portMeanCov_m);
    out.write(info.starbMeanCov_m);
    out.write(info.modeAndStabilisation);
    out.write(info.runtimeFilter1);
    out.write(info.runtimeFilter2);
    out.write(info.pipeTrackingStatus);
    out.write(info.transmitArraySizeUsed_deg);
    out.write(info.receiveArraySizeUsed_deg);
    out.write(info.transmitPower_dB);
    out.write(info.SLrampUpTimeRemaining);
    out.write(info.padding2);
    out.write(info.yawAngle_deg);
    out.write(checkedCount<uint16_t>(dg.txSectors.size(), "#MRZ tx sector count"));
    out.write(checkedCount<uint16_t>(txSectorSize, "#MRZ tx sector size"));
    out.write(info.headingVessel_deg);
    out.write(info.soundSpeedAtTxDepth_mPerSec);
    out.write(info.txTransducerDepth_m);
    out.write(info.z_waterLevelReRefPoint_m);
    out.write(info.x_kmallToall_m);
    out.write(info.y_kmallToall_m);
    out.write(info.latLongInfo);
    out.write(info.posSensorStatus);
    out.write(info.attitudeSensorStatus);
    out.write(info.padding3);
    out.write(info.latitude_deg);
    out.write(info.longitude_deg);
    out.write(info.ellipsoidHeightReRefPoint_m);
    out.writeBytes(info.extra);
    endBlock(out, pos, "#MRZ ping info");

    for (const auto &tx : dg.txSectors) {
        out.write(tx.txSectorNumb);
        out.write(tx.txArrNumber);
        out.write(tx.txSubArray);
        out.write(tx.padding0);
        out.write(tx.sectorTransmitDelay_sec);
        out.write(tx.tiltAngleReTx_deg);
        out.write(tx.txNominalSourceLevel_dB);
        out.write(tx.txFocusRange_m);
        out.write(tx.centreFreq_Hz);
        out.write(tx.signalBandWidth_Hz);
        out.write(tx.totalSignalLength_sec);
        out.write(tx.pulseShading);
        out.write(tx.signalWaveForm);
        out.write(tx.padding1);
        out.writeBytes(tx.extra);
    }

    size_t soundingSize = elementSize(dg.soundings, MRZ_SOUNDING_SIZE, "#MRZ sounding");
    size_t classSize = elementSize(dg.extraDetClasses, MRZ_EXTRA_DET_CLASS_INFO_SIZE, "#MRZ extra detection class");
    pos = beginBlock(out);
    out.write(dg.rxInfo.numSoundingsMaxMain);
    out.write(dg.rxInfo.numSoundingsValidMain);
    out.write(checkedCount<uint16_t>(soundingSize, "#MRZ sounding size"));
    out.write(dg.rxInfo.WCSampleRate);
    out.write(dg.rxInfo.seabedImageSampleRate);
    out.write(dg.rxInfo.BSnormal_dB);
    out.write(dg.rxInfo.BSoblique_dB);
    out.write(dg.rxInfo.extraDetectionAlarmFlag);
    out.write(dg.rxInfo.numExtraDetections);
    out.write(checkedCount<uint16_t>(dg.extraDetClasses.size(), "#MRZ extra detection class count"));
    out.write(checkedCount<uint16_t>(classSize, "#MRZ extra detection class size"));
    out.writeBytes(dg.rxInfo.extra);
    endBlock(out, pos, "#MRZ rx info");

    for (const auto &cls : dg.extraDetClasses) {
        out.write(cls.numExtraDetInClass);
        out.write(cls.padding);
        out.write(cls.alarmFlag);
        out.writeBytes(cls.extra);
    }

    for (const auto &s : dg.soundings) {
        out.write(s.soundingIndex);
        out.write(s.txSectorNumb);
        out.write(s.detectionType);
        out.write(s.detectionMethod);
        out.write(s.rejectionInfo1);
        out.write(s.rejectionInfo2);
        out.write(s.postProcessingInfo);
        out.write(s.detectionClass);
        out.write(s.detectionConfidenceLevel);
        out.write(s.padding);
        out.write(s.rangeFactor);
        out.write(s.qualityFactor);
        out.write(s.detectionUncertaintyVer_m);
        out.write(s.detectionUncertaintyHor_m);
        out.write(s.detectionWindowLength_sec);
        out.write(s.echoLength_sec);
        out.write(s.WCBeamNumb);
        out.write(s.WCrange_samples);
        out.write(s.WCNomBeamAngleAcross_deg);
        out.write(s.meanAbsCoeff_dBPerkm);
        out.write(s.reflectivity1_dB);
        out.write(s.reflectivity2_dB);
        out.write(s.receiverSensitivityApplied_dB);
        out.write(s.sourceLevelApplied_dB);
        out.write(s.BScalibration_dB);
        out.write(s.TVG_dB);
        out.write(s.beamAngleReRx_deg);
        out.write(s.beamAngleCorrection_deg);
        out.write(s.twoWayTravelTime_sec);
        out.write(s.twoWayTravelTimeCorrection_sec);
        out.write(s.deltaLatitude_deg);
        out.write(s.deltaLongitude_deg);
        out.write(s.z_reRefPoint_m);
        out.write(s.y_reRefPoint_m);
        out.write(s.x_reRefPoint_m);
        out.write(s.beamIncAngleAdj_deg);
        out.write(s.realTimeCleanInfo);
        out.write(s.SIstartRange_samples);
        out.write(s.SIcentreSample);
        out.write(s.SInumSamples);
        out.writeBytes(s.extra);
    }

    for (auto sample : dg.SIsample_desidB) {
        out.write(sample);
    }
    out.writeBytes(dg.trailer);
    return finishDatagram(out);
}

// ============================================================================
// #MWC
// ============================================================================

Bytes encodeWaterColumn(const WaterColumnDatagram &dg)
{
    if (dg.rxInfo.phaseFlag > MWC_PHASE_HIGH_RES) {
        std::stringstream msg;
        msg << "#MWC phase flag " << static_cast<int>(dg.rxInfo.phaseFlag) << " is not 0, 1 or 2";
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }

    ByteWriter out;
    beginDatagram(out, dg.header);
    writeMultibeamPrefix(out, dg.partition, dg.cmnPart);

    size_t txSectorSize = elementSize(dg.txSectors, MWC_TX_SECTOR_DATA_SIZE, "#MWC tx sector");
    size_t pos = beginBlock(out);
    out.write(checkedCount<uint16_t>(dg.txSectors.size(), "#MWC tx sector count"));
    out.write(checkedCount<uint16_t>(txSectorSize, "#MWC tx sector size"));
    out.write(dg.txInfo.padding);
    out.write(dg.txInfo.heave_m);
    out.writeBytes(dg.txInfo.extra);
    endBlock(out, pos, "#MWC tx info");

    for (const auto &sector : dg.txSectors) {
        out.write(sector.tiltAngleReTx_deg);
        out.write(sector.centreFreq_Hz);
        out.write(sector.txBeamWidthAlong_deg);
        out.write(sector.txSectorNum);
        out.write(sector.padding);
        out.writeBytes(sector.extra);
    }

    size_t beamSize = elementSize(dg.beams, MWC_RX_BEAM_DATA_SIZE, "#MWC beam");
    pos = beginBlock(out);
    out.write(checkedCount<uint16_t>(dg.beams.size(), "#MWC beam count"));
    out.write(checkedCount<uint8_t>(beamSize, "#MWC beam entry size"));
    out.write(dg.rxInfo.phaseFlag);
    out.write(dg.rxInfo.TVGfunctionApplied);
    out.write(dg.rxInfo.TVGoffset_dB);
    out.write(dg.rxInfo.sampleFreq_Hz);
    out.write(dg.rxInfo.soundVelocity_mPerSec);
    out.writeBytes(dg.rxInfo.extra);
    endBlock(out, pos, "#MWC rx info");

    for (const auto &beam : dg.beams) {
        size_t numSamples = beam.sampleAmplitude05dB.size();
        size_t numPhase = dg.rxInfo.phaseFlag == MWC_PHASE_LOW_RES    ? beam.rxBeamPhase8.size()
                          : dg.rxInfo.phaseFlag == MWC_PHASE_HIGH_RES ? beam.rxBeamPhase16.size()
                                                                      : numSamples;
        if (numPhase != numSamples) {
            std::stringstream msg;
            msg << "#MWC beam has " << numSamples << " amplitude samples but " << numPhase << " phase samples";
            throw KmallError(ErrorCode::MalformedHeader, msg.str());
        }

        out.write(beam.beamPointAngReVertical_deg);
        out.write(beam.startRangeSampleNum);
        out.write(beam.detectedRangeInSamples);
        out.write(beam.beamTxSectorNum);
        out.write(checkedCount<uint16_t>(numSamples, "#MWC beam sample count"));
        out.writeBytes(beam.extra);
        for (auto amplitude : beam.sampleAmplitude05dB) {
            out.write(amplitude);
        }
        if (dg.rxInfo.phaseFlag == MWC_PHASE_LOW_RES) {
            for (auto phase : beam.rxBeamPhase8) {
                out.write(phase);
            }
        } else if (dg.rxInfo.phaseFlag == MWC_PHASE_HIGH_RES) {
            for (auto phase : beam.rxBeamPhase16) {
                out.write(phase);
            }
        }
    }
    out.writeBytes(dg.trailer);
    return finishDatagram(out);
}

} // namespace detail

// ============================================================================
// Dispatch
// ============================================================================

namespace {

struct EncodeVisitor {
    Bytes operator()(const OpaqueDatagram &dg) const { return encodeOpaque(dg); }
    Bytes operator()(const InstallationParameters &dg) const { return encodeParameterText(dg); }
    Bytes operator()(const RuntimeParameters &dg) const { return encodeParameterText(dg); }
    Bytes operator()(const SoundVelocityProfile &dg) const { return encodeSoundVelocityProfile(dg); }
    Bytes operator()(const SoundVelocityTransducer &dg) const { return encodeSoundVelocityTransducer(dg); }
    Bytes operator()(const AttitudeDatagram &dg) const { return encodeAttitude(dg); }
    Bytes operator()(const PositionDatagram &dg) const { return encodePositionData(dg); }
    Bytes operator()(const CompatibilityPosition &dg) const { return encodePositionData(dg); }
    Bytes operator()(const ClockDatagram &dg) const { return encodeClock(dg); }
    Bytes operator()(const SensorDepthDatagram &dg) const { return encodeSensorDepth(dg); }
    Bytes operator()(const HeightDatagram &dg) const { return encodeHeight(dg); }
    Bytes operator()(const CompatibilityHeaveDatagram &dg) const { return detail::encodeCompatibilityHeave(dg); }
    Bytes operator()(const DepthDatagram &dg) const { return detail::encodeDepth(dg); }
    Bytes operator()(const WaterColumnDatagram &dg) const { return detail::encodeWaterColumn(dg); }
    Bytes operator()(const CompressedDatagram &dg) const { return encodeQuantized(dg); }
};

} // namespace

Bytes encode(const Datagram &datagram) { return std::visit(EncodeVisitor{}, datagram); }

} // namespace kmall
