/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Body decoders for every datagram kind with a schema.
 */

#include <iostream>
#include <sstream>

#include "DatagramDecoder.hpp"
#include "KmallError.hpp"
#include "ProtocolConstants.hpp"
#include "TypeTable.hpp"

namespace kmall {

namespace {

uint32_t readTrailingLength(const uint8_t *data, uint32_t numBytesDgm)
{
    ByteReader tail(data + numBytesDgm - LENGTH_FIELD_SIZE, LENGTH_FIELD_SIZE, numBytesDgm - LENGTH_FIELD_SIZE);
    return tail.read<uint32_t>();
}

/// Checks a per-element byte count against the known element size
void requireElementSize(size_t declared, size_t known, size_t count, const char *what, size_t offset)
{
    if (count > 0 && declared < known) {
        std::stringstream msg;
        msg << what << " declares " << declared << " bytes per element, less than the " << known
            << " known bytes, at offset " << offset;
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }
}

void readSensorCommon(ByteReader &in, SensorCommon &cmn)
{
    auto declared = in.read<uint16_t>();
    ByteReader block = detail::openBlock(in, declared, S_COMMON_SIZE, 2, "sensor common part");
    cmn.sensorSystem = block.read<uint16_t>();
    cmn.sensorStatus = block.read<uint16_t>();
    cmn.padding = block.read<uint16_t>();
    cmn.extra = block.readBytes(block.remaining());
}

template <typename T> T decodeParameterText(ByteReader &body, const DatagramHeader &header)
{
    T dg;
    dg.header = header;
    auto numBytesCmnPart = body.read<uint16_t>();
    if (numBytesCmnPart < I_PARAM_FIXED_SIZE) {
        std::stringstream msg;
        msg << header.dgmType << " common part of " << numBytesCmnPart << " bytes is smaller than "
            << I_PARAM_FIXED_SIZE;
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }
    dg.info = body.read<uint16_t>();
    dg.status = body.read<uint16_t>();
    dg.text = body.readString(numBytesCmnPart - I_PARAM_FIXED_SIZE);
    dg.trailer = body.readBytes(body.remaining());
    return dg;
}

template <typename T> T decodePositionData(ByteReader &body, const DatagramHeader &header)
{
    T dg;
    dg.header = header;
    readSensorCommon(body, dg.cmnPart);
    dg.timeFromSensor_sec = body.read<uint32_t>();
    dg.timeFromSensor_nanosec = body.read<uint32_t>();
    dg.posFixQuality_m = body.read<float>();
    dg.correctedLat_deg = body.read<double>();
    dg.correctedLong_deg = body.read<double>();
    dg.speedOverGround_mPerSec = body.read<float>();
    dg.courseOverGround_deg = body.read<float>();
    dg.ellipsoidHeightReRefPoint_m = body.read<float>();
    dg.posDataFromSensor = body.readString(body.remaining());
    return dg;
}

void readKmBinary(ByteReader &in, KmBinary &kmb)
{
    kmb.dgmType = in.readString(DATAGRAM_TAG_LENGTH);
    kmb.numBytesDgm = in.read<uint16_t>();
    kmb.dgmVersion = in.read<uint16_t>();
    kmb.time_sec = in.read<uint32_t>();
    kmb.time_nanosec = in.read<uint32_t>();
    kmb.status = in.read<uint32_t>();
    kmb.latitude_deg = in.read<double>();
    kmb.longitude_deg = in.read<double>();
    kmb.ellipsoidHeight_m = in.read<float>();
    kmb.roll_deg = in.read<float>();
    kmb.pitch_deg = in.read<float>();
    kmb.heading_deg = in.read<float>();
    kmb.heave_m = in.read<float>();
    kmb.rollRate = in.read<float>();
    kmb.pitchRate = in.read<float>();
    kmb.yawRate = in.read<float>();
    kmb.velNorth = in.read<float>();
    kmb.velEast = in.read<float>();
    kmb.velDown = in.read<float>();
    kmb.latitudeError_m = in.read<float>();
    kmb.longitudeError_m = in.read<float>();
    kmb.ellipsoidHeightError_m = in.read<float>();
    kmb.rollError_deg = in.read<float>();
    kmb.pitchError_deg = in.read<float>();
    kmb.headingError_deg = in.read<float>();
    kmb.heaveError_m = in.read<float>();
    kmb.northAcceleration = in.read<float>();
    kmb.eastAcceleration = in.read<float>();
    kmb.downAcceleration = in.read<float>();
}

void readPingInfo(ByteReader &in, MrzPingInfo &info, uint16_t &numTxSectors, uint16_t &numBytesPerTxSector)
{
    auto declared = in.read<uint16_t>();
    ByteReader block = detail::openBlock(in, declared, MRZ_PING_INFO_SIZE, 2, "#MRZ ping info");
    info.padding0 = block.read<uint16_t>();
    info.pingRate_Hz = block.read<float>();
    info.beamSpacing = block.read<uint8_t>();
    info.depthMode = block.read<uint8_t>();
    info.subDepthMode = block.read<uint8_t>();
    info.distanceBtwSwath = block.read<uint8_t>();
    info.detectionMode = block.read<uint8_t>();
    info.pulseForm = block.read<uint8_t>();
    info.padding1 = block.read<uint16_t>();
    info.frequencyMode_Hz = block.read<float>();
    info.freqRangeLowLim_Hz = block.read<float>();
    info.freqRangeHighLim_Hz = block.read<float>();
    info.maxTotalTxPulseLength_sec = block.read<float>();
    info.maxEffTxPulseLength_sec = block.read<float>();
    info.maxEffTxBandWidth_Hz = block.read<float>();
    info.absCoeff_dBPerkm = block.read<float>();
    info.portSectorEdge_deg = block.read<float>();
    info.starbSectorEdge_deg = block.read<float>();
    info.portMeanCov_deg = block.read<float>();
    info.starbMeanCov_deg = block.read<float>();
    info.portMeanCov_m = block.read<int16_t>();
    info.starbMeanCov_m = block.read<int16_t>();
    info.modeAndStabilisation = block.read<uint8_t>();
    info.runtimeFilter1 = block.read<uint8_t>();
    info.runtimeFilter2 = block.read<uint16_t>();
    info.pipeTrackingStatus = block.read<uint32_t>();
    info.transmitArraySizeUsed_deg = block.read<float>();
    info.receiveArraySizeUsed_deg = block.read<float>();
    info.transmitPower_dB = block.read<float>();
    info.SLrampUpTimeRemaining = block.read<uint16_t>();
    info.padding2 = block.read<uint16_t>();
    info.yawAngle_deg = block.read<float>();
    numTxSectors = block.read<uint16_t>();
    numBytesPerTxSector = block.read<uint16_t>();
    info.headingVessel_deg = block.read<float>();
    info.soundSpeedAtTxDepth_mPerSec = block.read<float>();
    info.txTransducerDepth_m = block.read<float>();
    info.z_waterLevelReRefPoint_m = block.read<float>();
    info.x_kmallToall_m = block.read<float>();
    info.y_kmallToall_m = block.read<float>();
    info.latLongInfo = block.read<uint8_t>();
    info.posSensorStatus = block.read<uint8_t>();
    info.attitudeSensorStatus = block.read<uint8_t>();
    info.padding3 = block.read<uint8_t>();
    info.latitude_deg = block.read<double>();
    info.longitude_deg = block.read<double>();
    info.ellipsoidHeightReRefPoint_m = block.read<float>();
    info.extra = block.readBytes(block.remaining());
}

void readTxSector(ByteReader &in, MrzTxSector &tx)
{
    tx.txSectorNumb = in.read<uint8_t>();
    tx.txArrNumber = in.read<uint8_t>();
    tx.txSubArray = in.read<uint8_t>();
    tx.padding0 = in.read<uint8_t>();
    tx.sectorTransmitDelay_sec = in.read<float>();
    tx.tiltAngleReTx_deg = in.read<float>();
    tx.txNominalSourceLevel_dB = in.read<float>();
    tx.txFocusRange_m = in.read<float>();
    tx.centreFreq_Hz = in.read<float>();
    tx.signalBandWidth_Hz = in.read<float>();
    tx.totalSignalLength_sec = in.read<float>();
    tx.pulseShading = in.read<uint8_t>();
    tx.signalWaveForm = in.read<uint8_t>();
    tx.padding1 = in.read<uint16_t>();
    tx.extra = in.readBytes(in.remaining());
}

void readSounding(ByteReader &in, MrzSounding &s)
{
    s.soundingIndex = in.read<uint16_t>();
    s.txSectorNumb = in.read<uint8_t>();
    s.detectionType = in.read<uint8_t>();
    s.detectionMethod = in.read<uint8_t>();
    s.rejectionInfo1 = in.read<uint8_t>();
    s.rejectionInfo2 = in.read<uint8_t>();
    s.postProcessingInfo = in.read<uint8_t>();
    s.detectionClass = in.read<uint8_t>();
    s.detectionConfidenceLevel = in.read<uint8_t>();
    s.padding = in.read<uint16_t>();
    s.rangeFactor = in.read<float>();
    s.qualityFactor = in.read<float>();
    s.detectionUncertaintyVer_m = in.read<float>();
    s.detectionUncertaintyHor_m = in.read<float>();
    s.detectionWindowLength_sec = in.read<float>();
    s.echoLength_sec = in.read<float>();
    s.WCBeamNumb = in.read<uint16_t>();
    s.WCrange_samples = in.read<uint16_t>();
    s.WCNomBeamAngleAcross_deg = in.read<float>();
    s.meanAbsCoeff_dBPerkm = in.read<float>();
    s.reflectivity1_dB = in.read<float>();
    s.reflectivity2_dB = in.read<float>();
    s.receiverSensitivityApplied_dB = in.read<float>();
    s.sourceLevelApplied_dB = in.read<float>();
    s.BScalibration_dB = in.read<float>();
    s.TVG_dB = in.read<float>();
    s.beamAngleReRx_deg = in.read<float>();
    s.beamAngleCorrection_deg = in.read<float>();
    s.twoWayTravelTime_sec = in.read<float>();
    s.twoWayTravelTimeCorrection_sec = in.read<float>();
    s.deltaLatitude_deg = in.read<float>();
    s.deltaLongitude_deg = in.read<float>();
    s.z_reRefPoint_m = in.read<float>();
    s.y_reRefPoint_m = in.read<float>();
    s.x_reRefPoint_m = in.read<float>();
    s.beamIncAngleAdj_deg = in.read<float>();
    s.realTimeCleanInfo = in.read<uint16_t>();
    s.SIstartRange_samples = in.read<uint16_t>();
    s.SIcentreSample = in.read<uint16_t>();
    s.SInumSamples = in.read<uint16_t>();
    s.extra = in.readBytes(in.remaining());
}

} // namespace

// ============================================================================
// Header-level decoding
// ============================================================================

DatagramHeader decodeHeader(const uint8_t *data, size_t size)
{
    if (size < MIN_DATAGRAM_SIZE) {
        std::stringstream msg;
        msg << "buffer of " << size << " bytes is shorter than the minimum datagram of " << MIN_DATAGRAM_SIZE;
        throw KmallError(ErrorCode::TruncatedRecord, msg.str());
    }

    ByteReader in(data, DATAGRAM_HEADER_SIZE);
    DatagramHeader header;
    header.numBytesDgm = in.read<uint32_t>();
    header.dgmType = in.readString(DATAGRAM_TAG_LENGTH);
    header.dgmVersion = in.read<uint8_t>();
    header.systemID = in.read<uint8_t>();
    header.echoSounderID = in.read<uint16_t>();
    header.time_sec = in.read<uint32_t>();
    header.time_nanosec = in.read<uint32_t>();

    if (header.dgmType[0] != DATAGRAM_TAG_MARKER) {
        std::stringstream msg;
        msg << "datagram tag does not start with '" << DATAGRAM_TAG_MARKER << "'";
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }
    if (header.numBytesDgm < MIN_DATAGRAM_SIZE) {
        std::stringstream msg;
        msg << header.dgmType << " declares " << header.numBytesDgm << " bytes, less than the minimum of "
            << MIN_DATAGRAM_SIZE;
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }
    if (header.numBytesDgm > size) {
        std::stringstream msg;
        msg << header.dgmType << " declares " << header.numBytesDgm << " bytes but only " << size
            << " are available";
        throw KmallError(ErrorCode::TruncatedRecord, msg.str());
    }
    return header;
}

DatagramHeader decodeHeader(const Bytes &buffer) { return decodeHeader(buffer.data(), buffer.size()); }

namespace {

/// Header plus the length check; returns a reader over the body
ByteReader frameBody(const Bytes &buffer, const std::string &declaredTag, DatagramHeader &header)
{
    header = decodeHeader(buffer);
    if (!declaredTag.empty() && header.dgmType != declaredTag) {
        std::stringstream msg;
        msg << "expected " << declaredTag << " datagram but buffer holds " << header.dgmType;
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }
    uint32_t trailing = readTrailingLength(buffer.data(), header.numBytesDgm);
    if (trailing != header.numBytesDgm) {
        std::stringstream msg;
        msg << header.dgmType << " leading length " << header.numBytesDgm << " does not match trailing length "
            << trailing;
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }
    return ByteReader(buffer.data() + DATAGRAM_HEADER_SIZE,
                      header.numBytesDgm - DATAGRAM_HEADER_SIZE - LENGTH_FIELD_SIZE, DATAGRAM_HEADER_SIZE);
}

} // namespace

MultibeamPrefix decodeMultibeamCommon(const Bytes &buffer)
{
    MultibeamPrefix prefix;
    ByteReader body = frameBody(buffer, std::string(), prefix.header);

    const std::string &tag = prefix.header.dgmType;
    if (tag == TAG_QUANTIZED_LEVEL0 || tag == TAG_QUANTIZED_LEVEL1) {
        body.skip(QUANTIZED_PREAMBLE_SIZE - DATAGRAM_TAG_LENGTH);
        prefix.originalTag = body.readString(DATAGRAM_TAG_LENGTH);
    } else if (tag == TAG_RANGE_AND_DEPTH || tag == TAG_WATER_COLUMN) {
        prefix.originalTag = tag;
    } else {
        throw KmallError(ErrorCode::MalformedHeader, tag + " is not a multibeam datagram");
    }
    detail::readMultibeamPrefix(body, prefix.partition, prefix.cmnPart);
    return prefix;
}

Datagram decode(const Bytes &buffer, const std::string &declaredTag)
{
    DatagramHeader header;
    ByteReader body = frameBody(buffer, declaredTag, header);

    const DatagramType *type = findType(header.dgmType);
    if (type == nullptr || !type->hasSchema) {
#ifdef DEBUG_DECODE
        std::cout << "opaque decode of " << header.dgmType << " (" << header.numBytesDgm << " bytes)\n";
#endif
        OpaqueDatagram dg;
        dg.header = header;
        dg.body = body.readBytes(body.remaining());
        return dg;
    }

#ifdef DEBUG_DECODE
    std::cout << "decoding " << header.dgmType << " (" << header.numBytesDgm << " bytes)\n";
#endif
    return type->decode(body, header);
}

// ============================================================================
// Body decoders
// ============================================================================

namespace detail {

ByteReader openBlock(ByteReader &in, size_t declared, size_t known, size_t fieldWidth, const char *what)
{
    if (declared < known) {
        std::stringstream msg;
        msg << what << " declares " << declared << " bytes, less than the " << known << " known bytes, at offset "
            << (in.origin() + in.position() - fieldWidth);
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }
    return in.subReader(declared - fieldWidth);
}

void readMultibeamPrefix(ByteReader &in, MultibeamPartition &partition, MultibeamCommon &cmnPart)
{
    partition.numOfDgms = in.read<uint16_t>();
    partition.dgmNum = in.read<uint16_t>();
    readMultibeamBody(in, cmnPart);
}

void readMultibeamBody(ByteReader &in, MultibeamCommon &cmnPart)
{
    auto declared = in.read<uint16_t>();
    ByteReader block = openBlock(in, declared, M_BODY_SIZE, 2, "multibeam common part");
    cmnPart.pingCnt = block.read<uint16_t>();
    cmnPart.rxFansPerPing = block.read<uint8_t>();
    cmnPart.rxFanIndex = block.read<uint8_t>();
    cmnPart.swathsPerPing = block.read<uint8_t>();
    cmnPart.swathAlongPosition = block.read<uint8_t>();
    cmnPart.txTransducerInd = block.read<uint8_t>();
    cmnPart.rxTransducerInd = block.read<uint8_t>();
    cmnPart.numRxTransducers = block.read<uint8_t>();
    cmnPart.algorithmType = block.read<uint8_t>();
    cmnPart.extra = block.readBytes(block.remaining());
}

Datagram decodeInstallationParameters(ByteReader &body, const DatagramHeader &header)
{
    return decodeParameterText<InstallationParameters>(body, header);
}

Datagram decodeRuntimeParameters(ByteReader &body, const DatagramHeader &header)
{
    return decodeParameterText<RuntimeParameters>(body, header);
}

Datagram decodePosition(ByteReader &body, const DatagramHeader &header)
{
    return decodePositionData<PositionDatagram>(body, header);
}

Datagram decodeCompatibilityPosition(ByteReader &body, const DatagramHeader &header)
{
    return decodePositionData<CompatibilityPosition>(body, header);
}

Datagram decodeClock(ByteReader &body, const DatagramHeader &header)
{
    ClockDatagram dg;
    dg.header = header;
    readSensorCommon(body, dg.cmnPart);
    dg.offset_sec = body.read<float>();
    dg.clockDevPU_nanosec = body.read<int32_t>();
    dg.dataFromSensor = body.readString(body.remaining());
    return dg;
}

Datagram decodeSensorDepth(ByteReader &body, const DatagramHeader &header)
{
    SensorDepthDatagram dg;
    dg.header = header;
    readSensorCommon(body, dg.cmnPart);
    dg.depthUsed_m = body.read<float>();
    dg.offset = body.read<float>();
    dg.scale = body.read<float>();
    dg.latitude_deg = body.read<double>();
    dg.longitude_deg = body.read<double>();
    dg.dataFromSensor = body.readString(body.remaining());
    return dg;
}

Datagram decodeHeight(ByteReader &body, const DatagramHeader &header)
{
    HeightDatagram dg;
    dg.header = header;
    readSensorCommon(body, dg.cmnPart);
    dg.sensorType = body.read<uint16_t>();
    dg.padding = body.read<uint16_t>();
    dg.heightUsed_m = body.read<float>();
    dg.dataFromSensor = body.readString(body.remaining());
    return dg;
}

Datagram decodeCompatibilityHeave(ByteReader &body, const DatagramHeader &header)
{
    CompatibilityHeaveDatagram dg;
    dg.header = header;
    readMultibeamBody(body, dg.cmnPart);
    dg.heave_m = body.read<float>();
    dg.trailer = body.readBytes(body.remaining());
    return dg;
}

Datagram decodeAttitude(ByteReader &body, const DatagramHeader &header)
{
    AttitudeDatagram dg;
    dg.header = header;

    auto declared = body.read<uint16_t>();
    ByteReader info = openBlock(body, declared, SKM_INFO_SIZE, 2, "#SKM info");
    dg.info.sensorSystem = info.read<uint8_t>();
    dg.info.sensorStatus = info.read<uint8_t>();
    dg.info.sensorInputFormat = info.read<uint16_t>();
    auto numSamples = info.read<uint16_t>();
    auto numBytesPerSample = info.read<uint16_t>();
    dg.info.sensorDataContents = info.read<uint16_t>();
    dg.info.extra = info.readBytes(info.remaining());

    requireElementSize(numBytesPerSample, SKM_KM_BINARY_SIZE + SKM_DELAYED_HEAVE_SIZE, numSamples, "#SKM sample",
                       body.origin() + body.position());
    dg.samples.resize(numSamples);
    for (auto &sample : dg.samples) {
        ByteReader in = body.subReader(numBytesPerSample);
        readKmBinary(in, sample.kmBinary);
        sample.delayedHeave.time_sec = in.read<uint32_t>();
        sample.delayedHeave.time_nanosec = in.read<uint32_t>();
        sample.delayedHeave.delayedHeave_m = in.read<float>();
        sample.extra = in.readBytes(in.remaining());
    }
    dg.trailer = body.readBytes(body.remaining());
    return dg;
}

Datagram decodeSoundVelocityProfile(ByteReader &body, const DatagramHeader &header)
{
    SoundVelocityProfile dg;
    dg.header = header;

    auto declared = body.read<uint16_t>();
    ByteReader cmn = openBlock(body, declared, SVP_COMMON_SIZE, 2, "#SVP common part");
    auto numSamples = cmn.read<uint16_t>();
    dg.sensorFormat = cmn.readString(DATAGRAM_TAG_LENGTH);
    dg.time_sec = cmn.read<uint32_t>();
    dg.latitude_deg = cmn.read<double>();
    dg.longitude_deg = cmn.read<double>();
    dg.commonExtra = cmn.readBytes(cmn.remaining());

    dg.points.resize(numSamples);
    for (auto &point : dg.points) {
        point.depth_m = body.read<float>();
        point.soundVelocity_mPerSec = body.read<float>();
        point.padding = body.read<uint32_t>();
        point.temp_C = body.read<float>();
        point.salinity = body.read<float>();
    }
    dg.trailer = body.readBytes(body.remaining());
    return dg;
}

Datagram decodeSoundVelocityTransducer(ByteReader &body, const DatagramHeader &header)
{
    SoundVelocityTransducer dg;
    dg.header = header;

    auto declared = body.read<uint16_t>();
    ByteReader info = openBlock(body, declared, SVT_INFO_SIZE, 2, "#SVT info");
    dg.info.sensorStatus = info.read<uint16_t>();
    dg.info.sensorInputFormat = info.read<uint16_t>();
    auto numSamples = info.read<uint16_t>();
    auto numBytesPerSample = info.read<uint16_t>();
    dg.info.sensorDataContents = info.read<uint16_t>();
    dg.info.filterTime_sec = info.read<float>();
    dg.info.soundVelocity_mPerSec_offset = info.read<float>();
    dg.info.extra = info.readBytes(info.remaining());

    requireElementSize(numBytesPerSample, SVT_SAMPLE_SIZE, numSamples, "#SVT sample",
                       body.origin() + body.position());
    dg.samples.resize(numSamples);
    for (auto &sample : dg.samples) {
        ByteReader in = body.subReader(numBytesPerSample);
        sample.time_sec = in.read<uint32_t>();
        sample.time_nanosec = in.read<uint32_t>();
        sample.soundVelocity_mPerSec = in.read<float>();
        sample.temp_C = in.read<float>();
        sample.pressure_Pa = in.read<float>();
        sample.salinity = in.read<float>();
        sample.extra = in.readBytes(in.remaining());
    }
    dg.trailer = body.readBytes(body.remaining());
    return dg;
}

Datagram decodeDepth(ByteReader &body, const DatagramHeader &header)
{
    DepthDatagram dg;
    dg.header = header;
    readMultibeamPrefix(body, dg.partition, dg.cmnPart);

    uint16_t numTxSectors = 0;
    uint16_t numBytesPerTxSector = 0;
    readPingInfo(body, dg.pingInfo, numTxSectors, numBytesPerTxSector);

    requireElementSize(numBytesPerTxSector, MRZ_TX_SECTOR_INFO_SIZE, numTxSectors, "#MRZ tx sector",
                       body.origin() + body.position());
    dg.txSectors.resize(numTxSectors);
    for (auto &tx : dg.txSectors) {
        ByteReader in = body.subReader(numBytesPerTxSector);
        readTxSector(in, tx);
    }

    auto declared = body.read<uint16_t>();
    ByteReader rx = openBlock(body, declared, MRZ_RX_INFO_SIZE, 2, "#MRZ rx info");
    dg.rxInfo.numSoundingsMaxMain = rx.read<uint16_t>();
    dg.rxInfo.numSoundingsValidMain = rx.read<uint16_t>();
    auto numBytesPerSounding = rx.read<uint16_t>();
    dg.rxInfo.WCSampleRate = rx.read<float>();
    dg.rxInfo.seabedImageSampleRate = rx.read<float>();
    dg.rxInfo.BSnormal_dB = rx.read<float>();
    dg.rxInfo.BSoblique_dB = rx.read<float>();
    dg.rxInfo.extraDetectionAlarmFlag = rx.read<uint16_t>();
    dg.rxInfo.numExtraDetections = rx.read<uint16_t>();
    auto numExtraDetectionClasses = rx.read<uint16_t>();
    auto numBytesPerClass = rx.read<uint16_t>();
    dg.rxInfo.extra = rx.readBytes(rx.remaining());

    requireElementSize(numBytesPerClass, MRZ_EXTRA_DET_CLASS_INFO_SIZE, numExtraDetectionClasses,
                       "#MRZ extra detection class", body.origin() + body.position());
    dg.extraDetClasses.resize(numExtraDetectionClasses);
    for (auto &cls : dg.extraDetClasses) {
        ByteReader in = body.subReader(numBytesPerClass);
        cls.numExtraDetInClass = in.read<uint16_t>();
        cls.padding = in.read<int8_t>();
        cls.alarmFlag = in.read<uint8_t>();
        cls.extra = in.readBytes(in.remaining());
    }

    size_t numSoundings = static_cast<size_t>(dg.rxInfo.numSoundingsMaxMain) + dg.rxInfo.numExtraDetections;
    requireElementSize(numBytesPerSounding, MRZ_SOUNDING_SIZE, numSoundings, "#MRZ sounding",
                       body.origin() + body.position());
    dg.soundings.resize(numSoundings);
    size_t numSeabedSamples = 0;
    for (auto &sounding : dg.soundings) {
        ByteReader in = body.subReader(numBytesPerSounding);
        readSounding(in, sounding);
        numSeabedSamples += sounding.SInumSamples;
    }

    dg.SIsample_desidB.resize(numSeabedSamples);
    for (auto &sample : dg.SIsample_desidB) {
        sample = body.read<int16_t>();
    }
    dg.trailer = body.readBytes(body.remaining());
    return dg;
}

Datagram decodeWaterColumn(ByteReader &body, const DatagramHeader &header)
{
    WaterColumnDatagram dg;
    dg.header = header;
    readMultibeamPrefix(body, dg.partition, dg.cmnPart);

    auto declared = body.read<uint16_t>();
    ByteReader tx = openBlock(body, declared, MWC_TX_INFO_SIZE, 2, "#MWC tx info");
    auto numTxSectors = tx.read<uint16_t>();
    auto numBytesPerTxSector = tx.read<uint16_t>();
    dg.txInfo.padding = tx.read<int16_t>();
    dg.txInfo.heave_m = tx.read<float>();
    dg.txInfo.extra = tx.readBytes(tx.remaining());

    requireElementSize(numBytesPerTxSector, MWC_TX_SECTOR_DATA_SIZE, numTxSectors, "#MWC tx sector",
                       body.origin() + body.position());
    dg.txSectors.resize(numTxSectors);
    for (auto &sector : dg.txSectors) {
        ByteReader in = body.subReader(numBytesPerTxSector);
        sector.tiltAngleReTx_deg = in.read<float>();
        sector.centreFreq_Hz = in.read<float>();
        sector.txBeamWidthAlong_deg = in.read<float>();
        sector.txSectorNum = in.read<uint16_t>();
        sector.padding = in.read<int16_t>();
        sector.extra = in.readBytes(in.remaining());
    }

    declared = body.read<uint16_t>();
    ByteReader rx = openBlock(body, declared, MWC_RX_INFO_SIZE, 2, "#MWC rx info");
    auto numBeams = rx.read<uint16_t>();
    auto numBytesPerBeamEntry = rx.read<uint8_t>();
    dg.rxInfo.phaseFlag = rx.read<uint8_t>();
    dg.rxInfo.TVGfunctionApplied = rx.read<uint8_t>();
    dg.rxInfo.TVGoffset_dB = rx.read<int8_t>();
    dg.rxInfo.sampleFreq_Hz = rx.read<float>();
    dg.rxInfo.soundVelocity_mPerSec = rx.read<float>();
    dg.rxInfo.extra = rx.readBytes(rx.remaining());

    if (dg.rxInfo.phaseFlag > MWC_PHASE_HIGH_RES) {
        std::stringstream msg;
        msg << "#MWC phase flag " << static_cast<int>(dg.rxInfo.phaseFlag) << " is not 0, 1 or 2";
        throw KmallError(ErrorCode::MalformedHeader, msg.str());
    }

    requireElementSize(numBytesPerBeamEntry, MWC_RX_BEAM_DATA_SIZE, numBeams, "#MWC beam",
                       body.origin() + body.position());
    dg.beams.resize(numBeams);
    for (auto &beam : dg.beams) {
        ByteReader in = body.subReader(numBytesPerBeamEntry);
        beam.beamPointAngReVertical_deg = in.read<float>();
        beam.startRangeSampleNum = in.read<uint16_t>();
        beam.detectedRangeInSamples = in.read<uint16_t>();
        beam.beamTxSectorNum = in.read<uint16_t>();
        auto numSampleData = in.read<uint16_t>();
        beam.extra = in.readBytes(in.remaining());

        beam.sampleAmplitude05dB.resize(numSampleData);
        for (auto &amplitude : beam.sampleAmplitude05dB) {
            amplitude = body.read<int8_t>();
        }
        if (dg.rxInfo.phaseFlag == MWC_PHASE_LOW_RES) {
            beam.rxBeamPhase8.resize(numSampleData);
            for (auto &phase : beam.rxBeamPhase8) {
                phase = body.read<int8_t>();
            }
        } else if (dg.rxInfo.phaseFlag == MWC_PHASE_HIGH_RES) {
            beam.rxBeamPhase16.resize(numSampleData);
            for (auto &phase : beam.rxBeamPhase16) {
                phase = body.read<int16_t>();
            }
        }
    }
    dg.trailer = body.readBytes(body.remaining());
    return dg;
}

} // namespace detail

} // namespace kmall
