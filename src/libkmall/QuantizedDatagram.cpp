/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <iostream>
#include <sstream>

#include "DatagramDecoder.hpp"
#include "DatagramEncoder.hpp"
#include "KmallError.hpp"
#include "ProtocolConstants.hpp"
#include "QuantizationTable.hpp"
#include "QuantizedDatagram.hpp"

namespace kmall {

namespace {

void writeStored(ByteWriter &out, IntWidth width, int64_t stored)
{
    switch (width) {
    case IntWidth::I16:
        out.write(static_cast<int16_t>(stored));
        break;
    case IntWidth::I32:
        out.write(static_cast<int32_t>(stored));
        break;
    case IntWidth::I64:
        out.write(stored);
        break;
    }
}

int64_t readStored(ByteReader &in, IntWidth width)
{
    switch (width) {
    case IntWidth::I16:
        return in.read<int16_t>();
    case IntWidth::I32:
        return in.read<int32_t>();
    case IntWidth::I64:
        return in.read<int64_t>();
    }
    return 0;
}

template <typename T> void writeFields(ByteWriter &out, const T &object, const std::vector<FieldBinding<T>> &fields)
{
    for (const auto &binding : fields) {
        writeStored(out, binding.field.width, quantize(binding.field, binding.get(object)));
    }
}

template <typename T> void readFields(ByteReader &in, T &object, const std::vector<FieldBinding<T>> &fields)
{
    for (const auto &binding : fields) {
        binding.set(object, dequantize(binding.field, readStored(in, binding.field.width)));
    }
}

void writeExtra(ByteWriter &out, const Bytes &extra)
{
    if (extra.size() > 0xFFFF) {
        throw KmallError(ErrorCode::QuantizationOverflow, "struct extension too large for a quantized datagram");
    }
    out.write(static_cast<uint16_t>(extra.size()));
    out.writeBytes(extra);
}

Bytes readExtra(ByteReader &in) { return in.readBytes(in.read<uint16_t>()); }

void writeCount(ByteWriter &out, size_t count, const char *what)
{
    if (count > 0xFFFF) {
        std::stringstream msg;
        msg << what << " count " << count << " does not fit a quantized datagram";
        throw KmallError(ErrorCode::QuantizationOverflow, msg.str());
    }
    out.write(static_cast<uint16_t>(count));
}

void writeTrailer(ByteWriter &out, const Bytes &trailer)
{
    out.write(static_cast<uint32_t>(trailer.size()));
    out.writeBytes(trailer);
}

Bytes readTrailer(ByteReader &in) { return in.readBytes(in.read<uint32_t>()); }

// ============================================================================
// #MRZ payload
// ============================================================================

void writeDepth(ByteWriter &out, const DepthDatagram &dg, uint8_t level)
{
    detail::writeMultibeamPrefix(out, dg.partition, dg.cmnPart);

    const MrzPingInfo &info = dg.pingInfo;
    out.write(info.padding0);
    out.write(info.beamSpacing);
    out.write(info.depthMode);
    out.write(info.subDepthMode);
    out.write(info.distanceBtwSwath);
    out.write(info.detectionMode);
    out.write(info.pulseForm);
    out.write(info.padding1);
    out.write(info.portMeanCov_m);
    out.write(info.starbMeanCov_m);
    out.write(info.modeAndStabilisation);
    out.write(info.runtimeFilter1);
    out.write(info.runtimeFilter2);
    out.write(info.pipeTrackingStatus);
    out.write(info.SLrampUpTimeRemaining);
    out.write(info.padding2);
    out.write(info.latLongInfo);
    out.write(info.posSensorStatus);
    out.write(info.attitudeSensorStatus);
    out.write(info.padding3);
    writeFields(out, info, pingInfoFields());
    writeExtra(out, info.extra);

    writeCount(out, dg.txSectors.size(), "#MRZ tx sector");
    for (const auto &tx : dg.txSectors) {
        out.write(tx.txSectorNumb);
        out.write(tx.txArrNumber);
        out.write(tx.txSubArray);
        out.write(tx.padding0);
        out.write(tx.pulseShading);
        out.write(tx.signalWaveForm);
        out.write(tx.padding1);
        writeFields(out, tx, mrzTxSectorFields());
        writeExtra(out, tx.extra);
    }

    out.write(dg.rxInfo.numSoundingsMaxMain);
    out.write(dg.rxInfo.numSoundingsValidMain);
    out.write(dg.rxInfo.extraDetectionAlarmFlag);
    out.write(dg.rxInfo.numExtraDetections);
    writeFields(out, dg.rxInfo, mrzRxInfoFields());
    writeExtra(out, dg.rxInfo.extra);

    writeCount(out, dg.extraDetClasses.size(), "#MRZ extra detection class");
    for (const auto &cls : dg.extraDetClasses) {
        out.write(cls.numExtraDetInClass);
        out.write(cls.padding);
        out.write(cls.alarmFlag);
        writeExtra(out, cls.extra);
    }

    writeCount(out, dg.soundings.size(), "#MRZ sounding");
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
        out.write(s.WCBeamNumb);
        out.write(s.WCrange_samples);
        out.write(s.realTimeCleanInfo);
        out.write(s.SIstartRange_samples);
        out.write(s.SIcentreSample);
        out.write(s.SInumSamples);
        writeFields(out, s, soundingFields());
        writeExtra(out, s.extra);
    }

    if (level == 0) {
        out.write(static_cast<uint32_t>(dg.SIsample_desidB.size()));
        for (auto sample : dg.SIsample_desidB) {
            out.write(sample);
        }
    }
    writeTrailer(out, dg.trailer);
}

DepthDatagram readDepth(ByteReader &in, uint8_t level)
{
    DepthDatagram dg;
    detail::readMultibeamPrefix(in, dg.partition, dg.cmnPart);

    MrzPingInfo &info = dg.pingInfo;
    info.padding0 = in.read<uint16_t>();
    info.beamSpacing = in.read<uint8_t>();
    info.depthMode = in.read<uint8_t>();
    info.subDepthMode = in.read<uint8_t>();
    info.distanceBtwSwath = in.read<uint8_t>();
    info.detectionMode = in.read<uint8_t>();
    info.pulseForm = in.read<uint8_t>();
    info.padding1 = in.read<uint16_t>();
    info.portMeanCov_m = in.read<int16_t>();
    info.starbMeanCov_m = in.read<int16_t>();
    info.modeAndStabilisation = in.read<uint8_t>();
    info.runtimeFilter1 = in.read<uint8_t>();
    info.runtimeFilter2 = in.read<uint16_t>();
    info.pipeTrackingStatus = in.read<uint32_t>();
    info.SLrampUpTimeRemaining = in.read<uint16_t>();
    info.padding2 = in.read<uint16_t>();
    info.latLongInfo = in.read<uint8_t>();
    info.posSensorStatus = in.read<uint8_t>();
    info.attitudeSensorStatus = in.read<uint8_t>();
    info.padding3 = in.read<uint8_t>();
    readFields(in, info, pingInfoFields());
    info.extra = readExtra(in);

    dg.txSectors.resize(in.read<uint16_t>());
    for (auto &tx : dg.txSectors) {
        tx.txSectorNumb = in.read<uint8_t>();
        tx.txArrNumber = in.read<uint8_t>();
        tx.txSubArray = in.read<uint8_t>();
        tx.padding0 = in.read<uint8_t>();
        tx.pulseShading = in.read<uint8_t>();
        tx.signalWaveForm = in.read<uint8_t>();
        tx.padding1 = in.read<uint16_t>();
        readFields(in, tx, mrzTxSectorFields());
        tx.extra = readExtra(in);
    }

    dg.rxInfo.numSoundingsMaxMain = in.read<uint16_t>();
    dg.rxInfo.numSoundingsValidMain = in.read<uint16_t>();
    dg.rxInfo.extraDetectionAlarmFlag = in.read<uint16_t>();
    dg.rxInfo.numExtraDetections = in.read<uint16_t>();
    readFields(in, dg.rxInfo, mrzRxInfoFields());
    dg.rxInfo.extra = readExtra(in);

    dg.extraDetClasses.resize(in.read<uint16_t>());
    for (auto &cls : dg.extraDetClasses) {
        cls.numExtraDetInClass = in.read<uint16_t>();
        cls.padding = in.read<int8_t>();
        cls.alarmFlag = in.read<uint8_t>();
        cls.extra = readExtra(in);
    }

    dg.soundings.resize(in.read<uint16_t>());
    for (auto &s : dg.soundings) {
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
        s.WCBeamNumb = in.read<uint16_t>();
        s.WCrange_samples = in.read<uint16_t>();
        s.realTimeCleanInfo = in.read<uint16_t>();
        s.SIstartRange_samples = in.read<uint16_t>();
        s.SIcentreSample = in.read<uint16_t>();
        s.SInumSamples = in.read<uint16_t>();
        readFields(in, s, soundingFields());
        s.extra = readExtra(in);
        if (level != 0) {
            // seabed image was dropped
            s.SInumSamples = 0;
        }
    }

    size_t numSoundings = static_cast<size_t>(dg.rxInfo.numSoundingsMaxMain) + dg.rxInfo.numExtraDetections;
    if (numSoundings != dg.soundings.size()) {
        std::stringstream msg;
        msg << "quantized #MRZ declares " << numSoundings << " soundings but holds " << dg.soundings.size();
        throw KmallError(ErrorCode::CorruptCompressedStream, msg.str());
    }

    if (level == 0) {
        dg.SIsample_desidB.resize(in.read<uint32_t>());
        for (auto &sample : dg.SIsample_desidB) {
            sample = in.read<int16_t>();
        }
        if (dg.SIsample_desidB.size() != dg.seabedImageOffsets().back()) {
            throw KmallError(ErrorCode::CorruptCompressedStream,
                             "quantized #MRZ seabed image count disagrees with its soundings");
        }
    }
    dg.trailer = readTrailer(in);
    return dg;
}

// ============================================================================
// #MWC payload
// ============================================================================

void writeWaterColumn(ByteWriter &out, const WaterColumnDatagram &dg)
{
    detail::writeMultibeamPrefix(out, dg.partition, dg.cmnPart);

    out.write(dg.txInfo.padding);
    writeFields(out, dg.txInfo, mwcTxInfoFields());
    writeExtra(out, dg.txInfo.extra);

    writeCount(out, dg.txSectors.size(), "#MWC tx sector");
    for (const auto &sector : dg.txSectors) {
        out.write(sector.txSectorNum);
        out.write(sector.padding);
        writeFields(out, sector, mwcTxSectorFields());
        writeExtra(out, sector.extra);
    }

    out.write(dg.rxInfo.phaseFlag);
    out.write(dg.rxInfo.TVGfunctionApplied);
    out.write(dg.rxInfo.TVGoffset_dB);
    writeFields(out, dg.rxInfo, mwcRxInfoFields());
    writeExtra(out, dg.rxInfo.extra);

    writeCount(out, dg.beams.size(), "#MWC beam");
    for (const auto &beam : dg.beams) {
        out.write(beam.startRangeSampleNum);
        out.write(beam.detectedRangeInSamples);
        out.write(beam.beamTxSectorNum);
        writeFields(out, beam, mwcBeamFields());
        writeExtra(out, beam.extra);

        writeCount(out, beam.sampleAmplitude05dB.size(), "#MWC sample");
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
    writeTrailer(out, dg.trailer);
}

WaterColumnDatagram readWaterColumn(ByteReader &in)
{
    WaterColumnDatagram dg;
    detail::readMultibeamPrefix(in, dg.partition, dg.cmnPart);

    dg.txInfo.padding = in.read<int16_t>();
    readFields(in, dg.txInfo, mwcTxInfoFields());
    dg.txInfo.extra = readExtra(in);

    dg.txSectors.resize(in.read<uint16_t>());
    for (auto &sector : dg.txSectors) {
        sector.txSectorNum = in.read<uint16_t>();
        sector.padding = in.read<int16_t>();
        readFields(in, sector, mwcTxSectorFields());
        sector.extra = readExtra(in);
    }

    dg.rxInfo.phaseFlag = in.read<uint8_t>();
    dg.rxInfo.TVGfunctionApplied = in.read<uint8_t>();
    dg.rxInfo.TVGoffset_dB = in.read<int8_t>();
    readFields(in, dg.rxInfo, mwcRxInfoFields());
    dg.rxInfo.extra = readExtra(in);
    if (dg.rxInfo.phaseFlag > MWC_PHASE_HIGH_RES) {
        throw KmallError(ErrorCode::CorruptCompressedStream, "quantized #MWC carries an invalid phase flag");
    }

    dg.beams.resize(in.read<uint16_t>());
    for (auto &beam : dg.beams) {
        beam.startRangeSampleNum = in.read<uint16_t>();
        beam.detectedRangeInSamples = in.read<uint16_t>();
        beam.beamTxSectorNum = in.read<uint16_t>();
        readFields(in, beam, mwcBeamFields());
        beam.extra = readExtra(in);

        auto numSamples = in.read<uint16_t>();
        beam.sampleAmplitude05dB.resize(numSamples);
        for (auto &amplitude : beam.sampleAmplitude05dB) {
            amplitude = in.read<int8_t>();
        }
        if (dg.rxInfo.phaseFlag == MWC_PHASE_LOW_RES) {
            beam.rxBeamPhase8.resize(numSamples);
            for (auto &phase : beam.rxBeamPhase8) {
                phase = in.read<int8_t>();
            }
        } else if (dg.rxInfo.phaseFlag == MWC_PHASE_HIGH_RES) {
            beam.rxBeamPhase16.resize(numSamples);
            for (auto &phase : beam.rxBeamPhase16) {
                phase = in.read<int16_t>();
            }
        }
    }
    dg.trailer = readTrailer(in);
    return dg;
}

} // namespace

std::string quantizedTag(uint8_t level)
{
    if (level == 0) {
        return TAG_QUANTIZED_LEVEL0;
    }
    if (level == 1) {
        return TAG_QUANTIZED_LEVEL1;
    }
    std::stringstream msg;
    msg << "retention level " << static_cast<int>(level) << " is not supported, expected 0 to "
        << static_cast<int>(MAX_RETENTION_LEVEL);
    throw KmallError(ErrorCode::UnsupportedLevel, msg.str());
}

CompressedDatagram makeCompressed(const Datagram &vendor, uint8_t level)
{
    CompressedDatagram dg;
    dg.header = headerOf(vendor);
    dg.header.dgmType = quantizedTag(level);
    dg.level = level;
    dg.codecVersion = QUANTIZED_CODEC_VERSION;
    dg.originalTag = headerOf(vendor).dgmType;

    if (const auto *depth = std::get_if<DepthDatagram>(&vendor)) {
        dg.payload = *depth;
    } else if (const auto *wc = std::get_if<WaterColumnDatagram>(&vendor)) {
        if (level != 0) {
            throw KmallError(ErrorCode::UnsupportedLevel, "#MWC datagrams are only quantized at level 0");
        }
        dg.payload = *wc;
    } else {
        throw KmallError(ErrorCode::UnsupportedLevel, dg.originalTag + " datagrams are not quantized");
    }
    return dg;
}

Datagram restoreVendor(const CompressedDatagram &compressed)
{
    return std::visit(
        [&compressed](const auto &payload) -> Datagram {
            auto vendor = payload;
            vendor.header = compressed.header;
            vendor.header.dgmType = compressed.originalTag;
            return vendor;
        },
        compressed.payload);
}

Bytes encodeQuantized(const CompressedDatagram &dg)
{
    if (dg.header.dgmType != quantizedTag(dg.level)) {
        std::stringstream msg;
        msg << "level " << static_cast<int>(dg.level) << " datagram cannot carry tag " << dg.header.dgmType;
        throw KmallError(ErrorCode::UnsupportedLevel, msg.str());
    }

    ByteWriter out;
    detail::beginDatagram(out, dg.header);
    out.write(dg.level);
    out.write(dg.codecVersion);
    out.write<uint16_t>(0);
    out.writeString(dg.originalTag, DATAGRAM_TAG_LENGTH);

    if (const auto *depth = std::get_if<DepthDatagram>(&dg.payload)) {
        writeDepth(out, *depth, dg.level);
    } else {
        writeWaterColumn(out, std::get<WaterColumnDatagram>(dg.payload));
    }

#ifdef DEBUG_CODEC
    std::cout << "quantized " << dg.originalTag << " into " << (out.size() + LENGTH_FIELD_SIZE) << " bytes\n";
#endif
    return detail::finishDatagram(out);
}

namespace detail {

Datagram decodeQuantized(ByteReader &body, const DatagramHeader &header)
{
    CompressedDatagram dg;
    dg.header = header;
    dg.level = body.read<uint8_t>();
    dg.codecVersion = body.read<uint8_t>();
    body.skip(2);
    dg.originalTag = body.readString(DATAGRAM_TAG_LENGTH);

    uint8_t expectedLevel = header.dgmType == TAG_QUANTIZED_LEVEL0 ? 0 : 1;
    if (dg.level != expectedLevel) {
        std::stringstream msg;
        msg << header.dgmType << " datagram carries level byte " << static_cast<int>(dg.level);
        throw KmallError(ErrorCode::UnsupportedLevel, msg.str());
    }
    if (dg.codecVersion != QUANTIZED_CODEC_VERSION) {
        std::stringstream msg;
        msg << header.dgmType << " datagram has codec version " << static_cast<int>(dg.codecVersion)
            << ", this build reads version " << static_cast<int>(QUANTIZED_CODEC_VERSION);
        throw KmallError(ErrorCode::UnsupportedLevel, msg.str());
    }

    if (dg.originalTag == TAG_RANGE_AND_DEPTH) {
        dg.payload = readDepth(body, dg.level);
    } else if (dg.originalTag == TAG_WATER_COLUMN && dg.level == 0) {
        dg.payload = readWaterColumn(body);
    } else {
        throw KmallError(ErrorCode::CorruptCompressedStream,
                         header.dgmType + " datagram wraps unexpected tag '" + dg.originalTag + "'");
    }

    if (!body.atEnd()) {
        std::stringstream msg;
        msg << header.dgmType << " datagram has " << body.remaining() << " unread bytes";
        throw KmallError(ErrorCode::CorruptCompressedStream, msg.str());
    }

    std::visit(
        [&dg](auto &payload) {
            payload.header = dg.header;
            payload.header.dgmType = dg.originalTag;
        },
        dg.payload);

#ifdef DEBUG_CODEC
    std::cout << "dequantized " << dg.originalTag << " from " << header.dgmType << "\n";
#endif
    return dg;
}

} // namespace detail

} // namespace kmall
