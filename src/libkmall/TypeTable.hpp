/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Static registry of KMALL datagram tags.
 */

#pragma once

#include <string>
#include <vector>

#include "ByteReader.hpp"
#include "Datagrams.hpp"

namespace kmall {

enum class DatagramKind {
    InstallationParameters,
    RuntimeParameters,
    BistError,
    BistReply,
    BistShort,
    Position,
    KmBinary,
    SoundVelocityProfile,
    SoundVelocityTransducer,
    Clock,
    SensorDepth,
    SensorHeight,
    SensorHeading,
    RangeAndDepth,
    WaterColumn,
    CompatibilityPosition,
    CompatibilityHeave,
    QuantizedLevel0,
    QuantizedLevel1
};

/// Decodes the body (bytes between the header and the trailing length)
using BodyDecoder = Datagram (*)(ByteReader &body, const DatagramHeader &header);

struct DatagramType {
    const char *tag;
    DatagramKind kind;
    const char *description;
    bool hasSchema;      ///< false: decoded as OpaqueDatagram
    bool isNavigation;   ///< timestamps feed the navigation gap check
    bool isCompressible; ///< quantized by CompressionCodec
    BodyDecoder decode;  ///< nullptr when !hasSchema
};

/**
 * Look up a 4-character tag.
 *
 * @return the registry entry, or nullptr if the tag is unrecognized
 */
[[nodiscard]] const DatagramType *findType(const std::string &tag);

[[nodiscard]] bool isRecognized(const std::string &tag);

/// Every registered type, vendor tags first, synthetic tags last
[[nodiscard]] const std::vector<DatagramType> &allTypes();

} // namespace kmall
