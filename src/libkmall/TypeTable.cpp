/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include "TypeTable.hpp"
#include "DatagramDecoder.hpp"
#include "ProtocolConstants.hpp"
#include "QuantizedDatagram.hpp"

namespace kmall {

const std::vector<DatagramType> &allTypes()
{
    // clang-format off
    static const std::vector<DatagramType> types = {
        {TAG_INSTALLATION_PARAM,        DatagramKind::InstallationParameters,  "Installation parameters and sensor setup", true,  false, false, detail::decodeInstallationParameters},
        {TAG_RUNTIME_PARAM,             DatagramKind::RuntimeParameters,       "Runtime parameters",                        true,  false, false, detail::decodeRuntimeParameters},
        {TAG_BIST_ERROR,                DatagramKind::BistError,               "BIST error report",                         false, false, false, nullptr},
        {TAG_BIST_REPLY,                DatagramKind::BistReply,               "BIST reply",                                false, false, false, nullptr},
        {TAG_BIST_SHORT,                DatagramKind::BistShort,               "BIST short reply",                          false, false, false, nullptr},
        {TAG_POSITION,                  DatagramKind::Position,                "Position",                                  true,  true,  false, detail::decodePosition},
        {TAG_KM_BINARY,                 DatagramKind::KmBinary,                "KM binary attitude and position",           true,  true,  false, detail::decodeAttitude},
        {TAG_SOUND_VELOCITY_PROFILE,    DatagramKind::SoundVelocityProfile,    "Sound velocity profile",                    true,  false, false, detail::decodeSoundVelocityProfile},
        {TAG_SOUND_VELOCITY_TRANSDUCER, DatagramKind::SoundVelocityTransducer, "Sound velocity at transducer",              true,  false, false, detail::decodeSoundVelocityTransducer},
        {TAG_CLOCK,                     DatagramKind::Clock,                   "Clock",                                     true,  true,  false, detail::decodeClock},
        {TAG_DEPTH,                     DatagramKind::SensorDepth,             "Depth (pressure) sensor",                   true,  false, false, detail::decodeSensorDepth},
        {TAG_HEIGHT,                    DatagramKind::SensorHeight,            "Height sensor",                             true,  false, false, detail::decodeHeight},
        {TAG_HEADING,                   DatagramKind::SensorHeading,           "Heading sensor",                            false, false, false, nullptr},
        {TAG_RANGE_AND_DEPTH,           DatagramKind::RangeAndDepth,           "Multibeam range and depth",                 true,  false, true,  detail::decodeDepth},
        {TAG_WATER_COLUMN,              DatagramKind::WaterColumn,             "Multibeam water column",                    true,  false, true,  detail::decodeWaterColumn},
        {TAG_COMPATIBILITY_POSITION,    DatagramKind::CompatibilityPosition,   "Compatibility position",                    true,  true,  false, detail::decodeCompatibilityPosition},
        {TAG_COMPATIBILITY_HEAVE,       DatagramKind::CompatibilityHeave,      "Compatibility heave",                       true,  false, false, detail::decodeCompatibilityHeave},
        {TAG_QUANTIZED_LEVEL0,          DatagramKind::QuantizedLevel0,         "Quantized multibeam, seabed image kept",    true,  false, false, detail::decodeQuantized},
        {TAG_QUANTIZED_LEVEL1,          DatagramKind::QuantizedLevel1,         "Quantized multibeam, seabed image dropped", true,  false, false, detail::decodeQuantized},
    };
    // clang-format on
    return types;
}

const DatagramType *findType(const std::string &tag)
{
    for (const auto &type : allTypes()) {
        if (tag == type.tag) {
            return &type;
        }
    }
    return nullptr;
}

bool isRecognized(const std::string &tag) { return findType(tag) != nullptr; }

} // namespace kmall
