/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Decodes one complete datagram buffer into its structured form.
 *
 * The buffer must hold exactly one datagram: leading length, header, body and
 * trailing length. All functions throw KmallError on malformed input.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "ByteReader.hpp"
#include "Datagrams.hpp"

namespace kmall {

/// Header, partition and common part of a multibeam datagram
struct MultibeamPrefix {
    DatagramHeader header;
    /// Vendor tag of the payload: header.dgmType, or the wrapped tag of a quantized datagram
    std::string originalTag;
    MultibeamPartition partition;
    MultibeamCommon cmnPart;
};

/**
 * Decode and validate the 20-byte header.
 *
 * @throws KmallError TruncatedRecord if the buffer is shorter than the header
 *         or than the declared length, MalformedHeader if the tag does not
 *         start with '#' or the declared length is too small
 */
[[nodiscard]] DatagramHeader decodeHeader(const uint8_t *data, size_t size);
[[nodiscard]] DatagramHeader decodeHeader(const Bytes &buffer);

/**
 * Decode only the header, partition and common part of a #MRZ, #MWC or
 * quantized datagram. Used by the ping check, which needs nothing else.
 */
[[nodiscard]] MultibeamPrefix decodeMultibeamCommon(const Bytes &buffer);

/**
 * Fully decode a datagram.
 *
 * @param buffer      the complete datagram
 * @param declaredTag tag the caller expects (from the index); empty to skip
 * @return the decoded variant, OpaqueDatagram for tags without a schema
 */
[[nodiscard]] Datagram decode(const Bytes &buffer, const std::string &declaredTag = std::string());

namespace detail {

/// Returns a reader over the first @p declared bytes of a block whose size
/// field of @p fieldWidth bytes has already been consumed from @p in.
ByteReader openBlock(ByteReader &in, size_t declared, size_t known, size_t fieldWidth, const char *what);

void readMultibeamPrefix(ByteReader &in, MultibeamPartition &partition, MultibeamCommon &cmnPart);

/// EMdgmMbody alone, as carried by #CHE
void readMultibeamBody(ByteReader &in, MultibeamCommon &cmnPart);

Datagram decodeInstallationParameters(ByteReader &body, const DatagramHeader &header);
Datagram decodeRuntimeParameters(ByteReader &body, const DatagramHeader &header);
Datagram decodePosition(ByteReader &body, const DatagramHeader &header);
Datagram decodeCompatibilityPosition(ByteReader &body, const DatagramHeader &header);
Datagram decodeAttitude(ByteReader &body, const DatagramHeader &header);
Datagram decodeSoundVelocityProfile(ByteReader &body, const DatagramHeader &header);
Datagram decodeSoundVelocityTransducer(ByteReader &body, const DatagramHeader &header);
Datagram decodeClock(ByteReader &body, const DatagramHeader &header);
Datagram decodeSensorDepth(ByteReader &body, const DatagramHeader &header);
Datagram decodeHeight(ByteReader &body, const DatagramHeader &header);
Datagram decodeCompatibilityHeave(ByteReader &body, const DatagramHeader &header);
Datagram decodeDepth(ByteReader &body, const DatagramHeader &header);
Datagram decodeWaterColumn(ByteReader &body, const DatagramHeader &header);

} // namespace detail

} // namespace kmall
