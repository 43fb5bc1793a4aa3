/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Encode/decode of the synthetic #QZ0 and #QZ1 datagrams.
 *
 * Body layout: an 8-byte preamble (level, codec version, reserved u16,
 * original vendor tag), then the partition and common part exactly as in the
 * vendor datagram, then the remaining blocks with integer fields copied and
 * the fields of QuantizationTable stored as fixed-point integers. Level 1
 * omits the #MRZ seabed image samples.
 */

#pragma once

#include <cstdint>
#include <string>

#include "ByteReader.hpp"
#include "Datagrams.hpp"

namespace kmall {

/// Synthetic tag for a retention level
[[nodiscard]] std::string quantizedTag(uint8_t level);

/**
 * Wrap a vendor #MRZ or #MWC datagram for compression. The synthetic header
 * copies the vendor header with the tag replaced.
 *
 * @throws KmallError UnsupportedLevel for an unknown level or a #MWC at level 1
 */
[[nodiscard]] CompressedDatagram makeCompressed(const Datagram &vendor, uint8_t level);

/// Unwrap to the vendor datagram under its original tag
[[nodiscard]] Datagram restoreVendor(const CompressedDatagram &compressed);

/**
 * @throws KmallError QuantizationOverflow for an out-of-range field
 */
[[nodiscard]] Bytes encodeQuantized(const CompressedDatagram &dg);

namespace detail {

/**
 * Body decoder for #QZ0/#QZ1.
 *
 * @throws KmallError UnsupportedLevel if the level byte disagrees with the tag
 *         or the codec version is unknown, CorruptCompressedStream if the
 *         original tag is not a quantizable kind or a field is out of range
 */
Datagram decodeQuantized(ByteReader &body, const DatagramHeader &header);

} // namespace detail

} // namespace kmall
