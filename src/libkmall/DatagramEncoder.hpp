/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Synthesizes the on-disk bytes of a datagram.
 *
 * Inverse of decode(). The leading and trailing lengths and every block byte
 * count are recomputed from the content, so callers may freely add or remove
 * soundings, samples or beams before encoding.
 */

#pragma once

#include "ByteReader.hpp"
#include "Datagrams.hpp"

namespace kmall {

/**
 * @throws KmallError MalformedHeader if the tag is not 4 characters starting
 *         with '#', or array elements carry differing extra byte counts
 */
[[nodiscard]] Bytes encode(const Datagram &datagram);

namespace detail {

/// Writes the 20-byte header with a placeholder length
void beginDatagram(ByteWriter &out, const DatagramHeader &header);

/// Appends the trailing length, patches the leading one and hands back the bytes
Bytes finishDatagram(ByteWriter &out);

void writeMultibeamPrefix(ByteWriter &out, const MultibeamPartition &partition, const MultibeamCommon &cmnPart);
void writeMultibeamBody(ByteWriter &out, const MultibeamCommon &cmnPart);

Bytes encodeCompatibilityHeave(const CompatibilityHeaveDatagram &dg);

Bytes encodeDepth(const DepthDatagram &dg);
Bytes encodeWaterColumn(const WaterColumnDatagram &dg);

} // namespace detail

} // namespace kmall
