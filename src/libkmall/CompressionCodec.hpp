/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief File-level lossy compression of KMALL files.
 *
 * Retention levels:
 *   0  #MRZ and #MWC quantized under #QZ0, seabed image kept
 *   1  #MRZ quantized under #QZ1 with its seabed image dropped, #MWC copied
 *
 * Every other datagram is copied byte for byte. The input file is never
 * modified. Output goes to `<output>.partial` first and replaces the output
 * path only when the run completes, so a failed run leaves any earlier file at
 * that path as it was.
 */

#pragma once

#include <cstdint>
#include <filesystem>

namespace kmall {

class KmallFile;

/// `<dir>/<stem>.qz<level>.kmall`
[[nodiscard]] std::filesystem::path compressedPath(const std::filesystem::path &input, uint8_t level);

/// `<dir>/<stem>.restored.kmall`, with any `.qzN` removed from the stem
[[nodiscard]] std::filesystem::path restoredPath(const std::filesystem::path &input);

/**
 * @brief Write the quantized copy of @p file.
 *
 * @return path of the written file
 * @throws KmallError UnsupportedLevel for a level above MAX_RETENTION_LEVEL,
 *         QuantizationOverflow for a field outside its range, IOFailure,
 *         or any decode error of a quantized datagram
 */
std::filesystem::path compress(KmallFile &file, uint8_t level);

/**
 * @brief Write the dequantized copy of a compressed file.
 *
 * @return path of the written file
 * @throws KmallError UnsupportedLevel if the file holds no synthetic datagram,
 *         mixes levels or still holds a raw #MRZ; CorruptCompressedStream for
 *         out-of-range fields; IOFailure
 */
std::filesystem::path decompress(KmallFile &file);

} // namespace kmall
