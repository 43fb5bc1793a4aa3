/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Error taxonomy for reading, checking and compressing KMALL files.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace kmall {

enum class ErrorCode {
    MalformedHeader,         ///< leading/trailing length mismatch or bad struct size
    TruncatedRecord,         ///< read past the declared datagram length
    TruncatedStream,         ///< declared length exceeds the bytes left in the file
    UnrecognizedTag,         ///< no schema for the tag (reported, never thrown)
    UnsupportedLevel,        ///< decompression input lacks a valid synthetic marker
    CorruptCompressedStream, ///< quantized field decodes to an out-of-range value
    QuantizationOverflow,    ///< value does not fit its quantized field
    IOFailure                ///< open/seek/read/write failure
};

inline const char *errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::MalformedHeader:
        return "MalformedHeader";
    case ErrorCode::TruncatedRecord:
        return "TruncatedRecord";
    case ErrorCode::TruncatedStream:
        return "TruncatedStream";
    case ErrorCode::UnrecognizedTag:
        return "UnrecognizedTag";
    case ErrorCode::UnsupportedLevel:
        return "UnsupportedLevel";
    case ErrorCode::CorruptCompressedStream:
        return "CorruptCompressedStream";
    case ErrorCode::QuantizationOverflow:
        return "QuantizationOverflow";
    case ErrorCode::IOFailure:
        return "IOFailure";
    }
    return "Unknown";
}

/**
 * Exception thrown by every libkmall operation that fails. what() carries
 * the human readable detail, code() the category.
 */
class KmallError : public std::runtime_error
{
  public:
    KmallError(ErrorCode code, const std::string &message) : std::runtime_error(message), m_code(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

  private:
    ErrorCode m_code;
};

} // namespace kmall
