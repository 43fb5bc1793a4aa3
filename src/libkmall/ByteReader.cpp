/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Bounds-checked little-endian reader and writer.
 */

#include <sstream>

#include "ByteReader.hpp"
#include "KmallError.hpp"

namespace kmall {

void ByteReader::require(size_t count) const
{
    if (count > m_size - m_pos) {
        std::stringstream msg;
        msg << "read of " << count << " bytes at offset " << (m_origin + m_pos) << " exceeds datagram bound "
            << (m_origin + m_size);
        throw KmallError(ErrorCode::TruncatedRecord, msg.str());
    }
}

void ByteReader::readInto(uint8_t *dst, size_t count)
{
    require(count);
    if (count > 0) {
        std::memcpy(dst, m_data + m_pos, count);
    }
    m_pos += count;
}

std::vector<uint8_t> ByteReader::readBytes(size_t count)
{
    require(count);
    std::vector<uint8_t> bytes(m_data + m_pos, m_data + m_pos + count);
    m_pos += count;
    return bytes;
}

std::string ByteReader::readString(size_t count)
{
    require(count);
    std::string text(reinterpret_cast<const char *>(m_data + m_pos), count);
    m_pos += count;
    return text;
}

ByteReader ByteReader::subReader(size_t count)
{
    require(count);
    ByteReader sub(m_data + m_pos, count, m_origin + m_pos);
    m_pos += count;
    return sub;
}

void ByteReader::skip(size_t count)
{
    require(count);
    m_pos += count;
}

void ByteReader::seek(size_t pos)
{
    if (pos > m_size) {
        std::stringstream msg;
        msg << "seek to offset " << (m_origin + pos) << " exceeds datagram bound " << (m_origin + m_size);
        throw KmallError(ErrorCode::TruncatedRecord, msg.str());
    }
    m_pos = pos;
}

void ByteWriter::writeBytes(const uint8_t *src, size_t count)
{
    if (count > 0) {
        m_buffer.insert(m_buffer.end(), src, src + count);
    }
}

void ByteWriter::writeString(const std::string &text, size_t width)
{
    for (size_t i = 0; i < width; ++i) {
        m_buffer.push_back(i < text.size() ? static_cast<uint8_t>(text[i]) : 0);
    }
}

void ByteWriter::patchU16(size_t pos, uint16_t value)
{
    m_buffer.at(pos) = static_cast<uint8_t>(value & 0xFF);
    m_buffer.at(pos + 1) = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void ByteWriter::patchU32(size_t pos, uint32_t value)
{
    for (size_t i = 0; i < 4; ++i) {
        m_buffer.at(pos + i) = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

} // namespace kmall
