/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Bounds-checked little-endian cursor over a datagram buffer, and the
 * matching writer used to synthesize datagrams.
 *
 * KMALL bodies are sequences where the size of later fields depends on the
 * values of earlier ones. Every read goes through ByteReader, which refuses to
 * move past the end of its window and reports the offending offset.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace kmall {

class ByteReader
{
  public:
    /**
     * @param data   start of the window
     * @param size   number of readable bytes
     * @param origin offset of data[0] within the datagram, used in messages
     */
    ByteReader(const uint8_t *data, size_t size, size_t origin = 0) : m_data(data), m_size(size), m_origin(origin) {}

    explicit ByteReader(const std::vector<uint8_t> &buffer) : ByteReader(buffer.data(), buffer.size()) {}

    template <typename T> T read()
    {
        static_assert(std::is_arithmetic<T>::value, "ByteReader::read needs an arithmetic type");
        require(sizeof(T));
        const uint8_t *p = m_data + m_pos;
        m_pos += sizeof(T);

        if constexpr (std::is_floating_point<T>::value) {
            using Bits = typename std::conditional<sizeof(T) == 4, uint32_t, uint64_t>::type;
            Bits bits = decodeLE<Bits>(p);
            T value;
            std::memcpy(&value, &bits, sizeof(T));
            return value;
        } else {
            using U = typename std::make_unsigned<T>::type;
            return static_cast<T>(decodeLE<U>(p));
        }
    }

    void readInto(uint8_t *dst, size_t count);
    [[nodiscard]] std::vector<uint8_t> readBytes(size_t count);
    [[nodiscard]] std::string readString(size_t count);

    /**
     * Carve the next @p count bytes out as an independent reader and advance
     * past them. Used for struct blocks that declare their own size.
     */
    [[nodiscard]] ByteReader subReader(size_t count);

    void skip(size_t count);
    void seek(size_t pos);

    [[nodiscard]] size_t position() const { return m_pos; }
    [[nodiscard]] size_t remaining() const { return m_size - m_pos; }
    [[nodiscard]] size_t size() const { return m_size; }
    [[nodiscard]] size_t origin() const { return m_origin; }
    [[nodiscard]] bool atEnd() const { return m_pos == m_size; }

  private:
    void require(size_t count) const;

    template <typename U> static U decodeLE(const uint8_t *p)
    {
        U value = 0;
        for (size_t i = 0; i < sizeof(U); ++i) {
            value |= static_cast<U>(static_cast<U>(p[i]) << (8 * i));
        }
        return value;
    }

    const uint8_t *m_data;
    size_t m_size;
    size_t m_origin;
    size_t m_pos{0};
};

class ByteWriter
{
  public:
    ByteWriter() = default;

    template <typename T> void write(T value)
    {
        static_assert(std::is_arithmetic<T>::value, "ByteWriter::write needs an arithmetic type");
        if constexpr (std::is_floating_point<T>::value) {
            using Bits = typename std::conditional<sizeof(T) == 4, uint32_t, uint64_t>::type;
            Bits bits;
            std::memcpy(&bits, &value, sizeof(T));
            encodeLE(bits);
        } else {
            encodeLE(static_cast<typename std::make_unsigned<T>::type>(value));
        }
    }

    void writeBytes(const uint8_t *src, size_t count);
    void writeBytes(const std::vector<uint8_t> &bytes) { writeBytes(bytes.data(), bytes.size()); }

    /// Writes exactly @p width bytes: truncates or zero-pads @p text.
    void writeString(const std::string &text, size_t width);
    void writeString(const std::string &text) { writeString(text, text.size()); }

    /// Overwrites a previously written u16/u32 at @p pos.
    void patchU16(size_t pos, uint16_t value);
    void patchU32(size_t pos, uint32_t value);

    [[nodiscard]] size_t size() const { return m_buffer.size(); }
    [[nodiscard]] const std::vector<uint8_t> &buffer() const { return m_buffer; }
    [[nodiscard]] std::vector<uint8_t> release() { return std::move(m_buffer); }

  private:
    template <typename U> void encodeLE(U value)
    {
        for (size_t i = 0; i < sizeof(U); ++i) {
            m_buffer.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
        }
    }

    std::vector<uint8_t> m_buffer;
};

} // namespace kmall
