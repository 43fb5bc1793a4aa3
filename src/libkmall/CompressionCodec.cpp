/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

#include "CompressionCodec.hpp"
#include "DatagramDecoder.hpp"
#include "DatagramEncoder.hpp"
#include "KmallError.hpp"
#include "KmallFile.hpp"
#include "ProtocolConstants.hpp"
#include "QuantizedDatagram.hpp"
#include "TypeTable.hpp"

namespace kmall {

namespace {

bool isQuantizedTag(const std::string &tag) { return tag == TAG_QUANTIZED_LEVEL0 || tag == TAG_QUANTIZED_LEVEL1; }

/// The codec only runs over cleanly indexed input
void requireCleanIndex(const FileIndex &index, const std::filesystem::path &path)
{
    if (!index.issues.empty()) {
        const IndexIssue &issue = index.issues.front();
        std::stringstream msg;
        msg << path.string() << ": " << issue.message << " at offset " << issue.offset;
        throw KmallError(issue.code, msg.str());
    }
}

/**
 * Output written to `<output>.partial` and renamed over @p output only by
 * commit(). Until then nothing at the output path is touched, and the partial
 * file is removed when the object goes away.
 */
class OutputFile
{
  public:
    OutputFile(const std::filesystem::path &input, std::filesystem::path output)
        : m_output(std::move(output)), m_partial(m_output)
    {
        std::error_code ec;
        if (std::filesystem::equivalent(input, m_output, ec)) {
            throw KmallError(ErrorCode::IOFailure, "refusing to overwrite the input file " + input.string());
        }
        m_partial += PARTIAL_OUTPUT_SUFFIX;
        m_stream.open(m_partial, std::ios::binary | std::ios::trunc);
        if (!m_stream.is_open()) {
            throw KmallError(ErrorCode::IOFailure, "cannot create " + m_partial.string());
        }
    }
    ~OutputFile()
    {
        if (!m_committed) {
            m_stream.close();
            std::error_code ec;
            std::filesystem::remove(m_partial, ec);
        }
    }

    OutputFile(const OutputFile &) = delete;
    OutputFile &operator=(const OutputFile &) = delete;

    void write(const Bytes &bytes)
    {
        m_stream.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!m_stream) {
            throw KmallError(ErrorCode::IOFailure, "write to " + m_partial.string() + " failed");
        }
    }

    void commit()
    {
        m_stream.close();
        if (m_stream.fail()) {
            throw KmallError(ErrorCode::IOFailure, "cannot finish writing " + m_partial.string());
        }
        std::error_code ec;
        std::filesystem::rename(m_partial, m_output, ec);
        if (ec) {
            throw KmallError(ErrorCode::IOFailure,
                             "cannot move " + m_partial.string() + " to " + m_output.string() + ": " + ec.message());
        }
        m_committed = true;
    }

    [[nodiscard]] const std::filesystem::path &path() const { return m_output; }

  private:
    std::filesystem::path m_output;
    std::filesystem::path m_partial;
    std::ofstream m_stream;
    bool m_committed{false};
};

/// #MRZ at every level, #MWC at level 0 only
bool quantizedAtLevel(const std::string &tag, uint8_t level)
{
    const DatagramType *type = findType(tag);
    if (type == nullptr || !type->isCompressible) {
        return false;
    }
    return tag != TAG_WATER_COLUMN || level == 0;
}

} // namespace

std::filesystem::path compressedPath(const std::filesystem::path &input, uint8_t level)
{
    std::string name = input.stem().string() + COMPRESSED_SUFFIX_PREFIX + std::to_string(level) + KMALL_EXTENSION;
    return input.parent_path() / name;
}

std::filesystem::path restoredPath(const std::filesystem::path &input)
{
    std::string stem = input.stem().string();
    auto dot = stem.rfind(COMPRESSED_SUFFIX_PREFIX);
    if (dot != std::string::npos && dot + std::string(COMPRESSED_SUFFIX_PREFIX).size() + 1 == stem.size()) {
        stem.erase(dot);
    }
    return input.parent_path() / (stem + RESTORED_SUFFIX + KMALL_EXTENSION);
}

std::filesystem::path compress(KmallFile &file, uint8_t level)
{
    if (level > MAX_RETENTION_LEVEL) {
        std::stringstream msg;
        msg << "retention level " << static_cast<int>(level) << " is not supported, expected 0 to "
            << static_cast<int>(MAX_RETENTION_LEVEL);
        throw KmallError(ErrorCode::UnsupportedLevel, msg.str());
    }

    const FileIndex &index = file.index();
    requireCleanIndex(index, file.path());
    for (const auto &entry : index.entries) {
        if (isQuantizedTag(entry.tag)) {
            std::stringstream msg;
            msg << file.path().string() << " is already compressed (" << entry.tag << " at offset " << entry.offset
                << ")";
            throw KmallError(ErrorCode::UnsupportedLevel, msg.str());
        }
    }

    OutputFile out(file.path(), compressedPath(file.path(), level));
    for (const auto &entry : index.entries) {
        Bytes bytes = file.readDatagram(entry);
        if (quantizedAtLevel(entry.tag, level)) {
            CompressedDatagram dg = makeCompressed(decode(bytes, entry.tag), level);
            out.write(encodeQuantized(dg));
        } else {
            out.write(bytes);
        }
    }
    out.commit();

#ifdef DEBUG_CODEC
    std::cout << "wrote " << out.path().string() << " at level " << static_cast<int>(level) << "\n";
#endif
    return out.path();
}

std::filesystem::path decompress(KmallFile &file)
{
    const FileIndex &index = file.index();
    requireCleanIndex(index, file.path());

    std::optional<std::string> syntheticTag;
    for (const auto &entry : index.entries) {
        if (entry.tag == TAG_RANGE_AND_DEPTH) {
            std::stringstream msg;
            msg << file.path().string() << " holds an uncompressed #MRZ at offset " << entry.offset;
            throw KmallError(ErrorCode::UnsupportedLevel, msg.str());
        }
        if (isQuantizedTag(entry.tag)) {
            if (syntheticTag && *syntheticTag != entry.tag) {
                std::stringstream msg;
                msg << file.path().string() << " mixes " << *syntheticTag << " and " << entry.tag << " datagrams";
                throw KmallError(ErrorCode::UnsupportedLevel, msg.str());
            }
            syntheticTag = entry.tag;
        }
    }
    if (!syntheticTag) {
        throw KmallError(ErrorCode::UnsupportedLevel, file.path().string() + " holds no compressed datagrams");
    }

    OutputFile out(file.path(), restoredPath(file.path()));
    for (const auto &entry : index.entries) {
        Bytes bytes = file.readDatagram(entry);
        if (isQuantizedTag(entry.tag)) {
            auto dg = std::get<CompressedDatagram>(decode(bytes, entry.tag));
            out.write(encode(restoreVendor(dg)));
        } else {
            out.write(bytes);
        }
    }
    out.commit();

#ifdef DEBUG_CODEC
    std::cout << "wrote " << out.path().string() << " from " << *syntheticTag << " datagrams\n";
#endif
    return out.path();
}

} // namespace kmall
