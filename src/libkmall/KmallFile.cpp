/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <sstream>
#include <utility>

#include "DatagramDecoder.hpp"
#include "KmallError.hpp"
#include "KmallFile.hpp"
#include "RecordIterator.hpp"

namespace kmall {

KmallFile::KmallFile(std::filesystem::path path, std::ifstream stream, uint64_t fileSize)
    : m_path(std::move(path)), m_stream(std::move(stream)), m_fileSize(fileSize)
{
}

KmallFile KmallFile::open(const std::filesystem::path &path)
{
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw KmallError(ErrorCode::IOFailure, "cannot open " + path.string());
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw KmallError(ErrorCode::IOFailure, "cannot size " + path.string() + ": " + ec.message());
    }
    return KmallFile(path, std::move(stream), static_cast<uint64_t>(size));
}

const FileIndex &KmallFile::index()
{
    if (!m_index) {
        return rebuildIndex();
    }
    return *m_index;
}

const FileIndex &KmallFile::rebuildIndex()
{
    FileIndex fresh = buildIndex(m_stream);
    m_index = std::move(fresh);
    return *m_index;
}

Bytes KmallFile::readDatagram(const IndexEntry &entry)
{
    if (entry.offset > m_fileSize || entry.size > m_fileSize - entry.offset) {
        std::stringstream msg;
        msg << "datagram at offset " << entry.offset << " of " << entry.size << " bytes lies outside "
            << m_path.string() << " (" << m_fileSize << " bytes)";
        throw KmallError(ErrorCode::IOFailure, msg.str());
    }

    Bytes buffer(entry.size);
    m_stream.clear();
    m_stream.seekg(static_cast<std::streamoff>(entry.offset), std::ios::beg);
    m_stream.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (static_cast<size_t>(m_stream.gcount()) != buffer.size()) {
        std::stringstream msg;
        msg << "short read of " << entry.tag << " at offset " << entry.offset << " in " << m_path.string();
        throw KmallError(ErrorCode::IOFailure, msg.str());
    }
    return buffer;
}

Datagram KmallFile::decode(const IndexEntry &entry) { return kmall::decode(readDatagram(entry), entry.tag); }

RecordRange KmallFile::records(const std::optional<std::string> &tag)
{
    return RecordRange(this, &index().entries, tag);
}

} // namespace kmall
