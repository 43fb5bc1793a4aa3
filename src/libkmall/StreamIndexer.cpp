/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Forward scan of a KMALL stream into a FileIndex.
 */

#include <algorithm>
#include <iostream>
#include <optional>
#include <sstream>

#include "ByteReader.hpp"
#include "FileIndex.hpp"
#include "ProtocolConstants.hpp"

namespace kmall {

namespace {

struct Prefix {
    uint32_t numBytesDgm{0};
    std::string tag;
    uint32_t time_sec{0};
    uint32_t time_nanosec{0};
};

bool readAt(std::istream &stream, uint64_t offset, uint8_t *dst, size_t count)
{
    stream.clear();
    stream.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream) {
        return false;
    }
    stream.read(reinterpret_cast<char *>(dst), static_cast<std::streamsize>(count));
    return static_cast<size_t>(stream.gcount()) == count;
}

Prefix parsePrefix(const uint8_t *raw)
{
    ByteReader in(raw, DATAGRAM_HEADER_SIZE);
    Prefix prefix;
    prefix.numBytesDgm = in.read<uint32_t>();
    prefix.tag = in.readString(DATAGRAM_TAG_LENGTH);
    in.skip(4); // version, system id, echosounder id
    prefix.time_sec = in.read<uint32_t>();
    prefix.time_nanosec = in.read<uint32_t>();
    return prefix;
}

bool isPlausible(const Prefix &prefix)
{
    if (prefix.numBytesDgm < MIN_DATAGRAM_SIZE || prefix.numBytesDgm > MAX_DATAGRAM_SIZE) {
        return false;
    }
    if (prefix.tag[0] != DATAGRAM_TAG_MARKER) {
        return false;
    }
    for (size_t i = 1; i < DATAGRAM_TAG_LENGTH; ++i) {
        char c = prefix.tag[i];
        if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))) {
            return false;
        }
    }
    return true;
}

/// Plausible prefix, fully inside the stream, trailing length matching
bool isDatagramAt(std::istream &stream, uint64_t offset, uint64_t fileSize)
{
    if (fileSize - offset < MIN_DATAGRAM_SIZE) {
        return false;
    }
    uint8_t raw[DATAGRAM_HEADER_SIZE];
    if (!readAt(stream, offset, raw, sizeof(raw))) {
        return false;
    }
    Prefix prefix = parsePrefix(raw);
    if (!isPlausible(prefix) || prefix.numBytesDgm > fileSize - offset) {
        return false;
    }
    uint8_t tail[LENGTH_FIELD_SIZE];
    if (!readAt(stream, offset + prefix.numBytesDgm - LENGTH_FIELD_SIZE, tail, sizeof(tail))) {
        return false;
    }
    return ByteReader(tail, sizeof(tail)).read<uint32_t>() == prefix.numBytesDgm;
}

/**
 * Scan forward from @p from for the next offset holding a datagram. Candidates
 * are located by their tag marker, which sits 4 bytes into the datagram.
 */
std::optional<uint64_t> resynchronize(std::istream &stream, uint64_t from, uint64_t fileSize)
{
    std::vector<uint8_t> chunk(RESYNC_CHUNK_SIZE);
    uint64_t scanPos = from + LENGTH_FIELD_SIZE;

    while (scanPos < fileSize) {
        size_t count = static_cast<size_t>(std::min<uint64_t>(RESYNC_CHUNK_SIZE, fileSize - scanPos));
        if (!readAt(stream, scanPos, chunk.data(), count)) {
            return std::nullopt;
        }
        for (size_t i = 0; i < count; ++i) {
            if (chunk[i] != static_cast<uint8_t>(DATAGRAM_TAG_MARKER)) {
                continue;
            }
            uint64_t candidate = scanPos + i - LENGTH_FIELD_SIZE;
            if (isDatagramAt(stream, candidate, fileSize)) {
                return candidate;
            }
        }
        scanPos += count;
    }
    return std::nullopt;
}

void flag(FileIndex &index, uint64_t offset, ErrorCode code, const std::string &message)
{
    std::cerr << "Warning: " << message << " at offset " << offset << "\n";
    index.issues.push_back(IndexIssue{offset, code, message});
}

} // namespace

std::vector<IndexEntry> FileIndex::entriesWithTag(const std::string &tag) const
{
    std::vector<IndexEntry> matching;
    for (const auto &entry : entries) {
        if (entry.tag == tag) {
            matching.push_back(entry);
        }
    }
    return matching;
}

FileIndex buildIndex(std::istream &stream)
{
    FileIndex index;

    stream.clear();
    stream.seekg(0, std::ios::end);
    auto end = stream.tellg();
    if (!stream || end < 0) {
        throw KmallError(ErrorCode::IOFailure, "cannot determine the stream size");
    }
    index.fileSize = static_cast<uint64_t>(end);

    uint64_t pos = 0;
    while (pos < index.fileSize) {
        uint64_t remaining = index.fileSize - pos;
        if (remaining < MIN_DATAGRAM_SIZE) {
            std::stringstream msg;
            msg << remaining << " trailing bytes are too short for a datagram";
            flag(index, pos, ErrorCode::TruncatedStream, msg.str());
            return index;
        }

        uint8_t raw[DATAGRAM_HEADER_SIZE];
        if (!readAt(stream, pos, raw, sizeof(raw))) {
            throw KmallError(ErrorCode::IOFailure, "read failed while indexing");
        }
        Prefix prefix = parsePrefix(raw);

        std::optional<std::string> problem;
        if (!isPlausible(prefix)) {
            std::stringstream msg;
            msg << "implausible datagram prefix (length " << prefix.numBytesDgm << ")";
            problem = msg.str();
        } else if (prefix.numBytesDgm > remaining) {
            std::stringstream msg;
            msg << prefix.tag << " declares " << prefix.numBytesDgm << " bytes but only " << remaining
                << " remain";
            flag(index, pos, ErrorCode::TruncatedStream, msg.str());
            return index;
        } else {
            uint8_t tail[LENGTH_FIELD_SIZE];
            if (!readAt(stream, pos + prefix.numBytesDgm - LENGTH_FIELD_SIZE, tail, sizeof(tail))) {
                throw KmallError(ErrorCode::IOFailure, "read failed while indexing");
            }
            uint32_t trailing = ByteReader(tail, sizeof(tail)).read<uint32_t>();
            if (trailing != prefix.numBytesDgm) {
                std::stringstream msg;
                msg << prefix.tag << " leading length " << prefix.numBytesDgm << " does not match trailing length "
                    << trailing;
                problem = msg.str();
            }
        }

        if (problem) {
            flag(index, pos, ErrorCode::MalformedHeader, *problem);
            auto next = resynchronize(stream, pos + 1, index.fileSize);
            if (!next) {
                flag(index, pos, ErrorCode::TruncatedStream, "no further datagram found");
                return index;
            }
#ifdef DEBUG_INDEX
            std::cout << "resynchronized from " << pos << " to " << *next << "\n";
#endif
            pos = *next;
            continue;
        }

        IndexEntry entry;
        entry.time = static_cast<double>(prefix.time_sec) + static_cast<double>(prefix.time_nanosec) / NANOSEC_PER_SEC;
        entry.offset = pos;
        entry.size = prefix.numBytesDgm;
        entry.tag = prefix.tag;
#ifdef DEBUG_INDEX
        std::cout << entry.tag << " offset " << entry.offset << " size " << entry.size << "\n";
#endif
        index.entries.push_back(entry);
        pos += prefix.numBytesDgm;
    }

    index.complete = true;
    return index;
}

} // namespace kmall
