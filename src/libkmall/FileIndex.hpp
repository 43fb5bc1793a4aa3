/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Sequential index of the datagrams in a KMALL stream.
 */

#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "KmallError.hpp"

namespace kmall {

struct IndexEntry {
    double time{0};     ///< header timestamp, seconds
    uint64_t offset{0}; ///< position of the leading length field
    uint32_t size{0};   ///< numBytesDgm
    std::string tag;
};

/// A record the indexer could not accept, or the reason the index stops early
struct IndexIssue {
    uint64_t offset{0};
    ErrorCode code{ErrorCode::MalformedHeader};
    std::string message;
};

struct FileIndex {
    std::vector<IndexEntry> entries; ///< strictly increasing offsets
    uint64_t fileSize{0};
    bool complete{false}; ///< entries run to the end of the stream
    std::vector<IndexIssue> issues;

    [[nodiscard]] std::vector<IndexEntry> entriesWithTag(const std::string &tag) const;
};

/**
 * @brief Build the index of a KMALL stream in one forward pass.
 *
 * Only the 20-byte header prefix and the trailing length field of each
 * datagram are read. A record with an implausible prefix or a trailing length
 * that disagrees with the leading one is flagged and skipped; the scan then
 * resumes at the next offset holding a plausible, self-consistent datagram.
 * A datagram running past the end of the stream ends the scan and leaves the
 * index incomplete.
 *
 * @throws KmallError IOFailure if the stream cannot be sized or read at all
 */
[[nodiscard]] FileIndex buildIndex(std::istream &stream);

} // namespace kmall
