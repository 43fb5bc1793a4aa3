/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief An open KMALL file: the file handle plus its cached index.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include "Datagrams.hpp"
#include "FileIndex.hpp"

namespace kmall {

// Forward declaration for the iterator API
class RecordRange;

class KmallFile
{
  public:
    /**
     * @brief Open a file for reading. The index is built on first use.
     *
     * @throws KmallError IOFailure if the file cannot be opened
     */
    [[nodiscard]] static KmallFile open(const std::filesystem::path &path);

    ~KmallFile() = default;

    KmallFile(const KmallFile &) = delete;
    KmallFile &operator=(const KmallFile &) = delete;
    KmallFile(KmallFile &&) = default;
    KmallFile &operator=(KmallFile &&) = default;

    /// The cached index, built on the first call
    [[nodiscard]] const FileIndex &index();

    /// Rescan the file and replace the cached index. Invalidates open ranges.
    const FileIndex &rebuildIndex();

    /**
     * @brief Read the raw bytes of one datagram.
     *
     * @throws KmallError IOFailure if the entry lies outside the file or the
     *         read fails
     */
    [[nodiscard]] Bytes readDatagram(const IndexEntry &entry);

    /// readDatagram() followed by kmall::decode() against the entry's tag
    [[nodiscard]] Datagram decode(const IndexEntry &entry);

    /**
     * @brief Lazy range over the indexed datagrams.
     *
     * Nothing is read until a record's bytes or decoded form is requested.
     * The range refers to this file's index and must not outlive it.
     *
     * Example:
     * @code
     *   auto file = KmallFile::open("0001_20240101_000000.kmall");
     *   for (const auto &record : file.records(TAG_RANGE_AND_DEPTH)) {
     *       auto mrz = std::get<DepthDatagram>(record.decode());
     *       std::cout << mrz.cmnPart.pingCnt << "\n";
     *   }
     * @endcode
     *
     * @param tag restrict to one datagram tag, or every record if empty
     */
    [[nodiscard]] RecordRange records(const std::optional<std::string> &tag = std::nullopt);

    [[nodiscard]] const std::filesystem::path &path() const { return m_path; }
    [[nodiscard]] uint64_t fileSize() const { return m_fileSize; }

  private:
    KmallFile(std::filesystem::path path, std::ifstream stream, uint64_t fileSize);

    std::filesystem::path m_path;
    std::ifstream m_stream;
    uint64_t m_fileSize{0};
    std::optional<FileIndex> m_index;
};

} // namespace kmall
