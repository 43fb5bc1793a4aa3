/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Lazy iteration over the datagrams of a KmallFile.
 *
 * The iterator walks the file's index; a RecordView reads or decodes its
 * datagram only when asked, so scanning a large file for one tag costs no
 * more than the index lookups.
 */

#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Datagrams.hpp"
#include "FileIndex.hpp"

namespace kmall {

// Forward declaration
class KmallFile;

class RecordView
{
  public:
    RecordView() = default;
    RecordView(KmallFile *file, const IndexEntry *entry) : m_file(file), m_entry(entry) {}

    [[nodiscard]] const IndexEntry &entry() const { return *m_entry; }
    [[nodiscard]] const std::string &tag() const { return m_entry->tag; }

    /// Raw datagram bytes, read on each call
    [[nodiscard]] Bytes bytes() const;

    /// Decoded datagram, decoded on each call
    [[nodiscard]] Datagram decode() const;

  private:
    KmallFile *m_file{nullptr};
    const IndexEntry *m_entry{nullptr};
};

class RecordIterator
{
  public:
    // Iterator traits
    using iterator_category = std::input_iterator_tag;
    using value_type = RecordView;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type *;
    using reference = const value_type &;

    RecordIterator() = default;

    // Construct begin iterator
    RecordIterator(KmallFile *file, const std::vector<IndexEntry> *entries, std::optional<std::string> tag);

    reference operator*() const { return m_current; }
    pointer operator->() const { return &m_current; }
    RecordIterator &operator++();
    RecordIterator operator++(int);

    bool operator==(const RecordIterator &other) const;
    bool operator!=(const RecordIterator &other) const { return !(*this == other); }

  private:
    /// Move to the first matching entry at or after m_pos
    void settle();

    KmallFile *m_file{nullptr};
    const std::vector<IndexEntry> *m_entries{nullptr};
    std::optional<std::string> m_tag;
    size_t m_pos{0};
    RecordView m_current;
    bool m_isEnd{true};
};

class RecordRange
{
  public:
    RecordRange(KmallFile *file, const std::vector<IndexEntry> *entries, std::optional<std::string> tag)
        : m_file(file), m_entries(entries), m_tag(std::move(tag))
    {
    }

    [[nodiscard]] RecordIterator begin() const { return RecordIterator(m_file, m_entries, m_tag); }
    [[nodiscard]] RecordIterator end() const { return RecordIterator(); }

  private:
    KmallFile *m_file;
    const std::vector<IndexEntry> *m_entries;
    std::optional<std::string> m_tag;
};

} // namespace kmall
