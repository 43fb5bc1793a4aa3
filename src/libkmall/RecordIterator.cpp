/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <utility>

#include "KmallFile.hpp"
#include "RecordIterator.hpp"

namespace kmall {

// =============================================================================
// RecordView
// =============================================================================

Bytes RecordView::bytes() const { return m_file->readDatagram(*m_entry); }

Datagram RecordView::decode() const { return m_file->decode(*m_entry); }

// =============================================================================
// RecordIterator
// =============================================================================

RecordIterator::RecordIterator(KmallFile *file, const std::vector<IndexEntry> *entries,
                               std::optional<std::string> tag)
    : m_file(file), m_entries(entries), m_tag(std::move(tag)), m_pos(0), m_isEnd(false)
{
    if (!m_file || !m_entries) {
        m_isEnd = true;
        return;
    }
    settle();
}

void RecordIterator::settle()
{
    while (m_pos < m_entries->size()) {
        const IndexEntry &entry = (*m_entries)[m_pos];
        if (!m_tag || entry.tag == *m_tag) {
            m_current = RecordView(m_file, &entry);
            return;
        }
        ++m_pos;
    }
    m_isEnd = true;
    m_current = RecordView();
}

RecordIterator &RecordIterator::operator++()
{
    if (!m_isEnd) {
        ++m_pos;
        settle();
    }
    return *this;
}

RecordIterator RecordIterator::operator++(int)
{
    RecordIterator tmp = *this;
    ++(*this);
    return tmp;
}

bool RecordIterator::operator==(const RecordIterator &other) const
{
    if (m_isEnd && other.m_isEnd) {
        return true;
    }
    if (m_isEnd != other.m_isEnd) {
        return false;
    }
    return m_entries == other.m_entries && m_pos == other.m_pos;
}

} // namespace kmall
