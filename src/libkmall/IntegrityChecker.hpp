/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Detection of silent data loss in a KMALL file.
 *
 * The PU drops whole pings or individual receive fans without leaving any
 * other trace, and navigation streams can stall. These checks detect and
 * count such absences; they never try to reconstruct the missing data.
 * Every check is read-only and degrades per record: a datagram that fails to
 * decode is counted in errorCount and skipped. Records the indexer already
 * skipped are counted in indexIssueCount.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "FileIndex.hpp"
#include "ProtocolConstants.hpp"

namespace kmall {

class KmallFile;

/// Ping counter fields of one #MRZ datagram
struct PingSample {
    uint16_t pingCnt{0};
    uint8_t rxFansPerPing{0};
    uint8_t rxFanIndex{0};
};

struct PingReport {
    size_t totalPings{0};          ///< pings seen plus pings missed
    size_t pingsMissed{0};         ///< counter values absent inside the observed range
    size_t missingMrzRecords{0};   ///< receive fans absent from pings that were seen
    size_t duplicateMrzRecords{0}; ///< repeated (ping, fan) pairs
    int64_t minPingCount{0};       ///< after unwrapping the 16-bit counter
    int64_t maxPingCount{0};
    size_t errorCount{0};          ///< undecodable records and out-of-range fan indices
    size_t indexIssueCount{0};     ///< records the indexer flagged and skipped
    bool indexComplete{true};
};

struct NavigationReport {
    size_t sampleCount{0};
    double minDelta{0};      ///< smallest |delta| between consecutive samples, seconds
    double maxDelta{0};
    double meanDelta{0};
    double meanFrequency{0}; ///< 1 / meanDelta, Hz
    size_t gapCount{0};      ///< deltas at or above the threshold
    double gapThreshold{DEFAULT_NAV_GAP_THRESHOLD_SEC};
    size_t errorCount{0};
    size_t indexIssueCount{0};
    bool indexComplete{true};
};

struct TypeSummary {
    std::string tag;
    std::string description; ///< empty for unrecognized tags
    size_t count{0};
    uint64_t totalBytes{0};
    uint32_t minSize{0};
    uint32_t maxSize{0};
};

/**
 * @brief Ping-count arithmetic over samples in file order.
 *
 * The 16-bit counter is unwrapped against the previous sample before
 * grouping. Each group's fan count is the largest rxFansPerPing it declares.
 *
 * @throws std::invalid_argument if expectedIncrement is not positive
 */
[[nodiscard]] PingReport checkPingCount(const std::vector<PingSample> &samples,
                                        int expectedIncrement = DEFAULT_PING_INCREMENT);

/// Collects a PingSample from every #MRZ (plain or quantized) in the file
[[nodiscard]] PingReport checkPingCount(KmallFile &file, int expectedIncrement = DEFAULT_PING_INCREMENT);

/// Gap statistics over timestamps in file order
[[nodiscard]] NavigationReport checkNavigationGaps(const std::vector<double> &times,
                                                   double gapThreshold = DEFAULT_NAV_GAP_THRESHOLD_SEC);

/**
 * Header timestamps of every navigation-bearing datagram (#SKM, #SPO, #CPO,
 * #SCL), or of @p tag only when given.
 */
[[nodiscard]] NavigationReport checkNavigationGaps(KmallFile &file,
                                                   double gapThreshold = DEFAULT_NAV_GAP_THRESHOLD_SEC,
                                                   const std::optional<std::string> &tag = std::nullopt);

/**
 * Sensor timestamps of the individual KM binary samples inside every #SKM
 * datagram. An #SKM batches many attitude samples, so this sees stalls that
 * the datagram header times hide.
 */
[[nodiscard]] NavigationReport checkAttitudeGaps(KmallFile &file,
                                                 double gapThreshold = DEFAULT_NAV_GAP_THRESHOLD_SEC);

/// Per-tag count and size statistics, sorted by tag
[[nodiscard]] std::vector<TypeSummary> summarizeTypes(const FileIndex &index);

} // namespace kmall
