/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <variant>

#include "DatagramDecoder.hpp"
#include "IntegrityChecker.hpp"
#include "KmallError.hpp"
#include "KmallFile.hpp"
#include "TypeTable.hpp"

namespace kmall {

namespace {

struct PingGroup {
    uint8_t declaredFans{0};
    std::set<uint8_t> fans;
};

/// Place a raw counter value on the unwrapped axis next to the previous one
int64_t unwrap(uint16_t raw, int64_t previous)
{
    auto modulus = static_cast<int64_t>(PING_COUNTER_MODULUS);
    auto threshold = static_cast<int64_t>(PING_COUNTER_WRAP_THRESHOLD);
    int64_t prevRaw = ((previous % modulus) + modulus) % modulus;
    int64_t diff = static_cast<int64_t>(raw) - prevRaw;
    if (diff < -threshold) {
        diff += modulus;
    } else if (diff >= threshold) {
        diff -= modulus;
    }
    return previous + diff;
}

} // namespace

PingReport checkPingCount(const std::vector<PingSample> &samples, int expectedIncrement)
{
    if (expectedIncrement <= 0) {
        throw std::invalid_argument("expected ping increment must be positive");
    }

    PingReport report;
    std::map<int64_t, PingGroup> groups;
    std::optional<int64_t> previous;

    for (const auto &sample : samples) {
        int64_t counter = previous ? unwrap(sample.pingCnt, *previous) : sample.pingCnt;
        previous = counter;

        PingGroup &group = groups[counter];
        group.declaredFans = std::max(group.declaredFans, sample.rxFansPerPing);

        if (sample.rxFanIndex >= sample.rxFansPerPing) {
            ++report.errorCount;
            continue;
        }
        if (!group.fans.insert(sample.rxFanIndex).second) {
            ++report.duplicateMrzRecords;
        }
    }

    if (groups.empty()) {
        return report;
    }

    report.minPingCount = groups.begin()->first;
    report.maxPingCount = groups.rbegin()->first;

    size_t expected = static_cast<size_t>((report.maxPingCount - report.minPingCount) / expectedIncrement) + 1;
    report.pingsMissed = expected > groups.size() ? expected - groups.size() : 0;
    report.totalPings = groups.size() + report.pingsMissed;

    for (const auto &entry : groups) {
        const PingGroup &group = entry.second;
        if (group.declaredFans > group.fans.size()) {
            report.missingMrzRecords += group.declaredFans - group.fans.size();
        }
    }
    return report;
}

PingReport checkPingCount(KmallFile &file, int expectedIncrement)
{
    const FileIndex &index = file.index();
    std::vector<PingSample> samples;
    size_t errors = 0;

    for (const auto &entry : index.entries) {
        bool quantized = entry.tag == TAG_QUANTIZED_LEVEL0 || entry.tag == TAG_QUANTIZED_LEVEL1;
        if (entry.tag != TAG_RANGE_AND_DEPTH && !quantized) {
            continue;
        }
        try {
            MultibeamPrefix prefix = decodeMultibeamCommon(file.readDatagram(entry));
            if (prefix.originalTag != TAG_RANGE_AND_DEPTH) {
                continue;
            }
            samples.push_back(PingSample{prefix.cmnPart.pingCnt, prefix.cmnPart.rxFansPerPing,
                                         prefix.cmnPart.rxFanIndex});
        } catch (const KmallError &ex) {
            std::cerr << "Warning: " << ex.what() << " (record at offset " << entry.offset << " skipped)\n";
            ++errors;
        }
    }

    PingReport report = checkPingCount(samples, expectedIncrement);
    report.errorCount += errors;
    report.indexIssueCount = index.issues.size();
    report.indexComplete = index.complete;
    return report;
}

NavigationReport checkNavigationGaps(const std::vector<double> &times, double gapThreshold)
{
    NavigationReport report;
    report.sampleCount = times.size();
    report.gapThreshold = gapThreshold;
    if (times.size() < 2) {
        return report;
    }

    double sum = 0;
    report.minDelta = std::fabs(times[1] - times[0]);
    report.maxDelta = times[1] - times[0];
    for (size_t i = 1; i < times.size(); ++i) {
        double delta = times[i] - times[i - 1];
        report.minDelta = std::min(report.minDelta, std::fabs(delta));
        report.maxDelta = std::max(report.maxDelta, delta);
        sum += delta;
        if (delta >= gapThreshold) {
            ++report.gapCount;
        }
    }
    report.meanDelta = sum / static_cast<double>(times.size() - 1);
    report.meanFrequency = report.meanDelta != 0 ? 1.0 / report.meanDelta : 0;
    return report;
}

NavigationReport checkNavigationGaps(KmallFile &file, double gapThreshold, const std::optional<std::string> &tag)
{
    const FileIndex &index = file.index();
    std::vector<double> times;
    size_t errors = 0;

    for (const auto &entry : index.entries) {
        if (tag) {
            if (entry.tag != *tag) {
                continue;
            }
        } else {
            const DatagramType *type = findType(entry.tag);
            if (type == nullptr || !type->isNavigation) {
                continue;
            }
        }
        try {
            times.push_back(decodeHeader(file.readDatagram(entry)).time());
        } catch (const KmallError &ex) {
            std::cerr << "Warning: " << ex.what() << " (record at offset " << entry.offset << " skipped)\n";
            ++errors;
        }
    }

    NavigationReport report = checkNavigationGaps(times, gapThreshold);
    report.errorCount = errors;
    report.indexIssueCount = index.issues.size();
    report.indexComplete = index.complete;
    return report;
}

NavigationReport checkAttitudeGaps(KmallFile &file, double gapThreshold)
{
    const FileIndex &index = file.index();
    std::vector<double> times;
    size_t errors = 0;

    for (const auto &entry : index.entries) {
        if (entry.tag != TAG_KM_BINARY) {
            continue;
        }
        try {
            auto skm = std::get<AttitudeDatagram>(decode(file.readDatagram(entry), entry.tag));
            for (const auto &sample : skm.samples) {
                times.push_back(static_cast<double>(sample.kmBinary.time_sec) +
                                static_cast<double>(sample.kmBinary.time_nanosec) / NANOSEC_PER_SEC);
            }
        } catch (const KmallError &ex) {
            std::cerr << "Warning: " << ex.what() << " (record at offset " << entry.offset << " skipped)\n";
            ++errors;
        }
    }

    NavigationReport report = checkNavigationGaps(times, gapThreshold);
    report.errorCount = errors;
    report.indexIssueCount = index.issues.size();
    report.indexComplete = index.complete;
    return report;
}

std::vector<TypeSummary> summarizeTypes(const FileIndex &index)
{
    std::map<std::string, TypeSummary> byTag;
    for (const auto &entry : index.entries) {
        auto it = byTag.find(entry.tag);
        if (it == byTag.end()) {
            TypeSummary summary;
            summary.tag = entry.tag;
            const DatagramType *type = findType(entry.tag);
            if (type != nullptr) {
                summary.description = type->description;
            }
            summary.minSize = entry.size;
            summary.maxSize = entry.size;
            it = byTag.emplace(entry.tag, summary).first;
        }
        TypeSummary &summary = it->second;
        ++summary.count;
        summary.totalBytes += entry.size;
        summary.minSize = std::min(summary.minSize, entry.size);
        summary.maxSize = std::max(summary.maxSize, entry.size);
    }

    std::vector<TypeSummary> result;
    result.reserve(byTag.size());
    for (auto &entry : byTag) {
        result.push_back(entry.second);
    }
    return result;
}

} // namespace kmall
