/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <cstddef>
#include <cstdint>
#include <iomanip>

#include "ReportPrinter.hpp"
#include "libkmall/KmallError.hpp"

namespace kmallcheck {

namespace {

void printSkipped(size_t indexIssueCount, bool indexComplete, std::ostream &outStream)
{
    if (indexIssueCount > 0) {
        outStream << "  skipped by indexer   " << indexIssueCount << "\n";
    }
    if (!indexComplete) {
        outStream << "  (file index incomplete, counts cover the indexed part only)\n";
    }
}

} // namespace

void printTypeSummary(const std::vector<kmall::TypeSummary> &summary, std::ostream &outStream)
{
    outStream << std::left << std::setw(6) << "Tag" << std::right << std::setw(10) << "Count" << std::setw(14)
              << "Bytes" << std::setw(10) << "Min" << std::setw(10) << "Max"
              << "  Description\n";

    uint64_t totalBytes = 0;
    size_t totalCount = 0;
    for (const auto &type : summary) {
        outStream << std::left << std::setw(6) << type.tag << std::right << std::setw(10) << type.count
                  << std::setw(14) << type.totalBytes << std::setw(10) << type.minSize << std::setw(10)
                  << type.maxSize << "  " << (type.description.empty() ? "(unrecognized)" : type.description)
                  << "\n";
        totalBytes += type.totalBytes;
        totalCount += type.count;
    }
    outStream << std::left << std::setw(6) << "Total" << std::right << std::setw(10) << totalCount << std::setw(14)
              << totalBytes << "\n";
}

void printIndexIssues(const kmall::FileIndex &index, std::ostream &outStream)
{
    if (index.issues.empty()) {
        return;
    }
    outStream << "Index issues:\n";
    for (const auto &issue : index.issues) {
        outStream << "  offset " << issue.offset << ": " << kmall::errorCodeName(issue.code) << " - "
                  << issue.message << "\n";
    }
    if (!index.complete) {
        outStream << "  index stops before the end of the file\n";
    }
}

void printPingReport(const kmall::PingReport &report, std::ostream &outStream)
{
    outStream << "Ping count check:\n";
    if (report.totalPings == 0) {
        outStream << "  no #MRZ datagrams\n";
        printSkipped(report.indexIssueCount, report.indexComplete, outStream);
        return;
    }
    double missedPct = 100.0 * static_cast<double>(report.pingsMissed) / static_cast<double>(report.totalPings);
    outStream << "  ping counter range   " << report.minPingCount << " - " << report.maxPingCount << "\n";
    outStream << "  total pings          " << report.totalPings << "\n";
    outStream << "  pings missed         " << report.pingsMissed << " (" << std::fixed << std::setprecision(2)
              << missedPct << "%)\n";
    outStream << "  missing #MRZ records " << report.missingMrzRecords << "\n";
    outStream << "  duplicate #MRZ       " << report.duplicateMrzRecords << "\n";
    if (report.errorCount > 0) {
        outStream << "  unreadable records   " << report.errorCount << "\n";
    }
    printSkipped(report.indexIssueCount, report.indexComplete, outStream);
    outStream << std::defaultfloat;
}

void printNavigationReport(const kmall::NavigationReport &report, const char *title, std::ostream &outStream)
{
    outStream << title << ":\n";
    if (report.sampleCount < 2) {
        outStream << "  " << report.sampleCount << " sample(s), nothing to compare\n";
        printSkipped(report.indexIssueCount, report.indexComplete, outStream);
        return;
    }
    outStream << std::fixed << std::setprecision(3);
    outStream << "  samples              " << report.sampleCount << "\n";
    outStream << "  min delta            " << report.minDelta << " s\n";
    outStream << "  max delta            " << report.maxDelta << " s\n";
    outStream << "  mean delta           " << report.meanDelta << " s (" << report.meanFrequency << " Hz)\n";
    outStream << "  gaps >= " << report.gapThreshold << " s     " << report.gapCount << "\n";
    if (report.errorCount > 0) {
        outStream << "  unreadable records   " << report.errorCount << "\n";
    }
    printSkipped(report.indexIssueCount, report.indexComplete, outStream);
    outStream << std::defaultfloat;
}

} // namespace kmallcheck
