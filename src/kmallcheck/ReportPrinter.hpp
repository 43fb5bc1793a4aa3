/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Text rendering of the integrity reports for kmallcheck.
 */

#pragma once

#include <ostream>
#include <vector>

#include "libkmall/FileIndex.hpp"
#include "libkmall/IntegrityChecker.hpp"

namespace kmallcheck {

void printTypeSummary(const std::vector<kmall::TypeSummary> &summary, std::ostream &outStream);

void printIndexIssues(const kmall::FileIndex &index, std::ostream &outStream);

void printPingReport(const kmall::PingReport &report, std::ostream &outStream);

void printNavigationReport(const kmall::NavigationReport &report, const char *title, std::ostream &outStream);

} // namespace kmallcheck
