/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Example demonstrating the record iterator API of libkmall.
 *
 * Walks the #MRZ datagrams of a file and prints the ping counter, the number
 * of soundings and the depth range of each one. Records are read and decoded
 * only when the loop asks for them.
 *
 * Usage:
 *   ./record_iterator_example <path_to_kmall_file>
 */

#include "KmallError.hpp"
#include "KmallFile.hpp"
#include "ProtocolConstants.hpp"
#include "RecordIterator.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <variant>

using namespace kmall;

int main(int argc, char *argv[])
{
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <kmall_file>\n";
        return 1;
    }

    try {
        auto file = KmallFile::open(argv[1]);

        const FileIndex &index = file.index();
        std::cout << "Indexed " << index.entries.size() << " datagrams in " << index.fileSize << " bytes\n";
        if (!index.complete) {
            std::cout << "Warning: index stops early (" << index.issues.size() << " issue(s))\n";
        }

        std::cout << std::fixed << std::setprecision(2);
        int pingCount = 0;
        for (const auto &record : file.records(TAG_RANGE_AND_DEPTH)) {
            auto mrz = std::get<DepthDatagram>(record.decode());

            float minDepth = 0;
            float maxDepth = 0;
            bool first = true;
            for (const auto &sounding : mrz.soundings) {
                if (first) {
                    minDepth = maxDepth = sounding.z_reRefPoint_m;
                    first = false;
                }
                minDepth = std::min(minDepth, sounding.z_reRefPoint_m);
                maxDepth = std::max(maxDepth, sounding.z_reRefPoint_m);
            }

            std::cout << "Ping " << mrz.cmnPart.pingCnt << " fan " << static_cast<int>(mrz.cmnPart.rxFanIndex) << "/"
                      << static_cast<int>(mrz.cmnPart.rxFansPerPing) << ": " << mrz.soundings.size()
                      << " soundings, depth " << minDepth << " - " << maxDepth << " m\n";
            ++pingCount;
        }
        std::cout << pingCount << " #MRZ datagrams\n";

    } catch (const KmallError &ex) {
        std::cerr << "Error (" << errorCodeName(ex.code()) << "): " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
