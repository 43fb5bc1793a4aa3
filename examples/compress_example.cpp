/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Example: compress a KMALL file, restore it and compare ping counts.
 *
 * Usage:
 *   ./compress_example <path_to_kmall_file> [level]
 */

#include "CompressionCodec.hpp"
#include "IntegrityChecker.hpp"
#include "KmallError.hpp"
#include "KmallFile.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

using namespace kmall;

int main(int argc, char *argv[])
{
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <kmall_file> [level]\n";
        return 1;
    }
    auto level = static_cast<uint8_t>(argc == 3 ? std::atoi(argv[2]) : 0);

    try {
        auto original = KmallFile::open(argv[1]);
        auto compressedFile = compress(original, level);

        auto compressed = KmallFile::open(compressedFile);
        auto restoredFile = decompress(compressed);

        std::cout << "original   " << original.fileSize() << " bytes\n";
        std::cout << "compressed " << compressed.fileSize() << " bytes  " << compressedFile.string() << "\n";
        std::cout << "restored   " << std::filesystem::file_size(restoredFile) << " bytes  " << restoredFile.string()
                  << "\n";

        // The ping check reads compressed files directly
        PingReport before = checkPingCount(original);
        PingReport after = checkPingCount(compressed);
        std::cout << "pings: " << before.totalPings << " before, " << after.totalPings << " after\n";
        if (before.pingsMissed != after.pingsMissed || before.missingMrzRecords != after.missingMrzRecords) {
            std::cerr << "Ping statistics differ after compression\n";
            return 1;
        }
    } catch (const KmallError &ex) {
        std::cerr << "Error (" << errorCodeName(ex.code()) << "): " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
