/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief kmallcheck: inspect, verify and compress KMALL files.
 *
 * Without options every file gets a datagram type summary. -V adds the ping
 * count, navigation gap and attitude sample gap checks, -z and -u run the
 * lossy codec.
 */

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include "getopt.h"
#else
#include <unistd.h>
#endif

#include "ReportPrinter.hpp"
#include "libkmall/CompressionCodec.hpp"
#include "libkmall/IntegrityChecker.hpp"
#include "libkmall/KmallError.hpp"
#include "libkmall/KmallFile.hpp"
#include "libkmall/ProtocolConstants.hpp"

using namespace kmall;
using namespace kmallcheck;

static bool g_verbose = false;

enum class Action { Summary, Verify, Compress, Decompress };

struct Options {
    Action action{Action::Summary};
    double gapThreshold{DEFAULT_NAV_GAP_THRESHOLD_SEC};
    int pingIncrement{DEFAULT_PING_INCREMENT};
    uint8_t level{0};
    std::string outputFile;
};

/// Recursively collects *.kmall files under @p dir, sorted by path
std::vector<std::string> findKmallFiles(const std::string &dir)
{
    std::vector<std::string> found;
    std::error_code ec;
    for (std::filesystem::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (it->is_regular_file(entryEc) && it->path().extension() == KMALL_EXTENSION) {
            found.push_back(it->path().string());
        }
    }
    if (ec) {
        std::cerr << "Warning: " << dir << ": " << ec.message() << "\n";
    }
    std::sort(found.begin(), found.end());
    return found;
}

void verifyFile(KmallFile &file, const Options &opts, std::ostream &outStream)
{
    const FileIndex &index = file.index();
    printTypeSummary(summarizeTypes(index), outStream);
    printIndexIssues(index, outStream);
    printPingReport(checkPingCount(file, opts.pingIncrement), outStream);
    printNavigationReport(checkNavigationGaps(file, opts.gapThreshold), "Navigation gap check", outStream);
    printNavigationReport(checkAttitudeGaps(file, opts.gapThreshold), "Attitude sample gap check", outStream);
}

/// @return false if the file could not be processed
bool processFile(const std::string &filename, const Options &opts, std::ostream &outStream)
{
    std::filesystem::path inputFilePath{filename};
    std::error_code ec;

    auto length = std::filesystem::file_size(inputFilePath, ec);
    if (ec.value() != 0) {
        std::cerr << filename << ": No such file\n";
        return false;
    }
    if (length == 0) {
        std::cerr << filename << ": Empty file\n";
        return false;
    }

    try {
        KmallFile file = KmallFile::open(inputFilePath);

        switch (opts.action) {
        case Action::Summary:
            printTypeSummary(summarizeTypes(file.index()), outStream);
            printIndexIssues(file.index(), outStream);
            break;
        case Action::Verify:
            verifyFile(file, opts, outStream);
            break;
        case Action::Compress: {
            auto output = compress(file, opts.level);
            if (g_verbose) {
                auto written = std::filesystem::file_size(output, ec);
                std::cout << "Wrote " << output.string() << " (" << length << " -> " << written << " bytes)\n";
            }
            break;
        }
        case Action::Decompress: {
            auto output = decompress(file);
            if (g_verbose) {
                std::cout << "Wrote " << output.string() << "\n";
            }
            break;
        }
        }
    } catch (const KmallError &ex) {
        std::cerr << filename << ": " << errorCodeName(ex.code()) << ": " << ex.what() << "\n";
        return false;
    }
    return true;
}

int processFiles(const std::vector<std::string> &filelist, const Options &opts)
{
    std::ofstream outFileStream;
    if (!opts.outputFile.empty()) {
        outFileStream.open(opts.outputFile, std::ios::out | std::ios::trunc);
        if (!outFileStream.is_open()) {
            std::cerr << "Couldn't open output file\n";
            return 1;
        }
    }
    std::ostream &outStream = (opts.outputFile.empty() ? std::cout : outFileStream);

    int failures = 0;
    for (auto &&filename : filelist) {
        if (filelist.size() > 1 || g_verbose) {
            outStream << filename << std::endl;
        }
        if (!processFile(filename, opts, outStream)) {
            ++failures;
        }
        if (filelist.size() > 1) {
            outStream << std::endl;
        }
    }
    return failures == 0 ? 0 : 1;
}

void showHelp(char *progName)
{
    std::cout << "Usage: " << progName << " [options] kmallfile..." << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "    -h              print this help" << std::endl;
    std::cout << "    -d <dir>        process every .kmall file below a directory" << std::endl;
    std::cout << "    -p              print the datagram type summary (default)" << std::endl;
    std::cout << "    -V              verify: type summary, ping count, navigation and attitude gap checks" << std::endl;
    std::cout << "    -g <seconds>    navigation gap threshold (default " << DEFAULT_NAV_GAP_THRESHOLD_SEC << ")"
              << std::endl;
    std::cout << "    -i <n>          expected ping counter increment (default " << DEFAULT_PING_INCREMENT << ")"
              << std::endl;
    std::cout << "    -z              compress into <name>.qz<level>.kmall" << std::endl;
    std::cout << "    -l <level>      retention level for -z, 0 or 1 (default 0)" << std::endl;
    std::cout << "    -u              decompress into <name>.restored.kmall" << std::endl;
    std::cout << "    -o <filename>   write reports to a file" << std::endl;
    std::cout << "    -v              verbose output" << std::endl;
}

/// Parses a whole-string integer; prints an error and returns nullopt otherwise
std::optional<long> parseInteger(const char *arg, const char *what)
{
    try {
        size_t idx = 0;
        long value = std::stol(arg, &idx);
        if (idx != strlen(arg)) {
            std::cerr << "Error: Invalid " << what << " (contains non-numeric characters): " << arg << std::endl;
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument &) {
        std::cerr << "Error: " << what << " must be a valid integer: " << arg << std::endl;
    } catch (const std::out_of_range &) {
        std::cerr << "Error: " << what << " out of range: " << arg << std::endl;
    }
    return std::nullopt;
}

int main(int argc, char *argv[])
{
    Options opts;
    std::vector<std::string> filelist{};
    std::vector<std::string> dirs{};
    bool compressRequested{false};
    bool decompressRequested{false};

    int c;
    while ((c = getopt(argc, argv, "hd:pVg:i:zl:uo:v")) != -1) {
        switch (c) {
        case 'h':
            showHelp(argv[0]);
            return 0;
        case 'd':
            dirs.push_back(optarg);
            break;
        case 'p':
            opts.action = Action::Summary;
            break;
        case 'V':
            opts.action = Action::Verify;
            break;
        case 'g':
            try {
                size_t idx = 0;
                opts.gapThreshold = std::stod(optarg, &idx);
                if (idx != strlen(optarg) || opts.gapThreshold <= 0) {
                    std::cerr << "Error: Gap threshold must be a positive number of seconds: " << optarg << std::endl;
                    return 1;
                }
            } catch (const std::logic_error &) {
                std::cerr << "Error: Gap threshold must be a number: " << optarg << std::endl;
                return 1;
            }
            break;
        case 'i': {
            auto value = parseInteger(optarg, "ping increment");
            if (!value) {
                return 1;
            }
            if (*value <= 0 || *value >= static_cast<long>(PING_COUNTER_WRAP_THRESHOLD)) {
                std::cerr << "Error: Ping increment must be between 1 and " << PING_COUNTER_WRAP_THRESHOLD - 1
                          << std::endl;
                return 1;
            }
            opts.pingIncrement = static_cast<int>(*value);
            break;
        }
        case 'z':
            compressRequested = true;
            break;
        case 'l': {
            auto value = parseInteger(optarg, "retention level");
            if (!value) {
                return 1;
            }
            if (*value < 0 || *value > MAX_RETENTION_LEVEL) {
                std::cerr << "Error: Retention level must be 0 to " << static_cast<int>(MAX_RETENTION_LEVEL)
                          << std::endl;
                return 1;
            }
            opts.level = static_cast<uint8_t>(*value);
            break;
        }
        case 'u':
            decompressRequested = true;
            break;
        case 'o':
            opts.outputFile = optarg;
            break;
        case 'v':
            g_verbose = true;
            break;
        default:
            showHelp(argv[0]);
            return 1;
        }
    }

    if (compressRequested && decompressRequested) {
        std::cerr << "Error: -z and -u cannot be combined\n";
        return 1;
    }
    if (compressRequested) {
        opts.action = Action::Compress;
    } else if (decompressRequested) {
        opts.action = Action::Decompress;
    }

    for (const auto &dir : dirs) {
        auto found = findKmallFiles(dir);
        filelist.insert(filelist.end(), found.begin(), found.end());
    }
    for (int i = optind; i < argc; ++i) {
        filelist.push_back(argv[i]);
    }

    if (filelist.empty()) {
        if (!dirs.empty()) {
            std::cerr << "No .kmall files found\n";
            return 1;
        }
        showHelp(argv[0]);
        return 0;
    }

    return processFiles(filelist, opts);
}
