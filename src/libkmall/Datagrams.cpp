/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <sstream>
#include <stdexcept>

#include "Datagrams.hpp"
#include "ProtocolConstants.hpp"

namespace kmall {

double DatagramHeader::time() const
{
    return static_cast<double>(time_sec) + static_cast<double>(time_nanosec) / NANOSEC_PER_SEC;
}

std::vector<size_t> DepthDatagram::seabedImageOffsets() const
{
    std::vector<size_t> offsets;
    offsets.reserve(soundings.size() + 1);
    size_t running = 0;
    for (const auto &sounding : soundings) {
        offsets.push_back(running);
        running += sounding.SInumSamples;
    }
    offsets.push_back(running);
    return offsets;
}

std::vector<int16_t> DepthDatagram::seabedImage(size_t soundingIndex) const
{
    if (soundingIndex >= soundings.size()) {
        std::stringstream msg;
        msg << "sounding " << soundingIndex << " out of range, datagram has " << soundings.size();
        throw std::out_of_range(msg.str());
    }
    auto offsets = seabedImageOffsets();
    size_t begin = offsets[soundingIndex];
    size_t end = offsets[soundingIndex + 1];
    if (end > SIsample_desidB.size()) {
        // level 1 restored datagrams, or a caller-built datagram without samples
        return {};
    }
    return std::vector<int16_t>(SIsample_desidB.begin() + static_cast<std::ptrdiff_t>(begin),
                                SIsample_desidB.begin() + static_cast<std::ptrdiff_t>(end));
}

const DatagramHeader &headerOf(const Datagram &datagram)
{
    return std::visit([](const auto &dg) -> const DatagramHeader & { return dg.header; }, datagram);
}

DatagramHeader &headerOf(Datagram &datagram)
{
    return std::visit([](auto &dg) -> DatagramHeader & { return dg.header; }, datagram);
}

} // namespace kmall
