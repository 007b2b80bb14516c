#pragma once

#include "core/cancellation.hpp"
#include "discovery/device.hpp"
#include "network/udp_listener.hpp"

#include <QHash>
#include <algorithm>
#include <optional>
#include <vector>

namespace relayscout::discovery {

// Wait slice used when draining a datagram queue against a CancelToken.
constexpr Millis kDrainSlice{50};

/**
 * Drain `queue` until `token` ends, parsing each datagram with `parse`.
 * Devices are kept unique by id; a later observation replaces an earlier one.
 */
template<typename Parse>
std::vector<DiscoveredDevice> collect_unique(network::DatagramQueue& queue,
                                             const CancelToken& token,
                                             Parse&& parse) {
    QHash<QString, DiscoveredDevice> by_id;

    while (!token.is_cancelled()) {
        const auto wait = std::min(token.remaining(kDrainSlice), kDrainSlice);
        auto datagram = queue.pop_for(wait);
        if (!datagram) {
            if (queue.is_drained()) break;
            continue;
        }
        std::optional<DiscoveredDevice> device = parse(*datagram);
        if (device && !device->id.isEmpty()) {
            by_id.insert(device->id, std::move(*device));
        }
    }

    std::vector<DiscoveredDevice> out;
    out.reserve(static_cast<size_t>(by_id.size()));
    for (auto it = by_id.cbegin(); it != by_id.cend(); ++it) {
        out.push_back(it.value());
    }
    return out;
}

} // namespace relayscout::discovery
