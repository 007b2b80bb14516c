#pragma once

#include "core/cancellation.hpp"
#include "core/result.hpp"
#include "discovery/device.hpp"

#include <vector>

namespace relayscout::discovery {

/**
 * Discoverer - common shape of every per-protocol discoverer.
 *
 * One-shot discovery blocks the caller until the timeout or token ends and
 * returns the unique devices seen. Continuous discovery runs in the
 * background and publishes devices into a lossy channel.
 */
class Discoverer {
public:
    virtual ~Discoverer() = default;

    /**
     * Discover devices for `timeout`.
     */
    virtual Result<std::vector<DiscoveredDevice>, Error> discover(Millis timeout) {
        return discover(CancelToken::with_timeout(timeout));
    }

    /**
     * Discover devices until `token` is cancelled or expires. Transport
     * setup failures are returned as errors; malformed traffic is ignored.
     */
    virtual Result<std::vector<DiscoveredDevice>, Error> discover(const CancelToken& token) = 0;

    /**
     * Begin continuous discovery. Returns the existing channel when already
     * running. The channel is closed by stop_discovery().
     */
    virtual Result<DeviceChannelPtr, Error> start_discovery() = 0;

    virtual void stop_discovery() = 0;

    /**
     * Stop continuous discovery and release resources.
     */
    virtual Result<void, Error> stop() {
        stop_discovery();
        return Result<void, Error>::ok();
    }
};

} // namespace relayscout::discovery
