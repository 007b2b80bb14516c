#pragma once

#include "core/background_task.hpp"
#include "discovery/discoverer.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QReadWriteLock>
#include <memory>
#include <optional>


namespace relayscout::network {
class UdpListener;
}

namespace relayscout::discovery {

constexpr quint16 kCoiotPort = 5683;

[[nodiscard]] QHostAddress coiot_multicast_address();

struct CoiotOptions {
    quint16 port = kCoiotPort;

    // Group joined after binding; nullopt listens for unicast only.
    std::optional<QHostAddress> multicast_group = coiot_multicast_address();

    // How long continuous mode waits for a datagram before re-checking
    // whether it has been stopped.
    Millis read_wait{1000};
};

/**
 * Return the payload of a CoAP v1 message, skipping header, token and the
 * option list. Delta and length nibbles 13 and 14 carry 1- and 2-byte
 * extensions. Returns nullopt for malformed messages and for messages
 * without a payload.
 */
[[nodiscard]] std::optional<QByteArray> coap_payload(const QByteArray& packet);

/**
 * Build a device from a CoIoT status payload sent by `sender`.
 *
 * JSON payloads map id, mac, type, fw_ver and settings.device.name; a
 * missing id falls back to the MAC with colons removed. Non-JSON payloads
 * are scanned for an XX:XX:XX:XX:XX:XX MAC. Returns nullopt when no id can
 * be derived.
 */
[[nodiscard]] std::optional<DiscoveredDevice> parse_coiot_payload(const QByteArray& payload,
                                                                  const QHostAddress& sender);

[[nodiscard]] std::optional<DiscoveredDevice> parse_coap_message(const QByteArray& packet,
                                                                 const QHostAddress& sender);

/**
 * CoiotDiscoverer - listens for Gen1 CoIoT status multicasts.
 */
class CoiotDiscoverer final : public Discoverer {
public:
    explicit CoiotDiscoverer(CoiotOptions options = {});
    ~CoiotDiscoverer() override;

    using Discoverer::discover;
    Result<std::vector<DiscoveredDevice>, Error> discover(const CancelToken& token) override;

    /**
     * Binds the listening socket immediately; a bind failure is returned
     * here rather than from the background task.
     */
    Result<DeviceChannelPtr, Error> start_discovery() override;
    void stop_discovery() override;

    [[nodiscard]] bool is_running() const;

private:
    [[nodiscard]] std::unique_ptr<network::UdpListener> make_listener() const;

    CoiotOptions options_;
    mutable QReadWriteLock mu_;
    DeviceChannelPtr channel_;
    std::unique_ptr<network::UdpListener> listener_;
    BackgroundTask task_;
};

} // namespace relayscout::discovery
