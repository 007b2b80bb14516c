#pragma once

#include "core/bounded_queue.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QString>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace relayscout::discovery {

/**
 * Hardware/firmware generation of a device.
 *
 * Gen1 devices speak the REST API; Gen2 and later speak JSON-RPC.
 */
enum class Generation {
    Unknown = 0,
    Gen1 = 1,
    Gen2 = 2,
    Gen3 = 3,
    Gen4 = 4,
};

[[nodiscard]] QString generation_name(Generation gen);

/**
 * Accepts "Gen1"/"gen1"/"1", "Gen2"/"gen2"/"2"/"Plus"/"Pro", "Gen3"/"gen3"/"3",
 * "Gen4"/"gen4"/"4" and "Unknown"/"unknown"/"". Anything else yields nullopt.
 */
[[nodiscard]] std::optional<Generation> parse_generation(const QString& name);

[[nodiscard]] constexpr bool is_rpc(Generation gen) noexcept {
    return gen == Generation::Gen2 || gen == Generation::Gen3 || gen == Generation::Gen4;
}

[[nodiscard]] constexpr bool is_rest(Generation gen) noexcept {
    return gen == Generation::Gen1;
}

/**
 * Mechanism that produced a DiscoveredDevice.
 */
enum class Protocol {
    Mdns,
    Coiot,
    Ble,
    WifiAp,
    Manual,
};

// Wire names: "mdns", "coiot", "ble", "wifi_ap", "manual".
[[nodiscard]] QString protocol_name(Protocol protocol);
[[nodiscard]] std::optional<Protocol> parse_protocol(const QString& name);

constexpr uint16_t kDefaultHttpPort = 80;

/**
 * DiscoveredDevice - one observation of a device by any discoverer.
 *
 * Records handed to callers always have a non-empty `id`. Two records with
 * the same merge_key() describe the same device; the one with the later
 * `last_seen` wins as a whole.
 */
struct DiscoveredDevice {
    QString id;
    QString name;
    QString model;
    QString mac_address;
    QString firmware;
    Protocol protocol = Protocol::Manual;
    QHostAddress address;            // null when the device has no IP yet
    uint16_t port = 0;
    Generation generation = Generation::Unknown;
    bool auth_required = false;
    Timestamp last_seen;
    QByteArray raw;                  // undecoded payload, for diagnostics

    /**
     * Base URL of the device's HTTP API, e.g. "http://192.168.1.20:80".
     * Empty when the device has no address.
     */
    [[nodiscard]] QString url() const;

    /**
     * Deduplication key: id, else MAC address, else address string.
     */
    [[nodiscard]] QString merge_key() const;

    [[nodiscard]] bool has_address() const { return !address.isNull(); }
};

/**
 * Channel used by continuous discovery. Producers drop devices rather than
 * block when the consumer falls behind.
 */
using DeviceChannel = BoundedQueue<DiscoveredDevice>;
using DeviceChannelPtr = std::shared_ptr<DeviceChannel>;

constexpr size_t kDeviceChannelCapacity = 100;

[[nodiscard]] inline DeviceChannelPtr make_device_channel(size_t capacity = kDeviceChannelCapacity) {
    return std::make_shared<DeviceChannel>(capacity);
}

/**
 * Collapse observations sharing a merge key. A record replaces the stored one
 * when its key is new or its last_seen is strictly later. Records are never
 * combined field by field. Records without any key are dropped.
 */
[[nodiscard]] std::vector<DiscoveredDevice> deduplicate(const std::vector<DiscoveredDevice>& devices);

/**
 * True for 10/8, 172.16/12, 192.168/16 and 127/8 IPv4 addresses.
 */
[[nodiscard]] bool is_private_or_loopback_ipv4(quint32 ipv4);

/**
 * Strip ':' separators from a MAC address ("AA:BB:CC:DD:EE:FF" -> "AABBCCDDEEFF").
 */
[[nodiscard]] QString mac_without_colons(const QString& mac);

} // namespace relayscout::discovery
