#pragma once

#include "core/background_task.hpp"
#include "discovery/discoverer.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QReadWriteLock>
#include <optional>
#include <string_view>

namespace relayscout::discovery {

inline constexpr std::string_view kMdnsService = "_shelly._tcp.local.";
constexpr quint16 kMdnsPort = 5353;
constexpr quint16 kDnsTypePtr = 12;

struct MdnsOptions {
    QHostAddress query_address{QStringLiteral("224.0.0.251")};
    quint16 query_port = kMdnsPort;

    // Continuous mode re-queries every `requery_interval`, collecting
    // responses for `requery_window` each time.
    Millis requery_interval{10000};
    Millis requery_window{5000};
};

/**
 * Build a minimal DNS query: 12-byte header with QDCOUNT=1 followed by one
 * label-encoded question of type `qtype`, class IN.
 */
[[nodiscard]] QByteArray build_dns_query(std::string_view name, quint16 qtype);

/**
 * Extract a device from an mDNS response.
 *
 * Not a DNS decoder: TXT markers (id=, model=, gen=, fw=, auth=) are found
 * by scanning the payload as text, and the address is the first run of four
 * bytes after the header that forms a private or loopback IPv4 address.
 * Returns nullopt for queries, short packets, or records lacking an id or
 * an address.
 */
[[nodiscard]] std::optional<DiscoveredDevice> parse_mdns_response(const QByteArray& data);

/**
 * MdnsDiscoverer - finds Gen2+ devices advertising _shelly._tcp over mDNS.
 */
class MdnsDiscoverer final : public Discoverer {
public:
    explicit MdnsDiscoverer(MdnsOptions options = {});
    ~MdnsDiscoverer() override;

    using Discoverer::discover;

    /**
     * Send one PTR query from an ephemeral port and collect responses,
     * unique by id, until `token` ends.
     */
    Result<std::vector<DiscoveredDevice>, Error> discover(const CancelToken& token) override;

    Result<DeviceChannelPtr, Error> start_discovery() override;
    void stop_discovery() override;

    [[nodiscard]] bool is_running() const;

private:
    void run_continuous(const CancelToken& stop, const DeviceChannelPtr& channel);

    MdnsOptions options_;
    mutable QReadWriteLock mu_;
    DeviceChannelPtr channel_;
    BackgroundTask task_;
};

} // namespace relayscout::discovery
