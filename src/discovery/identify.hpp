#pragma once

#include "core/cancellation.hpp"
#include "core/result.hpp"
#include "discovery/device.hpp"
#include "network/http_json_fetcher.hpp"

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <functional>
#include <memory>
#include <optional>

namespace relayscout::discovery {

constexpr Millis kIdentifyTimeout{5000};
constexpr Millis kProbeAddressTimeout{2000};
constexpr int kMaxConcurrentProbes = 20;

/**
 * DeviceInfo - what a device reports about itself over HTTP.
 */
struct DeviceInfo {
    QString id;
    QString name;
    QString model;
    QString firmware;
    QString mac_address;
    QString app;
    QString profile;
    Generation generation = Generation::Unknown;
    bool auth_required = false;
    QJsonObject raw;
};

/**
 * DeviceIdentifier - asks the device at an address what it is.
 */
class DeviceIdentifier {
public:
    virtual ~DeviceIdentifier() = default;

    virtual Result<DeviceInfo, Error> identify(const QString& address,
                                               Millis timeout,
                                               const CancelToken& token) = 0;
};

/**
 * HttpDeviceIdentifier - identifies devices via GET /shelly.
 *
 * A response with gen >= 2 is a Gen2+ device. Anything else is read as a
 * Gen1 response, whose user-visible name comes from GET /settings.
 */
class HttpDeviceIdentifier final : public DeviceIdentifier {
public:
    explicit HttpDeviceIdentifier(std::shared_ptr<network::JsonFetcher> fetcher = nullptr);

    Result<DeviceInfo, Error> identify(const QString& address,
                                       Millis timeout,
                                       const CancelToken& token) override;

private:
    std::shared_ptr<network::JsonFetcher> fetcher_;
};

struct ProbeProgress {
    QString address;
    int total = 0;
    int done = 0;
    bool found = false;
    std::optional<DiscoveredDevice> device;
    std::optional<Error> error;
};

// Return false to cancel the remaining probes. May be called from several
// worker threads concurrently.
using ProbeProgressCallback = std::function<bool(const ProbeProgress&)>;

/**
 * Identify every address, with at most kMaxConcurrentProbes in flight and
 * kProbeAddressTimeout per address. Found devices are reported with
 * Protocol::Manual on port 80. Order of the result is unspecified.
 */
[[nodiscard]] std::vector<DiscoveredDevice> probe_addresses(DeviceIdentifier& identifier,
                                                            const QStringList& addresses,
                                                            const CancelToken& token,
                                                            const ProbeProgressCallback& callback = {});

/**
 * All host addresses of an IPv4 subnet in CIDR form, excluding the network
 * and broadcast addresses. Malformed input yields an empty list.
 *
 *   generate_subnet_addresses("192.168.1.0/30") == {"192.168.1.1", "192.168.1.2"}
 */
[[nodiscard]] QStringList generate_subnet_addresses(const QString& cidr);

/**
 * Host part of an address that may carry a scheme and a port
 * ("http://10.0.0.5:80" -> 10.0.0.5). Null when it is not an IP address.
 */
[[nodiscard]] QHostAddress host_of(const QString& address);

} // namespace relayscout::discovery
