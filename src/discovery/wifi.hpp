#pragma once

#include "core/background_task.hpp"
#include "discovery/discoverer.hpp"
#include "network/http_json_fetcher.hpp"

#include <QHash>
#include <QJsonObject>
#include <QReadWriteLock>
#include <QString>
#include <functional>
#include <memory>
#include <optional>


namespace relayscout::discovery {

namespace wifi {

inline const QString kApPrefix = QStringLiteral("shelly");

// Address and port of a device serving its own access point.
inline const QString kDefaultApAddress = QStringLiteral("192.168.33.1");
constexpr quint16 kDefaultApPort = 80;

inline const QString kGen2InfoPath = QStringLiteral("/rpc/Shelly.GetDeviceInfo");
inline const QString kGen1InfoPath = QStringLiteral("/shelly");

constexpr Millis kProbeTimeout{10000};
constexpr Millis kHttpTimeout{5000};
constexpr Millis kSettleDelay{2000};        // wait for DHCP after joining the AP
constexpr Millis kRescanInterval{10000};
constexpr Millis kScanBudget{30000};

} // namespace wifi

/**
 * WifiNetwork - one visible access point.
 */
struct WifiNetwork {
    QString ssid;
    QString bssid;
    int signal = 0;
    int channel = 0;
    QString security;

    // Filled in once the SSID is classified as a device AP.
    bool is_shelly = false;
    QString device_type;
    QString device_id;
    Timestamp last_seen;
};

/**
 * WifiDiscoveredDevice - a DiscoveredDevice found through its AP.
 */
struct WifiDiscoveredDevice : DiscoveredDevice {
    QString ssid;
    QString bssid;
    int signal = 0;
    int channel = 0;
    QString security;
    bool is_connected = false;   // true when details came from an active probe
};

/**
 * WifiScanner - platform WiFi control, usually backed by OS tools.
 */
class WifiScanner {
public:
    virtual ~WifiScanner() = default;

    virtual Result<std::vector<WifiNetwork>, Error> scan(const CancelToken& token) = 0;
    virtual Result<void, Error> connect(const CancelToken& token,
                                        const QString& ssid,
                                        const QString& password) = 0;
    virtual Result<void, Error> disconnect(const CancelToken& token) = 0;

    /**
     * The network currently joined, or nullopt when not connected.
     */
    virtual Result<std::optional<WifiNetwork>, Error> current_network(const CancelToken& token) = 0;
};

struct SsidParts {
    QString type;
    QString id;

    bool operator==(const SsidParts&) const = default;
};

/**
 * True when `ssid` looks like a device AP: "shelly", an optional model
 * token, an optional '-' or '_', then a hex id (case-insensitive).
 */
[[nodiscard]] bool is_shelly_ap(const QString& ssid);

/**
 * Split a device AP SSID into model type and device id.
 *
 * With separators, the first segment is the type and the last the id.
 * Without, the trailing hex run is the id and the rest the type. Ids are
 * upper-cased, types lower-cased.
 *
 *   parse_shelly_ssid("shellyplus1pm-AABBCC") == {"plus1pm", "AABBCC"}
 */
[[nodiscard]] SsidParts parse_shelly_ssid(const QString& ssid);

/**
 * g4/gen4 -> Gen4, g3/gen3 -> Gen3, plus/pro/g2/gen2 -> Gen2, otherwise Gen1.
 */
[[nodiscard]] Generation infer_generation_from_model(const QString& model);

[[nodiscard]] WifiDiscoveredDevice network_to_device(const WifiNetwork& network);

/**
 * Overlay a Gen2+ Shelly.GetDeviceInfo response onto `device`.
 */
void apply_gen2_info(WifiDiscoveredDevice& device, const QJsonObject& info);

/**
 * Overlay a Gen1 /shelly response onto `device`; forces Gen1.
 */
void apply_gen1_info(WifiDiscoveredDevice& device, const QJsonObject& info);

struct WifiOptions {
    // Join each device AP to read its details. Disconnects the host from
    // its current network for the duration of each probe.
    bool probe_devices = false;

    QString ap_address = wifi::kDefaultApAddress;
    quint16 ap_port = wifi::kDefaultApPort;
    Millis probe_timeout = wifi::kProbeTimeout;
    Millis http_timeout = wifi::kHttpTimeout;
    Millis settle_delay = wifi::kSettleDelay;
    Millis rescan_interval = wifi::kRescanInterval;
    Millis scan_budget = wifi::kScanBudget;
};

/**
 * WifiDiscoverer - finds unprovisioned devices by their AP SSIDs.
 */
class WifiDiscoverer final : public Discoverer {
public:
    using NetworkCallback = std::function<void(const WifiNetwork&)>;
    using DeviceCallback = std::function<void(const WifiDiscoveredDevice&)>;

    /**
     * @param fetcher HTTP client for probing; defaults to HttpJsonFetcher.
     */
    explicit WifiDiscoverer(std::shared_ptr<WifiScanner> scanner,
                            WifiOptions options = {},
                            std::shared_ptr<network::JsonFetcher> fetcher = nullptr);
    ~WifiDiscoverer() override;

    using Discoverer::discover;

    /**
     * Scan once and return one device per matching SSID, probing each when
     * probe_devices is set. A failed probe keeps the SSID-derived record.
     */
    Result<std::vector<DiscoveredDevice>, Error> discover(const CancelToken& token) override;

    Result<DeviceChannelPtr, Error> start_discovery() override;
    void stop_discovery() override;

    /**
     * Scan and return only the classified device networks.
     */
    Result<std::vector<WifiNetwork>, Error> scan_networks(const CancelToken& token);

    /**
     * Join `network`, query its info endpoints (Gen2, then Gen1) and return
     * the enriched record. The previously joined network is rejoined
     * afterwards whatever the outcome; a failed rejoin is logged only.
     */
    Result<WifiDiscoveredDevice, Error> probe_device(const CancelToken& token, const WifiNetwork& network);

    [[nodiscard]] std::vector<WifiDiscoveredDevice> devices() const;
    void clear();

    NetworkCallback on_network_found;
    DeviceCallback on_device_found;

private:
    void run_continuous(const CancelToken& stop, const DeviceChannelPtr& channel);
    [[nodiscard]] QUrl ap_url(const QString& path) const;

    std::shared_ptr<WifiScanner> scanner_;
    WifiOptions options_;
    std::shared_ptr<network::JsonFetcher> fetcher_;

    mutable QReadWriteLock mu_;
    QHash<QString, WifiDiscoveredDevice> devices_;   // keyed by SSID
    DeviceChannelPtr channel_;
    BackgroundTask task_;
};

} // namespace relayscout::discovery
