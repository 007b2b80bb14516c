#pragma once

#include "core/background_task.hpp"
#include "discovery/bthome.hpp"
#include "discovery/discoverer.hpp"

#include <QByteArray>
#include <QHash>
#include <QMap>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>
#include <functional>
#include <memory>
#include <optional>


namespace relayscout::discovery {

namespace ble {

// Vendor GATT service advertised by Gen2+ devices in provisioning mode.
inline const QString kServiceUuid = QStringLiteral("5f6d4f53-5f52-5043-5f53-56435f49445f");
inline const QString kRpcCharacteristicUuid = QStringLiteral("5f6d4f53-5f52-5043-5f72-7063");
inline const QString kDataCharacteristicUuid = QStringLiteral("5f6d4f53-5f52-5043-5f64-6174");

inline const QString kNamePrefix = QStringLiteral("SHELLY-");
inline const QString kBTHomeServiceUuid = QStringLiteral("fcd2");

constexpr Millis kDefaultScanDuration{10000};

} // namespace ble

/**
 * BleAdvertisement - one advertisement as reported by the radio layer.
 */
struct BleAdvertisement {
    QString address;
    QString local_name;
    int rssi = 0;
    bool connectable = false;
    QStringList service_uuids;
    QMap<QString, QByteArray> service_data;   // keyed by service UUID
    quint16 manufacturer_id = 0;
    QByteArray manufacturer_data;
};

/**
 * BleDiscoveredDevice - a DiscoveredDevice plus radio-level details.
 */
struct BleDiscoveredDevice : DiscoveredDevice {
    int rssi = 0;
    QString local_name;
    QString service_uuid;                     // first advertised service UUID
    bool connectable = false;
    std::optional<BTHomeData> bthome;
};

/**
 * True once the device has joined a network, i.e. has a usable IP address.
 */
[[nodiscard]] bool is_device_provisioned(const BleDiscoveredDevice& device);

/**
 * BleScanner - platform radio access.
 *
 * start() may either block until `token` ends or return once scanning is
 * running; the discoverer waits for the token either way. The callback
 * may be invoked from any thread.
 */
class BleScanner {
public:
    using AdvertisementCallback = std::function<void(const BleAdvertisement&)>;

    virtual ~BleScanner() = default;

    virtual Result<void, Error> start(const CancelToken& token, AdvertisementCallback callback) = 0;
    virtual Result<void, Error> stop() = 0;
};

/**
 * BleConnector - opens a real connection to test connectability.
 */
class BleConnector {
public:
    virtual ~BleConnector() = default;

    virtual Result<void, Error> connect(const CancelToken& token, const QString& address) = 0;
    virtual Result<void, Error> disconnect() = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;
};

/**
 * ConnectabilityCache - remembers whether a MAC address accepted a
 * connection, so devices are not connected to repeatedly.
 */
class ConnectabilityCache {
public:
    /**
     * Decide whether `device` is connectable.
     *
     * A cached answer is returned as-is. Without a connector, the
     * advertisement's connectable flag is returned and nothing is cached.
     * Otherwise a connect attempt is made: success (followed by a
     * disconnect) caches true, any connect error caches false.
     */
    Result<bool, Error> is_connectable(const CancelToken& token,
                                       const BleDiscoveredDevice* device,
                                       BleConnector* connector);

    void clear();

    [[nodiscard]] std::optional<bool> cached(const QString& mac) const;
    [[nodiscard]] size_t size() const;

private:
    mutable QReadWriteLock mu_;
    QHash<QString, bool> results_;
};

struct BleOptions {
    QString filter_prefix = ble::kNamePrefix;
    bool include_bthome = true;
    Millis scan_duration = ble::kDefaultScanDuration;   // one continuous-mode scan window
};

/**
 * BleDiscoverer - finds devices from BLE advertisements.
 *
 * Matches provisioning-mode devices by name prefix or vendor service UUID,
 * and BLU sensors by BTHome service data.
 */
class BleDiscoverer final : public Discoverer {
public:
    using DeviceCallback = std::function<void(const BleDiscoveredDevice&)>;

    explicit BleDiscoverer(std::shared_ptr<BleScanner> scanner, BleOptions options = {});
    ~BleDiscoverer() override;

    using Discoverer::discover;

    /**
     * Scan until `token` ends. Fails with NotSupported when constructed
     * without a scanner, and with a Transport error when the scan cannot
     * start.
     */
    Result<std::vector<DiscoveredDevice>, Error> discover(const CancelToken& token) override;

    Result<DeviceChannelPtr, Error> start_discovery() override;
    void stop_discovery() override;

    [[nodiscard]] bool is_shelly_device(const BleAdvertisement& adv) const;
    [[nodiscard]] BleDiscoveredDevice parse_advertisement(const BleAdvertisement& adv) const;

    /**
     * Feed one advertisement, as the scanner callback does.
     */
    void handle_advertisement(const BleAdvertisement& adv);

    [[nodiscard]] std::vector<BleDiscoveredDevice> devices() const;
    [[nodiscard]] std::optional<BleDiscoveredDevice> device_by_address(const QString& address) const;
    void clear();

    [[nodiscard]] ConnectabilityCache& connectability() { return connectability_; }

    /**
     * Called for every matching advertisement. Set before scanning starts.
     */
    DeviceCallback on_device_found;

private:
    void run_continuous(const CancelToken& stop);

    std::shared_ptr<BleScanner> scanner_;
    BleOptions options_;

    mutable QReadWriteLock mu_;
    QHash<QString, BleDiscoveredDevice> devices_;
    DeviceChannelPtr channel_;
    BackgroundTask task_;
    ConnectabilityCache connectability_;
};

} // namespace relayscout::discovery
