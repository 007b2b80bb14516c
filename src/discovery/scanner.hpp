#pragma once

#include "discovery/ble.hpp"
#include "discovery/discoverer.hpp"
#include "discovery/scanner_config.hpp"
#include "discovery/wifi.hpp"

#include <QMutex>
#include <QString>
#include <memory>
#include <vector>

namespace relayscout::discovery {

/**
 * Scanner - runs every enabled discoverer and merges their results.
 *
 * mDNS and CoIoT discoverers are built fresh for each scan and stopped when
 * it ends. BLE and WiFi discoverers exist only once a platform scanner has
 * been supplied, and live as long as the Scanner.
 *
 *   Scanner scanner(config);
 *   scanner.set_wifi_scanner(std::make_shared<NmcliWifiScanner>());
 *   auto devices = scanner.scan(Millis{5000}).unwrap();
 */
class Scanner {
public:
    explicit Scanner(ScannerConfig config = {});
    ~Scanner();

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    /**
     * Enable BLE discovery through `scanner`. A null scanner disables it.
     */
    void set_ble_scanner(std::shared_ptr<BleScanner> scanner);

    /**
     * Enable WiFi AP discovery through `scanner`. A null scanner disables it.
     */
    void set_wifi_scanner(std::shared_ptr<WifiScanner> scanner);

    /**
     * Run `discoverer` in every scan alongside the configured protocols.
     */
    void add_discoverer(QString name, std::shared_ptr<Discoverer> discoverer);

    /**
     * Scan with every active discoverer for the configured timeout.
     */
    Result<std::vector<DiscoveredDevice>, Error> scan();

    /**
     * Scan with every active discoverer concurrently until `timeout`, then
     * deduplicate. A failing discoverer is logged and skipped, so the scan
     * itself does not fail.
     */
    Result<std::vector<DiscoveredDevice>, Error> scan(Millis timeout);
    Result<std::vector<DiscoveredDevice>, Error> scan(const CancelToken& token);

    /**
     * Stop every discoverer the Scanner holds. All are stopped even when one
     * fails; the first error is returned.
     */
    Result<void, Error> stop();

    [[nodiscard]] const ScannerConfig& config() const { return config_; }
    [[nodiscard]] std::shared_ptr<BleDiscoverer> ble() const;
    [[nodiscard]] std::shared_ptr<WifiDiscoverer> wifi() const;

private:
    struct Entry {
        QString name;
        std::shared_ptr<Discoverer> discoverer;
        bool per_scan = false;   // built for this scan, stopped after it
    };

    [[nodiscard]] std::vector<Entry> active_entries() const;

    ScannerConfig config_;

    mutable QMutex mu_;
    std::shared_ptr<BleDiscoverer> ble_;
    std::shared_ptr<WifiDiscoverer> wifi_;
    std::vector<Entry> extra_;
};

} // namespace relayscout::discovery
