#pragma once

#include "core/types.hpp"
#include "discovery/ble.hpp"
#include "discovery/coiot.hpp"
#include "discovery/mdns.hpp"

#include <QString>
#include <optional>

class QSettings;

namespace relayscout::discovery {

constexpr Millis kDefaultScanTimeout{10000};

/**
 * ScannerConfig - which protocols a Scanner runs and how.
 *
 * BLE and WiFi stay inactive unless the Scanner is also given a platform
 * scanner, whatever these flags say.
 */
struct ScannerConfig {
    bool enable_mdns = true;
    bool enable_coiot = true;
    bool enable_ble = false;
    bool enable_wifi = false;

    // Joining device APs drops the host off its network; never on by default.
    bool probe_devices = false;

    bool include_bthome = true;
    QString ble_filter_prefix = ble::kNamePrefix;
    Millis ble_scan_window = ble::kDefaultScanDuration;

    Millis timeout = kDefaultScanTimeout;

    MdnsOptions mdns;
    CoiotOptions coiot;
};

/**
 * Read the scanner/, wifi/ and ble/ groups. Missing or malformed keys keep
 * their defaults.
 */
[[nodiscard]] ScannerConfig load_scanner_config(QSettings& settings);

/**
 * Apply RELAYSCOUT_MDNS, RELAYSCOUT_COIOT, RELAYSCOUT_BLE, RELAYSCOUT_WIFI,
 * RELAYSCOUT_WIFI_PROBE and RELAYSCOUT_TIMEOUT_MS on top of `config`.
 */
void apply_environment_overrides(ScannerConfig& config);

/**
 * "1", "true", "on", "yes" -> true; "0", "false", "off", "no" -> false
 * (case-insensitive). Anything else is nullopt.
 */
[[nodiscard]] std::optional<bool> parse_flag(const QString& value);

} // namespace relayscout::discovery
