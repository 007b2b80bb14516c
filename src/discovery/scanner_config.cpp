#include "discovery/scanner_config.hpp"

#include "core/logging.hpp"

#include <QSettings>

namespace relayscout::discovery {
namespace {

void read_flag(QSettings& settings, const char* key, bool& field) {
    if (!settings.contains(QLatin1String(key))) return;
    const auto value = parse_flag(settings.value(QLatin1String(key)).toString());
    if (value) {
        field = *value;
    } else {
        qCWarning(rsScannerLog) << "ignoring setting" << key << "- not a boolean";
    }
}

void read_millis(QSettings& settings, const char* key, Millis& field) {
    if (!settings.contains(QLatin1String(key))) return;
    bool ok = false;
    const auto ms = settings.value(QLatin1String(key)).toLongLong(&ok);
    if (ok && ms > 0) {
        field = Millis{ms};
    } else {
        qCWarning(rsScannerLog) << "ignoring setting" << key << "- not a positive integer";
    }
}

void env_flag(const char* name, bool& field) {
    if (!qEnvironmentVariableIsSet(name)) return;
    const auto value = parse_flag(qEnvironmentVariable(name));
    if (value) {
        field = *value;
    } else {
        qCWarning(rsScannerLog) << "ignoring" << name << "- not a boolean";
    }
}

} // namespace

std::optional<bool> parse_flag(const QString& value) {
    const auto v = value.trimmed().toLower();
    if (v == QLatin1String("1") || v == QLatin1String("true") ||
        v == QLatin1String("on") || v == QLatin1String("yes")) {
        return true;
    }
    if (v == QLatin1String("0") || v == QLatin1String("false") ||
        v == QLatin1String("off") || v == QLatin1String("no")) {
        return false;
    }
    return std::nullopt;
}

ScannerConfig load_scanner_config(QSettings& settings) {
    ScannerConfig config;

    read_flag(settings, "scanner/mdns", config.enable_mdns);
    read_flag(settings, "scanner/coiot", config.enable_coiot);
    read_flag(settings, "scanner/ble", config.enable_ble);
    read_flag(settings, "scanner/wifi", config.enable_wifi);
    read_millis(settings, "scanner/timeout_ms", config.timeout);

    read_flag(settings, "wifi/probe_devices", config.probe_devices);

    read_flag(settings, "ble/include_bthome", config.include_bthome);
    if (settings.contains(QStringLiteral("ble/filter_prefix"))) {
        config.ble_filter_prefix = settings.value(QStringLiteral("ble/filter_prefix")).toString();
    }
    read_millis(settings, "ble/scan_window_ms", config.ble_scan_window);

    return config;
}

void apply_environment_overrides(ScannerConfig& config) {
    env_flag("RELAYSCOUT_MDNS", config.enable_mdns);
    env_flag("RELAYSCOUT_COIOT", config.enable_coiot);
    env_flag("RELAYSCOUT_BLE", config.enable_ble);
    env_flag("RELAYSCOUT_WIFI", config.enable_wifi);
    env_flag("RELAYSCOUT_WIFI_PROBE", config.probe_devices);

    const auto timeout = qEnvironmentVariable("RELAYSCOUT_TIMEOUT_MS");
    if (!timeout.isEmpty()) {
        bool ok = false;
        const auto ms = timeout.toLongLong(&ok);
        if (ok && ms > 0) {
            config.timeout = Millis{ms};
        } else {
            qCWarning(rsScannerLog) << "ignoring RELAYSCOUT_TIMEOUT_MS=" << timeout;
        }
    }
}

} // namespace relayscout::discovery
