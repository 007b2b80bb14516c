#pragma once

#include "core/result.hpp"

namespace relayscout::discovery {

// Typed platform errors. They let callers tell "nothing was found" apart
// from "this host cannot perform the discovery at all".

[[nodiscard]] inline Error ble_not_supported() {
    return Error{"BLE not supported on this platform", ErrorKind::NotSupported};
}

[[nodiscard]] inline Error wifi_not_supported() {
    return Error{"WiFi scanning not supported on this platform", ErrorKind::NotSupported};
}

[[nodiscard]] inline Error ssid_not_found() {
    return Error{"SSID not found", ErrorKind::SsidNotFound};
}

[[nodiscard]] inline Error auth_failed() {
    return Error{"WiFi authentication failed", ErrorKind::AuthFailed};
}

[[nodiscard]] inline Error tool_not_found() {
    return Error{"no WiFi management tool found", ErrorKind::ToolNotFound};
}

[[nodiscard]] inline Error connection_timeout() {
    return Error{"connection timeout", ErrorKind::ConnectionTimeout};
}

} // namespace relayscout::discovery
