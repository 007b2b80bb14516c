#pragma once

#include <QByteArray>
#include <cstdint>
#include <optional>

namespace relayscout::discovery {

/**
 * BTHomeData - decoded BTHome v2 sensor readings.
 *
 * A field is set only when its object type appeared in the payload; an
 * unset field means "not reported", never zero.
 */
struct BTHomeData {
    std::optional<double> temperature;   // °C
    std::optional<double> humidity;      // %
    std::optional<uint8_t> battery;      // %
    std::optional<double> illuminance;   // lux
    std::optional<bool> motion;
    std::optional<bool> window_open;
    std::optional<uint8_t> button;       // button event code
    std::optional<double> rotation;      // degrees
    uint8_t packet_id = 0;

    bool operator==(const BTHomeData&) const = default;
};

namespace bthome {

constexpr uint8_t kPacketId = 0x00;
constexpr uint8_t kBattery = 0x01;
constexpr uint8_t kTemperature = 0x02;
constexpr uint8_t kHumidity = 0x03;
constexpr uint8_t kIlluminance = 0x05;
constexpr uint8_t kMotion = 0x21;
constexpr uint8_t kWindow = 0x2D;
constexpr uint8_t kButton = 0x3A;
constexpr uint8_t kRotation = 0x3F;

// Device-info flag bit marking an encrypted payload.
constexpr uint8_t kEncryptedFlag = 0x01;

/**
 * Value size in bytes of an object type. Unknown types report 1 so that
 * decoding can step over them.
 */
[[nodiscard]] int object_size(uint8_t object_id) noexcept;

} // namespace bthome

/**
 * Decode BTHome v2 service data (the bytes under service UUID fcd2).
 *
 * Returns nullopt for empty or encrypted payloads. Truncated trailing
 * objects are dropped and the readings decoded so far are returned.
 */
[[nodiscard]] std::optional<BTHomeData> parse_bthome_data(const QByteArray& data);

} // namespace relayscout::discovery
