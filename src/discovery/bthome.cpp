#include "discovery/bthome.hpp"

namespace relayscout::discovery {
namespace bthome {

int object_size(uint8_t object_id) noexcept {
    switch (object_id) {
        case kPacketId: return 1;
        case kBattery: return 1;
        case kTemperature: return 2;
        case kHumidity: return 2;
        case kIlluminance: return 3;
        case kMotion: return 1;
        case kWindow: return 1;
        case kButton: return 1;
        case kRotation: return 2;
        default: return 1;
    }
}

} // namespace bthome

namespace {

int16_t le_int16(const uint8_t* p) {
    return static_cast<int16_t>(static_cast<uint16_t>(p[0] | (p[1] << 8)));
}

uint16_t le_uint16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t le_uint24(const uint8_t* p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16);
}

void apply_object(BTHomeData& out, uint8_t object_id, const uint8_t* value) {
    switch (object_id) {
        case bthome::kPacketId:
            out.packet_id = value[0];
            break;
        case bthome::kBattery:
            out.battery = value[0];
            break;
        case bthome::kTemperature:
            out.temperature = le_int16(value) * 0.01;
            break;
        case bthome::kHumidity:
            out.humidity = le_uint16(value) * 0.01;
            break;
        case bthome::kIlluminance:
            out.illuminance = le_uint24(value) * 0.01;
            break;
        case bthome::kMotion:
            out.motion = value[0] != 0;
            break;
        case bthome::kWindow:
            out.window_open = value[0] != 0;
            break;
        case bthome::kButton:
            out.button = value[0];
            break;
        case bthome::kRotation:
            out.rotation = le_int16(value) * 0.1;
            break;
        default:
            break;
    }
}

} // namespace

std::optional<BTHomeData> parse_bthome_data(const QByteArray& data) {
    if (data.isEmpty()) return std::nullopt;

    const auto* bytes = reinterpret_cast<const uint8_t*>(data.constData());
    if (bytes[0] & bthome::kEncryptedFlag) return std::nullopt;

    BTHomeData out;
    qsizetype offset = 1;
    while (offset < data.size()) {
        const uint8_t object_id = bytes[offset++];
        const int size = bthome::object_size(object_id);
        if (offset + size > data.size()) break;

        apply_object(out, object_id, bytes + offset);
        offset += size;
    }
    return out;
}

} // namespace relayscout::discovery
