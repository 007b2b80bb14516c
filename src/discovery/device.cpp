#include "discovery/device.hpp"

#include <unordered_map>

namespace relayscout::discovery {

QString generation_name(Generation gen) {
    switch (gen) {
        case Generation::Gen1: return QStringLiteral("Gen1");
        case Generation::Gen2: return QStringLiteral("Gen2");
        case Generation::Gen3: return QStringLiteral("Gen3");
        case Generation::Gen4: return QStringLiteral("Gen4");
        case Generation::Unknown: break;
    }
    return QStringLiteral("Unknown");
}

std::optional<Generation> parse_generation(const QString& name) {
    if (name == QLatin1String("Gen1") || name == QLatin1String("gen1") || name == QLatin1String("1")) {
        return Generation::Gen1;
    }
    if (name == QLatin1String("Gen2") || name == QLatin1String("gen2") || name == QLatin1String("2") ||
        name == QLatin1String("Plus") || name == QLatin1String("Pro")) {
        return Generation::Gen2;
    }
    if (name == QLatin1String("Gen3") || name == QLatin1String("gen3") || name == QLatin1String("3")) {
        return Generation::Gen3;
    }
    if (name == QLatin1String("Gen4") || name == QLatin1String("gen4") || name == QLatin1String("4")) {
        return Generation::Gen4;
    }
    if (name.isEmpty() || name == QLatin1String("Unknown") || name == QLatin1String("unknown")) {
        return Generation::Unknown;
    }
    return std::nullopt;
}

QString protocol_name(Protocol protocol) {
    switch (protocol) {
        case Protocol::Mdns: return QStringLiteral("mdns");
        case Protocol::Coiot: return QStringLiteral("coiot");
        case Protocol::Ble: return QStringLiteral("ble");
        case Protocol::WifiAp: return QStringLiteral("wifi_ap");
        case Protocol::Manual: return QStringLiteral("manual");
    }
    return QStringLiteral("manual");
}

std::optional<Protocol> parse_protocol(const QString& name) {
    for (auto p : {Protocol::Mdns, Protocol::Coiot, Protocol::Ble, Protocol::WifiAp, Protocol::Manual}) {
        if (protocol_name(p) == name) return p;
    }
    return std::nullopt;
}

QString DiscoveredDevice::url() const {
    if (address.isNull()) return QString{};
    const auto p = port == 0 ? kDefaultHttpPort : port;
    return QStringLiteral("http://%1:%2").arg(address.toString()).arg(p);
}

QString DiscoveredDevice::merge_key() const {
    if (!id.isEmpty()) return id;
    if (!mac_address.isEmpty()) return mac_address;
    if (!address.isNull()) return address.toString();
    return QString{};
}

std::vector<DiscoveredDevice> deduplicate(const std::vector<DiscoveredDevice>& devices) {
    std::unordered_map<QString, DiscoveredDevice> by_key;
    by_key.reserve(devices.size());

    for (const auto& device : devices) {
        const auto key = device.merge_key();
        if (key.isEmpty()) continue;

        auto it = by_key.find(key);
        if (it == by_key.end()) {
            by_key.emplace(key, device);
        } else if (device.last_seen > it->second.last_seen) {
            it->second = device;
        }
    }

    std::vector<DiscoveredDevice> out;
    out.reserve(by_key.size());
    for (auto& [key, device] : by_key) {
        out.push_back(std::move(device));
    }
    return out;
}

bool is_private_or_loopback_ipv4(quint32 ipv4) {
    const auto a = static_cast<uint8_t>(ipv4 >> 24);
    const auto b = static_cast<uint8_t>(ipv4 >> 16);
    if (a == 10) return true;
    if (a == 172 && b >= 16 && b <= 31) return true;
    if (a == 192 && b == 168) return true;
    return a == 127;
}

QString mac_without_colons(const QString& mac) {
    QString out = mac;
    out.remove(QLatin1Char(':'));
    return out;
}

} // namespace relayscout::discovery
