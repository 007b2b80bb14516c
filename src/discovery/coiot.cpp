#include "discovery/coiot.hpp"

#include "core/logging.hpp"
#include "discovery/udp_collect.hpp"
#include "network/udp_listener.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace relayscout::discovery {
namespace {

constexpr uint8_t kPayloadMarker = 0xFF;
constexpr qsizetype kMacTextLength = 17;

bool is_hex_digit(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_mac_text(const char* s) {
    for (int i = 0; i < kMacTextLength; ++i) {
        if (i % 3 == 2) {
            if (s[i] != ':') return false;
        } else if (!is_hex_digit(s[i])) {
            return false;
        }
    }
    return true;
}

DiscoveredDevice coiot_device(const QHostAddress& sender) {
    DiscoveredDevice device;
    device.protocol = Protocol::Coiot;
    device.port = kDefaultHttpPort;
    device.generation = Generation::Gen1;
    device.address = sender;
    device.last_seen = Timestamp::now();
    return device;
}

std::optional<DiscoveredDevice> from_json(const QJsonObject& status, const QHostAddress& sender) {
    auto device = coiot_device(sender);

    device.id = status.value(QStringLiteral("id")).toString();
    const auto mac = status.value(QStringLiteral("mac")).toString();
    if (!mac.isEmpty()) {
        device.mac_address = mac;
        if (device.id.isEmpty()) {
            device.id = mac_without_colons(mac);
        }
    }
    device.model = status.value(QStringLiteral("type")).toString();
    device.firmware = status.value(QStringLiteral("fw_ver")).toString();
    device.name = status.value(QStringLiteral("settings")).toObject()
                      .value(QStringLiteral("device")).toObject()
                      .value(QStringLiteral("name")).toString();

    if (device.id.isEmpty()) return std::nullopt;
    return device;
}

std::optional<DiscoveredDevice> from_text(const QByteArray& payload, const QHostAddress& sender) {
    for (qsizetype i = 0; i + kMacTextLength <= payload.size(); ++i) {
        const char* candidate = payload.constData() + i;
        if (!is_mac_text(candidate)) continue;

        auto device = coiot_device(sender);
        device.mac_address = QString::fromLatin1(candidate, kMacTextLength);
        device.id = mac_without_colons(device.mac_address);
        return device;
    }
    return std::nullopt;
}

} // namespace

QHostAddress coiot_multicast_address() {
    return QHostAddress(QStringLiteral("224.0.1.187"));
}

std::optional<QByteArray> coap_payload(const QByteArray& packet) {
    const auto* data = reinterpret_cast<const uint8_t*>(packet.constData());
    const qsizetype n = packet.size();

    if (n < 4) return std::nullopt;
    if (((data[0] >> 6) & 0x03) != 1) return std::nullopt;

    const qsizetype token_length = data[0] & 0x0F;
    if (n < 4 + token_length) return std::nullopt;

    qsizetype offset = 4 + token_length;
    while (offset < n && data[offset] != kPayloadMarker) {
        const uint8_t delta = data[offset] >> 4;
        qsizetype length = data[offset] & 0x0F;
        ++offset;

        if (delta == 13) {
            offset += 1;
        } else if (delta == 14) {
            offset += 2;
        }

        if (length == 13) {
            if (offset >= n) return std::nullopt;
            length = data[offset] + 13;
            offset += 1;
        } else if (length == 14) {
            if (offset + 1 >= n) return std::nullopt;
            length = ((qsizetype(data[offset]) << 8) | data[offset + 1]) + 269;
            offset += 2;
        }

        offset += length;
    }

    if (offset < n && data[offset] == kPayloadMarker) {
        ++offset;
    }
    if (offset >= n) return std::nullopt;

    return packet.mid(offset);
}

std::optional<DiscoveredDevice> parse_coiot_payload(const QByteArray& payload,
                                                    const QHostAddress& sender) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(payload, &err);

    std::optional<DiscoveredDevice> device;
    if (err.error == QJsonParseError::NoError && doc.isObject()) {
        device = from_json(doc.object(), sender);
    } else {
        device = from_text(payload, sender);
    }

    if (device) device->raw = payload;
    return device;
}

std::optional<DiscoveredDevice> parse_coap_message(const QByteArray& packet,
                                                   const QHostAddress& sender) {
    auto payload = coap_payload(packet);
    if (!payload) return std::nullopt;
    return parse_coiot_payload(*payload, sender);
}

CoiotDiscoverer::CoiotDiscoverer(CoiotOptions options)
    : options_(std::move(options))
{
}

CoiotDiscoverer::~CoiotDiscoverer() {
    stop_discovery();
}

std::unique_ptr<network::UdpListener> CoiotDiscoverer::make_listener() const {
    network::UdpListenerOptions opts;
    opts.name = QStringLiteral("coiot");
    opts.port = options_.port;
    opts.multicast_group = options_.multicast_group;
    return std::make_unique<network::UdpListener>(std::move(opts));
}

namespace {

std::optional<DiscoveredDevice> parse_datagram(const network::Datagram& d) {
    auto device = parse_coap_message(d.data, d.sender);
    if (!device) {
        qCDebug(rsCoiotLog) << "ignored datagram from" << d.sender.toString()
                            << "size" << d.data.size();
    }
    return device;
}

} // namespace

Result<std::vector<DiscoveredDevice>, Error> CoiotDiscoverer::discover(const CancelToken& token) {
    auto listener = make_listener();
    auto started = listener->start();
    if (started.is_err()) {
        qCWarning(rsCoiotLog) << "listen failed:" << started.unwrap_err().message.c_str();
        return Result<std::vector<DiscoveredDevice>, Error>::err(started.unwrap_err());
    }

    auto devices = collect_unique(*listener->datagrams(), token, parse_datagram);
    listener->stop();

    qCDebug(rsCoiotLog) << "listen window closed," << devices.size() << "devices";
    return Result<std::vector<DiscoveredDevice>, Error>::ok(std::move(devices));
}

Result<DeviceChannelPtr, Error> CoiotDiscoverer::start_discovery() {
    QWriteLocker lock(&mu_);
    if (task_.is_running()) {
        return Result<DeviceChannelPtr, Error>::ok(channel_);
    }

    auto listener = make_listener();
    auto started = listener->start();
    if (started.is_err()) {
        return Result<DeviceChannelPtr, Error>::err(started.unwrap_err());
    }

    listener_ = std::move(listener);
    channel_ = make_device_channel();

    auto datagrams = listener_->datagrams();
    auto channel = channel_;
    const auto wait = options_.read_wait;
    task_.start([datagrams, channel, wait](const CancelToken& stop) {
        while (!stop.is_cancelled()) {
            auto d = datagrams->pop_for(wait);
            if (!d) {
                if (datagrams->is_drained()) break;
                continue;
            }
            auto device = parse_datagram(*d);
            if (device && !channel->try_push(std::move(*device))) {
                qCDebug(rsCoiotLog) << "consumer slow, device update dropped";
            }
        }
    });
    return Result<DeviceChannelPtr, Error>::ok(std::move(channel));
}

void CoiotDiscoverer::stop_discovery() {
    std::unique_ptr<network::UdpListener> listener;
    DeviceChannelPtr channel;
    {
        QWriteLocker lock(&mu_);
        listener = std::move(listener_);
        channel = channel_;
    }
    // Stopping the listener closes its queue, which wakes the drain loop.
    if (listener) listener->stop();
    task_.stop();
    if (channel) channel->close();
}

bool CoiotDiscoverer::is_running() const {
    return task_.is_running();
}

} // namespace relayscout::discovery
