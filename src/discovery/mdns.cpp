#include "discovery/mdns.hpp"

#include "core/logging.hpp"
#include "discovery/udp_collect.hpp"
#include "network/udp_listener.hpp"

#include <algorithm>

namespace relayscout::discovery {
namespace {

// Value following `marker`, up to the next space, NUL or newline.
std::optional<QByteArray> txt_value(const QByteArray& data, const char* marker) {
    const auto idx = data.indexOf(marker);
    if (idx < 0) return std::nullopt;

    const auto start = idx + static_cast<qsizetype>(qstrlen(marker));
    auto end = start;
    while (end < data.size()) {
        const char c = data.at(end);
        if (c == ' ' || c == '\0' || c == '\n') break;
        ++end;
    }
    return data.mid(start, end - start);
}

Generation generation_from_txt(char c) {
    switch (c) {
        case '1': return Generation::Gen1;
        case '2': return Generation::Gen2;
        case '3': return Generation::Gen3;
        default: return Generation::Gen2;   // newer generations speak Gen2 RPC
    }
}

std::optional<QHostAddress> scan_ipv4(const QByteArray& data) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(data.constData());
    for (qsizetype i = 12; i + 3 < data.size(); ++i) {
        const uint8_t first = bytes[i];
        const uint8_t last = bytes[i + 3];
        if (first == 0 || first == 255 || last == 0 || last == 255) continue;

        const quint32 ip = (quint32(first) << 24) | (quint32(bytes[i + 1]) << 16) |
                           (quint32(bytes[i + 2]) << 8) | quint32(last);
        if (is_private_or_loopback_ipv4(ip)) {
            return QHostAddress(ip);
        }
    }
    return std::nullopt;
}

} // namespace

QByteArray build_dns_query(std::string_view name, quint16 qtype) {
    QByteArray msg;
    msg.reserve(static_cast<qsizetype>(12 + name.size() + 6));

    // ID=0, flags=0, QDCOUNT=1, ANCOUNT=NSCOUNT=ARCOUNT=0
    const char header[12] = {0, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0};
    msg.append(header, sizeof(header));

    if (!name.empty() && name.back() == '.') {
        name.remove_suffix(1);
    }
    while (!name.empty()) {
        const auto dot = name.find('.');
        const auto label = name.substr(0, dot);
        msg.append(static_cast<char>(label.size()));
        msg.append(label.data(), static_cast<qsizetype>(label.size()));
        if (dot == std::string_view::npos) break;
        name.remove_prefix(dot + 1);
    }

    msg.append('\0');
    msg.append(static_cast<char>(qtype >> 8));
    msg.append(static_cast<char>(qtype & 0xFF));
    msg.append('\0');
    msg.append('\1');   // class IN
    return msg;
}

std::optional<DiscoveredDevice> parse_mdns_response(const QByteArray& data) {
    if (data.size() < 12) return std::nullopt;
    if ((static_cast<uint8_t>(data.at(2)) & 0x80) == 0) return std::nullopt;

    DiscoveredDevice device;
    device.protocol = Protocol::Mdns;
    device.port = kDefaultHttpPort;
    device.last_seen = Timestamp::now();
    device.raw = data;

    if (auto id = txt_value(data, "id=")) device.id = QString::fromUtf8(*id);
    if (auto model = txt_value(data, "model=")) device.model = QString::fromUtf8(*model);
    if (auto fw = txt_value(data, "fw=")) device.firmware = QString::fromUtf8(*fw);

    if (const auto idx = data.indexOf("gen="); idx >= 0) {
        const auto pos = idx + 4;
        device.generation = generation_from_txt(pos < data.size() ? data.at(pos) : '\0');
    }

    if (const auto idx = data.indexOf("auth="); idx >= 0) {
        const auto pos = idx + 5;
        device.auth_required = pos < data.size() && data.at(pos) == '1';
    }

    auto address = scan_ipv4(data);
    if (device.id.isEmpty() || !address) return std::nullopt;

    device.address = *address;
    device.mac_address = device.id;
    return device;
}

MdnsDiscoverer::MdnsDiscoverer(MdnsOptions options)
    : options_(std::move(options))
{
}

MdnsDiscoverer::~MdnsDiscoverer() {
    stop_discovery();
}

Result<std::vector<DiscoveredDevice>, Error> MdnsDiscoverer::discover(const CancelToken& token) {
    network::UdpListenerOptions opts;
    opts.name = QStringLiteral("mdns");
    opts.initial_datagram = build_dns_query(kMdnsService, kDnsTypePtr);
    opts.initial_target = options_.query_address;
    opts.initial_target_port = options_.query_port;

    network::UdpListener listener(std::move(opts));
    auto started = listener.start();
    if (started.is_err()) {
        qCWarning(rsMdnsLog) << "query failed:" << started.unwrap_err().message.c_str();
        return Result<std::vector<DiscoveredDevice>, Error>::err(started.unwrap_err());
    }

    auto devices = collect_unique(*listener.datagrams(), token, [](const network::Datagram& d) {
        auto device = parse_mdns_response(d.data);
        if (!device) {
            qCDebug(rsMdnsLog) << "ignored datagram from" << d.sender.toString()
                               << "size" << d.data.size();
        }
        return device;
    });
    listener.stop();

    qCDebug(rsMdnsLog) << "query window closed," << devices.size() << "devices";
    return Result<std::vector<DiscoveredDevice>, Error>::ok(std::move(devices));
}

Result<DeviceChannelPtr, Error> MdnsDiscoverer::start_discovery() {
    QWriteLocker lock(&mu_);
    if (task_.is_running()) {
        return Result<DeviceChannelPtr, Error>::ok(channel_);
    }

    channel_ = make_device_channel();
    auto channel = channel_;
    task_.start([this, channel](const CancelToken& stop) { run_continuous(stop, channel); });
    return Result<DeviceChannelPtr, Error>::ok(std::move(channel));
}

void MdnsDiscoverer::stop_discovery() {
    DeviceChannelPtr channel;
    {
        QReadLocker lock(&mu_);
        channel = channel_;
    }
    task_.stop();
    if (channel) channel->close();
}

bool MdnsDiscoverer::is_running() const {
    return task_.is_running();
}

void MdnsDiscoverer::run_continuous(const CancelToken& stop, const DeviceChannelPtr& channel) {
    // Ticks are measured from the start of each cycle, so the time spent
    // collecting counts toward the interval.
    auto next_tick = CancelToken::Clock::now();
    do {
        next_tick = std::max(next_tick + options_.requery_interval, CancelToken::Clock::now());
        auto result = discover(stop.child_with_timeout(options_.requery_window));
        if (result.is_err()) {
            // Retried on the next tick.
            continue;
        }
        for (auto& device : result.unwrap()) {
            if (!channel->try_push(std::move(device))) {
                qCDebug(rsMdnsLog) << "consumer slow, device update dropped";
            }
        }
    } while (!stop.wait_until(next_tick));
}

} // namespace relayscout::discovery
