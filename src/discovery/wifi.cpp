#include "discovery/wifi.hpp"

#include "core/logging.hpp"
#include "discovery/errors.hpp"

#include <QRegularExpression>
#include <QUrl>

#include <algorithm>

namespace relayscout::discovery {
namespace {

const QRegularExpression& ap_pattern() {
    static const QRegularExpression re(
        QRegularExpression::anchoredPattern(QStringLiteral("shelly[a-z0-9]*[-_]?[a-f0-9]+")),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

bool is_hex_char(QChar c) {
    const auto u = c.unicode();
    return (u >= '0' && u <= '9') || (u >= 'a' && u <= 'f') || (u >= 'A' && u <= 'F');
}

} // namespace

bool is_shelly_ap(const QString& ssid) {
    return ap_pattern().match(ssid).hasMatch();
}

SsidParts parse_shelly_ssid(const QString& ssid) {
    QString rest = ssid.toLower();
    if (rest.startsWith(wifi::kApPrefix)) {
        rest.remove(0, wifi::kApPrefix.size());
    }

    static const QRegularExpression separators(QStringLiteral("[-_]"));
    const auto parts = rest.split(separators, Qt::SkipEmptyParts);

    SsidParts out;
    if (parts.size() >= 2) {
        out.type = parts.first();
        out.id = parts.last().toUpper();
    } else if (parts.size() == 1) {
        const auto& part = parts.first();
        for (auto i = part.size() - 1; i >= 0; --i) {
            if (!is_hex_char(part.at(i))) {
                out.type = part.left(i + 1);
                out.id = part.mid(i + 1).toUpper();
                return out;
            }
        }
        out.id = part.toUpper();
    }
    return out;
}

Generation infer_generation_from_model(const QString& model) {
    const auto m = model.toLower();
    const auto has = [&m](const char* token) { return m.contains(QLatin1String(token)); };

    if (has("g4") || has("gen4")) return Generation::Gen4;
    if (has("g3") || has("gen3")) return Generation::Gen3;
    if (has("plus") || has("pro") || has("g2") || has("gen2")) return Generation::Gen2;
    return Generation::Gen1;
}

WifiDiscoveredDevice network_to_device(const WifiNetwork& network) {
    const auto parts = parse_shelly_ssid(network.ssid);

    WifiDiscoveredDevice device;
    device.id = parts.id;
    device.name = network.ssid;
    device.model = parts.type;
    device.mac_address = network.bssid;
    device.protocol = Protocol::WifiAp;
    device.address = QHostAddress(wifi::kDefaultApAddress);
    device.port = wifi::kDefaultApPort;
    device.generation = infer_generation_from_model(parts.type);
    device.last_seen = network.last_seen;
    device.ssid = network.ssid;
    device.bssid = network.bssid;
    device.signal = network.signal;
    device.channel = network.channel;
    device.security = network.security;
    return device;
}

void apply_gen2_info(WifiDiscoveredDevice& device, const QJsonObject& info) {
    const auto str = [&info](const char* key, QString& field) {
        const auto v = info.value(QLatin1String(key));
        if (v.isString()) field = v.toString();
    };

    str("name", device.name);
    str("model", device.model);
    str("mac", device.mac_address);
    str("fw_id", device.firmware);

    const auto gen = info.value(QLatin1String("gen"));
    if (gen.isDouble()) {
        const int g = gen.toInt();
        if (g >= 0 && g <= static_cast<int>(Generation::Gen4)) {
            device.generation = static_cast<Generation>(g);
        }
    }

    const auto auth = info.value(QLatin1String("auth_en"));
    if (auth.isBool()) device.auth_required = auth.toBool();

    str("id", device.id);
}

void apply_gen1_info(WifiDiscoveredDevice& device, const QJsonObject& info) {
    const auto type = info.value(QLatin1String("type"));
    if (type.isString()) device.model = type.toString();

    const auto mac = info.value(QLatin1String("mac"));
    if (mac.isString()) {
        device.mac_address = mac.toString();
        if (device.id.isEmpty()) {
            device.id = mac_without_colons(device.mac_address);
        }
    }

    const auto fw = info.value(QLatin1String("fw"));
    if (fw.isString()) device.firmware = fw.toString();

    const auto auth = info.value(QLatin1String("auth"));
    if (auth.isBool()) device.auth_required = auth.toBool();

    device.generation = Generation::Gen1;
}

WifiDiscoverer::WifiDiscoverer(std::shared_ptr<WifiScanner> scanner,
                               WifiOptions options,
                               std::shared_ptr<network::JsonFetcher> fetcher)
    : scanner_(std::move(scanner))
    , options_(std::move(options))
    , fetcher_(fetcher ? std::move(fetcher) : std::make_shared<network::HttpJsonFetcher>())
{
}

WifiDiscoverer::~WifiDiscoverer() {
    stop_discovery();
}

QUrl WifiDiscoverer::ap_url(const QString& path) const {
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(options_.ap_address);
    if (options_.ap_port != wifi::kDefaultApPort) {
        url.setPort(options_.ap_port);
    }
    url.setPath(path);
    return url;
}

Result<std::vector<WifiNetwork>, Error> WifiDiscoverer::scan_networks(const CancelToken& token) {
    using R = Result<std::vector<WifiNetwork>, Error>;
    if (!scanner_) return R::err(wifi_not_supported());

    auto scanned = scanner_->scan(token);
    if (scanned.is_err()) return R::err(scanned.unwrap_err());

    std::vector<WifiNetwork> out;
    for (auto& network : scanned.unwrap()) {
        if (!is_shelly_ap(network.ssid)) continue;
        const auto parts = parse_shelly_ssid(network.ssid);
        network.is_shelly = true;
        network.device_type = parts.type;
        network.device_id = parts.id;
        network.last_seen = Timestamp::now();
        out.push_back(std::move(network));
    }
    return R::ok(std::move(out));
}

Result<std::vector<DiscoveredDevice>, Error> WifiDiscoverer::discover(const CancelToken& token) {
    using R = Result<std::vector<DiscoveredDevice>, Error>;
    if (!scanner_) return R::err(wifi_not_supported());

    auto networks = scan_networks(token);
    if (networks.is_err()) {
        return R::err(Error::wrap(ErrorKind::Transport, "WiFi scan failed", networks.unwrap_err()));
    }

    std::vector<DiscoveredDevice> out;
    for (const auto& network : networks.unwrap()) {
        if (on_network_found) on_network_found(network);

        auto device = network_to_device(network);
        if (options_.probe_devices) {
            auto probed = probe_device(token, network);
            if (probed.is_ok()) {
                device = std::move(probed).unwrap();
            } else {
                qCDebug(rsWifiLog) << "probe of" << network.ssid << "failed:"
                                   << probed.unwrap_err().message.c_str();
            }
        }

        if (device.id.isEmpty()) continue;
        out.push_back(device);

        {
            QWriteLocker lock(&mu_);
            devices_.insert(network.ssid, device);
        }
        if (on_device_found) on_device_found(device);
    }

    qCDebug(rsWifiLog) << "scan finished," << out.size() << "device APs";
    return R::ok(std::move(out));
}

Result<WifiDiscoveredDevice, Error> WifiDiscoverer::probe_device(const CancelToken& token,
                                                                 const WifiNetwork& network) {
    using R = Result<WifiDiscoveredDevice, Error>;
    if (!scanner_) return R::err(wifi_not_supported());

    const auto probe = token.child_with_timeout(options_.probe_timeout);

    std::optional<WifiNetwork> original;
    auto current = scanner_->current_network(probe);
    if (current.is_ok()) {
        original = current.unwrap();
    } else {
        qCDebug(rsWifiLog) << "current network unknown:" << current.unwrap_err().message.c_str();
    }

    auto joined = scanner_->connect(probe, network.ssid, QString{});
    if (joined.is_err()) {
        return R::err(Error::wrap(ErrorKind::Probe, "failed to connect to device AP", joined.unwrap_err()));
    }

    auto device = network_to_device(network);
    device.is_connected = true;

    if (!probe.wait_for(options_.settle_delay)) {
        auto gen2 = fetcher_->get_json(ap_url(wifi::kGen2InfoPath), options_.http_timeout, probe);
        if (gen2.is_ok()) {
            apply_gen2_info(device, gen2.unwrap());
        } else {
            auto gen1 = fetcher_->get_json(ap_url(wifi::kGen1InfoPath), options_.http_timeout, probe);
            if (gen1.is_ok()) {
                apply_gen1_info(device, gen1.unwrap());
            } else {
                qCDebug(rsWifiLog) << network.ssid << "answered neither info endpoint";
            }
        }
    }

    if (original) {
        // The probe token may already be spent; rejoining gets its own budget.
        const auto rejoin = CancelToken::with_timeout(options_.probe_timeout);
        auto back = scanner_->connect(rejoin, original->ssid, QString{});
        if (back.is_err()) {
            qCWarning(rsWifiLog) << "could not rejoin" << original->ssid << ":"
                                 << back.unwrap_err().message.c_str();
        }
    }

    return R::ok(std::move(device));
}

Result<DeviceChannelPtr, Error> WifiDiscoverer::start_discovery() {
    QWriteLocker lock(&mu_);
    if (task_.is_running()) {
        return Result<DeviceChannelPtr, Error>::ok(channel_);
    }
    if (!scanner_) {
        return Result<DeviceChannelPtr, Error>::err(wifi_not_supported());
    }

    channel_ = make_device_channel();
    auto channel = channel_;
    task_.start([this, channel](const CancelToken& stop) { run_continuous(stop, channel); });
    return Result<DeviceChannelPtr, Error>::ok(std::move(channel));
}

void WifiDiscoverer::run_continuous(const CancelToken& stop, const DeviceChannelPtr& channel) {
    // Rescans are spaced from the start of the previous scan.
    auto next_tick = CancelToken::Clock::now();
    do {
        next_tick = std::max(next_tick + options_.rescan_interval, CancelToken::Clock::now());
        auto result = discover(stop.child_with_timeout(options_.scan_budget));
        if (result.is_err()) {
            qCDebug(rsWifiLog) << "periodic scan failed:" << result.unwrap_err().message.c_str();
            continue;
        }
        for (auto& device : result.unwrap()) {
            if (!channel->try_push(std::move(device))) {
                qCDebug(rsWifiLog) << "consumer slow, device update dropped";
            }
        }
    } while (!stop.wait_until(next_tick));
}

void WifiDiscoverer::stop_discovery() {
    DeviceChannelPtr channel;
    {
        QReadLocker lock(&mu_);
        channel = channel_;
    }
    task_.stop();
    if (channel) channel->close();
}

std::vector<WifiDiscoveredDevice> WifiDiscoverer::devices() const {
    QReadLocker lock(&mu_);
    std::vector<WifiDiscoveredDevice> out;
    out.reserve(static_cast<size_t>(devices_.size()));
    for (auto it = devices_.cbegin(); it != devices_.cend(); ++it) {
        out.push_back(it.value());
    }
    return out;
}

void WifiDiscoverer::clear() {
    QWriteLocker lock(&mu_);
    devices_.clear();
}

} // namespace relayscout::discovery
