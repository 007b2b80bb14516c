#include "discovery/identify.hpp"

#include "core/logging.hpp"

#include <QAtomicInt>
#include <QJsonDocument>
#include <QMutex>
#include <QThread>
#include <QUrl>

#include <algorithm>

namespace relayscout::discovery {
namespace {

QString normalize_base(QString address) {
    if (!address.startsWith(QLatin1String("http://")) && !address.startsWith(QLatin1String("https://"))) {
        address.prepend(QLatin1String("http://"));
    }
    while (address.endsWith(QLatin1Char('/'))) {
        address.chop(1);
    }
    return address;
}

Generation generation_from_number(int gen) {
    switch (gen) {
        case 3: return Generation::Gen3;
        case 4: return Generation::Gen4;
        default: return Generation::Gen2;
    }
}

DeviceInfo gen2_info(const QJsonObject& data) {
    DeviceInfo info;
    info.id = data.value(QLatin1String("id")).toString();
    info.name = data.value(QLatin1String("name")).toString();
    info.model = data.value(QLatin1String("model")).toString();
    info.firmware = data.value(QLatin1String("fw_id")).toString();
    info.mac_address = data.value(QLatin1String("mac")).toString();
    info.auth_required = data.value(QLatin1String("auth_en")).toBool();
    info.app = data.value(QLatin1String("app")).toString();
    info.profile = data.value(QLatin1String("profile")).toString();
    info.generation = generation_from_number(data.value(QLatin1String("gen")).toInt());
    info.raw = data;
    return info;
}

DeviceInfo gen1_info(const QJsonObject& data) {
    DeviceInfo info;
    info.id = data.value(QLatin1String("mac")).toString();
    info.model = data.value(QLatin1String("type")).toString();
    info.firmware = data.value(QLatin1String("fw")).toString();
    info.mac_address = info.id;
    info.auth_required = data.value(QLatin1String("auth")).toBool();
    info.generation = Generation::Gen1;
    info.raw = data;
    return info;
}

// User-assigned name from Gen1 settings, else the device hostname.
QString gen1_name(const QJsonObject& settings) {
    const auto name = settings.value(QLatin1String("name")).toString();
    if (!name.isEmpty()) return name;
    return settings.value(QLatin1String("device")).toObject()
                   .value(QLatin1String("hostname")).toString();
}

} // namespace

HttpDeviceIdentifier::HttpDeviceIdentifier(std::shared_ptr<network::JsonFetcher> fetcher)
    : fetcher_(fetcher ? std::move(fetcher) : std::make_shared<network::HttpJsonFetcher>())
{
}

Result<DeviceInfo, Error> HttpDeviceIdentifier::identify(const QString& address,
                                                         Millis timeout,
                                                         const CancelToken& token) {
    const auto base = normalize_base(address);

    auto shelly = fetcher_->get_json(QUrl(base + QLatin1String("/shelly")), timeout, token);
    if (shelly.is_err()) {
        return Result<DeviceInfo, Error>::err(
            Error::wrap(ErrorKind::Probe, "identify " + address.toStdString(), shelly.unwrap_err()));
    }

    const auto& data = shelly.unwrap();
    if (data.value(QLatin1String("gen")).toInt() >= 2) {
        return Result<DeviceInfo, Error>::ok(gen2_info(data));
    }

    auto info = gen1_info(data);
    auto settings = fetcher_->get_json(QUrl(base + QLatin1String("/settings")), timeout, token);
    if (settings.is_ok()) {
        info.name = gen1_name(settings.unwrap());
    }
    return Result<DeviceInfo, Error>::ok(std::move(info));
}

std::vector<DiscoveredDevice> probe_addresses(DeviceIdentifier& identifier,
                                              const QStringList& addresses,
                                              const CancelToken& token,
                                              const ProbeProgressCallback& callback) {
    const int total = static_cast<int>(addresses.size());

    QMutex mu;
    std::vector<DiscoveredDevice> found;
    int done = 0;
    QAtomicInt stopped{0};
    QAtomicInt next{0};

    auto worker = [&]() {
        for (;;) {
            if (stopped.loadRelaxed() != 0 || token.is_cancelled()) return;
            const int i = next.fetchAndAddRelaxed(1);
            if (i >= total) return;

            ProbeProgress progress;
            progress.address = addresses.at(i);
            progress.total = total;

            auto info = identifier.identify(progress.address, kProbeAddressTimeout, token);
            if (info.is_ok()) {
                const auto& d = info.unwrap();
                DiscoveredDevice device;
                device.id = d.id;
                if (device.id.isEmpty()) {
                    // Gen1 replies without a MAC are keyed by their address.
                    const auto host = host_of(progress.address);
                    device.id = host.isNull() ? progress.address : host.toString();
                }
                device.name = d.name;
                device.model = d.model;
                device.generation = d.generation;
                device.address = host_of(progress.address);
                device.port = kDefaultHttpPort;
                device.mac_address = d.mac_address;
                device.firmware = d.firmware;
                device.auth_required = d.auth_required;
                device.protocol = Protocol::Manual;
                device.last_seen = Timestamp::now();
                device.raw = QJsonDocument(d.raw).toJson(QJsonDocument::Compact);

                progress.found = true;
                progress.device = device;
            } else {
                progress.error = info.unwrap_err();
            }

            {
                QMutexLocker lock(&mu);
                if (progress.device) found.push_back(*progress.device);
                progress.done = ++done;
            }

            if (callback && !callback(progress)) {
                stopped.storeRelaxed(1);
            }
        }
    };

    const int worker_count = std::min(kMaxConcurrentProbes, total);
    std::vector<std::unique_ptr<QThread>> workers;
    workers.reserve(static_cast<size_t>(worker_count));
    for (int i = 0; i < worker_count; ++i) {
        workers.emplace_back(QThread::create(worker));
        workers.back()->start();
    }
    for (auto& w : workers) {
        w->wait();
    }

    qCDebug(rsProbeLog) << "probed" << done << "of" << total << "addresses," << found.size() << "devices";
    return found;
}

QStringList generate_subnet_addresses(const QString& cidr) {
    const auto subnet = QHostAddress::parseSubnet(cidr);
    const auto& network = subnet.first;
    const int prefix = subnet.second;
    if (network.isNull() || network.protocol() != QAbstractSocket::IPv4Protocol || prefix < 0 || prefix > 32) {
        return {};
    }

    const quint32 mask = prefix == 0 ? 0u : ~quint32(0) << (32 - prefix);
    const quint32 first = network.toIPv4Address() & mask;
    const quint32 broadcast = first | ~mask;

    QStringList out;
    for (quint64 ip = quint64(first) + 1; ip < broadcast; ++ip) {
        out.append(QHostAddress(static_cast<quint32>(ip)).toString());
    }
    return out;
}

QHostAddress host_of(const QString& address) {
    QString s = address;
    if (s.startsWith(QLatin1String("http://"))) s.remove(0, 7);
    else if (s.startsWith(QLatin1String("https://"))) s.remove(0, 8);

    const auto colon = s.lastIndexOf(QLatin1Char(':'));
    if (colon >= 0) s.truncate(colon);

    return QHostAddress(s);
}

} // namespace relayscout::discovery
