#include "discovery/scanner.hpp"

#include "core/logging.hpp"
#include "discovery/coiot.hpp"
#include "discovery/mdns.hpp"

#include <QThread>

#include <optional>

namespace relayscout::discovery {

Scanner::Scanner(ScannerConfig config)
    : config_(std::move(config))
{
}

Scanner::~Scanner() {
    auto result = stop();
    if (result.is_err()) {
        qCDebug(rsScannerLog) << "stop on destruction:" << result.unwrap_err().message.c_str();
    }
}

void Scanner::set_ble_scanner(std::shared_ptr<BleScanner> scanner) {
    std::shared_ptr<BleDiscoverer> previous;
    {
        QMutexLocker lock(&mu_);
        previous = std::move(ble_);
        if (scanner) {
            BleOptions options;
            options.filter_prefix = config_.ble_filter_prefix;
            options.include_bthome = config_.include_bthome;
            options.scan_duration = config_.ble_scan_window;
            ble_ = std::make_shared<BleDiscoverer>(std::move(scanner), options);
        }
    }
    if (previous) previous->stop_discovery();
}

void Scanner::set_wifi_scanner(std::shared_ptr<WifiScanner> scanner) {
    std::shared_ptr<WifiDiscoverer> previous;
    {
        QMutexLocker lock(&mu_);
        previous = std::move(wifi_);
        if (scanner) {
            WifiOptions options;
            options.probe_devices = config_.probe_devices;
            wifi_ = std::make_shared<WifiDiscoverer>(std::move(scanner), options);
        }
    }
    if (previous) previous->stop_discovery();
}

void Scanner::add_discoverer(QString name, std::shared_ptr<Discoverer> discoverer) {
    if (!discoverer) return;
    QMutexLocker lock(&mu_);
    extra_.push_back(Entry{std::move(name), std::move(discoverer), false});
}

std::shared_ptr<BleDiscoverer> Scanner::ble() const {
    QMutexLocker lock(&mu_);
    return ble_;
}

std::shared_ptr<WifiDiscoverer> Scanner::wifi() const {
    QMutexLocker lock(&mu_);
    return wifi_;
}

std::vector<Scanner::Entry> Scanner::active_entries() const {
    std::vector<Entry> entries;
    if (config_.enable_mdns) {
        entries.push_back(Entry{QStringLiteral("mdns"),
                                std::make_shared<MdnsDiscoverer>(config_.mdns), true});
    }
    if (config_.enable_coiot) {
        entries.push_back(Entry{QStringLiteral("coiot"),
                                std::make_shared<CoiotDiscoverer>(config_.coiot), true});
    }

    QMutexLocker lock(&mu_);
    if (config_.enable_ble && ble_) {
        entries.push_back(Entry{QStringLiteral("ble"), ble_, false});
    }
    if (config_.enable_wifi && wifi_) {
        entries.push_back(Entry{QStringLiteral("wifi"), wifi_, false});
    }
    entries.insert(entries.end(), extra_.begin(), extra_.end());
    return entries;
}

Result<std::vector<DiscoveredDevice>, Error> Scanner::scan() {
    return scan(config_.timeout);
}

Result<std::vector<DiscoveredDevice>, Error> Scanner::scan(Millis timeout) {
    return scan(CancelToken::with_timeout(timeout));
}

Result<std::vector<DiscoveredDevice>, Error> Scanner::scan(const CancelToken& token) {
    const auto entries = active_entries();
    std::vector<std::vector<DiscoveredDevice>> found(entries.size());

    std::vector<std::unique_ptr<QThread>> workers;
    workers.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        workers.emplace_back(QThread::create([&entries, &found, &token, i]() {
            const auto& entry = entries[i];
            auto result = entry.discoverer->discover(token);
            if (result.is_err()) {
                qCWarning(rsScannerLog) << entry.name << "discovery failed:"
                                        << result.unwrap_err().message.c_str();
                return;
            }
            found[i] = std::move(result).unwrap();
            qCDebug(rsScannerLog) << entry.name << "found" << found[i].size() << "devices";
        }));
        workers.back()->start();
    }
    for (auto& w : workers) {
        w->wait();
    }

    for (const auto& entry : entries) {
        if (!entry.per_scan) continue;
        auto stopped = entry.discoverer->stop();
        if (stopped.is_err()) {
            qCDebug(rsScannerLog) << entry.name << "stop failed:" << stopped.unwrap_err().message.c_str();
        }
    }

    std::vector<DiscoveredDevice> all;
    for (auto& devices : found) {
        all.insert(all.end(), std::make_move_iterator(devices.begin()), std::make_move_iterator(devices.end()));
    }
    auto unique = deduplicate(std::move(all));
    qCInfo(rsScannerLog) << "scan finished," << unique.size() << "unique devices";
    return Result<std::vector<DiscoveredDevice>, Error>::ok(std::move(unique));
}

Result<void, Error> Scanner::stop() {
    std::vector<std::shared_ptr<Discoverer>> held;
    {
        QMutexLocker lock(&mu_);
        if (ble_) held.push_back(ble_);
        if (wifi_) held.push_back(wifi_);
        for (const auto& entry : extra_) held.push_back(entry.discoverer);
    }

    std::optional<Error> first;
    for (const auto& discoverer : held) {
        auto result = discoverer->stop();
        if (result.is_err() && !first) {
            first = result.unwrap_err();
        }
    }
    if (first) return Result<void, Error>::err(*first);
    return Result<void, Error>::ok();
}

} // namespace relayscout::discovery
