#include "discovery/ble.hpp"

#include "core/logging.hpp"
#include "discovery/errors.hpp"

namespace relayscout::discovery {
namespace {

constexpr Millis kWaitSlice{250};

// Block until `token` ends.
void wait_until_done(const CancelToken& token) {
    while (!token.wait_for(kWaitSlice)) {
    }
}

} // namespace

bool is_device_provisioned(const BleDiscoveredDevice& device) {
    return !device.address.isNull() && device.address != QHostAddress(QHostAddress::AnyIPv4);
}

Result<bool, Error> ConnectabilityCache::is_connectable(const CancelToken& token,
                                                        const BleDiscoveredDevice* device,
                                                        BleConnector* connector) {
    if (!device) {
        return Result<bool, Error>::err(Error{"device is null", ErrorKind::InvalidArgument});
    }

    if (auto hit = cached(device->mac_address)) {
        return Result<bool, Error>::ok(*hit);
    }

    if (!connector) {
        return Result<bool, Error>::ok(device->connectable);
    }

    bool connectable = false;
    auto connected = connector->connect(token, device->mac_address);
    if (connected.is_ok()) {
        connectable = true;
        auto disconnected = connector->disconnect();
        if (disconnected.is_err()) {
            qCDebug(rsBleLog) << "disconnect from" << device->mac_address << "failed:"
                              << disconnected.unwrap_err().message.c_str();
        }
    } else {
        qCDebug(rsBleLog) << device->mac_address << "not connectable:"
                          << connected.unwrap_err().message.c_str();
    }

    QWriteLocker lock(&mu_);
    results_.insert(device->mac_address, connectable);
    return Result<bool, Error>::ok(connectable);
}

void ConnectabilityCache::clear() {
    QWriteLocker lock(&mu_);
    results_.clear();
}

std::optional<bool> ConnectabilityCache::cached(const QString& mac) const {
    QReadLocker lock(&mu_);
    auto it = results_.constFind(mac);
    if (it == results_.cend()) return std::nullopt;
    return it.value();
}

size_t ConnectabilityCache::size() const {
    QReadLocker lock(&mu_);
    return static_cast<size_t>(results_.size());
}

BleDiscoverer::BleDiscoverer(std::shared_ptr<BleScanner> scanner, BleOptions options)
    : scanner_(std::move(scanner))
    , options_(std::move(options))
{
}

BleDiscoverer::~BleDiscoverer() {
    stop_discovery();
}

bool BleDiscoverer::is_shelly_device(const BleAdvertisement& adv) const {
    if (adv.local_name.toUpper().startsWith(options_.filter_prefix.toUpper())) {
        return true;
    }
    for (const auto& uuid : adv.service_uuids) {
        if (uuid.compare(ble::kServiceUuid, Qt::CaseInsensitive) == 0) {
            return true;
        }
    }
    return options_.include_bthome && adv.service_data.contains(ble::kBTHomeServiceUuid);
}

BleDiscoveredDevice BleDiscoverer::parse_advertisement(const BleAdvertisement& adv) const {
    BleDiscoveredDevice device;
    device.id = adv.address;
    device.mac_address = adv.address;
    device.name = adv.local_name;
    device.protocol = Protocol::Ble;
    device.generation = Generation::Gen2;   // BLE provisioning exists from Gen2 on
    device.last_seen = Timestamp::now();
    device.rssi = adv.rssi;
    device.local_name = adv.local_name;
    device.connectable = adv.connectable;

    if (!adv.service_uuids.isEmpty()) {
        device.service_uuid = adv.service_uuids.first();
    }

    if (adv.local_name.toUpper().startsWith(ble::kNamePrefix)) {
        const auto parts = adv.local_name.split(QLatin1Char('-'));
        if (parts.size() >= 2) {
            device.model = parts.at(1);
        }
    }

    auto service_data = adv.service_data.constFind(ble::kBTHomeServiceUuid);
    if (service_data != adv.service_data.cend()) {
        device.bthome = parse_bthome_data(service_data.value());
        device.raw = service_data.value();
    }

    return device;
}

void BleDiscoverer::handle_advertisement(const BleAdvertisement& adv) {
    if (!is_shelly_device(adv)) return;

    auto device = parse_advertisement(adv);
    if (device.id.isEmpty()) return;

    DeviceChannelPtr channel;
    {
        QWriteLocker lock(&mu_);
        devices_.insert(device.id, device);
        channel = channel_;
    }

    if (on_device_found) {
        on_device_found(device);
    }

    if (channel && !channel->is_closed() && !channel->try_push(device)) {
        qCDebug(rsBleLog) << "consumer slow, device update dropped";
    }
}

Result<std::vector<DiscoveredDevice>, Error> BleDiscoverer::discover(const CancelToken& token) {
    if (!scanner_) {
        return Result<std::vector<DiscoveredDevice>, Error>::err(ble_not_supported());
    }

    {
        QWriteLocker lock(&mu_);
        devices_.clear();
    }

    auto started = scanner_->start(token, [this](const BleAdvertisement& adv) {
        handle_advertisement(adv);
    });
    if (started.is_err()) {
        return Result<std::vector<DiscoveredDevice>, Error>::err(
            Error::wrap(ErrorKind::Transport, "failed to start BLE scan", started.unwrap_err()));
    }

    wait_until_done(token);

    auto stopped = scanner_->stop();
    if (stopped.is_err()) {
        qCDebug(rsBleLog) << "scanner stop failed:" << stopped.unwrap_err().message.c_str();
    }

    std::vector<DiscoveredDevice> out;
    QReadLocker lock(&mu_);
    out.reserve(static_cast<size_t>(devices_.size()));
    for (auto it = devices_.cbegin(); it != devices_.cend(); ++it) {
        out.push_back(static_cast<const DiscoveredDevice&>(it.value()));
    }
    qCDebug(rsBleLog) << "scan finished," << out.size() << "devices";
    return Result<std::vector<DiscoveredDevice>, Error>::ok(std::move(out));
}

Result<DeviceChannelPtr, Error> BleDiscoverer::start_discovery() {
    QWriteLocker lock(&mu_);
    if (task_.is_running()) {
        return Result<DeviceChannelPtr, Error>::ok(channel_);
    }
    if (!scanner_) {
        return Result<DeviceChannelPtr, Error>::err(ble_not_supported());
    }

    channel_ = make_device_channel();
    task_.start([this](const CancelToken& stop) { run_continuous(stop); });
    return Result<DeviceChannelPtr, Error>::ok(channel_);
}

void BleDiscoverer::run_continuous(const CancelToken& stop) {
    while (!stop.is_cancelled()) {
        const auto window = stop.child_with_timeout(options_.scan_duration);
        auto started = scanner_->start(window, [this](const BleAdvertisement& adv) {
            handle_advertisement(adv);
        });
        if (started.is_err()) {
            qCDebug(rsBleLog) << "scan window failed:" << started.unwrap_err().message.c_str();
        }
        wait_until_done(window);
    }
}

void BleDiscoverer::stop_discovery() {
    DeviceChannelPtr channel;
    {
        QReadLocker lock(&mu_);
        channel = channel_;
    }
    if (!task_.is_running()) return;

    task_.stop();
    if (scanner_) {
        auto stopped = scanner_->stop();
        if (stopped.is_err()) {
            qCDebug(rsBleLog) << "scanner stop failed:" << stopped.unwrap_err().message.c_str();
        }
    }
    if (channel) channel->close();
}

std::vector<BleDiscoveredDevice> BleDiscoverer::devices() const {
    QReadLocker lock(&mu_);
    std::vector<BleDiscoveredDevice> out;
    out.reserve(static_cast<size_t>(devices_.size()));
    for (auto it = devices_.cbegin(); it != devices_.cend(); ++it) {
        out.push_back(it.value());
    }
    return out;
}

std::optional<BleDiscoveredDevice> BleDiscoverer::device_by_address(const QString& address) const {
    QReadLocker lock(&mu_);
    auto it = devices_.constFind(address);
    if (it == devices_.cend()) return std::nullopt;
    return it.value();
}

void BleDiscoverer::clear() {
    QWriteLocker lock(&mu_);
    devices_.clear();
}

} // namespace relayscout::discovery
