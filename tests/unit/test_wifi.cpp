#include <catch2/catch_test_macros.hpp>

#include "discovery/errors.hpp"
#include "discovery/wifi.hpp"
#include "fakes.hpp"

#include <QJsonObject>
#include <QThread>

using namespace relayscout;
using namespace relayscout::discovery;
using relayscout::testing::FakeJsonFetcher;
using relayscout::testing::FakeWifiScanner;

namespace {

const QString kGen2Url = QStringLiteral("http://192.168.33.1/rpc/Shelly.GetDeviceInfo");
const QString kGen1Url = QStringLiteral("http://192.168.33.1/shelly");

WifiNetwork network(const QString& ssid, int signal = -50) {
    WifiNetwork n;
    n.ssid = ssid;
    n.bssid = QStringLiteral("aa:bb:cc:00:00:01");
    n.signal = signal;
    n.channel = 6;
    n.security = QStringLiteral("open");
    return n;
}

WifiOptions fast_probe() {
    WifiOptions options;
    options.probe_devices = true;
    options.settle_delay = Millis{1};
    return options;
}

} // namespace

TEST_CASE("is_shelly_ap", "[wifi][ssid]") {
    REQUIRE(is_shelly_ap("shellyplus1pm-AABBCC"));
    REQUIRE(is_shelly_ap("ShellyPlus2PM_ABCDEF"));
    REQUIRE(is_shelly_ap("shelly1-a1b2c3"));
    REQUIRE(is_shelly_ap("SHELLYPLUSABCDEF"));

    REQUIRE_FALSE(is_shelly_ap("shelly"));
    REQUIRE_FALSE(is_shelly_ap("HomeWiFi"));
    REQUIRE_FALSE(is_shelly_ap("my-shelly1-aabbcc"));
    // Several separators are outside the supported naming pattern.
    REQUIRE_FALSE(is_shelly_ap("shellyplug-s-AABBCC"));
}

TEST_CASE("is_shelly_ap: the whole SSID must match", "[wifi][ssid]") {
    REQUIRE_FALSE(is_shelly_ap("shelly1-abc\n"));
    REQUIRE_FALSE(is_shelly_ap("shelly1-abc\r\n"));
    REQUIRE_FALSE(is_shelly_ap("\nshelly1-abc"));
    REQUIRE_FALSE(is_shelly_ap("shelly1-abc "));
}

TEST_CASE("parse_shelly_ssid: separated form", "[wifi][ssid]") {
    REQUIRE(parse_shelly_ssid("shellyplus1pm-AABBCC") == SsidParts{"plus1pm", "AABBCC"});
    REQUIRE(parse_shelly_ssid("ShellyPlus2PM_abcdef") == SsidParts{"plus2pm", "ABCDEF"});
    REQUIRE(parse_shelly_ssid("shelly1-a1b2c3") == SsidParts{"1", "A1B2C3"});
    REQUIRE(parse_shelly_ssid("shellyplug-s-AABBCC") == SsidParts{"plug", "AABBCC"});
}

TEST_CASE("parse_shelly_ssid: unseparated form takes the trailing hex run", "[wifi][ssid]") {
    REQUIRE(parse_shelly_ssid("shellyplusABCDEF") == SsidParts{"plus", "ABCDEF"});
    REQUIRE(parse_shelly_ssid("shellydimmer2") == SsidParts{"dimmer", "2"});
    REQUIRE(parse_shelly_ssid("shellyabc") == SsidParts{"", "ABC"});
    REQUIRE(parse_shelly_ssid("shelly") == SsidParts{});
}

TEST_CASE("infer_generation_from_model", "[wifi]") {
    REQUIRE(infer_generation_from_model("plus1pm") == Generation::Gen2);
    REQUIRE(infer_generation_from_model("pro4pm") == Generation::Gen2);
    REQUIRE(infer_generation_from_model("1g3") == Generation::Gen3);
    REQUIRE(infer_generation_from_model("1minigen3") == Generation::Gen3);
    REQUIRE(infer_generation_from_model("1g4") == Generation::Gen4);
    REQUIRE(infer_generation_from_model("1pm") == Generation::Gen1);
    REQUIRE(infer_generation_from_model("") == Generation::Gen1);
}

TEST_CASE("network_to_device uses the AP address", "[wifi]") {
    const auto device = network_to_device(network("shellyplus1pm-AABBCC", -42));

    REQUIRE(device.id == "AABBCC");
    REQUIRE(device.model == "plus1pm");
    REQUIRE(device.name == "shellyplus1pm-AABBCC");
    REQUIRE(device.generation == Generation::Gen2);
    REQUIRE(device.protocol == Protocol::WifiAp);
    REQUIRE(device.address == QHostAddress(QStringLiteral("192.168.33.1")));
    REQUIRE(device.port == 80);
    REQUIRE(device.ssid == "shellyplus1pm-AABBCC");
    REQUIRE(device.signal == -42);
    REQUIRE(device.channel == 6);
    REQUIRE_FALSE(device.is_connected);
}

TEST_CASE("apply_gen2_info overlays device info", "[wifi]") {
    auto device = network_to_device(network("shellyplus1pm-AABBCC"));
    apply_gen2_info(device, QJsonObject{
        {"id", "shellyplus1pm-a8032aabbcc"},
        {"name", "Porch"},
        {"model", "SNSW-001P16EU"},
        {"mac", "A8032AABBCC0"},
        {"fw_id", "20231107-164738/1.0.8-g"},
        {"gen", 3},
        {"auth_en", true},
    });

    REQUIRE(device.id == "shellyplus1pm-a8032aabbcc");
    REQUIRE(device.name == "Porch");
    REQUIRE(device.model == "SNSW-001P16EU");
    REQUIRE(device.mac_address == "A8032AABBCC0");
    REQUIRE(device.firmware == "20231107-164738/1.0.8-g");
    REQUIRE(device.generation == Generation::Gen3);
    REQUIRE(device.auth_required);
}

TEST_CASE("apply_gen2_info ignores out-of-range generations", "[wifi]") {
    auto device = network_to_device(network("shellyplus1pm-AABBCC"));
    apply_gen2_info(device, QJsonObject{{"gen", 9}});
    REQUIRE(device.generation == Generation::Gen2);
}

TEST_CASE("apply_gen1_info forces Gen1", "[wifi]") {
    WifiDiscoveredDevice device;
    apply_gen1_info(device, QJsonObject{
        {"type", "SHSW-1"},
        {"mac", "AA:BB:CC:DD:EE:FF"},
        {"fw", "20230913-112003/v1.14.0"},
        {"auth", false},
    });

    REQUIRE(device.model == "SHSW-1");
    REQUIRE(device.mac_address == "AA:BB:CC:DD:EE:FF");
    REQUIRE(device.id == "AABBCCDDEEFF");
    REQUIRE(device.firmware == "20230913-112003/v1.14.0");
    REQUIRE(device.generation == Generation::Gen1);
    REQUIRE_FALSE(device.auth_required);
}

TEST_CASE("WifiDiscoverer: no scanner is not supported", "[wifi]") {
    WifiDiscoverer discoverer(nullptr);

    auto result = discoverer.discover(Millis{10});
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::NotSupported);
    REQUIRE(discoverer.start_discovery().is_err());
}

TEST_CASE("WifiDiscoverer: scan failure is a transport error", "[wifi]") {
    auto scanner = std::make_shared<FakeWifiScanner>();
    scanner->scan_error = tool_not_found();
    WifiDiscoverer discoverer(scanner);

    auto result = discoverer.discover(Millis{100});
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::Transport);
    REQUIRE(result.unwrap_err().is(ErrorKind::ToolNotFound));
}

TEST_CASE("WifiDiscoverer: discover lists device APs only", "[wifi]") {
    auto scanner = std::make_shared<FakeWifiScanner>();
    scanner->networks = {network("HomeWiFi"), network("shellyplus1pm-AABBCC"), network("shelly1-DDEEFF")};
    auto fetcher = std::make_shared<FakeJsonFetcher>();
    WifiDiscoverer discoverer(scanner, {}, fetcher);

    QStringList seen;
    discoverer.on_network_found = [&seen](const WifiNetwork& n) { seen.append(n.ssid); };
    int found = 0;
    discoverer.on_device_found = [&found](const WifiDiscoveredDevice&) { ++found; };

    auto result = discoverer.discover(Millis{1000});
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().size() == 2);
    REQUIRE(seen == QStringList{"shellyplus1pm-AABBCC", "shelly1-DDEEFF"});
    REQUIRE(found == 2);

    // Without probe_devices the host never leaves its network.
    REQUIRE(scanner->connects.isEmpty());
    REQUIRE(fetcher->requested().isEmpty());

    REQUIRE(discoverer.devices().size() == 2);
    discoverer.clear();
    REQUIRE(discoverer.devices().empty());
}

TEST_CASE("WifiDiscoverer: scan_networks classifies networks", "[wifi]") {
    auto scanner = std::make_shared<FakeWifiScanner>();
    scanner->networks = {network("HomeWiFi"), network("shellyplus1pm-AABBCC")};
    WifiDiscoverer discoverer(scanner);

    auto networks = discoverer.scan_networks(CancelToken::with_timeout(Millis{1000}));
    REQUIRE(networks.is_ok());
    REQUIRE(networks.unwrap().size() == 1);

    const auto& n = networks.unwrap().front();
    REQUIRE(n.is_shelly);
    REQUIRE(n.device_type == "plus1pm");
    REQUIRE(n.device_id == "AABBCC");
    REQUIRE_FALSE(n.last_seen.is_zero());
}

TEST_CASE("WifiDiscoverer: probe reads Gen2 info and rejoins", "[wifi][probe]") {
    auto scanner = std::make_shared<FakeWifiScanner>();
    scanner->current = network("HomeWiFi");
    auto fetcher = std::make_shared<FakeJsonFetcher>();
    fetcher->responses.insert(kGen2Url, QJsonObject{
        {"id", "shellyplus1pm-aabbcc"},
        {"model", "SNSW-001P16EU"},
        {"gen", 2},
    });
    WifiDiscoverer discoverer(scanner, fast_probe(), fetcher);

    auto probed = discoverer.probe_device(CancelToken{}, network("shellyplus1pm-AABBCC"));
    REQUIRE(probed.is_ok());

    const auto& device = probed.unwrap();
    REQUIRE(device.is_connected);
    REQUIRE(device.id == "shellyplus1pm-aabbcc");
    REQUIRE(device.model == "SNSW-001P16EU");
    REQUIRE(scanner->connects == QStringList{"shellyplus1pm-AABBCC", "HomeWiFi"});
    REQUIRE(fetcher->requested() == QStringList{kGen2Url});
}

TEST_CASE("WifiDiscoverer: probe falls back to Gen1 info", "[wifi][probe]") {
    auto scanner = std::make_shared<FakeWifiScanner>();
    auto fetcher = std::make_shared<FakeJsonFetcher>();
    fetcher->responses.insert(kGen1Url, QJsonObject{{"type", "SHSW-1"}, {"mac", "AA:BB:CC:DD:EE:FF"}});
    WifiDiscoverer discoverer(scanner, fast_probe(), fetcher);

    auto probed = discoverer.probe_device(CancelToken{}, network("shelly1-DDEEFF"));
    REQUIRE(probed.is_ok());
    REQUIRE(probed.unwrap().generation == Generation::Gen1);
    REQUIRE(probed.unwrap().model == "SHSW-1");
    // The SSID-derived id is kept when the response does not replace it.
    REQUIRE(probed.unwrap().id == "DDEEFF");
    REQUIRE(fetcher->requested() == QStringList{kGen2Url, kGen1Url});
    // Not connected to anything before, so nothing to rejoin.
    REQUIRE(scanner->connects == QStringList{"shelly1-DDEEFF"});
}

TEST_CASE("WifiDiscoverer: failed AP join is a probe error", "[wifi][probe]") {
    auto scanner = std::make_shared<FakeWifiScanner>();
    scanner->current = network("HomeWiFi");
    scanner->connect_errors.insert("shellyplus1pm-AABBCC", ssid_not_found());
    auto fetcher = std::make_shared<FakeJsonFetcher>();
    WifiDiscoverer discoverer(scanner, fast_probe(), fetcher);

    auto probed = discoverer.probe_device(CancelToken{}, network("shellyplus1pm-AABBCC"));
    REQUIRE(probed.is_err());
    REQUIRE(probed.unwrap_err().kind == ErrorKind::Probe);
    REQUIRE(probed.unwrap_err().is(ErrorKind::SsidNotFound));
    REQUIRE(fetcher->requested().isEmpty());
}

TEST_CASE("WifiDiscoverer: failed rejoin does not fail the probe", "[wifi][probe]") {
    auto scanner = std::make_shared<FakeWifiScanner>();
    scanner->current = network("HomeWiFi");
    scanner->connect_errors.insert("HomeWiFi", auth_failed());
    auto fetcher = std::make_shared<FakeJsonFetcher>();
    WifiDiscoverer discoverer(scanner, fast_probe(), fetcher);

    auto probed = discoverer.probe_device(CancelToken{}, network("shellyplus1pm-AABBCC"));
    REQUIRE(probed.is_ok());
    REQUIRE(scanner->connects == QStringList{"shellyplus1pm-AABBCC", "HomeWiFi"});
}

TEST_CASE("WifiDiscoverer: discover keeps SSID record when probing fails", "[wifi][probe]") {
    auto scanner = std::make_shared<FakeWifiScanner>();
    scanner->networks = {network("shellyplus1pm-AABBCC")};
    scanner->connect_errors.insert("shellyplus1pm-AABBCC", connection_timeout());
    WifiDiscoverer discoverer(scanner, fast_probe(), std::make_shared<FakeJsonFetcher>());

    auto result = discoverer.discover(Millis{1000});
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().size() == 1);
    REQUIRE(result.unwrap().front().id == "AABBCC");
}

TEST_CASE("WifiDiscoverer: continuous rescans keep their interval", "[wifi]") {
    auto scanner = std::make_shared<FakeWifiScanner>();
    scanner->networks = {network("shelly1-DDEEFF")};
    scanner->scan_delay = Millis{200};

    WifiOptions options;
    options.rescan_interval = Millis{300};
    WifiDiscoverer discoverer(scanner, options, std::make_shared<FakeJsonFetcher>());

    auto channel = discoverer.start_discovery();
    REQUIRE(channel.is_ok());
    QThread::msleep(1100);
    discoverer.stop_discovery();

    // Scans start near 0, 300, 600 and 900 ms. Adding the interval after
    // each 200 ms scan would fit only three.
    REQUIRE(scanner->scans.loadRelaxed() >= 4);
    REQUIRE(scanner->scans.loadRelaxed() <= 5);
}
