#include <catch2/catch_test_macros.hpp>

#include "discovery/device.hpp"
#include "fakes.hpp"

#include <algorithm>

using namespace relayscout;
using namespace relayscout::discovery;
using relayscout::testing::make_device;

namespace {

const DiscoveredDevice* find_id(const std::vector<DiscoveredDevice>& devices, const QString& id) {
    auto it = std::find_if(devices.begin(), devices.end(),
                           [&id](const DiscoveredDevice& d) { return d.id == id; });
    return it == devices.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("Generation names and parsing", "[device]") {
    REQUIRE(generation_name(Generation::Gen1) == "Gen1");
    REQUIRE(generation_name(Generation::Gen4) == "Gen4");
    REQUIRE(generation_name(Generation::Unknown) == "Unknown");

    REQUIRE(parse_generation("gen1") == Generation::Gen1);
    REQUIRE(parse_generation("2") == Generation::Gen2);
    REQUIRE(parse_generation("Plus") == Generation::Gen2);
    REQUIRE(parse_generation("Pro") == Generation::Gen2);
    REQUIRE(parse_generation("Gen3") == Generation::Gen3);
    REQUIRE(parse_generation("4") == Generation::Gen4);
    REQUIRE(parse_generation("") == Generation::Unknown);
    REQUIRE_FALSE(parse_generation("gen5").has_value());

    REQUIRE(is_rest(Generation::Gen1));
    REQUIRE_FALSE(is_rpc(Generation::Gen1));
    REQUIRE(is_rpc(Generation::Gen3));
    REQUIRE_FALSE(is_rpc(Generation::Unknown));
}

TEST_CASE("Protocol wire names round-trip", "[device]") {
    REQUIRE(protocol_name(Protocol::WifiAp) == "wifi_ap");
    REQUIRE(parse_protocol("coiot") == Protocol::Coiot);
    REQUIRE_FALSE(parse_protocol("zigbee").has_value());
}

TEST_CASE("DiscoveredDevice::url defaults the port", "[device]") {
    DiscoveredDevice d;
    REQUIRE(d.url().isEmpty());

    d.address = QHostAddress(QStringLiteral("192.168.1.20"));
    REQUIRE(d.url() == "http://192.168.1.20:80");

    d.port = 8080;
    REQUIRE(d.url() == "http://192.168.1.20:8080");
}

TEST_CASE("DiscoveredDevice::merge_key falls back to MAC then address", "[device]") {
    DiscoveredDevice d;
    d.address = QHostAddress(QStringLiteral("10.0.0.7"));
    REQUIRE(d.merge_key() == "10.0.0.7");

    d.mac_address = QStringLiteral("AA:BB:CC:DD:EE:FF");
    REQUIRE(d.merge_key() == "AA:BB:CC:DD:EE:FF");

    d.id = QStringLiteral("shellyplus1-aabbcc");
    REQUIRE(d.merge_key() == "shellyplus1-aabbcc");
}

TEST_CASE("deduplicate keeps the latest observation per key", "[device][dedup]") {
    auto older = make_device("dev1", 1000, Protocol::Mdns);
    older.name = QStringLiteral("old");
    auto newer = make_device("dev1", 2000, Protocol::Coiot);
    newer.name = QStringLiteral("new");
    auto other = make_device("dev2", 1500);

    const auto out = deduplicate({older, other, newer});
    REQUIRE(out.size() == 2);

    const auto* dev1 = find_id(out, "dev1");
    REQUIRE(dev1 != nullptr);
    REQUIRE(dev1->name == "new");
    REQUIRE(dev1->protocol == Protocol::Coiot);
}

TEST_CASE("deduplicate replaces whole records, never merges fields", "[device][dedup]") {
    auto first = make_device("dev1", 1000);
    first.firmware = QStringLiteral("1.0.0");
    auto second = make_device("dev1", 2000);
    second.model = QStringLiteral("SNSW-001X16EU");

    const auto out = deduplicate({first, second});
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].model == "SNSW-001X16EU");
    REQUIRE(out[0].firmware.isEmpty());
}

TEST_CASE("deduplicate keeps the first record on equal timestamps", "[device][dedup]") {
    auto a = make_device("dev1", 1000);
    a.name = QStringLiteral("a");
    auto b = make_device("dev1", 1000);
    b.name = QStringLiteral("b");

    const auto out = deduplicate({a, b});
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].name == "a");
}

TEST_CASE("deduplicate merges records keyed by MAC", "[device][dedup]") {
    DiscoveredDevice a;
    a.mac_address = QStringLiteral("AA:BB:CC:DD:EE:FF");
    a.last_seen = Timestamp(1000);
    auto b = a;
    b.last_seen = Timestamp(3000);
    b.name = QStringLiteral("later");

    const auto out = deduplicate({a, b});
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].name == "later");
}

TEST_CASE("is_private_or_loopback_ipv4 ranges", "[device]") {
    const auto ip = [](const char* s) { return QHostAddress(QString::fromLatin1(s)).toIPv4Address(); };

    REQUIRE(is_private_or_loopback_ipv4(ip("10.1.2.3")));
    REQUIRE(is_private_or_loopback_ipv4(ip("172.16.0.1")));
    REQUIRE(is_private_or_loopback_ipv4(ip("172.31.255.254")));
    REQUIRE(is_private_or_loopback_ipv4(ip("192.168.33.1")));
    REQUIRE(is_private_or_loopback_ipv4(ip("127.0.0.1")));
    REQUIRE_FALSE(is_private_or_loopback_ipv4(ip("172.32.0.1")));
    REQUIRE_FALSE(is_private_or_loopback_ipv4(ip("8.8.8.8")));
}

TEST_CASE("mac_without_colons", "[device]") {
    REQUIRE(mac_without_colons("AA:BB:CC:DD:EE:FF") == "AABBCCDDEEFF");
    REQUIRE(mac_without_colons("AABBCC") == "AABBCC");
}
