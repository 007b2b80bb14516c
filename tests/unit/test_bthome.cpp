#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "discovery/bthome.hpp"

using namespace relayscout::discovery;
using Catch::Approx;

namespace {

QByteArray bytes(std::initializer_list<int> values) {
    QByteArray out;
    for (int v : values) out.append(static_cast<char>(v));
    return out;
}

} // namespace

TEST_CASE("BTHome: battery", "[bthome]") {
    const auto data = parse_bthome_data(bytes({0x40, 0x01, 0x64}));
    REQUIRE(data.has_value());
    REQUIRE(data->battery == 100);
    REQUIRE_FALSE(data->temperature.has_value());
}

TEST_CASE("BTHome: temperature is signed", "[bthome]") {
    const auto warm = parse_bthome_data(bytes({0x40, 0x02, 0xE8, 0x03}));
    REQUIRE(warm.has_value());
    REQUIRE(*warm->temperature == Approx(10.0));

    const auto cold = parse_bthome_data(bytes({0x40, 0x02, 0x18, 0xFC}));
    REQUIRE(cold.has_value());
    REQUIRE(*cold->temperature == Approx(-10.0));
}

TEST_CASE("BTHome: humidity", "[bthome]") {
    const auto data = parse_bthome_data(bytes({0x40, 0x03, 0x88, 0x13}));
    REQUIRE(data.has_value());
    REQUIRE(*data->humidity == Approx(50.0));
}

TEST_CASE("BTHome: illuminance is 24-bit scaled by 0.01", "[bthome]") {
    // 0x01E240 = 123456 -> 1234.56 lx
    const auto data = parse_bthome_data(bytes({0x40, 0x05, 0x40, 0xE2, 0x01}));
    REQUIRE(data.has_value());
    REQUIRE(*data->illuminance == Approx(1234.56));
}

TEST_CASE("BTHome: booleans, button and rotation", "[bthome]") {
    const auto data = parse_bthome_data(bytes({0x40,
                                               0x00, 0x2A,          // packet id
                                               0x21, 0x01,          // motion
                                               0x2D, 0x00,          // window closed
                                               0x3A, 0x04,          // button event
                                               0x3F, 0x9C, 0xFF})); // rotation -10.0
    REQUIRE(data.has_value());
    REQUIRE(data->packet_id == 0x2A);
    REQUIRE(data->motion == true);
    REQUIRE(data->window_open == false);
    REQUIRE(data->button == 4);
    REQUIRE(*data->rotation == Approx(-10.0));
}

TEST_CASE("BTHome: several readings in one payload", "[bthome]") {
    const auto data = parse_bthome_data(bytes({0x40, 0x01, 0x5A, 0x02, 0xCA, 0x09, 0x03, 0xBF, 0x13}));
    REQUIRE(data.has_value());
    REQUIRE(data->battery == 90);
    REQUIRE(*data->temperature == Approx(25.06));
    REQUIRE(*data->humidity == Approx(50.55));
}

TEST_CASE("BTHome: encrypted and empty payloads are rejected", "[bthome]") {
    REQUIRE_FALSE(parse_bthome_data(QByteArray()).has_value());
    REQUIRE_FALSE(parse_bthome_data(bytes({0x41, 0x01, 0x64})).has_value());
}

TEST_CASE("BTHome: truncated trailing object is dropped", "[bthome]") {
    const auto data = parse_bthome_data(bytes({0x40, 0x01, 0x64, 0x02, 0xE8}));
    REQUIRE(data.has_value());
    REQUIRE(data->battery == 100);
    REQUIRE_FALSE(data->temperature.has_value());
}

TEST_CASE("BTHome: unknown object types are stepped over", "[bthome]") {
    const auto data = parse_bthome_data(bytes({0x40, 0x7E, 0x00, 0x01, 0x32}));
    REQUIRE(data.has_value());
    REQUIRE(data->battery == 50);
}

TEST_CASE("BTHome: flag byte alone yields an empty reading", "[bthome]") {
    const auto data = parse_bthome_data(bytes({0x40}));
    REQUIRE(data.has_value());
    REQUIRE(*data == BTHomeData{});
}

TEST_CASE("BTHome: object sizes", "[bthome]") {
    REQUIRE(bthome::object_size(bthome::kIlluminance) == 3);
    REQUIRE(bthome::object_size(bthome::kTemperature) == 2);
    REQUIRE(bthome::object_size(bthome::kBattery) == 1);
    REQUIRE(bthome::object_size(0x7E) == 1);
}
