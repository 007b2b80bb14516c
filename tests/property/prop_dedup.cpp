#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>

#include "discovery/device.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <utility>

using namespace relayscout;
using namespace relayscout::discovery;

namespace rc {

// Few distinct ids so that collisions are common.
template<>
struct Arbitrary<DiscoveredDevice> {
    static Gen<DiscoveredDevice> arbitrary() {
        return gen::map(
            gen::pair(gen::elementOf(std::string("abcde")), gen::inRange<int64_t>(1, 50)),
            [](const std::pair<char, int64_t>& p) {
                DiscoveredDevice d;
                d.id = QString(QChar::fromLatin1(p.first));
                d.last_seen = Timestamp(p.second);
                d.name = QString::number(p.second);
                return d;
            });
    }
};

} // namespace rc

namespace {

std::set<std::pair<std::string, int64_t>> summary(const std::vector<DiscoveredDevice>& devices) {
    std::set<std::pair<std::string, int64_t>> out;
    for (const auto& d : devices) out.emplace(d.id.toStdString(), d.last_seen.millis());
    return out;
}

} // namespace

TEST_CASE("Property: deduplicate is idempotent", "[property][dedup]") {
    rc::check("dedup(dedup(x)) == dedup(x)", [](const std::vector<DiscoveredDevice>& devices) {
        const auto once = deduplicate(devices);
        const auto twice = deduplicate(once);
        RC_ASSERT(summary(once) == summary(twice));
    });
}

TEST_CASE("Property: deduplicate keeps one record per key with the latest stamp", "[property][dedup]") {
    rc::check("latest observation wins", [](const std::vector<DiscoveredDevice>& devices) {
        std::map<std::string, int64_t> latest;
        for (const auto& d : devices) {
            auto& seen = latest[d.id.toStdString()];
            seen = std::max(seen, d.last_seen.millis());
        }

        const auto out = deduplicate(devices);
        RC_ASSERT(out.size() == latest.size());
        for (const auto& d : out) {
            RC_ASSERT(d.last_seen.millis() == latest.at(d.id.toStdString()));
            // Whole record replaced: the name travels with the stamp.
            RC_ASSERT(d.name == QString::number(d.last_seen.millis()));
        }
    });
}
