#include <catch2/catch_test_macros.hpp>

#include "core/types/DiscoveryError.hpp"
#include "infrastructure/async/AsioContext.hpp"
#include "infrastructure/snmp/SessionRegistry.hpp"
#include "support/FakeSnmpTransport.hpp"

#include <regex>
#include <thread>

using namespace netsweep::core;
using netsweep::infra::SessionRegistry;
using netsweep::infra::SessionSettings;
using netsweep::testing::FakeSnmpTransport;

namespace {
class ManualClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override { return now_; }
    void advance(std::chrono::system_clock::duration by) { now_ += by; }

private:
    std::chrono::system_clock::time_point now_{std::chrono::milliseconds(1700000000000)};
};

SnmpTarget deviceTarget(const std::string& address = "10.3.0.1") {
    SnmpTarget target;
    target.address = address;
    target.community = "public";
    return target;
}
} // namespace

TEST_CASE("Session ids", "[SessionRegistry]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    SessionRegistry registry(transport, std::make_shared<ManualClock>());

    auto first = registry.connect(deviceTarget());
    auto second = registry.connect(deviceTarget());

    REQUIRE(std::regex_match(first, std::regex("^snmp_1700000000000_[0-9a-z]{8}$")));
    REQUIRE(first != second);
    REQUIRE(registry.count() == 2);
}

TEST_CASE("Session lifecycle", "[SessionRegistry]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    auto clock = std::make_shared<ManualClock>();
    SessionRegistry registry(transport, clock);

    auto id = registry.connect(deviceTarget("10.3.0.7"));

    SECTION("find returns the session and marks it active") {
        clock->advance(std::chrono::minutes(10));
        auto session = registry.find(id);
        REQUIRE(session);
        REQUIRE(session->target().address == "10.3.0.7");

        auto info = registry.info(id);
        REQUIRE(info);
        REQUIRE(info->lastActivityAt - info->createdAt == std::chrono::minutes(10));
    }

    SECTION("disconnect closes the transport session") {
        REQUIRE(registry.disconnect(id));
        REQUIRE_FALSE(registry.find(id));
        REQUIRE_FALSE(registry.disconnect(id));
        REQUIRE(transport->liveSessions() == 0);
    }

    SECTION("transport errors remove the session") {
        registry.reportTransportError(id, "socket closed");
        REQUIRE(registry.count() == 0);
        REQUIRE(transport->liveSessions() == 0);
        REQUIRE_NOTHROW(registry.reportTransportError(id, "again"));
    }

    SECTION("unknown ids") {
        REQUIRE_FALSE(registry.find("snmp_0_00000000"));
        REQUIRE_FALSE(registry.touch("snmp_0_00000000"));
        REQUIRE_FALSE(registry.info("snmp_0_00000000"));
    }
}

TEST_CASE("Idle sessions are swept", "[SessionRegistry]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    auto clock = std::make_shared<ManualClock>();
    SessionRegistry registry(transport, clock);

    auto idle = registry.connect(deviceTarget("10.3.0.1"));
    auto busy = registry.connect(deviceTarget("10.3.0.2"));

    clock->advance(std::chrono::minutes(20));
    REQUIRE(registry.touch(busy));

    SECTION("exactly at the TTL nothing is evicted") {
        clock->advance(std::chrono::minutes(10));
        REQUIRE(registry.sweepIdle() == 0);
    }

    SECTION("past the TTL only the idle session goes") {
        clock->advance(std::chrono::minutes(11));
        REQUIRE(registry.sweepIdle() == 1);
        REQUIRE_FALSE(registry.find(idle));
        REQUIRE(registry.find(busy));
        REQUIRE(transport->liveSessions() == 1);
    }
}

TEST_CASE("Connect failures", "[SessionRegistry]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    SessionRegistry registry(transport, std::make_shared<ManualClock>());

    REQUIRE_THROWS_AS(registry.connect(deviceTarget("")), ValidationError);

    transport->refuseOpen("public");
    REQUIRE_THROWS_AS(registry.connect(deviceTarget()), ConnectError);
    REQUIRE(registry.count() == 0);
}

TEST_CASE("Registry closes remaining sessions on destruction", "[SessionRegistry]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    {
        SessionRegistry registry(transport, std::make_shared<ManualClock>());
        registry.connect(deviceTarget());
        registry.connect(deviceTarget());
        REQUIRE(transport->liveSessions() == 2);
    }
    REQUIRE(transport->liveSessions() == 0);
}

TEST_CASE("Background reaper", "[SessionRegistry]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    auto clock = std::make_shared<ManualClock>();

    SessionSettings settings;
    settings.idleTtl = std::chrono::minutes(1);
    settings.sweepInterval = std::chrono::minutes(0);

    netsweep::infra::AsioContext context(1);
    SessionRegistry registry(transport, clock, settings);
    registry.connect(deviceTarget());
    clock->advance(std::chrono::minutes(2));

    context.start();
    registry.startReaper(context.getContext());
    for (int i = 0; i < 200 && registry.count() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    registry.stopReaper();
    context.stop();

    REQUIRE(registry.count() == 0);
    REQUIRE(transport->liveSessions() == 0);
}
