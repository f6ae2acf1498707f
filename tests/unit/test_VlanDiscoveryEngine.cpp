#include <catch2/catch_test_macros.hpp>

#include "core/types/DiscoveryError.hpp"
#include "discovery/VlanDiscoveryEngine.hpp"
#include "support/FakeSnmpTransport.hpp"

using namespace netsweep::core;
using netsweep::discovery::VlanDiscoveryEngine;
using netsweep::testing::FakeSnmpTransport;

namespace {
std::string stateRow(int vlanId) {
    return std::string(SnmpOids::VTP_VLAN_STATE) + ".1." + std::to_string(vlanId);
}

std::string nameRow(int vlanId) {
    return std::string(SnmpOids::VTP_VLAN_NAME) + ".1." + std::to_string(vlanId);
}

SnmpTarget switchTarget() {
    SnmpTarget target;
    target.address = "10.1.1.1";
    target.community = "public";
    return target;
}
} // namespace

TEST_CASE("VLAN states decide validity", "[VlanDiscoveryEngine]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    transport->agent("public")
        .setInt(stateRow(10), 1)
        .setInt(stateRow(20), 2)
        .setInt(stateRow(4095), 1)
        .setText(nameRow(10), "users");

    VlanDiscoveryEngine engine(transport);
    auto result = engine.discoverVlans(switchTarget());

    REQUIRE(result.vlans.size() == 1);
    REQUIRE(result.vlans[0].vlanId == 10);
    REQUIRE(result.vlans[0].name == "users");
    REQUIRE(result.vlans[0].state == "active");
    REQUIRE(result.vlans[0].usedBy == std::vector<std::string>{"10.1.1.1"});

    REQUIRE(result.invalidVlans ==
            std::vector<InvalidVlan>{{20, VLAN_REASON_INACTIVE}, {4095, VLAN_REASON_RANGE}});
    REQUIRE(result.validCount == 1);
    REQUIRE(result.activeCount == 1);
    REQUIRE(result.inactiveCount == 1);
    REQUIRE(result.invalidCount == 2);
    REQUIRE(result.totalDiscovered == 3);

    REQUIRE(result.rawResponses.vlanState.size() == 3);
    REQUIRE(result.rawResponses.vlanName.size() == 1);
    REQUIRE(transport->liveSessions() == 0);
}

TEST_CASE("VLAN names", "[VlanDiscoveryEngine]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    auto& agent = transport->agent("public");

    SECTION("Missing or blank names use the placeholder") {
        agent.setInt(stateRow(1), 1).setInt(stateRow(30), 1).setText(nameRow(30), "   ");

        auto result = VlanDiscoveryEngine(transport).discoverVlans(switchTarget());
        REQUIRE(result.vlans.size() == 2);
        REQUIRE(result.vlans[0].name == "VLAN1");
        REQUIRE(result.vlans[1].name == "VLAN30");
    }

    SECTION("Names never introduce VLANs") {
        agent.setInt(stateRow(5), 2).setText(nameRow(5), "old").setText(nameRow(6), "ghost");

        auto result = VlanDiscoveryEngine(transport).discoverVlans(switchTarget());
        REQUIRE(result.vlans.empty());
        REQUIRE(result.invalidVlans.size() == 1);
        // The name walk is skipped when no VLAN was accepted
        REQUIRE(transport->walkedRoots() == std::vector<std::string>{SnmpOids::VTP_VLAN_STATE});
    }

    SECTION("Names are trimmed") {
        agent.setInt(stateRow(100), 1).setText(nameRow(100), " voice ");

        auto result = VlanDiscoveryEngine(transport).discoverVlans(switchTarget());
        REQUIRE(result.vlans.at(0).name == "voice");
    }
}

TEST_CASE("VLAN state decoding", "[VlanDiscoveryEngine]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    auto& agent = transport->agent("public");

    SECTION("Textual state") {
        agent.setText(stateRow(7), "1");
        auto result = VlanDiscoveryEngine(transport).discoverVlans(switchTarget());
        REQUIRE(result.vlanIds() == std::vector<int>{7});
    }

    SECTION("Exception markers are skipped") {
        agent.setInt(stateRow(7), 1).setMarker(stateRow(8), SnmpDataType::NoSuchInstance);
        auto result = VlanDiscoveryEngine(transport).discoverVlans(switchTarget());
        REQUIRE(result.vlanIds() == std::vector<int>{7});
        REQUIRE(result.invalidVlans.empty());
    }

    SECTION("VLAN 0 is out of range") {
        agent.setInt(stateRow(0), 1);
        auto result = VlanDiscoveryEngine(transport).discoverVlans(switchTarget());
        REQUIRE(result.invalidVlans == std::vector<InvalidVlan>{{0, VLAN_REASON_RANGE}});
    }
}

TEST_CASE("A VLAN id seen twice in one walk counts once", "[VlanDiscoveryEngine]") {
    const std::string stateRoot = SnmpOids::VTP_VLAN_STATE;
    const std::string nameRoot = SnmpOids::VTP_VLAN_NAME;

    // Same VLAN reported under management domains 1 and 2
    auto transport = std::make_shared<FakeSnmpTransport>();
    transport->agent("public")
        .setInt(stateRoot + ".1.10", 1)
        .setInt(stateRoot + ".2.10", 2)
        .setInt(stateRoot + ".2.30", 1)
        .setText(nameRoot + ".1.10", "users")
        .setText(nameRoot + ".2.10", "shadow");

    auto result = VlanDiscoveryEngine(transport).discoverVlans(switchTarget());

    REQUIRE(result.vlanIds() == std::vector<int>{10, 30});
    REQUIRE(result.vlans[0].name == "users");
    REQUIRE(result.invalidVlans.empty());
    REQUIRE(result.totalDiscovered == 2);
    REQUIRE(result.rawResponses.vlanState.size() == 3);
}

TEST_CASE("Repeated discovery gives the same VLANs", "[VlanDiscoveryEngine]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    transport->agent("public")
        .setInt(stateRow(1), 1)
        .setInt(stateRow(20), 1)
        .setInt(stateRow(30), 2)
        .setText(nameRow(20), "voice");

    VlanDiscoveryEngine engine(transport);
    auto first = engine.discoverVlans(switchTarget());
    auto second = engine.discoverVlans(switchTarget());

    REQUIRE(first.vlans == second.vlans);
    REQUIRE(first.invalidVlans == second.invalidVlans);
    REQUIRE(first.vlanIds() == std::vector<int>{1, 20});
    REQUIRE(transport->liveSessions() == 0);
}

TEST_CASE("Out of range ids are reported unclamped", "[VlanDiscoveryEngine]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    transport->agent("public")
        .setInt(std::string(SnmpOids::VTP_VLAN_STATE) + ".1.4294967295", 1)
        .setInt(stateRow(10), 1);

    auto result = VlanDiscoveryEngine(transport).discoverVlans(switchTarget());

    REQUIRE(result.vlanIds() == std::vector<int>{10});
    REQUIRE(result.invalidVlans == std::vector<InvalidVlan>{{4294967295LL, VLAN_REASON_RANGE}});
}

TEST_CASE("Undecodable state rows are skipped", "[VlanDiscoveryEngine]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    transport->agent("public")
        .setInt(stateRow(10), 1)
        .setMarker(stateRow(20), SnmpDataType::Malformed)
        .setInt(stateRow(30), 1);

    auto result = VlanDiscoveryEngine(transport).discoverVlans(switchTarget());

    REQUIRE(result.vlanIds() == std::vector<int>{10, 30});
    REQUIRE(result.invalidVlans.empty());
    REQUIRE(result.rawResponses.vlanState.size() == 2);
}

TEST_CASE("Empty VLAN table", "[VlanDiscoveryEngine]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    transport->agent("public").setText(SnmpOids::SYS_DESCR, "Router");

    auto result = VlanDiscoveryEngine(transport).discoverVlans(switchTarget());
    REQUIRE(result.vlans.empty());
    REQUIRE(result.totalDiscovered == 0);
}

TEST_CASE("VLAN discovery errors", "[VlanDiscoveryEngine]") {
    auto transport = std::make_shared<FakeSnmpTransport>();
    VlanDiscoveryEngine engine(transport);

    SECTION("Validation happens before any session is opened") {
        auto target = switchTarget();
        target.address = "300.1.1.1";
        REQUIRE_THROWS_AS(engine.discoverVlans(target), ValidationError);
        REQUIRE(transport->openedTargets().empty());
    }

    SECTION("Walk failure propagates and closes the session") {
        transport->agent("public").brokenWalks.insert(SnmpOids::VTP_VLAN_STATE);
        REQUIRE_THROWS_AS(engine.discoverVlans(switchTarget()), ConnectError);
        REQUIRE(transport->liveSessions() == 0);
    }

    SECTION("Silent agent") {
        auto target = switchTarget();
        target.community = "nobody";
        REQUIRE_THROWS_AS(engine.discoverVlans(target), RequestTimeout);
    }
}
