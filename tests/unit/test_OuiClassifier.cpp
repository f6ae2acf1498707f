#include <catch2/catch_test_macros.hpp>

#include "discovery/BufferingMacSink.hpp"
#include "discovery/HashOuiClassifier.hpp"

using namespace netsweep::core;
using netsweep::discovery::BufferingMacSink;
using netsweep::discovery::HashOuiClassifier;

TEST_CASE("Placeholder OUI labels", "[OuiClassifier]") {
    HashOuiClassifier classifier;

    SECTION("Label depends only on the OUI") {
        REQUIRE(classifier.classify("FF:FF:FF:00:00:00") == "Desktop");
        REQUIRE(classifier.classify("01:00:00:AA:BB:CC") == "Mobile");
        REQUIRE(classifier.classify("02:00:00:12:34:56") == "IoT");
        REQUIRE(classifier.classify("0A:0B:0C:0D:0E:0F") == "Server");
        REQUIRE(classifier.classify("00:1A:2B:3C:4D:5E") == "Network");
        REQUIRE(classifier.classify("00:1A:2B:00:00:00") == classifier.classify("00:1A:2B:FF:FF:FF"));
    }

    SECTION("Lower-case hex is accepted") {
        REQUIRE(classifier.classify("0a:0b:0c:0d:0e:0f") == "Server");
    }

    SECTION("Malformed input") {
        REQUIRE(classifier.classify("") == "Unknown");
        REQUIRE(classifier.classify("00-1A-2B-3C-4D-5E") == "Unknown");
        REQUIRE(classifier.classify("GG:00:00:00:00:00") == "Unknown");
    }
}

TEST_CASE("Buffering sink", "[OuiClassifier]") {
    BufferingMacSink sink;
    REQUIRE_FALSE(sink.isComplete());
    REQUIRE_FALSE(sink.summary().has_value());

    sink.onChunk(10, {{"00:00:00:00:00:01", 10, "Desktop", 1}});
    sink.onChunk(20, {});
    sink.onChunk(30, {{"00:00:00:00:00:02", 30, "Mobile", std::nullopt}});

    MacSweepSummary summary;
    summary.vlanIds = {10, 20, 30};
    summary.totalMacAddresses = 2;
    sink.onComplete(summary);

    REQUIRE(sink.chunkOrder() == std::vector<int>{10, 20, 30});
    REQUIRE(sink.records().size() == 2);
    REQUIRE(sink.records()[1].vlanId == 30);
    REQUIRE(sink.isComplete());
    REQUIRE(sink.summary()->totalMacAddresses == 2);
}
