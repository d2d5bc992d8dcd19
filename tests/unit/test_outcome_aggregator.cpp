#include <catch2/catch_test_macros.hpp>
#include "certdel/analysis/outcome_aggregator.hpp"

using namespace certdel::protocol;
using namespace certdel::protocol::analysis;
using certdel::protocol::models::MeasurementCounts;

TEST_CASE("OutcomeAggregator - Splitting two-stage counts", "[aggregator][analysis]") {
    SECTION("Each stage is re-aggregated") {
        const MeasurementCounts raw = {{"00 11", 3}, {"01 10", 2}};
        auto split = OutcomeAggregator::SplitCounts(raw);
        REQUIRE(split.first == MeasurementCounts{{"00", 3}, {"01", 2}});
        REQUIRE(split.second == MeasurementCounts{{"11", 3}, {"10", 2}});
        REQUIRE(split.failures.empty());
    }
    SECTION("Shared stage outcomes merge") {
        const MeasurementCounts raw = {{"00 11", 3}, {"00 10", 2}, {"01 11", 1}};
        auto split = OutcomeAggregator::SplitCounts(raw);
        REQUIRE(split.first == MeasurementCounts{{"00", 5}, {"01", 1}});
        REQUIRE(split.second == MeasurementCounts{{"11", 4}, {"10", 2}});
    }
    SECTION("Both halves keep every consumed shot") {
        const MeasurementCounts raw = {{"000 1", 7}, {"010 0", 11}, {"111 1", 5}};
        auto split = OutcomeAggregator::SplitCounts(raw);
        REQUIRE(models::TotalShots(split.first) == models::TotalShots(raw));
        REQUIRE(models::TotalShots(split.second) == models::TotalShots(raw));
    }
    SECTION("Entries without exactly one separator are failures") {
        const MeasurementCounts raw = {{"00 11", 3}, {"0011", 4}, {"0 0 1", 1}};
        auto split = OutcomeAggregator::SplitCounts(raw);
        REQUIRE(split.first == MeasurementCounts{{"00", 3}});
        REQUIRE(split.failures.size() == 2);
        for (const auto& failure : split.failures) {
            REQUIRE(failure.failure.type == ProtocolFailureType::MalformedMeasurement);
        }
    }
    SECTION("Custom separator") {
        const MeasurementCounts raw = {{"01|10", 2}};
        auto split = OutcomeAggregator::SplitCounts(raw, '|');
        REQUIRE(split.first == MeasurementCounts{{"01", 2}});
        REQUIRE(split.second == MeasurementCounts{{"10", 2}});
    }
    SECTION("Empty input") {
        auto split = OutcomeAggregator::SplitCounts({});
        REQUIRE(split.first.empty());
        REQUIRE(split.second.empty());
    }
}

TEST_CASE("OutcomeAggregator - Correlating stages", "[aggregator][analysis]") {
    const MeasurementCounts raw = {{"00 11", 3}, {"00 10", 2}, {"01 11", 1}, {"10 01", 4}};

    SECTION("Keeps second stages of accepted first stages") {
        auto correlated = OutcomeAggregator::Correlate(raw, {"00", "10"});
        REQUIRE(correlated.counts == MeasurementCounts{{"11", 3}, {"10", 2}, {"01", 4}});
        REQUIRE(correlated.failures.empty());
    }
    SECTION("Nothing accepted gives an empty histogram") {
        auto correlated = OutcomeAggregator::Correlate(raw, {});
        REQUIRE(correlated.counts.empty());
    }
    SECTION("Malformed entries are reported") {
        const MeasurementCounts broken = {{"0011", 2}};
        auto correlated = OutcomeAggregator::Correlate(broken, {"00"});
        REQUIRE(correlated.counts.empty());
        REQUIRE(correlated.failures.size() == 1);
        REQUIRE(correlated.failures[0].count == 2);
    }
}
