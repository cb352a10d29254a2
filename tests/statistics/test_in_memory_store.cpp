#include <catch2/catch.hpp>

#include "kwhflow/statistics/in_memory_store.hpp"
#include "common/statistics_fixtures.hpp"
#include "common/usage_fixtures.hpp"

#include <stdexcept>

using kwhflow::core::StatisticPoint;
using kwhflow::statistics::InMemoryStatisticsStore;
using tests::fixtures::utc;

TEST_CASE("StatisticIdentity builds the stable key and display name", "[statistics][store]") {
	const auto identity = tests::fixtures::account("1234");
	REQUIRE(identity.key() == "dominion_energy:1234_energy_consumption");
	REQUIRE(identity.displayName() == "Dominion Energy 1234 Energy Consumption");

	const auto metadata = identity.metadata();
	REQUIRE(metadata.statistic_key == identity.key());
	REQUIRE(metadata.source == "dominion_energy");
	REQUIRE(metadata.unit == "kWh");
	REQUIRE(metadata.has_sum);
	REQUIRE_FALSE(metadata.has_mean);
}

TEST_CASE("InMemoryStatisticsStore upserts points by start", "[statistics][store]") {
	InMemoryStatisticsStore store;
	const auto identity = tests::fixtures::account("1234");
	const auto key = identity.key();

	REQUIRE_FALSE(store.getLastPoint(key).has_value());
	REQUIRE_THROWS_AS(store.upsert(key, {StatisticPoint{utc(2024, 7, 1, 0), 1.0, 1.0}}), std::runtime_error);

	store.registerMetadata(identity.metadata());
	store.upsert(key, {StatisticPoint{utc(2024, 7, 1, 1), 2.0, 3.0}, StatisticPoint{utc(2024, 7, 1, 0), 1.0, 1.0}});
	store.upsert(key, {StatisticPoint{utc(2024, 7, 1, 1), 2.5, 3.5}, StatisticPoint{utc(2024, 7, 1, 2), 1.0, 4.5}});

	const auto points = store.points(key);
	REQUIRE(points.size() == 3);
	REQUIRE(points[0].start == utc(2024, 7, 1, 0));
	REQUIRE(points[1].sum == Catch::Detail::Approx(3.5));
	REQUIRE(store.getLastPoint(key)->start == utc(2024, 7, 1, 2));
	REQUIRE(store.upsertCalls() == 2);
	REQUIRE(store.metadata(key)->display_name == "Dominion Energy 1234 Energy Consumption");
}

TEST_CASE("InMemoryStatisticsStore finds the sum at or before an instant", "[statistics][store]") {
	InMemoryStatisticsStore store;
	const auto identity = tests::fixtures::account("1234");
	store.registerMetadata(identity.metadata());
	store.upsert(identity.key(), {StatisticPoint{utc(2024, 7, 1, 0), 1.0, 10.0},
	                              StatisticPoint{utc(2024, 7, 1, 3), 1.0, 11.0}});

	REQUIRE_FALSE(store.getSumBefore(identity.key(), utc(2024, 6, 30, 23)).has_value());
	REQUIRE(*store.getSumBefore(identity.key(), utc(2024, 7, 1, 0)) == Catch::Detail::Approx(10.0));
	REQUIRE(*store.getSumBefore(identity.key(), utc(2024, 7, 1, 2)) == Catch::Detail::Approx(10.0));
	REQUIRE(*store.getSumBefore(identity.key(), utc(2024, 7, 2, 0)) == Catch::Detail::Approx(11.0));
	REQUIRE_FALSE(store.getSumBefore("unknown", utc(2024, 7, 2, 0)).has_value());
}

TEST_CASE("InMemoryStatisticsStore requires a statistic key in metadata", "[statistics][store]") {
	InMemoryStatisticsStore store;
	REQUIRE_THROWS_AS(store.registerMetadata({}), std::invalid_argument);
	REQUIRE(store.metadataRegistrations() == 0);
}
