#include <catch2/catch.hpp>

#include "kwhflow/transform/joiner.hpp"
#include "common/usage_fixtures.hpp"

#include <vector>

using kwhflow::core::Metric;
using kwhflow::core::ResolvedReading;
using kwhflow::transform::joinPowerEnergy;
using tests::fixtures::utc;

TEST_CASE("joinPowerEnergy pairs readings on equal instants", "[transform][join]") {
	std::vector<ResolvedReading> power{
	    {utc(2024, 7, 1, 1, 0), 3.0, Metric::Power},
	    {utc(2024, 7, 1, 0, 0), 1.0, Metric::Power},
	    {utc(2024, 7, 1, 0, 30), 2.0, Metric::Power},
	};
	std::vector<ResolvedReading> energy{
	    {utc(2024, 7, 1, 0, 0), 0.5, Metric::Energy},
	    {utc(2024, 7, 1, 1, 0), 1.5, Metric::Energy},
	    {utc(2024, 7, 1, 1, 30), 2.5, Metric::Energy},
	};

	const auto joined = joinPowerEnergy(power, energy);
	REQUIRE(joined.size() == 2);
	REQUIRE(joined[0].timestamp == utc(2024, 7, 1, 0, 0));
	REQUIRE(joined[0].power_kw == Catch::Detail::Approx(1.0));
	REQUIRE(joined[0].energy_kwh == Catch::Detail::Approx(0.5));
	REQUIRE(joined[1].timestamp == utc(2024, 7, 1, 1, 0));
	REQUIRE(joined[1].power_kw == Catch::Detail::Approx(3.0));
	REQUIRE(joined[1].energy_kwh == Catch::Detail::Approx(1.5));
}

TEST_CASE("joinPowerEnergy handles empty and disjoint inputs", "[transform][join]") {
	REQUIRE(joinPowerEnergy({}, {}).empty());
	REQUIRE(joinPowerEnergy({{utc(2024, 7, 1, 0), 1.0, Metric::Power}}, {}).empty());
	REQUIRE(joinPowerEnergy({{utc(2024, 7, 1, 0), 1.0, Metric::Power}}, {{utc(2024, 7, 1, 1), 1.0, Metric::Energy}})
	            .empty());
}

TEST_CASE("joinPowerEnergy pairs every duplicate on a shared instant", "[transform][join]") {
	const auto at = utc(2024, 11, 3, 5, 0);
	const auto joined = joinPowerEnergy({{at, 1.0, Metric::Power}, {at, 2.0, Metric::Power}},
	                                    {{at, 0.5, Metric::Energy}, {at, 0.25, Metric::Energy}});
	REQUIRE(joined.size() == 4);
	for (const auto &row : joined) {
		REQUIRE(row.timestamp == at);
	}
}
