#include <catch2/catch.hpp>

#include "kwhflow/statistics/in_memory_store.hpp"
#include "kwhflow/statistics/merger.hpp"
#include "common/statistics_fixtures.hpp"
#include "common/usage_fixtures.hpp"

#include <algorithm>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using kwhflow::core::ErrorKind;
using kwhflow::core::StatisticPoint;
using kwhflow::statistics::accumulate;
using kwhflow::statistics::InMemoryStatisticsStore;
using kwhflow::statistics::MergeOptions;
using kwhflow::statistics::StatisticsMerger;
using tests::fixtures::fixedClock;
using tests::fixtures::hourlyBuckets;
using tests::fixtures::utc;

namespace {

MergeOptions optionsAt(kwhflow::core::TimePoint now) {
	MergeOptions options;
	options.clock = fixedClock(now);
	return options;
}

bool sumsIncrease(const std::vector<StatisticPoint> &points) {
	for (std::size_t i = 1; i < points.size(); ++i) {
		if (!(points[i].sum > points[i - 1].sum) || !(points[i].start > points[i - 1].start)) {
			return false;
		}
	}
	return true;
}

} // namespace

TEST_CASE("accumulate seeds the running sum with the baseline", "[statistics][merge]") {
	const auto points = accumulate(hourlyBuckets(utc(2024, 7, 1, 4), 3, 0.5), 10.0);
	REQUIRE(points.size() == 3);
	REQUIRE(points[0].state == Catch::Detail::Approx(0.5));
	REQUIRE(points[0].sum == Catch::Detail::Approx(10.5));
	REQUIRE(points[2].sum == Catch::Detail::Approx(11.5));
	REQUIRE(accumulate({}, 5.0).empty());
}

TEST_CASE("StatisticsMerger writes the whole series on a first run", "[statistics][merge]") {
	auto store = std::make_shared<InMemoryStatisticsStore>();
	StatisticsMerger merger(store, tests::fixtures::newYork(), optionsAt(utc(2024, 7, 3, 12)));
	const auto identity = tests::fixtures::account("1234");

	auto result = merger.merge(identity, hourlyBuckets(utc(2024, 7, 1, 4), 24));
	REQUIRE(result.ok());
	REQUIRE(result.value().first_run);
	REQUIRE_FALSE(result.value().window.has_value());
	REQUIRE(result.value().points.size() == 24);
	REQUIRE(result.value().points.front().sum == Catch::Detail::Approx(1.0));
	REQUIRE(result.value().points.back().sum == Catch::Detail::Approx(24.0));

	const auto stored = store->points(identity.key());
	REQUIRE(stored.size() == 24);
	REQUIRE(sumsIncrease(stored));
	REQUIRE(store->metadata(identity.key())->display_name == identity.displayName());
	REQUIRE(store->upsertCalls() == 1);
}

TEST_CASE("StatisticsMerger extends the series from the last persisted point", "[statistics][merge]") {
	auto store = std::make_shared<InMemoryStatisticsStore>();
	StatisticsMerger merger(store, tests::fixtures::newYork(), optionsAt(utc(2024, 7, 3, 12)));
	const auto identity = tests::fixtures::account("1234");

	REQUIRE(merger.merge(identity, hourlyBuckets(utc(2024, 7, 1, 4), 24)).ok());

	// The second export repeats day one and adds day two.
	auto result = merger.merge(identity, hourlyBuckets(utc(2024, 7, 1, 4), 48));
	REQUIRE(result.ok());
	REQUIRE_FALSE(result.value().first_run);
	REQUIRE(result.value().window->start == utc(2024, 7, 2, 3));
	REQUIRE(result.value().window->baseline_sum == Catch::Detail::Approx(24.0));
	REQUIRE(result.value().points.size() == 24);
	REQUIRE(result.value().points.front().start == utc(2024, 7, 2, 4));
	REQUIRE(result.value().points.front().sum == Catch::Detail::Approx(25.0));

	const auto stored = store->points(identity.key());
	REQUIRE(stored.size() == 48);
	REQUIRE(stored.back().sum == Catch::Detail::Approx(48.0));
	REQUIRE(sumsIncrease(stored));
	REQUIRE(store->metadataRegistrations() == 1);
}

TEST_CASE("StatisticsMerger re-merging the same export is a no-op", "[statistics][merge]") {
	auto store = std::make_shared<InMemoryStatisticsStore>();
	StatisticsMerger merger(store, tests::fixtures::newYork(), optionsAt(utc(2024, 7, 3, 12)));
	const auto identity = tests::fixtures::account("1234");
	const auto buckets = hourlyBuckets(utc(2024, 7, 1, 4), 24);

	REQUIRE(merger.merge(identity, buckets).ok());
	const auto before = store->points(identity.key());

	auto again = merger.merge(identity, buckets);
	REQUIRE(again.ok());
	REQUIRE_FALSE(again.value().written());
	REQUIRE(store->upsertCalls() == 1);

	const auto after = store->points(identity.key());
	REQUIRE(after.size() == before.size());
	for (std::size_t i = 0; i < after.size(); ++i) {
		REQUIRE(after[i].start == before[i].start);
		REQUIRE(after[i].sum == Catch::Detail::Approx(before[i].sum));
	}
}

TEST_CASE("StatisticsMerger never reaches further back than the correction window", "[statistics][merge]") {
	auto store = std::make_shared<InMemoryStatisticsStore>();
	const auto identity = tests::fixtures::account("1234");
	store->registerMetadata(identity.metadata());
	store->upsert(identity.key(), {StatisticPoint{utc(2024, 1, 1, 5), 1.0, 100.0}});

	StatisticsMerger merger(store, tests::fixtures::newYork(), optionsAt(utc(2024, 3, 15, 16)));
	REQUIRE(merger.correctionFloor() == utc(2024, 2, 14, 5));

	std::vector<kwhflow::core::HourlyBucket> buckets = hourlyBuckets(utc(2024, 1, 5, 10), 1, 3.0);
	const auto recent = hourlyBuckets(utc(2024, 2, 14, 5), 3, 2.0);
	buckets.insert(buckets.end(), recent.begin(), recent.end());

	auto result = merger.merge(identity, buckets);
	REQUIRE(result.ok());
	REQUIRE(result.value().window->start == utc(2024, 2, 14, 5));
	REQUIRE(result.value().window->baseline_sum == Catch::Detail::Approx(100.0));

	// Buckets at or before the window start are left out.
	const auto &points = result.value().points;
	REQUIRE(points.size() == 2);
	REQUIRE(points[0].start == utc(2024, 2, 14, 6));
	REQUIRE(points[0].sum == Catch::Detail::Approx(102.0));
	REQUIRE(points[1].sum == Catch::Detail::Approx(104.0));
}

TEST_CASE("StatisticsMerger correction window length is configurable", "[statistics][merge]") {
	auto store = std::make_shared<InMemoryStatisticsStore>();
	MergeOptions options = optionsAt(utc(2024, 3, 15, 16));
	options.correction_window_days = 7;

	const StatisticsMerger merger(store, tests::fixtures::newYork(), options);
	REQUIRE(merger.correctionFloor() == utc(2024, 3, 8, 5));

	options.correction_window_days = -1;
	REQUIRE_THROWS_AS(StatisticsMerger(store, tests::fixtures::newYork(), options), std::invalid_argument);
	REQUIRE_THROWS_AS(StatisticsMerger(nullptr, tests::fixtures::newYork()), std::invalid_argument);
}

TEST_CASE("StatisticsMerger sorts buckets before summing", "[statistics][merge]") {
	auto store = std::make_shared<InMemoryStatisticsStore>();
	const StatisticsMerger merger(store, kwhflow::core::TimeZone::utc(), optionsAt(utc(2024, 7, 3, 0)));

	auto buckets = hourlyBuckets(utc(2024, 7, 1, 0), 5);
	std::reverse(buckets.begin(), buckets.end());

	auto planned = merger.plan("meter", buckets);
	REQUIRE(planned.ok());
	REQUIRE(sumsIncrease(planned.value().points));
	REQUIRE(store->points("meter").empty());
}

TEST_CASE("StatisticsMerger reports store failures as store errors", "[statistics][merge]") {
	auto store = std::make_shared<tests::fixtures::FailingStore>();
	StatisticsMerger merger(store, kwhflow::core::TimeZone::utc(), optionsAt(utc(2024, 7, 3, 0)));
	const auto identity = tests::fixtures::account("1234");
	const auto buckets = hourlyBuckets(utc(2024, 7, 1, 0), 3);

	SECTION("failed read") {
		store->fail_reads = true;
		auto result = merger.merge(identity, buckets);
		REQUIRE_FALSE(result.ok());
		REQUIRE(result.error().kind == ErrorKind::Store);
		REQUIRE(store->writes == 0);
	}

	SECTION("failed write") {
		store->fail_writes = true;
		auto result = merger.merge(identity, buckets);
		REQUIRE_FALSE(result.ok());
		REQUIRE(result.error().kind == ErrorKind::Store);
		REQUIRE(result.error().message.find("disk full") != std::string::npos);
	}

	SECTION("failed metadata registration is retried on the next run") {
		store->fail_metadata = true;
		REQUIRE_FALSE(merger.merge(identity, buckets).ok());
		REQUIRE(store->writes == 0);

		store->fail_metadata = false;
		REQUIRE(merger.merge(identity, buckets).ok());
		REQUIRE(merger.merge(identity, buckets).ok());
		REQUIRE(store->metadata_calls == 2);
		REQUIRE(store->writes == 2);
	}
}

TEST_CASE("StatisticsMerger serializes concurrent merges of one key", "[statistics][merge]") {
	auto store = std::make_shared<InMemoryStatisticsStore>();
	StatisticsMerger merger(store, tests::fixtures::newYork(), optionsAt(utc(2024, 7, 3, 12)));
	const auto identity = tests::fixtures::account("1234");
	const auto buckets = hourlyBuckets(utc(2024, 7, 1, 4), 24);

	std::vector<std::future<bool>> runs;
	for (int i = 0; i < 4; ++i) {
		runs.push_back(std::async(std::launch::async,
		                          [&merger, &identity, &buckets]() { return merger.merge(identity, buckets).ok(); }));
	}
	for (auto &run : runs) {
		REQUIRE(run.get());
	}

	// Exactly one run saw an empty store; the others found nothing new.
	REQUIRE(store->upsertCalls() == 1);
	REQUIRE(store->metadataRegistrations() == 1);
	const auto stored = store->points(identity.key());
	REQUIRE(stored.size() == 24);
	REQUIRE(stored.back().sum == Catch::Detail::Approx(24.0));
}
