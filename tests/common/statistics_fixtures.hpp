#pragma once

#include "kwhflow/core/usage_types.hpp"
#include "kwhflow/statistics/statistics_store.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tests::fixtures {

// Consecutive hourly buckets, each holding `energy` kWh.
inline std::vector<kwhflow::core::HourlyBucket> hourlyBuckets(kwhflow::core::TimePoint first, std::size_t count,
                                                              double energy = 1.0) {
	std::vector<kwhflow::core::HourlyBucket> buckets;
	buckets.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		kwhflow::core::HourlyBucket bucket;
		bucket.hour_start = first + std::chrono::hours(static_cast<int>(i));
		bucket.power_kw = energy;
		bucket.energy_kwh = energy;
		bucket.interval_count = 2;
		buckets.push_back(bucket);
	}
	return buckets;
}

inline std::function<kwhflow::core::TimePoint()> fixedClock(kwhflow::core::TimePoint now) {
	return [now]() { return now; };
}

inline kwhflow::statistics::StatisticIdentity account(const std::string &id) {
	kwhflow::statistics::StatisticIdentity identity;
	identity.account_id = id;
	return identity;
}

/**
 * Store whose reads or writes fail on demand.
 */
class FailingStore : public kwhflow::statistics::IStatisticsStore {
public:
	bool fail_reads = false;
	bool fail_metadata = false;
	bool fail_writes = false;
	std::size_t metadata_calls = 0;
	std::size_t writes = 0;

	std::optional<kwhflow::core::StatisticPoint> getLastPoint(const std::string &) override {
		if (fail_reads) {
			throw std::runtime_error("recorder unavailable");
		}
		return std::nullopt;
	}

	std::optional<double> getSumBefore(const std::string &, kwhflow::core::TimePoint) override {
		if (fail_reads) {
			throw std::runtime_error("recorder unavailable");
		}
		return std::nullopt;
	}

	void registerMetadata(const kwhflow::statistics::StatisticMetadata &) override {
		++metadata_calls;
		if (fail_metadata) {
			throw std::runtime_error("metadata rejected");
		}
	}

	void upsert(const std::string &, const std::vector<kwhflow::core::StatisticPoint> &) override {
		if (fail_writes) {
			throw std::runtime_error("disk full");
		}
		++writes;
	}

	std::string getName() const override {
		return "FailingStore";
	}
};

} // namespace tests::fixtures
