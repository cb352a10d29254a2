#include "kwhflow/statistics/merger.hpp"
#include "kwhflow/core/civil_time.hpp"
#include "kwhflow/utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace kwhflow::statistics {

namespace {

utils::KeyedMutex &mergeLocks() {
	static utils::KeyedMutex locks;
	return locks;
}

} // namespace

std::vector<core::StatisticPoint> accumulate(const std::vector<core::HourlyBucket> &buckets, double baseline_sum) {
	std::vector<core::StatisticPoint> points;
	points.reserve(buckets.size());
	double running = baseline_sum;
	for (const auto &bucket : buckets) {
		running += bucket.energy_kwh;
		points.push_back(core::StatisticPoint{bucket.hour_start, bucket.energy_kwh, running});
	}
	return points;
}

StatisticsMerger::StatisticsMerger(std::shared_ptr<IStatisticsStore> store, core::TimeZone zone,
                                   MergeOptions options)
    : store_(std::move(store)), zone_(std::move(zone)), options_(std::move(options)) {
	if (!store_) {
		throw std::invalid_argument("StatisticsMerger requires a statistics store.");
	}
	if (options_.correction_window_days < 0) {
		throw std::invalid_argument("Correction window must not be negative.");
	}
	if (!options_.clock) {
		options_.clock = [] { return std::chrono::system_clock::now(); };
	}
}

core::TimePoint StatisticsMerger::correctionFloor() const {
	const auto today = zone_.localDate(options_.clock());
	return zone_.startOfDay(today.addDays(-options_.correction_window_days));
}

core::Outcome<MergeResult> StatisticsMerger::plan(const std::string &statistic_key,
                                                  const std::vector<core::HourlyBucket> &hourly) const {
	using Result = core::Outcome<MergeResult>;

	std::vector<core::HourlyBucket> ordered(hourly);
	std::stable_sort(ordered.begin(), ordered.end(),
	                 [](const core::HourlyBucket &a, const core::HourlyBucket &b) { return a.hour_start < b.hour_start; });

	MergeResult result;
	try {
		const auto last = store_->getLastPoint(statistic_key);
		if (!last) {
			result.first_run = true;
			result.points = accumulate(ordered, 0.0);
			KWHFLOW_INFO("No statistics stored for {}, writing {} points from zero", statistic_key,
			             result.points.size());
			return Result::success(std::move(result));
		}

		core::CorrectionWindow window;
		window.start = std::max(last->start, correctionFloor());
		window.baseline_sum = store_->getSumBefore(statistic_key, window.start).value_or(0.0);
		result.window = window;

		std::vector<core::HourlyBucket> tail;
		for (const auto &bucket : ordered) {
			if (bucket.hour_start > window.start) {
				tail.push_back(bucket);
			}
		}
		result.points = accumulate(tail, window.baseline_sum);
		KWHFLOW_DEBUG("Correction window for {} starts {} with baseline {:.3f} kWh, {} new points", statistic_key,
		              core::formatUtc(window.start), window.baseline_sum, result.points.size());
	} catch (const std::exception &e) {
		return Result::failure(core::ErrorKind::Store,
		                       "Failed to read statistics for " + statistic_key + ": " + e.what());
	}
	return Result::success(std::move(result));
}

void StatisticsMerger::ensureMetadata(const StatisticIdentity &identity) {
	metadata_registration_.run(identity.key(), [this, &identity]() {
		store_->registerMetadata(identity.metadata());
		return true;
	});
}

core::Outcome<MergeResult> StatisticsMerger::merge(const StatisticIdentity &identity,
                                                   const std::vector<core::HourlyBucket> &hourly) {
	using Result = core::Outcome<MergeResult>;
	const auto key = identity.key();
	auto guard = mergeLocks().lock(key);

	auto planned = plan(key, hourly);
	if (!planned) {
		return planned;
	}
	auto result = std::move(planned).value();
	if (!result.written()) {
		KWHFLOW_DEBUG("No completed hours after the correction window for {}", key);
		return Result::success(std::move(result));
	}

	try {
		ensureMetadata(identity);
		store_->upsert(key, result.points);
	} catch (const std::exception &e) {
		return Result::failure(core::ErrorKind::Store, "Failed to write statistics for " + key + ": " + e.what());
	}
	KWHFLOW_INFO("Wrote {} statistic points for {}", result.points.size(), key);
	return Result::success(std::move(result));
}

} // namespace kwhflow::statistics
