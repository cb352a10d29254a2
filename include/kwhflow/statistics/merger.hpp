#pragma once

#include "kwhflow/core/outcome.hpp"
#include "kwhflow/core/time_zone.hpp"
#include "kwhflow/core/usage_types.hpp"
#include "kwhflow/statistics/statistics_store.hpp"
#include "kwhflow/utils/single_flight.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kwhflow::statistics {

// How far back a run may rewrite the persisted series.
constexpr int kDefaultCorrectionWindowDays = 30;

struct MergeOptions {
	int correction_window_days = kDefaultCorrectionWindowDays;
	// Source of "now"; system_clock::now when empty.
	std::function<core::TimePoint()> clock;
};

struct MergeResult {
	bool first_run = false;
	// Absent on a first run.
	std::optional<core::CorrectionWindow> window;
	std::vector<core::StatisticPoint> points;

	bool written() const {
		return !points.empty();
	}
};

/**
 * @class StatisticsMerger
 * @brief Merges hourly buckets into the persisted cumulative series of a key.
 *
 * On a first run every bucket is emitted with sums anchored at zero. Otherwise
 * the correction window starts at the later of the last persisted point and
 * local midnight `correction_window_days` ago; buckets strictly after it are
 * re-summed from the persisted sum at that instant and upserted in one batch.
 * Merges of the same key never interleave, even across merger instances.
 */
class StatisticsMerger {
public:
	StatisticsMerger(std::shared_ptr<IStatisticsStore> store, core::TimeZone zone, MergeOptions options = {});

	/**
	 * @brief Computes the points to write and writes them.
	 * @return ErrorKind::Store failure when the store throws on any call.
	 */
	core::Outcome<MergeResult> merge(const StatisticIdentity &identity,
	                                 const std::vector<core::HourlyBucket> &hourly);

	/**
	 * @brief Computes the points a merge would write without writing them.
	 */
	core::Outcome<MergeResult> plan(const std::string &statistic_key,
	                                const std::vector<core::HourlyBucket> &hourly) const;

	/**
	 * @brief Oldest instant a run may rewrite: local midnight N days before today.
	 */
	core::TimePoint correctionFloor() const;

	const MergeOptions &options() const {
		return options_;
	}

private:
	void ensureMetadata(const StatisticIdentity &identity);

	std::shared_ptr<IStatisticsStore> store_;
	core::TimeZone zone_;
	MergeOptions options_;
	utils::SingleFlight<bool> metadata_registration_;
};

/**
 * @brief Running cumulative sum over buckets, seeded with `baseline_sum`.
 */
std::vector<core::StatisticPoint> accumulate(const std::vector<core::HourlyBucket> &buckets, double baseline_sum);

} // namespace kwhflow::statistics
