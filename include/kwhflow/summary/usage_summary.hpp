#pragma once

#include "kwhflow/core/civil_time.hpp"
#include "kwhflow/core/time_zone.hpp"
#include "kwhflow/core/usage_types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace kwhflow::summary {

struct PeakPower {
	double value = 0.0;
	core::TimePoint timestamp{};
};

/**
 * @brief Usage of one local calendar day.
 */
struct DailyUsage {
	core::CivilDate date;
	double total_energy_kwh = 0.0;
	double avg_power_kw = 0.0;
	double peak_power_kw = 0.0;
};

/**
 * @brief Readings of the most recent local date in the table.
 */
struct DailyStats {
	DailyUsage usage;
	PeakPower peak_power;
	std::size_t data_points = 0;

	const core::CivilDate &day() const {
		return usage.date;
	}

	/**
	 * @return nullopt when the table is empty.
	 */
	static std::optional<DailyStats> fromTable(const core::UsageTable &rows, const core::TimeZone &zone);
};

/**
 * @brief The last seven local dates present in the table.
 */
struct WeeklyAnalysis {
	double total_energy_kwh = 0.0;
	double avg_daily_energy_kwh = 0.0;
	std::vector<DailyUsage> daily_totals;
	DailyUsage highest_usage;
	DailyUsage lowest_usage;

	static constexpr std::size_t kDays = 7;

	static std::optional<WeeklyAnalysis> fromTable(const core::UsageTable &rows, const core::TimeZone &zone);
};

/**
 * @brief Meter-read dates bounding the current billing period.
 */
struct BillingWindow {
	std::optional<core::CivilDate> previous_period_end;
	core::CivilDate next_meter_read;
};

struct BillingPeriodStats {
	core::CivilDate start_date;
	int days_in_period = 0;
	double total_energy_kwh = 0.0;
	double daily_average_kwh = 0.0;
	std::vector<DailyUsage> daily_usages;
	DailyUsage peak_day;
	PeakPower peak_power;

	/**
	 * @brief Summarizes the days from the day after the previous bill through
	 * the next meter read, both inclusive.
	 *
	 * Without a previous bill end, or with no readings inside the period, the
	 * result is all zeros dated `today`. The daily average divides by the days
	 * that have readings, days_in_period counts calendar days from start to
	 * the meter read date.
	 */
	static BillingPeriodStats fromTable(const core::UsageTable &rows, const core::TimeZone &zone,
	                                    const BillingWindow &window, const core::CivilDate &today);
};

/**
 * @brief Groups rows by local calendar date, ascending.
 */
std::vector<DailyUsage> dailyUsages(const core::UsageTable &rows, const core::TimeZone &zone);

} // namespace kwhflow::summary
