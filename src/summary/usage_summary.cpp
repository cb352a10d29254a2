#include "kwhflow/summary/usage_summary.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cstddef>
#include <map>
#include <utility>

namespace kwhflow::summary {

namespace {

using ConstVector = Eigen::Map<const Eigen::VectorXd>;

struct DayColumns {
	std::vector<core::TimePoint> timestamps;
	std::vector<double> power;
	std::vector<double> energy;

	ConstVector powerVector() const {
		return ConstVector(power.data(), static_cast<Eigen::Index>(power.size()));
	}

	ConstVector energyVector() const {
		return ConstVector(energy.data(), static_cast<Eigen::Index>(energy.size()));
	}

	// First reading with the highest power.
	PeakPower peak() const {
		Eigen::Index index = 0;
		const double value = powerVector().maxCoeff(&index);
		return PeakPower{value, timestamps[static_cast<std::size_t>(index)]};
	}

	DailyUsage usage(const core::CivilDate &date) const {
		const auto p = powerVector();
		return DailyUsage{date, energyVector().sum(), p.mean(), p.maxCoeff()};
	}

	void append(const core::LocalizedReading &row) {
		timestamps.push_back(row.timestamp);
		power.push_back(row.power_kw);
		energy.push_back(row.energy_kwh);
	}
};

using DayMap = std::map<core::CivilDate, DayColumns>;

DayMap groupByDate(const core::UsageTable &rows, const core::TimeZone &zone) {
	DayMap days;
	for (const auto &row : rows) {
		days[zone.localDate(row.timestamp)].append(row);
	}
	return days;
}

DayColumns concat(const DayMap &days) {
	DayColumns all;
	for (const auto &entry : days) {
		const auto &day = entry.second;
		all.timestamps.insert(all.timestamps.end(), day.timestamps.begin(), day.timestamps.end());
		all.power.insert(all.power.end(), day.power.begin(), day.power.end());
		all.energy.insert(all.energy.end(), day.energy.begin(), day.energy.end());
	}
	return all;
}

Eigen::VectorXd dailyTotals(const std::vector<DailyUsage> &days) {
	Eigen::VectorXd totals(static_cast<Eigen::Index>(days.size()));
	for (std::size_t i = 0; i < days.size(); ++i) {
		totals(static_cast<Eigen::Index>(i)) = days[i].total_energy_kwh;
	}
	return totals;
}

} // namespace

std::vector<DailyUsage> dailyUsages(const core::UsageTable &rows, const core::TimeZone &zone) {
	std::vector<DailyUsage> result;
	for (const auto &entry : groupByDate(rows, zone)) {
		result.push_back(entry.second.usage(entry.first));
	}
	return result;
}

std::optional<DailyStats> DailyStats::fromTable(const core::UsageTable &rows, const core::TimeZone &zone) {
	const auto days = groupByDate(rows, zone);
	if (days.empty()) {
		return std::nullopt;
	}
	const auto &latest = *days.rbegin();

	DailyStats stats;
	stats.usage = latest.second.usage(latest.first);
	stats.peak_power = latest.second.peak();
	stats.data_points = latest.second.timestamps.size();
	return stats;
}

std::optional<WeeklyAnalysis> WeeklyAnalysis::fromTable(const core::UsageTable &rows, const core::TimeZone &zone) {
	auto days = dailyUsages(rows, zone);
	if (days.empty()) {
		return std::nullopt;
	}
	if (days.size() > kDays) {
		days.erase(days.begin(), days.end() - static_cast<std::ptrdiff_t>(kDays));
	}

	const Eigen::VectorXd totals = dailyTotals(days);
	Eigen::Index highest = 0;
	Eigen::Index lowest = 0;
	totals.maxCoeff(&highest);
	totals.minCoeff(&lowest);

	WeeklyAnalysis analysis;
	analysis.total_energy_kwh = totals.sum();
	analysis.avg_daily_energy_kwh = totals.mean();
	analysis.highest_usage = days[static_cast<std::size_t>(highest)];
	analysis.lowest_usage = days[static_cast<std::size_t>(lowest)];
	analysis.daily_totals = std::move(days);
	return analysis;
}

BillingPeriodStats BillingPeriodStats::fromTable(const core::UsageTable &rows, const core::TimeZone &zone,
                                                 const BillingWindow &window, const core::CivilDate &today) {
	BillingPeriodStats stats;
	stats.start_date = today;
	stats.peak_day.date = today;

	if (!window.previous_period_end) {
		return stats;
	}
	const auto period_start = window.previous_period_end->addDays(1);
	const auto period_end = window.next_meter_read;

	auto days = groupByDate(rows, zone);
	for (auto it = days.begin(); it != days.end();) {
		if (it->first < period_start || it->first > period_end) {
			it = days.erase(it);
		} else {
			++it;
		}
	}
	if (days.empty()) {
		return stats;
	}

	for (const auto &entry : days) {
		stats.daily_usages.push_back(entry.second.usage(entry.first));
	}
	const Eigen::VectorXd totals = dailyTotals(stats.daily_usages);
	Eigen::Index peak_index = 0;
	totals.maxCoeff(&peak_index);

	stats.start_date = period_start;
	stats.days_in_period = static_cast<int>(period_end.toDays() - period_start.toDays());
	stats.total_energy_kwh = totals.sum();
	stats.daily_average_kwh = stats.total_energy_kwh / static_cast<double>(stats.daily_usages.size());
	stats.peak_day = stats.daily_usages[static_cast<std::size_t>(peak_index)];
	stats.peak_power = concat(days).peak();
	return stats;
}

} // namespace kwhflow::summary
