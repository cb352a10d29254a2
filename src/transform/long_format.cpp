#include "kwhflow/transform/long_format.hpp"
#include "kwhflow/utils/logging.hpp"

#include <algorithm>
#include <regex>

namespace kwhflow::transform {

std::optional<TimeOfDay> parseTimeOfDayLabel(const std::string &column_name) {
	static const std::regex label_regex(R"((\d{1,2}):(\d{2}) ?([AP]M))");
	std::smatch match;
	if (!std::regex_search(column_name, match, label_regex)) {
		return std::nullopt;
	}
	const int hour12 = std::stoi(match[1].str());
	const int minute = std::stoi(match[2].str());
	if (hour12 < 1 || hour12 > 12 || minute > 59) {
		return std::nullopt;
	}
	const bool is_pm = match[3].str() == "PM";
	TimeOfDay time;
	time.hour = (hour12 % 12) + (is_pm ? 12 : 0);
	time.minute = minute;
	return time;
}

core::Outcome<std::vector<core::IntervalReading>> toLongFormat(const core::WideTable &table, core::Metric metric) {
	using Result = core::Outcome<std::vector<core::IntervalReading>>;

	const auto &columns = table.timeColumns();
	if (columns.empty()) {
		return Result::failure(core::ErrorKind::Transform,
		                       std::string("No time-of-day columns in the ") + core::metricName(metric) + " table.");
	}

	std::vector<TimeOfDay> times;
	times.reserve(columns.size());
	for (const auto &column : columns) {
		const auto parsed = parseTimeOfDayLabel(column);
		if (!parsed) {
			return Result::failure(core::ErrorKind::Transform,
			                       "Cannot parse time-of-day label from column '" + column + "'.");
		}
		times.push_back(*parsed);
	}

	std::vector<core::IntervalReading> readings;
	readings.reserve(columns.size() * table.rows());
	for (std::size_t column = 0; column < columns.size(); ++column) {
		for (std::size_t row = 0; row < table.rows(); ++row) {
			core::IntervalReading reading;
			reading.timestamp.date = table.dates()[row];
			reading.timestamp.hour = times[column].hour;
			reading.timestamp.minute = times[column].minute;
			reading.value = table.values()[row][column];
			reading.metric = metric;
			readings.push_back(reading);
		}
	}

	std::stable_sort(readings.begin(), readings.end(),
	                 [](const core::IntervalReading &lhs, const core::IntervalReading &rhs) {
		                 return lhs.timestamp < rhs.timestamp;
	                 });

	KWHFLOW_DEBUG("Reshaped {} table: {} days x {} columns -> {} readings", core::metricName(metric), table.rows(),
	              columns.size(), readings.size());
	return Result::success(std::move(readings));
}

} // namespace kwhflow::transform
