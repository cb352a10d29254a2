#pragma once

#include "kwhflow/core/outcome.hpp"
#include "kwhflow/core/usage_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kwhflow::transform {

struct TimeOfDay {
	int hour = 0; // 0-23
	int minute = 0;
};

/**
 * @brief Extracts and parses the "H:MM AM|PM" label of a column name.
 *
 * A unit suffix such as "12:30 AM kW" is tolerated. Returns nullopt when no
 * label is present or the hour/minute are out of range for a 12-hour clock.
 */
std::optional<TimeOfDay> parseTimeOfDayLabel(const std::string &column_name);

/**
 * @brief Pivots a wide table into one reading per (day, time-of-day).
 *
 * The result is sorted ascending by timestamp. Fails with
 * ErrorKind::Transform when the table has no time-of-day columns or a column
 * label cannot be parsed.
 */
core::Outcome<std::vector<core::IntervalReading>> toLongFormat(const core::WideTable &table, core::Metric metric);

} // namespace kwhflow::transform
