#pragma once

#include "kwhflow/core/usage_types.hpp"

#include <optional>
#include <string>

namespace kwhflow::transform {

struct TrimResult {
	core::WideTable table;
	// Set when the latest day was dropped as incomplete.
	std::optional<core::CivilDate> dropped_date;
};

/**
 * @brief True for time-of-day columns carrying the PM marker (noon onwards).
 */
bool isAfternoonColumn(const std::string &label);

/**
 * @brief Drops the latest day when all of its afternoon values are exactly zero.
 *
 * An export produced before the day has finished leaves the PM columns of the
 * last date empty. An empty table is returned unchanged.
 */
TrimResult trimIncompleteDay(const core::WideTable &table);

} // namespace kwhflow::transform
