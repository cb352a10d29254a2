#pragma once

#include "kwhflow/core/outcome.hpp"
#include "kwhflow/core/usage_types.hpp"

#include <string>

namespace kwhflow::ingest {

/**
 * @brief Names of the two sheets in the upstream usage export.
 */
struct SheetNames {
	std::string power = "kW Usage Data";
	std::string energy = "kWH Usage Data";
};

/**
 * @brief Checks that the raw import holds the power and energy tables and
 * turns the loose mapping into a typed UsageSheets.
 *
 * Fails with ErrorKind::DataSource when fewer than two sheets are present,
 * when a named sheet is missing, when a sheet has no columns, or when a row
 * does not carry one value per time-of-day column.
 */
core::Outcome<core::UsageSheets> validateSheets(const core::RawImport &raw, const SheetNames &names = {});

} // namespace kwhflow::ingest
