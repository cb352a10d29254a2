#include "kwhflow/ingest/sheet_validator.hpp"
#include "kwhflow/utils/logging.hpp"

#include <sstream>

namespace kwhflow::ingest {

namespace {

std::string listSheetNames(const core::RawImport &raw) {
	std::ostringstream oss;
	oss << "[";
	bool first = true;
	for (const auto &entry : raw.sheets) {
		if (!first) {
			oss << ", ";
		}
		oss << "'" << entry.first << "'";
		first = false;
	}
	oss << "]";
	return oss.str();
}

std::string checkTableShape(const std::string &sheet, const core::WideTable &table) {
	if (table.timeColumns().empty()) {
		return "Sheet '" + sheet + "' has no time-of-day columns.";
	}
	const auto width = table.timeColumns().size();
	for (std::size_t row = 0; row < table.rows(); ++row) {
		if (table.values()[row].size() != width) {
			return "Sheet '" + sheet + "' row for " + table.dates()[row].toIsoString() + " has " +
			       std::to_string(table.values()[row].size()) + " values, expected " + std::to_string(width) +
			       ".";
		}
	}
	return {};
}

} // namespace

core::Outcome<core::UsageSheets> validateSheets(const core::RawImport &raw, const SheetNames &names) {
	using Result = core::Outcome<core::UsageSheets>;

	if (raw.sheets.size() < 2) {
		return Result::failure(core::ErrorKind::DataSource,
		                       "Usage export missing expected sheets. Found: " + listSheetNames(raw));
	}

	const auto power_it = raw.sheets.find(names.power);
	const auto energy_it = raw.sheets.find(names.energy);
	if (power_it == raw.sheets.end() || energy_it == raw.sheets.end()) {
		const std::string &missing = power_it == raw.sheets.end() ? names.power : names.energy;
		return Result::failure(core::ErrorKind::DataSource,
		                       "Usage export has no sheet named '" + missing + "'. Found: " + listSheetNames(raw));
	}

	for (const auto *entry : {&*power_it, &*energy_it}) {
		auto problem = checkTableShape(entry->first, entry->second);
		if (!problem.empty()) {
			return Result::failure(core::ErrorKind::DataSource, std::move(problem));
		}
	}

	KWHFLOW_DEBUG("Validated usage export: {} power rows, {} energy rows", power_it->second.rows(),
	              energy_it->second.rows());
	return Result::success(core::UsageSheets{power_it->second, energy_it->second});
}

} // namespace kwhflow::ingest
