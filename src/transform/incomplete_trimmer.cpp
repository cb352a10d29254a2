#include "kwhflow/transform/incomplete_trimmer.hpp"
#include "kwhflow/utils/logging.hpp"

#include <algorithm>
#include <vector>

namespace kwhflow::transform {

bool isAfternoonColumn(const std::string &label) {
	return label.find(" PM") != std::string::npos;
}

TrimResult trimIncompleteDay(const core::WideTable &table) {
	TrimResult result{table, std::nullopt};
	if (table.empty()) {
		return result;
	}

	const auto &dates = table.dates();
	const auto latest = *std::max_element(dates.begin(), dates.end());

	std::vector<std::size_t> afternoon;
	for (std::size_t column = 0; column < table.timeColumns().size(); ++column) {
		if (isAfternoonColumn(table.timeColumns()[column])) {
			afternoon.push_back(column);
		}
	}

	double afternoon_sum = 0.0;
	for (std::size_t row = 0; row < table.rows(); ++row) {
		if (dates[row] != latest) {
			continue;
		}
		for (const auto column : afternoon) {
			afternoon_sum += table.values()[row][column];
		}
	}

	if (afternoon_sum == 0.0) {
		KWHFLOW_INFO("Dropping incomplete day {} (no afternoon readings yet)", latest.toIsoString());
		result.table = table.withoutDate(latest);
		result.dropped_date = latest;
	}
	return result;
}

} // namespace kwhflow::transform
