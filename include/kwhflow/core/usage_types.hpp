#pragma once

#include "kwhflow/core/civil_time.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace kwhflow::core {

enum class Metric { Power, Energy };

inline const char *metricName(Metric metric) {
	return metric == Metric::Power ? "power_kw" : "energy_kwh";
}

/**
 * @class WideTable
 * @brief One row per calendar day, one value column per time-of-day label.
 *
 * Values are stored row-major: values()[row][column] belongs to dates()[row]
 * and timeColumns()[column]. The Total column of the upstream export is not
 * stored; it is always derived from the time-of-day columns.
 */
class WideTable {
public:
	WideTable() = default;

	explicit WideTable(std::vector<std::string> time_columns) : time_columns_(std::move(time_columns)) {
	}

	WideTable(std::vector<std::string> time_columns, std::vector<CivilDate> dates,
	          std::vector<std::vector<double>> values)
	    : time_columns_(std::move(time_columns)), dates_(std::move(dates)), values_(std::move(values)) {
		if (dates_.size() != values_.size()) {
			throw std::invalid_argument("WideTable dates and value rows must have the same size.");
		}
	}

	const std::vector<std::string> &timeColumns() const {
		return time_columns_;
	}

	const std::vector<CivilDate> &dates() const {
		return dates_;
	}

	const std::vector<std::vector<double>> &values() const {
		return values_;
	}

	std::size_t rows() const {
		return dates_.size();
	}

	bool empty() const {
		return dates_.empty();
	}

	/**
	 * @brief Appends a day. The row must hold one value per time-of-day column.
	 */
	void addRow(CivilDate date, std::vector<double> row) {
		if (row.size() != time_columns_.size()) {
			throw std::invalid_argument("WideTable row for " + date.toIsoString() + " has " +
			                            std::to_string(row.size()) + " values, expected " +
			                            std::to_string(time_columns_.size()) + ".");
		}
		dates_.push_back(date);
		values_.push_back(std::move(row));
	}

	/**
	 * @brief Row-wise sum across the time-of-day columns.
	 */
	double total(std::size_t row) const {
		if (row >= values_.size()) {
			throw std::out_of_range("WideTable row index out of range.");
		}
		double sum = 0.0;
		for (double value : values_[row]) {
			sum += value;
		}
		return sum;
	}

	/**
	 * @brief Returns a copy keeping only the rows whose date differs from the given one.
	 */
	WideTable withoutDate(const CivilDate &date) const {
		WideTable result(time_columns_);
		for (std::size_t row = 0; row < dates_.size(); ++row) {
			if (dates_[row] != date) {
				result.dates_.push_back(dates_[row]);
				result.values_.push_back(values_[row]);
			}
		}
		return result;
	}

private:
	std::vector<std::string> time_columns_;
	std::vector<CivilDate> dates_;
	std::vector<std::vector<double>> values_;
};

/**
 * @brief The loosely-typed raw import: sheet name to table.
 */
struct RawImport {
	std::map<std::string, WideTable> sheets;
};

/**
 * @brief The validated import with exactly the two tables the pipeline needs.
 */
struct UsageSheets {
	WideTable power;
	WideTable energy;
};

struct IntervalReading {
	CivilDateTime timestamp;
	double value = 0.0;
	Metric metric = Metric::Energy;
};

struct ResolvedReading {
	TimePoint timestamp{};
	double value = 0.0;
	Metric metric = Metric::Energy;
};

struct LocalizedReading {
	TimePoint timestamp{};
	double power_kw = 0.0;
	double energy_kwh = 0.0;
};

/**
 * @brief Entity-facing table: one row per interval, ascending by timestamp.
 */
using UsageTable = std::vector<LocalizedReading>;

struct HourlyBucket {
	TimePoint hour_start{};
	double power_kw = 0.0;
	double energy_kwh = 0.0;
	std::size_t interval_count = 0;
};

struct StatisticPoint {
	TimePoint start{};
	double state = 0.0;
	double sum = 0.0;
};

struct CorrectionWindow {
	TimePoint start{};
	double baseline_sum = 0.0;
};

} // namespace kwhflow::core
