#pragma once

#include "kwhflow/core/usage_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kwhflow::statistics {

/**
 * @struct StatisticMetadata
 * @brief Description registered once per statistic key in the external store.
 */
struct StatisticMetadata {
	std::string statistic_key;
	std::string display_name;
	std::string source;
	std::string unit = "kWh";
	bool has_sum = true;
	bool has_mean = false;
};

/**
 * @brief Stable identity of an account's cumulative consumption series.
 */
struct StatisticIdentity {
	std::string source = "dominion_energy";
	std::string provider_name = "Dominion Energy";
	std::string account_id;

	/// e.g. "dominion_energy:1234_energy_consumption"
	std::string key() const {
		return source + ":" + account_id + "_energy_consumption";
	}

	std::string displayName() const {
		return provider_name + " " + account_id + " Energy Consumption";
	}

	StatisticMetadata metadata() const {
		StatisticMetadata meta;
		meta.statistic_key = key();
		meta.display_name = displayName();
		meta.source = source;
		return meta;
	}
};

/**
 * @class IStatisticsStore
 * @brief Interface of the external long-term statistics store.
 *
 * Implementations must give upsert-by-start semantics: writing a point whose
 * start already exists for the key replaces it. Failures are reported by
 * throwing a std::exception.
 */
class IStatisticsStore {
public:
	virtual ~IStatisticsStore() = default;

	/**
	 * @brief Most recent persisted point of a series, if any.
	 */
	virtual std::optional<core::StatisticPoint> getLastPoint(const std::string &statistic_key) = 0;

	/**
	 * @brief Cumulative sum of the last point starting at or before `instant`.
	 */
	virtual std::optional<double> getSumBefore(const std::string &statistic_key, core::TimePoint instant) = 0;

	virtual void registerMetadata(const StatisticMetadata &metadata) = 0;

	/**
	 * @brief Writes a batch of points for one key, all or nothing.
	 */
	virtual void upsert(const std::string &statistic_key, const std::vector<core::StatisticPoint> &points) = 0;

	virtual std::string getName() const = 0;
};

} // namespace kwhflow::statistics
