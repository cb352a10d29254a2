#pragma once

#include "kwhflow/statistics/statistics_store.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kwhflow::statistics {

/**
 * @class InMemoryStatisticsStore
 * @brief Thread-safe reference store keeping every series in memory.
 */
class InMemoryStatisticsStore : public IStatisticsStore {
public:
	std::optional<core::StatisticPoint> getLastPoint(const std::string &statistic_key) override;
	std::optional<double> getSumBefore(const std::string &statistic_key, core::TimePoint instant) override;
	void registerMetadata(const StatisticMetadata &metadata) override;
	void upsert(const std::string &statistic_key, const std::vector<core::StatisticPoint> &points) override;

	std::string getName() const override {
		return "InMemoryStatisticsStore";
	}

	/// Points of a series ascending by start.
	std::vector<core::StatisticPoint> points(const std::string &statistic_key) const;

	std::optional<StatisticMetadata> metadata(const std::string &statistic_key) const;

	std::size_t metadataRegistrations() const;
	std::size_t upsertCalls() const;

private:
	using Series = std::map<core::TimePoint, core::StatisticPoint>;

	mutable std::mutex mutex_;
	std::map<std::string, Series> series_;
	std::map<std::string, StatisticMetadata> metadata_;
	std::size_t metadata_registrations_ = 0;
	std::size_t upsert_calls_ = 0;
};

} // namespace kwhflow::statistics
