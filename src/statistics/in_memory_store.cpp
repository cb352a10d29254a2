#include "kwhflow/statistics/in_memory_store.hpp"

#include <stdexcept>

namespace kwhflow::statistics {

std::optional<core::StatisticPoint> InMemoryStatisticsStore::getLastPoint(const std::string &statistic_key) {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = series_.find(statistic_key);
	if (it == series_.end() || it->second.empty()) {
		return std::nullopt;
	}
	return it->second.rbegin()->second;
}

std::optional<double> InMemoryStatisticsStore::getSumBefore(const std::string &statistic_key,
                                                            core::TimePoint instant) {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = series_.find(statistic_key);
	if (it == series_.end()) {
		return std::nullopt;
	}
	const auto &series = it->second;
	auto upper = series.upper_bound(instant);
	if (upper == series.begin()) {
		return std::nullopt;
	}
	--upper;
	return upper->second.sum;
}

void InMemoryStatisticsStore::registerMetadata(const StatisticMetadata &metadata) {
	if (metadata.statistic_key.empty()) {
		throw std::invalid_argument("Statistic metadata must carry a statistic key.");
	}
	std::lock_guard<std::mutex> lock(mutex_);
	metadata_[metadata.statistic_key] = metadata;
	++metadata_registrations_;
}

void InMemoryStatisticsStore::upsert(const std::string &statistic_key, const std::vector<core::StatisticPoint> &points) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (metadata_.find(statistic_key) == metadata_.end()) {
		throw std::runtime_error("No metadata registered for statistic '" + statistic_key + "'.");
	}
	auto &series = series_[statistic_key];
	for (const auto &point : points) {
		series[point.start] = point;
	}
	++upsert_calls_;
}

std::vector<core::StatisticPoint> InMemoryStatisticsStore::points(const std::string &statistic_key) const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<core::StatisticPoint> result;
	const auto it = series_.find(statistic_key);
	if (it == series_.end()) {
		return result;
	}
	result.reserve(it->second.size());
	for (const auto &entry : it->second) {
		result.push_back(entry.second);
	}
	return result;
}

std::optional<StatisticMetadata> InMemoryStatisticsStore::metadata(const std::string &statistic_key) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = metadata_.find(statistic_key);
	if (it == metadata_.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::size_t InMemoryStatisticsStore::metadataRegistrations() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return metadata_registrations_;
}

std::size_t InMemoryStatisticsStore::upsertCalls() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return upsert_calls_;
}

} // namespace kwhflow::statistics
