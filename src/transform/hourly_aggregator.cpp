#include "kwhflow/transform/hourly_aggregator.hpp"
#include "kwhflow/utils/logging.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

namespace kwhflow::transform {

namespace {

double columnSum(const std::vector<double> &column) {
	if (column.empty()) {
		return 0.0;
	}
	return Eigen::Map<const Eigen::VectorXd>(column.data(), static_cast<Eigen::Index>(column.size())).sum();
}

struct BucketAccumulator {
	double power_sum = 0.0;
	double energy_sum = 0.0;
	std::size_t count = 0;
};

} // namespace

HourlyAggregator::HourlyAggregator(core::TimeZone zone, Options options)
    : zone_(std::move(zone)), options_(options) {
	if (!(options_.conservation_tolerance > 0.0)) {
		throw std::invalid_argument("Conservation tolerance must be positive.");
	}
}

core::Outcome<std::vector<core::HourlyBucket>> HourlyAggregator::aggregate(const core::UsageTable &rows) const {
	using Result = core::Outcome<std::vector<core::HourlyBucket>>;

	std::map<core::TimePoint, BucketAccumulator> groups;
	for (const auto &row : rows) {
		auto &group = groups[zone_.floorHour(row.timestamp)];
		group.power_sum += row.power_kw;
		group.energy_sum += row.energy_kwh;
		++group.count;
	}

	std::vector<core::HourlyBucket> buckets;
	buckets.reserve(groups.size());
	std::size_t partial = 0;
	for (const auto &entry : groups) {
		const auto &group = entry.second;
		core::HourlyBucket bucket;
		bucket.hour_start = entry.first;
		bucket.power_kw = group.power_sum / static_cast<double>(group.count);
		bucket.energy_kwh = group.energy_sum;
		bucket.interval_count = group.count;
		if (group.count != 2) {
			++partial;
		}
		buckets.push_back(bucket);
	}
	if (partial > 0) {
		KWHFLOW_DEBUG("{} of {} hourly buckets do not hold exactly two half-hour readings", partial,
		              buckets.size());
	}

	if (auto violation = checkEnergyConservation(rows, buckets, options_.conservation_tolerance)) {
		KWHFLOW_ERROR("Failed to process data for statistics: {}", violation->message);
		return Result::failure(std::move(*violation));
	}
	return Result::success(std::move(buckets));
}

double totalEnergy(const core::UsageTable &rows) {
	std::vector<double> energy;
	energy.reserve(rows.size());
	for (const auto &row : rows) {
		energy.push_back(row.energy_kwh);
	}
	return columnSum(energy);
}

double totalEnergy(const std::vector<core::HourlyBucket> &buckets) {
	std::vector<double> energy;
	energy.reserve(buckets.size());
	for (const auto &bucket : buckets) {
		energy.push_back(bucket.energy_kwh);
	}
	return columnSum(energy);
}

std::optional<core::Error> checkEnergyConservation(const core::UsageTable &rows,
                                                   const std::vector<core::HourlyBucket> &buckets,
                                                   double tolerance) {
	const double original_sum = totalEnergy(rows);
	const double hourly_sum = totalEnergy(buckets);
	if (std::abs(original_sum - hourly_sum) <= tolerance) {
		return std::nullopt;
	}
	std::ostringstream oss;
	oss << std::fixed << std::setprecision(3) << "Energy sum mismatch after hourly aggregation. Original: "
	    << original_sum << " kWh, Hourly: " << hourly_sum << " kWh";
	return core::Error{core::ErrorKind::Consistency, oss.str()};
}

} // namespace kwhflow::transform
