#pragma once

#include "kwhflow/core/outcome.hpp"
#include "kwhflow/core/time_zone.hpp"
#include "kwhflow/core/usage_types.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace kwhflow::transform {

// Absolute kWh difference tolerated between interval and hourly totals.
constexpr double kDefaultConservationTolerance = 0.001;

/**
 * @class HourlyAggregator
 * @brief Buckets interval rows into local wall-clock hours.
 *
 * Within a bucket power is averaged and energy summed. After aggregation the
 * total energy of the buckets must match the total of the input rows within
 * the tolerance, otherwise the result is an ErrorKind::Consistency failure.
 */
class HourlyAggregator {
public:
	struct Options {
		double conservation_tolerance = kDefaultConservationTolerance;
	};

	explicit HourlyAggregator(core::TimeZone zone) : HourlyAggregator(std::move(zone), Options{}) {
	}

	HourlyAggregator(core::TimeZone zone, Options options);

	core::Outcome<std::vector<core::HourlyBucket>> aggregate(const core::UsageTable &rows) const;

	const Options &options() const {
		return options_;
	}

private:
	core::TimeZone zone_;
	Options options_;
};

double totalEnergy(const core::UsageTable &rows);
double totalEnergy(const std::vector<core::HourlyBucket> &buckets);

/**
 * @brief Compares interval and hourly energy totals.
 * @return The consistency error, or nullopt when the totals agree.
 */
std::optional<core::Error> checkEnergyConservation(const core::UsageTable &rows,
                                                   const std::vector<core::HourlyBucket> &buckets,
                                                   double tolerance = kDefaultConservationTolerance);

} // namespace kwhflow::transform
