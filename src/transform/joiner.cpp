#include "kwhflow/transform/joiner.hpp"
#include "kwhflow/utils/logging.hpp"

#include <algorithm>

namespace kwhflow::transform {

namespace {

void sortByTimestamp(std::vector<core::ResolvedReading> &readings) {
	std::stable_sort(readings.begin(), readings.end(),
	                 [](const core::ResolvedReading &lhs, const core::ResolvedReading &rhs) {
		                 return lhs.timestamp < rhs.timestamp;
	                 });
}

} // namespace

core::UsageTable joinPowerEnergy(std::vector<core::ResolvedReading> power, std::vector<core::ResolvedReading> energy) {
	sortByTimestamp(power);
	sortByTimestamp(energy);

	core::UsageTable joined;
	joined.reserve(std::min(power.size(), energy.size()));

	std::size_t i = 0;
	std::size_t j = 0;
	while (i < power.size() && j < energy.size()) {
		const auto ts = power[i].timestamp;
		if (ts < energy[j].timestamp) {
			++i;
			continue;
		}
		if (energy[j].timestamp < ts) {
			++j;
			continue;
		}
		// Equal keys: every pairing of the two runs, as a relational inner join does.
		std::size_t power_end = i;
		while (power_end < power.size() && power[power_end].timestamp == ts) {
			++power_end;
		}
		std::size_t energy_end = j;
		while (energy_end < energy.size() && energy[energy_end].timestamp == ts) {
			++energy_end;
		}
		for (std::size_t p = i; p < power_end; ++p) {
			for (std::size_t e = j; e < energy_end; ++e) {
				joined.push_back({ts, power[p].value, energy[e].value});
			}
		}
		i = power_end;
		j = energy_end;
	}

	if (joined.size() != power.size() || joined.size() != energy.size()) {
		KWHFLOW_DEBUG("Joined {} power and {} energy readings into {} rows", power.size(), energy.size(),
		              joined.size());
	}
	return joined;
}

} // namespace kwhflow::transform
