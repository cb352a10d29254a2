#include "kwhflow/transform/dst_resolver.hpp"
#include "kwhflow/utils/logging.hpp"

namespace kwhflow::transform {

DstResolution DstResolver::resolve(const std::vector<core::IntervalReading> &readings) const {
	DstResolution result;
	result.readings.reserve(readings.size());

	for (const auto &reading : readings) {
		const auto resolution = zone_.classify(reading.timestamp);
		switch (resolution.kind) {
		case core::LocalTimeKind::Unique:
			result.readings.push_back({resolution.earliest, reading.value, reading.metric});
			break;
		case core::LocalTimeKind::Ambiguous:
			++result.ambiguous;
			result.readings.push_back({policy_ == AmbiguousTimePolicy::Earliest ? resolution.earliest
			                                                                    : resolution.latest,
			                           reading.value, reading.metric});
			break;
		case core::LocalTimeKind::NonExistent:
			result.dropped.push_back(reading.timestamp);
			break;
		}
	}

	if (result.hasNotice()) {
		for (const auto &missing : result.dropped) {
			KWHFLOW_DEBUG("Timestamp {} does not exist in {} (DST gap)", missing.toString(), zone_.name());
		}
		KWHFLOW_WARN("Some timestamps were lost during DST transition handling. Original rows: {}, Final rows: {}",
		             readings.size(), result.readings.size());
	}
	if (result.ambiguous > 0) {
		KWHFLOW_DEBUG("Resolved {} repeated wall-clock timestamps in {}", result.ambiguous, zone_.name());
	}
	return result;
}

} // namespace kwhflow::transform
