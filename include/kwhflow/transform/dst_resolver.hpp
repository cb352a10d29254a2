#pragma once

#include "kwhflow/core/time_zone.hpp"
#include "kwhflow/core/usage_types.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace kwhflow::transform {

/**
 * @brief Which instant a repeated (fall-back) wall-clock time resolves to.
 */
enum class AmbiguousTimePolicy {
	Earliest, // first occurrence
	Latest    // second occurrence
};

constexpr AmbiguousTimePolicy kDefaultAmbiguousTimePolicy = AmbiguousTimePolicy::Earliest;

/**
 * @brief Readings with zone-aware timestamps plus the non-fatal DST notice.
 *
 * Readings whose wall-clock time was skipped by a spring-forward transition
 * are listed in `dropped` and absent from `readings`.
 */
struct DstResolution {
	std::vector<core::ResolvedReading> readings;
	std::vector<core::CivilDateTime> dropped;
	std::size_t ambiguous = 0;

	std::size_t droppedCount() const {
		return dropped.size();
	}

	bool hasNotice() const {
		return !dropped.empty();
	}
};

class DstResolver {
public:
	explicit DstResolver(core::TimeZone zone, AmbiguousTimePolicy policy = kDefaultAmbiguousTimePolicy)
	    : zone_(std::move(zone)), policy_(policy) {
	}

	DstResolution resolve(const std::vector<core::IntervalReading> &readings) const;

	const core::TimeZone &zone() const {
		return zone_;
	}

	AmbiguousTimePolicy policy() const {
		return policy_;
	}

private:
	core::TimeZone zone_;
	AmbiguousTimePolicy policy_;
};

} // namespace kwhflow::transform
