#pragma once

#include "kwhflow/core/civil_time.hpp"
#include "kwhflow/core/outcome.hpp"
#include "kwhflow/core/zone_rules.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace kwhflow::core {

enum class LocalTimeKind {
	Unique,     // the wall-clock time maps to exactly one instant
	Ambiguous,  // fall-back: the wall-clock time occurs twice
	NonExistent // spring-forward: the wall-clock time is skipped
};

struct LocalTimeResolution {
	LocalTimeKind kind = LocalTimeKind::Unique;
	// Both equal for Unique, undefined for NonExistent.
	TimePoint earliest{};
	TimePoint latest{};
};

/**
 * @class TimeZone
 * @brief A named zone from the system tz database.
 *
 * The zone file is read once at load time into an immutable ZoneRules table
 * that copies of the zone share. Lookups never touch the process environment,
 * so they are safe from any thread.
 */
class TimeZone {
public:
	/**
	 * @brief Loads a zone by IANA name (e.g. "America/New_York").
	 * @return DataSource error if the name is not in the zoneinfo database.
	 */
	static Outcome<TimeZone> load(const std::string &name);

	static TimeZone utc();

	const std::string &name() const {
		return name_;
	}

	std::chrono::seconds offsetAt(TimePoint instant) const;

	CivilDateTime toLocal(TimePoint instant) const;

	CivilDate localDate(TimePoint instant) const {
		return toLocal(instant).date;
	}

	/**
	 * @brief Finds the instants at which the wall clock of this zone reads `local`.
	 */
	LocalTimeResolution classify(const CivilDateTime &local) const;

	/**
	 * @brief Truncates an instant to the start of its local wall-clock hour.
	 */
	TimePoint floorHour(TimePoint instant) const;

	/**
	 * @brief First instant of a local calendar day.
	 *
	 * Midnight is used when it exists (the earlier one if repeated); when midnight
	 * falls in a gap, the instant the clock jumps forward is returned.
	 */
	TimePoint startOfDay(const CivilDate &date) const;

	/**
	 * @brief Directory searched for zone files: $TZDIR or /usr/share/zoneinfo.
	 */
	static std::string zoneInfoDirectory();

private:
	TimeZone(std::string name, ZoneRules rules);

	std::int64_t offsetSeconds(std::int64_t epoch_seconds) const {
		return rules_->offsetAt(epoch_seconds);
	}

	std::string name_;
	std::shared_ptr<const ZoneRules> rules_;
};

} // namespace kwhflow::core
