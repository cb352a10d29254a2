#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kwhflow::core {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief A calendar date with no time-of-day and no time zone.
 */
struct CivilDate {
	int year = 1970;
	int month = 1;
	int day = 1;

	/**
	 * @brief Days since 1970-01-01 in the proleptic Gregorian calendar.
	 */
	std::int64_t toDays() const;
	static CivilDate fromDays(std::int64_t days);

	CivilDate addDays(std::int64_t days) const {
		return fromDays(toDays() + days);
	}

	bool isValid() const;

	/**
	 * @brief Parses the upstream MM/DD/YYYY form.
	 */
	static std::optional<CivilDate> parseUs(std::string_view text);

	/**
	 * @brief Parses the ISO YYYY-MM-DD form.
	 */
	static std::optional<CivilDate> parseIso(std::string_view text);

	std::string toIsoString() const;

	friend bool operator==(const CivilDate &lhs, const CivilDate &rhs) {
		return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
	}
	friend bool operator!=(const CivilDate &lhs, const CivilDate &rhs) {
		return !(lhs == rhs);
	}
	friend bool operator<(const CivilDate &lhs, const CivilDate &rhs) {
		return lhs.toDays() < rhs.toDays();
	}
	friend bool operator<=(const CivilDate &lhs, const CivilDate &rhs) {
		return !(rhs < lhs);
	}
	friend bool operator>(const CivilDate &lhs, const CivilDate &rhs) {
		return rhs < lhs;
	}
	friend bool operator>=(const CivilDate &lhs, const CivilDate &rhs) {
		return !(lhs < rhs);
	}
};

/**
 * @brief A wall-clock date and time with no time zone attached.
 */
struct CivilDateTime {
	CivilDate date;
	int hour = 0;
	int minute = 0;
	int second = 0;

	/**
	 * @brief Seconds since the epoch when the wall clock is read as UTC.
	 *
	 * Only meaningful as an ordering key or as input to a zone lookup.
	 */
	std::int64_t toEpochSeconds() const;
	static CivilDateTime fromEpochSeconds(std::int64_t seconds);

	std::string toString() const;

	friend bool operator==(const CivilDateTime &lhs, const CivilDateTime &rhs) {
		return lhs.toEpochSeconds() == rhs.toEpochSeconds();
	}
	friend bool operator!=(const CivilDateTime &lhs, const CivilDateTime &rhs) {
		return !(lhs == rhs);
	}
	friend bool operator<(const CivilDateTime &lhs, const CivilDateTime &rhs) {
		return lhs.toEpochSeconds() < rhs.toEpochSeconds();
	}
	friend bool operator>(const CivilDateTime &lhs, const CivilDateTime &rhs) {
		return rhs < lhs;
	}
};

inline std::int64_t toEpochSeconds(TimePoint tp) {
	return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline TimePoint fromEpochSeconds(std::int64_t seconds) {
	return TimePoint(std::chrono::seconds(seconds));
}

/**
 * @brief Formats an instant as an ISO-8601 UTC string, e.g. 2024-03-10T07:00:00Z.
 */
std::string formatUtc(TimePoint tp);

} // namespace kwhflow::core
