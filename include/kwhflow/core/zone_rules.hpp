#pragma once

#include "kwhflow/core/outcome.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace kwhflow::core {

/**
 * @brief A POSIX TZ rule such as "EST5EDT,M3.2.0,M11.1.0".
 *
 * Offsets are stored east-positive (the opposite sign of the POSIX text).
 */
struct PosixZoneRule {
	struct Transition {
		enum class Form { Julian, ZeroBasedDay, MonthWeekDay };
		Form form = Form::MonthWeekDay;
		int day = 0;   // 1-365 for Julian, 0-365 for ZeroBasedDay, 0-6 (Sunday first) for MonthWeekDay
		int week = 1;  // 1-5, 5 meaning the last such weekday
		int month = 1; // 1-12
		std::int64_t time = 2 * 3600; // local wall time of the change, may be negative or past 24h

		/**
		 * @brief Seconds since the epoch of the change in `year`, read as UTC wall time.
		 */
		std::int64_t wallSeconds(int year) const;
	};

	std::int64_t std_offset = 0;
	bool has_dst = false;
	std::int64_t dst_offset = 0;
	Transition dst_start;
	Transition dst_end;

	/**
	 * @brief Parses a TZ string. A DST name without rules gets the US rules.
	 * @return DataSource error on malformed text.
	 */
	static Outcome<PosixZoneRule> parse(const std::string &text);

	std::int64_t offsetAt(std::int64_t epoch_seconds) const;
};

/**
 * @class ZoneRules
 * @brief Immutable UTC offset table read from a TZif file (RFC 8536).
 *
 * Instants are looked up in the transition list; instants past the last listed
 * transition follow the POSIX rule in the file footer.
 */
class ZoneRules {
public:
	static ZoneRules fixed(std::int64_t offset_seconds);

	/**
	 * @brief Parses the raw bytes of a TZif file (versions 1 to 4).
	 */
	static Outcome<ZoneRules> parse(const std::string &bytes);

	static Outcome<ZoneRules> readFile(const std::string &path);

	std::int64_t offsetAt(std::int64_t epoch_seconds) const;

	std::size_t transitionCount() const {
		return transitions_.size();
	}

private:
	std::vector<std::int64_t> transitions_;
	// Offset in force from transitions_[i] on.
	std::vector<std::int64_t> offsets_after_;
	// Offset before the first transition, or everywhere when there are none.
	std::int64_t initial_offset_ = 0;
	bool has_footer_ = false;
	PosixZoneRule footer_;
};

} // namespace kwhflow::core
