#include <catch2/catch.hpp>

#include "kwhflow/core/time_zone.hpp"
#include "kwhflow/core/zone_rules.hpp"
#include "common/usage_fixtures.hpp"

#include <cstdint>
#include <string>

using kwhflow::core::ErrorKind;
using kwhflow::core::PosixZoneRule;
using kwhflow::core::TimeZone;
using kwhflow::core::ZoneRules;
using kwhflow::core::toEpochSeconds;
using tests::fixtures::utc;

namespace {

constexpr std::int64_t kHour = 3600;

void appendBigEndian(std::string &bytes, std::int64_t value, int width) {
	for (int shift = (width - 1) * 8; shift >= 0; shift -= 8) {
		bytes.push_back(static_cast<char>((value >> shift) & 0xFF));
	}
}

// One transition at `at` from type 0 (offset_before) to type 1 (offset_after).
std::string tzifBlock(char version, int width, std::int64_t at, std::int64_t offset_before,
                      std::int64_t offset_after) {
	std::string bytes = "TZif";
	bytes.push_back(version);
	bytes.append(15, '\0');
	for (std::int64_t count : {0, 0, 0, 1, 2, 8}) {
		appendBigEndian(bytes, count, 4);
	}
	appendBigEndian(bytes, at, width);
	bytes.push_back('\1');
	appendBigEndian(bytes, offset_before, 4);
	bytes.append({'\0', '\0'});
	appendBigEndian(bytes, offset_after, 4);
	bytes.append({'\0', '\4'});
	bytes.append("OLD\0NEW\0", 8);
	return bytes;
}

} // namespace

TEST_CASE("PosixZoneRule parses TZ strings", "[core][zone_rules]") {
	SECTION("standard time only") {
		auto rule = PosixZoneRule::parse("IST-5:30");
		REQUIRE(rule.ok());
		REQUIRE_FALSE(rule.value().has_dst);
		REQUIRE(rule.value().std_offset == 5 * kHour + 30 * 60);

		auto quoted = PosixZoneRule::parse("<-03>3");
		REQUIRE(quoted.ok());
		REQUIRE(quoted.value().std_offset == -3 * kHour);
	}

	SECTION("daylight time with rules") {
		auto rule = PosixZoneRule::parse("EST5EDT,M3.2.0,M11.1.0");
		REQUIRE(rule.ok());
		REQUIRE(rule.value().has_dst);
		REQUIRE(rule.value().std_offset == -5 * kHour);
		REQUIRE(rule.value().dst_offset == -4 * kHour);
		REQUIRE(rule.value().dst_start.month == 3);
		REQUIRE(rule.value().dst_start.week == 2);
		REQUIRE(rule.value().dst_end.time == 2 * kHour);
	}

	SECTION("malformed text") {
		for (const std::string text : {"", "E5", "EST", "EST5EDT,M13.1.0,M11.1.0", "EST5EDT,M3.2.0",
		                               "EST5EDT,M3.2.0,M11.1.0x"}) {
			auto rule = PosixZoneRule::parse(text);
			REQUIRE_FALSE(rule.ok());
			REQUIRE(rule.error().kind == ErrorKind::DataSource);
		}
	}
}

TEST_CASE("PosixZoneRule switches offsets at the rule instants", "[core][zone_rules]") {
	SECTION("northern hemisphere") {
		const auto rule = PosixZoneRule::parse("EST5EDT,M3.2.0,M11.1.0").value();
		// 2030-03-10 02:00 EST and 2030-11-03 02:00 EDT.
		REQUIRE(rule.offsetAt(toEpochSeconds(utc(2030, 3, 10, 7)) - 1) == -5 * kHour);
		REQUIRE(rule.offsetAt(toEpochSeconds(utc(2030, 3, 10, 7))) == -4 * kHour);
		REQUIRE(rule.offsetAt(toEpochSeconds(utc(2030, 11, 3, 6)) - 1) == -4 * kHour);
		REQUIRE(rule.offsetAt(toEpochSeconds(utc(2030, 11, 3, 6))) == -5 * kHour);
	}

	SECTION("last weekday of the month") {
		const auto rule = PosixZoneRule::parse("GMT0BST,M3.5.0/1,M10.5.0").value();
		// 2030-03-31 is the last Sunday of March.
		REQUIRE(rule.offsetAt(toEpochSeconds(utc(2030, 3, 31, 0, 59))) == 0);
		REQUIRE(rule.offsetAt(toEpochSeconds(utc(2030, 3, 31, 1))) == kHour);
	}

	SECTION("southern hemisphere") {
		const auto rule = PosixZoneRule::parse("AEST-10AEDT,M10.1.0,M4.1.0/3").value();
		REQUIRE(rule.offsetAt(toEpochSeconds(utc(2030, 1, 15, 12))) == 11 * kHour);
		REQUIRE(rule.offsetAt(toEpochSeconds(utc(2030, 7, 15, 12))) == 10 * kHour);
		// 2030-04-07 03:00 AEDT and 2030-10-06 02:00 AEST.
		REQUIRE(rule.offsetAt(toEpochSeconds(utc(2030, 4, 6, 16)) - 1) == 11 * kHour);
		REQUIRE(rule.offsetAt(toEpochSeconds(utc(2030, 4, 6, 16))) == 10 * kHour);
		REQUIRE(rule.offsetAt(toEpochSeconds(utc(2030, 10, 5, 16))) == 11 * kHour);
	}
}

TEST_CASE("ZoneRules reads TZif data", "[core][zone_rules]") {
	const std::int64_t at = toEpochSeconds(utc(2000, 1, 1, 0));

	SECTION("version 1 transition table") {
		auto rules = ZoneRules::parse(tzifBlock('\0', 4, at, kHour, 2 * kHour));
		REQUIRE(rules.ok());
		REQUIRE(rules.value().transitionCount() == 1);
		REQUIRE(rules.value().offsetAt(at - 1) == kHour);
		REQUIRE(rules.value().offsetAt(at) == 2 * kHour);
		REQUIRE(rules.value().offsetAt(at + 100 * 365 * 24 * kHour) == 2 * kHour);
	}

	SECTION("version 2 data with a footer rule") {
		const std::string bytes = tzifBlock('2', 4, at, kHour, 2 * kHour) + tzifBlock('2', 8, at, kHour, 2 * kHour) +
		                          "\nNEW-2OLD-1,M3.5.0,M10.5.0\n";
		auto rules = ZoneRules::parse(bytes);
		REQUIRE(rules.ok());
		REQUIRE(rules.value().offsetAt(at - 1) == kHour);
		// Past the last transition the footer rule applies: winter is the second offset.
		REQUIRE(rules.value().offsetAt(toEpochSeconds(utc(2040, 1, 15, 0))) == 2 * kHour);
		REQUIRE(rules.value().offsetAt(toEpochSeconds(utc(2040, 7, 15, 0))) == kHour);
	}

	SECTION("garbage is rejected") {
		for (const std::string bytes : {std::string(), std::string("not a zone file"),
		                                tzifBlock('\0', 4, at, 0, 0).substr(0, 50)}) {
			auto rules = ZoneRules::parse(bytes);
			REQUIRE_FALSE(rules.ok());
			REQUIRE(rules.error().kind == ErrorKind::DataSource);
		}
	}
}

TEST_CASE("ZoneRules follows the system database beyond its transition list", "[core][zone_rules]") {
	auto rules = ZoneRules::readFile(TimeZone::zoneInfoDirectory() + "/America/New_York");
	REQUIRE(rules.ok());
	REQUIRE(rules.value().offsetAt(toEpochSeconds(utc(2090, 7, 1, 12))) == -4 * kHour);
	REQUIRE(rules.value().offsetAt(toEpochSeconds(utc(2090, 12, 1, 12))) == -5 * kHour);
	// Local mean time before standard time was adopted.
	REQUIRE(rules.value().offsetAt(toEpochSeconds(utc(1850, 1, 1, 12))) == -(4 * kHour + 56 * 60 + 2));

	REQUIRE_FALSE(ZoneRules::readFile("/nonexistent/zone").ok());
}
