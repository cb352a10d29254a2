#include "kwhflow/core/time_zone.hpp"
#include "kwhflow/utils/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <optional>

namespace kwhflow::core {

namespace {

constexpr std::int64_t kSecondsPerHour = 3600LL;
constexpr std::int64_t kSecondsPerDay = 86400LL;

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) {
	std::int64_t quotient = value / divisor;
	if ((value % divisor) < 0) {
		--quotient;
	}
	return quotient;
}

bool isSafeZoneName(const std::string &name) {
	if (name.empty() || name.front() == '/' || name.find("..") != std::string::npos) {
		return false;
	}
	for (char c : name) {
		const bool allowed = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
		                     c == '/' || c == '_' || c == '-' || c == '+';
		if (!allowed) {
			return false;
		}
	}
	return true;
}

} // namespace

TimeZone::TimeZone(std::string name, ZoneRules rules)
    : name_(std::move(name)), rules_(std::make_shared<ZoneRules>(std::move(rules))) {
}

std::string TimeZone::zoneInfoDirectory() {
	const char *tzdir = std::getenv("TZDIR");
	if (tzdir && *tzdir) {
		return tzdir;
	}
	return "/usr/share/zoneinfo";
}

Outcome<TimeZone> TimeZone::load(const std::string &name) {
	if (name == "UTC") {
		return Outcome<TimeZone>::success(utc());
	}
	if (!isSafeZoneName(name)) {
		return Outcome<TimeZone>::failure(ErrorKind::DataSource, "Invalid time zone name '" + name + "'.");
	}
	std::error_code ec;
	const auto path = std::filesystem::path(zoneInfoDirectory()) / name;
	if (!std::filesystem::is_regular_file(path, ec)) {
		return Outcome<TimeZone>::failure(ErrorKind::DataSource,
		                                  "Unknown time zone '" + name + "' (not found under " +
		                                      zoneInfoDirectory() + ").");
	}
	auto rules = ZoneRules::readFile(path.string());
	if (!rules) {
		return rules.propagate<TimeZone>();
	}
	KWHFLOW_DEBUG("Loaded zone {} with {} transitions", name, rules.value().transitionCount());
	return Outcome<TimeZone>::success(TimeZone(name, std::move(rules).value()));
}

TimeZone TimeZone::utc() {
	return TimeZone("UTC", ZoneRules::fixed(0));
}

std::chrono::seconds TimeZone::offsetAt(TimePoint instant) const {
	return std::chrono::seconds(offsetSeconds(toEpochSeconds(instant)));
}

CivilDateTime TimeZone::toLocal(TimePoint instant) const {
	const auto seconds = toEpochSeconds(instant);
	return CivilDateTime::fromEpochSeconds(seconds + offsetSeconds(seconds));
}

LocalTimeResolution TimeZone::classify(const CivilDateTime &local) const {
	// Read as UTC, the wall clock differs from the real instant by the offset in
	// force at that instant. Transitions are far more than a day apart, so the
	// offsets a day either side cover every candidate.
	const std::int64_t wall = local.toEpochSeconds();
	const std::int64_t offset_before = offsetSeconds(wall - kSecondsPerDay);
	const std::int64_t offset_after = offsetSeconds(wall + kSecondsPerDay);

	std::optional<std::int64_t> first;
	std::optional<std::int64_t> second;
	for (const std::int64_t offset : {offset_before, offset_after}) {
		const std::int64_t candidate = wall - offset;
		if (candidate + offsetSeconds(candidate) != wall) {
			continue;
		}
		if (!first) {
			first = candidate;
		} else if (*first != candidate) {
			second = candidate;
		}
	}

	LocalTimeResolution resolution;
	if (!first) {
		resolution.kind = LocalTimeKind::NonExistent;
		return resolution;
	}
	if (!second) {
		resolution.kind = LocalTimeKind::Unique;
		resolution.earliest = fromEpochSeconds(*first);
		resolution.latest = resolution.earliest;
		return resolution;
	}
	resolution.kind = LocalTimeKind::Ambiguous;
	resolution.earliest = fromEpochSeconds(std::min(*first, *second));
	resolution.latest = fromEpochSeconds(std::max(*first, *second));
	return resolution;
}

TimePoint TimeZone::floorHour(TimePoint instant) const {
	const std::int64_t seconds = toEpochSeconds(instant);
	const std::int64_t offset = offsetSeconds(seconds);
	const std::int64_t local_floor = floorDiv(seconds + offset, kSecondsPerHour) * kSecondsPerHour;
	return fromEpochSeconds(local_floor - offset);
}

TimePoint TimeZone::startOfDay(const CivilDate &date) const {
	CivilDateTime midnight;
	midnight.date = date;
	const auto resolution = classify(midnight);
	if (resolution.kind != LocalTimeKind::NonExistent) {
		return resolution.earliest;
	}
	const std::int64_t wall = midnight.toEpochSeconds();
	KWHFLOW_DEBUG("Midnight of {} does not exist in {}, using the end of the gap", date.toIsoString(), name_);
	return fromEpochSeconds(wall - offsetSeconds(wall - kSecondsPerDay));
}

} // namespace kwhflow::core
