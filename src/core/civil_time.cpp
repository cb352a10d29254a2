#include "kwhflow/core/civil_time.hpp"

#include <cstdio>

namespace kwhflow::core {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400LL;

bool isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
	static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) {
	std::int64_t quotient = value / divisor;
	if ((value % divisor) < 0) {
		--quotient;
	}
	return quotient;
}

// Reads an unsigned decimal field of 1..max_width digits starting at pos.
bool readNumber(std::string_view text, std::size_t &pos, std::size_t max_width, int &out) {
	std::size_t start = pos;
	int value = 0;
	while (pos < text.size() && pos - start < max_width && text[pos] >= '0' && text[pos] <= '9') {
		value = value * 10 + (text[pos] - '0');
		++pos;
	}
	if (pos == start) {
		return false;
	}
	out = value;
	return true;
}

std::string_view trim(std::string_view text) {
	while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
		text.remove_prefix(1);
	}
	while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
		text.remove_suffix(1);
	}
	return text;
}

} // namespace

// Days-from-civil over 400-year eras.
std::int64_t CivilDate::toDays() const {
	const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
	const std::int64_t era = floorDiv(y, 400);
	const std::int64_t yoe = y - era * 400;
	const std::int64_t mp = (month + 9) % 12;
	const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
	const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

CivilDate CivilDate::fromDays(std::int64_t days) {
	const std::int64_t z = days + 719468;
	const std::int64_t era = floorDiv(z, 146097);
	const std::int64_t doe = z - era * 146097;
	const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const std::int64_t mp = (5 * doy + 2) / 153;
	const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
	const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
	const std::int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
	return CivilDate{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

bool CivilDate::isValid() const {
	if (month < 1 || month > 12 || day < 1) {
		return false;
	}
	return day <= daysInMonth(year, month);
}

std::optional<CivilDate> CivilDate::parseUs(std::string_view text) {
	text = trim(text);
	CivilDate date;
	std::size_t pos = 0;
	if (!readNumber(text, pos, 2, date.month) || pos >= text.size() || text[pos++] != '/') {
		return std::nullopt;
	}
	if (!readNumber(text, pos, 2, date.day) || pos >= text.size() || text[pos++] != '/') {
		return std::nullopt;
	}
	const std::size_t year_start = pos;
	if (!readNumber(text, pos, 4, date.year) || pos - year_start != 4 || pos != text.size()) {
		return std::nullopt;
	}
	if (!date.isValid()) {
		return std::nullopt;
	}
	return date;
}

std::optional<CivilDate> CivilDate::parseIso(std::string_view text) {
	text = trim(text);
	CivilDate date;
	std::size_t pos = 0;
	if (!readNumber(text, pos, 4, date.year) || pos != 4 || pos >= text.size() || text[pos++] != '-') {
		return std::nullopt;
	}
	if (!readNumber(text, pos, 2, date.month) || pos >= text.size() || text[pos++] != '-') {
		return std::nullopt;
	}
	if (!readNumber(text, pos, 2, date.day) || pos != text.size()) {
		return std::nullopt;
	}
	if (!date.isValid()) {
		return std::nullopt;
	}
	return date;
}

std::string CivilDate::toIsoString() const {
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
	return buffer;
}

std::int64_t CivilDateTime::toEpochSeconds() const {
	return date.toDays() * kSecondsPerDay + hour * 3600LL + minute * 60LL + second;
}

CivilDateTime CivilDateTime::fromEpochSeconds(std::int64_t seconds) {
	const std::int64_t days = floorDiv(seconds, kSecondsPerDay);
	const std::int64_t remainder = seconds - days * kSecondsPerDay;
	CivilDateTime result;
	result.date = CivilDate::fromDays(days);
	result.hour = static_cast<int>(remainder / 3600);
	result.minute = static_cast<int>((remainder % 3600) / 60);
	result.second = static_cast<int>(remainder % 60);
	return result;
}

std::string CivilDateTime::toString() const {
	char buffer[32];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d", date.year, date.month, date.day, hour,
	              minute, second);
	return buffer;
}

std::string formatUtc(TimePoint tp) {
	const auto civil = CivilDateTime::fromEpochSeconds(toEpochSeconds(tp));
	char buffer[32];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02dZ", civil.date.year, civil.date.month,
	              civil.date.day, civil.hour, civil.minute, civil.second);
	return buffer;
}

} // namespace kwhflow::core
