#include "kwhflow/core/zone_rules.hpp"
#include "kwhflow/core/civil_time.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <optional>

namespace kwhflow::core {

namespace {

constexpr std::int64_t kSecondsPerHour = 3600LL;
constexpr std::int64_t kSecondsPerDay = 86400LL;
constexpr std::size_t kHeaderSize = 44;

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) {
	std::int64_t quotient = value / divisor;
	if ((value % divisor) < 0) {
		--quotient;
	}
	return quotient;
}

bool isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
	static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

/**
 * Cursor over a POSIX TZ string.
 */
class RuleScanner {
public:
	explicit RuleScanner(const std::string &text) : text_(text) {
	}

	bool atEnd() const {
		return pos_ >= text_.size();
	}

	char peek() const {
		return atEnd() ? '\0' : text_[pos_];
	}

	bool consume(char c) {
		if (peek() == c) {
			++pos_;
			return true;
		}
		return false;
	}

	bool readName() {
		if (consume('<')) {
			const auto close = text_.find('>', pos_);
			if (close == std::string::npos || close == pos_) {
				return false;
			}
			pos_ = close + 1;
			return true;
		}
		const auto start = pos_;
		while (!atEnd() && std::isalpha(static_cast<unsigned char>(peek()))) {
			++pos_;
		}
		return pos_ - start >= 3;
	}

	std::optional<int> readNumber(int max_digits) {
		int value = 0;
		int digits = 0;
		while (digits < max_digits && !atEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
			value = value * 10 + (peek() - '0');
			++pos_;
			++digits;
		}
		if (digits == 0) {
			return std::nullopt;
		}
		return value;
	}

	// [+|-]hh[:mm[:ss]], signed as written.
	std::optional<std::int64_t> readClock(int max_hours) {
		std::int64_t sign = 1;
		if (consume('-')) {
			sign = -1;
		} else {
			consume('+');
		}
		const auto hours = readNumber(3);
		if (!hours || *hours > max_hours) {
			return std::nullopt;
		}
		std::int64_t seconds = *hours * kSecondsPerHour;
		if (consume(':')) {
			const auto minutes = readNumber(2);
			if (!minutes || *minutes > 59) {
				return std::nullopt;
			}
			seconds += *minutes * 60;
			if (consume(':')) {
				const auto secs = readNumber(2);
				if (!secs || *secs > 59) {
					return std::nullopt;
				}
				seconds += *secs;
			}
		}
		return sign * seconds;
	}

	bool startsClock() const {
		const char c = peek();
		return c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c));
	}

	std::optional<PosixZoneRule::Transition> readTransition() {
		using Form = PosixZoneRule::Transition::Form;
		PosixZoneRule::Transition transition;
		if (consume('J')) {
			const auto day = readNumber(3);
			if (!day || *day < 1 || *day > 365) {
				return std::nullopt;
			}
			transition.form = Form::Julian;
			transition.day = *day;
		} else if (consume('M')) {
			const auto month = readNumber(2);
			if (!month || *month < 1 || *month > 12 || !consume('.')) {
				return std::nullopt;
			}
			const auto week = readNumber(1);
			if (!week || *week < 1 || *week > 5 || !consume('.')) {
				return std::nullopt;
			}
			const auto weekday = readNumber(1);
			if (!weekday || *weekday > 6) {
				return std::nullopt;
			}
			transition.form = Form::MonthWeekDay;
			transition.month = *month;
			transition.week = *week;
			transition.day = *weekday;
		} else {
			const auto day = readNumber(3);
			if (!day || *day > 365) {
				return std::nullopt;
			}
			transition.form = Form::ZeroBasedDay;
			transition.day = *day;
		}
		if (consume('/')) {
			const auto time = readClock(167);
			if (!time) {
				return std::nullopt;
			}
			transition.time = *time;
		}
		return transition;
	}

private:
	const std::string &text_;
	std::size_t pos_ = 0;
};

/**
 * Big-endian reader over the TZif bytes.
 */
class ByteReader {
public:
	explicit ByteReader(const std::string &bytes) : bytes_(bytes) {
	}

	bool has(std::size_t count) const {
		return pos_ + count <= bytes_.size();
	}

	void skip(std::size_t count) {
		pos_ += count;
	}

	std::int64_t readSigned(std::size_t width) {
		std::uint64_t value = 0;
		for (std::size_t i = 0; i < width; ++i) {
			value = (value << 8) | static_cast<unsigned char>(bytes_[pos_ + i]);
		}
		pos_ += width;
		if (width < 8 && (value & (std::uint64_t(1) << (width * 8 - 1)))) {
			value |= ~((std::uint64_t(1) << (width * 8)) - 1);
		}
		return static_cast<std::int64_t>(value);
	}

	std::uint8_t readByte() {
		return static_cast<std::uint8_t>(bytes_[pos_++]);
	}

	std::string rest() const {
		return bytes_.substr(pos_);
	}

private:
	const std::string &bytes_;
	std::size_t pos_ = 0;
};

struct TzifCounts {
	std::uint32_t isut = 0;
	std::uint32_t isstd = 0;
	std::uint32_t leap = 0;
	std::uint32_t time = 0;
	std::uint32_t type = 0;
	std::uint32_t chars = 0;

	std::size_t dataSize(std::size_t time_width) const {
		return time * time_width + time + type * 6 + chars + leap * (time_width + 4) + isstd + isut;
	}
};

std::optional<TzifCounts> readHeader(ByteReader &reader, char &version) {
	if (!reader.has(kHeaderSize)) {
		return std::nullopt;
	}
	const char magic[] = {'T', 'Z', 'i', 'f'};
	for (char expected : magic) {
		if (static_cast<char>(reader.readByte()) != expected) {
			return std::nullopt;
		}
	}
	version = static_cast<char>(reader.readByte());
	reader.skip(15);
	TzifCounts counts;
	counts.isut = static_cast<std::uint32_t>(reader.readSigned(4));
	counts.isstd = static_cast<std::uint32_t>(reader.readSigned(4));
	counts.leap = static_cast<std::uint32_t>(reader.readSigned(4));
	counts.time = static_cast<std::uint32_t>(reader.readSigned(4));
	counts.type = static_cast<std::uint32_t>(reader.readSigned(4));
	counts.chars = static_cast<std::uint32_t>(reader.readSigned(4));
	if (counts.type == 0) {
		return std::nullopt;
	}
	return counts;
}

} // namespace

std::int64_t PosixZoneRule::Transition::wallSeconds(int year) const {
	CivilDate date{year, 1, 1};
	std::int64_t days = date.toDays();
	switch (form) {
	case Form::Julian:
		days += day - 1;
		if (isLeapYear(year) && day >= 60) {
			++days;
		}
		break;
	case Form::ZeroBasedDay:
		days += day;
		break;
	case Form::MonthWeekDay: {
		const std::int64_t first = CivilDate{year, month, 1}.toDays();
		// 1970-01-01 was a Thursday.
		const std::int64_t first_weekday = ((first + 4) % 7 + 7) % 7;
		std::int64_t mday = 1 + (day - first_weekday + 7) % 7 + (week - 1) * 7;
		while (mday > daysInMonth(year, month)) {
			mday -= 7;
		}
		days = first + mday - 1;
		break;
	}
	}
	return days * kSecondsPerDay + time;
}

Outcome<PosixZoneRule> PosixZoneRule::parse(const std::string &text) {
	const auto malformed = [&text]() {
		return Outcome<PosixZoneRule>::failure(ErrorKind::DataSource, "Malformed TZ rule '" + text + "'.");
	};

	RuleScanner scanner(text);
	PosixZoneRule rule;
	if (!scanner.readName()) {
		return malformed();
	}
	const auto std_clock = scanner.readClock(24);
	if (!std_clock) {
		return malformed();
	}
	rule.std_offset = -*std_clock;
	if (scanner.atEnd()) {
		return Outcome<PosixZoneRule>::success(rule);
	}

	if (!scanner.readName()) {
		return malformed();
	}
	rule.has_dst = true;
	rule.dst_offset = rule.std_offset + kSecondsPerHour;
	if (scanner.startsClock()) {
		const auto dst_clock = scanner.readClock(24);
		if (!dst_clock) {
			return malformed();
		}
		rule.dst_offset = -*dst_clock;
	}

	if (scanner.atEnd()) {
		rule.dst_start.month = 3;
		rule.dst_start.week = 2;
		rule.dst_end.month = 11;
		rule.dst_end.week = 1;
		return Outcome<PosixZoneRule>::success(rule);
	}
	if (!scanner.consume(',')) {
		return malformed();
	}
	const auto start = scanner.readTransition();
	if (!start || !scanner.consume(',')) {
		return malformed();
	}
	const auto end = scanner.readTransition();
	if (!end || !scanner.atEnd()) {
		return malformed();
	}
	rule.dst_start = *start;
	rule.dst_end = *end;
	return Outcome<PosixZoneRule>::success(rule);
}

std::int64_t PosixZoneRule::offsetAt(std::int64_t epoch_seconds) const {
	if (!has_dst) {
		return std_offset;
	}
	const int year = CivilDate::fromDays(floorDiv(epoch_seconds + std_offset, kSecondsPerDay)).year;
	// The start is written in standard time, the end in daylight time.
	const std::int64_t start = dst_start.wallSeconds(year) - std_offset;
	const std::int64_t end = dst_end.wallSeconds(year) - dst_offset;
	if (start < end) {
		return (epoch_seconds >= start && epoch_seconds < end) ? dst_offset : std_offset;
	}
	// Southern hemisphere: daylight time spans the new year.
	return (epoch_seconds >= end && epoch_seconds < start) ? std_offset : dst_offset;
}

ZoneRules ZoneRules::fixed(std::int64_t offset_seconds) {
	ZoneRules rules;
	rules.initial_offset_ = offset_seconds;
	return rules;
}

Outcome<ZoneRules> ZoneRules::parse(const std::string &bytes) {
	const auto malformed = [](const std::string &detail) {
		return Outcome<ZoneRules>::failure(ErrorKind::DataSource, "Malformed TZif data: " + detail + ".");
	};

	ByteReader reader(bytes);
	char version = '\0';
	auto counts = readHeader(reader, version);
	if (!counts) {
		return malformed("bad header");
	}
	std::size_t time_width = 4;
	if (version != '\0') {
		// Version 2+ repeats the data with 64-bit times; the 32-bit block is skipped.
		if (!reader.has(counts->dataSize(4))) {
			return malformed("truncated version 1 block");
		}
		reader.skip(counts->dataSize(4));
		counts = readHeader(reader, version);
		if (!counts) {
			return malformed("bad second header");
		}
		time_width = 8;
	}
	if (!reader.has(counts->dataSize(time_width))) {
		return malformed("truncated data block");
	}

	std::vector<std::int64_t> times(counts->time);
	for (auto &time : times) {
		time = reader.readSigned(time_width);
	}
	std::vector<std::uint8_t> indices(counts->time);
	for (auto &index : indices) {
		index = reader.readByte();
		if (index >= counts->type) {
			return malformed("transition type out of range");
		}
	}
	std::vector<std::int64_t> type_offsets(counts->type);
	for (auto &offset : type_offsets) {
		offset = reader.readSigned(4);
		reader.skip(2);
	}
	reader.skip(counts->chars + counts->leap * (time_width + 4) + counts->isstd + counts->isut);

	ZoneRules rules;
	rules.initial_offset_ = type_offsets.front();
	rules.transitions_ = std::move(times);
	rules.offsets_after_.reserve(indices.size());
	for (const auto index : indices) {
		rules.offsets_after_.push_back(type_offsets[index]);
	}
	if (!std::is_sorted(rules.transitions_.begin(), rules.transitions_.end())) {
		return malformed("transitions out of order");
	}

	if (time_width == 8) {
		const std::string footer = reader.rest();
		if (footer.size() < 2 || footer.front() != '\n') {
			return malformed("missing footer");
		}
		const auto close = footer.find('\n', 1);
		if (close == std::string::npos) {
			return malformed("unterminated footer");
		}
		const std::string tz = footer.substr(1, close - 1);
		if (!tz.empty()) {
			auto rule = PosixZoneRule::parse(tz);
			if (!rule) {
				return rule.propagate<ZoneRules>();
			}
			rules.footer_ = std::move(rule).value();
			rules.has_footer_ = true;
		}
	}
	return Outcome<ZoneRules>::success(std::move(rules));
}

Outcome<ZoneRules> ZoneRules::readFile(const std::string &path) {
	std::ifstream file(path, std::ios::binary);
	if (!file.is_open()) {
		return Outcome<ZoneRules>::failure(ErrorKind::DataSource, "Cannot open zone file: " + path);
	}
	const std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
	auto rules = parse(bytes);
	if (!rules) {
		return Outcome<ZoneRules>::failure(ErrorKind::DataSource, path + ": " + rules.error().message);
	}
	return rules;
}

std::int64_t ZoneRules::offsetAt(std::int64_t epoch_seconds) const {
	if (transitions_.empty()) {
		return has_footer_ ? footer_.offsetAt(epoch_seconds) : initial_offset_;
	}
	if (epoch_seconds < transitions_.front()) {
		return initial_offset_;
	}
	if (has_footer_ && epoch_seconds >= transitions_.back()) {
		return footer_.offsetAt(epoch_seconds);
	}
	const auto it = std::upper_bound(transitions_.begin(), transitions_.end(), epoch_seconds);
	return offsets_after_[static_cast<std::size_t>(std::distance(transitions_.begin(), it)) - 1];
}

} // namespace kwhflow::core
