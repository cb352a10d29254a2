#include "kwhflow/ingest/sheet_reader.hpp"
#include "kwhflow/utils/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace kwhflow::ingest {

namespace {

using Result = core::Outcome<core::WideTable>;

std::string trimField(std::string field) {
	field.erase(0, field.find_first_not_of(" \t\r\n"));
	const auto last = field.find_last_not_of(" \t\r\n");
	if (last == std::string::npos) {
		return {};
	}
	field.erase(last + 1);
	return field;
}

bool parseNumber(const std::string &text, double &out) {
	if (text.empty()) {
		return false;
	}
	std::string cleaned;
	cleaned.reserve(text.size());
	for (char c : text) {
		// Thousands separators appear in spreadsheet exports.
		if (c != ',') {
			cleaned.push_back(c);
		}
	}
	char *end = nullptr;
	errno = 0;
	const double value = std::strtod(cleaned.c_str(), &end);
	if (errno != 0 || end == cleaned.c_str() || *end != '\0') {
		return false;
	}
	// strtod also accepts nan, inf and hex floats; readings are plain decimals.
	if (!std::isfinite(value) || cleaned.find_first_of("xX") != std::string::npos) {
		return false;
	}
	out = value;
	return true;
}

bool isBlank(const std::string &line) {
	return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

std::vector<std::string> SheetReader::splitLine(const std::string &line, char delimiter) {
	std::vector<std::string> fields;
	std::string current;
	bool in_quotes = false;
	for (std::size_t i = 0; i < line.size(); ++i) {
		const char c = line[i];
		if (in_quotes) {
			if (c == '"') {
				if (i + 1 < line.size() && line[i + 1] == '"') {
					current.push_back('"');
					++i;
				} else {
					in_quotes = false;
				}
			} else {
				current.push_back(c);
			}
		} else if (c == '"') {
			in_quotes = true;
		} else if (c == delimiter) {
			fields.push_back(trimField(std::move(current)));
			current.clear();
		} else {
			current.push_back(c);
		}
	}
	fields.push_back(trimField(std::move(current)));
	return fields;
}

bool SheetReader::isTimeOfDayHeader(const std::string &header) {
	return header.find("AM") != std::string::npos || header.find("PM") != std::string::npos;
}

Result SheetReader::read(std::istream &input, const CsvOptions &options) {
	std::string line;
	std::vector<std::string> header;
	while (std::getline(input, line)) {
		if (!isBlank(line)) {
			header = splitLine(line, options.delimiter);
			break;
		}
	}
	if (header.empty()) {
		return Result::failure(core::ErrorKind::DataSource, "Sheet is empty or missing its header row.");
	}

	const auto date_it = std::find(header.begin(), header.end(), options.date_column);
	if (date_it == header.end()) {
		return Result::failure(core::ErrorKind::DataSource,
		                       "Sheet header has no '" + options.date_column + "' column.");
	}
	const auto date_index = static_cast<std::size_t>(std::distance(header.begin(), date_it));

	std::vector<std::size_t> time_indices;
	std::vector<std::string> time_columns;
	for (std::size_t i = 0; i < header.size(); ++i) {
		if (i != date_index && isTimeOfDayHeader(header[i])) {
			time_indices.push_back(i);
			time_columns.push_back(header[i]);
		}
	}

	core::WideTable table(std::move(time_columns));
	std::size_t line_number = 1;
	while (std::getline(input, line)) {
		++line_number;
		if (isBlank(line)) {
			continue;
		}
		const auto fields = splitLine(line, options.delimiter);
		if (fields.size() != header.size()) {
			return Result::failure(core::ErrorKind::DataSource,
			                       "Line " + std::to_string(line_number) + " has " +
			                           std::to_string(fields.size()) + " fields, header has " +
			                           std::to_string(header.size()) + ".");
		}
		const auto date = core::CivilDate::parseUs(fields[date_index]);
		if (!date) {
			return Result::failure(core::ErrorKind::DataSource, "Line " + std::to_string(line_number) +
			                                                        ": cannot parse date '" +
			                                                        fields[date_index] + "' as MM/DD/YYYY.");
		}
		std::vector<double> row;
		row.reserve(time_indices.size());
		for (const auto index : time_indices) {
			double value = 0.0;
			if (!parseNumber(fields[index], value)) {
				return Result::failure(core::ErrorKind::DataSource,
				                       "Line " + std::to_string(line_number) + ": value '" + fields[index] +
				                           "' in column '" + header[index] + "' is not numeric.");
			}
			row.push_back(value);
		}
		table.addRow(*date, std::move(row));
	}

	return Result::success(std::move(table));
}

Result SheetReader::readFile(const std::string &path, const CsvOptions &options) {
	std::ifstream file(path);
	if (!file.is_open()) {
		return Result::failure(core::ErrorKind::DataSource, "Cannot open sheet file: " + path);
	}
	auto result = read(file, options);
	if (!result) {
		return Result::failure(core::ErrorKind::DataSource, path + ": " + result.error().message);
	}
	return result;
}

core::Outcome<core::RawImport> SheetReader::readDirectory(const std::string &directory, const CsvOptions &options) {
	using ImportResult = core::Outcome<core::RawImport>;

	std::error_code ec;
	if (!std::filesystem::is_directory(directory, ec)) {
		return ImportResult::failure(core::ErrorKind::DataSource, "Not a directory: " + directory);
	}

	std::vector<std::filesystem::path> files;
	for (const auto &entry : std::filesystem::directory_iterator(directory, ec)) {
		if (entry.is_regular_file(ec) && entry.path().extension() == ".csv") {
			files.push_back(entry.path());
		}
	}
	if (ec) {
		return ImportResult::failure(core::ErrorKind::DataSource,
		                             "Cannot list " + directory + ": " + ec.message());
	}
	std::sort(files.begin(), files.end());

	core::RawImport raw;
	for (const auto &file : files) {
		auto table = readFile(file.string(), options);
		if (!table) {
			return table.propagate<core::RawImport>();
		}
		KWHFLOW_DEBUG("Loaded sheet '{}' with {} rows", file.stem().string(), table.value().rows());
		raw.sheets.emplace(file.stem().string(), std::move(table).value());
	}
	return ImportResult::success(std::move(raw));
}

} // namespace kwhflow::ingest
