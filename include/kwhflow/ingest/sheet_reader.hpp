#pragma once

#include "kwhflow/core/outcome.hpp"
#include "kwhflow/core/usage_types.hpp"

#include <istream>
#include <string>
#include <vector>

namespace kwhflow::ingest {

struct CsvOptions {
	char delimiter = ',';
	std::string date_column = "Date";
};

/**
 * @class SheetReader
 * @brief Loads usage export sheets saved as CSV into wide tables.
 *
 * The header must contain the date column; every header containing an AM or
 * PM marker becomes a time-of-day column. The upstream Total column and any
 * other column are ignored. Dates are read in MM/DD/YYYY form.
 */
class SheetReader {
public:
	SheetReader() = delete;

	static core::Outcome<core::WideTable> read(std::istream &input, const CsvOptions &options = {});

	static core::Outcome<core::WideTable> readFile(const std::string &path, const CsvOptions &options = {});

	/**
	 * @brief Loads every *.csv file in a directory, keyed by file stem.
	 */
	static core::Outcome<core::RawImport> readDirectory(const std::string &directory,
	                                                    const CsvOptions &options = {});

	static std::vector<std::string> splitLine(const std::string &line, char delimiter);

	static bool isTimeOfDayHeader(const std::string &header);
};

} // namespace kwhflow::ingest
