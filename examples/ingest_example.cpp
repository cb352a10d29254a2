#include "kwhflow/ingest/sheet_reader.hpp"
#include "kwhflow/pipeline.hpp"
#include "kwhflow/statistics/in_memory_store.hpp"
#include "kwhflow/summary/usage_summary.hpp"
#include "kwhflow/utils/logging.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace kwhflow;

namespace {

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printDaily(const summary::DailyUsage &day) {
	std::cout << "  " << day.date.toIsoString() << " | " << std::fixed << std::setprecision(3) << std::setw(9)
	          << day.total_energy_kwh << " kWh | avg " << std::setw(7) << day.avg_power_kw << " kW | peak "
	          << std::setw(7) << day.peak_power_kw << " kW\n";
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main(int argc, char **argv) {
	if (argc < 3) {
		std::cerr << "usage: " << argv[0] << " <sheet-directory> <account-id> [time-zone]\n";
		std::cerr << "  The directory must hold 'kW Usage Data.csv' and 'kWH Usage Data.csv'.\n";
		return 2;
	}

	utils::Logging::init(spdlog::level::info);

	PipelineConfig config;
	if (argc > 3) {
		config.timezone = argv[3];
	}

	auto raw = ingest::SheetReader::readDirectory(argv[1]);
	if (!raw) {
		std::cerr << raw.error().describe() << "\n";
		return 1;
	}

	auto store = std::make_shared<statistics::InMemoryStatisticsStore>();
	auto pipeline = UsagePipeline::create(config, store);
	if (!pipeline) {
		std::cerr << pipeline.error().describe() << "\n";
		return 1;
	}

	statistics::StatisticIdentity identity;
	identity.account_id = argv[2];

	auto report = pipeline.value().run(raw.value(), identity);
	if (!report) {
		std::cerr << report.error().describe() << "\n";
		return 1;
	}
	const auto &result = report.value();
	const auto &zone = pipeline.value().zone();

	printHeader("Pipeline");
	std::cout << "  Interval rows:     " << result.entity_table.size() << "\n";
	std::cout << "  Hourly buckets:    " << result.hourly.size() << "\n";
	std::cout << "  DST dropped rows:  " << result.diagnostics.dst_dropped.size() << "\n";
	for (const auto &date : result.diagnostics.trimmed_dates) {
		std::cout << "  Trimmed day:       " << date.toIsoString() << "\n";
	}
	std::cout << "  Points written:    " << result.merge.points.size() << " to " << identity.key() << "\n";
	if (!result.merge.points.empty()) {
		const auto &last = result.merge.points.back();
		std::cout << "  Last point:        " << core::formatUtc(last.start) << " sum " << std::fixed
		          << std::setprecision(3) << last.sum << " kWh\n";
		std::cout.unsetf(std::ios::floatfield);
	}

	if (const auto daily = summary::DailyStats::fromTable(result.entity_table, zone)) {
		printHeader("Latest day");
		printDaily(daily->usage);
		std::cout << "  Peak at " << zone.toLocal(daily->peak_power.timestamp).toString() << " ("
		          << daily->data_points << " readings)\n";
	}

	if (const auto weekly = summary::WeeklyAnalysis::fromTable(result.entity_table, zone)) {
		printHeader("Last seven days");
		for (const auto &day : weekly->daily_totals) {
			printDaily(day);
		}
		std::cout << "  Total " << std::fixed << std::setprecision(3) << weekly->total_energy_kwh
		          << " kWh, daily mean " << weekly->avg_daily_energy_kwh << " kWh\n";
		std::cout.unsetf(std::ios::floatfield);
	}

	return 0;
}
