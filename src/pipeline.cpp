#include "kwhflow/pipeline.hpp"
#include "kwhflow/transform/incomplete_trimmer.hpp"
#include "kwhflow/transform/joiner.hpp"
#include "kwhflow/transform/long_format.hpp"
#include "kwhflow/utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace kwhflow {

namespace {

using Report = core::Outcome<PipelineReport>;

Report logFailure(const char *stage, const core::Error &error) {
	KWHFLOW_ERROR("Usage pipeline failed at {}: {}", stage, error.describe());
	return Report::failure(error);
}

} // namespace

void PipelineConfig::validate() const {
	if (timezone.empty()) {
		throw std::invalid_argument("PipelineConfig: timezone must not be empty.");
	}
	if (sheets.power.empty() || sheets.energy.empty()) {
		throw std::invalid_argument("PipelineConfig: sheet names must not be empty.");
	}
	if (sheets.power == sheets.energy) {
		throw std::invalid_argument("PipelineConfig: power and energy sheets must differ.");
	}
	if (!(conservation_tolerance > 0.0)) {
		throw std::invalid_argument("PipelineConfig: conservation tolerance must be positive.");
	}
	if (merge.correction_window_days < 0) {
		throw std::invalid_argument("PipelineConfig: correction window must not be negative.");
	}
}

UsagePipeline::UsagePipeline(PipelineConfig config, core::TimeZone zone,
                             std::shared_ptr<statistics::IStatisticsStore> store)
    : config_(std::move(config)), zone_(std::move(zone)),
      merger_(std::make_unique<statistics::StatisticsMerger>(std::move(store), zone_, config_.merge)) {
}

core::Outcome<UsagePipeline> UsagePipeline::create(PipelineConfig config,
                                                   std::shared_ptr<statistics::IStatisticsStore> store) {
	config.validate();
	auto zone = core::TimeZone::load(config.timezone);
	if (!zone) {
		return zone.propagate<UsagePipeline>();
	}
	return core::Outcome<UsagePipeline>::success(
	    UsagePipeline(std::move(config), std::move(zone).value(), std::move(store)));
}

core::Outcome<PipelineReport> UsagePipeline::transform(const core::RawImport &raw) const {
	PipelineReport report;

	auto sheets = ingest::validateSheets(raw, config_.sheets);
	if (!sheets) {
		return logFailure("sheet validation", sheets.error());
	}

	auto power_trim = transform::trimIncompleteDay(sheets.value().power);
	auto energy_trim = transform::trimIncompleteDay(sheets.value().energy);
	for (const auto *trim : {&power_trim, &energy_trim}) {
		if (trim->dropped_date) {
			report.diagnostics.trimmed_dates.push_back(*trim->dropped_date);
		}
	}

	auto power_long = transform::toLongFormat(power_trim.table, core::Metric::Power);
	if (!power_long) {
		return logFailure("reshaping the power sheet", power_long.error());
	}
	auto energy_long = transform::toLongFormat(energy_trim.table, core::Metric::Energy);
	if (!energy_long) {
		return logFailure("reshaping the energy sheet", energy_long.error());
	}

	const transform::DstResolver resolver(zone_, config_.ambiguous_policy);
	auto power = resolver.resolve(power_long.value());
	auto energy = resolver.resolve(energy_long.value());
	auto &diagnostics = report.diagnostics;
	diagnostics.dst_dropped = power.dropped;
	diagnostics.dst_dropped.insert(diagnostics.dst_dropped.end(), energy.dropped.begin(), energy.dropped.end());
	diagnostics.ambiguous = power.ambiguous + energy.ambiguous;

	const auto power_rows = power.readings.size();
	const auto energy_rows = energy.readings.size();
	report.entity_table = transform::joinPowerEnergy(std::move(power.readings), std::move(energy.readings));
	const auto joined = report.entity_table.size();
	diagnostics.unmatched = (power_rows > joined ? power_rows - joined : 0) +
	                        (energy_rows > joined ? energy_rows - joined : 0);
	if (diagnostics.unmatched > 0) {
		KWHFLOW_DEBUG("{} readings had no counterpart in the other sheet", diagnostics.unmatched);
	}

	const transform::HourlyAggregator aggregator(zone_, {config_.conservation_tolerance});
	auto hourly = aggregator.aggregate(report.entity_table);
	if (!hourly) {
		return logFailure("hourly aggregation", hourly.error());
	}
	report.hourly = std::move(hourly).value();

	KWHFLOW_DEBUG("Transformed {} interval rows into {} hourly buckets", report.entity_table.size(),
	              report.hourly.size());
	return Report::success(std::move(report));
}

core::Outcome<PipelineReport> UsagePipeline::run(const core::RawImport &raw,
                                                 const statistics::StatisticIdentity &identity) {
	auto transformed = transform(raw);
	if (!transformed) {
		return transformed;
	}
	auto report = std::move(transformed).value();

	auto merged = merger_->merge(identity, report.hourly);
	if (!merged) {
		return logFailure("statistics merge", merged.error());
	}
	report.merge = std::move(merged).value();
	return Report::success(std::move(report));
}

std::future<core::Outcome<PipelineReport>> UsagePipeline::runAsync(core::RawImport raw,
                                                                   statistics::StatisticIdentity identity) {
	return std::async(std::launch::async, [this, raw = std::move(raw), identity = std::move(identity)]() {
		return run(raw, identity);
	});
}

} // namespace kwhflow
