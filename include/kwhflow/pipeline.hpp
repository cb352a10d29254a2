#pragma once

#include "kwhflow/core/outcome.hpp"
#include "kwhflow/core/time_zone.hpp"
#include "kwhflow/core/usage_types.hpp"
#include "kwhflow/ingest/sheet_validator.hpp"
#include "kwhflow/statistics/merger.hpp"
#include "kwhflow/statistics/statistics_store.hpp"
#include "kwhflow/transform/dst_resolver.hpp"
#include "kwhflow/transform/hourly_aggregator.hpp"

#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace kwhflow {

/**
 * @brief Settings of one usage pipeline.
 */
struct PipelineConfig {
	std::string timezone = "America/New_York";
	ingest::SheetNames sheets;
	double conservation_tolerance = transform::kDefaultConservationTolerance;
	transform::AmbiguousTimePolicy ambiguous_policy = transform::kDefaultAmbiguousTimePolicy;
	statistics::MergeOptions merge;

	/**
	 * @brief Throws std::invalid_argument on empty zone or sheet names, a
	 * non-positive tolerance or a negative correction window.
	 */
	void validate() const;
};

/**
 * @brief Non-fatal observations collected during a run.
 */
struct PipelineDiagnostics {
	// Latest days dropped as incomplete, power sheet first.
	std::vector<core::CivilDate> trimmed_dates;
	std::vector<core::CivilDateTime> dst_dropped;
	std::size_t ambiguous = 0;
	std::size_t unmatched = 0;
};

struct PipelineReport {
	core::UsageTable entity_table;
	std::vector<core::HourlyBucket> hourly;
	statistics::MergeResult merge;
	PipelineDiagnostics diagnostics;
};

/**
 * @class UsagePipeline
 * @brief Turns one usage export into the entity table and the merged
 * cumulative statistics of an account.
 *
 * Stages run strictly in order (validate, trim, reshape, resolve DST, join,
 * aggregate, merge) and the first failing stage ends the run with its error.
 * Nothing is written to the store unless every earlier stage succeeded.
 */
class UsagePipeline {
public:
	/**
	 * @brief Validates the configuration and loads its time zone.
	 * @return DataSource error for an unknown zone.
	 */
	static core::Outcome<UsagePipeline> create(PipelineConfig config,
	                                           std::shared_ptr<statistics::IStatisticsStore> store);

	/**
	 * @brief Runs the stages up to and including the hourly aggregation.
	 *
	 * The merge field of the report is left empty.
	 */
	core::Outcome<PipelineReport> transform(const core::RawImport &raw) const;

	core::Outcome<PipelineReport> run(const core::RawImport &raw, const statistics::StatisticIdentity &identity);

	/**
	 * @brief Runs on a worker thread. The pipeline must outlive the future.
	 */
	std::future<core::Outcome<PipelineReport>> runAsync(core::RawImport raw, statistics::StatisticIdentity identity);

	const PipelineConfig &config() const {
		return config_;
	}

	const core::TimeZone &zone() const {
		return zone_;
	}

private:
	UsagePipeline(PipelineConfig config, core::TimeZone zone, std::shared_ptr<statistics::IStatisticsStore> store);

	PipelineConfig config_;
	core::TimeZone zone_;
	std::unique_ptr<statistics::StatisticsMerger> merger_;
};

} // namespace kwhflow
