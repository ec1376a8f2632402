#pragma once

#include "campus-energy/aggregate/aggregator.hpp"
#include "campus-energy/ingest/ingestor.hpp"
#include "campus-energy/ledger/ledger_registry.hpp"
#include "campus-energy/report/dashboard_views.hpp"
#include "campus-energy/summary/summary_builder.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace campusenergy {

struct PipelineConfig {
	std::filesystem::path data_dir = "data";
	std::filesystem::path output_dir = ".";
	std::size_t histogram_bins = 20;
	bool generate_sample_if_missing = true;
	std::uint32_t sample_seed = 42;
};

/**
 * @brief Everything derived from a non-empty canonical dataset.
 */
struct Analytics {
	aggregate::AggregationResult aggregation;
	report::DashboardViews views;
	summary::SummaryReport summary_report;
	std::vector<ledger::LedgerReport> ledger_reports;
};

struct PipelineResult {
	ingest::IngestionResult ingestion;
	ledger::LedgerRegistry registry;
	std::optional<Analytics> analytics; // empty: insufficient data

	bool hasData() const {
		return analytics.has_value();
	}

	std::optional<summary::SummaryReport> summaryReport() const {
		if (!analytics) {
			return std::nullopt;
		}
		return analytics->summary_report;
	}

	std::string summaryText() const;
};

/**
 * @class Pipeline
 * @brief One batch run: ingest, aggregate, populate ledgers, summarise.
 *
 * Analytics start only after ingestion has finished. When no valid record
 * survives ingestion the analytics path stops and the result carries the
 * insufficient-data outcome.
 */
class Pipeline {
public:
	explicit Pipeline(PipelineConfig config);

	const PipelineConfig &config() const {
		return config_;
	}

	/**
	 * @brief Discovers the CSV sources of the data directory (generating
	 * sample data first when configured and the directory is missing) and
	 * analyses them.
	 */
	PipelineResult run() const;

	/**
	 * @brief Runs ingestion and analysis over explicit sources.
	 */
	PipelineResult run(const std::vector<std::shared_ptr<ingest::IRowSource>> &sources) const;

	/**
	 * @brief Writes the result files into the output directory. With
	 * insufficient data only the summary text is written.
	 */
	std::vector<std::filesystem::path> exportResults(const PipelineResult &result) const;

	/**
	 * @brief Checks that each ledger total equals the matching summary-table
	 * sum and that both views know the same buildings.
	 * @throws std::logic_error On any disagreement.
	 */
	static void reconcile(const ledger::LedgerRegistry &registry, const aggregate::BuildingSummaryTable &table);

private:
	PipelineConfig config_;
};

} // namespace campusenergy
