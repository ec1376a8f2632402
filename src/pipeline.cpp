#include "campus-energy/pipeline.hpp"

#include "campus-energy/ingest/csv_source.hpp"
#include "campus-energy/report/exporter.hpp"
#include "campus-energy/report/summary_text.hpp"
#include "campus-energy/utils/logging.hpp"
#include "campus-energy/utils/sample_data.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <system_error>

namespace campusenergy {

std::string PipelineResult::summaryText() const {
	return report::renderSummary(summaryReport(), ingestion.report);
}

Pipeline::Pipeline(PipelineConfig config) : config_(std::move(config)) {
	if (config_.histogram_bins == 0) {
		throw std::invalid_argument("Histogram bin count must be positive.");
	}
}

PipelineResult Pipeline::run() const {
	std::error_code ec;
	if (!std::filesystem::exists(config_.data_dir, ec) && config_.generate_sample_if_missing) {
		CAMPUS_WARN("{} directory not found. Creating sample data for demonstration.", config_.data_dir.string());
		utils::SampleDataConfig sample;
		sample.seed = config_.sample_seed;
		utils::generateSampleData(config_.data_dir, sample);
	}
	return run(ingest::discoverCsvSources(config_.data_dir));
}

PipelineResult Pipeline::run(const std::vector<std::shared_ptr<ingest::IRowSource>> &sources) const {
	PipelineResult result;
	result.ingestion = ingest::IngestorBuilder().withSources(sources).build().ingest();

	const auto &dataset = result.ingestion.dataset;
	if (dataset.isEmpty()) {
		CAMPUS_WARN("No valid data after ingestion; derived outputs are replaced by the insufficient-data marker.");
		return result;
	}

	Analytics analytics;
	analytics.aggregation = aggregate::Aggregator::aggregate(dataset);

	result.registry.populate(dataset);
	reconcile(result.registry, analytics.aggregation.building_summary);
	analytics.ledger_reports = result.registry.allReports().collect();

	analytics.views = report::DashboardViewBuilder().withHistogramBins(config_.histogram_bins).build(dataset);

	auto headline = summary::SummaryBuilder::build(dataset, analytics.aggregation.building_summary,
	                                               analytics.aggregation.weekly_totals);
	if (!headline) {
		throw std::logic_error("Summary missing for a non-empty dataset.");
	}
	analytics.summary_report = std::move(*headline);

	result.analytics = std::move(analytics);
	return result;
}

std::vector<std::filesystem::path> Pipeline::exportResults(const PipelineResult &result) const {
	report::Exporter exporter(config_.output_dir);
	std::vector<std::filesystem::path> written;
	if (result.analytics) {
		written.push_back(exporter.writeCleanedDataset(result.ingestion.dataset));
		written.push_back(exporter.writeBuildingSummary(result.analytics->aggregation.building_summary));
		const auto dashboard = exporter.writeDashboard(result.analytics->views);
		written.insert(written.end(), dashboard.begin(), dashboard.end());
	}
	written.push_back(exporter.writeSummaryText(result.summaryText()));
	CAMPUS_INFO("Exported {} files to {}", written.size(), config_.output_dir.string());
	return written;
}

void Pipeline::reconcile(const ledger::LedgerRegistry &registry, const aggregate::BuildingSummaryTable &table) {
	if (registry.size() != table.size()) {
		throw std::logic_error("Ledger registry holds " + std::to_string(registry.size()) +
		                       " buildings but the summary table holds " + std::to_string(table.size()) + ".");
	}
	for (const auto &[building, stats] : table) {
		const auto *ledger = registry.find(building);
		if (ledger == nullptr) {
			throw std::logic_error("Building '" + building + "' has no ledger.");
		}
		const double total = ledger->totalConsumption();
		const double tolerance = 1e-9 * std::max(1.0, std::abs(stats.sum));
		if (std::abs(total - stats.sum) > tolerance || ledger->size() != stats.count) {
			throw std::logic_error("Ledger total for '" + building + "' disagrees with the building summary.");
		}
	}
}

} // namespace campusenergy
