#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "campus-energy/pipeline.hpp"
#include "campus-energy/report/exporter.hpp"
#include "campus-energy/report/summary_text.hpp"
#include "common/energy_fixtures.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using campusenergy::Pipeline;
using campusenergy::PipelineConfig;
using campusenergy::aggregate::Aggregator;
using campusenergy::core::CanonicalDataset;
using campusenergy::ingest::DiagnosticKind;
using campusenergy::ledger::LedgerRegistry;
using campusenergy::report::Exporter;
using tests::helpers::TempDir;
using tests::helpers::at;
using tests::helpers::raw;
using tests::helpers::readLines;
using tests::helpers::record;

namespace {

bool contains(const std::string &text, const std::string &needle) {
	return text.find(needle) != std::string::npos;
}

std::vector<std::string> fileNames(const std::vector<std::filesystem::path> &paths) {
	std::vector<std::string> names;
	for (const auto &path : paths) {
		names.push_back(path.filename().string());
	}
	return names;
}

} // namespace

TEST_CASE("Pipeline analyses one constant week end to end", "[integration][pipeline]") {
	const Pipeline pipeline(PipelineConfig{});
	const auto result = pipeline.run(tests::helpers::constantWeekSources());

	REQUIRE(result.hasData());
	const auto &analytics = *result.analytics;
	REQUIRE(analytics.aggregation.daily_totals.size() == 7);
	REQUIRE(analytics.aggregation.weekly_totals.total() == Catch::Approx(4200.0));

	REQUIRE(analytics.ledger_reports.size() == 3);
	for (const auto &report : analytics.ledger_reports) {
		REQUIRE(report.total == Catch::Approx(1400.0));
		REQUIRE(report.average == Catch::Approx(200.0));
	}

	const auto summary = result.summaryReport();
	REQUIRE(summary.has_value());
	REQUIRE(summary->total_campus_kwh == Catch::Approx(4200.0));
	REQUIRE(summary->highest_consuming_building == "Library");
	REQUIRE(summary->peak_load_timestamp == at(2023, 1, 2));

	REQUIRE(analytics.views.kwh_histogram.size() == 20);
	REQUIRE(contains(result.summaryText(), "Total Campus Consumption: 4200 KWH"));
}

TEST_CASE("Pipeline keeps ledgers and summary table in agreement", "[integration][pipeline][reconcile]") {
	const Pipeline pipeline(PipelineConfig{});
	const auto result = pipeline.run(tests::helpers::randomSources(3));
	REQUIRE(result.hasData());

	const auto &table = result.analytics->aggregation.building_summary;
	REQUIRE(result.registry.buildingNames() == std::vector<std::string>{"Gym", "Lab", "Hall"});
	for (const auto &[building, stats] : table) {
		REQUIRE(result.registry.find(building)->totalConsumption() == Catch::Approx(stats.sum));
	}
	REQUIRE_NOTHROW(Pipeline::reconcile(result.registry, table));
}

TEST_CASE("Pipeline::reconcile detects disagreement", "[integration][pipeline][reconcile]") {
	const CanonicalDataset dataset({record(at(2023, 1, 2), "A", 10.0), record(at(2023, 1, 3), "B", 5.0)});
	const auto table = Aggregator::buildingSummary(dataset);

	LedgerRegistry drifted;
	drifted.populate(dataset);
	drifted.recordReading("A", at(2023, 1, 4), 1.0);
	REQUIRE_THROWS_AS(Pipeline::reconcile(drifted, table), std::logic_error);

	LedgerRegistry extra;
	extra.populate(dataset);
	extra.addBuilding("C");
	REQUIRE_THROWS_AS(Pipeline::reconcile(extra, table), std::logic_error);

	LedgerRegistry renamed;
	renamed.recordReading("A", at(2023, 1, 2), 10.0);
	renamed.recordReading("Z", at(2023, 1, 3), 5.0);
	REQUIRE_THROWS_AS(Pipeline::reconcile(renamed, table), std::logic_error);
}

TEST_CASE("Pipeline reports insufficient data when nothing survives", "[integration][pipeline][empty]") {
	TempDir dir("pipeline-empty");
	PipelineConfig config;
	config.output_dir = dir.path();
	const Pipeline pipeline(config);

	const auto result = pipeline.run(
	    {tests::helpers::memorySource("bad", {raw(std::string("yesterday"), std::string("1")),
	                                          raw(std::string("2023-01-01"), std::string("-4"))})});

	REQUIRE_FALSE(result.hasData());
	REQUIRE_FALSE(result.summaryReport().has_value());
	REQUIRE(result.registry.isEmpty());
	REQUIRE(result.ingestion.report.count(DiagnosticKind::ValidationFailure) == 2);

	const auto text = result.summaryText();
	REQUIRE(contains(text, campusenergy::report::kInsufficientData));
	REQUIRE(contains(text, "ValidationFailure [bad:2]"));

	const auto written = pipeline.exportResults(result);
	REQUIRE(fileNames(written) == std::vector<std::string>{Exporter::kSummaryFile});
	REQUIRE_FALSE(std::filesystem::exists(dir.path() / Exporter::kCleanedDataFile));
}

TEST_CASE("Pipeline runs over a data directory and exports every file", "[integration][pipeline][files]") {
	TempDir dir("pipeline-files");
	dir.write("hall.csv", "Date,KWH\n"
	                      "2023-03-06 08:00,150\n"
	                      "2023-03-07 08:00,NaN\n"
	                      "2023-03-08 08:00,90,oops\n");
	dir.write("gym.csv", "Date,Building,KWH\n"
	                     "2023-03-06,Gym,40\n"
	                     "2023-03-13,Gym,60\n");
	dir.write("broken.csv", "Timestamp,Value\n1,2\n");

	PipelineConfig config;
	config.data_dir = dir.path();
	config.output_dir = dir.path() / "out";
	config.generate_sample_if_missing = false;
	config.histogram_bins = 4;
	const Pipeline pipeline(config);

	const auto result = pipeline.run();
	REQUIRE(result.hasData());
	const auto &report = result.ingestion.report;
	REQUIRE(report.sources_total == 3);
	REQUIRE(report.sources_loaded == 2);
	REQUIRE(report.records_kept == 3);
	REQUIRE(report.count(DiagnosticKind::SourceUnavailable) == 1);
	REQUIRE(report.count(DiagnosticKind::RecordMalformed) == 1);
	REQUIRE(report.count(DiagnosticKind::ValidationFailure) == 1);

	// Files are discovered by name: broken, gym, hall.
	REQUIRE(result.registry.buildingNames() == std::vector<std::string>{"Gym", "hall"});
	REQUIRE(result.registry.find("gym") == nullptr);
	REQUIRE(result.registry.find("Gym")->size() == 2);
	REQUIRE(result.summaryReport()->highest_consuming_building == "hall");

	const auto written = pipeline.exportResults(result);
	REQUIRE(written.size() == 7);
	for (const auto &path : written) {
		REQUIRE(std::filesystem::exists(path));
	}

	const auto cleaned = readLines(config.output_dir / Exporter::kCleanedDataFile);
	REQUIRE(cleaned == std::vector<std::string>{"Date,Building,KWH,Month", "2023-03-06 00:00:00,Gym,40,3",
	                                            "2023-03-06 08:00:00,hall,150,3", "2023-03-13 00:00:00,Gym,60,3"});

	const auto summary = readLines(config.output_dir / Exporter::kSummaryFile);
	REQUIRE(summary.front() == "Campus Energy Usage Summary");
}

TEST_CASE("Pipeline generates sample data for a missing directory", "[integration][pipeline][sample]") {
	TempDir dir("pipeline-sample");
	PipelineConfig config;
	config.data_dir = dir.path() / "data";
	config.output_dir = dir.path();
	const Pipeline pipeline(config);

	const auto result = pipeline.run();
	REQUIRE(std::filesystem::exists(config.data_dir / "Library.csv"));
	REQUIRE(result.hasData());
	REQUIRE(result.ingestion.dataset.size() == 3 * 365);
	REQUIRE(result.ingestion.report.clean());
	REQUIRE(result.analytics->aggregation.daily_totals.size() == 365);

	PipelineConfig no_sample = config;
	no_sample.data_dir = dir.path() / "absent";
	no_sample.generate_sample_if_missing = false;
	const auto nothing = Pipeline(no_sample).run();
	REQUIRE_FALSE(nothing.hasData());
	REQUIRE_FALSE(std::filesystem::exists(no_sample.data_dir));
}

TEST_CASE("Pipeline rejects a zero histogram bin count", "[integration][pipeline][config]") {
	PipelineConfig config;
	config.histogram_bins = 0;
	REQUIRE_THROWS_AS(Pipeline(config), std::invalid_argument);
}
