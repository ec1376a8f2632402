#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "campus-energy/ingest/csv_source.hpp"
#include "campus-energy/ingest/ingestor.hpp"
#include "common/energy_fixtures.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace campusenergy::ingest;
using tests::helpers::at;
using tests::helpers::memorySource;
using tests::helpers::raw;

namespace {

class BrokenSource final : public IRowSource {
public:
	const std::string &origin() const override {
		return origin_;
	}

	SourceRows read() const override {
		throw SourceUnavailable(origin_, "disk on fire");
	}

private:
	std::string origin_ = "broken";
};

} // namespace

TEST_CASE("Ingestor drops invalid rows and keeps the rest", "[ingest][ingestor]") {
	std::vector<RawRecord> rows;
	for (int d = 1; d <= 9; ++d) {
		rows.push_back(raw("2023-01-0" + std::to_string(d), "100", std::string("Library")));
	}
	rows.push_back(raw(std::string("2023-01-10"), std::string("NaN"), std::string("Library")));

	auto ingestor = IngestorBuilder().withSource(memorySource("library", rows)).build();
	const auto result = ingestor.ingest();

	REQUIRE(result.hasData());
	REQUIRE(result.dataset.size() == 9);
	REQUIRE(result.report.sources_total == 1);
	REQUIRE(result.report.sources_loaded == 1);
	REQUIRE(result.report.records_read == 10);
	REQUIRE(result.report.records_kept == 9);
	REQUIRE(result.report.count(DiagnosticKind::ValidationFailure) == 1);
	REQUIRE(result.report.diagnostics[0].row == std::optional<std::size_t>(10));

	for (const auto &record : result.dataset) {
		REQUIRE(record.kwh == Catch::Approx(100.0));
		REQUIRE(record.month == 1);
	}
}

TEST_CASE("Ingestor validate rejects bad dates and kWh values", "[ingest][ingestor][validate]") {
	const IngestOptions options;
	std::string failure;

	REQUIRE_FALSE(Ingestor::validate(raw(std::nullopt, std::string("1")), "src", options, failure));
	REQUIRE(failure == "Date is missing");
	REQUIRE_FALSE(Ingestor::validate(raw(std::string("2023-13-01"), std::string("1")), "src", options, failure));
	REQUIRE_FALSE(Ingestor::validate(raw(std::string("2023-01-01"), std::string("abc")), "src", options, failure));
	REQUIRE_FALSE(Ingestor::validate(raw(std::string("2023-01-01"), std::string("12kW")), "src", options, failure));
	REQUIRE_FALSE(Ingestor::validate(raw(std::string("2023-01-01"), std::string("-5")), "src", options, failure));
	REQUIRE_FALSE(Ingestor::validate(raw(std::string("2023-01-01"), std::string("inf")), "src", options, failure));
	REQUIRE_FALSE(Ingestor::validate(raw(std::string("2023-01-01"), std::nullopt), "src", options, failure));

	const auto zero = Ingestor::validate(raw(std::string("2023-06-15"), std::string("0")), "src", options, failure);
	REQUIRE(zero.has_value());
	REQUIRE(zero->kwh == 0.0);
	REQUIRE(zero->month == 6);
}

TEST_CASE("Ingestor drops rows dated outside the clock range", "[ingest][ingestor][validate]") {
	auto ingestor = IngestorBuilder()
	                    .withSource(memorySource("lab", {raw(std::string("2023-01-01"), std::string("5")),
	                                                     raw(std::string("2300-01-01"), std::string("5")),
	                                                     raw(std::string("1600-06-15"), std::string("5"))}))
	                    .build();
	const auto result = ingestor.ingest();

	REQUIRE(result.dataset.size() == 1);
	REQUIRE(result.dataset[0].timestamp == at(2023, 1, 1));
	REQUIRE(result.report.count(DiagnosticKind::ValidationFailure) == 2);
	REQUIRE(result.report.diagnostics[0].message == "Date '2300-01-01' is not a valid date");
	REQUIRE(result.report.diagnostics[1].row == std::optional<std::size_t>(3));
}

TEST_CASE("Ingestor infers the building from the source origin", "[ingest][ingestor][building]") {
	const IngestOptions options;
	std::string failure;

	const auto inferred = Ingestor::validate(raw(std::string("2023-01-01"), std::string("5")), "Gym", options, failure);
	REQUIRE(inferred.has_value());
	REQUIRE(inferred->building == "Gym");

	const auto blank =
	    Ingestor::validate(raw(std::string("2023-01-01"), std::string("5"), std::string("  ")), "Gym", options, failure);
	REQUIRE(blank->building == "Gym");

	const auto explicit_name = Ingestor::validate(raw(std::string("2023-01-01"), std::string("5"), std::string("Lab")),
	                                              "Gym", options, failure);
	REQUIRE(explicit_name->building == "Lab");

	REQUIRE_FALSE(Ingestor::validate(raw(std::string("2023-01-01"), std::string("5")), "", options, failure));
}

TEST_CASE("Ingestor keeps quote characters that are part of a value", "[ingest][ingestor][building]") {
	tests::helpers::TempDir dir("ingest-quotes");
	const auto path = dir.write("halls.csv", "Date,KWH,Building\n"
	                                         "2023-01-01,5,\"\"\"Main Hall\"\"\"\n"
	                                         "2023-01-02,6,\"North, Annex\"\n");

	const auto result = IngestorBuilder().withSource(std::make_shared<CsvRowSource>(path)).build().ingest();
	REQUIRE(result.dataset.size() == 2);
	REQUIRE(result.dataset[0].building == "\"Main Hall\"");
	REQUIRE(result.dataset[1].building == "North, Annex");

	const IngestOptions options;
	std::string failure;
	const auto quoted = Ingestor::validate(raw(std::string("2023-01-01"), std::string("5"), std::string("\"Lab\"")),
	                                       "src", options, failure);
	REQUIRE(quoted.has_value());
	REQUIRE(quoted->building == "\"Lab\"");
}

TEST_CASE("Ingestor skips unavailable sources", "[ingest][ingestor][unavailable]") {
	auto ingestor = IngestorBuilder()
	                    .withSource(std::make_shared<BrokenSource>())
	                    .withSource(memorySource("hall", {raw(std::string("2023-01-01"), std::string("7"))}))
	                    .build();
	const auto result = ingestor.ingest();

	REQUIRE(result.dataset.size() == 1);
	REQUIRE(result.dataset[0].building == "hall");
	REQUIRE(result.report.sources_total == 2);
	REQUIRE(result.report.sources_loaded == 1);
	REQUIRE(result.report.count(DiagnosticKind::SourceUnavailable) == 1);
	REQUIRE(result.report.diagnostics[0].toString() == "SourceUnavailable [broken] disk on fire");
}

TEST_CASE("Ingestor merges sources in order and is repeatable", "[ingest][ingestor][merge]") {
	auto ingestor = IngestorBuilder().withSources(tests::helpers::constantWeekSources()).build();
	REQUIRE(ingestor.sourceCount() == 3);

	const auto first = ingestor.ingest();
	const auto second = ingestor.ingest();

	REQUIRE(first.dataset.size() == 21);
	REQUIRE(first.dataset == second.dataset);
	REQUIRE(first.report.clean());
	// Same timestamp: merge order decides.
	REQUIRE(first.dataset[0].building == "Library");
	REQUIRE(first.dataset[1].building == "Dormitory");
	REQUIRE(first.dataset[2].building == "Cafeteria");
	REQUIRE(first.dataset[0].timestamp == at(2023, 1, 2));
}

TEST_CASE("Ingestor with no sources yields an empty dataset", "[ingest][ingestor][empty]") {
	const auto result = IngestorBuilder().build().ingest();
	REQUIRE_FALSE(result.hasData());
	REQUIRE(result.report.sources_total == 0);
	REQUIRE(result.report.clean());
}

TEST_CASE("IngestorBuilder validates its configuration", "[ingest][ingestor][builder]") {
	REQUIRE_THROWS_AS(IngestorBuilder().withSource(nullptr), std::invalid_argument);
	REQUIRE_THROWS_AS(IngestorBuilder().withDateFormats({}).build(), std::invalid_argument);

	auto ingestor = IngestorBuilder()
	                    .withDateFormats({"%d/%m/%Y"})
	                    .withSource(memorySource("lab", {raw(std::string("02/01/2023"), std::string("3")),
	                                                     raw(std::string("2023-01-02"), std::string("3"))}))
	                    .build();
	const auto result = ingestor.ingest();
	REQUIRE(result.dataset.size() == 1);
	REQUIRE(result.dataset[0].timestamp == at(2023, 1, 2));
}
