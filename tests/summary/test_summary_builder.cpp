#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "campus-energy/summary/summary_builder.hpp"
#include "common/energy_fixtures.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using campusenergy::aggregate::Aggregator;
using campusenergy::core::AggregateSeries;
using campusenergy::core::CanonicalDataset;
using campusenergy::core::Granularity;
using campusenergy::summary::SummaryBuilder;
using campusenergy::summary::TrendStats;
using campusenergy::summary::percentileSorted;
using tests::helpers::at;
using tests::helpers::record;

namespace {

std::optional<campusenergy::summary::SummaryReport> summarize(const CanonicalDataset &dataset) {
	const auto aggregation = Aggregator::aggregate(dataset);
	return SummaryBuilder::build(dataset, aggregation.building_summary, aggregation.weekly_totals);
}

} // namespace

TEST_CASE("SummaryBuilder finds the highest consumer and the peak load", "[summary][builder]") {
	CanonicalDataset dataset({record(at(2023, 1, 2, 9), "Library", 120.0), record(at(2023, 1, 2, 9), "Gym", 300.0),
	                          record(at(2023, 1, 3, 9), "Library", 250.0), record(at(2023, 1, 10, 9), "Gym", 10.0)});

	const auto report = summarize(dataset);
	REQUIRE(report.has_value());
	REQUIRE(report->total_campus_kwh == Catch::Approx(680.0));
	REQUIRE(report->highest_consuming_building == "Library");
	REQUIRE(report->highest_building_kwh == Catch::Approx(370.0));
	REQUIRE(report->peak_load_building == "Gym");
	REQUIRE(report->peak_load_kwh == Catch::Approx(300.0));
	REQUIRE(report->peak_load_timestamp == at(2023, 1, 2, 9));

	REQUIRE(report->weekly_trend.count == 2);
	REQUIRE(report->weekly_trend.mean == Catch::Approx(340.0));
	REQUIRE(report->weekly_trend.max == Catch::Approx(670.0));
}

TEST_CASE("SummaryBuilder breaks ties deterministically", "[summary][builder][ties]") {
	CanonicalDataset dataset({record(at(2023, 1, 4), "Dormitory", 50.0), record(at(2023, 1, 2), "Library", 50.0),
	                          record(at(2023, 1, 3), "Dormitory", 50.0), record(at(2023, 1, 5), "Library", 50.0)});

	const auto report = summarize(dataset);
	REQUIRE(report.has_value());
	// Library appears first in time order, so it leads the table.
	REQUIRE(report->highest_consuming_building == "Library");
	REQUIRE(report->peak_load_timestamp == at(2023, 1, 2));
	REQUIRE(report->peak_load_building == "Library");
}

TEST_CASE("SummaryBuilder reports insufficient data for an empty dataset", "[summary][builder][empty]") {
	const CanonicalDataset empty;
	REQUIRE_FALSE(SummaryBuilder::build(empty, {}, AggregateSeries(Granularity::Week)).has_value());

	const CanonicalDataset one({record(at(2023, 1, 2), "A", 1.0)});
	REQUIRE_THROWS_AS(SummaryBuilder::build(one, {}, Aggregator::weeklyTotals(one)), std::invalid_argument);
	REQUIRE_THROWS_AS(SummaryBuilder::build(one, Aggregator::buildingSummary(one), AggregateSeries(Granularity::Week)),
	                  std::invalid_argument);
}

TEST_CASE("TrendStats describes a sequence", "[summary][trend]") {
	const auto stats = TrendStats::describe({4.0, 1.0, 3.0, 2.0});
	REQUIRE(stats.has_value());
	REQUIRE(stats->count == 4);
	REQUIRE(stats->mean == Catch::Approx(2.5));
	REQUIRE(stats->stddev.has_value());
	REQUIRE(*stats->stddev == Catch::Approx(std::sqrt(5.0 / 3.0)));
	REQUIRE(stats->min == 1.0);
	REQUIRE(stats->p25 == Catch::Approx(1.75));
	REQUIRE(stats->median == Catch::Approx(2.5));
	REQUIRE(stats->p75 == Catch::Approx(3.25));
	REQUIRE(stats->max == 4.0);

	const auto single = TrendStats::describe({7.0});
	REQUIRE(single.has_value());
	REQUIRE_FALSE(single->stddev.has_value());
	REQUIRE(single->median == 7.0);

	REQUIRE_FALSE(TrendStats::describe({}).has_value());
}

TEST_CASE("percentileSorted validates its input", "[summary][trend][percentile]") {
	const std::vector<double> sorted{10.0, 20.0, 30.0};
	REQUIRE(percentileSorted(sorted, 0.0) == 10.0);
	REQUIRE(percentileSorted(sorted, 1.0) == 30.0);
	REQUIRE(percentileSorted(sorted, 0.75) == Catch::Approx(25.0));

	REQUIRE_THROWS_AS(percentileSorted({}, 0.5), std::invalid_argument);
	REQUIRE_THROWS_AS(percentileSorted(sorted, 1.5), std::invalid_argument);
}
