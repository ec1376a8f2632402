#pragma once

#include "campus-energy/aggregate/aggregator.hpp"
#include "campus-energy/core/aggregate_series.hpp"
#include "campus-energy/core/canonical_dataset.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace campusenergy::summary {

/**
 * @brief describe()-style statistics of a value sequence.
 *
 * Percentiles interpolate linearly between closest ranks. The standard
 * deviation is the sample deviation (n - 1) and is undefined for fewer than
 * two values.
 */
struct TrendStats {
	std::size_t count = 0;
	double mean = 0.0;
	std::optional<double> stddev;
	double min = 0.0;
	double p25 = 0.0;
	double median = 0.0;
	double p75 = 0.0;
	double max = 0.0;

	/**
	 * @return The statistics, or std::nullopt for an empty sequence.
	 */
	static std::optional<TrendStats> describe(const std::vector<double> &values);
};

/**
 * @brief Linear-interpolation percentile of already sorted values.
 * @throws std::invalid_argument If values is empty or q is outside [0, 1].
 */
double percentileSorted(const std::vector<double> &sorted, double q);

/**
 * @brief Headline facts of one run.
 */
struct SummaryReport {
	double total_campus_kwh = 0.0;
	std::string highest_consuming_building;
	double highest_building_kwh = 0.0;
	core::TimePoint peak_load_timestamp{};
	double peak_load_kwh = 0.0;
	std::string peak_load_building;
	TrendStats weekly_trend;
};

/**
 * @class SummaryBuilder
 * @brief Derives the SummaryReport from the aggregation outputs.
 *
 * Ties are broken deterministically: the highest-consuming building is the
 * first maximum in table order, and the peak load is the earliest record
 * with the maximum kWh.
 */
class SummaryBuilder final {
public:
	/**
	 * @return The report, or std::nullopt (insufficient data) when the
	 * dataset is empty.
	 * @throws std::invalid_argument If the table or weekly series is empty
	 * while the dataset is not.
	 */
	static std::optional<SummaryReport> build(const core::CanonicalDataset &dataset,
	                                          const aggregate::BuildingSummaryTable &building_summary,
	                                          const core::AggregateSeries &weekly_totals);
};

} // namespace campusenergy::summary
