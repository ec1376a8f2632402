#pragma once

#include "campus-energy/core/aggregate_series.hpp"
#include "campus-energy/core/canonical_dataset.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <vector>

namespace campusenergy::report {

/**
 * @brief Mean kWh per record, per building and ISO week.
 *
 * `weekly_mean` has one row per week of the dataset span and one column per
 * building (first-appearance order); a cell is NaN when the building has no
 * record that week. `average_by_building` is the mean of each column over its
 * non-NaN cells.
 */
struct WeeklyUsageByBuilding {
	std::vector<core::TimePoint> week_starts;
	std::vector<std::string> buildings;
	Eigen::MatrixXd weekly_mean;
	Eigen::VectorXd average_by_building;
};

struct DayOfWeekPoint {
	int day_of_week = 0; // Monday = 0
	double kwh = 0.0;
};

/**
 * @brief One equal-width histogram bin, [lower, upper); the last bin also
 * holds values equal to its upper edge.
 */
struct HistogramBin {
	double lower = 0.0;
	double upper = 0.0;
	std::size_t count = 0;
};

/**
 * @brief The four plot-ready views of the dashboard. Nothing here needs
 * further computation by a plotting collaborator.
 */
struct DashboardViews {
	core::AggregateSeries daily_trend{core::Granularity::Day};
	WeeklyUsageByBuilding weekly_usage;
	std::vector<DayOfWeekPoint> day_of_week;
	std::vector<HistogramBin> kwh_histogram;
};

WeeklyUsageByBuilding weeklyUsageByBuilding(const core::CanonicalDataset &dataset);

std::vector<DayOfWeekPoint> dayOfWeekPoints(const core::CanonicalDataset &dataset);

/**
 * @brief Equal-width histogram over [min, max] of the values. When every
 * value is equal the range is widened to [v - 0.5, v + 0.5].
 * @throws std::invalid_argument If bins is zero.
 */
std::vector<HistogramBin> histogram(const std::vector<double> &values, std::size_t bins);

class DashboardViewBuilder {
public:
	DashboardViewBuilder &withHistogramBins(std::size_t bins);

	DashboardViews build(const core::CanonicalDataset &dataset) const;

private:
	std::size_t histogram_bins_ = 20;
};

} // namespace campusenergy::report
