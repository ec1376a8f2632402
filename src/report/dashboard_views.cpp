#include "campus-energy/report/dashboard_views.hpp"

#include "campus-energy/aggregate/aggregator.hpp"
#include "campus-energy/utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace campusenergy::report {

WeeklyUsageByBuilding weeklyUsageByBuilding(const core::CanonicalDataset &dataset) {
	WeeklyUsageByBuilding usage;
	const auto span = dataset.span();
	if (!span) {
		return usage;
	}

	const auto first_week = core::isoWeekStart(span->first);
	const auto last_week = core::isoWeekStart(span->second);
	const auto week_hours = core::periodLength(core::Granularity::Week).count();
	const auto weekIndex = [&](const core::TimePoint &tp) {
		const auto offset = std::chrono::duration_cast<std::chrono::hours>(core::isoWeekStart(tp) - first_week);
		return static_cast<Eigen::Index>(offset.count() / week_hours);
	};

	const Eigen::Index weeks = weekIndex(last_week) + 1;
	for (Eigen::Index w = 0; w < weeks; ++w) {
		usage.week_starts.push_back(first_week + std::chrono::hours(week_hours * w));
	}

	usage.buildings = dataset.buildings();
	std::unordered_map<std::string, Eigen::Index> column;
	for (std::size_t i = 0; i < usage.buildings.size(); ++i) {
		column.emplace(usage.buildings[i], static_cast<Eigen::Index>(i));
	}
	const auto building_count = static_cast<Eigen::Index>(usage.buildings.size());

	Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(weeks, building_count);
	Eigen::MatrixXd counts = Eigen::MatrixXd::Zero(weeks, building_count);
	for (const auto &record : dataset) {
		const auto row = weekIndex(record.timestamp);
		const auto col = column.at(record.building);
		sums(row, col) += record.kwh;
		counts(row, col) += 1.0;
	}

	const double nan = std::numeric_limits<double>::quiet_NaN();
	usage.weekly_mean = (counts.array() > 0.0).select(sums.array() / counts.array(), nan).matrix();

	const Eigen::ArrayXXd present = (counts.array() > 0.0).cast<double>();
	const Eigen::ArrayXd filled_sums =
	    (present > 0.0).select(usage.weekly_mean.array(), 0.0).colwise().sum().transpose();
	const Eigen::ArrayXd weeks_present = present.colwise().sum().transpose();
	usage.average_by_building = (weeks_present > 0.0).select(filled_sums / weeks_present, 0.0).matrix();
	return usage;
}

std::vector<DayOfWeekPoint> dayOfWeekPoints(const core::CanonicalDataset &dataset) {
	std::vector<DayOfWeekPoint> points;
	points.reserve(dataset.size());
	for (const auto &record : dataset) {
		points.push_back(DayOfWeekPoint{core::dayOfWeek(record.timestamp), record.kwh});
	}
	return points;
}

std::vector<HistogramBin> histogram(const std::vector<double> &values, std::size_t bins) {
	if (bins == 0) {
		throw std::invalid_argument("Histogram requires at least one bin.");
	}
	if (values.empty()) {
		return {};
	}

	const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
	double lower = *min_it;
	double upper = *max_it;
	if (lower == upper) {
		lower -= 0.5;
		upper += 0.5;
	}
	const double width = (upper - lower) / static_cast<double>(bins);

	std::vector<HistogramBin> result(bins);
	for (std::size_t i = 0; i < bins; ++i) {
		result[i].lower = lower + width * static_cast<double>(i);
		result[i].upper = (i + 1 == bins) ? upper : lower + width * static_cast<double>(i + 1);
	}
	for (double v : values) {
		auto index = static_cast<std::size_t>((v - lower) / width);
		if (index >= bins) {
			index = bins - 1;
		}
		++result[index].count;
	}
	return result;
}

DashboardViewBuilder &DashboardViewBuilder::withHistogramBins(std::size_t bins) {
	histogram_bins_ = bins;
	return *this;
}

DashboardViews DashboardViewBuilder::build(const core::CanonicalDataset &dataset) const {
	if (histogram_bins_ == 0) {
		throw std::invalid_argument("Histogram requires at least one bin.");
	}
	DashboardViews views;
	views.daily_trend = aggregate::Aggregator::dailyTotals(dataset);
	views.weekly_usage = weeklyUsageByBuilding(dataset);
	views.day_of_week = dayOfWeekPoints(dataset);
	views.kwh_histogram = histogram(dataset.kwhValues(), histogram_bins_);
	CAMPUS_DEBUG("Dashboard views built: {} days, {} weeks x {} buildings, {} histogram bins.",
	             views.daily_trend.size(), views.weekly_usage.week_starts.size(), views.weekly_usage.buildings.size(),
	             views.kwh_histogram.size());
	return views;
}

} // namespace campusenergy::report
