#include "campus-energy/summary/summary_builder.hpp"

#include "campus-energy/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <stdexcept>

namespace campusenergy::summary {

double percentileSorted(const std::vector<double> &sorted, double q) {
	if (sorted.empty()) {
		throw std::invalid_argument("Cannot compute a percentile of an empty sequence.");
	}
	if (q < 0.0 || q > 1.0) {
		throw std::invalid_argument("Percentile must be within [0, 1].");
	}
	const double position = q * static_cast<double>(sorted.size() - 1);
	const auto lower = static_cast<std::size_t>(std::floor(position));
	const auto upper = std::min(lower + 1, sorted.size() - 1);
	const double fraction = position - static_cast<double>(lower);
	return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
}

std::optional<TrendStats> TrendStats::describe(const std::vector<double> &values) {
	if (values.empty()) {
		return std::nullopt;
	}

	std::vector<double> sorted = values;
	std::sort(sorted.begin(), sorted.end());

	TrendStats stats;
	stats.count = values.size();
	const double n = static_cast<double>(values.size());
	stats.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
	if (values.size() > 1) {
		double sum_sq = 0.0;
		for (double v : values) {
			const double diff = v - stats.mean;
			sum_sq += diff * diff;
		}
		stats.stddev = std::sqrt(sum_sq / (n - 1.0));
	}
	stats.min = sorted.front();
	stats.p25 = percentileSorted(sorted, 0.25);
	stats.median = percentileSorted(sorted, 0.5);
	stats.p75 = percentileSorted(sorted, 0.75);
	stats.max = sorted.back();
	return stats;
}

std::optional<SummaryReport> SummaryBuilder::build(const core::CanonicalDataset &dataset,
                                                   const aggregate::BuildingSummaryTable &building_summary,
                                                   const core::AggregateSeries &weekly_totals) {
	if (dataset.isEmpty()) {
		CAMPUS_WARN("Summary skipped: the canonical dataset is empty.");
		return std::nullopt;
	}
	if (building_summary.isEmpty()) {
		throw std::invalid_argument("Building summary is empty for a non-empty dataset.");
	}
	if (weekly_totals.isEmpty()) {
		throw std::invalid_argument("Weekly totals are empty for a non-empty dataset.");
	}

	SummaryReport report;
	report.total_campus_kwh = dataset.totalKwh();

	// First maximum in table order wins.
	auto best = building_summary.begin();
	for (auto it = std::next(building_summary.begin()); it != building_summary.end(); ++it) {
		if (it->second.sum > best->second.sum) {
			best = it;
		}
	}
	report.highest_consuming_building = best->first;
	report.highest_building_kwh = best->second.sum;

	const core::CanonicalRecord *peak = &dataset[0];
	for (const auto &record : dataset) {
		if (record.kwh > peak->kwh || (record.kwh == peak->kwh && record.timestamp < peak->timestamp)) {
			peak = &record;
		}
	}
	report.peak_load_timestamp = peak->timestamp;
	report.peak_load_kwh = peak->kwh;
	report.peak_load_building = peak->building;

	report.weekly_trend = *TrendStats::describe(weekly_totals.getValues());

	CAMPUS_INFO("Summary: total {} kWh, highest building {}, peak {} kWh at {}.", report.total_campus_kwh,
	            report.highest_consuming_building, report.peak_load_kwh,
	            core::formatTimestamp(report.peak_load_timestamp));
	return report;
}

} // namespace campusenergy::summary
