#include "campus-energy/aggregate/aggregator.hpp"

#include "campus-energy/utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <unordered_map>

namespace campusenergy::aggregate {

std::optional<BuildingStats> BuildingSummaryTable::find(const std::string &building) const {
	const auto it = std::find_if(entries_.begin(), entries_.end(),
	                             [&](const Entry &entry) { return entry.first == building; });
	if (it == entries_.end()) {
		return std::nullopt;
	}
	return it->second;
}

const BuildingStats &BuildingSummaryTable::at(const std::string &building) const {
	const auto it = std::find_if(entries_.begin(), entries_.end(),
	                             [&](const Entry &entry) { return entry.first == building; });
	if (it == entries_.end()) {
		throw std::out_of_range("No summary row for building '" + building + "'.");
	}
	return it->second;
}

core::AggregateSeries Aggregator::resample(const core::CanonicalDataset &dataset, core::Granularity granularity) {
	const auto span = dataset.span();
	if (!span) {
		return core::AggregateSeries(granularity);
	}

	const auto step = std::chrono::duration_cast<std::chrono::hours>(core::periodLength(granularity)).count();
	const auto first = core::bucketStart(span->first, granularity);
	const auto last = core::bucketStart(span->second, granularity);
	const auto bucketIndex = [&](const core::TimePoint &bucket) {
		const auto offset = std::chrono::duration_cast<std::chrono::hours>(bucket - first).count();
		return static_cast<std::size_t>(offset / step);
	};

	const std::size_t buckets = bucketIndex(last) + 1;
	std::vector<core::TimePoint> starts;
	starts.reserve(buckets);
	for (std::size_t i = 0; i < buckets; ++i) {
		starts.push_back(first + std::chrono::hours(step * static_cast<long long>(i)));
	}

	std::vector<double> sums(buckets, 0.0);
	for (const auto &record : dataset) {
		sums[bucketIndex(core::bucketStart(record.timestamp, granularity))] += record.kwh;
	}

	CAMPUS_DEBUG("Resampled {} records into {} {} buckets.", dataset.size(), buckets,
	             core::granularityName(granularity));
	return core::AggregateSeries(granularity, std::move(starts), std::move(sums),
	                             core::granularityName(granularity) + "_total_kwh");
}

core::AggregateSeries Aggregator::dailyTotals(const core::CanonicalDataset &dataset) {
	return resample(dataset, core::Granularity::Day);
}

core::AggregateSeries Aggregator::weeklyTotals(const core::CanonicalDataset &dataset) {
	return resample(dataset, core::Granularity::Week);
}

BuildingSummaryTable Aggregator::buildingSummary(const core::CanonicalDataset &dataset) {
	BuildingSummaryTable table;
	std::unordered_map<std::string, std::size_t> index;
	for (const auto &record : dataset) {
		auto it = index.find(record.building);
		if (it == index.end()) {
			it = index.emplace(record.building, table.entries_.size()).first;
			BuildingStats stats;
			stats.min = record.kwh;
			stats.max = record.kwh;
			table.entries_.emplace_back(record.building, stats);
		}
		auto &stats = table.entries_[it->second].second;
		stats.min = std::min(stats.min, record.kwh);
		stats.max = std::max(stats.max, record.kwh);
		stats.sum += record.kwh;
		++stats.count;
	}
	for (auto &entry : table.entries_) {
		auto &stats = entry.second;
		stats.mean = stats.count == 0 ? 0.0 : stats.sum / static_cast<double>(stats.count);
	}
	return table;
}

AggregationResult Aggregator::aggregate(const core::CanonicalDataset &dataset) {
	AggregationResult result;
	result.daily_totals = dailyTotals(dataset);
	result.weekly_totals = weeklyTotals(dataset);
	result.building_summary = buildingSummary(dataset);
	CAMPUS_INFO("Aggregated {} records: {} days, {} weeks, {} buildings.", dataset.size(),
	            result.daily_totals.size(), result.weekly_totals.size(), result.building_summary.size());
	return result;
}

} // namespace campusenergy::aggregate
