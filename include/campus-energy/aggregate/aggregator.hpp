#pragma once

#include "campus-energy/core/aggregate_series.hpp"
#include "campus-energy/core/canonical_dataset.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace campusenergy::aggregate {

/**
 * @brief Descriptive statistics of one building's kWh records.
 */
struct BuildingStats {
	double mean = 0.0;
	double min = 0.0;
	double max = 0.0;
	double sum = 0.0;
	std::size_t count = 0;
};

/**
 * @class BuildingSummaryTable
 * @brief Building name → BuildingStats, iterated in order of each building's
 * first appearance in the canonical dataset.
 */
class BuildingSummaryTable {
public:
	using Entry = std::pair<std::string, BuildingStats>;
	using const_iterator = std::vector<Entry>::const_iterator;

	const_iterator begin() const {
		return entries_.begin();
	}

	const_iterator end() const {
		return entries_.end();
	}

	std::size_t size() const {
		return entries_.size();
	}

	bool isEmpty() const {
		return entries_.empty();
	}

	const std::vector<Entry> &entries() const {
		return entries_;
	}

	std::optional<BuildingStats> find(const std::string &building) const;

	/**
	 * @throws std::out_of_range If the building has no row.
	 */
	const BuildingStats &at(const std::string &building) const;

private:
	friend class Aggregator;

	std::vector<Entry> entries_;
};

struct AggregationResult {
	core::AggregateSeries daily_totals{core::Granularity::Day};
	core::AggregateSeries weekly_totals{core::Granularity::Week};
	BuildingSummaryTable building_summary;
};

/**
 * @class Aggregator
 * @brief Temporal rollups and per-building statistics over a CanonicalDataset.
 *
 * An empty dataset yields empty series and an empty table.
 */
class Aggregator final {
public:
	/**
	 * @brief Sums kWh into contiguous calendar buckets spanning the dataset.
	 *
	 * Buckets between the first and the last record that contain no records
	 * are emitted with 0.
	 */
	static core::AggregateSeries resample(const core::CanonicalDataset &dataset, core::Granularity granularity);

	/// Daily totals across all buildings (UTC calendar days).
	static core::AggregateSeries dailyTotals(const core::CanonicalDataset &dataset);

	/// Weekly totals across all buildings (ISO weeks starting Monday, UTC).
	static core::AggregateSeries weeklyTotals(const core::CanonicalDataset &dataset);

	static BuildingSummaryTable buildingSummary(const core::CanonicalDataset &dataset);

	static AggregationResult aggregate(const core::CanonicalDataset &dataset);
};

} // namespace campusenergy::aggregate
