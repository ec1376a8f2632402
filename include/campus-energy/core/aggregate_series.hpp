#pragma once

#include "campus-energy/core/calendar.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace campusenergy::core {

/**
 * @class AggregateSeries
 * @brief A time-bucketed sequence of (period_start, summed_kwh) pairs.
 *
 * Period starts and values live in separate vectors for cache-efficient
 * numerical processing. Periods are strictly increasing, aligned to the
 * calendar boundary of the granularity and contiguous: every period between
 * the first and the last is present, and a period with no underlying records
 * carries 0.
 */
class AggregateSeries {
public:
	using Value = double;

	explicit AggregateSeries(Granularity granularity) : granularity_(granularity) {
	}

	/**
	 * @brief Constructs an AggregateSeries.
	 * @param granularity The calendar period of every bucket.
	 * @param period_starts Bucket labels, one per value.
	 * @param values Summed kWh per bucket.
	 * @throws std::invalid_argument If sizes differ, a value is not finite, or
	 * the periods are not aligned, increasing and contiguous.
	 */
	AggregateSeries(Granularity granularity, std::vector<TimePoint> period_starts, std::vector<Value> values,
	                std::string label = {})
	    : granularity_(granularity), period_starts_(std::move(period_starts)), values_(std::move(values)),
	      label_(std::move(label)) {
		if (period_starts_.size() != values_.size()) {
			throw std::invalid_argument("Period starts and values vectors must have the same size.");
		}
		for (double v : values_) {
			if (!std::isfinite(v)) {
				throw std::invalid_argument("AggregateSeries values must be finite.");
			}
		}
		validatePeriods();
	}

	Granularity granularity() const {
		return granularity_;
	}

	std::chrono::hours frequency() const {
		return periodLength(granularity_);
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return period_starts_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	const std::string &label() const {
		return label_;
	}

	void setLabel(std::string label) {
		label_ = std::move(label);
	}

	std::size_t size() const {
		return period_starts_.size();
	}

	bool isEmpty() const {
		return size() == 0;
	}

	Value total() const {
		return std::accumulate(values_.begin(), values_.end(), 0.0);
	}

	/**
	 * @brief Value of the bucket containing tp.
	 * @return The bucket value, or std::nullopt when tp is outside the span.
	 */
	std::optional<Value> valueAt(const TimePoint &tp) const {
		const auto key = bucketStart(tp, granularity_);
		const auto it = std::lower_bound(period_starts_.begin(), period_starts_.end(), key);
		if (it == period_starts_.end() || *it != key) {
			return std::nullopt;
		}
		return values_[static_cast<std::size_t>(it - period_starts_.begin())];
	}

	AggregateSeries slice(std::size_t start, std::size_t end) const {
		if (start > end) {
			throw std::invalid_argument("Slice start index must not exceed end index.");
		}
		if (end > size()) {
			throw std::out_of_range("Slice end index exceeds the length of the series.");
		}
		std::vector<TimePoint> starts(period_starts_.begin() + static_cast<std::ptrdiff_t>(start),
		                              period_starts_.begin() + static_cast<std::ptrdiff_t>(end));
		std::vector<Value> values(values_.begin() + static_cast<std::ptrdiff_t>(start),
		                          values_.begin() + static_cast<std::ptrdiff_t>(end));
		return AggregateSeries(granularity_, std::move(starts), std::move(values), label_);
	}

	/**
	 * @brief Buckets whose period start lies in [from, to).
	 */
	AggregateSeries between(const TimePoint &from, const TimePoint &to) const {
		if (to < from) {
			throw std::invalid_argument("Range end must not precede range start.");
		}
		const auto first = std::lower_bound(period_starts_.begin(), period_starts_.end(), from);
		const auto last = std::lower_bound(period_starts_.begin(), period_starts_.end(), to);
		return slice(static_cast<std::size_t>(first - period_starts_.begin()),
		             static_cast<std::size_t>(last - period_starts_.begin()));
	}

private:
	void validatePeriods() const {
		const auto step = periodLength(granularity_);
		for (std::size_t i = 0; i < period_starts_.size(); ++i) {
			if (bucketStart(period_starts_[i], granularity_) != period_starts_[i]) {
				throw std::invalid_argument("AggregateSeries periods must start on a " + granularityName(granularity_) +
				                            " boundary.");
			}
			if (i > 0 && period_starts_[i] - period_starts_[i - 1] != step) {
				throw std::invalid_argument("AggregateSeries periods must be strictly increasing and contiguous.");
			}
		}
	}

	Granularity granularity_;
	std::vector<TimePoint> period_starts_;
	std::vector<Value> values_;
	std::string label_;
};

} // namespace campusenergy::core
