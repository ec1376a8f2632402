#include "campus-energy/core/canonical_dataset.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

namespace campusenergy::core {

CanonicalDataset::CanonicalDataset(std::vector<CanonicalRecord> records) : records_(std::move(records)) {
	for (const auto &record : records_) {
		if (!std::isfinite(record.kwh) || record.kwh < 0.0) {
			throw std::invalid_argument("Canonical records require a finite, non-negative kWh value.");
		}
		if (record.building.empty()) {
			throw std::invalid_argument("Canonical records require a building name.");
		}
		if (record.month != monthOf(record.timestamp)) {
			throw std::invalid_argument("Canonical record month does not match its timestamp.");
		}
	}
	std::stable_sort(records_.begin(), records_.end(),
	                 [](const CanonicalRecord &lhs, const CanonicalRecord &rhs) { return lhs.timestamp < rhs.timestamp; });
}

std::optional<std::pair<TimePoint, TimePoint>> CanonicalDataset::span() const {
	if (records_.empty()) {
		return std::nullopt;
	}
	return std::make_pair(records_.front().timestamp, records_.back().timestamp);
}

CanonicalDataset CanonicalDataset::between(const TimePoint &from, const TimePoint &to) const {
	if (to < from) {
		throw std::invalid_argument("Range end must not precede range start.");
	}
	const auto by_time = [](const CanonicalRecord &record, const TimePoint &tp) { return record.timestamp < tp; };
	const auto first = std::lower_bound(records_.begin(), records_.end(), from, by_time);
	const auto last = std::lower_bound(first, records_.end(), to, by_time);
	return CanonicalDataset(std::vector<CanonicalRecord>(first, last), PresortedTag{});
}

CanonicalDataset CanonicalDataset::forBuilding(const std::string &building) const {
	std::vector<CanonicalRecord> subset;
	std::copy_if(records_.begin(), records_.end(), std::back_inserter(subset),
	             [&](const CanonicalRecord &record) { return record.building == building; });
	return CanonicalDataset(std::move(subset), PresortedTag{});
}

std::vector<std::string> CanonicalDataset::buildings() const {
	std::vector<std::string> names;
	std::unordered_set<std::string> seen;
	for (const auto &record : records_) {
		if (seen.insert(record.building).second) {
			names.push_back(record.building);
		}
	}
	return names;
}

std::vector<double> CanonicalDataset::kwhValues() const {
	std::vector<double> values;
	values.reserve(records_.size());
	for (const auto &record : records_) {
		values.push_back(record.kwh);
	}
	return values;
}

double CanonicalDataset::totalKwh() const {
	double total = 0.0;
	for (const auto &record : records_) {
		total += record.kwh;
	}
	return total;
}

} // namespace campusenergy::core
