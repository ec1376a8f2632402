#pragma once

#include "campus-energy/core/calendar.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace campusenergy::core {

/**
 * @brief One validated meter observation. Only ingestion produces these.
 */
struct CanonicalRecord {
	TimePoint timestamp{};
	std::string building;
	double kwh = 0.0;
	int month = 1;

	bool operator==(const CanonicalRecord &other) const {
		return timestamp == other.timestamp && building == other.building && kwh == other.kwh &&
		       month == other.month;
	}
	bool operator!=(const CanonicalRecord &other) const {
		return !(*this == other);
	}
};

/**
 * @class CanonicalDataset
 * @brief The merged, validated record set, indexed by time.
 *
 * Records are ordered by timestamp; records sharing a timestamp keep the
 * order in which they were handed over (merge order). Every record has a
 * finite, non-negative kWh value and a non-empty building name.
 */
class CanonicalDataset {
public:
	using const_iterator = std::vector<CanonicalRecord>::const_iterator;

	CanonicalDataset() = default;

	/**
	 * @brief Indexes validated records by time.
	 * @param records Records in merge order.
	 * @throws std::invalid_argument If a record violates the validity invariant.
	 */
	explicit CanonicalDataset(std::vector<CanonicalRecord> records);

	const std::vector<CanonicalRecord> &records() const {
		return records_;
	}

	std::size_t size() const {
		return records_.size();
	}

	bool isEmpty() const {
		return records_.empty();
	}

	const_iterator begin() const {
		return records_.begin();
	}

	const_iterator end() const {
		return records_.end();
	}

	const CanonicalRecord &operator[](std::size_t index) const {
		return records_[index];
	}

	/**
	 * @brief Earliest and latest timestamp, or std::nullopt when empty.
	 */
	std::optional<std::pair<TimePoint, TimePoint>> span() const;

	/**
	 * @brief Records with from <= timestamp < to.
	 */
	CanonicalDataset between(const TimePoint &from, const TimePoint &to) const;

	CanonicalDataset forBuilding(const std::string &building) const;

	/**
	 * @brief Distinct building names in order of first appearance.
	 */
	std::vector<std::string> buildings() const;

	std::vector<double> kwhValues() const;

	double totalKwh() const;

	bool operator==(const CanonicalDataset &other) const {
		return records_ == other.records_;
	}
	bool operator!=(const CanonicalDataset &other) const {
		return !(*this == other);
	}

private:
	struct PresortedTag {};
	CanonicalDataset(std::vector<CanonicalRecord> records, PresortedTag) : records_(std::move(records)) {
	}

	std::vector<CanonicalRecord> records_;
};

} // namespace campusenergy::core
