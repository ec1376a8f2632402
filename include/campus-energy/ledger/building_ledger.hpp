#pragma once

#include "campus-energy/core/reading.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace campusenergy::ledger {

/**
 * @brief Derived totals of one building ledger.
 */
struct LedgerReport {
	std::string name;
	double total = 0.0;
	double average = 0.0;
	std::size_t reading_count = 0;

	/**
	 * @brief "Building: <name>, Total KWH: <total>, Average KWH: <average>"
	 * with the average rounded to two decimals.
	 */
	std::string toString() const;
};

/**
 * @class BuildingLedger
 * @brief Per-building accumulator of readings.
 *
 * Readings are kept in insertion order, which need not be chronological.
 */
class BuildingLedger {
public:
	explicit BuildingLedger(std::string name);

	const std::string &name() const {
		return name_;
	}

	void addReading(core::TimePoint timestamp, double kwh);

	const std::vector<core::Reading> &readings() const {
		return readings_;
	}

	std::size_t size() const {
		return readings_.size();
	}

	bool isEmpty() const {
		return readings_.empty();
	}

	double totalConsumption() const;

	/**
	 * @brief Mean kWh per reading; 0 for a ledger without readings.
	 */
	double averageConsumption() const;

	LedgerReport report() const;

private:
	std::string name_;
	std::vector<core::Reading> readings_;
};

} // namespace campusenergy::ledger
