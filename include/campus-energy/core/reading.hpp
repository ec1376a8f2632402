#pragma once

#include "campus-energy/core/calendar.hpp"

namespace campusenergy::core {

/**
 * @class Reading
 * @brief A single timestamped consumption value in kWh.
 *
 * Readings are immutable once created. Validation of the value happens at
 * ingestion; a Reading trusts its inputs.
 */
class Reading {
public:
	Reading(TimePoint timestamp, double kwh) : timestamp_(timestamp), kwh_(kwh) {
	}

	const TimePoint &timestamp() const {
		return timestamp_;
	}

	double kwh() const {
		return kwh_;
	}

private:
	TimePoint timestamp_;
	double kwh_;
};

} // namespace campusenergy::core
