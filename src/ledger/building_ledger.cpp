#include "campus-energy/ledger/building_ledger.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace campusenergy::ledger {

std::string LedgerReport::toString() const {
	std::ostringstream out;
	out << "Building: " << name << ", Total KWH: " << std::setprecision(15) << total << ", Average KWH: "
	    << std::fixed << std::setprecision(2) << average;
	return out.str();
}

BuildingLedger::BuildingLedger(std::string name) : name_(std::move(name)) {
}

void BuildingLedger::addReading(core::TimePoint timestamp, double kwh) {
	readings_.emplace_back(timestamp, kwh);
}

double BuildingLedger::totalConsumption() const {
	double total = 0.0;
	for (const auto &reading : readings_) {
		total += reading.kwh();
	}
	return total;
}

double BuildingLedger::averageConsumption() const {
	if (readings_.empty()) {
		return 0.0;
	}
	return totalConsumption() / static_cast<double>(readings_.size());
}

LedgerReport BuildingLedger::report() const {
	LedgerReport result;
	result.name = name_;
	result.total = totalConsumption();
	result.average = averageConsumption();
	result.reading_count = readings_.size();
	return result;
}

} // namespace campusenergy::ledger
