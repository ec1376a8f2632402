#include "campus-energy/ledger/ledger_registry.hpp"

#include "campus-energy/utils/logging.hpp"

namespace campusenergy::ledger {

BuildingLedger &LedgerRegistry::addBuilding(const std::string &name) {
	const auto it = index_.find(name);
	if (it != index_.end()) {
		return *ledgers_[it->second];
	}
	index_.emplace(name, ledgers_.size());
	ledgers_.push_back(std::make_unique<BuildingLedger>(name));
	return *ledgers_.back();
}

void LedgerRegistry::recordReading(const std::string &building, core::TimePoint timestamp, double kwh) {
	addBuilding(building).addReading(timestamp, kwh);
}

void LedgerRegistry::populate(const core::CanonicalDataset &dataset) {
	for (const auto &record : dataset) {
		recordReading(record.building, record.timestamp, record.kwh);
	}
	CAMPUS_DEBUG("Ledger registry holds {} buildings after {} readings.", ledgers_.size(), dataset.size());
}

const BuildingLedger *LedgerRegistry::find(const std::string &name) const {
	const auto it = index_.find(name);
	if (it == index_.end()) {
		return nullptr;
	}
	return ledgers_[it->second].get();
}

std::vector<std::string> LedgerRegistry::buildingNames() const {
	std::vector<std::string> names;
	names.reserve(ledgers_.size());
	for (const auto &ledger : ledgers_) {
		names.push_back(ledger->name());
	}
	return names;
}

} // namespace campusenergy::ledger
