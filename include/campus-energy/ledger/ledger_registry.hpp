#pragma once

#include "campus-energy/core/canonical_dataset.hpp"
#include "campus-energy/ledger/building_ledger.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace campusenergy::ledger {

/**
 * @class LedgerRegistry
 * @brief Owns one BuildingLedger per distinct building name and routes
 * readings to it.
 *
 * Ledgers are iterated in the order their building was first referenced.
 */
class LedgerRegistry {
	using Storage = std::vector<std::unique_ptr<BuildingLedger>>;

public:
	/**
	 * @brief Lazy view over the registry producing one LedgerReport per
	 * ledger on dereference.
	 */
	class ReportSequence {
	public:
		class iterator {
		public:
			using iterator_category = std::input_iterator_tag;
			using value_type = LedgerReport;
			using difference_type = std::ptrdiff_t;
			using pointer = void;
			using reference = LedgerReport;

			explicit iterator(Storage::const_iterator position) : position_(position) {
			}

			LedgerReport operator*() const {
				return (*position_)->report();
			}

			iterator &operator++() {
				++position_;
				return *this;
			}

			iterator operator++(int) {
				iterator previous = *this;
				++position_;
				return previous;
			}

			bool operator==(const iterator &other) const {
				return position_ == other.position_;
			}

			bool operator!=(const iterator &other) const {
				return position_ != other.position_;
			}

		private:
			Storage::const_iterator position_;
		};

		explicit ReportSequence(const Storage &ledgers) : ledgers_(&ledgers) {
		}

		iterator begin() const {
			return iterator(ledgers_->begin());
		}

		iterator end() const {
			return iterator(ledgers_->end());
		}

		std::size_t size() const {
			return ledgers_->size();
		}

		std::vector<LedgerReport> collect() const {
			return std::vector<LedgerReport>(begin(), end());
		}

	private:
		const Storage *ledgers_;
	};

	LedgerRegistry() = default;

	LedgerRegistry(const LedgerRegistry &) = delete;
	LedgerRegistry &operator=(const LedgerRegistry &) = delete;
	LedgerRegistry(LedgerRegistry &&) = default;
	LedgerRegistry &operator=(LedgerRegistry &&) = default;

	/**
	 * @brief Returns the ledger for name, creating it if needed.
	 */
	BuildingLedger &addBuilding(const std::string &name);

	void recordReading(const std::string &building, core::TimePoint timestamp, double kwh);

	/**
	 * @brief Records every canonical record in dataset order.
	 */
	void populate(const core::CanonicalDataset &dataset);

	const BuildingLedger *find(const std::string &name) const;

	bool contains(const std::string &name) const {
		return index_.find(name) != index_.end();
	}

	std::size_t size() const {
		return ledgers_.size();
	}

	bool isEmpty() const {
		return ledgers_.empty();
	}

	std::vector<std::string> buildingNames() const;

	ReportSequence allReports() const {
		return ReportSequence(ledgers_);
	}

private:
	Storage ledgers_;
	std::unordered_map<std::string, std::size_t> index_;
};

} // namespace campusenergy::ledger
