#pragma once

#include "campus-energy/ingest/raw_record.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace campusenergy::ingest {

/**
 * @brief Raised by a row source that cannot be read at all.
 */
class SourceUnavailable : public std::runtime_error {
public:
	SourceUnavailable(std::string origin, const std::string &reason)
	    : std::runtime_error(reason), origin_(std::move(origin)) {
	}

	const std::string &origin() const {
		return origin_;
	}

private:
	std::string origin_;
};

/**
 * @class IRowSource
 * @brief Interface for one tabular input of meter rows.
 *
 * The origin label names the source in diagnostics and is the building name
 * assigned to rows that carry none.
 */
class IRowSource {
public:
	virtual ~IRowSource() = default;

	virtual const std::string &origin() const = 0;

	/**
	 * @brief Reads every row of the source.
	 * @throws SourceUnavailable If the source cannot be read at all.
	 */
	virtual SourceRows read() const = 0;
};

/**
 * @class MemoryRowSource
 * @brief A row source over records already held in memory.
 */
class MemoryRowSource final : public IRowSource {
public:
	MemoryRowSource(std::string origin, std::vector<RawRecord> records)
	    : origin_(std::move(origin)), records_(std::move(records)) {
		for (std::size_t i = 0; i < records_.size(); ++i) {
			if (records_[i].row == 0) {
				records_[i].row = i + 1;
			}
		}
	}

	const std::string &origin() const override {
		return origin_;
	}

	SourceRows read() const override {
		return SourceRows{records_, {}};
	}

private:
	std::string origin_;
	std::vector<RawRecord> records_;
};

} // namespace campusenergy::ingest
