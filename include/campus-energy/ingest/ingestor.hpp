#pragma once

#include "campus-energy/core/canonical_dataset.hpp"
#include "campus-energy/ingest/raw_record.hpp"
#include "campus-energy/ingest/row_source.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace campusenergy::ingest {

struct IngestOptions {
	std::vector<std::string> date_formats = core::defaultDateFormats();
};

struct IngestionResult {
	core::CanonicalDataset dataset;
	IngestionReport report;

	bool hasData() const {
		return !dataset.isEmpty();
	}
};

class IngestorBuilder;

/**
 * @class Ingestor
 * @brief Merges row sources into one CanonicalDataset.
 *
 * Ingestion runs in two stages. Validation turns every raw record into a
 * flat canonical record or a diagnostic; indexing then orders the survivors
 * by time. A failing source or record never aborts the run. The ingestor
 * holds no state between runs, so ingesting the same sources twice yields
 * the same dataset.
 */
class Ingestor {
public:
	friend class IngestorBuilder;

	IngestionResult ingest() const;

	std::size_t sourceCount() const {
		return sources_.size();
	}

	/**
	 * @brief Validates a single raw record.
	 * @param record The raw row.
	 * @param origin Source label; the building of a row that has none.
	 * @param options Parsing options.
	 * @param failure Receives the reason when validation fails.
	 * @return The canonical record, or std::nullopt when the row is dropped.
	 */
	static std::optional<core::CanonicalRecord> validate(const RawRecord &record, const std::string &origin,
	                                                     const IngestOptions &options, std::string &failure);

private:
	Ingestor(std::vector<std::shared_ptr<const IRowSource>> sources, IngestOptions options);

	std::vector<std::shared_ptr<const IRowSource>> sources_;
	IngestOptions options_;
};

/**
 * @class IngestorBuilder
 * @brief Fluent configuration of an Ingestor.
 */
class IngestorBuilder {
public:
	IngestorBuilder &withSource(std::shared_ptr<const IRowSource> source);

	IngestorBuilder &withSources(const std::vector<std::shared_ptr<IRowSource>> &sources);

	/**
	 * @brief Replaces the accepted date layouts (std::get_time syntax).
	 */
	IngestorBuilder &withDateFormats(std::vector<std::string> formats);

	Ingestor build();

private:
	std::vector<std::shared_ptr<const IRowSource>> sources_;
	IngestOptions options_;
};

} // namespace campusenergy::ingest
