#include "campus-energy/ingest/ingestor.hpp"

#include "campus-energy/utils/logging.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace campusenergy::ingest {

namespace {

std::string cleanField(const std::string &text) {
	const auto first = text.find_first_not_of(" \t\r\n");
	if (first == std::string::npos) {
		return {};
	}
	const auto last = text.find_last_not_of(" \t\r\n");
	return text.substr(first, last - first + 1);
}

// Tokens read as a missing value, in addition to the empty field.
bool isNullToken(const std::string &field) {
	static const std::unordered_set<std::string> tokens{"NaN", "nan", "NAN", "NA", "N/A", "n/a",
	                                                    "null", "NULL", "None", "-nan", "#N/A"};
	return field.empty() || tokens.count(field) > 0;
}

std::optional<double> parseKwh(const std::string &field, std::string &failure) {
	if (isNullToken(field)) {
		failure = "KWH is missing";
		return std::nullopt;
	}
	errno = 0;
	char *end = nullptr;
	const double value = std::strtod(field.c_str(), &end);
	if (end == field.c_str() || *end != '\0' || errno == ERANGE) {
		failure = "KWH '" + field + "' is not numeric";
		return std::nullopt;
	}
	if (!std::isfinite(value)) {
		failure = "KWH '" + field + "' is not finite";
		return std::nullopt;
	}
	if (value < 0.0) {
		failure = "KWH '" + field + "' is negative";
		return std::nullopt;
	}
	return value;
}

} // namespace

Ingestor::Ingestor(std::vector<std::shared_ptr<const IRowSource>> sources, IngestOptions options)
    : sources_(std::move(sources)), options_(std::move(options)) {
	if (options_.date_formats.empty()) {
		throw std::invalid_argument("At least one date format is required.");
	}
}

std::optional<core::CanonicalRecord> Ingestor::validate(const RawRecord &record, const std::string &origin,
                                                        const IngestOptions &options, std::string &failure) {
	const std::string date_field = record.date ? cleanField(*record.date) : std::string{};
	if (isNullToken(date_field)) {
		failure = "Date is missing";
		return std::nullopt;
	}
	const auto timestamp = core::parseTimestamp(date_field, options.date_formats);
	if (!timestamp) {
		failure = "Date '" + date_field + "' is not a valid date";
		return std::nullopt;
	}

	const auto kwh = parseKwh(record.kwh ? cleanField(*record.kwh) : std::string{}, failure);
	if (!kwh) {
		return std::nullopt;
	}

	std::string building = record.building ? cleanField(*record.building) : std::string{};
	if (isNullToken(building)) {
		building = origin;
	}
	if (building.empty()) {
		failure = "no building name and no source label to infer it from";
		return std::nullopt;
	}

	core::CanonicalRecord canonical;
	canonical.timestamp = *timestamp;
	canonical.building = std::move(building);
	canonical.kwh = *kwh;
	canonical.month = core::monthOf(*timestamp);
	return canonical;
}

IngestionResult Ingestor::ingest() const {
	IngestionResult result;
	auto &report = result.report;
	report.sources_total = sources_.size();

	// Stage 1: merge every readable source and validate its rows.
	std::vector<core::CanonicalRecord> merged;
	for (const auto &source : sources_) {
		const std::string &origin = source->origin();
		SourceRows rows;
		try {
			rows = source->read();
		} catch (const std::exception &e) {
			CAMPUS_ERROR("Error loading {}: {}", origin, e.what());
			report.diagnostics.push_back(Diagnostic{DiagnosticKind::SourceUnavailable, origin, std::nullopt, e.what()});
			continue;
		}

		++report.sources_loaded;
		report.records_read += rows.records.size() + rows.malformed.size();
		for (auto &malformed : rows.malformed) {
			CAMPUS_WARN("Skipping malformed row {} in {}: {}", malformed.row.value_or(0), origin, malformed.message);
			report.diagnostics.push_back(std::move(malformed));
		}

		std::size_t kept = 0;
		for (const auto &record : rows.records) {
			std::string failure;
			auto canonical = validate(record, origin, options_, failure);
			if (!canonical) {
				CAMPUS_WARN("Dropping row {} in {}: {}", record.row, origin, failure);
				report.diagnostics.push_back(Diagnostic{DiagnosticKind::ValidationFailure, origin, record.row, failure});
				continue;
			}
			merged.push_back(std::move(*canonical));
			++kept;
		}
		CAMPUS_INFO("Successfully loaded: {} ({} of {} rows kept)", origin, kept,
		            rows.records.size() + rows.malformed.size());
	}

	// Stage 2: index the validated records by time.
	report.records_kept = merged.size();
	result.dataset = core::CanonicalDataset(std::move(merged));

	if (result.dataset.isEmpty()) {
		CAMPUS_WARN("Ingestion produced no valid records from {} sources.", report.sources_total);
	} else {
		CAMPUS_INFO("Ingested {} records from {} of {} sources with {} diagnostics.", report.records_kept,
		            report.sources_loaded, report.sources_total, report.diagnostics.size());
	}
	return result;
}

// --- Builder Implementation ---

IngestorBuilder &IngestorBuilder::withSource(std::shared_ptr<const IRowSource> source) {
	if (!source) {
		throw std::invalid_argument("Row source must not be null.");
	}
	sources_.push_back(std::move(source));
	return *this;
}

IngestorBuilder &IngestorBuilder::withSources(const std::vector<std::shared_ptr<IRowSource>> &sources) {
	for (const auto &source : sources) {
		withSource(source);
	}
	return *this;
}

IngestorBuilder &IngestorBuilder::withDateFormats(std::vector<std::string> formats) {
	options_.date_formats = std::move(formats);
	return *this;
}

Ingestor IngestorBuilder::build() {
	CAMPUS_DEBUG("Building Ingestor with {} sources.", sources_.size());
	return Ingestor(sources_, options_);
}

} // namespace campusenergy::ingest
