#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace campusenergy::ingest {

/**
 * @brief An unvalidated input row. Fields are the raw text of the `Date`,
 * `KWH` and `Building` columns; a field is absent when the source has no
 * such column.
 */
struct RawRecord {
	std::optional<std::string> date;
	std::optional<std::string> kwh;
	std::optional<std::string> building;
	std::size_t row = 0; // 1-based data row within its source
};

enum class DiagnosticKind {
	SourceUnavailable,
	RecordMalformed,
	ValidationFailure
};

std::string diagnosticKindName(DiagnosticKind kind);

struct Diagnostic {
	DiagnosticKind kind = DiagnosticKind::ValidationFailure;
	std::string origin;
	std::optional<std::size_t> row;
	std::string message;

	std::string toString() const;
};

/**
 * @brief Result of reading one source: the rows it could split into fields
 * and the rows it had to skip.
 */
struct SourceRows {
	std::vector<RawRecord> records;
	std::vector<Diagnostic> malformed;
};

/**
 * @brief Per-run account of what ingestion read, kept and skipped.
 */
struct IngestionReport {
	std::size_t sources_total = 0;
	std::size_t sources_loaded = 0;
	std::size_t records_read = 0;
	std::size_t records_kept = 0;
	std::vector<Diagnostic> diagnostics;

	std::size_t count(DiagnosticKind kind) const;

	bool clean() const {
		return diagnostics.empty();
	}
};

} // namespace campusenergy::ingest
