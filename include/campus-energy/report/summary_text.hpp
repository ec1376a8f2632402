#pragma once

#include "campus-energy/ingest/raw_record.hpp"
#include "campus-energy/summary/summary_builder.hpp"

#include <optional>
#include <string>

namespace campusenergy::report {

/// Marker written in place of every derived fact when no valid data exists.
inline constexpr const char *kInsufficientData = "Insufficient data";

/**
 * @brief Renders the executive summary as plain text.
 *
 * When report is empty, the headline facts are replaced by the
 * insufficient-data marker. The ingestion account and every diagnostic are
 * listed at the end.
 */
std::string renderSummary(const std::optional<summary::SummaryReport> &report,
                          const ingest::IngestionReport &ingestion);

} // namespace campusenergy::report
