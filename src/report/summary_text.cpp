#include "campus-energy/report/summary_text.hpp"

#include <iomanip>
#include <sstream>

namespace campusenergy::report {

std::string renderSummary(const std::optional<summary::SummaryReport> &report,
                          const ingest::IngestionReport &ingestion) {
	std::ostringstream out;
	out << "Campus Energy Usage Summary\n";
	out << "===========================\n";

	if (!report) {
		out << kInsufficientData << ": no valid meter records were ingested.\n";
		out << "Total Campus Consumption: " << kInsufficientData << "\n";
		out << "Highest-Consuming Building: " << kInsufficientData << "\n";
		out << "Peak Load Time: " << kInsufficientData << "\n";
		out << "Weekly Trends: " << kInsufficientData << "\n";
	} else {
		const auto &weekly = report->weekly_trend;
		out << std::setprecision(15);
		out << "Total Campus Consumption: " << report->total_campus_kwh << " KWH\n";
		out << "Highest-Consuming Building: " << report->highest_consuming_building << " ("
		    << report->highest_building_kwh << " KWH)\n";
		out << "Peak Load Time: " << core::formatTimestamp(report->peak_load_timestamp) << " ("
		    << report->peak_load_building << ", " << report->peak_load_kwh << " KWH)\n";
		out << std::fixed << std::setprecision(2);
		out << "Weekly Trends (Mean: " << weekly.mean << ", Max: " << weekly.max << ")\n";
		out << "Weekly Distribution (Weeks: " << weekly.count << ", Min: " << weekly.min << ", 25%: " << weekly.p25
		    << ", 50%: " << weekly.median << ", 75%: " << weekly.p75 << ", Std: ";
		if (weekly.stddev) {
			out << *weekly.stddev;
		} else {
			out << "n/a";
		}
		out << ")\n";
		out << "Daily Trends: See dashboard for visualizations.\n";
	}

	out << "\nData Quality\n";
	out << "------------\n";
	out << "Sources loaded: " << ingestion.sources_loaded << " of " << ingestion.sources_total << "\n";
	out << "Records kept: " << ingestion.records_kept << " of " << ingestion.records_read << "\n";
	out << "Diagnostics: " << ingestion.diagnostics.size() << "\n";
	for (const auto &diagnostic : ingestion.diagnostics) {
		out << "  - " << diagnostic.toString() << "\n";
	}
	return out.str();
}

} // namespace campusenergy::report
