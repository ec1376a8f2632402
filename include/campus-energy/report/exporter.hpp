#pragma once

#include "campus-energy/aggregate/aggregator.hpp"
#include "campus-energy/core/canonical_dataset.hpp"
#include "campus-energy/report/dashboard_views.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace campusenergy::report {

/**
 * @class Exporter
 * @brief Writes run outputs as flat files into one directory.
 *
 * Every write throws std::runtime_error when the file cannot be written.
 */
class Exporter {
public:
	static constexpr const char *kCleanedDataFile = "cleaned_energy_data.csv";
	static constexpr const char *kBuildingSummaryFile = "building_summary.csv";
	static constexpr const char *kSummaryFile = "summary.txt";
	static constexpr const char *kDailyTrendFile = "dashboard_daily.csv";
	static constexpr const char *kWeeklyUsageFile = "dashboard_weekly_by_building.csv";
	static constexpr const char *kDayOfWeekFile = "dashboard_day_of_week.csv";
	static constexpr const char *kHistogramFile = "dashboard_histogram.csv";

	/**
	 * @param output_dir Created if it does not exist.
	 */
	explicit Exporter(std::filesystem::path output_dir);

	const std::filesystem::path &outputDir() const {
		return output_dir_;
	}

	/// Date,Building,KWH,Month
	std::filesystem::path writeCleanedDataset(const core::CanonicalDataset &dataset) const;

	/// Building,mean,min,max,sum
	std::filesystem::path writeBuildingSummary(const aggregate::BuildingSummaryTable &table) const;

	std::filesystem::path writeSummaryText(const std::string &text) const;

	/**
	 * @brief Writes the four dashboard views, one file each.
	 */
	std::vector<std::filesystem::path> writeDashboard(const DashboardViews &views) const;

private:
	std::filesystem::path output_dir_;
};

} // namespace campusenergy::report
