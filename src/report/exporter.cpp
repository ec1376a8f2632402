#include "campus-energy/report/exporter.hpp"

#include "campus-energy/utils/logging.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <system_error>

namespace campusenergy::report {

namespace {

std::ofstream openForWrite(const std::filesystem::path &path) {
	std::ofstream out(path, std::ios::out | std::ios::trunc);
	if (!out) {
		throw std::runtime_error("Cannot open " + path.string() + " for writing.");
	}
	out << std::setprecision(15);
	return out;
}

void finish(std::ofstream &out, const std::filesystem::path &path) {
	out.flush();
	if (!out) {
		throw std::runtime_error("Failed writing " + path.string() + ".");
	}
	CAMPUS_DEBUG("Wrote {}", path.string());
}

std::string csvField(const std::string &value) {
	if (value.find_first_of(",\"\n") == std::string::npos) {
		return value;
	}
	std::string quoted = "\"";
	for (char c : value) {
		if (c == '"') {
			quoted.push_back('"');
		}
		quoted.push_back(c);
	}
	quoted.push_back('"');
	return quoted;
}

} // namespace

Exporter::Exporter(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {
	std::error_code ec;
	std::filesystem::create_directories(output_dir_, ec);
	if (ec) {
		throw std::runtime_error("Cannot create output directory " + output_dir_.string() + ": " + ec.message());
	}
}

std::filesystem::path Exporter::writeCleanedDataset(const core::CanonicalDataset &dataset) const {
	const auto path = output_dir_ / kCleanedDataFile;
	auto out = openForWrite(path);
	out << "Date,Building,KWH,Month\n";
	for (const auto &record : dataset) {
		out << core::formatTimestamp(record.timestamp) << ',' << csvField(record.building) << ',' << record.kwh << ','
		    << record.month << '\n';
	}
	finish(out, path);
	return path;
}

std::filesystem::path Exporter::writeBuildingSummary(const aggregate::BuildingSummaryTable &table) const {
	const auto path = output_dir_ / kBuildingSummaryFile;
	auto out = openForWrite(path);
	out << "Building,mean,min,max,sum\n";
	for (const auto &[building, stats] : table) {
		out << csvField(building) << ',' << stats.mean << ',' << stats.min << ',' << stats.max << ',' << stats.sum
		    << '\n';
	}
	finish(out, path);
	return path;
}

std::filesystem::path Exporter::writeSummaryText(const std::string &text) const {
	const auto path = output_dir_ / kSummaryFile;
	auto out = openForWrite(path);
	out << text;
	finish(out, path);
	return path;
}

std::vector<std::filesystem::path> Exporter::writeDashboard(const DashboardViews &views) const {
	std::vector<std::filesystem::path> written;

	{
		const auto path = output_dir_ / kDailyTrendFile;
		auto out = openForWrite(path);
		out << "Date,KWH\n";
		const auto &starts = views.daily_trend.getTimestamps();
		const auto &values = views.daily_trend.getValues();
		for (std::size_t i = 0; i < starts.size(); ++i) {
			out << core::formatTimestamp(starts[i], true) << ',' << values[i] << '\n';
		}
		finish(out, path);
		written.push_back(path);
	}

	{
		const auto path = output_dir_ / kWeeklyUsageFile;
		auto out = openForWrite(path);
		const auto &usage = views.weekly_usage;
		out << "Week";
		for (const auto &building : usage.buildings) {
			out << ',' << csvField(building);
		}
		out << '\n';
		for (std::size_t w = 0; w < usage.week_starts.size(); ++w) {
			out << core::formatTimestamp(usage.week_starts[w], true);
			for (Eigen::Index b = 0; b < usage.weekly_mean.cols(); ++b) {
				const double cell = usage.weekly_mean(static_cast<Eigen::Index>(w), b);
				out << ',';
				if (std::isfinite(cell)) {
					out << cell;
				}
			}
			out << '\n';
		}
		out << "Average";
		for (Eigen::Index b = 0; b < usage.average_by_building.size(); ++b) {
			out << ',' << usage.average_by_building(b);
		}
		out << '\n';
		finish(out, path);
		written.push_back(path);
	}

	{
		const auto path = output_dir_ / kDayOfWeekFile;
		auto out = openForWrite(path);
		out << "DayOfWeek,KWH\n";
		for (const auto &point : views.day_of_week) {
			out << point.day_of_week << ',' << point.kwh << '\n';
		}
		finish(out, path);
		written.push_back(path);
	}

	{
		const auto path = output_dir_ / kHistogramFile;
		auto out = openForWrite(path);
		out << "Lower,Upper,Count\n";
		for (const auto &bin : views.kwh_histogram) {
			out << bin.lower << ',' << bin.upper << ',' << bin.count << '\n';
		}
		finish(out, path);
		written.push_back(path);
	}

	CAMPUS_INFO("Dashboard data written to {}", output_dir_.string());
	return written;
}

} // namespace campusenergy::report
