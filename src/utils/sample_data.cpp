#include "campus-energy/utils/sample_data.hpp"

#include "campus-energy/core/calendar.hpp"
#include "campus-energy/utils/logging.hpp"

#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>

namespace campusenergy::utils {

std::vector<std::filesystem::path> generateSampleData(const std::filesystem::path &directory,
                                                      const SampleDataConfig &config) {
	if (config.buildings.empty()) {
		throw std::invalid_argument("Sample data requires at least one building.");
	}
	if (config.max_kwh <= config.min_kwh) {
		throw std::invalid_argument("Sample kWh range must be non-empty.");
	}

	std::error_code ec;
	std::filesystem::create_directories(directory, ec);
	if (ec) {
		throw std::runtime_error("Cannot create sample data directory " + directory.string() + ": " + ec.message());
	}

	const auto first_day = core::daysFromCivil(core::CivilDate{config.year, 1, 1});
	const auto next_year = core::daysFromCivil(core::CivilDate{config.year + 1, 1, 1});

	std::mt19937 rng(config.seed);
	std::uniform_int_distribution<int> kwh(config.min_kwh, config.max_kwh - 1);

	std::vector<std::filesystem::path> written;
	for (const auto &building : config.buildings) {
		const auto path = directory / (building + ".csv");
		std::ofstream out(path, std::ios::out | std::ios::trunc);
		if (!out) {
			throw std::runtime_error("Cannot open " + path.string() + " for writing.");
		}
		out << "Date,Building,KWH\n";
		for (auto day = first_day; day < next_year; ++day) {
			const auto tp = core::TimePoint{} + std::chrono::hours(24 * day);
			out << core::formatTimestamp(tp, true) << ',' << building << ',' << kwh(rng) << '\n';
		}
		out.flush();
		if (!out) {
			throw std::runtime_error("Failed writing " + path.string() + ".");
		}
		written.push_back(path);
	}
	CAMPUS_INFO("Generated sample data for {} buildings in {}", written.size(), directory.string());
	return written;
}

} // namespace campusenergy::utils
