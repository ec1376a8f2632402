#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace campusenergy::utils {

struct SampleDataConfig {
	std::vector<std::string> buildings{"Library", "Dormitory", "Cafeteria"};
	int year = 2023;
	int min_kwh = 100; // inclusive
	int max_kwh = 500; // exclusive
	std::uint32_t seed = 42;
};

/**
 * @brief Writes one demonstration CSV per building (`<name>.csv` with
 * columns Date,Building,KWH) holding one row per day of the configured year.
 * @return The files written, in building order.
 * @throws std::invalid_argument On an empty building list or kWh range.
 * @throws std::runtime_error If the directory or a file cannot be written.
 */
std::vector<std::filesystem::path> generateSampleData(const std::filesystem::path &directory,
                                                      const SampleDataConfig &config = {});

} // namespace campusenergy::utils
