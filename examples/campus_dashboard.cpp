#include "campus-energy/pipeline.hpp"
#include "campus-energy/utils/logging.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

using namespace campusenergy;

namespace {

void printUsage(const char *program) {
	std::cerr << "Usage: " << program
	          << " [--data DIR] [--out DIR] [--bins N] [--no-sample] [--log-level LEVEL]\n"
	          << "  --data DIR          directory of per-building CSV files (default: data)\n"
	          << "  --out DIR           directory for exported files (default: .)\n"
	          << "  --bins N            kWh histogram bins (default: 20)\n"
	          << "  --no-sample         do not generate sample data when DIR is missing\n"
	          << "  --log-level LEVEL   trace, debug, info, warn, error, critical or off\n";
}

bool parseArguments(int argc, char **argv, PipelineConfig &config) {
	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];
		const auto next = [&]() -> const char * { return (i + 1 < argc) ? argv[++i] : nullptr; };

		if (arg == "--data") {
			const char *value = next();
			if (!value) {
				return false;
			}
			config.data_dir = value;
		} else if (arg == "--out") {
			const char *value = next();
			if (!value) {
				return false;
			}
			config.output_dir = value;
		} else if (arg == "--bins") {
			const char *value = next();
			if (!value) {
				return false;
			}
			char *end = nullptr;
			const long bins = std::strtol(value, &end, 10);
			if (end == value || *end != '\0' || bins <= 0) {
				std::cerr << "Invalid bin count: " << value << "\n";
				return false;
			}
			config.histogram_bins = static_cast<std::size_t>(bins);
		} else if (arg == "--no-sample") {
			config.generate_sample_if_missing = false;
		} else if (arg == "--log-level") {
			const char *value = next();
			if (!value) {
				return false;
			}
#ifndef CAMPUS_NO_LOGGING
			const auto level = utils::Logging::levelFromName(value);
			if (!level) {
				std::cerr << "Unknown log level: " << value << "\n";
				return false;
			}
			utils::Logging::init(*level);
#endif
		} else {
			std::cerr << "Unknown argument: " << arg << "\n";
			return false;
		}
	}
	return true;
}

} // namespace

int main(int argc, char **argv) {
	PipelineConfig config;
	if (!parseArguments(argc, argv, config)) {
		printUsage(argv[0]);
		return 2;
	}

	try {
		const Pipeline pipeline(config);
		const auto result = pipeline.run();

		for (const auto &report : result.registry.allReports()) {
			std::cout << report.toString() << '\n';
		}

		const auto files = pipeline.exportResults(result);
		std::cout << '\n' << result.summaryText();

		std::cout << "\nDashboard pipeline complete. Files exported:";
		for (const auto &file : files) {
			std::cout << ' ' << file.filename().string();
		}
		std::cout << '\n';
	} catch (const std::exception &e) {
		CAMPUS_CRITICAL("Pipeline failed: {}", e.what());
		std::cerr << "Error: " << e.what() << '\n';
		return 1;
	}
	return 0;
}
