#include "campus-energy/utils/logging.hpp"

#ifndef CAMPUS_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace campusenergy::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("campus-energy");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("campus-energy");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

std::optional<spdlog::level::level_enum> Logging::levelFromName(const std::string &name) {
	if (name == "trace") {
		return spdlog::level::trace;
	}
	if (name == "debug") {
		return spdlog::level::debug;
	}
	if (name == "info") {
		return spdlog::level::info;
	}
	if (name == "warn" || name == "warning") {
		return spdlog::level::warn;
	}
	if (name == "error") {
		return spdlog::level::err;
	}
	if (name == "critical") {
		return spdlog::level::critical;
	}
	if (name == "off") {
		return spdlog::level::off;
	}
	return std::nullopt;
}

} // namespace campusenergy::utils

#else

namespace campusenergy::utils {

// Empty implementation - nothing to do

} // namespace campusenergy::utils

#endif // CAMPUS_NO_LOGGING
