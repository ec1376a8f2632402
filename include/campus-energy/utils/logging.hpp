#pragma once

#ifndef CAMPUS_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace campusenergy::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the spdlog logger used by the pipeline.
 *
 * Ingestion reports per-source progress and skipped records through this
 * logger; the command-line driver configures its level at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance, creating it on first use.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/**
	 * @brief Maps a level name ("trace", "debug", "info", "warn", "error",
	 * "critical", "off") onto an spdlog level.
	 * @return The level, or std::nullopt if the name is not recognised.
	 */
	static std::optional<spdlog::level::level_enum> levelFromName(const std::string &name);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace campusenergy::utils

// --- Logger Macros for convenient access ---
#define CAMPUS_TRACE(...)    campusenergy::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define CAMPUS_DEBUG(...)    campusenergy::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define CAMPUS_INFO(...)     campusenergy::utils::Logging::getLogger()->info(__VA_ARGS__)
#define CAMPUS_WARN(...)     campusenergy::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define CAMPUS_ERROR(...)    campusenergy::utils::Logging::getLogger()->error(__VA_ARGS__)
#define CAMPUS_CRITICAL(...) campusenergy::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when spdlog is not available

namespace campusenergy::utils {

class Logging {
public:
	static void init() {}
};

} // namespace campusenergy::utils

#define CAMPUS_TRACE(...)    do {} while(0)
#define CAMPUS_DEBUG(...)    do {} while(0)
#define CAMPUS_INFO(...)     do {} while(0)
#define CAMPUS_WARN(...)     do {} while(0)
#define CAMPUS_ERROR(...)    do {} while(0)
#define CAMPUS_CRITICAL(...) do {} while(0)

#endif // CAMPUS_NO_LOGGING
