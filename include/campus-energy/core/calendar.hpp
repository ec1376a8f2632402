#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace campusenergy::core {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Calendar period used when resampling a time-indexed dataset.
 *
 * Periods are evaluated in UTC. A week is an ISO week: it starts on Monday at
 * 00:00 and the bucket is labelled by that Monday.
 */
enum class Granularity {
	Day,
	Week
};

std::string granularityName(Granularity granularity);

/**
 * @brief Length of one period of the given granularity.
 */
std::chrono::hours periodLength(Granularity granularity);

struct CivilDate {
	int year = 1970;
	unsigned month = 1;
	unsigned day = 1;
};

/// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(const CivilDate &date);

CivilDate civilFromDays(std::int64_t days);

bool isValidCivilDate(const CivilDate &date);

/**
 * @brief Floor of the number of whole days between the epoch and tp.
 */
std::int64_t dayKey(const TimePoint &tp);

TimePoint dayStart(const TimePoint &tp);

TimePoint isoWeekStart(const TimePoint &tp);

TimePoint bucketStart(const TimePoint &tp, Granularity granularity);

/**
 * @brief Day of week with Monday = 0 ... Sunday = 6.
 */
int dayOfWeek(const TimePoint &tp);

/**
 * @brief Calendar month, 1-12.
 */
int monthOf(const TimePoint &tp);

/**
 * @brief Default accepted layouts, tried in order. Every layout must consume
 * the whole field; a trailing 'Z' is accepted and ignored.
 */
const std::vector<std::string> &defaultDateFormats();

/**
 * @brief Parses a UTC date or date-time.
 * @param text The field text; surrounding whitespace is ignored.
 * @param formats std::get_time layouts to try, in order.
 * @return The parsed instant, or std::nullopt if no layout matches exactly
 * or the calendar date does not exist.
 */
std::optional<TimePoint> parseTimestamp(const std::string &text,
                                        const std::vector<std::string> &formats = defaultDateFormats());

/**
 * @brief Formats tp as "YYYY-MM-DD HH:MM:SS", or "YYYY-MM-DD" when
 * date_only is set.
 */
std::string formatTimestamp(const TimePoint &tp, bool date_only = false);

} // namespace campusenergy::core
