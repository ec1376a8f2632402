#include "campus-energy/core/calendar.hpp"

#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace campusenergy::core {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400LL;

const std::int64_t kMinRepresentableSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(TimePoint::duration::min()).count() + 1;
const std::int64_t kMaxRepresentableSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(TimePoint::duration::max()).count() - 1;

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) {
	std::int64_t quotient = value / divisor;
	if ((value % divisor) != 0 && ((value < 0) != (divisor < 0))) {
		--quotient;
	}
	return quotient;
}

std::int64_t floorMod(std::int64_t value, std::int64_t divisor) {
	return value - floorDiv(value, divisor) * divisor;
}

std::string trimmed(const std::string &text) {
	const auto first = text.find_first_not_of(" \t\r\n");
	if (first == std::string::npos) {
		return {};
	}
	const auto last = text.find_last_not_of(" \t\r\n");
	return text.substr(first, last - first + 1);
}

unsigned daysInMonth(int year, unsigned month) {
	static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2) {
		const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
		return leap ? 29 : 28;
	}
	return kDays[month - 1];
}

} // namespace

std::string granularityName(Granularity granularity) {
	switch (granularity) {
	case Granularity::Day:
		return "day";
	case Granularity::Week:
		return "week";
	default:
		throw std::logic_error("Unsupported granularity.");
	}
}

std::chrono::hours periodLength(Granularity granularity) {
	switch (granularity) {
	case Granularity::Day:
		return std::chrono::hours(24);
	case Granularity::Week:
		return std::chrono::hours(24 * 7);
	default:
		throw std::logic_error("Unsupported granularity.");
	}
}

// Howard Hinnant's days_from_civil / civil_from_days.
std::int64_t daysFromCivil(const CivilDate &date) {
	const std::int64_t y = static_cast<std::int64_t>(date.year) - (date.month <= 2 ? 1 : 0);
	const std::int64_t era = floorDiv(y, 400);
	const std::int64_t yoe = y - era * 400;
	const std::int64_t mp = (static_cast<std::int64_t>(date.month) + 9) % 12;
	const std::int64_t doy = (153 * mp + 2) / 5 + static_cast<std::int64_t>(date.day) - 1;
	const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

CivilDate civilFromDays(std::int64_t days) {
	const std::int64_t z = days + 719468;
	const std::int64_t era = floorDiv(z, 146097);
	const std::int64_t doe = z - era * 146097;
	const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const std::int64_t mp = (5 * doy + 2) / 153;
	const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
	const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
	const std::int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
	return CivilDate{static_cast<int>(y), static_cast<unsigned>(m), static_cast<unsigned>(d)};
}

bool isValidCivilDate(const CivilDate &date) {
	if (date.month < 1 || date.month > 12 || date.day < 1) {
		return false;
	}
	return date.day <= daysInMonth(date.year, date.month);
}

std::int64_t dayKey(const TimePoint &tp) {
	const auto seconds = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
	return floorDiv(seconds, kSecondsPerDay);
}

TimePoint dayStart(const TimePoint &tp) {
	return TimePoint{} + std::chrono::seconds(dayKey(tp) * kSecondsPerDay);
}

TimePoint isoWeekStart(const TimePoint &tp) {
	const auto day = dayKey(tp);
	const auto monday = day - dayOfWeek(tp);
	return TimePoint{} + std::chrono::seconds(monday * kSecondsPerDay);
}

TimePoint bucketStart(const TimePoint &tp, Granularity granularity) {
	switch (granularity) {
	case Granularity::Day:
		return dayStart(tp);
	case Granularity::Week:
		return isoWeekStart(tp);
	default:
		throw std::logic_error("Unsupported granularity.");
	}
}

int dayOfWeek(const TimePoint &tp) {
	// 1970-01-01 was a Thursday (Monday = 0 => Thursday = 3).
	return static_cast<int>(floorMod(dayKey(tp) + 3, 7));
}

int monthOf(const TimePoint &tp) {
	return static_cast<int>(civilFromDays(dayKey(tp)).month);
}

const std::vector<std::string> &defaultDateFormats() {
	static const std::vector<std::string> formats{
	    "%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M", "%Y-%m-%dT%H:%M", "%Y-%m-%d"};
	return formats;
}

std::optional<TimePoint> parseTimestamp(const std::string &text, const std::vector<std::string> &formats) {
	std::string field = trimmed(text);
	if (!field.empty() && (field.back() == 'Z' || field.back() == 'z')) {
		field.pop_back();
	}
	if (field.empty()) {
		return std::nullopt;
	}

	for (const auto &format : formats) {
		std::tm tm{};
		std::istringstream stream(field);
		stream.imbue(std::locale::classic());
		stream >> std::get_time(&tm, format.c_str());
		if (stream.fail()) {
			continue;
		}
		if (stream.peek() != std::char_traits<char>::eof()) {
			continue;
		}

		const CivilDate date{tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1),
		                     static_cast<unsigned>(tm.tm_mday)};
		if (!isValidCivilDate(date)) {
			return std::nullopt;
		}
		if (tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59) {
			return std::nullopt;
		}
		const std::int64_t seconds = daysFromCivil(date) * kSecondsPerDay + tm.tm_hour * 3600LL +
		                             tm.tm_min * 60LL + tm.tm_sec;
		// TimePoint ticks in nanoseconds and cannot hold every four-digit year.
		if (seconds < kMinRepresentableSeconds || seconds > kMaxRepresentableSeconds) {
			return std::nullopt;
		}
		return TimePoint{} + std::chrono::seconds(seconds);
	}
	return std::nullopt;
}

std::string formatTimestamp(const TimePoint &tp, bool date_only) {
	const auto day = dayKey(tp);
	const auto date = civilFromDays(day);
	const auto seconds = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
	const auto second_of_day = seconds - day * kSecondsPerDay;

	std::ostringstream out;
	out << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month << '-'
	    << std::setw(2) << date.day;
	if (!date_only) {
		out << ' ' << std::setw(2) << second_of_day / 3600 << ':' << std::setw(2) << (second_of_day / 60) % 60
		    << ':' << std::setw(2) << second_of_day % 60;
	}
	return out.str();
}

} // namespace campusenergy::core
