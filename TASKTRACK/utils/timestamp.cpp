#include "timestamp.hpp"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace tasktrack::time {
namespace {

constexpr std::int64_t kSecondsPerDay = 86400;
constexpr std::int64_t kNanosPerSecond = 1000000000;
// Seconds representable as int64 nanoseconds, roughly years 1678..2262.
constexpr std::int64_t kMaxEpochSeconds = std::numeric_limits<std::int64_t>::max() / kNanosPerSecond - 1;
constexpr std::int64_t kMinEpochSeconds = std::numeric_limits<std::int64_t>::min() / kNanosPerSecond + 1;

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct CivilDate {
    std::int64_t year;
    unsigned month;
    unsigned day;
};

CivilDate civil_from_days(std::int64_t z) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0), m, d};
}

bool is_leap(std::int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29u : kDays[m - 1];
}

bool read_digits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

}

std::string format_rfc3339(TimePoint tp) {
    using namespace std::chrono;
    const std::int64_t total = duration_cast<nanoseconds>(tp.time_since_epoch()).count();
    std::int64_t secs = total / kNanosPerSecond;
    std::int64_t nanos = total % kNanosPerSecond;
    if (nanos < 0) {
        nanos += kNanosPerSecond;
        secs -= 1;
    }
    std::int64_t days = secs / kSecondsPerDay;
    std::int64_t sod = secs % kSecondsPerDay;
    if (sod < 0) {
        sod += kSecondsPerDay;
        days -= 1;
    }
    const CivilDate date = civil_from_days(days);

    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << date.year << '-'
        << std::setw(2) << date.month << '-'
        << std::setw(2) << date.day << 'T'
        << std::setw(2) << sod / 3600 << ':'
        << std::setw(2) << (sod % 3600) / 60 << ':'
        << std::setw(2) << sod % 60;
    if (nanos != 0) {
        std::ostringstream frac;
        frac << std::setfill('0') << std::setw(9) << nanos;
        std::string digits = frac.str();
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        out << '.' << digits;
    }
    out << 'Z';
    return out.str();
}

std::optional<TimePoint> parse_rfc3339(std::string_view text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month)) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    std::int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (std::size_t i = digits; i < 9; ++i) {
            nanos *= 10;
        }
    }

    std::int64_t offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int off_h = 0, off_m = 0;
        if (!read_digits(text, pos, 2, off_h) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, off_m) || off_h > 23 || off_m > 59) {
            return std::nullopt;
        }
        offset_seconds = sign * (off_h * 3600 + off_m * 60);
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const std::int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const std::int64_t secs = days * kSecondsPerDay + hour * 3600 + minute * 60 + second - offset_seconds;
    if (secs > kMaxEpochSeconds || secs < kMinEpochSeconds) {
        return std::nullopt;
    }
    const std::chrono::nanoseconds since_epoch{secs * kNanosPerSecond + nanos};
    return TimePoint{std::chrono::duration_cast<Clock::duration>(since_epoch)};
}

std::string format_display(TimePoint tp) {
    const std::time_t t = Clock::to_time_t(tp);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    std::ostringstream out;
    out << std::put_time(&local, "%d %b %y %H:%M %Z");
    return out.str();
}

}
