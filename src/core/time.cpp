#include "gcli/core/time.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gcli {
namespace {

bool read_digits(const std::string& text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

// Days from 1970-01-01 to the given civil date (proleptic Gregorian).
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::tm to_utc_tm(Timestamp timestamp) {
    const std::time_t raw = static_cast<std::time_t>(timestamp);
    std::tm tm{};
    gmtime_r(&raw, &tm);
    return tm;
}

} // namespace

Timestamp system_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

Result<Timestamp> parse_iso8601(const std::string& text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    const bool date_ok = read_digits(text, pos, 4, year) && expect(text, pos, '-') &&
                         read_digits(text, pos, 2, month) && expect(text, pos, '-') &&
                         read_digits(text, pos, 2, day);
    if (!date_ok || pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        return Err<Timestamp>(ErrorKind::DataError, "Invalid ISO-8601 date: " + text);
    }
    ++pos;

    const bool time_ok = read_digits(text, pos, 2, hour) && expect(text, pos, ':') &&
                         read_digits(text, pos, 2, minute) && expect(text, pos, ':') &&
                         read_digits(text, pos, 2, second);
    if (!time_ok || month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return Err<Timestamp>(ErrorKind::DataError, "Invalid ISO-8601 time: " + text);
    }

    // Fractional seconds are truncated
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
    }

    std::int64_t offset_seconds = 0;
    if (pos < text.size()) {
        const char designator = text[pos++];
        if (designator == '+' || designator == '-') {
            int off_hour = 0, off_minute = 0;
            if (!read_digits(text, pos, 2, off_hour)) {
                return Err<Timestamp>(ErrorKind::DataError, "Invalid ISO-8601 offset: " + text);
            }
            if (pos < text.size() && text[pos] == ':') {
                ++pos;
            }
            if (pos < text.size() && !read_digits(text, pos, 2, off_minute)) {
                return Err<Timestamp>(ErrorKind::DataError, "Invalid ISO-8601 offset: " + text);
            }
            offset_seconds = (off_hour * 3600 + off_minute * 60) * (designator == '+' ? 1 : -1);
        } else if (designator != 'Z' && designator != 'z') {
            return Err<Timestamp>(ErrorKind::DataError, "Invalid ISO-8601 zone: " + text);
        }
    }

    if (pos != text.size()) {
        return Err<Timestamp>(ErrorKind::DataError, "Trailing characters in ISO-8601 date: " + text);
    }

    const std::int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const Timestamp timestamp = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
    return Ok(timestamp);
}

std::string format_iso8601(Timestamp timestamp) {
    const std::tm tm = to_utc_tm(timestamp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string format_basic_iso8601(Timestamp timestamp) {
    const std::tm tm = to_utc_tm(timestamp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

} // namespace gcli
