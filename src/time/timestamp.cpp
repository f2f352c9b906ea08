#include "time/timestamp.hpp"
#include "common/errors.hpp"
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tempo {

namespace {

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// Proleptic Gregorian calendar <-> day count (H. Hinnant's algorithms)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& year, unsigned& month, unsigned& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
}

bool is_leap_year(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int64_t year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool fields_valid(int year, int month, int day, int hour, int minute, int second) {
    if (year < 1 || year > 9999) return false;
    if (month < 1 || month > 12) return false;
    if (day < 1 || day > days_in_month(year, month)) return false;
    if (hour < 0 || hour > 23) return false;
    if (minute < 0 || minute > 59) return false;
    if (second < 0 || second > 59) return false;
    return true;
}

int64_t local_seconds(const RawTimestamp& raw) {
    int64_t days = days_from_civil(raw.year, static_cast<unsigned>(raw.month),
                                   static_cast<unsigned>(raw.day));
    return days * Timestamp::kSecondsPerDay + raw.hour * 3600 + raw.minute * 60 + raw.second;
}

int64_t utc_seconds(const RawTimestamp& raw, int offset_minutes) {
    return local_seconds(raw) - static_cast<int64_t>(offset_minutes) * 60;
}

// Reads exactly `width` decimal digits
bool read_digits(const std::string& s, size_t& pos, size_t width, int& out) {
    if (pos + width > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < width; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    pos += width;
    return true;
}

bool consume(const std::string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::string format_offset(int offset_minutes) {
    if (offset_minutes == 0) {
        return "Z";
    }
    std::ostringstream ss;
    int abs_minutes = std::abs(offset_minutes);
    ss << (offset_minutes < 0 ? '-' : '+')
       << std::setw(2) << std::setfill('0') << abs_minutes / 60 << ':'
       << std::setw(2) << std::setfill('0') << abs_minutes % 60;
    return ss.str();
}

} // namespace

// ==========================================
// Timestamp Implementation
// ==========================================

Timestamp Timestamp::from_unix_seconds(int64_t seconds) {
    return Timestamp(seconds);
}

Timestamp Timestamp::from_civil(int year, int month, int day, int hour, int minute, int second) {
    if (!fields_valid(year, month, day, hour, minute, second)) {
        throw std::invalid_argument("Calendar fields out of range");
    }
    RawTimestamp raw;
    raw.year = year;
    raw.month = month;
    raw.day = day;
    raw.hour = hour;
    raw.minute = minute;
    raw.second = second;
    return Timestamp(local_seconds(raw));
}

Timestamp Timestamp::parse(const std::string& text) {
    return TimestampNormalizer().normalize(text);
}

Timestamp Timestamp::parse_zoned(const std::string& text) {
    RawTimestamp raw = parse_timestamp(text);
    if (!raw.is_zone_aware()) {
        throw TimestampParseError(text);
    }
    return TimestampNormalizer().normalize(raw);
}

Timestamp Timestamp::now() {
    return TimestampNormalizer().normalize(std::chrono::system_clock::now());
}

int64_t Timestamp::days_since_epoch() const {
    return floor_div(seconds_, kSecondsPerDay);
}

int64_t Timestamp::week_bucket(int layer_days) const {
    if (layer_days <= 0) {
        throw std::invalid_argument("Layer width must be positive");
    }
    return floor_div(days_since_epoch(), layer_days);
}

std::string Timestamp::to_iso8601() const {
    int64_t days = days_since_epoch();
    int64_t second_of_day = seconds_ - days * kSecondsPerDay;

    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    std::ostringstream ss;
    ss << std::setfill('0')
       << std::setw(4) << year << '-'
       << std::setw(2) << month << '-'
       << std::setw(2) << day << 'T'
       << std::setw(2) << second_of_day / 3600 << ':'
       << std::setw(2) << (second_of_day % 3600) / 60 << ':'
       << std::setw(2) << second_of_day % 60 << 'Z';
    return ss.str();
}

std::string Timestamp::to_date_string() const {
    return to_iso8601().substr(0, 10);
}

// ==========================================
// RawTimestamp / Parsing
// ==========================================

std::string RawTimestamp::to_string() const {
    std::ostringstream ss;
    ss << std::setfill('0')
       << std::setw(4) << year << '-'
       << std::setw(2) << month << '-'
       << std::setw(2) << day << 'T'
       << std::setw(2) << hour << ':'
       << std::setw(2) << minute << ':'
       << std::setw(2) << second;
    if (utc_offset_minutes.has_value()) {
        ss << format_offset(*utc_offset_minutes);
    }
    return ss.str();
}

RawTimestamp parse_timestamp(const std::string& text) {
    const std::string s = trim(text);
    size_t pos = 0;
    RawTimestamp raw;

    if (!read_digits(s, pos, 4, raw.year) || !consume(s, pos, '-') ||
        !read_digits(s, pos, 2, raw.month) || !consume(s, pos, '-') ||
        !read_digits(s, pos, 2, raw.day)) {
        throw TimestampParseError(text);
    }

    // Optional time of day
    if (pos < s.size() && (s[pos] == 'T' || s[pos] == 't' || s[pos] == ' ')) {
        ++pos;
        if (!read_digits(s, pos, 2, raw.hour) || !consume(s, pos, ':') ||
            !read_digits(s, pos, 2, raw.minute)) {
            throw TimestampParseError(text);
        }
        if (consume(s, pos, ':')) {
            if (!read_digits(s, pos, 2, raw.second)) {
                throw TimestampParseError(text);
            }
            if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
                ++pos;
                size_t fraction_start = pos;
                while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                    ++pos;
                }
                if (pos == fraction_start) {
                    throw TimestampParseError(text);
                }
            }
        }
    }

    // Optional zone designator
    if (pos < s.size()) {
        char c = s[pos];
        if (c == 'Z' || c == 'z') {
            raw.utc_offset_minutes = 0;
            ++pos;
        } else if (c == '+' || c == '-') {
            int sign = (c == '-') ? -1 : 1;
            ++pos;
            int offset_hours = 0;
            int offset_minutes = 0;
            if (!read_digits(s, pos, 2, offset_hours)) {
                throw TimestampParseError(text);
            }
            if (consume(s, pos, ':') || pos < s.size()) {
                if (!read_digits(s, pos, 2, offset_minutes)) {
                    throw TimestampParseError(text);
                }
            }
            if (offset_hours > 23 || offset_minutes > 59) {
                throw TimestampParseError(text);
            }
            raw.utc_offset_minutes = sign * (offset_hours * 60 + offset_minutes);
        }
    }

    if (pos != s.size() ||
        !fields_valid(raw.year, raw.month, raw.day, raw.hour, raw.minute, raw.second)) {
        throw TimestampParseError(text);
    }

    return raw;
}

int compare_raw(const RawTimestamp& a, const RawTimestamp& b) {
    if (a.is_zone_aware() != b.is_zone_aware()) {
        throw IncomparableTimestampError(
            "Cannot compare zone-aware and zone-naive timestamps: " +
            a.to_string() + " vs " + b.to_string());
    }

    int64_t lhs = a.is_zone_aware() ? utc_seconds(a, *a.utc_offset_minutes) : local_seconds(a);
    int64_t rhs = b.is_zone_aware() ? utc_seconds(b, *b.utc_offset_minutes) : local_seconds(b);

    if (lhs < rhs) return -1;
    if (lhs > rhs) return 1;
    return 0;
}

// ==========================================
// TimestampNormalizer Implementation
// ==========================================

TimestampNormalizer::TimestampNormalizer(int naive_offset_minutes)
    : naive_offset_minutes_(naive_offset_minutes) {
    if (naive_offset_minutes < -24 * 60 || naive_offset_minutes > 24 * 60) {
        throw std::invalid_argument("Naive offset must lie within +/-24h");
    }
}

Timestamp TimestampNormalizer::normalize(const RawTimestamp& raw) const {
    if (!fields_valid(raw.year, raw.month, raw.day, raw.hour, raw.minute, raw.second)) {
        throw TimestampParseError(raw.to_string());
    }
    int offset = raw.utc_offset_minutes.value_or(naive_offset_minutes_);
    return Timestamp::from_unix_seconds(utc_seconds(raw, offset));
}

Timestamp TimestampNormalizer::normalize(const std::string& text) const {
    return normalize(parse_timestamp(text));
}

Timestamp TimestampNormalizer::normalize(std::chrono::system_clock::time_point tp) const {
    auto seconds = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch());
    return Timestamp::from_unix_seconds(static_cast<int64_t>(seconds.count()));
}

} // namespace tempo
