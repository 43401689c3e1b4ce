/**
 * @file date_time.cpp
 * @brief Civil calendar conversions for DateTime
 */

#include "soon/date_time.h"

#include <cctype>
#include <cstdio>

namespace soon {

namespace {

constexpr int64_t kMsPerDay = 86400000;

bool is_digit_at(const std::string& s, size_t pos) {
    return pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]));
}

bool digits_at(const std::string& s, size_t pos, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        if (!is_digit_at(s, pos + i)) return false;
    }
    return true;
}

int read_int(const std::string& s, size_t pos, size_t count) {
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        value = value * 10 + (s[pos + i] - '0');
    }
    return value;
}

bool is_leap(int64_t year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int64_t year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) return 29;
    return kDays[month - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm)
int64_t days_from_civil(int64_t y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civil_from_days(int64_t z, int64_t& y, int& m, int& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = yoe + era * 400 + (m <= 2 ? 1 : 0);
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // anonymous namespace

DateTime DateTime::invalid() {
    DateTime dt;
    dt.valid_ = false;
    return dt;
}

DateTime DateTime::from_time_point(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    return DateTime(static_cast<int64_t>(ms.count()));
}

std::optional<DateTime> DateTime::from_fields(int year, int month, int day,
                                              int hour, int minute,
                                              int second, int millisecond) {
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
    if (hour < 0 || hour > 23) return std::nullopt;
    if (minute < 0 || minute > 59) return std::nullopt;
    if (second < 0 || second > 59) return std::nullopt;
    if (millisecond < 0 || millisecond > 999) return std::nullopt;

    int64_t days = days_from_civil(year, month, day);
    int64_t ms = days * kMsPerDay
               + static_cast<int64_t>(hour) * 3600000
               + static_cast<int64_t>(minute) * 60000
               + static_cast<int64_t>(second) * 1000
               + millisecond;
    return DateTime(ms);
}

std::optional<DateTime> DateTime::parse(const std::string& text) {
    if (text.empty() || match_iso8601(text, 0) != text.size()) {
        return std::nullopt;
    }

    int year = read_int(text, 0, 4);
    int month = read_int(text, 5, 2);
    int day = read_int(text, 8, 2);
    int hour = 0, minute = 0, second = 0, millisecond = 0;
    int offset_minutes = 0;

    size_t pos = 10;
    if (pos < text.size() && text[pos] == 'T') {
        hour = read_int(text, 11, 2);
        minute = read_int(text, 14, 2);
        pos = 16;
        if (pos < text.size() && text[pos] == ':') {
            second = read_int(text, pos + 1, 2);
            pos += 3;
        }
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int scale = 100;
            while (is_digit_at(text, pos)) {
                millisecond += (text[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
        }
        if (pos < text.size() && text[pos] == 'Z') {
            ++pos;
        } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            int sign = text[pos] == '-' ? -1 : 1;
            int oh = read_int(text, pos + 1, 2);
            int om = read_int(text, pos + 4, 2);
            if (oh > 23 || om > 59) return std::nullopt;
            offset_minutes = sign * (oh * 60 + om);
        }
    }

    auto local = from_fields(year, month, day, hour, minute, second, millisecond);
    if (!local) return std::nullopt;
    return DateTime(local->epoch_ms() - static_cast<int64_t>(offset_minutes) * 60000);
}

std::chrono::system_clock::time_point DateTime::time_point() const {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(epoch_ms_)));
}

int DateTime::year() const {
    int64_t y;
    int m, d;
    civil_from_days(floor_div(epoch_ms_, kMsPerDay), y, m, d);
    return static_cast<int>(y);
}

std::string DateTime::to_iso_string() const {
    if (!valid_) {
        return std::string();
    }

    int64_t days = floor_div(epoch_ms_, kMsPerDay);
    int64_t rem = epoch_ms_ - days * kMsPerDay;

    int64_t y;
    int m, d;
    civil_from_days(days, y, m, d);

    int hour = static_cast<int>(rem / 3600000);
    int minute = static_cast<int>((rem / 60000) % 60);
    int second = static_cast<int>((rem / 1000) % 60);
    int ms = static_cast<int>(rem % 1000);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04lld-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(y), m, d, hour, minute, second, ms);
    return buf;
}

size_t match_iso8601(const std::string& text, size_t pos) {
    size_t p = pos;
    if (!digits_at(text, p, 4) || p + 4 >= text.size() || text[p + 4] != '-') return 0;
    p += 5;
    if (!digits_at(text, p, 2) || p + 2 >= text.size() || text[p + 2] != '-') return 0;
    p += 3;
    if (!digits_at(text, p, 2)) return 0;
    p += 2;

    // Optional time part: T\d{2}:\d{2}
    if (p < text.size() && text[p] == 'T' && digits_at(text, p + 1, 2) &&
        p + 3 < text.size() && text[p + 3] == ':' && digits_at(text, p + 4, 2)) {
        p += 6;
        if (p < text.size() && text[p] == ':' && digits_at(text, p + 1, 2)) {
            p += 3;
        }
        if (p < text.size() && text[p] == '.' && is_digit_at(text, p + 1)) {
            ++p;
            while (is_digit_at(text, p)) ++p;
        }
        if (p < text.size() && text[p] == 'Z') {
            ++p;
        } else if (p < text.size() && (text[p] == '+' || text[p] == '-') &&
                   digits_at(text, p + 1, 2) && p + 3 < text.size() &&
                   text[p + 3] == ':' && digits_at(text, p + 4, 2)) {
            p += 6;
        }
    }

    return p - pos;
}

} // namespace soon
