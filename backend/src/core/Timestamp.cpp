#include "core/Timestamp.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ipscout {

static bool read_int(const std::string& s, size_t pos, size_t len, int& out) {
    if (pos + len > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

std::string format_iso8601(TimePoint tp) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    int64_t secs = us / 1000000;
    int64_t frac = us % 1000000;
    if (frac < 0) { frac += 1000000; secs -= 1; }

    std::time_t tt = (std::time_t)secs;
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << (tm.tm_year + 1900) << "-" << std::setw(2) << (tm.tm_mon + 1) << "-" << std::setw(2) << tm.tm_mday
        << "T" << std::setw(2) << tm.tm_hour << ":" << std::setw(2) << tm.tm_min << ":" << std::setw(2) << tm.tm_sec
        << "." << std::setw(6) << frac << "Z";
    return out.str();
}

std::optional<TimePoint> parse_iso8601(const std::string& text) {
    // 2025-03-14T09:26:53[.ffffff][Z|+hh:mm]
    int year, mon, day, hour, min, sec;
    if (text.size() < 19) return std::nullopt;
    if (!read_int(text, 0, 4, year) || text[4] != '-' ||
        !read_int(text, 5, 2, mon) || text[7] != '-' ||
        !read_int(text, 8, 2, day) || (text[10] != 'T' && text[10] != ' ') ||
        !read_int(text, 11, 2, hour) || text[13] != ':' ||
        !read_int(text, 14, 2, min) || text[16] != ':' ||
        !read_int(text, 17, 2, sec)) {
        return std::nullopt;
    }
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60) return std::nullopt;

    size_t pos = 19;
    int64_t micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 6; ++digits) micros *= 10;
    }

    int64_t offset_s = 0;
    if (pos < text.size()) {
        char z = text[pos];
        if (z == 'Z') {
            ++pos;
        } else if (z == '+' || z == '-') {
            int oh, om;
            if (!read_int(text, pos + 1, 2, oh) || text.size() < pos + 6 || text[pos + 3] != ':' ||
                !read_int(text, pos + 4, 2, om)) {
                return std::nullopt;
            }
            offset_s = static_cast<int64_t>(oh) * 3600 + static_cast<int64_t>(om) * 60;
            if (z == '-') offset_s = -offset_s;
            pos += 6;
        }
        if (pos != text.size()) return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    std::time_t tt = timegm(&tm);

    auto tp = Clock::from_time_t(tt) - std::chrono::seconds(offset_s);
    return tp + std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros));
}

std::string format_local(TimePoint tp) {
    std::time_t tt = Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

} // namespace ipscout
