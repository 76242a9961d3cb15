/*
 * File: include/common/iso8601.hpp
 * Project: Greet Service
 * Purpose: ISO-8601 UTC timestamps for response bodies and log lines
 * Notes:
 *  - gmtime_r / timegm: safe to call from any io_context thread
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

// RFC3339 UTC with milliseconds (e.g., 2026-10-18T14:59:01.234Z)
inline std::string iso8601_ms(std::chrono::system_clock::time_point t)
{
    using namespace std::chrono;
    auto tp = time_point_cast<milliseconds>(t);
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    if (ms.count() < 0)
    {
        // pre-epoch: borrow one second so the fraction stays in [0, 999]
        ms += milliseconds(1000);
        tp -= seconds(1);
    }
    std::time_t tt = system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

inline std::string iso8601_now_ms()
{
    return iso8601_ms(std::chrono::system_clock::now());
}

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff]Z". Anything else yields nullopt.
inline std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string &s)
{
    int Y = 0, M = 0, D = 0, h = 0, m = 0, sec = 0, frac = 0;
    int consumed = 0;

    // fixed layout first: sscanf alone would take signs and leading blanks
    static const char layout[] = "dddd-dd-ddTdd:dd:dd";
    if (s.size() < 19)
        return std::nullopt;
    for (std::size_t i = 0; i < 19; ++i)
    {
        const bool digit = s[i] >= '0' && s[i] <= '9';
        if (layout[i] == 'd' ? !digit : s[i] != layout[i])
            return std::nullopt;
    }

    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &Y, &M, &D, &h, &m, &sec, &consumed) != 6 || consumed != 19)
        return std::nullopt;

    std::size_t pos = 19;
    if (pos < s.size() && s[pos] == '.')
    {
        std::size_t digits = 0;
        ++pos;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9' && digits < 3)
        {
            frac = frac * 10 + (s[pos] - '0');
            ++pos;
            ++digits;
        }
        if (digits != 3)
            return std::nullopt;
    }
    if (pos + 1 != s.size() || s[pos] != 'Z')
        return std::nullopt;

    if (M < 1 || M > 12 || D < 1 || D > 31 || h > 23 || m > 59 || sec > 60)
        return std::nullopt;

    std::tm tm{};
    tm.tm_year = Y - 1900;
    tm.tm_mon = M - 1;
    tm.tm_mday = D;
    tm.tm_hour = h;
    tm.tm_min = m;
    tm.tm_sec = sec;
    std::time_t tt = timegm(&tm);
    if (tt == static_cast<std::time_t>(-1))
        return std::nullopt;

    return std::chrono::system_clock::from_time_t(tt) + std::chrono::milliseconds(frac);
}
