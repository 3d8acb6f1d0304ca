// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_DATEUTILS_HXX
#define SIHOA_DATEUTILS_HXX

#include <ctime>
#include "utils/StringUtils.hxx"

namespace sihoa
{
    struct CalendarDate {
        int year{1970};
        unsigned month{1};
        unsigned day{1};

        bool operator==(const CalendarDate&) const = default;
    };
}

namespace sihoa::utils {
    inline bool isValidDate(const int year, const unsigned month, const unsigned day) {
        static constexpr std::array<unsigned, 12> days_in_month{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) return false;
        const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        const unsigned limit = days_in_month[month - 1] + ((month == 2 && leap) ? 1 : 0);
        return day <= limit;
    }

    inline std::optional<CalendarDate> makeDate(const int year, const unsigned month, const unsigned day) {
        if (!isValidDate(year, month, day)) return std::nullopt;
        return CalendarDate{year, month, day};
    }

    // Parses a run of exactly `width` digits
    inline std::optional<unsigned> parseDigits(const std::string_view text, const size_t width) {
        if (text.size() != width) return std::nullopt;
        unsigned value = 0;
        for (const char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
            value = value * 10 + static_cast<unsigned>(c - '0');
        }
        return value;
    }

    // "YYYY<sep>MM<sep>DD"
    inline std::optional<CalendarDate> parseYmd(const std::string_view text, const char sep) {
        if (text.size() != 10 || text[4] != sep || text[7] != sep) return std::nullopt;
        const auto y = parseDigits(text.substr(0, 4), 4);
        const auto m = parseDigits(text.substr(5, 2), 2);
        const auto d = parseDigits(text.substr(8, 2), 2);
        if (!y || !m || !d) return std::nullopt;
        return makeDate(static_cast<int>(*y), *m, *d);
    }

    inline std::optional<CalendarDate> parseWithStrptime(const std::string& text, const char* format) {
        std::tm tm{};
        const char* end = strptime(text.c_str(), format, &tm);
        if (!end || *end != '\0') return std::nullopt;
        return makeDate(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1), static_cast<unsigned>(tm.tm_mday));
    }

    /**
     * @brief Permissive firmware build date parser.
     *
     * Accepts YYYYMMDD, YYYY-MM-DD, ISO date-time, YYYY/MM/DD, MM/DD/YYYY,
     * "Mon DD YYYY", "DD Mon YYYY" and "Month DD, YYYY". Anything else yields nullopt.
     */
    inline std::optional<CalendarDate> parseBuildDate(std::string_view raw) {
        const std::string_view text = trim(raw);
        if (text.size() < 8) return std::nullopt;

        if (text.size() == 8) {
            if (const auto compact = parseDigits(text, 8)) {
                return makeDate(static_cast<int>(*compact / 10000), (*compact / 100) % 100, *compact % 100);
            }
        }
        if (const auto iso = parseYmd(text.substr(0, std::min<size_t>(text.size(), 10)), '-')) {
            if (text.size() == 10 || text[10] == 'T' || text[10] == ' ') return iso;
        }
        if (const auto slashed = parseYmd(text, '/')) return slashed;

        if (text.size() == 10 && text[2] == '/' && text[5] == '/') {
            const auto m = parseDigits(text.substr(0, 2), 2);
            const auto d = parseDigits(text.substr(3, 2), 2);
            const auto y = parseDigits(text.substr(6, 4), 4);
            if (m && d && y) return makeDate(static_cast<int>(*y), *m, *d);
            return std::nullopt;
        }

        const std::string owned(text);
        for (const char* format : {"%b %d %Y", "%d %b %Y", "%B %d, %Y"}) {
            if (auto date = parseWithStrptime(owned, format)) return date;
        }
        return std::nullopt;
    }

    inline std::string formatDate(const CalendarDate& date) {
        return stringFormat("%04d-%02u-%02u", date.year, date.month, date.day);
    }

    /**
     * @brief "YYYY-MM-DD HH:MM:SS" in UTC, the layout SQLite's CURRENT_TIMESTAMP uses.
     */
    inline std::string formatUtcTimestamp(const std::chrono::system_clock::time_point tp) {
        const std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm utc{};
        gmtime_r(&t, &utc);
        std::array<char, 32> buf{};
        std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &utc);
        return buf.data();
    }
}

#endif //SIHOA_DATEUTILS_HXX
