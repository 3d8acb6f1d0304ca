// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "schedule/Schedule.hxx"
#include "utils/StringUtils.hxx"

namespace sihoa
{
    TimeOfDay TimeOfDay::fromLocalTime(const std::time_t t) {
        std::tm local{};
        localtime_r(&t, &local);
        return fromHM(static_cast<uint8_t>(local.tm_hour), static_cast<uint8_t>(local.tm_min));
    }

    std::optional<TimeOfDay> parseTimeOfDay(std::string_view text) {
        text = utils::trim(text);
        const auto colon = text.find(':');
        if (colon == std::string_view::npos) return std::nullopt;

        const auto hh = text.substr(0, colon);
        const auto mm = text.substr(colon + 1);
        if (hh.empty() || hh.size() > 2 || mm.size() != 2) return std::nullopt;

        unsigned hour = 0;
        unsigned minute = 0;
        if (auto [p, ec] = std::from_chars(hh.data(), hh.data() + hh.size(), hour);
            ec != std::errc() || p != hh.data() + hh.size()) return std::nullopt;
        if (auto [p, ec] = std::from_chars(mm.data(), mm.data() + mm.size(), minute);
            ec != std::errc() || p != mm.data() + mm.size()) return std::nullopt;
        if (hour > 23 || minute > 59) return std::nullopt;

        return TimeOfDay::fromHM(static_cast<uint8_t>(hour), static_cast<uint8_t>(minute));
    }

    std::string formatTimeOfDay(const TimeOfDay t) {
        return utils::stringFormat("%02u:%02u", t.minutes / 60u, t.minutes % 60u);
    }

    bool ScheduleWindow::isActive(const TimeOfDay now) const {
        if (on < off) return on <= now && now < off;
        if (on > off) return now >= on || now < off;
        return false;
    }
} // sihoa
