// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_SCHEDULE_HXX
#define SIHOA_SCHEDULE_HXX

namespace sihoa
{
    // Minutes since local midnight
    struct TimeOfDay {
        uint16_t minutes{0};

        static TimeOfDay fromHM(const uint8_t hour, const uint8_t minute) {
            return TimeOfDay{static_cast<uint16_t>(hour * 60 + minute)};
        }
        static TimeOfDay fromLocalTime(std::time_t t);

        auto operator<=>(const TimeOfDay&) const = default;
    };

    /**
     * @brief Parse "HH:MM" (24h). Returns nullopt on anything else.
     */
    std::optional<TimeOfDay> parseTimeOfDay(std::string_view text);
    std::string formatTimeOfDay(TimeOfDay t);

    struct ScheduleWindow {
        TimeOfDay on;
        TimeOfDay off;

        /**
         * @brief True if now falls within [on, off). Windows with on > off span midnight,
         * on == off is never active.
         */
        [[nodiscard]] bool isActive(TimeOfDay now) const;
    };

    struct ActuatorGroup {
        std::string name;
        ScheduleWindow window;
        std::vector<std::string> members;   // actuator friendly names
    };
} // sihoa

#endif //SIHOA_SCHEDULE_HXX
