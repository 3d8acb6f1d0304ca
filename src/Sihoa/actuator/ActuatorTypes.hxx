// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_ACTUATORTYPES_HXX
#define SIHOA_ACTUATORTYPES_HXX

namespace sihoa
{
    enum class ActuatorClass {
        Light,
        Plug
    };

    enum class CommandStatus {
        Issued,     // set + get queued, pending flag raised
        Suppressed  // a previous command is still unconfirmed
    };

    struct LightAttributes {
        std::optional<int> brightness{};            // 0..254
        std::optional<std::string> color_mode{};    // "color_temp", "xy", ...
        std::optional<int> color_temp{};            // Mireds
        std::optional<int> link_quality{};          // LQI
        std::optional<std::string> power_on_behavior{};
        std::optional<int> color_temp_startup{};    // Mireds
    };

    struct PlugAttributes {
        std::optional<int> link_quality{};
        std::optional<std::string> power_on_behavior{};
    };

    using ActuatorAttributes = std::variant<LightAttributes, PlugAttributes>;

    inline std::optional<ActuatorClass> actuatorClassFromString(const std::string_view name) {
        if (name == "light") return ActuatorClass::Light;
        if (name == "plug") return ActuatorClass::Plug;
        return std::nullopt;
    }

    inline const char* actuatorClassToString(const ActuatorClass cls) {
        switch (cls) {
            case ActuatorClass::Light: return "light";
            case ActuatorClass::Plug:  return "plug";
        }
        return "unknown";
    }
} // sihoa

#endif //SIHOA_ACTUATORTYPES_HXX
