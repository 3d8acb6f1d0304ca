// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_DEVICERECORD_HXX
#define SIHOA_DEVICERECORD_HXX

#include "utils/DateUtils.hxx"

namespace sihoa
{
    struct DeviceRecord {
        std::string ieee_address{};                        // Primary key, e.g. "0x00124b0012345678"
        std::string friendly_name{};                       // Unique across active and retired rows
        std::optional<int> network_address{};              // 16-bit short address
        std::optional<std::string> firmware_version{};
        std::optional<CalendarDate> firmware_build_date{};
        std::optional<std::string> device_type{};          // Router, EndDevice, ...
        std::optional<std::string> zigbee_model{};
        std::optional<std::string> zigbee_manufacturer{};
        std::string created_at{};                          // Assigned by the store
        std::optional<std::string> retired_at{};           // UTC "YYYY-MM-DD HH:MM:SS", unset = active

        [[nodiscard]] bool isActive() const { return !retired_at.has_value(); }
    };
} // sihoa

#endif //SIHOA_DEVICERECORD_HXX
