// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "schedule/GroupController.hxx"

namespace sihoa
{
    static constexpr char TAG[] = "GroupController";

    void GroupController::addActuator(Actuator& actuator) {
        m_actuators[actuator.friendlyName()] = &actuator;
    }

    void GroupController::setGroups(std::vector<ActuatorGroup> groups) {
        m_groups = std::move(groups);
        for (const auto& group : m_groups) {
            SIHOA_LOGI(TAG, "Group %s: on %s, off %s, %zu members", group.name.c_str(),
                       formatTimeOfDay(group.window.on).c_str(), formatTimeOfDay(group.window.off).c_str(),
                       group.members.size());
        }
    }

    size_t GroupController::evaluate(const TimeOfDay now) {
        size_t issued = 0;
        for (const auto& group : m_groups) {
            const bool desired = group.window.isActive(now);
            for (const auto& member : group.members) {
                const auto it = m_actuators.find(member);
                if (it == m_actuators.end()) {
                    SIHOA_LOGW(TAG, "Group %s: unknown member %s", group.name.c_str(), member.c_str());
                    continue;
                }
                Actuator& actuator = *it->second;
                if (actuator.online() != true) continue;
                if (actuator.on() == desired) continue;

                if (actuator.requestState(desired) == CommandStatus::Issued) {
                    ++issued;
                }
            }
        }
        return issued;
    }
} // sihoa
