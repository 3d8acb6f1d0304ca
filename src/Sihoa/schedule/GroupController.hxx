// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_GROUPCONTROLLER_HXX
#define SIHOA_GROUPCONTROLLER_HXX

#include "actuator/Actuator.hxx"
#include "schedule/Schedule.hxx"

namespace sihoa
{
    /**
     * @brief Drives groups of actuators towards the state their schedule window asks for.
     */
    class GroupController {
    public:
        GroupController() = default;

        // Actuators must outlive the controller
        void addActuator(Actuator& actuator);
        void setGroups(std::vector<ActuatorGroup> groups);

        /**
         * @brief Request the desired state from every online member whose confirmed
         * state is unknown or different.
         * @return number of commands actually issued.
         */
        size_t evaluate(TimeOfDay now);

        [[nodiscard]] const std::vector<ActuatorGroup>& groups() const { return m_groups; }

    private:
        std::map<std::string, Actuator*, std::less<>> m_actuators;
        std::vector<ActuatorGroup> m_groups;
    };
} // sihoa

#endif //SIHOA_GROUPCONTROLLER_HXX
