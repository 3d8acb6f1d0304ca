// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_ACTUATOR_HXX
#define SIHOA_ACTUATOR_HXX

#include "actuator/ActuatorTypes.hxx"
#include "mqtt/MQTTMessage.hxx"

namespace sihoa
{
    /**
     * @brief In-memory model of one Zigbee2MQTT light or plug.
     *
     * Owned and driven by the runtime loop thread only. While a set command is
     * unconfirmed further on/off requests are suppressed.
     */
    class Actuator {
    public:
        using Clock = std::chrono::steady_clock;

        Actuator(ActuatorClass cls, std::string friendly_name, std::string ieee_address,
                 std::string base_topic, OutboundQueue& outbound,
                 std::chrono::milliseconds pending_timeout = std::chrono::milliseconds{0});

        Actuator(const Actuator&) = delete;
        Actuator& operator=(const Actuator&) = delete;
        Actuator(Actuator&&) = default;

        /**
         * @brief Handle {"state":"online"|"offline"}. Going online queues a read request.
         */
        void onAvailability(const cJSON* payload);

        /**
         * @brief Handle a state report published on <base>/<name>.
         */
        void onReport(const cJSON* payload);

        CommandStatus requestOn();
        CommandStatus requestOff();
        CommandStatus requestState(bool on);

        /**
         * @brief Drop a pending flag older than the configured timeout. No-op when the timeout is 0.
         * @return true if the flag was cleared.
         */
        bool expirePending(Clock::time_point now);

        [[nodiscard]] ActuatorClass actuatorClass() const { return m_class; }
        [[nodiscard]] const std::string& friendlyName() const { return m_friendly_name; }
        [[nodiscard]] const std::string& ieeeAddress() const { return m_ieee_address; }

        [[nodiscard]] std::optional<bool> online() const { return m_online; }
        [[nodiscard]] std::optional<bool> on() const { return m_on; }
        [[nodiscard]] bool pendingCommand() const { return m_pending; }
        [[nodiscard]] const ActuatorAttributes& attributes() const { return m_attributes; }

        [[nodiscard]] std::string stateTopic() const;
        [[nodiscard]] std::string availabilityTopic() const;
        [[nodiscard]] std::string setTopic() const;
        [[nodiscard]] std::string getTopic() const;

    private:
        void queue(std::string topic, JsonHandle payload) const;
        void queueReadRequest() const;

        ActuatorClass m_class;
        std::string m_friendly_name;
        std::string m_ieee_address;
        std::string m_base_topic;
        OutboundQueue* m_outbound;
        std::chrono::milliseconds m_pending_timeout;

        std::optional<bool> m_online{};             // set by availability only
        std::optional<bool> m_on{};                 // last confirmed state
        bool m_pending{false};
        Clock::time_point m_pending_since{};
        ActuatorAttributes m_attributes;
    };
} // sihoa

#endif //SIHOA_ACTUATOR_HXX
