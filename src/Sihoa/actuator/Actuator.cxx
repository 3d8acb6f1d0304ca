// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "actuator/Actuator.hxx"
#include "utils/StringUtils.hxx"

namespace sihoa
{
    static constexpr char TAG[] = "Actuator";

    namespace {
        ActuatorAttributes makeAttributes(const ActuatorClass cls) {
            if (cls == ActuatorClass::Light) return LightAttributes{};
            return PlugAttributes{};
        }

        template <typename T>
        void assignIfPresent(std::optional<T>& field, std::optional<T> value) {
            if (value) field = std::move(value);
        }
    }

    Actuator::Actuator(const ActuatorClass cls, std::string friendly_name, std::string ieee_address,
                       std::string base_topic, OutboundQueue& outbound,
                       const std::chrono::milliseconds pending_timeout)
        : m_class(cls),
          m_friendly_name(std::move(friendly_name)),
          m_ieee_address(std::move(ieee_address)),
          m_base_topic(std::move(base_topic)),
          m_outbound(&outbound),
          m_pending_timeout(pending_timeout),
          m_attributes(makeAttributes(cls)) {}

    void Actuator::onAvailability(const cJSON* payload) {
        const auto state = utils::getString(payload, "state");
        if (!state) {
            SIHOA_LOGD(TAG, "%s: availability without state ignored", m_friendly_name.c_str());
            return;
        }
        if (*state != "online" && *state != "offline") {
            SIHOA_LOGD(TAG, "%s: unknown availability '%s' ignored", m_friendly_name.c_str(), state->c_str());
            return;
        }

        const bool was_online = m_online.value_or(false);
        m_online = (*state == "online");
        SIHOA_LOGI(TAG, "%s is %s", m_friendly_name.c_str(), *m_online ? "online" : "offline");

        if (*m_online && !was_online) {
            queueReadRequest();
        }
    }

    void Actuator::onReport(const cJSON* payload) {
        if (!cJSON_IsObject(payload) || payload->child == nullptr) {
            SIHOA_LOGD(TAG, "%s: empty report ignored", m_friendly_name.c_str());
            return;
        }

        m_pending = false;

        if (const auto state = utils::getString(payload, "state")) {
            m_on = (*state == "ON");
        }

        std::visit([payload](auto& attrs) {
            using T = std::decay_t<decltype(attrs)>;
            assignIfPresent(attrs.link_quality, utils::getInt(payload, "linkquality"));
            assignIfPresent(attrs.power_on_behavior, utils::getString(payload, "power_on_behavior"));
            if constexpr (std::is_same_v<T, LightAttributes>) {
                assignIfPresent(attrs.brightness, utils::getInt(payload, "brightness"));
                assignIfPresent(attrs.color_mode, utils::getString(payload, "color_mode"));
                assignIfPresent(attrs.color_temp, utils::getInt(payload, "color_temp"));
                assignIfPresent(attrs.color_temp_startup, utils::getInt(payload, "color_temp_startup"));
            }
        }, m_attributes);

        SIHOA_LOGV(TAG, "%s: report, on=%s", m_friendly_name.c_str(),
                   m_on ? (*m_on ? "true" : "false") : "unknown");
    }

    CommandStatus Actuator::requestOn() {
        return requestState(true);
    }

    CommandStatus Actuator::requestOff() {
        return requestState(false);
    }

    CommandStatus Actuator::requestState(const bool on) {
        if (m_pending) {
            SIHOA_LOGV(TAG, "%s: command pending, request suppressed", m_friendly_name.c_str());
            return CommandStatus::Suppressed;
        }

        JsonHandle set(cJSON_CreateObject());
        cJSON_AddStringToObject(set.get(), "state", on ? "ON" : "OFF");
        if (m_class == ActuatorClass::Light) {
            cJSON_AddNumberToObject(set.get(), "transition", 0);
        }
        queue(setTopic(), std::move(set));

        JsonHandle get(cJSON_CreateObject());
        cJSON_AddStringToObject(get.get(), "state", "");
        queue(getTopic(), std::move(get));

        m_pending = true;
        m_pending_since = Clock::now();
        SIHOA_LOGI(TAG, "%s: switching %s", m_friendly_name.c_str(), on ? "ON" : "OFF");
        return CommandStatus::Issued;
    }

    bool Actuator::expirePending(const Clock::time_point now) {
        if (!m_pending || m_pending_timeout.count() <= 0) return false;
        if (now - m_pending_since < m_pending_timeout) return false;
        SIHOA_LOGW(TAG, "%s: no confirmation within %lld ms, clearing pending command",
                   m_friendly_name.c_str(), static_cast<long long>(m_pending_timeout.count()));
        m_pending = false;
        return true;
    }

    std::string Actuator::stateTopic() const {
        return utils::joinTopic({m_base_topic, m_friendly_name});
    }

    std::string Actuator::availabilityTopic() const {
        return utils::joinTopic({m_base_topic, m_friendly_name, "availability"});
    }

    std::string Actuator::setTopic() const {
        return utils::joinTopic({m_base_topic, m_friendly_name, "set"});
    }

    std::string Actuator::getTopic() const {
        return utils::joinTopic({m_base_topic, m_friendly_name, "get"});
    }

    void Actuator::queue(std::string topic, JsonHandle payload) const {
        if (!m_outbound->send(MqttMessage{std::move(topic), std::move(payload)})) {
            SIHOA_LOGE(TAG, "%s: outbound queue full, command lost", m_friendly_name.c_str());
        }
    }

    void Actuator::queueReadRequest() const {
        JsonHandle get(cJSON_CreateObject());
        std::visit([&get](const auto& attrs) {
            using T = std::decay_t<decltype(attrs)>;
            if constexpr (std::is_same_v<T, LightAttributes>) {
                cJSON_AddStringToObject(get.get(), "power_on_behavior", "");
                cJSON_AddStringToObject(get.get(), "color_temp_startup", "");
            } else {
                cJSON_AddStringToObject(get.get(), "state", "");
            }
        }, m_attributes);
        queue(getTopic(), std::move(get));
    }
} // sihoa
