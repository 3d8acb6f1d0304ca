// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "lifecycle/Lifecycle.hxx"
#include "inventory/InventoryReconciler.hxx"
#include "utils/StringUtils.hxx"

namespace sihoa {

    static constexpr char TAG[] = "LifecycleRuntime";

    sihoa_err_t Lifecycle::buildActuators() {
        m_actuators.reserve(m_config.actuators.size());
        for (const auto& [cls, friendly_name, ieee_address] : m_config.actuators) {
            auto actuator = std::make_unique<Actuator>(cls, friendly_name, ieee_address, m_config.mqtt_base_topic,
                                                       m_outbound, std::chrono::milliseconds(m_config.pending_timeout_ms));
            Actuator* raw = actuator.get();

            sihoa_err_t err = m_dispatcher.registerTopic(raw->availabilityTopic(),
                [raw](const cJSON* payload) { raw->onAvailability(payload); });
            if (err == SIHOA_OK) {
                err = m_dispatcher.registerTopic(raw->stateTopic(),
                    [raw](const cJSON* payload) { raw->onReport(payload); });
            }
            if (err != SIHOA_OK) {
                SIHOA_LOGE(TAG, "Cannot register %s %s: %s", actuatorClassToString(cls), friendly_name.c_str(),
                           sihoa_err_to_name(err));
                return err;
            }

            m_groups.addActuator(*raw);
            m_actuators.push_back(std::move(actuator));
            SIHOA_LOGI(TAG, "Subscribed to %s %s (%s)", actuatorClassToString(cls), friendly_name.c_str(),
                       ieee_address.empty() ? "no address" : ieee_address.c_str());
        }
        m_groups.setGroups(m_config.groups);
        return SIHOA_OK;
    }

    sihoa_err_t Lifecycle::registerInventorySync() {
        if (!m_config.inventory_sync_on_publish) {
            SIHOA_LOGI(TAG, "Inventory sync on publish is disabled.");
            return SIHOA_OK;
        }
        const std::string topic = utils::joinTopic({m_config.mqtt_base_topic, m_config.inventory_topic});
        const sihoa_err_t err = m_dispatcher.registerTopic(topic, [this](const cJSON* payload) {
            if (!cJSON_IsArray(payload)) {
                SIHOA_LOGW(TAG, "Ignoring device list that is not an array");
                return;
            }
            InventoryReconciler reconciler(m_store);
            ReconcileResult result;
            if (const sihoa_err_t rc = reconciler.reconcile(payload, result); rc != SIHOA_OK) {
                SIHOA_LOGE(TAG, "Inventory reconciliation failed: %s", sihoa_err_to_name(rc));
                return;
            }
            SIHOA_LOGI(TAG, "Inventory: %zu stored/updated, %zu retired", result.upserted, result.retired);
        });
        if (err == SIHOA_OK) {
            SIHOA_LOGI(TAG, "Subscribed to inventory: %s", topic.c_str());
        }
        return err;
    }

    void Lifecycle::runLoop() {
        const auto period = std::chrono::milliseconds(m_config.loop_period_ms);
        SIHOA_LOGI(TAG, "Runtime loop started, period %u ms, %zu actuators, %zu groups",
                   m_config.loop_period_ms, m_actuators.size(), m_groups.groups().size());

        while (!s_stop_requested && m_dispatcher.fatalError() == SIHOA_OK) {
            tick();
            std::this_thread::sleep_for(period);
        }
        if (s_stop_requested) {
            SIHOA_LOGI(TAG, "Stop requested.");
        }
    }

    void Lifecycle::tick() {
        MqttMessage message;
        while (m_outbound.receive(message, std::chrono::milliseconds{0})) {
            m_dispatcher.processOutbound(message);
        }

        auto wait = std::chrono::milliseconds(m_config.loop_drain_timeout_ms);
        while (m_inbound.receive(message, wait)) {
            wait = std::chrono::milliseconds{0};
            if (m_dispatcher.processInbound(message) != SIHOA_OK) {
                return;
            }
        }

        const auto now = Actuator::Clock::now();
        for (const auto& actuator : m_actuators) {
            actuator->expirePending(now);
        }

        if (const size_t issued = m_groups.evaluate(TimeOfDay::fromLocalTime(time(nullptr))); issued > 0) {
            SIHOA_LOGD(TAG, "Schedules issued %zu commands", issued);
        }
    }
} // sihoa
