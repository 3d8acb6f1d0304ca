// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "lifecycle/Lifecycle.hxx"

namespace sihoa {

    static constexpr char TAG[] = "LifecycleMQTT";
    static constexpr std::chrono::milliseconds CONNECT_POLL{100};

    sihoa_err_t Lifecycle::setupAndConnectMqtt() {
        MqttConnectionConfig mqtt_config;
        mqtt_config.uri = m_config.mqttUri();
        mqtt_config.client_id = m_config.mqtt_client_id;
        mqtt_config.username = m_config.mqtt_username;
        mqtt_config.password = m_config.mqtt_password;
        mqtt_config.keepalive_s = static_cast<int>(m_config.mqtt_keepalive_s);

        if (const sihoa_err_t err = m_mqtt.init(mqtt_config); err != SIHOA_OK) {
            return err;
        }
        m_mqtt.setCallbacks(
            [this](const int reason_code) { this->onMqttConnected(reason_code); },
            []() { SIHOA_LOGW(TAG, "MQTT disconnected, waiting for reconnect."); },
            [this](const std::string& t, const std::string& d) { this->onMqttData(t, d); });

        if (const sihoa_err_t err = m_mqtt.connect(); err != SIHOA_OK) {
            return err;
        }
        return waitForConnection();
    }

    sihoa_err_t Lifecycle::waitForConnection() const {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_config.mqtt_connect_timeout_ms);
        while (!m_mqtt.isConnected()) {
            if (const sihoa_err_t fatal = m_dispatcher.fatalError(); fatal != SIHOA_OK) {
                SIHOA_LOGE(TAG, "MQTT connection failed: %s", sihoa_err_to_name(fatal));
                return fatal;
            }
            if (s_stop_requested) {
                return SIHOA_FAIL;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                SIHOA_LOGE(TAG, "No MQTT connection to %s within %u ms", m_config.mqttUri().c_str(),
                           m_config.mqtt_connect_timeout_ms);
                return SIHOA_ERR_TIMEOUT;
            }
            std::this_thread::sleep_for(CONNECT_POLL);
        }
        return SIHOA_OK;
    }

    void Lifecycle::onMqttConnected(const int reason_code) {
        if (reason_code == 0) {
            SIHOA_LOGI(TAG, "MQTT connected successfully.");
        }
        m_dispatcher.onConnect(reason_code);
    }

    void Lifecycle::onMqttData(const std::string& topic, const std::string& data) {
        m_dispatcher.onMessage(topic, data);
    }

    void Lifecycle::shutdownMqtt() {
        if (m_mqtt.isConnected()) {
            m_mqtt.disconnect();
        }
        // Waits out a delivery already running on the client thread, the dispatcher goes away next.
        m_mqtt.detach();
    }
} // sihoa
