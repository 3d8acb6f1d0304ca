// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "mqtt/MQTTClient.hxx"

namespace sihoa
{
    static constexpr char TAG[] = "MQTTClient";

    MQTTClient::~MQTTClient() {
        if (m_handle) {
            if (MQTTAsync_isConnected(m_handle)) {
                disconnect();
            }
            MQTTAsync_setCallbacks(m_handle, nullptr, nullptr, nullptr, nullptr);
            MQTTAsync_destroy(&m_handle);
        }
    }

    sihoa_err_t MQTTClient::init(const MqttConnectionConfig& config) {
        if (m_handle) {
            SIHOA_LOGW(TAG, "Client already initialized");
            return SIHOA_FAIL;
        }
        m_config = config;

        int rc = MQTTAsync_create(&m_handle, m_config.uri.c_str(), m_config.client_id.c_str(),
                                  MQTTCLIENT_PERSISTENCE_NONE, nullptr);
        if (rc != MQTTASYNC_SUCCESS) {
            SIHOA_LOGE(TAG, "MQTTAsync_create(%s) failed: %d", m_config.uri.c_str(), rc);
            m_handle = nullptr;
            return SIHOA_ERR_INVALID_CONFIG;
        }

        // Paho requires a non-null message callback
        rc = MQTTAsync_setCallbacks(m_handle, this, onConnectionLost, onMessageArrived, nullptr);
        if (rc == MQTTASYNC_SUCCESS) {
            rc = MQTTAsync_setConnected(m_handle, this, onConnectedCallback);
        }
        if (rc != MQTTASYNC_SUCCESS) {
            SIHOA_LOGE(TAG, "Failed to set callbacks: %d", rc);
            MQTTAsync_destroy(&m_handle);
            return SIHOA_FAIL;
        }
        m_status = MqttStatus::DISCONNECTED;
        return SIHOA_OK;
    }

    sihoa_err_t MQTTClient::connect() {
        if (!m_handle) return SIHOA_ERR_INVALID_ARG;

        MQTTAsync_connectOptions opts = MQTTAsync_connectOptions_initializer;
        opts.keepAliveInterval = m_config.keepalive_s;
        opts.cleansession = 1;
        opts.automaticReconnect = 1;
        opts.minRetryInterval = 1;
        opts.maxRetryInterval = 30;
        if (!m_config.username.empty()) {
            opts.username = m_config.username.c_str();
        }
        if (!m_config.password.empty()) {
            opts.password = m_config.password.c_str();
        }
        opts.onSuccess = onConnectSuccess;
        opts.onFailure = onConnectFailure;
        opts.context = this;

        m_status = MqttStatus::CONNECTING;
        if (const int rc = MQTTAsync_connect(m_handle, &opts); rc != MQTTASYNC_SUCCESS) {
            SIHOA_LOGE(TAG, "MQTTAsync_connect failed: %d", rc);
            m_status = MqttStatus::DISCONNECTED;
            return SIHOA_FAIL;
        }
        SIHOA_LOGI(TAG, "Connecting to %s as %s", m_config.uri.c_str(), m_config.client_id.c_str());
        return SIHOA_OK;
    }

    void MQTTClient::disconnect() {
        if (!m_handle) return;
        m_status = MqttStatus::DISCONNECTED;
        MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
        opts.timeout = 1000;
        if (const int rc = MQTTAsync_disconnect(m_handle, &opts); rc != MQTTASYNC_SUCCESS) {
            SIHOA_LOGW(TAG, "MQTTAsync_disconnect failed: %d", rc);
        }
    }

    MqttStatus MQTTClient::getStatus() const {
        return m_status;
    }

    int MQTTClient::subscribe(const std::string& topic, const int qos) {
        if (!m_handle) return MQTTASYNC_FAILURE;
        MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
        const int rc = MQTTAsync_subscribe(m_handle, topic.c_str(), qos, &opts);
        SIHOA_LOGD(TAG, "SUBSCRIBE %s rc=%d", topic.c_str(), rc);
        return rc;
    }

    int MQTTClient::unsubscribe(const std::string& topic) {
        if (!m_handle) return MQTTASYNC_FAILURE;
        MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
        const int rc = MQTTAsync_unsubscribe(m_handle, topic.c_str(), &opts);
        SIHOA_LOGD(TAG, "UNSUBSCRIBE %s rc=%d", topic.c_str(), rc);
        return rc;
    }

    int MQTTClient::publish(const std::string& topic, const std::string& payload, const int qos, const bool retain) {
        if (!m_handle) return MQTTASYNC_FAILURE;
        MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
        return MQTTAsync_send(m_handle, topic.c_str(), static_cast<int>(payload.size()), payload.data(),
                              qos, retain ? 1 : 0, &opts);
    }

    void MQTTClient::onConnectedCallback(void* context, [[maybe_unused]] char* cause) {
        auto* client = static_cast<MQTTClient*>(context);
        if (!client) return;
        SIHOA_LOGI(TAG, "MQTT connected");
        client->m_status = MqttStatus::CONNECTED;
        client->notifyConnected(0);
    }

    void MQTTClient::onConnectionLost(void* context, char* cause) {
        auto* client = static_cast<MQTTClient*>(context);
        if (!client) return;
        SIHOA_LOGW(TAG, "MQTT connection lost: %s", cause ? cause : "unknown");
        client->m_status = MqttStatus::CONNECTING;
        client->notifyDisconnected();
    }

    int MQTTClient::onMessageArrived(void* context, char* topic_name, const int topic_len, MQTTAsync_message* message) {
        auto* client = static_cast<MQTTClient*>(context);
        if (client) {
            std::string topic = topic_len > 0
                ? std::string(topic_name, static_cast<size_t>(topic_len))
                : std::string(topic_name);
            std::string data;
            if (message->payload && message->payloadlen > 0) {
                data.assign(static_cast<const char*>(message->payload), static_cast<size_t>(message->payloadlen));
            }
            client->notifyData(topic, data);
        }
        MQTTAsync_freeMessage(&message);
        MQTTAsync_free(topic_name);
        return 1;
    }

    void MQTTClient::onConnectSuccess([[maybe_unused]] void* context, [[maybe_unused]] MQTTAsync_successData* response) {
        SIHOA_LOGD(TAG, "Connect request acknowledged");
    }

    void MQTTClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
        auto* client = static_cast<MQTTClient*>(context);
        if (!client) return;
        int code = response ? response->code : MQTTASYNC_FAILURE;
        if (code == 0) code = MQTTASYNC_FAILURE;
        SIHOA_LOGE(TAG, "Connect failed: code=%d (%s)", code,
                   response && response->message ? response->message : "no detail");
        client->m_status = MqttStatus::DISCONNECTED;
        client->notifyConnected(code);
    }
} // sihoa
