// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_MQTTCLIENT_HXX
#define SIHOA_MQTTCLIENT_HXX

#include <MQTTAsync.h>
#include "mqtt/Transport.hxx"

namespace sihoa
{
    struct MqttConnectionConfig {
        std::string uri;
        std::string client_id;
        std::string username;
        std::string password;
        int keepalive_s{60};
    };

    /**
     * @brief Transport over the Paho asynchronous MQTT client with automatic reconnect.
     */
    class MQTTClient final : public Transport {
        public:
            MQTTClient() = default;
            ~MQTTClient() override;

            MQTTClient(const MQTTClient&) = delete;
            MQTTClient& operator=(const MQTTClient&) = delete;

            sihoa_err_t init(const MqttConnectionConfig& config);

            sihoa_err_t connect();
            void disconnect();

            [[nodiscard]] MqttStatus getStatus() const override;

            int subscribe(const std::string& topic, int qos = 0) override;
            int unsubscribe(const std::string& topic) override;
            int publish(const std::string& topic, const std::string& payload, int qos = 0, bool retain = false) override;

        private:
            static void onConnectedCallback(void* context, char* cause);
            static void onConnectionLost(void* context, char* cause);
            static int onMessageArrived(void* context, char* topic_name, int topic_len, MQTTAsync_message* message);
            static void onConnectSuccess(void* context, MQTTAsync_successData* response);
            static void onConnectFailure(void* context, MQTTAsync_failureData* response);

            // Must outlive the asynchronous connect
            MqttConnectionConfig m_config;

            MQTTAsync m_handle{nullptr};
            std::atomic<MqttStatus> m_status{MqttStatus::DISCONNECTED};
    };
} // sihoa

#endif //SIHOA_MQTTCLIENT_HXX
