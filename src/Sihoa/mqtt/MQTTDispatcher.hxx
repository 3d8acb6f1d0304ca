// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_MQTTDISPATCHER_HXX
#define SIHOA_MQTTDISPATCHER_HXX

#include "mqtt/MQTTMessage.hxx"
#include "mqtt/Transport.hxx"

namespace sihoa {
    /**
     * @brief Topic registry and router between the transport and the runtime loop.
     *
     * onConnect()/onMessage() run on the transport thread, everything else on the
     * loop thread. The registry is the only state shared between the two.
     */
    class MQTTDispatcher {
        public:
            MQTTDispatcher(Transport& transport, InboundQueue& inbound);

            MQTTDispatcher(const MQTTDispatcher&) = delete;
            MQTTDispatcher& operator=(const MQTTDispatcher&) = delete;

            /**
             * @brief Subscribe to topic and bind handler to it.
             * @return SIHOA_ERR_DUPLICATE_REGISTRATION if the topic is already bound,
             *         SIHOA_ERR_SUBSCRIPTION_FAILED if the transport refused.
             */
            sihoa_err_t registerTopic(const std::string& topic, MessageHandler handler);

            /**
             * @brief Unsubscribe from topic and drop its binding.
             * @param previous receives the handler that was bound, may be null.
             */
            sihoa_err_t unregisterTopic(const std::string& topic, MessageHandler* previous = nullptr);

            sihoa_err_t processInbound(const MqttMessage& message);
            void processOutbound(const MqttMessage& message) const;

            // Transport callbacks
            void onConnect(int reason_code);
            void onMessage(const std::string& topic, const std::string& raw_payload);

            [[nodiscard]] bool isRegistered(const std::string& topic) const;
            [[nodiscard]] size_t registeredCount() const;

            /**
             * @brief First fatal error raised on either thread, SIHOA_OK while healthy.
             */
            [[nodiscard]] sihoa_err_t fatalError() const;

        private:
            void raiseFatal(sihoa_err_t code);

            Transport& m_transport;
            InboundQueue& m_inbound;

            std::map<std::string, MessageHandler> m_handlers;
            mutable std::mutex m_mutex;
            std::atomic<sihoa_err_t> m_fatal{SIHOA_OK};
    };
} // sihoa

#endif //SIHOA_MQTTDISPATCHER_HXX
