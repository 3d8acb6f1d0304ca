// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "mqtt/MQTTDispatcher.hxx"

namespace sihoa {
    static constexpr char TAG[] = "MQTTDispatcher";

    MQTTDispatcher::MQTTDispatcher(Transport& transport, InboundQueue& inbound)
        : m_transport(transport), m_inbound(inbound) {}

    sihoa_err_t MQTTDispatcher::registerTopic(const std::string& topic, MessageHandler handler) {
        std::lock_guard lock(m_mutex);
        if (m_handlers.contains(topic)) {
            SIHOA_LOGE(TAG, "Topic %s is already registered", topic.c_str());
            raiseFatal(SIHOA_ERR_DUPLICATE_REGISTRATION);
            return SIHOA_ERR_DUPLICATE_REGISTRATION;
        }
        if (const int rc = m_transport.subscribe(topic); rc != 0) {
            SIHOA_LOGE(TAG, "Subscribe to %s failed (rc=%d)", topic.c_str(), rc);
            raiseFatal(SIHOA_ERR_SUBSCRIPTION_FAILED);
            return SIHOA_ERR_SUBSCRIPTION_FAILED;
        }
        m_handlers.emplace(topic, std::move(handler));
        SIHOA_LOGD(TAG, "Registered %s", topic.c_str());
        return SIHOA_OK;
    }

    sihoa_err_t MQTTDispatcher::unregisterTopic(const std::string& topic, MessageHandler* previous) {
        std::lock_guard lock(m_mutex);
        const auto it = m_handlers.find(topic);
        if (it == m_handlers.end()) {
            SIHOA_LOGE(TAG, "Topic %s is not registered", topic.c_str());
            raiseFatal(SIHOA_ERR_NOT_REGISTERED);
            return SIHOA_ERR_NOT_REGISTERED;
        }
        if (const int rc = m_transport.unsubscribe(topic); rc != 0) {
            SIHOA_LOGE(TAG, "Unsubscribe from %s failed (rc=%d)", topic.c_str(), rc);
            raiseFatal(SIHOA_ERR_UNSUBSCRIPTION_FAILED);
            return SIHOA_ERR_UNSUBSCRIPTION_FAILED;
        }
        if (previous) {
            *previous = std::move(it->second);
        }
        m_handlers.erase(it);
        SIHOA_LOGD(TAG, "Unregistered %s", topic.c_str());
        return SIHOA_OK;
    }

    sihoa_err_t MQTTDispatcher::processInbound(const MqttMessage& message) {
        MessageHandler handler;
        {
            std::lock_guard lock(m_mutex);
            const auto it = m_handlers.find(message.topic);
            if (it == m_handlers.end()) {
                SIHOA_LOGE(TAG, "No handler for %s", message.topic.c_str());
                raiseFatal(SIHOA_ERR_UNROUTED_MESSAGE);
                return SIHOA_ERR_UNROUTED_MESSAGE;
            }
            handler = it->second;
        }
        // Handlers may register or unregister topics themselves.
        if (handler) {
            handler(message.payload.get());
        }
        return SIHOA_OK;
    }

    void MQTTDispatcher::processOutbound(const MqttMessage& message) const {
        const std::string body = utils::printJson(message.payload.get());
        SIHOA_LOGV(TAG, "-> %s %s", message.topic.c_str(), body.c_str());
        if (const int rc = m_transport.publish(message.topic, body); rc != 0) {
            SIHOA_LOGW(TAG, "Publish to %s failed (rc=%d), message dropped", message.topic.c_str(), rc);
        }
    }

    void MQTTDispatcher::onConnect(const int reason_code) {
        if (reason_code != 0) {
            SIHOA_LOGE(TAG, "Broker refused connection (reason=%d)", reason_code);
            raiseFatal(SIHOA_ERR_CONNECTION_REFUSED);
            return;
        }

        std::vector<std::string> topics;
        {
            std::lock_guard lock(m_mutex);
            topics.reserve(m_handlers.size());
            for (const auto& topic : m_handlers | std::views::keys) {
                topics.push_back(topic);
            }
        }
        SIHOA_LOGI(TAG, "Connected, re-subscribing %zu topics", topics.size());
        for (const auto& topic : topics) {
            if (const int rc = m_transport.subscribe(topic); rc != 0) {
                SIHOA_LOGE(TAG, "Re-subscribe to %s failed (rc=%d)", topic.c_str(), rc);
                raiseFatal(SIHOA_ERR_SUBSCRIPTION_FAILED);
                return;
            }
        }
    }

    void MQTTDispatcher::onMessage(const std::string& topic, const std::string& raw_payload) {
        if (!isRegistered(topic)) {
            SIHOA_LOGE(TAG, "Message on unregistered topic %s", topic.c_str());
            raiseFatal(SIHOA_ERR_UNROUTED_MESSAGE);
            return;
        }

        MqttMessage message{topic, utils::parseJson(raw_payload)};
        if (!message.payload) {
            SIHOA_LOGD(TAG, "Payload on %s is not JSON, delivering no data", topic.c_str());
        }
        if (!m_inbound.send(std::move(message))) {
            SIHOA_LOGE(TAG, "Inbound queue full, dropping message: %s", topic.c_str());
        }
    }

    bool MQTTDispatcher::isRegistered(const std::string& topic) const {
        std::lock_guard lock(m_mutex);
        return m_handlers.contains(topic);
    }

    size_t MQTTDispatcher::registeredCount() const {
        std::lock_guard lock(m_mutex);
        return m_handlers.size();
    }

    sihoa_err_t MQTTDispatcher::fatalError() const {
        return m_fatal.load();
    }

    void MQTTDispatcher::raiseFatal(const sihoa_err_t code) {
        sihoa_err_t expected = SIHOA_OK;
        m_fatal.compare_exchange_strong(expected, code);
    }
} // sihoa
