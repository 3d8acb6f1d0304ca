// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "inventory/SnapshotReader.hxx"

namespace sihoa
{
    static constexpr char TAG[] = "SnapshotReader";
    static constexpr std::chrono::milliseconds POLL_INTERVAL{50};

    SnapshotReader::SnapshotReader(MQTTDispatcher& dispatcher, InboundQueue& inbound)
        : m_dispatcher(dispatcher), m_inbound(inbound) {}

    sihoa_err_t SnapshotReader::read(const std::string& topic, const std::chrono::milliseconds timeout, JsonHandle& snapshot) {
        snapshot.reset();
        // Shared with the handler, which may stay bound if unregistering fails
        auto received = std::make_shared<JsonHandle>();

        sihoa_err_t err = m_dispatcher.registerTopic(topic, [received, topic](const cJSON* payload) {
            if (!cJSON_IsArray(payload)) {
                SIHOA_LOGW(TAG, "Ignoring non-array payload on %s", topic.c_str());
                return;
            }
            received->reset(cJSON_Duplicate(payload, true));
        });
        if (err != SIHOA_OK) {
            return err;
        }

        SIHOA_LOGI(TAG, "Waiting up to %lld ms for %s", static_cast<long long>(timeout.count()), topic.c_str());
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!*received && std::chrono::steady_clock::now() < deadline) {
            if (m_dispatcher.fatalError() != SIHOA_OK) {
                err = m_dispatcher.fatalError();
                break;
            }
            MqttMessage message;
            if (m_inbound.receive(message, POLL_INTERVAL)) {
                if (const sihoa_err_t rc = m_dispatcher.processInbound(message); rc != SIHOA_OK) {
                    err = rc;
                    break;
                }
            }
        }

        if (const sihoa_err_t rc = m_dispatcher.unregisterTopic(topic); rc != SIHOA_OK && err == SIHOA_OK) {
            err = rc;
        }
        if (err != SIHOA_OK) {
            return err;
        }
        if (!*received) {
            SIHOA_LOGE(TAG, "No device list received on %s", topic.c_str());
            return SIHOA_ERR_TIMEOUT;
        }
        snapshot = std::move(*received);
        return SIHOA_OK;
    }
} // sihoa
