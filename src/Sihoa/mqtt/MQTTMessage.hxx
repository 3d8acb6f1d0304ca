// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_MQTTMESSAGE_HXX
#define SIHOA_MQTTMESSAGE_HXX

#include "utils/JsonHandle.hxx"
#include "utils/MessageQueue.hxx"

namespace sihoa {
    // Topic plus decoded JSON body. An empty payload means "no data".
    struct MqttMessage {
        std::string topic;
        JsonHandle payload;
    };

    using InboundQueue = MessageQueue<MqttMessage>;
    using OutboundQueue = MessageQueue<MqttMessage>;

    using MessageHandler = std::function<void(const cJSON* payload)>;
} // sihoa

#endif //SIHOA_MQTTMESSAGE_HXX
