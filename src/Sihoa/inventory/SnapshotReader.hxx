// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_SNAPSHOTREADER_HXX
#define SIHOA_SNAPSHOTREADER_HXX

#include "mqtt/MQTTDispatcher.hxx"

namespace sihoa
{
    /**
     * @brief Waits for the retained device list published by the bridge.
     */
    class SnapshotReader {
    public:
        SnapshotReader(MQTTDispatcher& dispatcher, InboundQueue& inbound);

        /**
         * @brief Subscribe to topic and wait up to timeout for a JSON array.
         * Non-array payloads are ignored. The subscription is dropped before returning.
         * @return SIHOA_ERR_TIMEOUT if no array arrived in time.
         */
        sihoa_err_t read(const std::string& topic, std::chrono::milliseconds timeout, JsonHandle& snapshot);

    private:
        MQTTDispatcher& m_dispatcher;
        InboundQueue& m_inbound;
    };
} // sihoa

#endif //SIHOA_SNAPSHOTREADER_HXX
