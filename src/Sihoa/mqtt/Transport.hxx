// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_TRANSPORT_HXX
#define SIHOA_TRANSPORT_HXX

namespace sihoa
{
    enum class MqttStatus {
        DISCONNECTED,
        CONNECTING,
        CONNECTED
    };

    /**
     * @brief Publish/subscribe transport seen by the dispatcher.
     *
     * subscribe/unsubscribe/publish return 0 when the request was accepted and a
     * non-zero transport code otherwise. Callbacks fire on the transport's own thread.
     */
    class Transport {
        public:
            virtual ~Transport() = default;

            virtual int subscribe(const std::string& topic, int qos = 0) = 0;
            virtual int unsubscribe(const std::string& topic) = 0;
            virtual int publish(const std::string& topic, const std::string& payload, int qos = 0, bool retain = false) = 0;

            [[nodiscard]] virtual MqttStatus getStatus() const = 0;
            [[nodiscard]] bool isConnected() const { return getStatus() == MqttStatus::CONNECTED; }

            using ConnectedCallback = std::function<void(int reason_code)>;
            using DisconnectedCallback = std::function<void()>;
            using DataCallback = std::function<void(const std::string& topic, const std::string& data)>;

            void setCallbacks(ConnectedCallback on_connected, DisconnectedCallback on_disconnected, DataCallback on_data) {
                std::lock_guard lock(m_callback_mutex);
                m_on_connected = std::move(on_connected);
                m_on_disconnected = std::move(on_disconnected);
                m_on_data = std::move(on_data);
            }

            /**
             * @brief Drops all callbacks.
             *
             * Blocks until a delivery in progress on the transport thread has returned;
             * nothing is delivered to the old callbacks afterwards.
             */
            void detach() {
                setCallbacks(nullptr, nullptr, nullptr);
            }

        protected:
            void notifyConnected(const int reason_code) {
                std::lock_guard lock(m_callback_mutex);
                if (m_on_connected) m_on_connected(reason_code);
            }

            void notifyDisconnected() {
                std::lock_guard lock(m_callback_mutex);
                if (m_on_disconnected) m_on_disconnected();
            }

            void notifyData(const std::string& topic, const std::string& data) {
                std::lock_guard lock(m_callback_mutex);
                if (m_on_data) m_on_data(topic, data);
            }

        private:
            std::mutex m_callback_mutex;
            ConnectedCallback m_on_connected;
            DisconnectedCallback m_on_disconnected;
            DataCallback m_on_data;
    };
} // sihoa

#endif //SIHOA_TRANSPORT_HXX
