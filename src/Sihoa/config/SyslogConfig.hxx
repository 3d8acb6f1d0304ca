// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_SYSLOGCONFIG_HXX
#define SIHOA_SYSLOGCONFIG_HXX

#include "utils/MessageQueue.hxx"

namespace sihoa {
    /**
     * @brief Forwards every log line to a remote syslog server over UDP.
     */
    class SyslogConfig {
        public:
            SyslogConfig(const SyslogConfig&) = delete;
            SyslogConfig& operator=(const SyslogConfig&) = delete;

            static SyslogConfig& Instance() {
                static SyslogConfig instance;
                return instance;
            }

            void init(const std::string& server_addr);
            void setServer(const std::string& server_addr);

            // Stops the sender thread and restores the previous line writer
            void shutdown();

        private:
            SyslogConfig() = default;
            ~SyslogConfig();

            static int syslog_vprintf_func(const char* format, va_list args);
            void syslog_task_runner();
            void send_log_udp(const std::string& message);

            std::string m_server_addr;
            int m_sock{-1};
            vprintf_like_t m_original_logger{nullptr};
            std::recursive_mutex m_mutex;
            bool m_initialized{false};
            std::atomic<bool> m_running{false};
            MessageQueue<std::string> m_log_queue{256};
            std::thread m_thread;
    };
} // sihoa

#endif //SIHOA_SYSLOGCONFIG_HXX
