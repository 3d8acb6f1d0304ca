// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "config/SyslogConfig.hxx"
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sihoa {

    static constexpr char TAG[] = "SyslogService";
    static constexpr int SYSLOG_PORT = 514;
    static constexpr int MAX_LOG_MSG_SIZE = 512;
    static constexpr std::chrono::milliseconds QUEUE_POLL{200};

    static SyslogConfig* g_syslog_instance = nullptr;

    SyslogConfig::~SyslogConfig() {
        shutdown();
    }

    void SyslogConfig::init(const std::string& server_addr) {
        if (m_initialized) {
            setServer(server_addr);
            return;
        }
        g_syslog_instance = this;

        m_running = true;
        m_thread = std::thread(&SyslogConfig::syslog_task_runner, this);

        m_original_logger = log::setVprintf(syslog_vprintf_func);
        m_initialized = true;
        SIHOA_LOGI(TAG, "Syslog logger initialized with a background thread.");

        setServer(server_addr);
    }

    void SyslogConfig::shutdown() {
        if (!m_initialized) return;
        log::setVprintf(m_original_logger);
        m_running = false;
        if (m_thread.joinable()) {
            m_thread.join();
        }
        std::lock_guard lock(m_mutex);
        if (m_sock >= 0) {
            close(m_sock);
            m_sock = -1;
        }
        m_initialized = false;
    }

    void SyslogConfig::setServer(const std::string& server_addr) {
        std::lock_guard lock(m_mutex);

        if (m_sock >= 0) {
            close(m_sock);
            m_sock = -1;
        }
        m_server_addr = server_addr;

        if (m_server_addr.empty()) {
            SIHOA_LOGI(TAG, "Syslog server address is empty, remote logging is paused.");
            return;
        }

        addrinfo hints = {};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_DGRAM;
        addrinfo* res = nullptr;

        const int err = getaddrinfo(m_server_addr.c_str(), std::to_string(SYSLOG_PORT).c_str(), &hints, &res);
        if (err != 0 || res == nullptr) {
            SIHOA_LOGE(TAG, "DNS lookup failed for '%s': %s", m_server_addr.c_str(), gai_strerror(err));
            return;
        }

        m_sock = socket(res->ai_family, res->ai_socktype, 0);
        if (m_sock < 0) {
            SIHOA_LOGE(TAG, "Failed to create socket.");
        } else if (connect(m_sock, res->ai_addr, res->ai_addrlen) != 0) {
            SIHOA_LOGE(TAG, "Failed to connect socket.");
            close(m_sock);
            m_sock = -1;
        }

        freeaddrinfo(res);
        if (m_sock >= 0) {
            SIHOA_LOGI(TAG, "Syslog server set to %s", m_server_addr.c_str());
        }
    }

    int SyslogConfig::syslog_vprintf_func(const char* format, va_list args) {
        SyslogConfig* self = g_syslog_instance;
        if (!self || !self->m_original_logger) {
            return vfprintf(stderr, format, args);
        }

        va_list args_copy;
        va_copy(args_copy, args);
        const int ret = self->m_original_logger(format, args_copy);
        va_end(args_copy);

        if (!self->m_running) {
            return ret;
        }

        char msg_buffer[MAX_LOG_MSG_SIZE];
        vsnprintf(msg_buffer, sizeof(msg_buffer), format, args);
        if (char* end = strpbrk(msg_buffer, "\r\n")) {
            *end = '\0';
        }
        // Drop rather than block the caller when the sender falls behind
        self->m_log_queue.send(std::string(msg_buffer));
        return ret;
    }

    void SyslogConfig::syslog_task_runner() {
        std::string message;
        while (m_running) {
            if (m_log_queue.receive(message, QUEUE_POLL)) {
                send_log_udp(message);
            }
        }
    }

    void SyslogConfig::send_log_udp(const std::string& message) {
        std::lock_guard lock(m_mutex);

        if (m_sock < 0 || m_server_addr.empty()) {
            return;
        }

        char syslog_buf[MAX_LOG_MSG_SIZE + 32];
        const int len = snprintf(syslog_buf, sizeof(syslog_buf), "<14>sihoa: %s", message.c_str());
        if (len <= 0) return;

        const size_t size = std::min(static_cast<size_t>(len), sizeof(syslog_buf) - 1);
        if (send(m_sock, syslog_buf, size, 0) < 0) {
            // Not logged, it would loop back into this queue
            return;
        }
    }

} // sihoa
