// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/Log.hxx"
#include "utils/FileHandle.hxx"
#include <sys/stat.h>

namespace sihoa::log
{
    namespace {
        constexpr size_t MAX_LINE_SIZE = 1024;

        struct FileSink {
            FileHandle file;
            std::string path;
            size_t max_bytes{0};
            unsigned backups{0};
            size_t written{0};
        };

        std::atomic<LogLevel> g_level{LogLevel::Info};
        std::mutex g_sink_mutex;
        FileSink g_file_sink;

        void rotateLocked() {
            g_file_sink.file.close();
            if (g_file_sink.backups > 0) {
                for (unsigned i = g_file_sink.backups - 1; i >= 1; --i) {
                    const std::string from = g_file_sink.path + "." + std::to_string(i);
                    const std::string to = g_file_sink.path + "." + std::to_string(i + 1);
                    std::rename(from.c_str(), to.c_str());
                }
                const std::string first = g_file_sink.path + ".1";
                std::rename(g_file_sink.path.c_str(), first.c_str());
            }
            g_file_sink.file.reopen(g_file_sink.path.c_str(), g_file_sink.backups > 0 ? "a" : "w");
            g_file_sink.written = 0;
        }

        int defaultVprintf(const char* format, va_list args) {
            std::lock_guard lock(g_sink_mutex);
            if (!g_file_sink.file) {
                const int ret = vfprintf(stderr, format, args);
                fflush(stderr);
                return ret;
            }

            char line[MAX_LINE_SIZE];
            const int len = vsnprintf(line, sizeof(line), format, args);
            if (len < 0) return len;
            const size_t size = std::min(static_cast<size_t>(len), sizeof(line) - 1);

            if (g_file_sink.max_bytes > 0 && g_file_sink.written + size > g_file_sink.max_bytes) {
                rotateLocked();
                if (!g_file_sink.file) {
                    return static_cast<int>(fwrite(line, 1, size, stderr));
                }
            }
            const size_t out = fwrite(line, 1, size, g_file_sink.file.get());
            fflush(g_file_sink.file.get());
            g_file_sink.written += out;
            return static_cast<int>(out);
        }

        std::atomic<vprintf_like_t> g_vprintf{defaultVprintf};

        int callVprintf(const char* format, ...) {
            va_list args;
            va_start(args, format);
            const int ret = g_vprintf.load()(format, args);
            va_end(args);
            return ret;
        }

        char levelLetter(const LogLevel level) {
            switch (level) {
                case LogLevel::Error: return 'E';
                case LogLevel::Warn: return 'W';
                case LogLevel::Info: return 'I';
                case LogLevel::Debug: return 'D';
                case LogLevel::Verbose: return 'V';
                default: return '?';
            }
        }
    }

    void setLevel(const LogLevel level) {
        g_level = level;
    }

    std::optional<LogLevel> levelFromString(const std::string_view name) {
        if (name == "none") return LogLevel::None;
        if (name == "error") return LogLevel::Error;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "info") return LogLevel::Info;
        if (name == "debug") return LogLevel::Debug;
        if (name == "verbose") return LogLevel::Verbose;
        return std::nullopt;
    }

    vprintf_like_t setVprintf(const vprintf_like_t func) {
        return g_vprintf.exchange(func ? func : defaultVprintf);
    }

    sihoa_err_t openFile(const std::string& path, const size_t max_bytes, const unsigned backups) {
        std::lock_guard lock(g_sink_mutex);
        if (!g_file_sink.file.reopen(path.c_str(), "a")) {
            return SIHOA_FAIL;
        }
        g_file_sink.path = path;
        g_file_sink.max_bytes = max_bytes;
        g_file_sink.backups = backups;

        struct stat st{};
        g_file_sink.written = (stat(path.c_str(), &st) == 0) ? static_cast<size_t>(st.st_size) : 0;
        return SIHOA_OK;
    }

    void closeFile() {
        std::lock_guard lock(g_sink_mutex);
        g_file_sink.file.close();
        g_file_sink.path.clear();
        g_file_sink.written = 0;
    }

    void write(const LogLevel level, const char* tag, const char* format, ...) {
        if (level == LogLevel::None || level > g_level.load()) {
            return;
        }

        char message[MAX_LINE_SIZE];
        va_list args;
        va_start(args, format);
        vsnprintf(message, sizeof(message), format, args);
        va_end(args);

        const auto now = std::chrono::system_clock::now();
        const std::time_t secs = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&secs, &local);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

        callVprintf("%c (%s.%03lld) %s: %s\n", levelLetter(level), stamp, static_cast<long long>(millis),
                    tag ? tag : "-", message);
    }
} // sihoa::log
