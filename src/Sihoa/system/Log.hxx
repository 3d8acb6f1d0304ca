// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_LOG_HXX
#define SIHOA_LOG_HXX

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "system/Error.hxx"

namespace sihoa
{
    enum class LogLevel : uint8_t {
        None = 0,
        Error,
        Warn,
        Info,
        Debug,
        Verbose
    };

    using vprintf_like_t = int (*)(const char* format, va_list args);

    namespace log {
        void setLevel(LogLevel level);
        [[nodiscard]] std::optional<LogLevel> levelFromString(std::string_view name);

        /**
         * @brief Replace the line writer. Returns the previous one so hooks can chain.
         */
        vprintf_like_t setVprintf(vprintf_like_t func);

        /**
         * @brief Redirect output to a size rotated file (path, path.1 ... path.N).
         */
        sihoa_err_t openFile(const std::string& path, size_t max_bytes, unsigned backups);
        void closeFile();

        void write(LogLevel level, const char* tag, const char* format, ...) __attribute__((format(printf, 3, 4)));
    }
} // sihoa

#define SIHOA_LOGE(tag, format, ...) ::sihoa::log::write(::sihoa::LogLevel::Error, tag, format, ##__VA_ARGS__)
#define SIHOA_LOGW(tag, format, ...) ::sihoa::log::write(::sihoa::LogLevel::Warn, tag, format, ##__VA_ARGS__)
#define SIHOA_LOGI(tag, format, ...) ::sihoa::log::write(::sihoa::LogLevel::Info, tag, format, ##__VA_ARGS__)
#define SIHOA_LOGD(tag, format, ...) ::sihoa::log::write(::sihoa::LogLevel::Debug, tag, format, ##__VA_ARGS__)
#define SIHOA_LOGV(tag, format, ...) ::sihoa::log::write(::sihoa::LogLevel::Verbose, tag, format, ##__VA_ARGS__)

#endif //SIHOA_LOG_HXX
