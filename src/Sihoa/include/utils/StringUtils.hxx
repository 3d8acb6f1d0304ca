// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_STRINGUTILS_HXX
#define SIHOA_STRINGUTILS_HXX

namespace sihoa::utils {
    inline std::string stringFormat(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

    inline std::string stringFormat(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);

        va_list args_copy;
        va_copy(args_copy, args);
        const int len = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);

        if (len < 0) {
            va_end(args);
            return {};
        }

        std::vector<char> buf(len + 1);
        vsnprintf(buf.data(), len + 1, fmt, args);
        va_end(args);

        return {buf.data(), static_cast<size_t>(len)};
    }

    inline std::string_view trim(std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    }

    /**
     * @brief Join topic levels with '/', skipping empty levels.
     */
    inline std::string joinTopic(std::initializer_list<std::string_view> levels) {
        std::string topic;
        for (const auto level : levels) {
            if (level.empty()) continue;
            if (!topic.empty()) topic.push_back('/');
            topic.append(level);
        }
        return topic;
    }
}

#endif //SIHOA_STRINGUTILS_HXX
