// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_JSONHANDLE_HXX
#define SIHOA_JSONHANDLE_HXX
#include <cJSON.h>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sihoa
{
    struct CJsonDeleter {
        void operator()(cJSON* item) const { cJSON_Delete(item); }
    };

    // Owning cJSON tree
    using JsonHandle = std::unique_ptr<cJSON, CJsonDeleter>;

    namespace utils {
        /**
         * @brief Parse a JSON document. Empty handle on any syntax error.
         */
        inline JsonHandle parseJson(const std::string_view text) {
            return JsonHandle(cJSON_ParseWithLength(text.data(), text.size()));
        }

        inline std::string printJson(const cJSON* item, const bool formatted = false) {
            if (!item) return {};
            char* raw = formatted ? cJSON_Print(item) : cJSON_PrintUnformatted(item);
            if (!raw) return {};
            std::string result(raw);
            cJSON_free(raw);
            return result;
        }

        inline const cJSON* getObjectItem(const cJSON* object, const char* key) {
            if (!cJSON_IsObject(object)) return nullptr;
            return cJSON_GetObjectItemCaseSensitive(object, key);
        }

        inline std::optional<std::string> getString(const cJSON* object, const char* key) {
            const cJSON* item = getObjectItem(object, key);
            if (cJSON_IsString(item) && item->valuestring) {
                return std::string(item->valuestring);
            }
            return std::nullopt;
        }

        /**
         * @brief Integer value of a JSON number or of a JSON string holding a decimal integer.
         */
        inline std::optional<int> getInt(const cJSON* object, const char* key) {
            const cJSON* item = getObjectItem(object, key);
            if (cJSON_IsNumber(item)) {
                const double value = item->valuedouble;
                if (value < static_cast<double>(INT32_MIN) || value > static_cast<double>(INT32_MAX)) return std::nullopt;
                if (value != static_cast<double>(static_cast<int>(value))) return std::nullopt;
                return static_cast<int>(value);
            }
            if (cJSON_IsString(item) && item->valuestring) {
                const std::string_view text(item->valuestring);
                int value = 0;
                if (auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
                    ec == std::errc() && ptr == text.data() + text.size() && !text.empty()) {
                    return value;
                }
            }
            return std::nullopt;
        }
    }
} // sihoa

#endif //SIHOA_JSONHANDLE_HXX
