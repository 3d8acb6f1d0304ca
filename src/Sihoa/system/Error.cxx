// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/Error.hxx"

namespace sihoa
{
    namespace {
        struct ErrorName {
            sihoa_err_t code;
            const char* name;
        };

        constexpr ErrorName ERROR_NAMES[] = {
            {SIHOA_OK, "SIHOA_OK"},
            {SIHOA_FAIL, "SIHOA_FAIL"},
            {SIHOA_ERR_INVALID_ARG, "SIHOA_ERR_INVALID_ARG"},
            {SIHOA_ERR_INVALID_CONFIG, "SIHOA_ERR_INVALID_CONFIG"},
            {SIHOA_ERR_NOT_FOUND, "SIHOA_ERR_NOT_FOUND"},
            {SIHOA_ERR_TIMEOUT, "SIHOA_ERR_TIMEOUT"},
            {SIHOA_ERR_DUPLICATE_REGISTRATION, "SIHOA_ERR_DUPLICATE_REGISTRATION"},
            {SIHOA_ERR_NOT_REGISTERED, "SIHOA_ERR_NOT_REGISTERED"},
            {SIHOA_ERR_SUBSCRIPTION_FAILED, "SIHOA_ERR_SUBSCRIPTION_FAILED"},
            {SIHOA_ERR_UNSUBSCRIPTION_FAILED, "SIHOA_ERR_UNSUBSCRIPTION_FAILED"},
            {SIHOA_ERR_UNROUTED_MESSAGE, "SIHOA_ERR_UNROUTED_MESSAGE"},
            {SIHOA_ERR_CONNECTION_REFUSED, "SIHOA_ERR_CONNECTION_REFUSED"},
            {SIHOA_ERR_STORE, "SIHOA_ERR_STORE"},
            {SIHOA_ERR_STORE_CONSTRAINT, "SIHOA_ERR_STORE_CONSTRAINT"},
        };
    }

    const char* sihoa_err_to_name(const sihoa_err_t code) {
        for (const auto& [value, name] : ERROR_NAMES) {
            if (value == code) {
                return name;
            }
        }
        return "UNKNOWN ERROR";
    }
} // sihoa
