// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_ERROR_HXX
#define SIHOA_ERROR_HXX

namespace sihoa
{
    using sihoa_err_t = int;

    constexpr sihoa_err_t SIHOA_OK = 0;
    constexpr sihoa_err_t SIHOA_FAIL = -1;

    constexpr sihoa_err_t SIHOA_ERR_BASE = 0x5100;
    constexpr sihoa_err_t SIHOA_ERR_INVALID_ARG = SIHOA_ERR_BASE + 0x01;
    constexpr sihoa_err_t SIHOA_ERR_INVALID_CONFIG = SIHOA_ERR_BASE + 0x02;
    constexpr sihoa_err_t SIHOA_ERR_NOT_FOUND = SIHOA_ERR_BASE + 0x03;
    constexpr sihoa_err_t SIHOA_ERR_TIMEOUT = SIHOA_ERR_BASE + 0x04;

    // Registry / dispatcher path. All of these are fatal for the loop that hits them.
    constexpr sihoa_err_t SIHOA_ERR_DUPLICATE_REGISTRATION = SIHOA_ERR_BASE + 0x10;
    constexpr sihoa_err_t SIHOA_ERR_NOT_REGISTERED = SIHOA_ERR_BASE + 0x11;
    constexpr sihoa_err_t SIHOA_ERR_SUBSCRIPTION_FAILED = SIHOA_ERR_BASE + 0x12;
    constexpr sihoa_err_t SIHOA_ERR_UNSUBSCRIPTION_FAILED = SIHOA_ERR_BASE + 0x13;
    constexpr sihoa_err_t SIHOA_ERR_UNROUTED_MESSAGE = SIHOA_ERR_BASE + 0x14;
    constexpr sihoa_err_t SIHOA_ERR_CONNECTION_REFUSED = SIHOA_ERR_BASE + 0x15;

    // Persistent store
    constexpr sihoa_err_t SIHOA_ERR_STORE = SIHOA_ERR_BASE + 0x20;
    constexpr sihoa_err_t SIHOA_ERR_STORE_CONSTRAINT = SIHOA_ERR_BASE + 0x21;

    /**
     * @brief Human readable name of an error code, "UNKNOWN ERROR" for foreign values.
     */
    const char* sihoa_err_to_name(sihoa_err_t code);
} // sihoa

#endif //SIHOA_ERROR_HXX
