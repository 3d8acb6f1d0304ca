// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "config/CommandLine.hxx"
#include "config/Defaults.hxx"
#include <getopt.h>
#include <cmath>
#include <limits>

namespace sihoa
{
    static constexpr char TAG[] = "CommandLine";

    namespace {
        constexpr option DAEMON_OPTIONS[] = {
            {"config",   required_argument, nullptr, 'c'},
            {"database", required_argument, nullptr, 'd'},
            {"host",     required_argument, nullptr, 'H'},
            {"port",     required_argument, nullptr, 'p'},
            {"username", required_argument, nullptr, 'u'},
            {"password", required_argument, nullptr, 'P'},
            {"log-file", required_argument, nullptr, 'l'},
            {"help",     no_argument,       nullptr, 'h'},
            {nullptr,    0,                 nullptr, 0}
        };

        constexpr option IMPORT_OPTIONS[] = {
            {"config",   required_argument, nullptr, 'c'},
            {"database", required_argument, nullptr, 'd'},
            {"host",     required_argument, nullptr, 'H'},
            {"port",     required_argument, nullptr, 'p'},
            {"username", required_argument, nullptr, 'u'},
            {"password", required_argument, nullptr, 'P'},
            {"log-file", required_argument, nullptr, 'l'},
            {"topic",    required_argument, nullptr, 't'},
            {"timeout",  required_argument, nullptr, 'w'},
            {"help",     no_argument,       nullptr, 'h'},
            {nullptr,    0,                 nullptr, 0}
        };

        std::optional<int> toInt(const std::string_view text) {
            int value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) return std::nullopt;
            return value;
        }

        std::optional<double> toSeconds(const char* text) {
            if (!text || *text == '\0') return std::nullopt;
            char* end = nullptr;
            const double value = std::strtod(text, &end);
            if (end == text || *end != '\0' || !std::isfinite(value) || value < 0.0) return std::nullopt;
            // Stored as whole milliseconds in a uint32_t
            if (value > static_cast<double>(std::numeric_limits<uint32_t>::max()) / 1000.0) return std::nullopt;
            return value;
        }
    }

    sihoa_err_t parseCommandLine(const int argc, char* const argv[], const CommandLineMode mode, CommandLineOptions& out) {
        out = {};
        const bool import = (mode == CommandLineMode::Import);
        const char* short_options = import ? "c:d:H:p:u:P:l:t:w:h" : "c:d:H:p:u:P:l:h";
        const option* long_options = import ? IMPORT_OPTIONS : DAEMON_OPTIONS;

        // Full rescan on every call
        optind = 0;
        opterr = 0;

        int opt;
        while ((opt = getopt_long(argc, argv, short_options, long_options, nullptr)) != -1) {
            switch (opt) {
                case 'c': out.config_path = optarg; break;
                case 'd': out.database = optarg; break;
                case 'H': out.host = optarg; break;
                case 'u': out.username = optarg; break;
                case 'P': out.password = optarg; break;
                case 'l': out.log_file = optarg; break;
                case 't': out.topic = optarg; break;
                case 'p': {
                    const auto port = toInt(optarg);
                    if (!port) {
                        SIHOA_LOGE(TAG, "Invalid port '%s'", optarg);
                        return SIHOA_ERR_INVALID_ARG;
                    }
                    out.port = *port;
                    break;
                }
                case 'w': {
                    const auto seconds = toSeconds(optarg);
                    if (!seconds) {
                        SIHOA_LOGE(TAG, "Invalid timeout '%s'", optarg);
                        return SIHOA_ERR_INVALID_ARG;
                    }
                    out.timeout_s = *seconds;
                    break;
                }
                case 'h': out.help = true; break;
                default:
                    SIHOA_LOGE(TAG, "Unknown or incomplete option '%s'", argv[optind - 1]);
                    return SIHOA_ERR_INVALID_ARG;
            }
        }
        if (optind < argc) {
            SIHOA_LOGE(TAG, "Unexpected argument '%s'", argv[optind]);
            return SIHOA_ERR_INVALID_ARG;
        }
        return SIHOA_OK;
    }

    void printUsage(FILE* stream, const char* program, const CommandLineMode mode) {
        fprintf(stream, "Usage: %s [options]\n\n", program);
        fprintf(stream,
                "  -c, --config FILE      JSON configuration file\n"
                "  -d, --database FILE    SQLite database file (default: " SIHOA_DEFAULT_DATABASE_PATH ")\n"
                "  -H, --host HOST        MQTT broker host (default: " SIHOA_DEFAULT_MQTT_HOST ")\n"
                "  -p, --port PORT        MQTT broker port (default: %d)\n"
                "  -u, --username USER    MQTT username\n"
                "  -P, --password PASS    MQTT password\n"
                "  -l, --log-file FILE    Write a rotated log file instead of stderr\n",
                SIHOA_DEFAULT_MQTT_PORT);
        if (mode == CommandLineMode::Import) {
            fprintf(stream,
                    "  -t, --topic TOPIC      Devices topic below the base topic (default: " SIHOA_DEFAULT_INVENTORY_TOPIC ")\n"
                    "  -w, --timeout SECONDS  Wait for the retained device list (default: %.1f)\n",
                    SIHOA_DEFAULT_SNAPSHOT_TIMEOUT_MS / 1000.0);
        }
        fprintf(stream, "  -h, --help             Show this help\n");
    }
} // sihoa
