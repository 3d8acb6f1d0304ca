// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_CONFIGMANAGER_HXX
#define SIHOA_CONFIGMANAGER_HXX

#include "actuator/ActuatorTypes.hxx"
#include "config/CommandLine.hxx"
#include "schedule/Schedule.hxx"

namespace sihoa
{
    struct ActuatorConfig {
        ActuatorClass cls{ActuatorClass::Light};
        std::string friendly_name;
        std::string ieee_address;
    };

    struct AppConfig {
        // MQTT
        std::string mqtt_host;
        int mqtt_port{0};
        std::string mqtt_username;
        std::string mqtt_password;
        std::string mqtt_client_id;
        std::string mqtt_base_topic;
        uint32_t mqtt_keepalive_s{0};
        uint32_t mqtt_connect_timeout_ms{0};

        // Database
        std::string database_path;

        // Logging
        std::string log_level;
        std::string log_file;
        uint32_t log_max_bytes{0};
        uint32_t log_backups{0};
        std::string syslog_server;

        // Runtime loop
        uint32_t loop_period_ms{0};
        uint32_t loop_drain_timeout_ms{0};
        uint32_t pending_timeout_ms{0};

        // Inventory
        std::string inventory_topic;
        bool inventory_sync_on_publish{true};
        uint32_t snapshot_timeout_ms{0};

        std::vector<ActuatorConfig> actuators;
        std::vector<ActuatorGroup> groups;

        [[nodiscard]] std::string mqttUri() const;
    };

    class ConfigManager {
        public:
            ConfigManager(const ConfigManager&) = delete;
            ConfigManager& operator=(const ConfigManager&) = delete;

            [[nodiscard]] static ConfigManager& Instance() {
                static ConfigManager instance;
                return instance;
            }

            // Restore compiled defaults
            void reset();

            sihoa_err_t loadFile(const std::string& path);
            sihoa_err_t loadFromJson(std::string_view json);
            void applyCommandLine(const CommandLineOptions& options);

            /**
             * @brief Fill derived values (client id) and check consistency.
             * @return SIHOA_ERR_INVALID_CONFIG with the reason logged.
             */
            sihoa_err_t finalize();

            [[nodiscard]] AppConfig getConfig() const;
            void setConfig(const AppConfig& new_config);

        private:
            ConfigManager();

            static sihoa_err_t parseActuators(const cJSON* array, std::vector<ActuatorConfig>& out);
            static sihoa_err_t parseGroups(const cJSON* array, std::vector<ActuatorGroup>& out);
            static sihoa_err_t validate(const AppConfig& config);

            AppConfig config_cache;
            mutable std::mutex config_mutex;
    };
} // sihoa

#endif //SIHOA_CONFIGMANAGER_HXX
