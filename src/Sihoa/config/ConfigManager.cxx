// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "config/ConfigManager.hxx"
#include "config/Defaults.hxx"
#include "utils/FileHandle.hxx"
#include "utils/JsonHandle.hxx"
#include "utils/StringUtils.hxx"
#include <unistd.h>

namespace sihoa
{
    static constexpr char TAG[] = "Config";

    namespace {
        AppConfig defaultConfig() {
            AppConfig cfg;
            cfg.mqtt_host = SIHOA_DEFAULT_MQTT_HOST;
            cfg.mqtt_port = SIHOA_DEFAULT_MQTT_PORT;
            cfg.mqtt_base_topic = SIHOA_DEFAULT_MQTT_BASE_TOPIC;
            cfg.mqtt_keepalive_s = SIHOA_DEFAULT_MQTT_KEEPALIVE_S;
            cfg.mqtt_connect_timeout_ms = SIHOA_DEFAULT_MQTT_CONNECT_TIMEOUT_MS;
            cfg.database_path = SIHOA_DEFAULT_DATABASE_PATH;
            cfg.log_level = SIHOA_DEFAULT_LOG_LEVEL;
            cfg.log_max_bytes = SIHOA_DEFAULT_LOG_MAX_BYTES;
            cfg.log_backups = SIHOA_DEFAULT_LOG_BACKUPS;
            cfg.loop_period_ms = SIHOA_DEFAULT_LOOP_PERIOD_MS;
            cfg.loop_drain_timeout_ms = SIHOA_DEFAULT_LOOP_DRAIN_TIMEOUT_MS;
            cfg.pending_timeout_ms = SIHOA_DEFAULT_PENDING_TIMEOUT_MS;
            cfg.inventory_topic = SIHOA_DEFAULT_INVENTORY_TOPIC;
            cfg.inventory_sync_on_publish = SIHOA_DEFAULT_INVENTORY_SYNC;
            cfg.snapshot_timeout_ms = SIHOA_DEFAULT_SNAPSHOT_TIMEOUT_MS;
            return cfg;
        }

        bool readU32(const cJSON* item, uint32_t& out) {
            if (!cJSON_IsNumber(item)) return false;
            const double value = item->valuedouble;
            if (value < 0 || value > static_cast<double>(UINT32_MAX) || value != static_cast<double>(static_cast<uint32_t>(value))) {
                return false;
            }
            out = static_cast<uint32_t>(value);
            return true;
        }
    }

    std::string AppConfig::mqttUri() const {
        return utils::stringFormat("tcp://%s:%d", mqtt_host.c_str(), mqtt_port);
    }

    ConfigManager::ConfigManager() : config_cache(defaultConfig()) {}

    void ConfigManager::reset() {
        std::lock_guard lock(config_mutex);
        config_cache = defaultConfig();
    }

    sihoa_err_t ConfigManager::loadFile(const std::string& path) {
        const FileHandle file(path.c_str(), "r");
        if (!file) {
            SIHOA_LOGE(TAG, "Cannot open configuration file %s", path.c_str());
            return SIHOA_ERR_NOT_FOUND;
        }
        std::string content;
        if (!file.readAll(content)) {
            SIHOA_LOGE(TAG, "Error reading configuration file %s", path.c_str());
            return SIHOA_FAIL;
        }
        const sihoa_err_t err = loadFromJson(content);
        if (err == SIHOA_OK) {
            SIHOA_LOGI(TAG, "Configuration loaded from %s", path.c_str());
        }
        return err;
    }

    sihoa_err_t ConfigManager::loadFromJson(const std::string_view json) {
        const JsonHandle root = utils::parseJson(json);
        if (!cJSON_IsObject(root.get())) {
            SIHOA_LOGE(TAG, "Configuration is not a JSON object");
            return SIHOA_ERR_INVALID_CONFIG;
        }

        AppConfig cfg = getConfig();

        #define JsonSetStrConfig(SECTION, NAME, KEY) \
            if (const cJSON* item = cJSON_GetObjectItem(SECTION, KEY)) { \
                if (!cJSON_IsString(item) || item->valuestring == nullptr) { \
                    SIHOA_LOGE(TAG, "'%s' must be a string", KEY); \
                    return SIHOA_ERR_INVALID_CONFIG; \
                } \
                cfg.NAME = item->valuestring; \
            }

        #define JsonSetU32Config(SECTION, NAME, KEY) \
            if (const cJSON* item = cJSON_GetObjectItem(SECTION, KEY)) { \
                if (!readU32(item, cfg.NAME)) { \
                    SIHOA_LOGE(TAG, "'%s' must be a non-negative integer", KEY); \
                    return SIHOA_ERR_INVALID_CONFIG; \
                } \
            }

        if (const cJSON* mqtt = cJSON_GetObjectItem(root.get(), "mqtt")) {
            JsonSetStrConfig(mqtt, mqtt_host, "host");
            if (const cJSON* item = cJSON_GetObjectItem(mqtt, "port")) {
                uint32_t port = 0;
                if (!readU32(item, port) || port > 65535) {
                    SIHOA_LOGE(TAG, "'port' must be an integer in 1..65535");
                    return SIHOA_ERR_INVALID_CONFIG;
                }
                cfg.mqtt_port = static_cast<int>(port);
            }
            JsonSetStrConfig(mqtt, mqtt_username, "username");
            JsonSetStrConfig(mqtt, mqtt_password, "password");
            JsonSetStrConfig(mqtt, mqtt_client_id, "client_id");
            JsonSetStrConfig(mqtt, mqtt_base_topic, "base_topic");
            JsonSetU32Config(mqtt, mqtt_keepalive_s, "keepalive_s");
            JsonSetU32Config(mqtt, mqtt_connect_timeout_ms, "connect_timeout_ms");
        }

        if (const cJSON* database = cJSON_GetObjectItem(root.get(), "database")) {
            JsonSetStrConfig(database, database_path, "path");
        }

        if (const cJSON* log = cJSON_GetObjectItem(root.get(), "log")) {
            JsonSetStrConfig(log, log_level, "level");
            JsonSetStrConfig(log, log_file, "file");
            JsonSetU32Config(log, log_max_bytes, "max_bytes");
            JsonSetU32Config(log, log_backups, "backups");
            JsonSetStrConfig(log, syslog_server, "syslog_server");
        }

        if (const cJSON* loop = cJSON_GetObjectItem(root.get(), "loop")) {
            JsonSetU32Config(loop, loop_period_ms, "period_ms");
            JsonSetU32Config(loop, loop_drain_timeout_ms, "drain_timeout_ms");
            JsonSetU32Config(loop, pending_timeout_ms, "pending_timeout_ms");
        }

        if (const cJSON* inventory = cJSON_GetObjectItem(root.get(), "inventory")) {
            JsonSetStrConfig(inventory, inventory_topic, "topic");
            if (const cJSON* item = cJSON_GetObjectItem(inventory, "sync_on_publish")) {
                if (!cJSON_IsBool(item)) {
                    SIHOA_LOGE(TAG, "'sync_on_publish' must be a boolean");
                    return SIHOA_ERR_INVALID_CONFIG;
                }
                cfg.inventory_sync_on_publish = cJSON_IsTrue(item);
            }
            JsonSetU32Config(inventory, snapshot_timeout_ms, "snapshot_timeout_ms");
        }

        #undef JsonSetStrConfig
        #undef JsonSetU32Config

        if (const cJSON* actuators = cJSON_GetObjectItem(root.get(), "actuators")) {
            if (const sihoa_err_t err = parseActuators(actuators, cfg.actuators); err != SIHOA_OK) return err;
        }
        if (const cJSON* groups = cJSON_GetObjectItem(root.get(), "groups")) {
            if (const sihoa_err_t err = parseGroups(groups, cfg.groups); err != SIHOA_OK) return err;
        }

        setConfig(cfg);
        return SIHOA_OK;
    }

    sihoa_err_t ConfigManager::parseActuators(const cJSON* array, std::vector<ActuatorConfig>& out) {
        if (!cJSON_IsArray(array)) {
            SIHOA_LOGE(TAG, "'actuators' must be an array");
            return SIHOA_ERR_INVALID_CONFIG;
        }
        std::vector<ActuatorConfig> parsed;
        const cJSON* entry = nullptr;
        cJSON_ArrayForEach(entry, array) {
            const auto cls_name = utils::getString(entry, "class");
            const auto name = utils::getString(entry, "friendly_name");
            const auto ieee = utils::getString(entry, "ieee_address");
            if (!cls_name || !name || name->empty()) {
                SIHOA_LOGE(TAG, "Actuator entries need 'class' and 'friendly_name'");
                return SIHOA_ERR_INVALID_CONFIG;
            }
            const auto cls = actuatorClassFromString(*cls_name);
            if (!cls) {
                SIHOA_LOGE(TAG, "Unknown actuator class '%s' for %s", cls_name->c_str(), name->c_str());
                return SIHOA_ERR_INVALID_CONFIG;
            }
            parsed.push_back(ActuatorConfig{*cls, *name, ieee.value_or("")});
        }
        out = std::move(parsed);
        return SIHOA_OK;
    }

    sihoa_err_t ConfigManager::parseGroups(const cJSON* array, std::vector<ActuatorGroup>& out) {
        if (!cJSON_IsArray(array)) {
            SIHOA_LOGE(TAG, "'groups' must be an array");
            return SIHOA_ERR_INVALID_CONFIG;
        }
        std::vector<ActuatorGroup> parsed;
        const cJSON* entry = nullptr;
        cJSON_ArrayForEach(entry, array) {
            ActuatorGroup group;
            group.name = utils::getString(entry, "name").value_or("");

            const auto on = utils::getString(entry, "on");
            const auto off = utils::getString(entry, "off");
            const auto on_time = on ? parseTimeOfDay(*on) : std::nullopt;
            const auto off_time = off ? parseTimeOfDay(*off) : std::nullopt;
            if (!on_time || !off_time) {
                SIHOA_LOGE(TAG, "Group '%s' needs 'on' and 'off' as HH:MM", group.name.c_str());
                return SIHOA_ERR_INVALID_CONFIG;
            }
            group.window = ScheduleWindow{*on_time, *off_time};

            const cJSON* members = utils::getObjectItem(entry, "members");
            if (!cJSON_IsArray(members)) {
                SIHOA_LOGE(TAG, "Group '%s' needs a 'members' array", group.name.c_str());
                return SIHOA_ERR_INVALID_CONFIG;
            }
            const cJSON* member = nullptr;
            cJSON_ArrayForEach(member, members) {
                if (!cJSON_IsString(member) || member->valuestring == nullptr) {
                    SIHOA_LOGE(TAG, "Group '%s' members must be strings", group.name.c_str());
                    return SIHOA_ERR_INVALID_CONFIG;
                }
                group.members.emplace_back(member->valuestring);
            }
            parsed.push_back(std::move(group));
        }
        out = std::move(parsed);
        return SIHOA_OK;
    }

    void ConfigManager::applyCommandLine(const CommandLineOptions& options) {
        std::lock_guard lock(config_mutex);
        if (options.database) config_cache.database_path = *options.database;
        if (options.host) config_cache.mqtt_host = *options.host;
        if (options.port) config_cache.mqtt_port = *options.port;
        if (options.username) config_cache.mqtt_username = *options.username;
        if (options.password) config_cache.mqtt_password = *options.password;
        if (options.log_file) config_cache.log_file = *options.log_file;
        if (options.topic) config_cache.inventory_topic = *options.topic;
        if (options.timeout_s) {
            config_cache.snapshot_timeout_ms = static_cast<uint32_t>(*options.timeout_s * 1000.0);
        }
    }

    sihoa_err_t ConfigManager::finalize() {
        std::lock_guard lock(config_mutex);
        if (config_cache.mqtt_client_id.empty()) {
            config_cache.mqtt_client_id = utils::stringFormat(SIHOA_DEFAULT_MQTT_CLIENT_ID_PREFIX "%d", static_cast<int>(getpid()));
        }
        return validate(config_cache);
    }

    sihoa_err_t ConfigManager::validate(const AppConfig& config) {
        if (config.mqtt_port < 1 || config.mqtt_port > 65535) {
            SIHOA_LOGE(TAG, "MQTT port %d out of range", config.mqtt_port);
            return SIHOA_ERR_INVALID_CONFIG;
        }
        if (config.mqtt_host.empty()) {
            SIHOA_LOGE(TAG, "MQTT host cannot be empty");
            return SIHOA_ERR_INVALID_CONFIG;
        }
        if (!log::levelFromString(config.log_level)) {
            SIHOA_LOGE(TAG, "Unknown log level '%s'", config.log_level.c_str());
            return SIHOA_ERR_INVALID_CONFIG;
        }
        if (config.loop_period_ms == 0) {
            SIHOA_LOGE(TAG, "loop.period_ms must be positive");
            return SIHOA_ERR_INVALID_CONFIG;
        }

        std::set<std::string> names;
        for (const auto& actuator : config.actuators) {
            if (!names.insert(actuator.friendly_name).second) {
                SIHOA_LOGE(TAG, "Duplicate actuator '%s'", actuator.friendly_name.c_str());
                return SIHOA_ERR_INVALID_CONFIG;
            }
        }
        for (const auto& group : config.groups) {
            for (const auto& member : group.members) {
                if (!names.contains(member)) {
                    SIHOA_LOGE(TAG, "Group '%s' names unknown actuator '%s'", group.name.c_str(), member.c_str());
                    return SIHOA_ERR_INVALID_CONFIG;
                }
            }
        }
        return SIHOA_OK;
    }

    AppConfig ConfigManager::getConfig() const {
        std::lock_guard lock(config_mutex);
        return config_cache;
    }

    void ConfigManager::setConfig(const AppConfig& new_config) {
        std::lock_guard lock(config_mutex);
        config_cache = new_config;
    }
} // sihoa
