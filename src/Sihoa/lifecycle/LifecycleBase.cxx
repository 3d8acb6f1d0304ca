// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "lifecycle/Lifecycle.hxx"
#include "config/SyslogConfig.hxx"
#include "inventory/InventoryReconciler.hxx"
#include "inventory/SnapshotReader.hxx"
#include "utils/StringUtils.hxx"
#include <csignal>

namespace sihoa
{
    static constexpr char TAG[] = "LifecycleBase";

    std::atomic<bool> Lifecycle::s_stop_requested{false};

    Lifecycle::Lifecycle(AppConfig config)
        : m_config(std::move(config)),
          m_dispatcher(m_mqtt, m_inbound) {}

    Lifecycle::~Lifecycle() {
        shutdownMqtt();
    }

    void Lifecycle::requestStop() {
        s_stop_requested = true;
    }

    static void onStopSignal(int) {
        Lifecycle::requestStop();
    }

    int Lifecycle::main(const int argc, char* argv[], const CommandLineMode mode) {
        CommandLineOptions options;
        if (parseCommandLine(argc, argv, mode, options) != SIHOA_OK) {
            printUsage(stderr, argv[0], mode);
            return EXIT_FATAL;
        }
        if (options.help) {
            printUsage(stdout, argv[0], mode);
            return EXIT_OK;
        }

        auto& config_manager = ConfigManager::Instance();
        if (options.config_path) {
            if (config_manager.loadFile(*options.config_path) != SIHOA_OK) {
                return EXIT_FATAL;
            }
        }
        config_manager.applyCommandLine(options);
        if (config_manager.finalize() != SIHOA_OK) {
            return EXIT_FATAL;
        }
        const AppConfig config = config_manager.getConfig();
        if (setupLogging(config) != SIHOA_OK) {
            return EXIT_FATAL;
        }

        std::signal(SIGINT, onStopSignal);
        std::signal(SIGTERM, onStopSignal);

        int rc;
        {
            Lifecycle lifecycle(config);
            rc = mode == CommandLineMode::Import ? lifecycle.runImport() : lifecycle.runDaemon();
        }
        SyslogConfig::Instance().shutdown();
        log::closeFile();
        return rc;
    }

    sihoa_err_t Lifecycle::setupLogging(const AppConfig& config) {
        const auto level = log::levelFromString(config.log_level);
        if (!level) {
            SIHOA_LOGE(TAG, "Unknown log level '%s'", config.log_level.c_str());
            return SIHOA_ERR_INVALID_CONFIG;
        }
        log::setLevel(*level);

        if (!config.log_file.empty()) {
            if (log::openFile(config.log_file, config.log_max_bytes, config.log_backups) != SIHOA_OK) {
                SIHOA_LOGE(TAG, "Cannot open log file %s", config.log_file.c_str());
                return SIHOA_FAIL;
            }
        }
        if (!config.syslog_server.empty()) {
            SyslogConfig::Instance().init(config.syslog_server);
        }
        return SIHOA_OK;
    }

    int Lifecycle::runDaemon() {
        SIHOA_LOGI(TAG, "Starting SIHOA daemon...");

        if (m_store.open(m_config.database_path) != SIHOA_OK) {
            SIHOA_LOGE(TAG, "Cannot open database %s", m_config.database_path.c_str());
            return EXIT_FATAL;
        }

        if (setupAndConnectMqtt() != SIHOA_OK) {
            return EXIT_FATAL;
        }

        if (buildActuators() != SIHOA_OK || registerInventorySync() != SIHOA_OK) {
            shutdownMqtt();
            return EXIT_FATAL;
        }

        runLoop();
        shutdownMqtt();

        if (const sihoa_err_t fatal = m_dispatcher.fatalError(); fatal != SIHOA_OK) {
            SIHOA_LOGE(TAG, "Stopped on fatal error %s", sihoa_err_to_name(fatal));
            return EXIT_FATAL;
        }
        SIHOA_LOGI(TAG, "Stopped.");
        return EXIT_OK;
    }

    int Lifecycle::runImport() {
        if (m_store.open(m_config.database_path) != SIHOA_OK) {
            SIHOA_LOGE(TAG, "Cannot open database %s", m_config.database_path.c_str());
            return EXIT_FATAL;
        }
        if (setupAndConnectMqtt() != SIHOA_OK) {
            return EXIT_TRANSPORT;
        }

        const std::string topic = utils::joinTopic({m_config.mqtt_base_topic, m_config.inventory_topic});
        SnapshotReader reader(m_dispatcher, m_inbound);
        JsonHandle snapshot;
        const sihoa_err_t read_err = reader.read(topic, std::chrono::milliseconds(m_config.snapshot_timeout_ms), snapshot);
        shutdownMqtt();
        if (read_err != SIHOA_OK) {
            SIHOA_LOGE(TAG, "Reading %s failed: %s", topic.c_str(), sihoa_err_to_name(read_err));
            return EXIT_TRANSPORT;
        }

        const std::string pretty = utils::printJson(snapshot.get(), true);
        fprintf(stdout, "%s\n", pretty.c_str());
        fflush(stdout);

        InventoryReconciler reconciler(m_store);
        ReconcileResult result;
        if (const sihoa_err_t err = reconciler.reconcile(snapshot.get(), result); err != SIHOA_OK) {
            SIHOA_LOGE(TAG, "Reconciliation failed: %s", sihoa_err_to_name(err));
            return EXIT_FATAL;
        }
        fprintf(stderr, "Stored/updated %zu devices. Retired %zu devices\n", result.upserted, result.retired);
        return EXIT_OK;
    }
} // sihoa
