// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_LIFECYCLE_HXX
#define SIHOA_LIFECYCLE_HXX

#include "actuator/Actuator.hxx"
#include "config/ConfigManager.hxx"
#include "inventory/DeviceStore.hxx"
#include "mqtt/MQTTClient.hxx"
#include "mqtt/MQTTDispatcher.hxx"
#include "schedule/GroupController.hxx"

namespace sihoa
{
    // Process exit codes
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FATAL = 1;
    constexpr int EXIT_TRANSPORT = 2;

    class Lifecycle {
        public:
            explicit Lifecycle(AppConfig config);
            ~Lifecycle();

            Lifecycle(const Lifecycle&) = delete;
            Lifecycle& operator=(const Lifecycle&) = delete;

            /**
             * @brief Configure log level, log file and syslog from the loaded configuration.
             */
            static sihoa_err_t setupLogging(const AppConfig& config);

            /**
             * @brief Parse the command line, load and finalize the configuration, set up
             * logging and signal handlers, then run the daemon or the import tool.
             * @return process exit code.
             */
            static int main(int argc, char* argv[], CommandLineMode mode);

            // Safe to call from a signal handler
            static void requestStop();

            // Daemon: connect, build actuators, run the loop until stopped
            int runDaemon();

            // Import tool: read the retained device list and reconcile it into the store
            int runImport();

        private:
            // LifecycleMQTT
            sihoa_err_t setupAndConnectMqtt();
            sihoa_err_t waitForConnection() const;
            void onMqttConnected(int reason_code);
            void onMqttData(const std::string& topic, const std::string& data);
            void shutdownMqtt();

            // LifecycleRuntime
            sihoa_err_t buildActuators();
            sihoa_err_t registerInventorySync();
            void runLoop();
            void tick();

            AppConfig m_config;
            DeviceStore m_store;
            InboundQueue m_inbound;
            OutboundQueue m_outbound;
            MQTTClient m_mqtt;
            MQTTDispatcher m_dispatcher;
            std::vector<std::unique_ptr<Actuator>> m_actuators;
            GroupController m_groups;

            static std::atomic<bool> s_stop_requested;
    };
} // sihoa

#endif //SIHOA_LIFECYCLE_HXX
