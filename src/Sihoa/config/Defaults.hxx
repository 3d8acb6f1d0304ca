// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_DEFAULTS_HXX
#define SIHOA_DEFAULTS_HXX

// Compiled-in configuration defaults. The JSON file and the command line override them.

#define SIHOA_DEFAULT_MQTT_HOST                 "localhost"
#define SIHOA_DEFAULT_MQTT_PORT                 1883
#define SIHOA_DEFAULT_MQTT_BASE_TOPIC           "zigbee_network"
#define SIHOA_DEFAULT_MQTT_KEEPALIVE_S          60
#define SIHOA_DEFAULT_MQTT_CONNECT_TIMEOUT_MS   5000
#define SIHOA_DEFAULT_MQTT_CLIENT_ID_PREFIX     "sihoa_"

#define SIHOA_DEFAULT_DATABASE_PATH             "sihoa.db"

#define SIHOA_DEFAULT_LOG_LEVEL                 "debug"
#define SIHOA_DEFAULT_LOG_MAX_BYTES             (5 * 1024 * 1024)
#define SIHOA_DEFAULT_LOG_BACKUPS               15

#define SIHOA_DEFAULT_LOOP_PERIOD_MS            300
#define SIHOA_DEFAULT_LOOP_DRAIN_TIMEOUT_MS     100
#define SIHOA_DEFAULT_PENDING_TIMEOUT_MS        0

#define SIHOA_DEFAULT_INVENTORY_TOPIC           "bridge/devices"
#define SIHOA_DEFAULT_INVENTORY_SYNC            true
#define SIHOA_DEFAULT_SNAPSHOT_TIMEOUT_MS       5000

#endif //SIHOA_DEFAULTS_HXX
