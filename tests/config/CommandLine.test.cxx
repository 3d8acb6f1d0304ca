// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "config/CommandLine.hxx"

using namespace sihoa;

namespace {
    sihoa_err_t parse(std::vector<std::string> args, const CommandLineMode mode, CommandLineOptions& out) {
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (auto& arg : args) argv.push_back(arg.data());
        argv.push_back(nullptr);
        return parseCommandLine(static_cast<int>(args.size()), argv.data(), mode, out);
    }
}

static void test_daemon_options() {
    CommandLineOptions options;
    TEST_ASSERT_EQUAL(SIHOA_OK, parse({"sihoa", "-c", "/etc/sihoa.json", "--host", "broker", "-p", "1884",
                                       "-u", "me", "-P", "pw", "--log-file", "/tmp/sihoa.log"},
                                      CommandLineMode::Daemon, options));
    TEST_ASSERT_EQUAL_STRING("/etc/sihoa.json", options.config_path->c_str());
    TEST_ASSERT_EQUAL_STRING("broker", options.host->c_str());
    TEST_ASSERT_EQUAL_INT(1884, *options.port);
    TEST_ASSERT_EQUAL_STRING("me", options.username->c_str());
    TEST_ASSERT_EQUAL_STRING("pw", options.password->c_str());
    TEST_ASSERT_EQUAL_STRING("/tmp/sihoa.log", options.log_file->c_str());
    TEST_ASSERT_FALSE(options.database.has_value());
    TEST_ASSERT_FALSE(options.help);
}

static void test_import_only_options() {
    CommandLineOptions options;
    TEST_ASSERT_EQUAL(SIHOA_OK, parse({"sihoa-import", "-d", "inv.db", "-t", "bridge/devices", "-w", "1.5"},
                                      CommandLineMode::Import, options));
    TEST_ASSERT_EQUAL_STRING("inv.db", options.database->c_str());
    TEST_ASSERT_EQUAL_STRING("bridge/devices", options.topic->c_str());
    TEST_ASSERT_TRUE(*options.timeout_s == 1.5);

    // Same flags are unknown to the daemon
    TEST_ASSERT_EQUAL(SIHOA_ERR_INVALID_ARG, parse({"sihoa", "-t", "x"}, CommandLineMode::Daemon, options));
}

static void test_invalid_values_are_rejected() {
    CommandLineOptions options;
    TEST_ASSERT_EQUAL(SIHOA_ERR_INVALID_ARG, parse({"sihoa", "-p", "18x3"}, CommandLineMode::Daemon, options));
    TEST_ASSERT_EQUAL(SIHOA_ERR_INVALID_ARG, parse({"sihoa-import", "-w", "soon"}, CommandLineMode::Import, options));
    TEST_ASSERT_EQUAL(SIHOA_ERR_INVALID_ARG, parse({"sihoa", "--bogus"}, CommandLineMode::Daemon, options));
    TEST_ASSERT_EQUAL(SIHOA_ERR_INVALID_ARG, parse({"sihoa", "stray"}, CommandLineMode::Daemon, options));
}

static void test_timeout_out_of_range_is_rejected() {
    CommandLineOptions options;
    TEST_ASSERT_EQUAL(SIHOA_ERR_INVALID_ARG, parse({"sihoa-import", "-w", "1e10"}, CommandLineMode::Import, options));
    TEST_ASSERT_EQUAL(SIHOA_ERR_INVALID_ARG, parse({"sihoa-import", "-w", "inf"}, CommandLineMode::Import, options));
    TEST_ASSERT_EQUAL(SIHOA_ERR_INVALID_ARG, parse({"sihoa-import", "-w", "nan"}, CommandLineMode::Import, options));
    TEST_ASSERT_EQUAL(SIHOA_ERR_INVALID_ARG, parse({"sihoa-import", "-w", "-1"}, CommandLineMode::Import, options));

    // Largest accepted value still fits the millisecond field
    TEST_ASSERT_EQUAL(SIHOA_OK, parse({"sihoa-import", "-w", "4294967"}, CommandLineMode::Import, options));
    TEST_ASSERT_TRUE(*options.timeout_s == 4294967.0);
}

static void test_help_flag() {
    CommandLineOptions options;
    TEST_ASSERT_EQUAL(SIHOA_OK, parse({"sihoa", "--help"}, CommandLineMode::Daemon, options));
    TEST_ASSERT_TRUE(options.help);
}

void run_command_line_tests() {
    RUN_TEST(test_daemon_options);
    RUN_TEST(test_import_only_options);
    RUN_TEST(test_invalid_values_are_rejected);
    RUN_TEST(test_timeout_out_of_range_is_rejected);
    RUN_TEST(test_help_flag);
}
