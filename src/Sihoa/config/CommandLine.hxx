// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef SIHOA_COMMANDLINE_HXX
#define SIHOA_COMMANDLINE_HXX

namespace sihoa
{
    enum class CommandLineMode {
        Daemon,
        Import
    };

    struct CommandLineOptions {
        std::optional<std::string> config_path{};
        std::optional<std::string> database{};
        std::optional<std::string> host{};
        std::optional<int> port{};
        std::optional<std::string> username{};
        std::optional<std::string> password{};
        std::optional<std::string> log_file{};
        std::optional<std::string> topic{};         // import only
        std::optional<double> timeout_s{};          // import only
        bool help{false};
    };

    /**
     * @brief getopt_long based parser. Unknown options and malformed numbers yield
     * SIHOA_ERR_INVALID_ARG.
     */
    sihoa_err_t parseCommandLine(int argc, char* const argv[], CommandLineMode mode, CommandLineOptions& out);

    void printUsage(FILE* stream, const char* program, CommandLineMode mode);
} // sihoa

#endif //SIHOA_COMMANDLINE_HXX
