// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "lifecycle/Lifecycle.hxx"

// Reads the retained device list once and reconciles it into the inventory store.
int main(int argc, char* argv[]) {
    return sihoa::Lifecycle::main(argc, argv, sihoa::CommandLineMode::Import);
}
