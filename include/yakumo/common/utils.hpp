// utils.hpp - Utility functions for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once
#include <iostream>
#include <string>
#include <cstdint>
#include <vector>
#include <fstream>
#include <unordered_map>

#include <unistd.h>

namespace Yakumo::Utils {
    // General log function. Use for logging important information.
    void log(const std::string &msg);
    // General warning function. Use for logging important warnings.
    void warn(const std::string &msg);
    // General error function. Use for logging failures and general errors.
    void error(const std::string &msg);
    // Debug log function. Use for logging non-important information. These will not print unless the binary is compiled with DEBUG=1
    void debug(const std::string &msg);

    // Returns the hostname of the running platform.
    std::string getHostname();
    // Returns the version of the running release.
    std::string getVersion();
    // Default port of the HTTP API.
    unsigned short serverPort();

    // Raw byte to hex string conversion helper
    std::string bytesToHexString(const uint8_t* bytes, size_t length);

    // Joins an argv vector into a single printable command line
    std::string joinCommand(const std::vector<std::string>& argv);

    // Returns the config file in an unordered_map format. This purely reads the config file, you still need to parse it manually.
    // A missing file yields an empty map.
    std::unordered_map<std::string, std::string> getConfigMap(const std::string& path);

    // Looks up an integer config value; returns fallback if the key is absent, throws std::invalid_argument if it is malformed or outside [min, max].
    long configInt(const std::unordered_map<std::string, std::string>& config, const std::string& key, long fallback, long min, long max);

    // Looks up a string config value, returns fallback if the key is absent or empty.
    std::string configString(const std::unordered_map<std::string, std::string>& config, const std::string& key, const std::string& fallback);
};
