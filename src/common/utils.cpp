// utils.cpp - Utility functions for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <yakumo/common/utils.hpp>
#include <mutex>
#include <stdexcept>

namespace Yakumo::Utils {
    // Requests are served from several worker threads, keep lines whole
    static std::mutex gLogMutex;

    void log(const std::string &msg) {
        std::lock_guard lock(gLogMutex);
        std::cout << "[LOG] " << msg << std::endl;
    }

    void warn(const std::string &msg) {
        std::lock_guard lock(gLogMutex);
        std::cerr << "[WARN] " << msg << std::endl;
    }

    void error(const std::string &msg) {
        std::lock_guard lock(gLogMutex);
        std::cerr << "[ERROR] " << msg << std::endl;
    }

    void debug(const std::string &msg) {
#if DEBUG
        std::lock_guard lock(gLogMutex);
        std::cout << "[DEBUG] " << msg << std::endl;
#else
        (void)msg;
#endif
    }

    std::string getHostname() {
        char hostname[256];
        if (gethostname(hostname, sizeof(hostname)) == 0) {
            hostname[sizeof(hostname) - 1] = '\0';
            return std::string(hostname);
        } else {
            return "UnknownHost";
        }
    }

    std::string getVersion() {
        return "a0.3";
    }

    unsigned short serverPort() {
        return 3000;
    }

    std::string bytesToHexString(const uint8_t* bytes, size_t length) {
        const char hexChars[] = "0123456789abcdef";
        std::string hexString;
        hexString.reserve(length * 2);

        for (size_t i = 0; i < length; ++i) {
            uint8_t byte = bytes[i];
            hexString.push_back(hexChars[(byte >> 4) & 0x0F]);
            hexString.push_back(hexChars[byte & 0x0F]);
        }

        return hexString;
    }

    std::string joinCommand(const std::vector<std::string>& argv) {
        std::string out;
        for (const auto& arg : argv) {
            if (!out.empty())
                out.push_back(' ');
            out += arg;
        }
        return out;
    }

    std::unordered_map<std::string, std::string> getConfigMap(const std::string& path) {
        std::unordered_map<std::string, std::string> config;

        std::ifstream file(path);
        if (file.is_open()) {
            std::string line;
            while (std::getline(file, line)) {
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();

                if (line.empty() || line[0] == '#')
                    continue;

                size_t eq = line.find('=');
                if (eq == std::string::npos)
                    continue;

                config[line.substr(0, eq)] = line.substr(eq + 1);
            }
        } else {
            debug("Config file " + path + " not found, using defaults.");
        }

        return config;
    }

    long configInt(const std::unordered_map<std::string, std::string>& config, const std::string& key, long fallback, long min, long max) {
        auto it = config.find(key);
        if (it == config.end() || it->second.empty())
            return fallback;

        size_t consumed = 0;
        long value = 0;
        try {
            value = std::stol(it->second, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument("Config value " + key + "=" + it->second + " is not a number");
        }

        if (consumed != it->second.size())
            throw std::invalid_argument("Config value " + key + "=" + it->second + " is not a number");

        if (value < min || value > max)
            throw std::invalid_argument("Config value " + key + "=" + it->second + " is out of range [" + std::to_string(min) + ", " + std::to_string(max) + "]");

        return value;
    }

    std::string configString(const std::unordered_map<std::string, std::string>& config, const std::string& key, const std::string& fallback) {
        auto it = config.find(key);
        return (it == config.end() || it->second.empty()) ? fallback : it->second;
    }
}
