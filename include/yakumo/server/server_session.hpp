// server_session.hpp - Server state for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <yakumo/common/net/session_registry.hpp>

namespace Yakumo {
    // Typed view of the server_config file
    struct ServerConfig {
        uint16_t listenPort = 3000;
        uint16_t portRangeStart = Net::PortPool::DEFAULT_FIRST_PORT;
        uint16_t portRangeEnd = Net::PortPool::DEFAULT_LAST_PORT;
        std::string accessToken;
        std::string nftBinary = "/usr/sbin/nft";
        std::string nftTable = "yakumo";
        std::chrono::milliseconds providerTimeout{5000};
        size_t workerThreads = 4;

        // Throws std::invalid_argument on malformed values
        static ServerConfig fromMap(const std::unordered_map<std::string, std::string>& raw);
    };

    struct ServerState {
        std::string configPath;
        std::unordered_map<std::string, std::string> rawConfig;
        ServerConfig config;
        std::shared_ptr<Net::SessionRegistry> registry;
        bool ipv4Only = false;
        bool hostRunning = false;

        ~ServerState() = default;
        ServerState(const ServerState&) = delete;
        ServerState& operator=(const ServerState&) = delete;
        ServerState(ServerState&&) = default;
        ServerState& operator=(ServerState&&) = default;

        explicit ServerState() = default;
    };

    class ServerSession {
        public:
            // Return a reference to the Server Session instance
            static ServerSession& getInstance() { static ServerSession instance; return instance; }

            // Return the current server state
            std::shared_ptr<ServerState> getServerState() const;

            // Like getServerState, but returns nullptr instead of waiting for the lock
            std::shared_ptr<ServerState> tryGetServerState() const;

            // Set the server state
            void setServerState(std::shared_ptr<ServerState> state);

            // Getters
            std::shared_ptr<Net::SessionRegistry> getRegistry() const;
            ServerConfig getConfig() const;
            bool isIPv4Only() const;
            bool isHostRunning() const;

            // Setters
            void setHostRunning(bool hostRunning);

        private:
            mutable std::shared_mutex mMutex;
            std::shared_ptr<struct ServerState> mServerState{nullptr};
    };
}
