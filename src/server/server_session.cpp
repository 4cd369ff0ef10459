// server_session.cpp - Server state for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <yakumo/server/server_session.hpp>
#include <yakumo/common/utils.hpp>
#include <mutex>

namespace Yakumo {
    ServerConfig ServerConfig::fromMap(const std::unordered_map<std::string, std::string>& raw) {
        ServerConfig cfg;
        cfg.listenPort = static_cast<uint16_t>(Utils::configInt(raw, "LISTEN_PORT", Utils::serverPort(), 1, 65535));
        cfg.portRangeStart = static_cast<uint16_t>(Utils::configInt(raw, "PORT_RANGE_START", cfg.portRangeStart, Net::PortPool::MIN_EPHEMERAL_PORT, 65535));
        cfg.portRangeEnd = static_cast<uint16_t>(Utils::configInt(raw, "PORT_RANGE_END", cfg.portRangeEnd, Net::PortPool::MIN_EPHEMERAL_PORT, 65535));
        if (cfg.portRangeStart > cfg.portRangeEnd) {
            throw std::invalid_argument("PORT_RANGE_START must not exceed PORT_RANGE_END");
        }
        if (cfg.listenPort >= cfg.portRangeStart && cfg.listenPort <= cfg.portRangeEnd) {
            throw std::invalid_argument("LISTEN_PORT " + std::to_string(cfg.listenPort) + " lies inside the ingress port range");
        }

        cfg.accessToken = Utils::configString(raw, "ACCESS_TOKEN", "");
        cfg.nftBinary = Utils::configString(raw, "NFT_BINARY", cfg.nftBinary);
        cfg.nftTable = Utils::configString(raw, "NFT_TABLE", cfg.nftTable);
        cfg.providerTimeout = std::chrono::milliseconds(Utils::configInt(raw, "PROVIDER_TIMEOUT_MS", cfg.providerTimeout.count(), 100, 600000));
        cfg.workerThreads = static_cast<size_t>(Utils::configInt(raw, "WORKER_THREADS", static_cast<long>(cfg.workerThreads), 1, 256));
        return cfg;
    }

    std::shared_ptr<ServerState> ServerSession::getServerState() const {
        std::shared_lock lock(mMutex);
        return mServerState;
    }

    std::shared_ptr<ServerState> ServerSession::tryGetServerState() const {
        std::shared_lock lock(mMutex, std::try_to_lock);
        return lock.owns_lock() ? mServerState : nullptr;
    }

    void ServerSession::setServerState(std::shared_ptr<ServerState> state) {
        std::unique_lock lock(mMutex);
        mServerState = std::move(state);
    }

    std::shared_ptr<Net::SessionRegistry> ServerSession::getRegistry() const {
        std::shared_lock lock(mMutex);
        return mServerState ? mServerState->registry : nullptr;
    }

    ServerConfig ServerSession::getConfig() const {
        std::shared_lock lock(mMutex);
        return mServerState ? mServerState->config : ServerConfig{};
    }

    bool ServerSession::isIPv4Only() const {
        std::shared_lock lock(mMutex);
        return mServerState ? mServerState->ipv4Only : false;
    }

    bool ServerSession::isHostRunning() const {
        std::shared_lock lock(mMutex);
        return mServerState ? mServerState->hostRunning : false;
    }

    void ServerSession::setHostRunning(bool hostRunning) {
        std::unique_lock lock(mMutex);
        if (!mServerState)
            mServerState = std::make_shared<ServerState>();
        mServerState->hostRunning = hostRunning;
    }
}
