// server_config_test.cpp - Tests for the Yakumo server configuration
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <gtest/gtest.h>
#include <yakumo/server/server_session.hpp>

#include <stdexcept>

using namespace Yakumo;

// Test the defaults of an empty config
TEST(ServerConfigTest, Defaults) {
    ServerConfig cfg = ServerConfig::fromMap({});

    EXPECT_EQ(cfg.listenPort, 3000);
    EXPECT_EQ(cfg.portRangeStart, 10000);
    EXPECT_EQ(cfg.portRangeEnd, 20000);
    EXPECT_TRUE(cfg.accessToken.empty());
    EXPECT_EQ(cfg.nftBinary, "/usr/sbin/nft");
    EXPECT_EQ(cfg.nftTable, "yakumo");
    EXPECT_EQ(cfg.providerTimeout.count(), 5000);
    EXPECT_EQ(cfg.workerThreads, 4u);
}

// Test that every key is read
TEST(ServerConfigTest, Overrides) {
    ServerConfig cfg = ServerConfig::fromMap({
        {"LISTEN_PORT", "8080"},
        {"PORT_RANGE_START", "30000"},
        {"PORT_RANGE_END", "30100"},
        {"ACCESS_TOKEN", "s3cret"},
        {"NFT_BINARY", "/sbin/nft"},
        {"NFT_TABLE", "edge"},
        {"PROVIDER_TIMEOUT_MS", "1500"},
        {"WORKER_THREADS", "16"},
    });

    EXPECT_EQ(cfg.listenPort, 8080);
    EXPECT_EQ(cfg.portRangeStart, 30000);
    EXPECT_EQ(cfg.portRangeEnd, 30100);
    EXPECT_EQ(cfg.accessToken, "s3cret");
    EXPECT_EQ(cfg.nftBinary, "/sbin/nft");
    EXPECT_EQ(cfg.nftTable, "edge");
    EXPECT_EQ(cfg.providerTimeout.count(), 1500);
    EXPECT_EQ(cfg.workerThreads, 16u);
}

// Test that inconsistent values are refused
TEST(ServerConfigTest, RejectsInvalid) {
    EXPECT_THROW(ServerConfig::fromMap({{"PORT_RANGE_START", "20000"}, {"PORT_RANGE_END", "10000"}}), std::invalid_argument);
    EXPECT_THROW(ServerConfig::fromMap({{"PORT_RANGE_START", "80"}}), std::invalid_argument);
    EXPECT_THROW(ServerConfig::fromMap({{"LISTEN_PORT", "15000"}}), std::invalid_argument);
    EXPECT_THROW(ServerConfig::fromMap({{"LISTEN_PORT", "abc"}}), std::invalid_argument);
    EXPECT_THROW(ServerConfig::fromMap({{"WORKER_THREADS", "0"}}), std::invalid_argument);
    EXPECT_THROW(ServerConfig::fromMap({{"PROVIDER_TIMEOUT_MS", "10"}}), std::invalid_argument);
}

// Test the shared server state accessors
TEST(ServerSessionTest, StateAccessors) {
    auto& session = ServerSession::getInstance();

    auto state = std::make_shared<ServerState>();
    state->config = ServerConfig::fromMap({{"LISTEN_PORT", "4000"}});
    state->ipv4Only = true;
    session.setServerState(state);

    EXPECT_EQ(session.getConfig().listenPort, 4000);
    EXPECT_TRUE(session.isIPv4Only());
    EXPECT_FALSE(session.isHostRunning());
    EXPECT_EQ(session.getRegistry(), nullptr);
    EXPECT_EQ(session.tryGetServerState(), state);

    session.setHostRunning(true);
    EXPECT_TRUE(session.isHostRunning());

    session.setServerState(nullptr);
    EXPECT_FALSE(session.isHostRunning());
}
