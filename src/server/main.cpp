// main.cpp - Server entry point for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <asio.hpp>
#include <iostream>
#include <thread>
#include <cxxopts.hpp>
#include <yakumo/common/utils.hpp>
#include <yakumo/common/errors.hpp>
#include <yakumo/common/panic_handler.hpp>
#include <yakumo/common/libsodium_wrapper.hpp>
#include <yakumo/common/process_runner.hpp>
#include <yakumo/common/net/nft_rule_provider.hpp>
#include <yakumo/common/net/port_pool.hpp>
#include <yakumo/common/net/session_registry.hpp>
#include <yakumo/server/api_handler.hpp>
#include <yakumo/server/server_session.hpp>
#include <yakumo/server/net/http/http_server.hpp>

using namespace Yakumo::Utils;
using namespace Yakumo::Net;
using namespace Yakumo;

int main(int argc, char** argv) {
    cxxopts::Options options("yakumo_server", "Yakumo Routing Service - on-demand UDP/TCP port forwarding");

    options.add_options()
        ("h,help", "Print help")
        ("4,ipv4-only", "Force IPv4 only operation of the API listener", cxxopts::value<bool>()->default_value("false"))
        ("p,listen-port", "Override the API listen port", cxxopts::value<uint16_t>())
        ("config", "Override config file path", cxxopts::value<std::string>()->default_value("./server_config"));

    // Runs inside the crash handler: take no lock that the crashed thread may hold
    PanicHandler::init([](std::ostream& out) {
        auto state = ServerSession::getInstance().tryGetServerState();
        if (!state || !state->registry) {
            out << "Registry not started or locked\n";
            return;
        }
        out << "Table: " << NftRuleProvider::FAMILY << " " << state->config.nftTable
            << " (remove with: " << state->config.nftBinary << " delete table " << NftRuleProvider::FAMILY << " " << state->config.nftTable << ")\n";

        auto sessions = state->registry->trySnapshot();
        if (!sessions) {
            out << "Session table locked, listing skipped\n";
            return;
        }
        for (const auto& session : *sessions) {
            out << session.id << " [" << sessionStateName(session.state) << "]: port " << session.ingressPort
                << " -> " << session.targetIP << ":" << session.targetPort << ", chain " << session.ruleGroup << "\n";
        }
    });

    try {
        auto optionsObj = options.parse(argc, argv);
        if (optionsObj.count("help")) {
            std::cout << options.help() << std::endl;
            std::cout << "This software is licensed under the GPLv2-only license OR the GPLv3 license.\n";
            std::cout << "This software is provided under ABSOLUTELY NO WARRANTY, to the extent permitted by law.\n";
            return 0;
        }

        log("Yakumo Routing Service, Version " + getVersion() + " on " + getHostname());

        auto state = std::make_shared<ServerState>();
        state->configPath = optionsObj["config"].as<std::string>();
        state->rawConfig = Utils::getConfigMap(state->configPath);
        state->config = ServerConfig::fromMap(state->rawConfig);
        state->ipv4Only = optionsObj["ipv4-only"].as<bool>();
        if (optionsObj.count("listen-port")) {
            state->config.listenPort = optionsObj["listen-port"].as<uint16_t>();
        }

        const ServerConfig& cfg = state->config;
        if (cfg.accessToken.empty()) {
            warn("No ACCESS_TOKEN configured! The API accepts unauthenticated requests.");
        }

        LibSodiumWrapper::init();

        auto runner = std::make_shared<ProcessRunner>(cfg.providerTimeout);
        auto provider = std::make_shared<NftRuleProvider>(runner, cfg.nftBinary, cfg.nftTable);
        auto ports = std::make_shared<PortPool>(cfg.portRangeStart, cfg.portRangeEnd);
        state->registry = std::make_shared<SessionRegistry>(ports, provider);

        log("Ingress ports " + std::to_string(cfg.portRangeStart) + "-" + std::to_string(cfg.portRangeEnd) +
            ", nft table " + std::string(NftRuleProvider::FAMILY) + " " + cfg.nftTable);

        try {
            state->registry->bootstrap();
        } catch (const ProviderUnavailable& e) {
            error(std::string("Cannot start without the packet filter: ") + e.what());
            return 1;
        }

        state->hostRunning = true;
        ServerSession::getInstance().setServerState(state);

        asio::io_context io;

        auto handler = std::make_shared<ApiHandler>(state->registry, cfg.accessToken);
        auto server = std::make_shared<HTTP::HttpServer>(io, cfg.listenPort, handler, cfg.workerThreads, ServerSession::getInstance().isIPv4Only());

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const std::error_code&, int) {
            log("Received termination signal. Shutting down server gracefully.");
            ServerSession::getInstance().setHostRunning(false);
            server->stop();
        });

        // Run the IO context in a separate thread
        std::thread ioThread([&io]() {
            io.run();
        });

        ioThread.join();

        log("Shutting down server...");
        server->drainWorkers();

        // Sessions do not survive a restart, so their rules must not either
        auto registry = ServerSession::getInstance().getRegistry();
        size_t closed = registry->closeAll();
        log("Closed " + std::to_string(closed) + " session(s) on shutdown.");

        log("Server stopped.");
    } catch (const std::exception& e) {
        error("Server error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
