// http_server.hpp - HTTP API Server for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <unordered_set>
#include <asio.hpp>
#include <yakumo/common/utils.hpp>
#include <yakumo/server/api_handler.hpp>
#include <yakumo/server/net/http/http_connection.hpp>

namespace Yakumo::Net::HTTP {

    class HttpServer {
        public:
            HttpServer(asio::io_context& ioContext,
                       uint16_t port,
                       std::shared_ptr<ApiHandler> handler,
                       size_t workerThreads = 4,
                       bool ipv4Only = false)
                : mIoContext(ioContext),
                  mAcceptor(ioContext),
                  mHandler(std::move(handler)),
                  mWorkers(workerThreads == 0 ? 1 : workerThreads)
            {
                asio::error_code ec_open, ec_v6only, ec_bind;

                if (!ipv4Only) {
                    // Try IPv6 (dual-stack if supported)
                    asio::ip::tcp::endpoint endpoint_v6(asio::ip::tcp::v6(), port);

                    mAcceptor.open(endpoint_v6.protocol(), ec_open);

                    if (!ec_open) {
                        // Try enabling dual-stack, but DO NOT treat failure as fatal
                        mAcceptor.set_option(asio::ip::v6_only(false), ec_v6only);
                        mAcceptor.set_option(asio::socket_base::reuse_address(true));

                        // Try binding IPv6
                        mAcceptor.bind(endpoint_v6, ec_bind);
                    }
                }

                // If IPv6 bind failed OR IPv6 open failed OR forced IPv4-only
                if (ipv4Only || ec_open || ec_bind) {
                    if (!ipv4Only)
                        Utils::warn("HTTP: IPv6 unavailable (open=" + ec_open.message() +
                                    ", bind=" + ec_bind.message() +
                                    "), falling back to IPv4 only");

                    asio::ip::tcp::endpoint endpoint_v4(asio::ip::tcp::v4(), port);

                    mAcceptor.close(); // guarantee clean state
                    mAcceptor.open(endpoint_v4.protocol());
                    mAcceptor.set_option(asio::socket_base::reuse_address(true));
                    mAcceptor.bind(endpoint_v4);
                }

                // Start listening
                mAcceptor.listen();
                Utils::log("Started HTTP API on port " + std::to_string(port));
                mStartAccept();
            }

            // Stop accepting and drop open connections. Must run on the io_context.
            void stop();

            // Wait for requests already handed to the worker pool
            void drainWorkers();

        private:
            // Start accepting clients
            void mStartAccept();

            asio::io_context &mIoContext;
            asio::ip::tcp::acceptor mAcceptor;
            std::unordered_set<HttpConnection::pointer> mClients;
            std::shared_ptr<ApiHandler> mHandler;
            asio::thread_pool mWorkers;
            bool mRunning = true;
    };

}
