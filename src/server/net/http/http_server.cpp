// http_server.cpp - HTTP API Server for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <yakumo/server/net/http/http_server.hpp>
#include <yakumo/server/net/http/net_helper.hpp>

namespace Yakumo::Net::HTTP {

    void HttpServer::mStartAccept() {
        mAcceptor.async_accept(
            [this](asio::error_code ec, asio::ip::tcp::socket socket) {
                if (ec) {
                    if (ec == asio::error::operation_aborted) {
                        // Acceptor was cancelled/closed during shutdown
                        return;
                    }
                    Utils::error("Accept failed: " + ec.message());
                    // Try again only if still running
                    if (mRunning && mAcceptor.is_open())
                        mStartAccept();
                    return;
                }

                auto client = HttpConnection::create(
                    std::move(socket),
                    mHandler,
                    mWorkers,
                    [this](std::shared_ptr<HttpConnection> c) {
                        mClients.erase(c);
                    }
                );
                mClients.insert(client);
                client->start();

                if (mRunning && mAcceptor.is_open())
                    mStartAccept();
            }
        );
    }

    void HttpServer::stop() {
        mRunning = false;

        // Stop accepting
        if (mAcceptor.is_open()) {
            asio::error_code ec;
            mAcceptor.cancel(ec);
            mAcceptor.close(ec);
            Utils::log("HTTP acceptor closed.");
        }

        // Snapshot to avoid iterator invalidation while callbacks erase()
        std::vector<std::shared_ptr<HttpConnection>> snapshot(mClients.begin(), mClients.end());
        for (auto& client : snapshot) {
            client->disconnect();
        }
    }

    void HttpServer::drainWorkers() {
        mWorkers.join();
    }
}
