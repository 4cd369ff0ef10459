// http_connection.hpp - HTTP Connection for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <asio.hpp>
#include <yakumo/common/utils.hpp>
#include <yakumo/server/api_handler.hpp>
#include <yakumo/server/net/http/http_message.hpp>
#include <yakumo/server/net/http/net_helper.hpp>

namespace Yakumo::Net::HTTP {
    // One request, one response, then close
    class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
        public:
            using pointer = std::shared_ptr<HttpConnection>;

            static constexpr size_t MAX_HEAD_BYTES = 16 * 1024;
            static constexpr std::chrono::seconds READ_TIMEOUT{10};

            static pointer create(
                asio::ip::tcp::socket socket,
                std::shared_ptr<ApiHandler> handler,
                asio::thread_pool& workers,
                std::function<void(pointer)> onDisconnect)
            {
                auto conn = pointer(new HttpConnection(std::move(socket), std::move(handler), workers));
                conn->mOnDisconnect = std::move(onDisconnect);
                return conn;
            }

            // Start reading the request
            void start();
            // Close the socket and notify the owner, safe to call more than once
            void disconnect();

        private:
            HttpConnection(asio::ip::tcp::socket socket, std::shared_ptr<ApiHandler> handler, asio::thread_pool& workers)
                : mSocket(std::move(socket)),
                  mHandler(std::move(handler)),
                  mWorkers(workers),
                  mBuffer(MAX_HEAD_BYTES),
                  mReadDeadline(mSocket.get_executor()),
                  mPeer(NetHelper::peerOf(mSocket))
            {}

            void mReadRequest();
            // Runs the handler on the worker pool and hops back to the socket's executor to reply
            void mDispatch(HttpRequest request);
            void mWriteResponse(const HttpResponse& response);

            asio::ip::tcp::socket mSocket;
            std::shared_ptr<ApiHandler> mHandler;
            asio::thread_pool& mWorkers;
            asio::streambuf mBuffer;
            asio::steady_timer mReadDeadline;
            std::string mPeer;
            std::string mOutgoing;
            bool mRequestReceived = false;
            bool mClosed = false;
            std::function<void(pointer)> mOnDisconnect;
    };
}
