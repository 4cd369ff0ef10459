// http_connection.cpp - HTTP Connection for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <yakumo/server/net/http/http_connection.hpp>

namespace Yakumo::Net::HTTP {
    void HttpConnection::start() {
        auto self = shared_from_this();

        mReadDeadline.expires_after(READ_TIMEOUT);
        mReadDeadline.async_wait([this, self](const asio::error_code& ec) {
            if (ec == asio::error::operation_aborted || mRequestReceived) {
                return; // Request arrived in time
            }
            Utils::warn("HTTP: " + mPeer + " did not send a request within " + std::to_string(READ_TIMEOUT.count()) + "s, dropping.");
            disconnect();
        });

        mReadRequest();
        Utils::debug("HTTP: client connected: " + mPeer);
    }

    void HttpConnection::mReadRequest() {
        auto self = shared_from_this();
        asio::async_read_until(mSocket, mBuffer, "\r\n\r\n",
            [this, self](asio::error_code ec, std::size_t headBytes) {
                mRequestReceived = true;
                mReadDeadline.cancel();

                if (ec) {
                    if (ec == asio::error::not_found) {
                        // Streambuf limit reached before the blank line
                        mWriteResponse(ApiHandler::badRequest("Request head too large"));
                        return;
                    }
                    if (!NetHelper::isExpectedDisconnect(ec)) {
                        Utils::error("HTTP: read from " + mPeer + " failed: " + ec.message());
                    }
                    disconnect();
                    return;
                }

                std::string head(asio::buffers_begin(mBuffer.data()), asio::buffers_begin(mBuffer.data()) + headBytes);
                mBuffer.consume(headBytes);

                auto request = parseRequestHead(head);
                if (!request) {
                    Utils::warn("HTTP: malformed request from " + mPeer);
                    mWriteResponse(ApiHandler::badRequest("Malformed request"));
                    return;
                }

                Utils::debug("HTTP: " + request->method + " " + request->target + " from " + mPeer);
                mDispatch(std::move(*request));
            }
        );
    }

    void HttpConnection::mDispatch(HttpRequest request) {
        auto self = shared_from_this();
        asio::post(mWorkers, [this, self, request = std::move(request)]() {
            HttpResponse response = mHandler->handle(request);
            Utils::log("HTTP: " + request.method + " " + request.path + " from " + mPeer + " -> " + std::to_string(response.status));

            asio::post(mSocket.get_executor(), [this, self, response = std::move(response)]() {
                mWriteResponse(response);
            });
        });
    }

    void HttpConnection::mWriteResponse(const HttpResponse& response) {
        if (mClosed)
            return;

        auto self = shared_from_this();
        mOutgoing = response.serialize();
        asio::async_write(mSocket, asio::buffer(mOutgoing),
            [this, self](asio::error_code ec, std::size_t) {
                if (ec && !NetHelper::isExpectedDisconnect(ec)) {
                    Utils::error("HTTP: send to " + mPeer + " failed: " + ec.message());
                }
                disconnect();
            }
        );
    }

    void HttpConnection::disconnect() {
        if (mClosed)
            return;
        mClosed = true;

        mReadDeadline.cancel();
        asio::error_code ec;
        mSocket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        mSocket.close(ec);

        Utils::debug("HTTP: closed connection to " + mPeer);

        if (mOnDisconnect) {
            mOnDisconnect(shared_from_this());
        }
    }
}
