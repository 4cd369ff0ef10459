// net_helper.hpp - Network Helper Functions for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once
#include <string>
#include <asio.hpp>

namespace Yakumo::Net::HTTP {
    class NetHelper {
        public:
            inline static bool isExpectedDisconnect(const asio::error_code& ec) {
                using asio::error::operation_aborted;
                using asio::error::bad_descriptor;
                using asio::error::eof;

                return ec == operation_aborted || ec == bad_descriptor || ec == eof;
            }

            // Peer address for logs; the socket may already be gone
            inline static std::string peerOf(const asio::ip::tcp::socket& socket) {
                asio::error_code ec;
                auto ep = socket.remote_endpoint(ec);
                return ec ? std::string("<unknown>") : ep.address().to_string() + ":" + std::to_string(ep.port());
            }
    };
}
