// http_message.hpp - Minimal HTTP/1.1 messages for the Yakumo API
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace Yakumo::Net::HTTP {
    struct HttpRequest {
        std::string method;
        std::string target;  // Raw request target, e.g. /open_proxy?target_ip=...
        std::string path;    // Decoded path without the query
        std::string version;
        std::unordered_map<std::string, std::string> query;
        std::unordered_map<std::string, std::string> headers; // Lower-case names

        std::optional<std::string> param(const std::string& name) const;
        std::optional<std::string> header(const std::string& name) const;
    };

    struct HttpResponse {
        int status = 200;
        std::string body;
        std::string contentType = "application/json";

        // Status line, headers and body ready for the wire. Always Connection: close.
        std::string serialize() const;

        static const char* reasonPhrase(int status);
    };

    // Parses the request line and headers (everything up to and including the blank line).
    // Returns nullopt if the head is malformed.
    std::optional<HttpRequest> parseRequestHead(const std::string& head);

    // Percent-decoding; '+' becomes a space when plusAsSpace is set (query strings)
    std::string urlDecode(const std::string& in, bool plusAsSpace);
}
