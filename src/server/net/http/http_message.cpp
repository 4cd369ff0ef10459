// http_message.cpp - Minimal HTTP/1.1 messages for the Yakumo API
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <yakumo/server/net/http/http_message.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace Yakumo::Net::HTTP {
    namespace {
        int hexValue(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        std::string toLower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string trim(const std::string& s) {
            size_t begin = s.find_first_not_of(" \t");
            if (begin == std::string::npos)
                return "";
            size_t end = s.find_last_not_of(" \t");
            return s.substr(begin, end - begin + 1);
        }

        void parseQuery(const std::string& raw, std::unordered_map<std::string, std::string>& out) {
            size_t start = 0;
            while (start <= raw.size()) {
                size_t amp = raw.find('&', start);
                std::string pair = raw.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
                if (!pair.empty()) {
                    size_t eq = pair.find('=');
                    std::string key = urlDecode(pair.substr(0, eq), true);
                    std::string value = eq == std::string::npos ? "" : urlDecode(pair.substr(eq + 1), true);
                    // First occurrence wins
                    out.emplace(std::move(key), std::move(value));
                }
                if (amp == std::string::npos)
                    break;
                start = amp + 1;
            }
        }
    }

    std::optional<std::string> HttpRequest::param(const std::string& name) const {
        auto it = query.find(name);
        if (it == query.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<std::string> HttpRequest::header(const std::string& name) const {
        auto it = headers.find(toLower(name));
        if (it == headers.end())
            return std::nullopt;
        return it->second;
    }

    std::string urlDecode(const std::string& in, bool plusAsSpace) {
        std::string out;
        out.reserve(in.size());
        for (size_t i = 0; i < in.size(); ++i) {
            char c = in[i];
            if (c == '%' && i + 2 < in.size() && hexValue(in[i + 1]) >= 0 && hexValue(in[i + 2]) >= 0) {
                out.push_back(static_cast<char>(hexValue(in[i + 1]) * 16 + hexValue(in[i + 2])));
                i += 2;
            } else if (c == '+' && plusAsSpace) {
                out.push_back(' ');
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    std::optional<HttpRequest> parseRequestHead(const std::string& head) {
        std::istringstream stream(head);
        std::string line;

        if (!std::getline(stream, line))
            return std::nullopt;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        HttpRequest req;
        std::istringstream requestLine(line);
        std::string extra;
        if (!(requestLine >> req.method >> req.target >> req.version) || (requestLine >> extra))
            return std::nullopt;
        if (req.version.rfind("HTTP/", 0) != 0 || req.target.empty() || req.target[0] != '/')
            return std::nullopt;

        size_t q = req.target.find('?');
        req.path = urlDecode(req.target.substr(0, q), false);
        if (q != std::string::npos)
            parseQuery(req.target.substr(q + 1), req.query);

        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                break;

            size_t colon = line.find(':');
            if (colon == std::string::npos || colon == 0)
                return std::nullopt;

            req.headers[toLower(line.substr(0, colon))] = trim(line.substr(colon + 1));
        }

        return req;
    }

    const char* HttpResponse::reasonPhrase(int status) {
        switch (status) {
            case 200: return "OK";
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 413: return "Payload Too Large";
            case 500: return "Internal Server Error";
            case 503: return "Service Unavailable";
            default: return "Unknown";
        }
    }

    std::string HttpResponse::serialize() const {
        std::string out = "HTTP/1.1 " + std::to_string(status) + " " + reasonPhrase(status) + "\r\n";
        out += "Content-Type: " + contentType + "\r\n";
        out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        out += "Connection: close\r\n\r\n";
        out += body;
        return out;
    }
}
