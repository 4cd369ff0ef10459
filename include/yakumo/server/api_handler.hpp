// api_handler.hpp - HTTP API routes for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <memory>
#include <string>
#include <json/json.h>
#include <yakumo/common/net/session_registry.hpp>
#include <yakumo/server/net/http/http_message.hpp>

namespace Yakumo {
    // Maps requests onto the session registry. Blocking (provider calls), so it runs on worker threads.
    //
    //   GET /                                        greeting
    //   GET /health                                  provider reachability and counters
    //   GET /open_proxy?target_ip=..&target_port=..  400 invalid input, 503 no free port, 500 provider failure
    //   GET /close_proxy?session_id=..               404 unknown id, 500 teardown failure (session is still gone)
    //   GET /list_proxies                            { id: { ingress_port, target_ip, target_port, opened_at } }
    class ApiHandler {
        public:
            // An empty access token disables authentication
            ApiHandler(std::shared_ptr<Net::SessionRegistry> registry, std::string accessToken = "");

            Net::HTTP::HttpResponse handle(const Net::HTTP::HttpRequest& request);

            // Response for a request that could not be parsed at all
            static Net::HTTP::HttpResponse badRequest(const std::string& detail);

        private:
            bool mAuthorized(const Net::HTTP::HttpRequest& request) const;

            Net::HTTP::HttpResponse mRoot();
            Net::HTTP::HttpResponse mHealth();
            Net::HTTP::HttpResponse mOpenProxy(const Net::HTTP::HttpRequest& request);
            Net::HTTP::HttpResponse mCloseProxy(const Net::HTTP::HttpRequest& request);
            Net::HTTP::HttpResponse mListProxies();

            static Net::HTTP::HttpResponse mJson(int status, const Json::Value& body);
            static Net::HTTP::HttpResponse mDetail(int status, const std::string& detail);

            std::shared_ptr<Net::SessionRegistry> mRegistry;
            std::string mAccessToken;
    };
}
