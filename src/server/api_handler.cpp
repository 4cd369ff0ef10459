// api_handler.cpp - HTTP API routes for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <yakumo/server/api_handler.hpp>
#include <yakumo/common/errors.hpp>
#include <yakumo/common/libsodium_wrapper.hpp>
#include <yakumo/common/utils.hpp>

#include <chrono>

using Yakumo::Net::HTTP::HttpRequest;
using Yakumo::Net::HTTP::HttpResponse;

namespace Yakumo {
    ApiHandler::ApiHandler(std::shared_ptr<Net::SessionRegistry> registry, std::string accessToken)
        : mRegistry(std::move(registry)), mAccessToken(std::move(accessToken))
    {
        if (!mRegistry) {
            throw std::invalid_argument("ApiHandler needs a session registry");
        }
    }

    HttpResponse ApiHandler::mJson(int status, const Json::Value& body) {
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";

        HttpResponse response;
        response.status = status;
        response.body = Json::writeString(writer, body);
        return response;
    }

    HttpResponse ApiHandler::mDetail(int status, const std::string& detail) {
        Json::Value body;
        body["detail"] = detail;
        return mJson(status, body);
    }

    HttpResponse ApiHandler::badRequest(const std::string& detail) {
        return mDetail(400, detail);
    }

    bool ApiHandler::mAuthorized(const HttpRequest& request) const {
        if (mAccessToken.empty())
            return true;

        auto header = request.header("Authorization");
        if (!header)
            return false;

        return Utils::LibSodiumWrapper::constantTimeEquals(*header, "Bearer " + mAccessToken);
    }

    HttpResponse ApiHandler::handle(const HttpRequest& request) {
        if (!mAuthorized(request)) {
            Utils::warn("Rejected unauthorized request for " + request.path);
            return mDetail(401, "Unauthorized");
        }

        if (request.method != "GET") {
            return mDetail(405, "Method Not Allowed");
        }

        try {
            if (request.path == "/")
                return mRoot();
            if (request.path == "/health")
                return mHealth();
            if (request.path == "/open_proxy")
                return mOpenProxy(request);
            if (request.path == "/close_proxy")
                return mCloseProxy(request);
            if (request.path == "/list_proxies")
                return mListProxies();
        } catch (const ValidationError& e) {
            return mDetail(400, e.what());
        } catch (const ResourceExhausted& e) {
            return mDetail(503, e.what());
        } catch (const ProviderUnavailable& e) {
            return mDetail(503, e.what());
        } catch (const NotFound& e) {
            return mDetail(404, e.what());
        } catch (const TeardownError& e) {
            Json::Value body;
            body["detail"] = e.what();
            body["status"] = "closed";
            body["session_id"] = e.sessionID();
            return mJson(500, body);
        } catch (const ProvisioningError& e) {
            return mDetail(500, e.what());
        } catch (const std::exception& e) {
            Utils::error("Unhandled error serving " + request.path + ": " + e.what());
            return mDetail(500, "Internal Server Error");
        }

        return mDetail(404, "Not Found");
    }

    HttpResponse ApiHandler::mRoot() {
        Json::Value body;
        body["message"] = "Hello from the Yakumo Routing service!";
        return mJson(200, body);
    }

    HttpResponse ApiHandler::mHealth() {
        Net::HealthReport report = mRegistry->health();

        Json::Value body;
        body["status"] = report.providerReachable ? "healthy" : "degraded";
        body["provider_reachable"] = report.providerReachable;
        body["active_sessions"] = static_cast<Json::UInt64>(report.activeSessions);
        body["free_ports"] = static_cast<Json::UInt64>(report.freePorts);
        return mJson(200, body);
    }

    HttpResponse ApiHandler::mOpenProxy(const HttpRequest& request) {
        auto targetIP = request.param("target_ip");
        auto targetPortText = request.param("target_port");
        if (!targetIP || targetIP->empty()) {
            throw ValidationError("target_ip is required");
        }
        if (!targetPortText || targetPortText->empty()) {
            throw ValidationError("target_port is required");
        }

        long targetPort = 0;
        size_t consumed = 0;
        try {
            targetPort = std::stol(*targetPortText, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != targetPortText->size()) {
            throw ValidationError("target_port must be an integer, got '" + *targetPortText + "'");
        }
        Net::SessionRegistry::validateTarget(*targetIP, targetPort);

        Net::Session session = mRegistry->open(*targetIP, static_cast<int>(targetPort));

        Json::Value body;
        body["session_id"] = session.id;
        body["ingress_port"] = session.ingressPort;
        body["target_ip"] = session.targetIP;
        body["target_port"] = session.targetPort;
        return mJson(200, body);
    }

    HttpResponse ApiHandler::mCloseProxy(const HttpRequest& request) {
        auto sessionID = request.param("session_id");
        if (!sessionID || sessionID->empty()) {
            throw ValidationError("session_id is required");
        }

        mRegistry->close(*sessionID);

        Json::Value body;
        body["status"] = "closed";
        body["session_id"] = *sessionID;
        return mJson(200, body);
    }

    HttpResponse ApiHandler::mListProxies() {
        Json::Value body(Json::objectValue);
        for (const auto& summary : mRegistry->list()) {
            Json::Value element;
            element["ingress_port"] = summary.ingressPort;
            element["target_ip"] = summary.targetIP;
            element["target_port"] = summary.targetPort;
            element["opened_at"] = static_cast<Json::Int64>(
                std::chrono::duration_cast<std::chrono::seconds>(summary.created.time_since_epoch()).count());
            body[summary.id] = element;
        }
        return mJson(200, body);
    }
}
