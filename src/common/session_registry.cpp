// session_registry.cpp - Session Registry for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <yakumo/common/net/session_registry.hpp>
#include <yakumo/common/libsodium_wrapper.hpp>
#include <yakumo/common/utils.hpp>
#include <asio.hpp>
#include <algorithm>

namespace Yakumo::Net {
    const char* sessionStateName(SessionState state) {
        switch (state) {
            case SessionState::Pending: return "pending";
            case SessionState::Active: return "active";
            case SessionState::Closing: return "closing";
            case SessionState::Closed: return "closed";
        }
        return "unknown";
    }

    SessionRegistry::SessionRegistry(std::shared_ptr<PortPool> ports, std::shared_ptr<NatRuleProvider> provider)
        : mPorts(std::move(ports)), mProtocol(std::move(provider))
    {
        if (!mPorts) {
            throw std::invalid_argument("SessionRegistry needs a port pool");
        }
    }

    std::string SessionRegistry::ruleGroupFor(const std::string& sessionID) {
        std::string group = "proxy_" + sessionID;
        std::replace(group.begin(), group.end(), '-', '_');
        return group;
    }

    std::string SessionRegistry::validateTarget(const std::string& targetIP, long targetPort) {
        if (targetPort < 1 || targetPort > 65535) {
            throw ValidationError("target_port must be between 1 and 65535, got " + std::to_string(targetPort));
        }

        // Scoped IPv6 addresses cannot be expressed in a dnat target
        if (targetIP.empty() || targetIP.find('%') != std::string::npos) {
            throw ValidationError("target_ip '" + targetIP + "' is not a valid IP address");
        }

        asio::error_code ec;
        asio::ip::address address = asio::ip::make_address(targetIP, ec);
        if (ec) {
            throw ValidationError("target_ip '" + targetIP + "' is not a valid IP address");
        }

        return address.to_string();
    }

    std::string SessionRegistry::mGenerateSessionID() const {
        std::string id;
        do {
            id = Utils::LibSodiumWrapper::generateUUID();
        } while (mSessions.find(id) != mSessions.end());
        return id;
    }

    ForwardingPlan SessionRegistry::mPlanFor(const Session& session) {
        ForwardingPlan plan;
        plan.group = session.ruleGroup;
        plan.ingressPort = session.ingressPort;
        plan.targetIP = session.targetIP;
        plan.targetPort = session.targetPort;
        return plan;
    }

    Session SessionRegistry::open(const std::string& targetIP, int targetPort) {
        const std::string canonicalIP = validateTarget(targetIP, targetPort);

        // Claim the port and a Pending record before the lock is dropped for the provider calls
        Session session;
        {
            std::lock_guard lock(mMutex);
            session.id = mGenerateSessionID();
            session.ingressPort = mPorts->allocate();
            session.targetIP = canonicalIP;
            session.targetPort = static_cast<uint16_t>(targetPort);
            session.ruleGroup = ruleGroupFor(session.id);
            session.state = SessionState::Pending;
            mSessions.emplace(session.id, session);
        }

        const ForwardingPlan plan = mPlanFor(session);
        ProvisioningProtocol::InstallOutcome outcome;
        try {
            outcome = mProtocol.install(plan);
        } catch (const std::exception& e) {
            outcome.ok = false;
            outcome.failedStep = "install";
            outcome.failure = ProviderResult::failure(e.what());
            Utils::error("Install of " + plan.group + " threw: " + std::string(e.what()));
        }

        std::lock_guard lock(mMutex);
        if (!outcome.ok) {
            mSessions.erase(session.id);
            mPorts->release(session.ingressPort);
            Utils::warn("Session " + session.id + " rolled back, port " + std::to_string(session.ingressPort) + " released");
            throw ProvisioningError(outcome.failedStep, outcome.failure.describe());
        }

        auto it = mSessions.find(session.id);
        it->second.state = SessionState::Active;

        Utils::log("Opened session " + session.id + ": port " + std::to_string(session.ingressPort) +
                   " -> " + session.targetIP + ":" + std::to_string(session.targetPort));
        return it->second;
    }

    void SessionRegistry::close(const std::string& sessionID) {
        Session session;
        {
            std::lock_guard lock(mMutex);
            auto it = mSessions.find(sessionID);
            // Pending and Closing records belong to a call that is still running
            if (it == mSessions.end() || it->second.state != SessionState::Active) {
                throw NotFound("Session " + sessionID + " not found");
            }
            it->second.state = SessionState::Closing;
            session = it->second;
        }

        ProvisioningProtocol::TeardownOutcome outcome;
        try {
            outcome = mProtocol.teardown(mPlanFor(session));
        } catch (const std::exception& e) {
            outcome.failures.push_back(std::string("teardown threw: ") + e.what());
            Utils::error("Teardown of " + session.ruleGroup + " threw: " + std::string(e.what()));
        }

        {
            std::lock_guard lock(mMutex);
            auto it = mSessions.find(sessionID);
            if (it != mSessions.end()) {
                it->second.state = SessionState::Closed;
                mSessions.erase(it);
            }
            mPorts->release(session.ingressPort);
        }

        if (!outcome.ok()) {
            Utils::warn("Session " + sessionID + " closed with teardown errors, port " + std::to_string(session.ingressPort) + " released anyway");
            throw TeardownError(sessionID, outcome.failures);
        }

        Utils::log("Closed session " + sessionID + ", port " + std::to_string(session.ingressPort) + " released");
    }

    std::vector<SessionSummary> SessionRegistry::list() const {
        std::vector<SessionSummary> out;
        std::lock_guard lock(mMutex);
        out.reserve(mSessions.size());
        for (const auto& [id, session] : mSessions) {
            if (session.state != SessionState::Active)
                continue;

            SessionSummary summary;
            summary.id = id;
            summary.ingressPort = session.ingressPort;
            summary.targetIP = session.targetIP;
            summary.targetPort = session.targetPort;
            summary.created = session.created;
            out.push_back(std::move(summary));
        }
        return out;
    }

    std::optional<std::vector<Session>> SessionRegistry::trySnapshot() const {
        std::unique_lock lock(mMutex, std::try_to_lock);
        if (!lock.owns_lock())
            return std::nullopt;

        std::vector<Session> out;
        out.reserve(mSessions.size());
        for (const auto& entry : mSessions) {
            out.push_back(entry.second);
        }
        return out;
    }

    void SessionRegistry::bootstrap() {
        ProviderResult res = mProtocol.bootstrap();
        if (!res.ok) {
            throw ProviderUnavailable("Bootstrap of base hooks failed: " + res.describe());
        }
        Utils::log("Base hooks present");
    }

    HealthReport SessionRegistry::health() {
        HealthReport report;

        ProviderResult res = mProtocol.probe();
        report.providerReachable = res.ok;
        if (!res.ok) {
            report.providerDiagnostic = res.describe();
            Utils::warn("Provider probe failed: " + report.providerDiagnostic);
        }

        report.activeSessions = activeCount();
        report.freePorts = mPorts->freeCount();
        report.portCapacity = mPorts->capacity();
        return report;
    }

    size_t SessionRegistry::closeAll() {
        size_t closed = 0;
        for (const auto& summary : list()) {
            try {
                close(summary.id);
                closed++;
            } catch (const TeardownError& e) {
                Utils::warn(e.what());
                closed++;
            } catch (const NotFound&) {
                // Closed concurrently
            }
        }
        return closed;
    }

    size_t SessionRegistry::activeCount() const {
        std::lock_guard lock(mMutex);
        return static_cast<size_t>(std::count_if(mSessions.begin(), mSessions.end(),
            [](const auto& entry) { return entry.second.state == SessionState::Active; }));
    }
}
