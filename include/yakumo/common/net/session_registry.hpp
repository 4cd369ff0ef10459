// session_registry.hpp - Session Registry for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <yakumo/common/errors.hpp>
#include <yakumo/common/net/port_pool.hpp>
#include <yakumo/common/net/nat_rule_provider.hpp>
#include <yakumo/common/net/provisioning_protocol.hpp>

namespace Yakumo::Net {
    // Pending --install ok--> Active --close--> Closing --teardown attempted--> Closed (erased)
    // Pending --install failed--> Closed (rolled back, erased)
    enum class SessionState : uint8_t {
        Pending,
        Active,
        Closing,
        Closed,
    };

    const char* sessionStateName(SessionState state);

    struct Session {
        std::string id;
        uint16_t ingressPort = 0;
        std::string targetIP;
        uint16_t targetPort = 0;
        std::string ruleGroup; // Provider side handle, derived from id
        SessionState state = SessionState::Pending;
        std::chrono::system_clock::time_point created = std::chrono::system_clock::now();
    };

    // What list() hands out; no provider handles
    struct SessionSummary {
        std::string id;
        uint16_t ingressPort = 0;
        std::string targetIP;
        uint16_t targetPort = 0;
        std::chrono::system_clock::time_point created;
    };

    struct HealthReport {
        bool providerReachable = false;
        std::string providerDiagnostic;
        size_t activeSessions = 0;
        size_t freePorts = 0;
        size_t portCapacity = 0;
    };

    class SessionRegistry {
        public:
            SessionRegistry(std::shared_ptr<PortPool> ports, std::shared_ptr<NatRuleProvider> provider);

            SessionRegistry(const SessionRegistry&) = delete;
            SessionRegistry& operator=(const SessionRegistry&) = delete;

            // Validate, allocate a port and install the forwarding. Throws ValidationError, ResourceExhausted or ProvisioningError.
            Session open(const std::string& targetIP, int targetPort);

            // Tear down and forget an Active session. Throws NotFound, or TeardownError after the port has been released.
            void close(const std::string& sessionID);

            // Snapshot of Active sessions
            std::vector<SessionSummary> list() const;

            // Every record in any state, or nullopt if the table is locked. Never blocks, for the crash dump.
            std::optional<std::vector<Session>> trySnapshot() const;

            // Ensure the provider's base hooks exist. Throws ProviderUnavailable.
            void bootstrap();

            // Provider reachability plus counters
            HealthReport health();

            // Close every Active session, used on shutdown. Returns how many were removed.
            size_t closeAll();

            size_t activeCount() const;

            const PortPool& ports() const { return *mPorts; }

            // "proxy_" + id with dashes replaced, usable as an nft chain name
            static std::string ruleGroupFor(const std::string& sessionID);

            // Returns the canonical form of targetIP; throws ValidationError on a bad address or port
            static std::string validateTarget(const std::string& targetIP, long targetPort);

        private:
            // Caller holds mMutex
            std::string mGenerateSessionID() const;

            static ForwardingPlan mPlanFor(const Session& session);

            mutable std::mutex mMutex;
            std::unordered_map<std::string, Session> mSessions;
            std::shared_ptr<PortPool> mPorts;
            ProvisioningProtocol mProtocol;
    };
}
