// nat_rule_provider.hpp - NAT Rule Provider interface for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <cstdint>
#include <string>

namespace Yakumo::Net {
    enum class Protocol : uint8_t {
        UDP,
        TCP,
    };

    inline const char* protocolName(Protocol proto) {
        return proto == Protocol::UDP ? "udp" : "tcp";
    }

    // Outcome of one primitive provider operation
    struct ProviderResult {
        bool ok = false;
        int exitStatus = -1;
        std::string diagnostic; // stderr or an internal reason
        std::string command;    // What was run, for logs

        static ProviderResult success(std::string command = "") {
            ProviderResult r;
            r.ok = true;
            r.exitStatus = 0;
            r.command = std::move(command);
            return r;
        }

        static ProviderResult failure(std::string diagnostic, int exitStatus = -1, std::string command = "") {
            ProviderResult r;
            r.ok = false;
            r.exitStatus = exitStatus;
            r.diagnostic = std::move(diagnostic);
            r.command = std::move(command);
            return r;
        }

        // One-line summary used in logs and error messages
        std::string describe() const {
            std::string out = command.empty() ? std::string("<provider>") : command;
            out += ok ? " -> ok" : " -> exit " + std::to_string(exitStatus);
            if (!diagnostic.empty())
                out += ": " + diagnostic;
            return out;
        }
    };

    // Primitive operations against the packet filter. Implementations must be callable from several threads at once.
    class NatRuleProvider {
        public:
            virtual ~NatRuleProvider() = default;

            // Create the ingress dispatch and egress masquerade hook points if they are missing
            virtual ProviderResult ensureBaseHooks() = 0;

            virtual ProviderResult createGroup(const std::string& group) = 0;
            virtual ProviderResult flushGroup(const std::string& group) = 0;
            virtual ProviderResult deleteGroup(const std::string& group) = 0;

            virtual ProviderResult addRedirectRule(const std::string& group, Protocol proto, uint16_t ingressPort,
                                                   const std::string& targetIP, uint16_t targetPort) = 0;

            virtual ProviderResult addDispatchRule(uint16_t ingressPort, const std::string& group) = 0;
            virtual ProviderResult removeDispatchRule(uint16_t ingressPort, const std::string& group) = 0;

            // The group tags the rule so identical rules of different sessions stay distinguishable
            virtual ProviderResult addReturnMasqueradeRule(const std::string& group, Protocol proto,
                                                           const std::string& targetIP, uint16_t targetPort) = 0;
            virtual ProviderResult removeReturnMasqueradeRule(const std::string& group, Protocol proto,
                                                              const std::string& targetIP, uint16_t targetPort) = 0;

            // Liveness probe
            virtual ProviderResult listTables() = 0;
    };
}
