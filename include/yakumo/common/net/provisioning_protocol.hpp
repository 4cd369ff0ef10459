// provisioning_protocol.hpp - Rule install/teardown sequencing for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <yakumo/common/net/nat_rule_provider.hpp>

namespace Yakumo::Net {
    // Everything the provider needs to know about one session's forwarding
    struct ForwardingPlan {
        std::string group;
        uint16_t ingressPort = 0;
        std::string targetIP;
        uint16_t targetPort = 0;
    };

    // The provider has no transactions. All per-session rules live in one named group (plus the
    // dispatch and masquerade rules tagged with that group), and a failed install is replayed
    // backwards through the undo column of the step table so only "fully installed" or
    // "not installed" is ever left behind.
    class ProvisioningProtocol {
        public:
            using Action = std::function<ProviderResult(NatRuleProvider&, const ForwardingPlan&)>;

            struct Step {
                std::string name;
                Action apply;
                Action undo; // Empty when a later undo (group removal) covers it
            };

            struct InstallOutcome {
                bool ok = false;
                size_t completedSteps = 0;
                std::string failedStep;
                ProviderResult failure;
            };

            struct TeardownOutcome {
                std::vector<std::string> failures; // One line per failed step

                bool ok() const { return failures.empty(); }
            };

            explicit ProvisioningProtocol(std::shared_ptr<NatRuleProvider> provider);

            // Runs the install table in order. On the first failure the completed steps are undone in
            // reverse order (best effort) before returning.
            InstallOutcome install(const ForwardingPlan& plan);

            // Runs every teardown step regardless of earlier failures
            TeardownOutcome teardown(const ForwardingPlan& plan);

            // Idempotent creation of the base hooks
            ProviderResult bootstrap();

            // Liveness probe of the provider
            ProviderResult probe();

            static const std::vector<Step>& installSteps();
            static const std::vector<Step>& teardownSteps();

        private:
            void mRollback(const ForwardingPlan& plan, size_t completedSteps);

            std::shared_ptr<NatRuleProvider> mProvider;
    };
}
