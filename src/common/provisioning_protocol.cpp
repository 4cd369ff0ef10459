// provisioning_protocol.cpp - Rule install/teardown sequencing for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <yakumo/common/net/provisioning_protocol.hpp>
#include <yakumo/common/utils.hpp>
#include <stdexcept>

namespace Yakumo::Net {
    namespace {
        ProviderResult removeGroup(NatRuleProvider& p, const ForwardingPlan& plan) {
            ProviderResult flushed;
            try {
                flushed = p.flushGroup(plan.group);
            } catch (const std::exception& e) {
                flushed = ProviderResult::failure(std::string("provider threw: ") + e.what());
            }
            if (!flushed.ok) {
                Utils::warn("Flush of group " + plan.group + " failed, deleting anyway: " + flushed.describe());
            }
            return p.deleteGroup(plan.group);
        }

        ProviderResult removeUdpReturn(NatRuleProvider& p, const ForwardingPlan& plan) {
            return p.removeReturnMasqueradeRule(plan.group, Protocol::UDP, plan.targetIP, plan.targetPort);
        }

        ProviderResult removeTcpReturn(NatRuleProvider& p, const ForwardingPlan& plan) {
            return p.removeReturnMasqueradeRule(plan.group, Protocol::TCP, plan.targetIP, plan.targetPort);
        }

        ProviderResult removeDispatch(NatRuleProvider& p, const ForwardingPlan& plan) {
            return p.removeDispatchRule(plan.ingressPort, plan.group);
        }

        // A throwing provider call is a failed step like any other, so rollback and teardown still run
        ProviderResult attempt(const ProvisioningProtocol::Action& action, NatRuleProvider& p, const ForwardingPlan& plan) {
            try {
                return action(p, plan);
            } catch (const std::exception& e) {
                return ProviderResult::failure(std::string("provider threw: ") + e.what());
            }
        }
    }

    const std::vector<ProvisioningProtocol::Step>& ProvisioningProtocol::installSteps() {
        static const std::vector<Step> steps = {
            {"create group",
                [](NatRuleProvider& p, const ForwardingPlan& plan) { return p.createGroup(plan.group); },
                removeGroup},
            {"udp redirect",
                [](NatRuleProvider& p, const ForwardingPlan& plan) {
                    return p.addRedirectRule(plan.group, Protocol::UDP, plan.ingressPort, plan.targetIP, plan.targetPort);
                },
                nullptr},
            {"tcp redirect",
                [](NatRuleProvider& p, const ForwardingPlan& plan) {
                    return p.addRedirectRule(plan.group, Protocol::TCP, plan.ingressPort, plan.targetIP, plan.targetPort);
                },
                nullptr},
            {"dispatch",
                [](NatRuleProvider& p, const ForwardingPlan& plan) { return p.addDispatchRule(plan.ingressPort, plan.group); },
                removeDispatch},
            {"udp return masquerade",
                [](NatRuleProvider& p, const ForwardingPlan& plan) {
                    return p.addReturnMasqueradeRule(plan.group, Protocol::UDP, plan.targetIP, plan.targetPort);
                },
                removeUdpReturn},
            {"tcp return masquerade",
                [](NatRuleProvider& p, const ForwardingPlan& plan) {
                    return p.addReturnMasqueradeRule(plan.group, Protocol::TCP, plan.targetIP, plan.targetPort);
                },
                removeTcpReturn},
        };
        return steps;
    }

    // nftables refuses to delete a chain that is still a jump target, so the dispatch rule goes first
    const std::vector<ProvisioningProtocol::Step>& ProvisioningProtocol::teardownSteps() {
        static const std::vector<Step> steps = {
            {"remove udp return masquerade", removeUdpReturn, nullptr},
            {"remove tcp return masquerade", removeTcpReturn, nullptr},
            {"remove dispatch", removeDispatch, nullptr},
            {"flush group", [](NatRuleProvider& p, const ForwardingPlan& plan) { return p.flushGroup(plan.group); }, nullptr},
            {"delete group", [](NatRuleProvider& p, const ForwardingPlan& plan) { return p.deleteGroup(plan.group); }, nullptr},
        };
        return steps;
    }

    ProvisioningProtocol::ProvisioningProtocol(std::shared_ptr<NatRuleProvider> provider)
        : mProvider(std::move(provider))
    {
        if (!mProvider) {
            throw std::invalid_argument("ProvisioningProtocol needs a provider");
        }
    }

    ProvisioningProtocol::InstallOutcome ProvisioningProtocol::install(const ForwardingPlan& plan) {
        InstallOutcome outcome;
        const auto& steps = installSteps();

        for (const auto& step : steps) {
            ProviderResult res = attempt(step.apply, *mProvider, plan);
            if (!res.ok) {
                Utils::error("Install of " + plan.group + " failed at step '" + step.name + "': " + res.describe());
                outcome.failedStep = step.name;
                outcome.failure = std::move(res);
                mRollback(plan, outcome.completedSteps);
                return outcome;
            }
            outcome.completedSteps++;
        }

        outcome.ok = true;
        return outcome;
    }

    void ProvisioningProtocol::mRollback(const ForwardingPlan& plan, size_t completedSteps) {
        const auto& steps = installSteps();

        for (size_t i = completedSteps; i-- > 0; ) {
            const Step& step = steps[i];
            if (!step.undo)
                continue;

            ProviderResult res = attempt(step.undo, *mProvider, plan);
            if (!res.ok) {
                Utils::warn("Rollback of '" + step.name + "' for " + plan.group + " failed: " + res.describe());
            } else {
                Utils::debug("Rolled back '" + step.name + "' for " + plan.group);
            }
        }
    }

    ProvisioningProtocol::TeardownOutcome ProvisioningProtocol::teardown(const ForwardingPlan& plan) {
        TeardownOutcome outcome;

        for (const auto& step : teardownSteps()) {
            ProviderResult res = attempt(step.apply, *mProvider, plan);
            if (!res.ok) {
                Utils::error("Teardown of " + plan.group + " step '" + step.name + "' failed: " + res.describe());
                outcome.failures.push_back(step.name + ": " + res.describe());
            }
        }

        return outcome;
    }

    ProviderResult ProvisioningProtocol::bootstrap() {
        return mProvider->ensureBaseHooks();
    }

    ProviderResult ProvisioningProtocol::probe() {
        return mProvider->listTables();
    }
}
