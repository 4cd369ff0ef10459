// nft_rule_provider.hpp - nftables backed NAT Rule Provider for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <yakumo/common/net/nat_rule_provider.hpp>
#include <yakumo/common/process_runner.hpp>

namespace Yakumo::Net {
    // Drives the nft binary. All state lives in one inet table:
    //   chain prerouting  (nat hook, dispatches ingress ports into per-session chains)
    //   chain postrouting (nat hook, masquerades forwarded traffic)
    //   chain proxy_<id>  (per-session dnat rules)
    class NftRuleProvider : public NatRuleProvider {
        public:
            static constexpr const char* FAMILY = "inet";
            static constexpr const char* PREROUTING_CHAIN = "prerouting";
            static constexpr const char* POSTROUTING_CHAIN = "postrouting";

            NftRuleProvider(std::shared_ptr<Utils::CommandRunner> runner,
                            std::string nftBinary = "/usr/sbin/nft",
                            std::string table = "yakumo");

            ProviderResult ensureBaseHooks() override;

            ProviderResult createGroup(const std::string& group) override;
            ProviderResult flushGroup(const std::string& group) override;
            ProviderResult deleteGroup(const std::string& group) override;

            ProviderResult addRedirectRule(const std::string& group, Protocol proto, uint16_t ingressPort,
                                           const std::string& targetIP, uint16_t targetPort) override;

            ProviderResult addDispatchRule(uint16_t ingressPort, const std::string& group) override;
            ProviderResult removeDispatchRule(uint16_t ingressPort, const std::string& group) override;

            ProviderResult addReturnMasqueradeRule(const std::string& group, Protocol proto,
                                                   const std::string& targetIP, uint16_t targetPort) override;
            ProviderResult removeReturnMasqueradeRule(const std::string& group, Protocol proto,
                                                      const std::string& targetIP, uint16_t targetPort) override;

            ProviderResult listTables() override;

            const std::string& table() const { return mTable; }

            // Extracts N from a "... # handle N" line of `nft -a` output
            static std::optional<uint64_t> parseHandle(const std::string& line);

        private:
            // Runs `nft <args...>` and converts the outcome
            ProviderResult mRun(const std::vector<std::string>& args, std::string* output = nullptr);

            // Ensures one base chain exists in the table
            ProviderResult mEnsureChain(const char* chain, const char* hook, int priority);

            // Deletes the first rule of a base chain whose listing line contains every needle.
            // A rule that is not there counts as removed.
            ProviderResult mDeleteRuleMatching(const char* chain, const std::vector<std::string>& needles);

            std::shared_ptr<Utils::CommandRunner> mRunner;
            std::string mNftBinary;
            std::string mTable;
    };
}
