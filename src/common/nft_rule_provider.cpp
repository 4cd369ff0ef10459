// nft_rule_provider.cpp - nftables backed NAT Rule Provider for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <yakumo/common/net/nft_rule_provider.hpp>
#include <yakumo/common/utils.hpp>

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace Yakumo::Net {
    namespace {
        std::string trim(const std::string& s) {
            const char* ws = " \t\r\n";
            size_t begin = s.find_first_not_of(ws);
            if (begin == std::string::npos)
                return "";
            size_t end = s.find_last_not_of(ws);
            return s.substr(begin, end - begin + 1);
        }

        bool isIPv6(const std::string& ip) {
            return ip.find(':') != std::string::npos;
        }

        std::string quoted(const std::string& s) {
            return "\"" + s + "\"";
        }
    }

    NftRuleProvider::NftRuleProvider(std::shared_ptr<Utils::CommandRunner> runner, std::string nftBinary, std::string table)
        : mRunner(std::move(runner)), mNftBinary(std::move(nftBinary)), mTable(std::move(table))
    {
        if (!mRunner) {
            throw std::invalid_argument("NftRuleProvider needs a command runner");
        }
    }

    ProviderResult NftRuleProvider::mRun(const std::vector<std::string>& args, std::string* output) {
        std::vector<std::string> argv;
        argv.reserve(args.size() + 1);
        argv.push_back(mNftBinary);
        argv.insert(argv.end(), args.begin(), args.end());

        const std::string command = Utils::joinCommand(argv);
        Utils::debug("nft: " + command);

        Utils::CommandResult res = mRunner->run(argv);
        if (output)
            *output = res.out;

        if (!res.started)
            return ProviderResult::failure("could not start: " + trim(res.err), -1, command);
        if (res.timedOut)
            return ProviderResult::failure("timed out", -1, command);
        if (res.exitStatus != 0)
            return ProviderResult::failure(trim(res.err), res.exitStatus, command);

        return ProviderResult::success(command);
    }

    std::optional<uint64_t> NftRuleProvider::parseHandle(const std::string& line) {
        static const std::string marker = "# handle ";
        size_t pos = line.rfind(marker);
        if (pos == std::string::npos)
            return std::nullopt;

        std::string digits;
        for (size_t i = pos + marker.size(); i < line.size() && std::isdigit(static_cast<unsigned char>(line[i])); ++i) {
            digits.push_back(line[i]);
        }
        if (digits.empty())
            return std::nullopt;

        try {
            return std::stoull(digits);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    ProviderResult NftRuleProvider::listTables() {
        return mRun({"list", "tables"});
    }

    ProviderResult NftRuleProvider::mEnsureChain(const char* chain, const char* hook, int priority) {
        ProviderResult probe = mRun({"list", "chain", FAMILY, mTable, chain});
        if (probe.ok) {
            Utils::debug("nft: base chain " + std::string(chain) + " already present");
            return probe;
        }

        const std::string definition = "{ type nat hook " + std::string(hook) + " priority " + std::to_string(priority) + "; policy accept; }";
        return mRun({"add", "chain", FAMILY, mTable, chain, definition});
    }

    ProviderResult NftRuleProvider::ensureBaseHooks() {
        std::string tables;
        ProviderResult list = mRun({"list", "tables"}, &tables);
        if (!list.ok)
            return list;

        const std::string wanted = "table " + std::string(FAMILY) + " " + mTable;
        bool present = false;
        std::istringstream lines(tables);
        std::string line;
        while (std::getline(lines, line)) {
            if (trim(line) == wanted) {
                present = true;
                break;
            }
        }

        if (!present) {
            ProviderResult created = mRun({"add", "table", FAMILY, mTable});
            if (!created.ok)
                return created;
            Utils::log("nft: created table " + wanted);
        }

        ProviderResult pre = mEnsureChain(PREROUTING_CHAIN, "prerouting", -100);
        if (!pre.ok)
            return pre;

        return mEnsureChain(POSTROUTING_CHAIN, "postrouting", 100);
    }

    ProviderResult NftRuleProvider::createGroup(const std::string& group) {
        return mRun({"add", "chain", FAMILY, mTable, group});
    }

    ProviderResult NftRuleProvider::flushGroup(const std::string& group) {
        return mRun({"flush", "chain", FAMILY, mTable, group});
    }

    ProviderResult NftRuleProvider::deleteGroup(const std::string& group) {
        return mRun({"delete", "chain", FAMILY, mTable, group});
    }

    ProviderResult NftRuleProvider::addRedirectRule(const std::string& group, Protocol proto, uint16_t ingressPort,
                                                    const std::string& targetIP, uint16_t targetPort) {
        const bool v6 = isIPv6(targetIP);
        const std::string destination = v6
            ? "[" + targetIP + "]:" + std::to_string(targetPort)
            : targetIP + ":" + std::to_string(targetPort);

        return mRun({"add", "rule", FAMILY, mTable, group,
                     "meta", "nfproto", v6 ? "ipv6" : "ipv4",
                     protocolName(proto), "dport", std::to_string(ingressPort),
                     "dnat", v6 ? "ip6" : "ip", "to", destination});
    }

    ProviderResult NftRuleProvider::addDispatchRule(uint16_t ingressPort, const std::string& group) {
        return mRun({"add", "rule", FAMILY, mTable, PREROUTING_CHAIN,
                     "meta", "l4proto", "{ tcp, udp }", "th", "dport", std::to_string(ingressPort),
                     "jump", group, "comment", quoted(group)});
    }

    ProviderResult NftRuleProvider::removeDispatchRule(uint16_t ingressPort, const std::string& group) {
        return mDeleteRuleMatching(PREROUTING_CHAIN, {"dport " + std::to_string(ingressPort) + " ", "jump " + group + " "});
    }

    ProviderResult NftRuleProvider::addReturnMasqueradeRule(const std::string& group, Protocol proto,
                                                            const std::string& targetIP, uint16_t targetPort) {
        return mRun({"add", "rule", FAMILY, mTable, POSTROUTING_CHAIN,
                     isIPv6(targetIP) ? "ip6" : "ip", "daddr", targetIP,
                     protocolName(proto), "dport", std::to_string(targetPort),
                     "masquerade", "comment", quoted(group)});
    }

    ProviderResult NftRuleProvider::removeReturnMasqueradeRule(const std::string& group, Protocol proto,
                                                               const std::string& targetIP, uint16_t targetPort) {
        (void)targetIP; // nft may print the address in a different form, the comment pins the owner
        return mDeleteRuleMatching(POSTROUTING_CHAIN, {std::string(protocolName(proto)) + " dport " + std::to_string(targetPort) + " ",
                                                       "masquerade", "comment " + quoted(group)});
    }

    ProviderResult NftRuleProvider::mDeleteRuleMatching(const char* chain, const std::vector<std::string>& needles) {
        std::string listing;
        ProviderResult list = mRun({"-a", "list", "chain", FAMILY, mTable, chain}, &listing);
        if (!list.ok)
            return list;

        std::istringstream lines(listing);
        std::string line;
        while (std::getline(lines, line)) {
            bool matches = true;
            for (const auto& needle : needles) {
                if (line.find(needle) == std::string::npos) {
                    matches = false;
                    break;
                }
            }
            if (!matches)
                continue;

            std::optional<uint64_t> handle = parseHandle(line);
            if (!handle) {
                return ProviderResult::failure("rule without handle in listing: " + trim(line), -1, list.command);
            }
            return mRun({"delete", "rule", FAMILY, mTable, chain, "handle", std::to_string(*handle)});
        }

        Utils::debug("nft: no rule in " + std::string(chain) + " matched, nothing to delete");
        return ProviderResult::success(list.command);
    }
}
