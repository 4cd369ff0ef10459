// fake_rule_provider.hpp - In-memory NAT Rule Provider for the Yakumo tests
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <thread>
#include <tuple>
#include <unordered_set>
#include <vector>
#include <yakumo/common/net/nat_rule_provider.hpp>

namespace Yakumo::Testing {
    // Keeps a model of what nftables would hold and behaves like it where it matters:
    // a group that is still a jump target cannot be deleted.
    class FakeRuleProvider : public Net::NatRuleProvider {
        public:
            using MasqKey = std::tuple<std::string, Net::Protocol, std::string, uint16_t>;

            // Every call of this operation fails
            void failOperation(const std::string& op) {
                std::lock_guard lock(mMutex);
                mFailingOps.insert(op);
            }

            // Every call of this operation throws instead of returning a failure
            void throwOnOperation(const std::string& op) {
                std::lock_guard lock(mMutex);
                mThrowingOps.insert(op);
            }

            // The nth primitive call from now on fails (1-based)
            void failNthCall(size_t n) {
                std::lock_guard lock(mMutex);
                mCallsSinceArm = 0;
                mFailAt = n;
            }

            void failEverything(bool fail) {
                std::lock_guard lock(mMutex);
                mFailEverything = fail;
            }

            void clearFailures() {
                std::lock_guard lock(mMutex);
                mFailingOps.clear();
                mThrowingOps.clear();
                mFailAt = 0;
                mFailEverything = false;
            }

            void setDelay(std::chrono::milliseconds delay) {
                std::lock_guard lock(mMutex);
                mDelay = delay;
            }

            std::vector<std::string> calls() const {
                std::lock_guard lock(mMutex);
                return mCalls;
            }

            void clearCalls() {
                std::lock_guard lock(mMutex);
                mCalls.clear();
            }

            bool hasBaseHooks() const {
                std::lock_guard lock(mMutex);
                return mHooks;
            }

            size_t hookCreations() const {
                std::lock_guard lock(mMutex);
                return mHookCreations;
            }

            bool hasGroup(const std::string& group) const {
                std::lock_guard lock(mMutex);
                return mGroups.count(group) > 0;
            }

            size_t rulesIn(const std::string& group) const {
                std::lock_guard lock(mMutex);
                auto it = mGroups.find(group);
                return it == mGroups.end() ? 0 : it->second;
            }

            size_t dispatchCount() const {
                std::lock_guard lock(mMutex);
                return mDispatch.size();
            }

            size_t masqueradeCount() const {
                std::lock_guard lock(mMutex);
                return mMasquerade.size();
            }

            // Most recently created group, including ones still being installed
            std::string lastCreatedGroup() const {
                std::lock_guard lock(mMutex);
                return mLastCreated;
            }

            size_t groupCount() const {
                std::lock_guard lock(mMutex);
                return mGroups.size();
            }

            // Nothing per-session is left behind
            bool isClean() const {
                std::lock_guard lock(mMutex);
                return mGroups.empty() && mDispatch.empty() && mMasquerade.empty();
            }

            Net::ProviderResult ensureBaseHooks() override {
                std::lock_guard lock(mMutex);
                if (mShouldFail("ensureBaseHooks"))
                    return mFailure("ensureBaseHooks");
                if (!mHooks) {
                    mHooks = true;
                    mHookCreations++;
                }
                return Net::ProviderResult::success("ensureBaseHooks");
            }

            Net::ProviderResult createGroup(const std::string& group) override {
                std::lock_guard lock(mMutex);
                if (mShouldFail("createGroup"))
                    return mFailure("createGroup");
                if (mGroups.count(group))
                    return Net::ProviderResult::failure("File exists", 1, "createGroup");
                mGroups[group] = 0;
                mLastCreated = group;
                return Net::ProviderResult::success("createGroup");
            }

            Net::ProviderResult flushGroup(const std::string& group) override {
                std::lock_guard lock(mMutex);
                if (mShouldFail("flushGroup"))
                    return mFailure("flushGroup");
                auto it = mGroups.find(group);
                if (it == mGroups.end())
                    return Net::ProviderResult::failure("No such file or directory", 1, "flushGroup");
                it->second = 0;
                return Net::ProviderResult::success("flushGroup");
            }

            Net::ProviderResult deleteGroup(const std::string& group) override {
                std::lock_guard lock(mMutex);
                if (mShouldFail("deleteGroup"))
                    return mFailure("deleteGroup");
                auto it = mGroups.find(group);
                if (it == mGroups.end())
                    return Net::ProviderResult::failure("No such file or directory", 1, "deleteGroup");
                for (const auto& d : mDispatch) {
                    if (d.second == group)
                        return Net::ProviderResult::failure("Device or resource busy", 1, "deleteGroup");
                }
                mGroups.erase(it);
                return Net::ProviderResult::success("deleteGroup");
            }

            Net::ProviderResult addRedirectRule(const std::string& group, Net::Protocol proto, uint16_t,
                                                const std::string&, uint16_t) override {
                std::lock_guard lock(mMutex);
                const std::string op = std::string("addRedirectRule:") + Net::protocolName(proto);
                if (mShouldFail(op))
                    return mFailure(op);
                auto it = mGroups.find(group);
                if (it == mGroups.end())
                    return Net::ProviderResult::failure("No such file or directory", 1, op);
                it->second++;
                return Net::ProviderResult::success(op);
            }

            Net::ProviderResult addDispatchRule(uint16_t ingressPort, const std::string& group) override {
                std::lock_guard lock(mMutex);
                if (mShouldFail("addDispatchRule"))
                    return mFailure("addDispatchRule");
                if (!mGroups.count(group))
                    return Net::ProviderResult::failure("No such file or directory", 1, "addDispatchRule");
                mDispatch.insert({ingressPort, group});
                return Net::ProviderResult::success("addDispatchRule");
            }

            Net::ProviderResult removeDispatchRule(uint16_t ingressPort, const std::string& group) override {
                std::lock_guard lock(mMutex);
                if (mShouldFail("removeDispatchRule"))
                    return mFailure("removeDispatchRule");
                mDispatch.erase({ingressPort, group});
                return Net::ProviderResult::success("removeDispatchRule");
            }

            Net::ProviderResult addReturnMasqueradeRule(const std::string& group, Net::Protocol proto,
                                                        const std::string& targetIP, uint16_t targetPort) override {
                std::lock_guard lock(mMutex);
                const std::string op = std::string("addReturnMasqueradeRule:") + Net::protocolName(proto);
                if (mShouldFail(op))
                    return mFailure(op);
                mMasquerade.insert({group, proto, targetIP, targetPort});
                return Net::ProviderResult::success(op);
            }

            Net::ProviderResult removeReturnMasqueradeRule(const std::string& group, Net::Protocol proto,
                                                           const std::string& targetIP, uint16_t targetPort) override {
                std::lock_guard lock(mMutex);
                const std::string op = std::string("removeReturnMasqueradeRule:") + Net::protocolName(proto);
                if (mShouldFail(op))
                    return mFailure(op);
                mMasquerade.erase({group, proto, targetIP, targetPort});
                return Net::ProviderResult::success(op);
            }

            Net::ProviderResult listTables() override {
                std::lock_guard lock(mMutex);
                if (mShouldFail("listTables"))
                    return mFailure("listTables");
                return Net::ProviderResult::success("listTables");
            }

        private:
            // Caller holds mMutex
            bool mShouldFail(const std::string& op) {
                mCalls.push_back(op);
                if (mDelay.count() > 0) {
                    std::this_thread::sleep_for(mDelay);
                }

                mCallsSinceArm++;
                if (mFailAt != 0 && mCallsSinceArm == mFailAt) {
                    mFailAt = 0;
                    return true;
                }

                if (mFailEverything)
                    return true;

                // "addRedirectRule" matches both protocol variants
                const std::string base = op.substr(0, op.find(':'));
                if (mThrowingOps.count(op) > 0 || mThrowingOps.count(base) > 0)
                    throw std::system_error(std::make_error_code(std::errc::io_error), op);
                return mFailingOps.count(op) > 0 || mFailingOps.count(base) > 0;
            }

            static Net::ProviderResult mFailure(const std::string& op) {
                return Net::ProviderResult::failure("injected failure", 1, op);
            }

            mutable std::mutex mMutex;
            std::vector<std::string> mCalls;
            std::unordered_set<std::string> mFailingOps;
            std::unordered_set<std::string> mThrowingOps;
            size_t mFailAt = 0;
            size_t mCallsSinceArm = 0;
            bool mFailEverything = false;
            std::chrono::milliseconds mDelay{0};

            bool mHooks = false;
            size_t mHookCreations = 0;
            std::string mLastCreated;
            std::map<std::string, size_t> mGroups; // group -> rule count
            std::set<std::pair<uint16_t, std::string>> mDispatch;
            std::set<MasqKey> mMasquerade;
    };
}
