// port_pool.cpp - Ingress Port Pool for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <yakumo/common/net/port_pool.hpp>
#include <yakumo/common/libsodium_wrapper.hpp>
#include <yakumo/common/utils.hpp>
#include <mutex>
#include <stdexcept>

namespace Yakumo::Net {
    PortPool::PortPool(uint16_t first, uint16_t last)
        : mFirst(first), mLast(last), mCapacity(0), mFreeCount(0)
    {
        if (first < MIN_EPHEMERAL_PORT) {
            throw std::invalid_argument("Port range must start at or above " + std::to_string(MIN_EPHEMERAL_PORT) + ", got " + std::to_string(first));
        }
        if (first > last) {
            throw std::invalid_argument("Port range " + std::to_string(first) + "-" + std::to_string(last) + " is empty");
        }

        mCapacity = static_cast<size_t>(last) - first + 1;
        mFreeCount = mCapacity;
        mFreePorts.resize(mCapacity);
        mAllocated.assign(mCapacity, false);

        for (size_t i = 0; i < mCapacity; ++i) {
            mFreePorts[i] = static_cast<uint16_t>(first + i);
        }
    }

    uint16_t PortPool::allocate() {
        std::unique_lock lock(mMutex);
        if (mFreeCount == 0) {
            throw ResourceExhausted("No free ingress ports in range " + std::to_string(mFirst) + "-" + std::to_string(mLast));
        }

        // Pick a random slot and fill the hole with the last free entry
        const size_t index = Utils::LibSodiumWrapper::randomBelow(static_cast<uint32_t>(mFreeCount));
        const uint16_t port = mFreePorts[index];
        mFreePorts[index] = mFreePorts[mFreeCount - 1];
        mFreeCount--;

        mAllocated[port - mFirst] = true;
        return port;
    }

    void PortPool::release(uint16_t port) {
        std::unique_lock lock(mMutex);
        if (!contains(port)) {
            Utils::warn("PortPool: release of port " + std::to_string(port) + " outside of range " + std::to_string(mFirst) + "-" + std::to_string(mLast) + " ignored");
            return;
        }
        if (!mAllocated[port - mFirst]) {
            Utils::warn("PortPool: port " + std::to_string(port) + " released twice, ignoring");
            return;
        }

        mAllocated[port - mFirst] = false;
        mFreePorts[mFreeCount++] = port;
    }

    bool PortPool::isAllocated(uint16_t port) const {
        std::shared_lock lock(mMutex);
        return contains(port) && mAllocated[port - mFirst];
    }

    size_t PortPool::freeCount() const {
        std::shared_lock lock(mMutex);
        return mFreeCount;
    }

    size_t PortPool::allocatedCount() const {
        std::shared_lock lock(mMutex);
        return mCapacity - mFreeCount;
    }
}
