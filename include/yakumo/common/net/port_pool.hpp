// port_pool.hpp - Ingress Port Pool for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>
#include <shared_mutex>
#include <yakumo/common/errors.hpp>

namespace Yakumo::Net {
    // Owns the ephemeral ingress ports [first, last]. Every port in the range is at all times
    // either in the free list or marked allocated, never both.
    class PortPool {
        public:
            static constexpr uint16_t DEFAULT_FIRST_PORT = 10000;
            static constexpr uint16_t DEFAULT_LAST_PORT = 20000;
            static constexpr uint16_t MIN_EPHEMERAL_PORT = 1024;

            // Throws std::invalid_argument if the range is empty or overlaps the well-known ports
            PortPool(uint16_t first = DEFAULT_FIRST_PORT, uint16_t last = DEFAULT_LAST_PORT);

            PortPool(const PortPool&) = delete;
            PortPool& operator=(const PortPool&) = delete;

            // Take a random free port; throws ResourceExhausted when none is left
            uint16_t allocate();

            // Return a port to the free list. Double release and foreign ports are logged and ignored.
            void release(uint16_t port);

            bool isAllocated(uint16_t port) const;
            bool contains(uint16_t port) const { return port >= mFirst && port <= mLast; }

            size_t freeCount() const;
            size_t allocatedCount() const;
            size_t capacity() const { return mCapacity; }

            uint16_t first() const { return mFirst; }
            uint16_t last() const { return mLast; }

        private:
            mutable std::shared_mutex mMutex;
            uint16_t mFirst;
            uint16_t mLast;
            size_t mCapacity;
            size_t mFreeCount;
            std::vector<uint16_t> mFreePorts; // [0, mFreeCount) are free
            std::vector<bool> mAllocated;     // Indexed by port - mFirst
    };
}
