// libsodium_wrapper.hpp - Libsodium Wrapper for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <sodium.h>
#include <stdexcept>
#include <string>
#include <cstdint>
#include <yakumo/common/utils.hpp>

namespace Yakumo::Utils {

    class LibSodiumWrapper {
        public:
            // Initializes libsodium once per process; safe to call from every constructor
            static void init();

            // Random RFC 4122 version 4 UUID in canonical text form
            static std::string generateUUID();

            // Uniform random number in [0, upperBound)
            static uint32_t randomBelow(uint32_t upperBound);

            // Constant-time string comparison, for secrets such as bearer tokens
            static bool constantTimeEquals(const std::string& a, const std::string& b);
    };
}
