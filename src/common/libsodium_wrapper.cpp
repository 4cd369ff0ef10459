// libsodium_wrapper.cpp - Libsodium Wrapper for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <yakumo/common/libsodium_wrapper.hpp>
#include <array>

namespace Yakumo::Utils {

    void LibSodiumWrapper::init() {
        // sodium_init() returns 1 when already initialized
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium");
        }
    }

    std::string LibSodiumWrapper::generateUUID() {
        init();

        std::array<uint8_t, 16> raw;
        randombytes_buf(raw.data(), raw.size());

        raw[6] = static_cast<uint8_t>((raw[6] & 0x0F) | 0x40); // Version 4
        raw[8] = static_cast<uint8_t>((raw[8] & 0x3F) | 0x80); // Variant 10xx

        std::string hex = bytesToHexString(raw.data(), raw.size());
        return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
               hex.substr(16, 4) + "-" + hex.substr(20, 12);
    }

    uint32_t LibSodiumWrapper::randomBelow(uint32_t upperBound) {
        init();
        return randombytes_uniform(upperBound);
    }

    bool LibSodiumWrapper::constantTimeEquals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        if (a.empty()) {
            return true;
        }
        return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    }
}
