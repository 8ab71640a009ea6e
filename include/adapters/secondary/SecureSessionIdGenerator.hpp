#pragma once

#include "ports/output/ISessionIdGenerator.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <array>
#include <string>
#include <stdexcept>

namespace gateway::adapters::secondary {

/**
 * @brief session_id из CSPRNG OpenSSL: 32 байта (256 бит), lowercase hex
 */
class SecureSessionIdGenerator : public ports::output::ISessionIdGenerator {
public:
    static constexpr size_t kRandomBytes = 32;

    std::string generate() override {
        std::array<unsigned char, kRandomBytes> buffer{};
        if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed, error " + std::to_string(ERR_get_error()));
        }

        static const char* hex = "0123456789abcdef";
        std::string id;
        id.reserve(kRandomBytes * 2);
        for (unsigned char byte : buffer) {
            id.push_back(hex[byte >> 4]);
            id.push_back(hex[byte & 0x0F]);
        }
        return id;
    }
};

} // namespace gateway::adapters::secondary
