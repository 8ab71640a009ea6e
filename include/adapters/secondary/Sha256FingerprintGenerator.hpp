#pragma once

#include "ports/output/IFingerprintGenerator.hpp"
#include <openssl/evp.h>
#include <memory>
#include <string>
#include <stdexcept>

namespace gateway::adapters::secondary {

/**
 * @brief Fingerprint устройства: SHA-256 (OpenSSL EVP), lowercase hex
 *
 * Вход: ip + "|" + user_agent + "|" + accept_language.
 * Результат всегда 64 hex символа.
 */
class Sha256FingerprintGenerator : public ports::output::IFingerprintGenerator {
public:
    std::string fingerprint(const domain::DeviceAttributes& attrs) const override {
        return sha256Hex(attrs.ip + "|" + attrs.userAgent + "|" + attrs.acceptLanguage);
    }

    static std::string sha256Hex(const std::string& data) {
        using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
        EvpMdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;

        if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
            || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
            || EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
            throw std::runtime_error("SHA-256 digest failed");
        }

        static const char* hex = "0123456789abcdef";
        std::string out;
        out.reserve(length * 2);
        for (unsigned int i = 0; i < length; ++i) {
            out.push_back(hex[digest[i] >> 4]);
            out.push_back(hex[digest[i] & 0x0F]);
        }
        return out;
    }
};

} // namespace gateway::adapters::secondary
