/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "beanpow/crypto/sha256d.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <string>

namespace beanpow {
namespace crypto {

namespace {

void digest_once(EVP_MD_CTX* ctx, const std::uint8_t* data, std::size_t len, std::uint8_t* out,
                 const char* pass) {
    unsigned int out_len = 0;
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error(std::string("Failed to initialize ") + pass + " SHA256");
    }
    if (EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error(std::string("Failed to update ") + pass + " SHA256");
    }
    if (EVP_DigestFinal_ex(ctx, out, &out_len) != 1 || out_len != kDigestSize) {
        throw std::runtime_error(std::string("Failed to finalize ") + pass + " SHA256");
    }
}

} // namespace

Digest reference_sha256d(const std::uint8_t* data, std::size_t len) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }

    Digest first_hash{};
    Digest second_hash{};
    try {
        digest_once(ctx, data, len, first_hash.data(), "first");
        digest_once(ctx, first_hash.data(), first_hash.size(), second_hash.data(), "second");
    } catch (...) {
        EVP_MD_CTX_free(ctx);
        throw;
    }

    EVP_MD_CTX_free(ctx);
    return second_hash;
}

} // namespace crypto
} // namespace beanpow
