/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "beanpow/crypto/sha256_engine.hpp"

namespace beanpow {
namespace crypto {

/**
 * Compute double SHA256 through OpenSSL (Bitcoin standard)
 *
 * Independent of the round engine; used to cross-check a found nonce.
 * @param data Input bytes
 * @param len Input length
 * @return 32-byte hash output in natural order
 */
Digest reference_sha256d(const std::uint8_t* data, std::size_t len);

} // namespace crypto
} // namespace beanpow
