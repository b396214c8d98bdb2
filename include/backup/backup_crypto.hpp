// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "core/status.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tyr {
namespace backup {

/*
 Backup container

   salt (32) | nonce (12) | ciphertext | tag (16)

 key = PBKDF2-HMAC-SHA256(password, salt, iterations, 32 bytes)
 cipher = AES-256-GCM, no associated data
*/

constexpr size_t SALT_SIZE = 32;
constexpr size_t NONCE_SIZE = 12;
constexpr size_t TAG_SIZE = 16;
constexpr size_t KEY_SIZE = 32;
constexpr int DEFAULT_KDF_ITERATIONS = 100000;
// OpenSSL takes int lengths; larger buffers are fed in pieces of this size
constexpr size_t CRYPTO_CHUNK_SIZE = 64 * 1024;

core::Result<std::vector<uint8_t>> EncryptBackup(const std::vector<uint8_t> &plaintext,
                                                 const std::string &password,
                                                 int iterations = DEFAULT_KDF_ITERATIONS);

/**
 * Decrypt a backup container
 * @return AuthenticationFailed on a tag mismatch (wrong password or tampered
 *         data), CorruptBackup when the buffer is too short to be a backup
 */
core::Result<std::vector<uint8_t>> DecryptBackup(const std::vector<uint8_t> &container,
                                                 const std::string &password,
                                                 int iterations = DEFAULT_KDF_ITERATIONS);

std::string Base64Encode(const std::vector<uint8_t> &data);
// CorruptBackup on malformed input
core::Result<std::vector<uint8_t>> Base64Decode(const std::string &text);

} // namespace backup
} // namespace tyr
