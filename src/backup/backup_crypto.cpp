// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "backup/backup_crypto.hpp"
#include <algorithm>
#include <memory>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace tyr {
namespace backup {

using core::ErrorCode;
using core::Status;

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

// EVP_EncodeBlock / EVP_DecodeBlock work on whole groups: 3 bytes <-> 4 chars
constexpr size_t BASE64_ENCODE_CHUNK = CRYPTO_CHUNK_SIZE / 4 * 3;
constexpr size_t BASE64_DECODE_CHUNK = CRYPTO_CHUNK_SIZE;

bool DeriveKey(const std::string &password, const uint8_t *salt, int iterations,
               std::vector<uint8_t> &key) {
  key.assign(KEY_SIZE, 0);
  return PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), salt,
                           static_cast<int>(SALT_SIZE), iterations, EVP_sha256(),
                           static_cast<int>(KEY_SIZE), key.data()) == 1;
}

} // namespace

core::Result<std::vector<uint8_t>> EncryptBackup(const std::vector<uint8_t> &plaintext,
                                                 const std::string &password, int iterations) {
  std::vector<uint8_t> out(SALT_SIZE + NONCE_SIZE + plaintext.size() + TAG_SIZE);
  uint8_t *salt = out.data();
  uint8_t *nonce = salt + SALT_SIZE;
  uint8_t *ct = nonce + NONCE_SIZE;

  if (RAND_bytes(salt, static_cast<int>(SALT_SIZE)) != 1 ||
      RAND_bytes(nonce, static_cast<int>(NONCE_SIZE)) != 1) {
    return Status::Error(ErrorCode::IoError, "random generator failure");
  }

  std::vector<uint8_t> key;
  if (!DeriveKey(password, salt, iterations, key)) {
    return Status::Error(ErrorCode::IoError, "key derivation failed");
  }

  CipherCtx ctx(EVP_CIPHER_CTX_new());
  int len = 0;
  size_t total = 0;
  if (!ctx ||
      EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE),
                          nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
    return Status::Error(ErrorCode::IoError, "cipher initialization failed");
  }
  for (size_t offset = 0; offset < plaintext.size(); offset += CRYPTO_CHUNK_SIZE) {
    const size_t n = std::min(CRYPTO_CHUNK_SIZE, plaintext.size() - offset);
    if (EVP_EncryptUpdate(ctx.get(), ct + total, &len, plaintext.data() + offset,
                          static_cast<int>(n)) != 1) {
      return Status::Error(ErrorCode::IoError, "encryption failed");
    }
    total += static_cast<size_t>(len);
  }
  if (EVP_EncryptFinal_ex(ctx.get(), ct + total, &len) != 1) {
    return Status::Error(ErrorCode::IoError, "encryption failed");
  }
  total += static_cast<size_t>(len);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                          ct + total) != 1) {
    return Status::Error(ErrorCode::IoError, "tag generation failed");
  }
  return out;
}

core::Result<std::vector<uint8_t>> DecryptBackup(const std::vector<uint8_t> &container,
                                                 const std::string &password, int iterations) {
  if (container.size() < SALT_SIZE + NONCE_SIZE + TAG_SIZE) {
    return Status::Error(ErrorCode::CorruptBackup, "backup file is too short");
  }
  const uint8_t *salt = container.data();
  const uint8_t *nonce = salt + SALT_SIZE;
  const uint8_t *ct = nonce + NONCE_SIZE;
  const size_t ct_size = container.size() - SALT_SIZE - NONCE_SIZE - TAG_SIZE;
  // EVP_CTRL_GCM_SET_TAG takes a non-const pointer
  std::vector<uint8_t> tag(ct + ct_size, ct + ct_size + TAG_SIZE);

  std::vector<uint8_t> key;
  if (!DeriveKey(password, salt, iterations, key)) {
    return Status::Error(ErrorCode::IoError, "key derivation failed");
  }

  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx ||
      EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE),
                          nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
    return Status::Error(ErrorCode::IoError, "cipher initialization failed");
  }

  std::vector<uint8_t> plain(ct_size);
  int len = 0;
  size_t total = 0;
  for (size_t offset = 0; offset < ct_size; offset += CRYPTO_CHUNK_SIZE) {
    const size_t n = std::min(CRYPTO_CHUNK_SIZE, ct_size - offset);
    if (EVP_DecryptUpdate(ctx.get(), plain.data() + total, &len, ct + offset,
                          static_cast<int>(n)) != 1) {
      return Status::Error(ErrorCode::CorruptBackup, "decryption failed");
    }
    total += static_cast<size_t>(len);
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE),
                          tag.data()) != 1) {
    return Status::Error(ErrorCode::IoError, "cannot set authentication tag");
  }
  if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + total, &len) != 1) {
    return Status::Error(ErrorCode::AuthenticationFailed,
                         "wrong password or corrupted backup file");
  }
  total += static_cast<size_t>(len);
  plain.resize(total);
  return plain;
}

std::string Base64Encode(const std::vector<uint8_t> &data) {
  std::string out;
  out.reserve(4 * ((data.size() + 2) / 3));
  std::string block(CRYPTO_CHUNK_SIZE + 1, '\0');
  for (size_t offset = 0; offset < data.size(); offset += BASE64_ENCODE_CHUNK) {
    const size_t n = std::min(BASE64_ENCODE_CHUNK, data.size() - offset);
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(block.data()),
                                  data.data() + offset, static_cast<int>(n));
    out.append(block.data(), static_cast<size_t>(written));
  }
  return out;
}

core::Result<std::vector<uint8_t>> Base64Decode(const std::string &text) {
  if (text.empty()) return std::vector<uint8_t>{};
  if (text.size() % 4 != 0) {
    return Status::Error(ErrorCode::CorruptBackup, "malformed base64 payload");
  }
  std::vector<uint8_t> out;
  out.reserve(3 * (text.size() / 4));
  std::vector<uint8_t> block(BASE64_DECODE_CHUNK / 4 * 3);
  for (size_t offset = 0; offset < text.size(); offset += BASE64_DECODE_CHUNK) {
    const size_t n = std::min(BASE64_DECODE_CHUNK, text.size() - offset);
    const bool last = offset + n == text.size();
    const char *chunk = text.data() + offset;
    // Padding may only close the final group
    if (!last && chunk[n - 1] == '=') {
      return Status::Error(ErrorCode::CorruptBackup, "malformed base64 payload");
    }
    int decoded = EVP_DecodeBlock(block.data(), reinterpret_cast<const unsigned char *>(chunk),
                                  static_cast<int>(n));
    if (decoded < 0) {
      return Status::Error(ErrorCode::CorruptBackup, "malformed base64 payload");
    }
    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (last) {
      if (chunk[n - 1] == '=') ++padding;
      if (n > 1 && chunk[n - 2] == '=') ++padding;
    }
    out.insert(out.end(), block.begin(), block.begin() + (static_cast<size_t>(decoded) - padding));
  }
  return out;
}

} // namespace backup
} // namespace tyr
