#ifndef MESHLOAD_INTEGRITY_DECRYPTOR_H
#define MESHLOAD_INTEGRITY_DECRYPTOR_H

#include "meshload/base/error_code.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meshload {

// AES-256-GCM payload layout: iv(12) | ciphertext | tag(16)
constexpr size_t kAesKeySize = 32;
constexpr size_t kGcmIvSize = 12;
constexpr size_t kGcmTagSize = 16;

std::optional<std::vector<uint8_t>> aes_gcm_encrypt(const std::vector<uint8_t>& key,
                                                    const std::vector<uint8_t>& plaintext);

// nullopt on a wrong key, a short blob, or a failed tag check
std::optional<std::vector<uint8_t>> aes_gcm_decrypt(const std::vector<uint8_t>& key,
                                                    const std::vector<uint8_t>& blob);

// Decrypts source into destination; returns DecryptionFailed or StorageError on failure
ErrorCode decrypt_file(const std::string& source, const std::string& destination,
                       const std::vector<uint8_t>& key);

} // namespace meshload

#endif // MESHLOAD_INTEGRITY_DECRYPTOR_H
