#include "meshload/integrity/decryptor.h"
#include "meshload/base/logger.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <fstream>
#include <iterator>
#include <memory>

namespace meshload {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

} // anonymous namespace

std::optional<std::vector<uint8_t>> aes_gcm_encrypt(const std::vector<uint8_t>& key,
                                                    const std::vector<uint8_t>& plaintext) {
    if (key.size() != kAesKeySize) {
        return std::nullopt;
    }

    std::vector<uint8_t> out(kGcmIvSize + plaintext.size() + kGcmTagSize);
    if (RAND_bytes(out.data(), static_cast<int>(kGcmIvSize)) != 1) {
        return std::nullopt;
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kGcmIvSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), out.data()) != 1) {
        return std::nullopt;
    }

    int len = 0;
    uint8_t* cipher = out.data() + kGcmIvSize;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), cipher, &len, plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        return std::nullopt;
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), cipher + len, &final_len) != 1) {
        return std::nullopt;
    }
    uint8_t* tag = cipher + plaintext.size();
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagSize), tag) != 1) {
        return std::nullopt;
    }
    return out;
}

std::optional<std::vector<uint8_t>> aes_gcm_decrypt(const std::vector<uint8_t>& key,
                                                    const std::vector<uint8_t>& blob) {
    if (key.size() != kAesKeySize || blob.size() < kGcmIvSize + kGcmTagSize) {
        return std::nullopt;
    }

    const uint8_t* iv = blob.data();
    const uint8_t* cipher = blob.data() + kGcmIvSize;
    size_t cipher_len = blob.size() - kGcmIvSize - kGcmTagSize;
    std::vector<uint8_t> tag(blob.end() - kGcmTagSize, blob.end());

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kGcmIvSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1) {
        return std::nullopt;
    }

    std::vector<uint8_t> plain(cipher_len);
    int len = 0;
    if (cipher_len > 0 &&
        EVP_DecryptUpdate(ctx.get(), plain.data(), &len, cipher, static_cast<int>(cipher_len)) != 1) {
        return std::nullopt;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kGcmTagSize), tag.data()) != 1) {
        return std::nullopt;
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + len, &final_len) != 1) {
        return std::nullopt;
    }
    return plain;
}

ErrorCode decrypt_file(const std::string& source, const std::string& destination,
                       const std::vector<uint8_t>& key) {
    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        Logger::instance().error("Cannot open encrypted file " + source);
        return ErrorCode::StorageError;
    }
    std::vector<uint8_t> blob((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    auto plain = aes_gcm_decrypt(key, blob);
    if (!plain) {
        Logger::instance().error("Decryption failed for " + source);
        return ErrorCode::DecryptionFailed;
    }

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        Logger::instance().error("Cannot open decryption output " + destination);
        return ErrorCode::StorageError;
    }
    out.write(reinterpret_cast<const char*>(plain->data()), static_cast<std::streamsize>(plain->size()));
    if (!out) {
        Logger::instance().error("Failed to write decrypted file " + destination);
        return ErrorCode::StorageError;
    }
    return ErrorCode::Success;
}

} // namespace meshload
