#include "meshload/integrity/integrity_verifier.h"
#include "meshload/base/logger.h"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>

namespace meshload {

namespace {

constexpr size_t kReadBufferSize = 1024 * 1024;

bool hex_equals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // anonymous namespace

IntegrityVerifier::IntegrityVerifier(const FileDescriptor& descriptor)
    : descriptor_(descriptor) {
    if (descriptor_.manifest.scheme != IntegrityScheme::MerkleRoot) {
        return;
    }
    root_ = digest_from_hex(descriptor_.manifest.merkle_root);
    leaves_.reserve(descriptor_.manifest.chunk_hashes.size());
    for (const auto& hex : descriptor_.manifest.chunk_hashes) {
        auto leaf = digest_from_hex(hex);
        if (!leaf) {
            Logger::instance().error("Invalid Merkle leaf in manifest of " + descriptor_.file_hash);
            leaves_.clear();
            return;
        }
        leaves_.push_back(*leaf);
    }
    // Leaves are checked against the root once; chunks are then matched against their leaf
    if (!root_ || merkle_root(leaves_) != *root_) {
        Logger::instance().error("Merkle leaves of " + descriptor_.file_hash + " do not match the root");
        leaves_.clear();
    }
}

std::string IntegrityVerifier::hash_chunk(const std::vector<uint8_t>& data) {
    return digest_hex(sha256_digest(data.data(), data.size()));
}

bool IntegrityVerifier::verify_chunk(uint32_t index, const std::vector<uint8_t>& data) const {
    if (index >= descriptor_.total_chunks) {
        return false;
    }
    if (data.size() != descriptor_.chunk_length(index)) {
        Logger::instance().warning("Chunk " + std::to_string(index) + " of " + descriptor_.file_hash +
                                   " has length " + std::to_string(data.size()) + ", expected " +
                                   std::to_string(descriptor_.chunk_length(index)));
        return false;
    }

    if (descriptor_.manifest.scheme == IntegrityScheme::MerkleRoot) {
        if (!root_ || index >= leaves_.size()) {
            return false;
        }
        return sha256_digest(data.data(), data.size()) == leaves_[index];
    }

    if (index >= descriptor_.manifest.chunk_hashes.size()) {
        return false;
    }
    return hex_equals(hash_chunk(data), descriptor_.manifest.chunk_hashes[index]);
}

std::optional<std::string> IntegrityVerifier::hash_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::nullopt;
    }

    std::vector<char> buffer(kReadBufferSize);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            return std::nullopt;
        }
    }
    if (file.bad()) {
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        return std::nullopt;
    }
    return to_hex(digest, length);
}

ErrorCode IntegrityVerifier::verify_file(const std::string& path) const {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        Logger::instance().error("Cannot stat assembled file " + path + ": " + ec.message());
        return ErrorCode::StorageError;
    }
    if (size != descriptor_.size) {
        Logger::instance().error("Assembled file " + path + " has size " + std::to_string(size) +
                                 ", expected " + std::to_string(descriptor_.size));
        return ErrorCode::FileCorruption;
    }

    if (descriptor_.manifest.scheme == IntegrityScheme::ChunkHashes) {
        auto actual = hash_file(path);
        if (!actual) {
            Logger::instance().error("Failed to hash assembled file " + path);
            return ErrorCode::StorageError;
        }
        if (!hex_equals(*actual, descriptor_.file_hash)) {
            Logger::instance().error("File hash mismatch for " + descriptor_.file_hash + ": got " + *actual);
            return ErrorCode::FileCorruption;
        }
        return ErrorCode::Success;
    }

    if (!root_) {
        return ErrorCode::FileCorruption;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return ErrorCode::StorageError;
    }
    std::vector<Digest> leaves;
    leaves.reserve(descriptor_.total_chunks);
    std::vector<uint8_t> buffer;
    for (uint32_t i = 0; i < descriptor_.total_chunks; ++i) {
        buffer.resize(descriptor_.chunk_length(i));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (file.gcount() != static_cast<std::streamsize>(buffer.size())) {
            Logger::instance().error("Short read of chunk " + std::to_string(i) + " from " + path);
            return ErrorCode::StorageError;
        }
        leaves.push_back(sha256_digest(buffer.data(), buffer.size()));
    }

    if (merkle_root(leaves) != *root_) {
        Logger::instance().error("Merkle root mismatch for " + descriptor_.file_hash);
        return ErrorCode::FileCorruption;
    }
    return ErrorCode::Success;
}

} // namespace meshload
