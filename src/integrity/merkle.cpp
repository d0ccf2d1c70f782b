#include "meshload/integrity/merkle.h"
#include "meshload/core/types.h"
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>

namespace meshload {

namespace {

Digest hash_pair(const Digest& left, const Digest& right) {
    std::array<uint8_t, 64> buffer;
    std::copy(left.begin(), left.end(), buffer.begin());
    std::copy(right.begin(), right.end(), buffer.begin() + 32);
    return sha256_digest(buffer.data(), buffer.size());
}

std::vector<Digest> next_level(const std::vector<Digest>& level) {
    std::vector<Digest> parents;
    parents.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
        const Digest& left = level[i];
        const Digest& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
        parents.push_back(hash_pair(left, right));
    }
    return parents;
}

} // anonymous namespace

Digest sha256_digest(const uint8_t* data, size_t size) {
    Digest digest{};
    unsigned int length = 0;
    if (EVP_Digest(data, size, digest.data(), &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return digest;
}

std::string digest_hex(const Digest& digest) {
    return to_hex(digest.data(), digest.size());
}

std::optional<Digest> digest_from_hex(const std::string& hex) {
    auto bytes = from_hex(hex);
    if (!bytes || bytes->size() != 32) {
        return std::nullopt;
    }
    Digest digest;
    std::copy(bytes->begin(), bytes->end(), digest.begin());
    return digest;
}

Digest merkle_root(const std::vector<Digest>& leaves) {
    if (leaves.empty()) {
        static const uint8_t empty = 0;
        return sha256_digest(&empty, 0);
    }
    std::vector<Digest> level = leaves;
    while (level.size() > 1) {
        level = next_level(level);
    }
    return level.front();
}

} // namespace meshload
