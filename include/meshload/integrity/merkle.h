#ifndef MESHLOAD_INTEGRITY_MERKLE_H
#define MESHLOAD_INTEGRITY_MERKLE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meshload {

using Digest = std::array<uint8_t, 32>;

Digest sha256_digest(const uint8_t* data, size_t size);
std::string digest_hex(const Digest& digest);
std::optional<Digest> digest_from_hex(const std::string& hex);

// Binary SHA-256 tree; an odd node at any level is paired with itself
Digest merkle_root(const std::vector<Digest>& leaves);

} // namespace meshload

#endif // MESHLOAD_INTEGRITY_MERKLE_H
