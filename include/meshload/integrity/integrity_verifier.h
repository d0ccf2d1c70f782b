#ifndef MESHLOAD_INTEGRITY_INTEGRITY_VERIFIER_H
#define MESHLOAD_INTEGRITY_INTEGRITY_VERIFIER_H

#include "meshload/base/error_code.h"
#include "meshload/core/types.h"
#include "meshload/integrity/merkle.h"
#include <optional>
#include <string>
#include <vector>

namespace meshload {

// Validates chunks on receipt and the assembled file before promotion
class IntegrityVerifier {
public:
    explicit IntegrityVerifier(const FileDescriptor& descriptor);

    // Length and hash (or Merkle proof) check of one received chunk
    bool verify_chunk(uint32_t index, const std::vector<uint8_t>& data) const;

    // Re-reads the assembly in index order.
    // Returns Success, FileCorruption, or StorageError when the file cannot be read.
    ErrorCode verify_file(const std::string& path) const;

    static std::string hash_chunk(const std::vector<uint8_t>& data);
    static std::optional<std::string> hash_file(const std::string& path);

private:
    FileDescriptor descriptor_;
    std::vector<Digest> leaves_;   // Merkle scheme only
    std::optional<Digest> root_;
};

} // namespace meshload

#endif // MESHLOAD_INTEGRITY_INTEGRITY_VERIFIER_H
