#include "meshload/discovery/descriptor_resolver.h"
#include "meshload/base/logger.h"
#include "meshload/core/serialization.h"
#include "meshload/integrity/integrity_verifier.h"
#include "meshload/integrity/merkle.h"
#include <elio/time/timer.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace meshload {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool fail(std::string* reason, const std::string& why) {
    if (reason) *reason = why;
    return false;
}

} // anonymous namespace

ErrorCode validate_descriptor(const FileDescriptor& descriptor, std::string* reason) {
    auto check = [&]() -> bool {
        if (descriptor.file_hash.empty()) {
            return fail(reason, "missing file hash");
        }
        if (descriptor.size == 0) {
            return fail(reason, "empty file");
        }
        if (descriptor.chunk_size == 0) {
            return fail(reason, "zero chunk size");
        }
        uint64_t expected_chunks = (descriptor.size + descriptor.chunk_size - 1) / descriptor.chunk_size;
        if (descriptor.total_chunks != expected_chunks) {
            return fail(reason, "total_chunks " + std::to_string(descriptor.total_chunks) +
                                " does not match size (expected " + std::to_string(expected_chunks) + ")");
        }

        const auto& manifest = descriptor.manifest;
        if (manifest.chunk_hashes.size() != descriptor.total_chunks) {
            return fail(reason, "manifest has " + std::to_string(manifest.chunk_hashes.size()) +
                                " chunk hashes for " + std::to_string(descriptor.total_chunks) + " chunks");
        }
        for (size_t i = 0; i < manifest.chunk_hashes.size(); ++i) {
            if (!is_sha256_hex(manifest.chunk_hashes[i])) {
                return fail(reason, "chunk hash " + std::to_string(i) + " is not SHA-256 hex");
            }
        }

        if (manifest.scheme == IntegrityScheme::MerkleRoot) {
            auto root = digest_from_hex(manifest.merkle_root);
            if (!root) {
                return fail(reason, "merkle root is not SHA-256 hex");
            }
            std::vector<Digest> leaves;
            leaves.reserve(manifest.chunk_hashes.size());
            for (const auto& hex : manifest.chunk_hashes) {
                leaves.push_back(*digest_from_hex(hex));
            }
            if (merkle_root(leaves) != *root) {
                return fail(reason, "merkle leaves do not produce the root");
            }
        } else if (!is_sha256_hex(descriptor.file_hash)) {
            return fail(reason, "file hash is not SHA-256 hex");
        }
        return true;
    };

    return check() ? ErrorCode::Success : ErrorCode::InvalidDescriptor;
}

std::optional<FileDescriptor> describe_file(const std::string& path, uint32_t chunk_size,
                                            IntegrityScheme scheme) {
    if (chunk_size == 0) {
        Logger::instance().error("Chunk size must be positive");
        return std::nullopt;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        Logger::instance().error("Cannot stat " + path + ": " + ec.message());
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        Logger::instance().error("Cannot open " + path);
        return std::nullopt;
    }

    FileDescriptor descriptor;
    descriptor.file_name = std::filesystem::path(path).filename().string();
    descriptor.size = size;
    descriptor.chunk_size = chunk_size;
    descriptor.total_chunks = static_cast<uint32_t>((size + chunk_size - 1) / chunk_size);
    descriptor.manifest.scheme = scheme;

    std::vector<uint8_t> buffer;
    std::vector<Digest> leaves;
    for (uint32_t i = 0; i < descriptor.total_chunks; ++i) {
        buffer.resize(descriptor.chunk_length(i));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (file.gcount() != static_cast<std::streamsize>(buffer.size())) {
            Logger::instance().error("Short read while describing " + path);
            return std::nullopt;
        }
        descriptor.manifest.chunk_hashes.push_back(to_lower(IntegrityVerifier::hash_chunk(buffer)));
        if (scheme == IntegrityScheme::MerkleRoot) {
            leaves.push_back(sha256_digest(buffer.data(), buffer.size()));
        }
    }

    auto file_hash = IntegrityVerifier::hash_file(path);
    if (!file_hash) {
        return std::nullopt;
    }
    descriptor.file_hash = to_lower(*file_hash);
    if (scheme == IntegrityScheme::MerkleRoot) {
        descriptor.manifest.merkle_root = digest_hex(merkle_root(leaves));
    }
    return descriptor;
}

ManifestDirectoryResolver::ManifestDirectoryResolver(std::string directory,
                                                     std::chrono::milliseconds poll_interval)
    : directory_(std::move(directory)), poll_interval_(poll_interval) {}

std::string ManifestDirectoryResolver::path_for(const std::string& file_hash) const {
    return (std::filesystem::path(directory_) / (file_hash + ".json")).string();
}

ResolveResult ManifestDirectoryResolver::lookup(const std::string& file_hash) const {
    ResolveResult result;
    std::string path = path_for(file_hash);

    std::ifstream file(path);
    if (!file.is_open()) {
        result.error = ErrorCode::NotFound;
        result.message = "no manifest for " + file_hash;
        return result;
    }

    try {
        auto j = nlohmann::json::parse(file);
        FileDescriptor descriptor = j.get<FileDescriptor>();
        if (descriptor.file_hash != file_hash) {
            result.error = ErrorCode::InvalidDescriptor;
            result.message = "manifest " + path + " describes " + descriptor.file_hash;
            return result;
        }
        std::string reason;
        if (validate_descriptor(descriptor, &reason) != ErrorCode::Success) {
            result.error = ErrorCode::InvalidDescriptor;
            result.message = "invalid manifest " + path + ": " + reason;
            return result;
        }
        result.descriptor = std::move(descriptor);
    } catch (const nlohmann::json::exception& e) {
        result.error = ErrorCode::InvalidDescriptor;
        result.message = "malformed manifest " + path + ": " + e.what();
    } catch (const MeshLoadError& e) {
        result.error = e.code();
        result.message = "manifest " + path + ": " + e.what();
    }
    return result;
}

elio::coro::task<ResolveResult> ManifestDirectoryResolver::resolve(std::string file_hash,
                                                                   std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        ResolveResult result = lookup(file_hash);
        if (result.ok() || result.error != ErrorCode::NotFound) {
            if (!result.ok()) {
                Logger::instance().warning("Resolve failed for " + file_hash + ": " + result.message);
            }
            co_return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            Logger::instance().warning("Descriptor for " + file_hash + " not found within " +
                                       std::to_string(timeout.count()) + "ms");
            co_return result;
        }
        co_await elio::time::sleep_for(poll_interval_);
    }
}

} // namespace meshload
