#include "meshload/core/serialization.h"

namespace meshload {

void to_json(nlohmann::json& j, const CandidatePeer& peer) {
    j = nlohmann::json{
        {"peer_id", peer.peer_id},
        {"protocol", to_string(peer.protocol)},
        {"address", peer.address}
    };
}

void from_json(const nlohmann::json& j, CandidatePeer& peer) {
    j.at("peer_id").get_to(peer.peer_id);
    auto tag = parse_protocol_tag(j.at("protocol").get<std::string>());
    if (!tag) {
        throw MeshLoadError(ErrorCode::UnsupportedProtocol, j.at("protocol").get<std::string>());
    }
    peer.protocol = *tag;
    peer.address = j.value("address", std::string{});
}

void to_json(nlohmann::json& j, const IntegrityManifest& manifest) {
    j = nlohmann::json{
        {"scheme", manifest.scheme == IntegrityScheme::MerkleRoot ? "merkle" : "chunk_hashes"},
        {"chunk_hashes", manifest.chunk_hashes}
    };
    if (manifest.scheme == IntegrityScheme::MerkleRoot) {
        j["merkle_root"] = manifest.merkle_root;
    }
}

void from_json(const nlohmann::json& j, IntegrityManifest& manifest) {
    std::string scheme = j.value("scheme", std::string{"chunk_hashes"});
    if (scheme == "merkle") {
        manifest.scheme = IntegrityScheme::MerkleRoot;
        j.at("merkle_root").get_to(manifest.merkle_root);
    } else if (scheme == "chunk_hashes") {
        manifest.scheme = IntegrityScheme::ChunkHashes;
        manifest.merkle_root.clear();
    } else {
        throw MeshLoadError(ErrorCode::InvalidDescriptor, "unknown integrity scheme: " + scheme);
    }
    j.at("chunk_hashes").get_to(manifest.chunk_hashes);
}

void to_json(nlohmann::json& j, const FileDescriptor& descriptor) {
    j = nlohmann::json{
        {"file_hash", descriptor.file_hash},
        {"file_name", descriptor.file_name},
        {"size", descriptor.size},
        {"chunk_size", descriptor.chunk_size},
        {"total_chunks", descriptor.total_chunks},
        {"manifest", descriptor.manifest},
        {"peers", descriptor.peers},
        {"encrypted", descriptor.encrypted}
    };
}

void from_json(const nlohmann::json& j, FileDescriptor& descriptor) {
    j.at("file_hash").get_to(descriptor.file_hash);
    descriptor.file_name = j.value("file_name", std::string{});
    j.at("size").get_to(descriptor.size);
    j.at("chunk_size").get_to(descriptor.chunk_size);
    j.at("total_chunks").get_to(descriptor.total_chunks);
    j.at("manifest").get_to(descriptor.manifest);
    descriptor.peers = j.value("peers", std::vector<CandidatePeer>{});
    descriptor.encrypted = j.value("encrypted", false);
}

int64_t to_unix_millis(WallTime time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

WallTime from_unix_millis(int64_t millis) {
    return WallTime(std::chrono::duration_cast<WallTime::duration>(std::chrono::milliseconds(millis)));
}

} // namespace meshload
