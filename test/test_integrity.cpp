#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "meshload/core/serialization.h"
#include "meshload/discovery/descriptor_resolver.h"
#include "meshload/integrity/decryptor.h"
#include "meshload/integrity/integrity_verifier.h"
#include "meshload/integrity/merkle.h"
#include "test_util.h"

using namespace meshload;
using namespace meshload::test;

namespace {

std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // anonymous namespace

TEST_CASE("SHA-256 Known Vectors", "[integrity][hash]") {
    auto abc = bytes_of("abc");
    REQUIRE(digest_hex(sha256_digest(abc.data(), abc.size())) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(IntegrityVerifier::hash_chunk(abc) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::vector<uint8_t> empty;
    REQUIRE(digest_hex(sha256_digest(empty.data(), 0)) ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("Hex Helpers", "[integrity][hex]") {
    std::vector<uint8_t> raw{0x00, 0x7f, 0xab, 0xff};
    REQUIRE(to_hex(raw.data(), raw.size()) == "007fabff");
    REQUIRE(from_hex("007FabFF") == raw);
    REQUIRE_FALSE(from_hex("abc").has_value());
    REQUIRE_FALSE(from_hex("zz").has_value());
    REQUIRE(is_sha256_hex("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
    REQUIRE_FALSE(is_sha256_hex("e3b0c442"));
}

TEST_CASE("Merkle Root", "[integrity][merkle]") {
    std::vector<Digest> leaves;
    for (int i = 0; i < 3; ++i) {
        auto data = pattern_bytes(100, static_cast<uint32_t>(i));
        leaves.push_back(sha256_digest(data.data(), data.size()));
    }

    auto parent = [](const Digest& left, const Digest& right) {
        std::vector<uint8_t> joined(left.begin(), left.end());
        joined.insert(joined.end(), right.begin(), right.end());
        return sha256_digest(joined.data(), joined.size());
    };

    SECTION("Single leaf is its own root") {
        REQUIRE(merkle_root({leaves[0]}) == leaves[0]);
    }

    SECTION("Odd node is paired with itself") {
        Digest expected = parent(parent(leaves[0], leaves[1]), parent(leaves[2], leaves[2]));
        REQUIRE(merkle_root(leaves) == expected);
    }

    SECTION("Leaf order matters") {
        auto swapped = leaves;
        std::swap(swapped[0], swapped[1]);
        REQUIRE(merkle_root(swapped) != merkle_root(leaves));
    }
}

TEST_CASE("Chunk Verification With Chunk Hashes", "[integrity][chunk]") {
    auto dir = make_temp_dir("integrity_chunks");
    auto content = pattern_bytes(10000);
    auto descriptor = describe_content(dir, "data.bin", content, 4096);
    REQUIRE(descriptor.total_chunks == 3);

    IntegrityVerifier verifier(descriptor);
    for (uint32_t i = 0; i < descriptor.total_chunks; ++i) {
        REQUIRE(verifier.verify_chunk(i, chunk_of(content, descriptor, i)));
    }

    auto tampered = chunk_of(content, descriptor, 1);
    tampered[10] ^= 0x01;
    REQUIRE_FALSE(verifier.verify_chunk(1, tampered));

    // Right bytes, wrong slot
    REQUIRE_FALSE(verifier.verify_chunk(0, chunk_of(content, descriptor, 1)));

    // The last chunk is short; padding it is a length error
    auto padded = chunk_of(content, descriptor, 2);
    padded.push_back(0);
    REQUIRE_FALSE(verifier.verify_chunk(2, padded));

    REQUIRE_FALSE(verifier.verify_chunk(3, chunk_of(content, descriptor, 0)));
}

TEST_CASE("Chunk Verification With Merkle Root", "[integrity][chunk][merkle]") {
    auto dir = make_temp_dir("integrity_merkle");
    auto content = pattern_bytes(5000);
    auto descriptor = describe_content(dir, "data.bin", content, 1000, IntegrityScheme::MerkleRoot);
    REQUIRE(descriptor.manifest.scheme == IntegrityScheme::MerkleRoot);
    REQUIRE(is_sha256_hex(descriptor.manifest.merkle_root));

    IntegrityVerifier verifier(descriptor);
    REQUIRE(verifier.verify_chunk(3, chunk_of(content, descriptor, 3)));
    REQUIRE_FALSE(verifier.verify_chunk(3, chunk_of(content, descriptor, 4)));
    REQUIRE(verifier.verify_file((dir / "data.bin").string()) == ErrorCode::Success);

    // Leaves that do not add up to the root verify nothing
    auto forged = descriptor;
    std::swap(forged.manifest.chunk_hashes[0], forged.manifest.chunk_hashes[1]);
    IntegrityVerifier rejecting(forged);
    for (uint32_t i = 0; i < forged.total_chunks; ++i) {
        REQUIRE_FALSE(rejecting.verify_chunk(i, chunk_of(content, descriptor, i)));
    }
}

TEST_CASE("Whole File Verification", "[integrity][file]") {
    auto dir = make_temp_dir("integrity_file");
    auto content = pattern_bytes(9000);
    auto descriptor = describe_content(dir, "data.bin", content, 2048);
    IntegrityVerifier verifier(descriptor);

    REQUIRE(verifier.verify_file((dir / "data.bin").string()) == ErrorCode::Success);

    auto corrupt = content;
    corrupt[5000] ^= 0xff;
    write_file(dir / "corrupt.bin", corrupt);
    REQUIRE(verifier.verify_file((dir / "corrupt.bin").string()) == ErrorCode::FileCorruption);

    write_file(dir / "short.bin", std::vector<uint8_t>(content.begin(), content.begin() + 100));
    REQUIRE(verifier.verify_file((dir / "short.bin").string()) == ErrorCode::FileCorruption);

    REQUIRE(verifier.verify_file((dir / "missing.bin").string()) == ErrorCode::StorageError);
}

TEST_CASE("AES-GCM Round Trip", "[integrity][decrypt]") {
    std::vector<uint8_t> key(kAesKeySize, 0x42);
    auto plain = pattern_bytes(3000);

    auto blob = aes_gcm_encrypt(key, plain);
    REQUIRE(blob.has_value());
    REQUIRE(blob->size() == plain.size() + kGcmIvSize + kGcmTagSize);
    REQUIRE(aes_gcm_decrypt(key, *blob) == plain);

    std::vector<uint8_t> wrong_key(kAesKeySize, 0x43);
    REQUIRE_FALSE(aes_gcm_decrypt(wrong_key, *blob).has_value());

    auto tampered = *blob;
    tampered[kGcmIvSize + 5] ^= 0x01;
    REQUIRE_FALSE(aes_gcm_decrypt(key, tampered).has_value());

    REQUIRE_FALSE(aes_gcm_decrypt(key, std::vector<uint8_t>(4, 0)).has_value());
    REQUIRE_FALSE(aes_gcm_decrypt(std::vector<uint8_t>(16, 0), *blob).has_value());
}

TEST_CASE("Decrypt File", "[integrity][decrypt]") {
    auto dir = make_temp_dir("integrity_decrypt");
    std::vector<uint8_t> key(kAesKeySize, 0x11);
    auto plain = pattern_bytes(4096);
    auto blob = aes_gcm_encrypt(key, plain);
    REQUIRE(blob.has_value());
    write_file(dir / "cipher.bin", *blob);

    REQUIRE(decrypt_file((dir / "cipher.bin").string(), (dir / "plain.bin").string(), key) ==
            ErrorCode::Success);
    REQUIRE(read_file(dir / "plain.bin") == plain);

    std::vector<uint8_t> wrong_key(kAesKeySize, 0x12);
    REQUIRE(decrypt_file((dir / "cipher.bin").string(), (dir / "wrong.bin").string(), wrong_key) ==
            ErrorCode::DecryptionFailed);
    REQUIRE(decrypt_file((dir / "none.bin").string(), (dir / "out.bin").string(), key) ==
            ErrorCode::StorageError);
}

TEST_CASE("Describe File", "[integrity][describe]") {
    auto dir = make_temp_dir("integrity_describe");
    auto content = pattern_bytes(10 * 1024 + 1);
    auto descriptor = describe_content(dir, "payload.iso", content, 1024);

    REQUIRE(descriptor.file_name == "payload.iso");
    REQUIRE(descriptor.size == content.size());
    REQUIRE(descriptor.chunk_size == 1024);
    REQUIRE(descriptor.total_chunks == 11);
    REQUIRE(descriptor.chunk_length(10) == 1);
    REQUIRE(descriptor.manifest.chunk_hashes.size() == 11);
    REQUIRE(is_sha256_hex(descriptor.file_hash));
    REQUIRE(validate_descriptor(descriptor) == ErrorCode::Success);

    REQUIRE_FALSE(describe_file((dir / "nope").string(), 1024, IntegrityScheme::ChunkHashes).has_value());
    REQUIRE_FALSE(describe_file((dir / "payload.iso").string(), 0, IntegrityScheme::ChunkHashes).has_value());
}

TEST_CASE("Descriptor Validation", "[integrity][descriptor]") {
    auto dir = make_temp_dir("integrity_validate");
    auto content = pattern_bytes(4000);
    auto good = describe_content(dir, "file.bin", content, 1000);
    auto merkle = describe_content(dir, "file.bin", content, 1000, IntegrityScheme::MerkleRoot);
    std::string reason;

    auto d = good;
    d.size = 0;
    REQUIRE(validate_descriptor(d, &reason) == ErrorCode::InvalidDescriptor);
    REQUIRE(reason == "empty file");

    d = good;
    d.total_chunks = 5;
    REQUIRE(validate_descriptor(d) == ErrorCode::InvalidDescriptor);

    d = good;
    d.chunk_size = 0;
    REQUIRE(validate_descriptor(d) == ErrorCode::InvalidDescriptor);

    d = good;
    d.manifest.chunk_hashes.pop_back();
    REQUIRE(validate_descriptor(d) == ErrorCode::InvalidDescriptor);

    d = good;
    d.manifest.chunk_hashes[0] = "not-hex";
    REQUIRE(validate_descriptor(d) == ErrorCode::InvalidDescriptor);

    d = merkle;
    std::swap(d.manifest.chunk_hashes[0], d.manifest.chunk_hashes[1]);
    REQUIRE(validate_descriptor(d, &reason) == ErrorCode::InvalidDescriptor);
    REQUIRE(reason == "merkle leaves do not produce the root");

    REQUIRE(validate_descriptor(merkle) == ErrorCode::Success);
}

TEST_CASE("Descriptor JSON", "[integrity][descriptor][json]") {
    auto dir = make_temp_dir("integrity_json");
    auto descriptor = describe_content(dir, "file.bin", pattern_bytes(3000), 1000, IntegrityScheme::MerkleRoot);
    descriptor.peers = {{"seed-1", ProtocolTag::Tcp, "10.0.0.1:7000"},
                        {"mirror", ProtocolTag::Http, "http://mirror.example/file.bin"}};
    descriptor.encrypted = true;

    nlohmann::json j = descriptor;
    REQUIRE(j["manifest"]["scheme"] == "merkle");
    REQUIRE(j["peers"][1]["protocol"] == to_string(ProtocolTag::Http));

    auto parsed = j.get<FileDescriptor>();
    REQUIRE(parsed.file_hash == descriptor.file_hash);
    REQUIRE(parsed.manifest.merkle_root == descriptor.manifest.merkle_root);
    REQUIRE(parsed.peers == descriptor.peers);
    REQUIRE(parsed.encrypted);

    j["peers"][0]["protocol"] = "carrier-pigeon";
    REQUIRE_THROWS_AS(j.get<FileDescriptor>(), MeshLoadError);
}

TEST_CASE("Manifest Directory Lookup", "[integrity][discovery]") {
    auto dir = make_temp_dir("integrity_manifests");
    auto descriptor = describe_content(dir, "file.bin", pattern_bytes(2500), 1000);
    descriptor.peers = {{"local", ProtocolTag::File, (dir / "file.bin").string()}};

    ManifestDirectoryResolver resolver(dir.string());
    REQUIRE(resolver.path_for(descriptor.file_hash) == (dir / (descriptor.file_hash + ".json")).string());

    auto missing = resolver.lookup(descriptor.file_hash);
    REQUIRE_FALSE(missing.ok());
    REQUIRE(missing.error == ErrorCode::NotFound);

    {
        std::ofstream out(resolver.path_for(descriptor.file_hash));
        out << nlohmann::json(descriptor).dump();
    }
    auto found = resolver.lookup(descriptor.file_hash);
    REQUIRE(found.ok());
    REQUIRE(found.descriptor->peers.size() == 1);
    REQUIRE(found.descriptor->total_chunks == 3);

    // A manifest filed under the wrong hash
    std::string other(64, 'a');
    {
        std::ofstream out(resolver.path_for(other));
        out << nlohmann::json(descriptor).dump();
    }
    REQUIRE(resolver.lookup(other).error == ErrorCode::InvalidDescriptor);

    std::string garbled(64, 'b');
    {
        std::ofstream out(resolver.path_for(garbled));
        out << "{ broken";
    }
    REQUIRE(resolver.lookup(garbled).error == ErrorCode::InvalidDescriptor);
}
