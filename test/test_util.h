#ifndef MESHLOAD_TEST_TEST_UTIL_H
#define MESHLOAD_TEST_TEST_UTIL_H

#include "meshload/core/types.h"
#include "meshload/discovery/descriptor_resolver.h"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace meshload {
namespace test {

// Fresh, empty directory under the system temp dir
inline std::filesystem::path make_temp_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("meshload_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

// Deterministic, non-repeating-per-chunk content
inline std::vector<uint8_t> pattern_bytes(size_t size, uint32_t seed = 7) {
    std::vector<uint8_t> data(size);
    uint32_t state = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1664525u + 1013904223u;
        data[i] = static_cast<uint8_t>(state >> 24);
    }
    return data;
}

inline void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Writes content to <dir>/<name> and describes it
inline FileDescriptor describe_content(const std::filesystem::path& dir, const std::string& name,
                                       const std::vector<uint8_t>& content, uint32_t chunk_size,
                                       IntegrityScheme scheme = IntegrityScheme::ChunkHashes) {
    auto path = dir / name;
    write_file(path, content);
    auto descriptor = describe_file(path.string(), chunk_size, scheme);
    if (!descriptor) {
        throw std::runtime_error("cannot describe " + path.string());
    }
    return *descriptor;
}

inline std::vector<uint8_t> chunk_of(const std::vector<uint8_t>& content, const FileDescriptor& descriptor,
                                     uint32_t index) {
    auto begin = content.begin() + static_cast<std::ptrdiff_t>(descriptor.chunk_offset(index));
    return std::vector<uint8_t>(begin, begin + descriptor.chunk_length(index));
}

} // namespace test
} // namespace meshload

#endif // MESHLOAD_TEST_TEST_UTIL_H
