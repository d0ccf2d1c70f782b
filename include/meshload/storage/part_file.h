#ifndef MESHLOAD_STORAGE_PART_FILE_H
#define MESHLOAD_STORAGE_PART_FILE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meshload {

// "<final>.part" assembly file. Chunks are written at their offsets as they
// verify; the file only reaches its final name through promote().
class PartFile {
public:
    PartFile(std::string final_path, uint64_t size);

    const std::string& final_path() const { return final_path_; }
    const std::string& path() const { return part_path_; }
    uint64_t size() const { return size_; }

    // Create or reuse the part file at full size; existing bytes are kept
    bool open();
    bool exists() const;

    bool write_at(uint64_t offset, const std::vector<uint8_t>& data);
    std::optional<std::vector<uint8_t>> read_at(uint64_t offset, uint32_t length) const;

    // Atomic rename onto the final path
    bool promote();
    void discard();

private:
    std::string final_path_;
    std::string part_path_;
    uint64_t size_;
};

} // namespace meshload

#endif // MESHLOAD_STORAGE_PART_FILE_H
