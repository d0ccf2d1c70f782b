#include "meshload/storage/part_file.h"
#include "meshload/base/logger.h"
#include <filesystem>
#include <fstream>

namespace meshload {

PartFile::PartFile(std::string final_path, uint64_t size)
    : final_path_(std::move(final_path)),
      part_path_(final_path_ + ".part"),
      size_(size) {}

bool PartFile::open() {
    try {
        std::filesystem::path target(part_path_);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }
        if (!std::filesystem::exists(target)) {
            std::ofstream create(part_path_, std::ios::binary);
            if (!create.is_open()) {
                Logger::instance().error("Failed to create part file: " + part_path_);
                return false;
            }
        }
        if (std::filesystem::file_size(target) != size_) {
            std::filesystem::resize_file(target, size_);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::instance().error("Failed to prepare part file " + part_path_ + ": " + e.what());
        return false;
    }
    return true;
}

bool PartFile::exists() const {
    std::error_code ec;
    return std::filesystem::exists(part_path_, ec);
}

bool PartFile::write_at(uint64_t offset, const std::vector<uint8_t>& data) {
    if (offset + data.size() > size_) {
        Logger::instance().error("Write past end of part file " + part_path_);
        return false;
    }

    std::fstream file(part_path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!file.is_open()) {
        Logger::instance().error("Failed to open part file for writing: " + part_path_);
        return false;
    }
    file.seekp(static_cast<std::streamoff>(offset));
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        Logger::instance().error("Failed to write " + std::to_string(data.size()) + " bytes at offset " +
                                 std::to_string(offset) + " of " + part_path_);
        return false;
    }
    return true;
}

std::optional<std::vector<uint8_t>> PartFile::read_at(uint64_t offset, uint32_t length) const {
    std::ifstream file(part_path_, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::vector<uint8_t> data(length);
    file.seekg(static_cast<std::streamoff>(offset));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));
    if (file.gcount() != static_cast<std::streamsize>(length)) {
        return std::nullopt;
    }
    return data;
}

bool PartFile::promote() {
    try {
        std::filesystem::rename(part_path_, final_path_);
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::instance().error("Failed to promote " + part_path_ + ": " + e.what());
        return false;
    }
    Logger::instance().info("Promoted " + final_path_);
    return true;
}

void PartFile::discard() {
    std::error_code ec;
    std::filesystem::remove(part_path_, ec);
    if (ec) {
        Logger::instance().warning("Failed to remove part file " + part_path_ + ": " + ec.message());
    }
}

} // namespace meshload
