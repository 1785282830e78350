#pragma once

#include "assetrelay/core/errors.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <vector>

namespace assetrelay::storage {

// Temporary file holding the bytes of one part so the part can be replayed
// after a failed attempt. The file is removed when the spool is destroyed.
class PartSpool {
public:
    explicit PartSpool(const std::filesystem::path& directory);
    ~PartSpool();

    PartSpool(const PartSpool&) = delete;
    PartSpool& operator=(const PartSpool&) = delete;

    core::TransferResult open();

    core::TransferResult append(std::span<const uint8_t> data);

    // Positions the read cursor at `offset` bytes into the spool.
    core::TransferResult rewind(uint64_t offset = 0);

    // Reads up to `max_bytes` from the read cursor; empty `out` at the end.
    core::TransferResult read(size_t max_bytes, std::vector<uint8_t>& out);

    // Discards the contents and starts a new part.
    core::TransferResult reset();

    uint64_t size() const { return size_; }
    uint64_t read_position() const { return read_position_; }
    const std::filesystem::path& get_path() const { return path_; }

private:
    std::filesystem::path directory_;
    std::filesystem::path path_;
    std::fstream file_;
    uint64_t size_;
    uint64_t read_position_;

    void remove_file();
};

} // namespace assetrelay::storage
