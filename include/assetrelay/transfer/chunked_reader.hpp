#pragma once

#include "assetrelay/core/errors.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace assetrelay::transfer {

// A byte source consumed as a sequence of chunks.
//
// next_chunk() fills `out` with up to `max_bytes` bytes. A successful result
// with an empty `out` means end of input. After end of input or an error the
// reader has released its underlying handle; seek() reopens it where
// supported.
class ChunkedReader {
public:
    virtual ~ChunkedReader() = default;

    virtual core::TransferResult open() = 0;
    virtual core::TransferResult next_chunk(size_t max_bytes, std::vector<uint8_t>& out) = 0;

    // Available after open().
    virtual std::optional<uint64_t> total_bytes_known() const = 0;

    virtual bool seekable() const { return false; }
    virtual core::TransferResult seek(uint64_t offset);

    // Absolute offset of the next byte next_chunk() will return.
    virtual uint64_t bytes_read() const = 0;

    virtual std::string describe() const = 0;
};

// Forward-only wrapper over an already-open stream. With a declared length
// a short stream is truncated and a stream with bytes past that length is
// rejected as INVALID_REQUEST.
class StreamReader : public ChunkedReader {
public:
    StreamReader(std::istream& stream, std::optional<uint64_t> declared_length = std::nullopt,
                 std::string name = "stream");

    core::TransferResult open() override;
    core::TransferResult next_chunk(size_t max_bytes, std::vector<uint8_t>& out) override;
    std::optional<uint64_t> total_bytes_known() const override { return declared_length_; }
    uint64_t bytes_read() const override { return bytes_read_; }
    std::string describe() const override { return name_; }

private:
    core::TransferResult finish_at_declared_length();

    std::istream* stream_;
    std::optional<uint64_t> declared_length_;
    std::string name_;
    uint64_t bytes_read_;
    bool finished_;
};

class BufferReader : public ChunkedReader {
public:
    explicit BufferReader(std::vector<uint8_t> data, std::string name = "buffer");

    core::TransferResult open() override;
    core::TransferResult next_chunk(size_t max_bytes, std::vector<uint8_t>& out) override;
    std::optional<uint64_t> total_bytes_known() const override { return data_.size(); }
    bool seekable() const override { return true; }
    core::TransferResult seek(uint64_t offset) override;
    uint64_t bytes_read() const override { return position_; }
    std::string describe() const override { return name_; }

private:
    std::vector<uint8_t> data_;
    std::string name_;
    uint64_t position_;
};

class FileReader : public ChunkedReader {
public:
    explicit FileReader(const std::filesystem::path& path);

    core::TransferResult open() override;
    core::TransferResult next_chunk(size_t max_bytes, std::vector<uint8_t>& out) override;
    std::optional<uint64_t> total_bytes_known() const override { return file_size_; }
    bool seekable() const override { return true; }
    core::TransferResult seek(uint64_t offset) override;
    uint64_t bytes_read() const override { return position_; }
    std::string describe() const override { return path_.string(); }

    const std::filesystem::path& get_path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream file_;
    std::optional<uint64_t> file_size_;
    uint64_t position_;
};

} // namespace assetrelay::transfer
