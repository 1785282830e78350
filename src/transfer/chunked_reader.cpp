#include "assetrelay/transfer/chunked_reader.hpp"
#include "assetrelay/core/logger.hpp"
#include <algorithm>

namespace assetrelay::transfer {

using core::TransferError;
using core::TransferResult;

TransferResult ChunkedReader::seek(uint64_t) {
    return TransferResult(TransferError::INVALID_STATE, describe() + " is not seekable");
}

StreamReader::StreamReader(std::istream& stream, std::optional<uint64_t> declared_length, std::string name)
    : stream_(&stream)
    , declared_length_(declared_length)
    , name_(std::move(name))
    , bytes_read_(0)
    , finished_(false) {}

TransferResult StreamReader::open() {
    if (!*stream_) {
        return TransferResult(TransferError::SOURCE_UNREACHABLE, name_ + " is not readable");
    }
    return TransferResult();
}

TransferResult StreamReader::next_chunk(size_t max_bytes, std::vector<uint8_t>& out) {
    out.clear();
    if (finished_) {
        return TransferResult();
    }

    size_t want = max_bytes;
    if (declared_length_) {
        want = static_cast<size_t>(std::min<uint64_t>(want, *declared_length_ - bytes_read_));
        if (want == 0) {
            return finish_at_declared_length();
        }
    }

    out.resize(want);
    stream_->read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(want));
    auto got = static_cast<size_t>(stream_->gcount());
    out.resize(got);
    bytes_read_ += got;

    if (stream_->bad()) {
        finished_ = true;
        out.clear();
        return TransferResult(TransferError::SOURCE_TRUNCATED, name_ + ": stream read error");
    }

    if (got < want) {
        finished_ = true;
        if (declared_length_ && bytes_read_ < *declared_length_) {
            out.clear();
            return TransferResult(TransferError::SOURCE_TRUNCATED,
                                  name_ + ": stream ended at " + std::to_string(bytes_read_) +
                                  " of " + std::to_string(*declared_length_) + " bytes");
        }
        return TransferResult();
    }

    if (declared_length_ && bytes_read_ == *declared_length_) {
        auto result = finish_at_declared_length();
        if (!result) {
            out.clear();
        }
        return result;
    }

    return TransferResult();
}

TransferResult StreamReader::finish_at_declared_length() {
    finished_ = true;
    if (stream_->peek() != std::istream::traits_type::eof()) {
        return TransferResult(TransferError::INVALID_REQUEST,
                              name_ + " is longer than the declared " +
                              std::to_string(*declared_length_) + " bytes");
    }
    stream_->clear();
    return TransferResult();
}

BufferReader::BufferReader(std::vector<uint8_t> data, std::string name)
    : data_(std::move(data))
    , name_(std::move(name))
    , position_(0) {}

TransferResult BufferReader::open() {
    position_ = 0;
    return TransferResult();
}

TransferResult BufferReader::next_chunk(size_t max_bytes, std::vector<uint8_t>& out) {
    auto remaining = data_.size() - position_;
    auto count = std::min<uint64_t>(remaining, max_bytes);
    out.assign(data_.begin() + static_cast<std::ptrdiff_t>(position_),
               data_.begin() + static_cast<std::ptrdiff_t>(position_ + count));
    position_ += count;
    return TransferResult();
}

TransferResult BufferReader::seek(uint64_t offset) {
    if (offset > data_.size()) {
        return TransferResult(TransferError::INVALID_REQUEST, "seek past end of " + name_);
    }
    position_ = offset;
    return TransferResult();
}

FileReader::FileReader(const std::filesystem::path& path)
    : path_(path)
    , position_(0) {}

TransferResult FileReader::open() {
    std::error_code ec;
    auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return TransferResult(TransferError::SOURCE_UNREACHABLE,
                              "Cannot stat " + path_.string() + ": " + ec.message());
    }

    file_.close();
    file_.clear();
    file_.open(path_, std::ios::binary);
    if (!file_.is_open()) {
        return TransferResult(TransferError::SOURCE_UNREACHABLE, "Cannot open " + path_.string());
    }

    file_size_ = size;
    position_ = 0;
    LOG_DEBUG("Opened {} ({} bytes)", path_.string(), size);
    return TransferResult();
}

TransferResult FileReader::next_chunk(size_t max_bytes, std::vector<uint8_t>& out) {
    out.clear();
    if (!file_.is_open() || !file_size_) {
        return TransferResult(TransferError::INVALID_STATE, path_.string() + " is not open");
    }

    auto remaining = *file_size_ - position_;
    if (remaining == 0) {
        file_.close();
        return TransferResult();
    }

    auto want = static_cast<size_t>(std::min<uint64_t>(remaining, max_bytes));
    out.resize(want);
    file_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(want));
    auto got = static_cast<size_t>(file_.gcount());
    position_ += got;

    if (got < want) {
        out.clear();
        file_.close();
        return TransferResult(TransferError::SOURCE_TRUNCATED,
                              path_.string() + " shrank while reading at offset " + std::to_string(position_));
    }

    return TransferResult();
}

TransferResult FileReader::seek(uint64_t offset) {
    if (!file_size_ || offset > *file_size_) {
        return TransferResult(TransferError::INVALID_REQUEST, "seek past end of " + path_.string());
    }

    if (!file_.is_open()) {
        file_.clear();
        file_.open(path_, std::ios::binary);
        if (!file_.is_open()) {
            return TransferResult(TransferError::SOURCE_UNREACHABLE, "Cannot reopen " + path_.string());
        }
    }

    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    if (!file_) {
        return TransferResult(TransferError::IO_ERROR, "seek failed on " + path_.string());
    }
    position_ = offset;
    return TransferResult();
}

}
