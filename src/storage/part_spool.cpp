#include "assetrelay/storage/part_spool.hpp"
#include "assetrelay/core/logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <fmt/format.h>
#include <unistd.h>

namespace assetrelay::storage {

using core::TransferError;
using core::TransferResult;

namespace {

std::filesystem::path unique_spool_path(const std::filesystem::path& directory) {
    static std::atomic<uint64_t> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return directory / fmt::format("assetrelay-{}-{}-{}.part", ::getpid(), stamp, counter++);
}

}

PartSpool::PartSpool(const std::filesystem::path& directory)
    : directory_(directory)
    , size_(0)
    , read_position_(0) {}

PartSpool::~PartSpool() {
    remove_file();
}

TransferResult PartSpool::open() {
    if (file_.is_open()) {
        return TransferResult();
    }

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return TransferResult(TransferError::IO_ERROR,
                              "Cannot create spool directory " + directory_.string() + ": " + ec.message());
    }

    path_ = unique_spool_path(directory_);
    file_.open(path_, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        return TransferResult(TransferError::IO_ERROR, "Cannot create spool file " + path_.string());
    }

    size_ = 0;
    read_position_ = 0;
    LOG_DEBUG("Spool file {}", path_.string());
    return TransferResult();
}

TransferResult PartSpool::append(std::span<const uint8_t> data) {
    if (!file_.is_open()) {
        auto result = open();
        if (!result) {
            return result;
        }
    }
    if (data.empty()) {
        return TransferResult();
    }

    file_.clear();
    file_.seekp(static_cast<std::streamoff>(size_));
    file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file_) {
        return TransferResult(TransferError::IO_ERROR, "Write to spool file " + path_.string() + " failed");
    }

    size_ += data.size();
    return TransferResult();
}

TransferResult PartSpool::rewind(uint64_t offset) {
    if (offset > size_) {
        return TransferResult(TransferError::INVALID_REQUEST, "Spool rewind past end");
    }
    read_position_ = offset;
    return TransferResult();
}

TransferResult PartSpool::read(size_t max_bytes, std::vector<uint8_t>& out) {
    out.clear();
    if (read_position_ >= size_) {
        return TransferResult();
    }

    auto want = static_cast<size_t>(std::min<uint64_t>(max_bytes, size_ - read_position_));
    out.resize(want);

    file_.flush();
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(read_position_));
    file_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(want));
    if (static_cast<size_t>(file_.gcount()) != want) {
        out.clear();
        return TransferResult(TransferError::IO_ERROR, "Short read from spool file " + path_.string());
    }

    read_position_ += want;
    return TransferResult();
}

TransferResult PartSpool::reset() {
    if (!file_.is_open()) {
        return open();
    }

    file_.close();
    file_.open(path_, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        return TransferResult(TransferError::IO_ERROR, "Cannot truncate spool file " + path_.string());
    }

    size_ = 0;
    read_position_ = 0;
    return TransferResult();
}

void PartSpool::remove_file() {
    if (file_.is_open()) {
        file_.close();
    }
    if (!path_.empty()) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            LOG_WARN("Failed to remove spool file {}: {}", path_.string(), ec.message());
        }
        path_.clear();
    }
}

}
