#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace assetrelay::core {

enum class TransferError {
    SUCCESS = 0,
    SOURCE_UNREACHABLE,
    SOURCE_REJECTED,
    SOURCE_TRUNCATED,
    SOURCE_CHANGED,
    SINK_UNAVAILABLE,
    SINK_REJECTED,
    SINK_QUOTA_EXCEEDED,
    PART_UPLOAD_FAILED,
    SESSION_BUSY,
    CANCELLED,
    TIMEOUT,
    INVALID_REQUEST,
    INVALID_STATE,
    IO_ERROR
};

const char* to_string(TransferError error);

// Errors that a fresh attempt of the same operation may clear.
bool is_transient(TransferError error);

struct TransferResult {
    TransferError error;
    std::string message;
    std::optional<std::uint32_t> part_index;
    TransferError cause = TransferError::SUCCESS;
    int http_status = 0;

    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }

    bool transient() const { return is_transient(error); }

    TransferResult& at_part(std::uint32_t index) {
        part_index = index;
        return *this;
    }

    TransferResult& with_status(int status) {
        http_status = status;
        return *this;
    }

    // "PART_UPLOAD_FAILED [part 2] [cause SINK_UNAVAILABLE] [HTTP 503]: message"
    std::string describe() const;
};

} // namespace assetrelay::core
