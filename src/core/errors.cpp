#include "assetrelay/core/errors.hpp"
#include <sstream>

namespace assetrelay::core {

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS: return "SUCCESS";
        case TransferError::SOURCE_UNREACHABLE: return "SOURCE_UNREACHABLE";
        case TransferError::SOURCE_REJECTED: return "SOURCE_REJECTED";
        case TransferError::SOURCE_TRUNCATED: return "SOURCE_TRUNCATED";
        case TransferError::SOURCE_CHANGED: return "SOURCE_CHANGED";
        case TransferError::SINK_UNAVAILABLE: return "SINK_UNAVAILABLE";
        case TransferError::SINK_REJECTED: return "SINK_REJECTED";
        case TransferError::SINK_QUOTA_EXCEEDED: return "SINK_QUOTA_EXCEEDED";
        case TransferError::PART_UPLOAD_FAILED: return "PART_UPLOAD_FAILED";
        case TransferError::SESSION_BUSY: return "SESSION_BUSY";
        case TransferError::CANCELLED: return "CANCELLED";
        case TransferError::TIMEOUT: return "TIMEOUT";
        case TransferError::INVALID_REQUEST: return "INVALID_REQUEST";
        case TransferError::INVALID_STATE: return "INVALID_STATE";
        case TransferError::IO_ERROR: return "IO_ERROR";
    }
    return "UNKNOWN";
}

bool is_transient(TransferError error) {
    switch (error) {
        case TransferError::SOURCE_UNREACHABLE:
        case TransferError::SOURCE_TRUNCATED:
        case TransferError::SINK_UNAVAILABLE:
        case TransferError::TIMEOUT:
            return true;
        default:
            return false;
    }
}

std::string TransferResult::describe() const {
    std::ostringstream oss;
    oss << to_string(error);

    if (part_index) {
        oss << " [part " << *part_index << "]";
    }
    if (cause != TransferError::SUCCESS) {
        oss << " [cause " << to_string(cause) << "]";
    }
    if (http_status != 0) {
        oss << " [HTTP " << http_status << "]";
    }
    if (!message.empty()) {
        oss << ": " << message;
    }

    return oss.str();
}

}
