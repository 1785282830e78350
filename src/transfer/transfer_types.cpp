#include "assetrelay/transfer/transfer_types.hpp"
#include "assetrelay/core/utils.hpp"
#include <fmt/format.h>

namespace assetrelay::transfer {

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING: return "Pending";
        case TransferStatus::DOWNLOADING: return "Downloading";
        case TransferStatus::UPLOADING: return "Uploading";
        case TransferStatus::COMPLETED: return "Completed";
        case TransferStatus::FAILED: return "Failed";
        case TransferStatus::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

const char* to_string(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::DOWNLOADING: return "Downloading";
        case TransferPhase::UPLOADING: return "Uploading";
    }
    return "Unknown";
}

bool is_terminal(TransferStatus status) {
    return status == TransferStatus::COMPLETED ||
           status == TransferStatus::FAILED ||
           status == TransferStatus::CANCELLED;
}

std::string part_asset_name(const std::string& target_name, uint32_t index, uint32_t total_parts) {
    if (total_parts <= 1) {
        return target_name;
    }
    return fmt::format("{}.{:03d}", target_name, index + 1);
}

std::string describe_progress(const ProgressEvent& event) {
    using core::utils::StringUtils;

    std::string line = fmt::format("[{}]", to_string(event.phase));
    if (event.total_parts > 0) {
        line += fmt::format(" part {}/{}", event.current_part + 1, event.total_parts);
    }
    if (event.percent) {
        line += fmt::format(" {:.1f}%", *event.percent);
    }
    line += " " + StringUtils::format_bytes(event.bytes_so_far);
    if (event.bytes_total) {
        line += " / " + StringUtils::format_bytes(*event.bytes_total);
    }
    if (event.eta_seconds) {
        line += " eta " + StringUtils::format_duration(std::chrono::seconds(*event.eta_seconds));
    }
    return line;
}

}
