#pragma once

#include "assetrelay/core/errors.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace assetrelay::transfer {

class ChunkedReader;

enum class TransferStatus {
    PENDING,
    DOWNLOADING,
    UPLOADING,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class TransferPhase {
    DOWNLOADING,
    UPLOADING
};

const char* to_string(TransferStatus status);
const char* to_string(TransferPhase phase);

bool is_terminal(TransferStatus status);

// Half-open [start, end).
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t length() const { return end - start; }
    bool operator==(const ByteRange& other) const = default;
};

struct Part {
    uint32_t index = 0;
    ByteRange range;
    std::string asset_name;
    std::optional<uint64_t> sink_asset_id;
    std::string checksum;
    uint32_t attempts = 0;
    std::string download_url;
    bool resumed = false;
};

// Caller-opened byte stream. The reader is shared so the caller can keep
// the underlying stream alive for the duration of the transfer.
struct InlineStream {
    std::shared_ptr<ChunkedReader> reader;
};

struct RemoteUrl {
    std::string url;
};

using TransferSource = std::variant<InlineStream, RemoteUrl>;

struct TransferRequest {
    TransferSource source;
    std::string target_asset_name;
    uint64_t target_release_id = 0;
    std::optional<uint64_t> declared_size_bytes;
    std::string label;
    bool replace_existing = true;
};

struct ProgressEvent {
    uint64_t bytes_so_far = 0;
    std::optional<uint64_t> bytes_total;
    std::optional<double> percent;
    uint32_t current_part = 0;
    uint32_t total_parts = 0;
    TransferPhase phase = TransferPhase::DOWNLOADING;
    std::optional<uint64_t> eta_seconds;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

struct TransferOutcome {
    std::vector<uint64_t> asset_ids;
    std::vector<uint64_t> part_sizes;
    uint64_t total_bytes = 0;
};

struct TransferState {
    uint64_t bytes_transferred_total = 0;
    uint32_t total_parts_planned = 0;
    std::vector<Part> parts_completed;
    TransferStatus status = TransferStatus::PENDING;
    std::optional<core::TransferResult> last_error;
    uint32_t total_retries = 0;
    std::chrono::system_clock::time_point started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
    std::optional<TransferOutcome> result;
};

enum class PartialAssetPolicy {
    KEEP,
    DELETE_UPLOADED
};

// "[Uploading] part 2/3 45.0% 1.80 GB / 4.00 GB eta 1m 3s"
std::string describe_progress(const ProgressEvent& event);

// "<name>" for a single part, "<name>.001", "<name>.002", ... otherwise.
std::string part_asset_name(const std::string& target_name, uint32_t index, uint32_t total_parts);

} // namespace assetrelay::transfer
