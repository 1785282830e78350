#pragma once

#include "assetrelay/core/clock.hpp"
#include "assetrelay/core/errors.hpp"
#include "assetrelay/network/sink_client.hpp"
#include "assetrelay/transfer/chunked_reader.hpp"
#include "assetrelay/transfer/retry_policy.hpp"
#include "assetrelay/transfer/transfer_types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace assetrelay::storage {
class PartSpool;
class ResumeJournal;
}

namespace assetrelay::transfer {

// Observer for the uploader's progress. All callbacks run on the uploading
// thread.
class UploadListener {
public:
    virtual ~UploadListener() = default;

    // `final_count` is false while an unknown-length source is still being
    // partitioned and more parts may follow.
    virtual void on_parts_planned(uint32_t total_parts, bool final_count) = 0;
    virtual void on_part_started(const Part& part) = 0;
    virtual void on_bytes(uint64_t delta, uint32_t part_index, TransferPhase phase) = 0;
    virtual void on_upload_started(uint32_t part_index) = 0;
    virtual void on_part_completed(const Part& part) = 0;
    virtual void on_retry(uint32_t part_index, uint32_t retry, std::chrono::milliseconds delay,
                          const core::TransferResult& cause) = 0;
};

struct SplitUploadOptions {
    uint64_t max_asset_bytes = 2ULL * 1024 * 1024 * 1024;
    uint64_t max_total_bytes = 4ULL * 1024 * 1024 * 1024;
    size_t chunk_size = 1024 * 1024;
    RetryPolicy retry;
    std::filesystem::path spool_directory;
    bool replace_existing = true;

    // Consulted only for known-size seekable sources with a non-empty key.
    storage::ResumeJournal* journal = nullptr;
    std::string journal_key;
};

// Splits one source into sink assets of at most max_asset_bytes each and
// uploads them in index order, retrying each part independently.
class SplitUploader {
public:
    SplitUploader(network::SinkClient& sink, core::Clock& clock, SplitUploadOptions options);
    ~SplitUploader();

    // `reader` must already be open. `total_size` is the known or declared
    // length; nullopt partitions the source as it is read. Completed parts
    // are appended to `parts` in index order, also on failure.
    core::TransferResult upload(ChunkedReader& reader, network::ReleaseId release,
                                const std::string& asset_name, std::optional<uint64_t> total_size,
                                const std::atomic<bool>& cancelled, std::vector<Part>& parts,
                                UploadListener* listener = nullptr);

    uint32_t get_total_retries() const { return total_retries_; }

    // max(1, ceil(total / max_part)) contiguous ranges covering [0, total).
    static std::vector<ByteRange> plan_parts(uint64_t total, uint64_t max_part);

    uint64_t effective_part_size() const;

private:
    network::SinkClient& sink_;
    core::Clock& clock_;
    SplitUploadOptions options_;
    UploadListener* listener_;
    const std::atomic<bool>* cancelled_;
    uint32_t total_retries_;

    std::vector<network::AssetInfo> existing_assets_;
    bool assets_listed_;

    core::TransferResult upload_known(ChunkedReader& reader, network::ReleaseId release,
                                      const std::string& asset_name, uint64_t total_size,
                                      std::vector<Part>& parts);
    core::TransferResult upload_unknown(ChunkedReader& reader, network::ReleaseId release,
                                        const std::string& asset_name, std::vector<Part>& parts);

    core::TransferResult stream_part_attempt(ChunkedReader& reader, network::ReleaseId release, Part& part,
                                             storage::PartSpool* spool, uint64_t& high_water,
                                             std::optional<std::string>& reference_checksum);
    core::TransferResult spool_part_attempt(storage::PartSpool& spool, network::ReleaseId release, Part& part);

    core::TransferResult fill_spool(ChunkedReader& reader, storage::PartSpool& spool, uint32_t part_index,
                                    uint64_t part_start, std::vector<uint8_t>& carry, bool& end_of_input,
                                    std::string& checksum);

    // A journaled part is reused only while its asset is still listed and the
    // source bytes still hash to the journaled checksum.
    bool try_resume_part(ChunkedReader& reader, network::ReleaseId release, Part& part);
    core::TransferResult hash_source_range(ChunkedReader& reader, const ByteRange& range, std::string& checksum);
    core::TransferResult prepare_asset_slot(network::ReleaseId release, const Part& part, bool retrying);
    core::TransferResult refresh_assets(network::ReleaseId release);

    // nullopt: sleep done, try again. Otherwise the terminal result.
    std::optional<core::TransferResult> backoff(BackoffState& state, const core::TransferResult& failure,
                                                uint32_t part_index, bool replayable);

    core::TransferResult finish_part(network::AssetUpload& upload, Part& part);

    bool is_cancelled() const { return cancelled_ && cancelled_->load(); }
    void report(uint64_t delta, uint32_t part_index, TransferPhase phase);
};

} // namespace assetrelay::transfer
