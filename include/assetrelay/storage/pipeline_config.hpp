#pragma once

#include "assetrelay/core/config.hpp"
#include "assetrelay/transfer/retry_policy.hpp"
#include "assetrelay/transfer/transfer_types.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace assetrelay::storage {

struct PipelineConfig {
    uint64_t max_asset_bytes = 2ULL * 1024 * 1024 * 1024; // 2GB per release asset
    uint64_t max_file_size = 4ULL * 1024 * 1024 * 1024; // 4GB per transfer
    uint32_t chunk_size = 1024 * 1024; // 1MB
    std::chrono::milliseconds min_progress_interval{1000};
    std::chrono::seconds idle_timeout{60};
    transfer::RetryPolicy retry;

    std::filesystem::path spool_directory;
    std::filesystem::path resume_database;
    transfer::PartialAssetPolicy partial_asset_policy = transfer::PartialAssetPolicy::KEEP;

    PipelineConfig() = default;

    // Reads the pipeline keys; missing keys keep the defaults above.
    static PipelineConfig from_config(const core::Config& config);

    bool validate() const;

    // Reason validate() fails, if it does.
    std::optional<std::string> validation_error() const;

    std::filesystem::path get_spool_directory() const;

    bool has_spool_space(uint64_t required_bytes) const;
};

} // namespace assetrelay::storage
