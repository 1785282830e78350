#include "assetrelay/storage/pipeline_config.hpp"
#include "assetrelay/core/utils.hpp"

namespace assetrelay::storage {

PipelineConfig PipelineConfig::from_config(const core::Config& config) {
    PipelineConfig result;

    result.max_asset_bytes = config.get_uint64("sink.max_asset_bytes", result.max_asset_bytes);
    result.max_file_size = config.get_uint64("transfer.max_file_size", result.max_file_size);
    result.chunk_size = static_cast<uint32_t>(config.get_uint64("transfer.chunk_size", result.chunk_size));
    result.min_progress_interval = std::chrono::milliseconds(
        config.get_uint64("progress.min_interval_ms", result.min_progress_interval.count()));
    result.idle_timeout = std::chrono::seconds(
        config.get_uint64("network.idle_timeout_s", result.idle_timeout.count()));

    result.retry.max_retries = static_cast<uint32_t>(
        config.get_uint64("retry.max_retries", result.retry.max_retries));
    result.retry.base_delay = std::chrono::milliseconds(
        config.get_uint64("retry.base_delay_ms", result.retry.base_delay.count()));
    result.retry.factor = config.get_double("retry.factor", result.retry.factor);
    result.retry.max_delay = std::chrono::milliseconds(
        config.get_uint64("retry.max_delay_ms", result.retry.max_delay.count()));

    auto spool = config.get_string("transfer.spool_directory");
    if (!spool.empty()) {
        result.spool_directory = core::utils::FileUtils::expand_user(spool);
    }
    auto journal = config.get_string("resume.database");
    if (!journal.empty()) {
        result.resume_database = core::utils::FileUtils::expand_user(journal);
    }
    if (config.get_bool("transfer.cleanup_on_failure", false)) {
        result.partial_asset_policy = transfer::PartialAssetPolicy::DELETE_UPLOADED;
    }

    return result;
}

bool PipelineConfig::validate() const {
    return !validation_error().has_value();
}

std::optional<std::string> PipelineConfig::validation_error() const {
    if (max_asset_bytes == 0) {
        return "sink.max_asset_bytes must be positive";
    }
    if (chunk_size == 0) {
        return "transfer.chunk_size must be positive";
    }
    if (chunk_size > max_asset_bytes) {
        return "transfer.chunk_size must not exceed sink.max_asset_bytes";
    }
    if (max_file_size == 0) {
        return "transfer.max_file_size must be positive";
    }
    if (retry.factor < 1.0) {
        return "retry.factor must be at least 1";
    }
    if (retry.base_delay > retry.max_delay) {
        return "retry.base_delay_ms must not exceed retry.max_delay_ms";
    }
    if (idle_timeout.count() == 0) {
        return "network.idle_timeout_s must be positive";
    }
    return std::nullopt;
}

std::filesystem::path PipelineConfig::get_spool_directory() const {
    if (spool_directory.empty()) {
        return core::utils::FileUtils::get_temp_dir();
    }
    return spool_directory;
}

bool PipelineConfig::has_spool_space(uint64_t required_bytes) const {
    std::error_code ec;
    auto dir = get_spool_directory();
    auto existing = dir;
    while (!existing.empty() && !std::filesystem::exists(existing, ec)) {
        existing = existing.parent_path();
    }
    if (existing.empty()) {
        return false;
    }

    auto space_info = std::filesystem::space(existing, ec);
    if (ec) {
        return false;
    }
    return space_info.available > required_bytes;
}

}
