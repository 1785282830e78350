#include "assetrelay/transfer/transfer_session.hpp"
#include "assetrelay/core/logger.hpp"
#include "assetrelay/core/utils.hpp"
#include "assetrelay/storage/resume_journal.hpp"
#include <algorithm>
#include <filesystem>

namespace assetrelay::transfer {

using core::TransferError;
using core::TransferResult;

TransferSession::TransferSession(std::string session_id, TransferRequest request, network::SinkClient& sink,
                                 core::Clock& clock, storage::PipelineConfig config)
    : session_id_(std::move(session_id))
    , request_(std::move(request))
    , sink_(sink)
    , clock_(clock)
    , config_(std::move(config))
    , journal_(nullptr)
    , throttle_(clock, config_.min_progress_interval)
    , cancelled_(false) {
    state_.started_at = std::chrono::system_clock::now();
}

TransferSession::~TransferSession() {
    if (worker_.joinable()) {
        cancelled_ = true;
        worker_.join();
    }
}

void TransferSession::start() {
    worker_ = std::thread([this]() { run(); });
}

void TransferSession::run() {
    TransferResult result;
    try {
        result = execute();
    } catch (const std::exception& e) {
        LOG_ERROR("Transfer {} aborted by exception: {}", session_id_, e.what());
        result = TransferResult(TransferError::INVALID_STATE, e.what());
    }

    if (result) {
        finalize(TransferStatus::COMPLETED, result);
    } else if (result.error == TransferError::CANCELLED) {
        finalize(TransferStatus::CANCELLED, result);
    } else {
        finalize(TransferStatus::FAILED, result);
    }
}

void TransferSession::cancel() {
    if (!cancelled_.exchange(true)) {
        LOG_INFO("Cancellation requested for transfer {}", session_id_);
    }
}

void TransferSession::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    finished_cv_.wait(lock, [this]() { return is_terminal(state_.status); });
}

bool TransferSession::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return finished_cv_.wait_for(lock, timeout, [this]() { return is_terminal(state_.status); });
}

TransferState TransferSession::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

TransferStatus TransferSession::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.status;
}

bool TransferSession::is_finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_terminal(state_.status);
}

TransferResult TransferSession::execute() {
    if (cancelled_) {
        return TransferResult(TransferError::CANCELLED, "Transfer cancelled before start");
    }

    LOG_INFO("Transfer {} started: {} -> release {} as {}", session_id_,
             request_.label.empty() ? "(inline)" : request_.label,
             request_.target_release_id, request_.target_asset_name);

    set_status(TransferStatus::DOWNLOADING);
    throttle_.reset(request_.declared_size_bytes);

    std::shared_ptr<ChunkedReader> reader;
    std::string source_identity;
    auto result = resolve_reader(reader, source_identity);
    if (!result) {
        return result;
    }

    result = reader->open();
    if (!result) {
        LOG_ERROR("Cannot open {}: {}", reader->describe(), result.describe());
        return result;
    }

    if (cancelled_) {
        return TransferResult(TransferError::CANCELLED, "Transfer cancelled");
    }

    auto total = reader->total_bytes_known();
    if (total && request_.declared_size_bytes && *total != *request_.declared_size_bytes) {
        return TransferResult(TransferError::INVALID_REQUEST,
                              "Declared size " + std::to_string(*request_.declared_size_bytes) +
                              " does not match source size " + std::to_string(*total));
    }
    if (!total) {
        total = request_.declared_size_bytes;
    }

    if (total && *total > config_.max_file_size) {
        return TransferResult(TransferError::INVALID_REQUEST,
                              "File size " + core::utils::StringUtils::format_bytes(*total) +
                              " exceeds the limit of " +
                              core::utils::StringUtils::format_bytes(config_.max_file_size));
    }

    if (!reader->seekable() || !total) {
        auto spool_need = std::min(total.value_or(config_.max_asset_bytes), config_.max_asset_bytes);
        if (!config_.has_spool_space(spool_need)) {
            LOG_WARN("Spool directory {} may not have room for {}", config_.get_spool_directory().string(),
                     core::utils::StringUtils::format_bytes(spool_need));
        }
    }

    throttle_.set_total(total);

    SplitUploadOptions options;
    options.max_asset_bytes = config_.max_asset_bytes;
    options.max_total_bytes = config_.max_file_size;
    options.chunk_size = config_.chunk_size;
    options.retry = config_.retry;
    options.spool_directory = config_.get_spool_directory();
    options.replace_existing = request_.replace_existing;

    if (journal_ && journal_->is_open() && total && !source_identity.empty()) {
        auto part_size = config_.max_asset_bytes;
        if (sink_.max_asset_bytes() != 0) {
            part_size = std::min(part_size, sink_.max_asset_bytes());
        }
        options.journal = journal_;
        options.journal_key = storage::ResumeJournal::make_transfer_key(
            source_identity, request_.target_release_id, request_.target_asset_name, *total, part_size);
    }

    SplitUploader uploader(sink_, clock_, options);
    std::vector<Part> parts;
    result = uploader.upload(*reader, request_.target_release_id, request_.target_asset_name, total,
                             cancelled_, parts, this);
    return result;
}

TransferResult TransferSession::resolve_reader(std::shared_ptr<ChunkedReader>& reader,
                                               std::string& source_identity) {
    if (auto* inline_stream = std::get_if<InlineStream>(&request_.source)) {
        if (!inline_stream->reader) {
            return TransferResult(TransferError::INVALID_REQUEST, "Inline stream has no reader");
        }
        reader = inline_stream->reader;
        if (auto* file = dynamic_cast<FileReader*>(reader.get())) {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(file->get_path(), ec);
            source_identity = "file://" + (ec ? file->get_path() : absolute).string();
        }
        return TransferResult();
    }

    const auto& remote = std::get<RemoteUrl>(request_.source);
    if (remote.url.empty()) {
        return TransferResult(TransferError::INVALID_REQUEST, "Source URL is empty");
    }
    if (!reader_factory_) {
        return TransferResult(TransferError::INVALID_STATE, "No reader factory for URL sources");
    }

    std::unique_ptr<ChunkedReader> created = reader_factory_(remote.url);
    if (!created) {
        return TransferResult(TransferError::SOURCE_UNREACHABLE, "Cannot create a reader for " + remote.url);
    }
    reader = std::move(created);
    source_identity = remote.url;
    return TransferResult();
}

void TransferSession::set_status(TransferStatus status) {
    TransferStatus previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_.status) || state_.status == status) {
            return;
        }
        previous = state_.status;
        state_.status = status;
    }
    LOG_DEBUG("Transfer {}: {} -> {}", session_id_, to_string(previous), to_string(status));
}

void TransferSession::finalize(TransferStatus status, const TransferResult& result) {
    emit(throttle_.finish());

    if (status != TransferStatus::COMPLETED &&
        config_.partial_asset_policy == PartialAssetPolicy::DELETE_UPLOADED) {
        cleanup_partial_assets();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_.status)) {
            return;
        }

        state_.status = status;
        state_.finished_at = std::chrono::system_clock::now();

        if (status == TransferStatus::COMPLETED) {
            TransferOutcome outcome;
            for (const auto& part : state_.parts_completed) {
                outcome.asset_ids.push_back(part.sink_asset_id.value_or(0));
                outcome.part_sizes.push_back(part.range.length());
                outcome.total_bytes += part.range.length();
            }
            state_.result = outcome;
        } else {
            state_.last_error = result;
        }
    }
    finished_cv_.notify_all();

    if (status == TransferStatus::COMPLETED) {
        LOG_INFO("Transfer {} completed", session_id_);
    } else if (status == TransferStatus::CANCELLED) {
        LOG_WARN("Transfer {} cancelled", session_id_);
    } else {
        LOG_ERROR("Transfer {} failed: {}", session_id_, result.describe());
    }
}

void TransferSession::cleanup_partial_assets() {
    std::vector<Part> parts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        parts = state_.parts_completed;
    }

    for (const auto& part : parts) {
        if (part.resumed || !part.sink_asset_id) {
            continue;
        }
        LOG_INFO("Removing partial asset {} ({})", part.asset_name, *part.sink_asset_id);
        auto result = sink_.delete_asset(*part.sink_asset_id);
        if (!result) {
            LOG_WARN("Failed to remove partial asset {}: {}", part.asset_name, result.describe());
        }
    }
}

void TransferSession::emit(const ProgressEvent& event) {
    if (!callback_) {
        return;
    }
    try {
        callback_(event);
    } catch (const std::exception& e) {
        LOG_WARN("Progress callback for transfer {} threw: {}", session_id_, e.what());
    }
}

void TransferSession::on_parts_planned(uint32_t total_parts, bool final_count) {
    uint32_t current = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.total_parts_planned = total_parts;
        current = static_cast<uint32_t>(state_.parts_completed.size());
    }
    throttle_.set_part(current, total_parts);
    LOG_DEBUG("Transfer {}: {} part(s){}", session_id_, total_parts, final_count ? "" : " so far");
}

void TransferSession::on_part_started(const Part& part) {
    uint32_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = std::max(state_.total_parts_planned, part.index + 1);
    }
    throttle_.set_part(part.index, total);
}

void TransferSession::on_bytes(uint64_t delta, uint32_t part_index, TransferPhase phase) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.bytes_transferred_total += delta;
    }
    throttle_.set_phase(phase);
    if (auto event = throttle_.observe(delta)) {
        emit(*event);
    }
}

void TransferSession::on_upload_started(uint32_t part_index) {
    set_status(TransferStatus::UPLOADING);
    throttle_.set_phase(TransferPhase::UPLOADING);
}

void TransferSession::on_part_completed(const Part& part) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.parts_completed.push_back(part);
}

void TransferSession::on_retry(uint32_t part_index, uint32_t retry, std::chrono::milliseconds delay,
                               const TransferResult& cause) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.total_retries++;
}

}
