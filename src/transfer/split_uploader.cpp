#include "assetrelay/transfer/split_uploader.hpp"
#include "assetrelay/core/logger.hpp"
#include "assetrelay/core/utils.hpp"
#include "assetrelay/crypto/hash.hpp"
#include "assetrelay/storage/part_spool.hpp"
#include "assetrelay/storage/resume_journal.hpp"
#include <algorithm>
#include <stdexcept>

namespace assetrelay::transfer {

using core::TransferError;
using core::TransferResult;

namespace {

bool is_sink_error(TransferError error) {
    return error == TransferError::SINK_UNAVAILABLE ||
           error == TransferError::SINK_REJECTED ||
           error == TransferError::SINK_QUOTA_EXCEEDED;
}

TransferResult cancelled_result() {
    return TransferResult(TransferError::CANCELLED, "Transfer cancelled");
}

}

SplitUploader::SplitUploader(network::SinkClient& sink, core::Clock& clock, SplitUploadOptions options)
    : sink_(sink)
    , clock_(clock)
    , options_(std::move(options))
    , listener_(nullptr)
    , cancelled_(nullptr)
    , total_retries_(0)
    , assets_listed_(false) {
    if (options_.spool_directory.empty()) {
        options_.spool_directory = core::utils::FileUtils::get_temp_dir();
    }
}

SplitUploader::~SplitUploader() = default;

std::vector<ByteRange> SplitUploader::plan_parts(uint64_t total, uint64_t max_part) {
    if (max_part == 0) {
        throw std::invalid_argument("part size must be positive");
    }

    std::vector<ByteRange> ranges;
    if (total == 0) {
        ranges.push_back(ByteRange{0, 0});
        return ranges;
    }

    ranges.reserve(static_cast<size_t>((total + max_part - 1) / max_part));
    for (uint64_t start = 0; start < total; start += max_part) {
        ranges.push_back(ByteRange{start, std::min(total, start + max_part)});
    }
    return ranges;
}

uint64_t SplitUploader::effective_part_size() const {
    auto sink_limit = sink_.max_asset_bytes();
    if (sink_limit == 0) {
        return options_.max_asset_bytes;
    }
    return std::min(options_.max_asset_bytes, sink_limit);
}

TransferResult SplitUploader::upload(ChunkedReader& reader, network::ReleaseId release,
                                     const std::string& asset_name, std::optional<uint64_t> total_size,
                                     const std::atomic<bool>& cancelled, std::vector<Part>& parts,
                                     UploadListener* listener) {
    listener_ = listener;
    cancelled_ = &cancelled;
    total_retries_ = 0;
    assets_listed_ = false;
    existing_assets_.clear();

    if (options_.chunk_size == 0 || effective_part_size() == 0) {
        return TransferResult(TransferError::INVALID_REQUEST, "Chunk and part sizes must be positive");
    }
    if (asset_name.empty()) {
        return TransferResult(TransferError::INVALID_REQUEST, "Target asset name is empty");
    }

    if (total_size) {
        if (*total_size > options_.max_total_bytes) {
            return TransferResult(TransferError::INVALID_REQUEST,
                                  "Source size " + core::utils::StringUtils::format_bytes(*total_size) +
                                  " exceeds the limit of " +
                                  core::utils::StringUtils::format_bytes(options_.max_total_bytes));
        }
        return upload_known(reader, release, asset_name, *total_size, parts);
    }
    return upload_unknown(reader, release, asset_name, parts);
}

TransferResult SplitUploader::upload_known(ChunkedReader& reader, network::ReleaseId release,
                                           const std::string& asset_name, uint64_t total_size,
                                           std::vector<Part>& parts) {
    auto ranges = plan_parts(total_size, effective_part_size());
    auto total_parts = static_cast<uint32_t>(ranges.size());

    LOG_INFO("Uploading {} ({}) as {} part(s)", asset_name,
             core::utils::StringUtils::format_bytes(total_size), total_parts);
    if (listener_) {
        listener_->on_parts_planned(total_parts, true);
    }

    bool use_journal = options_.journal && options_.journal->is_open() &&
                       !options_.journal_key.empty() && reader.seekable();

    // Non-seekable sources keep the consumed bytes of the current part so a
    // retry can replay them before continuing from the live stream.
    std::unique_ptr<storage::PartSpool> spool;
    if (!reader.seekable()) {
        spool = std::make_unique<storage::PartSpool>(options_.spool_directory);
        auto result = spool->open();
        if (!result) {
            return result;
        }
    }

    for (uint32_t i = 0; i < total_parts; ++i) {
        if (is_cancelled()) {
            return cancelled_result().at_part(i);
        }

        Part part;
        part.index = i;
        part.range = ranges[i];
        part.asset_name = part_asset_name(asset_name, i, total_parts);

        if (listener_) {
            listener_->on_part_started(part);
        }

        if (use_journal && try_resume_part(reader, release, part)) {
            report(part.range.length(), i, TransferPhase::UPLOADING);
            if (listener_) {
                listener_->on_part_completed(part);
            }
            parts.push_back(part);
            continue;
        }

        if (spool) {
            auto result = spool->reset();
            if (!result) {
                return result.at_part(i);
            }
        }

        uint64_t high_water = 0;
        std::optional<std::string> reference_checksum;
        auto state = options_.retry.initial();

        while (true) {
            part.attempts++;
            auto result = stream_part_attempt(reader, release, part, spool.get(), high_water, reference_checksum);
            if (result) {
                break;
            }
            if (result.error == TransferError::CANCELLED) {
                return result.at_part(i);
            }
            if (auto terminal = backoff(state, result, i, reader.seekable())) {
                return *terminal;
            }
        }

        LOG_INFO("Part {}/{} {} uploaded ({} bytes, asset {})", i + 1, total_parts, part.asset_name,
                 part.range.length(), part.sink_asset_id.value_or(0));

        if (use_journal) {
            storage::CompletedPartRecord record;
            record.transfer_key = options_.journal_key;
            record.part_index = i;
            record.range_start = part.range.start;
            record.range_end = part.range.end;
            record.asset_name = part.asset_name;
            record.asset_id = part.sink_asset_id.value_or(0);
            record.checksum = part.checksum;
            record.completed_at = std::chrono::system_clock::now();
            if (!options_.journal->record_part(record)) {
                LOG_WARN("Could not record part {} in the resume journal", i);
            }
        }

        if (listener_) {
            listener_->on_part_completed(part);
        }
        parts.push_back(part);
    }

    if (use_journal) {
        options_.journal->clear_transfer(options_.journal_key);
    }
    return TransferResult();
}

TransferResult SplitUploader::upload_unknown(ChunkedReader& reader, network::ReleaseId release,
                                             const std::string& asset_name, std::vector<Part>& parts) {
    LOG_INFO("Uploading {} from a source of unknown length", asset_name);

    storage::PartSpool spool(options_.spool_directory);
    auto result = spool.open();
    if (!result) {
        return result;
    }

    std::vector<uint8_t> carry;
    bool end_of_input = false;
    uint64_t offset = 0;
    uint32_t index = 0;

    while (true) {
        if (is_cancelled()) {
            return cancelled_result().at_part(index);
        }

        Part part;
        part.index = index;
        part.range.start = offset;

        if (listener_) {
            listener_->on_part_started(part);
        }

        result = spool.reset();
        if (!result) {
            return result.at_part(index);
        }

        std::string checksum;
        result = fill_spool(reader, spool, index, offset, carry, end_of_input, checksum);
        if (!result) {
            return result;
        }

        part.range.end = offset + spool.size();
        part.checksum = checksum;

        // A look-ahead chunk in hand means at least one more part follows
        bool last = end_of_input;
        uint32_t known_parts = last ? index + 1 : index + 2;
        part.asset_name = part_asset_name(asset_name, index, known_parts);

        if (listener_) {
            listener_->on_parts_planned(known_parts, last);
        }

        auto state = options_.retry.initial();
        while (true) {
            part.attempts++;
            result = spool_part_attempt(spool, release, part);
            if (result) {
                break;
            }
            if (result.error == TransferError::CANCELLED) {
                return result.at_part(index);
            }
            if (auto terminal = backoff(state, result, index, true)) {
                return *terminal;
            }
        }

        LOG_INFO("Part {} {} uploaded ({} bytes, asset {})", index + 1, part.asset_name,
                 part.range.length(), part.sink_asset_id.value_or(0));

        if (listener_) {
            listener_->on_part_completed(part);
        }
        parts.push_back(part);

        offset = part.range.end;
        index++;
        if (last) {
            break;
        }
    }

    return TransferResult();
}

TransferResult SplitUploader::stream_part_attempt(ChunkedReader& reader, network::ReleaseId release, Part& part,
                                                  storage::PartSpool* spool, uint64_t& high_water,
                                                  std::optional<std::string>& reference_checksum) {
    if (is_cancelled()) {
        return cancelled_result();
    }

    auto result = prepare_asset_slot(release, part, part.attempts > 1);
    if (!result) {
        return result;
    }

    if (spool) {
        result = spool->rewind(0);
    } else if (reader.bytes_read() != part.range.start) {
        LOG_DEBUG("Repositioning {} to offset {}", reader.describe(), part.range.start);
        result = reader.seek(part.range.start);
    }
    if (!result) {
        return result;
    }

    if (is_cancelled()) {
        return cancelled_result();
    }

    const uint64_t length = part.range.length();
    std::unique_ptr<network::AssetUpload> upload;
    result = sink_.begin_upload(release, part.asset_name, length, upload);
    if (!result) {
        return result;
    }
    if (listener_) {
        listener_->on_upload_started(part.index);
    }

    crypto::ContentHasher hasher;
    std::vector<uint8_t> buffer;
    uint64_t offset = 0;

    auto fail = [&](TransferResult failure) {
        upload->abort();
        return failure;
    };

    auto forward = [&]() -> TransferResult {
        auto written = upload->write(buffer);
        if (!written) {
            return written;
        }
        hasher.update(buffer);
        offset += buffer.size();
        if (offset > high_water) {
            report(offset - high_water, part.index, TransferPhase::UPLOADING);
            high_water = offset;
        }
        return TransferResult();
    };

    if (spool) {
        while (true) {
            if (is_cancelled()) {
                return fail(cancelled_result());
            }
            result = spool->read(options_.chunk_size, buffer);
            if (!result) {
                return fail(result);
            }
            if (buffer.empty()) {
                break;
            }
            result = forward();
            if (!result) {
                return fail(result);
            }
        }
    }

    while (offset < length) {
        if (is_cancelled()) {
            return fail(cancelled_result());
        }

        auto want = static_cast<size_t>(std::min<uint64_t>(options_.chunk_size, length - offset));
        result = reader.next_chunk(want, buffer);
        if (!result) {
            return fail(result);
        }
        if (buffer.empty()) {
            return fail(TransferResult(TransferError::SOURCE_TRUNCATED,
                                       reader.describe() + " ended at offset " +
                                       std::to_string(part.range.start + offset) + ", expected " +
                                       std::to_string(part.range.end)));
        }

        if (spool) {
            result = spool->append(buffer);
            if (!result) {
                return fail(result);
            }
        }

        result = forward();
        if (!result) {
            return fail(result);
        }
    }

    auto checksum = crypto::hash_utils::hash_to_hex(hasher.finalize());
    if (reference_checksum && *reference_checksum != checksum) {
        return fail(TransferResult(TransferError::SOURCE_CHANGED,
                                   "Content of " + part.asset_name + " differs from an earlier read"));
    }
    reference_checksum = checksum;
    part.checksum = checksum;

    return finish_part(*upload, part);
}

TransferResult SplitUploader::spool_part_attempt(storage::PartSpool& spool, network::ReleaseId release, Part& part) {
    if (is_cancelled()) {
        return cancelled_result();
    }

    auto result = prepare_asset_slot(release, part, part.attempts > 1);
    if (!result) {
        return result;
    }

    result = spool.rewind(0);
    if (!result) {
        return result;
    }

    if (is_cancelled()) {
        return cancelled_result();
    }

    std::unique_ptr<network::AssetUpload> upload;
    result = sink_.begin_upload(release, part.asset_name, spool.size(), upload);
    if (!result) {
        return result;
    }
    if (listener_) {
        listener_->on_upload_started(part.index);
    }

    std::vector<uint8_t> buffer;
    while (true) {
        if (is_cancelled()) {
            upload->abort();
            return cancelled_result();
        }

        result = spool.read(options_.chunk_size, buffer);
        if (!result) {
            upload->abort();
            return result;
        }
        if (buffer.empty()) {
            break;
        }

        result = upload->write(buffer);
        if (!result) {
            upload->abort();
            return result;
        }
        report(0, part.index, TransferPhase::UPLOADING);
    }

    return finish_part(*upload, part);
}

TransferResult SplitUploader::fill_spool(ChunkedReader& reader, storage::PartSpool& spool, uint32_t part_index,
                                         uint64_t part_start, std::vector<uint8_t>& carry, bool& end_of_input,
                                         std::string& checksum) {
    const uint64_t part_size = effective_part_size();
    crypto::ContentHasher hasher;
    std::vector<uint8_t> buffer;
    auto state = options_.retry.initial();

    if (!carry.empty()) {
        auto result = spool.append(carry);
        if (!result) {
            return result.at_part(part_index);
        }
        hasher.update(carry);
        carry.clear();
    }

    auto read_chunk = [&](size_t want) -> TransferResult {
        auto result = reader.next_chunk(want, buffer);
        while (!result) {
            if (auto terminal = backoff(state, result, part_index, reader.seekable())) {
                return *terminal;
            }
            result = reader.seek(part_start + spool.size());
            if (result) {
                result = reader.next_chunk(want, buffer);
            }
        }
        return result;
    };

    auto over_limit = [&](uint64_t pending) {
        return part_start + spool.size() + pending > options_.max_total_bytes;
    };

    while (spool.size() < part_size) {
        if (is_cancelled()) {
            return cancelled_result().at_part(part_index);
        }

        auto want = static_cast<size_t>(std::min<uint64_t>(options_.chunk_size, part_size - spool.size()));
        auto result = read_chunk(want);
        if (!result) {
            return result;
        }
        if (buffer.empty()) {
            end_of_input = true;
            break;
        }
        if (over_limit(buffer.size())) {
            return TransferResult(TransferError::INVALID_REQUEST,
                                  "Source exceeds the limit of " +
                                  core::utils::StringUtils::format_bytes(options_.max_total_bytes))
                .at_part(part_index);
        }

        result = spool.append(buffer);
        if (!result) {
            return result.at_part(part_index);
        }
        hasher.update(buffer);
        report(buffer.size(), part_index, TransferPhase::DOWNLOADING);
    }

    if (!end_of_input) {
        if (is_cancelled()) {
            return cancelled_result().at_part(part_index);
        }

        auto result = read_chunk(options_.chunk_size);
        if (!result) {
            return result;
        }
        if (buffer.empty()) {
            end_of_input = true;
        } else {
            if (over_limit(buffer.size())) {
                return TransferResult(TransferError::INVALID_REQUEST,
                                      "Source exceeds the limit of " +
                                      core::utils::StringUtils::format_bytes(options_.max_total_bytes))
                    .at_part(part_index);
            }
            carry = buffer;
            report(carry.size(), part_index, TransferPhase::DOWNLOADING);
        }
    }

    checksum = crypto::hash_utils::hash_to_hex(hasher.finalize());
    return TransferResult();
}

bool SplitUploader::try_resume_part(ChunkedReader& reader, network::ReleaseId release, Part& part) {
    auto record = options_.journal->find_part(options_.journal_key, part.index);
    if (!record) {
        return false;
    }
    if (record->range_start != part.range.start || record->range_end != part.range.end ||
        record->asset_name != part.asset_name) {
        return false;
    }

    if (!assets_listed_) {
        auto result = refresh_assets(release);
        if (!result) {
            LOG_WARN("Cannot verify journaled part {}: {}", part.index, result.describe());
            return false;
        }
    }

    auto it = std::find_if(existing_assets_.begin(), existing_assets_.end(),
                           [&](const network::AssetInfo& asset) {
                               return asset.id == record->asset_id && asset.name == part.asset_name;
                           });
    if (it == existing_assets_.end() || it->size != part.range.length()) {
        LOG_INFO("Journaled part {} is no longer present in the release; uploading again", part.index);
        return false;
    }

    std::string checksum;
    auto hashed = hash_source_range(reader, part.range, checksum);
    if (!hashed) {
        LOG_WARN("Cannot verify journaled part {}: {}", part.index, hashed.describe());
        return false;
    }
    if (checksum != record->checksum) {
        LOG_INFO("Source bytes of part {} changed since it was uploaded; replacing asset {}",
                 part.index + 1, it->id);
        auto removed = sink_.delete_asset(it->id);
        if (!removed) {
            LOG_WARN("Failed to delete stale asset {}: {}", it->id, removed.describe());
        } else {
            existing_assets_.erase(it);
        }
        return false;
    }

    part.sink_asset_id = it->id;
    part.download_url = it->download_url;
    part.checksum = checksum;
    part.resumed = true;
    LOG_INFO("Part {} ({}) already uploaded as asset {}, skipping", part.index + 1, part.asset_name, it->id);
    return true;
}

TransferResult SplitUploader::hash_source_range(ChunkedReader& reader, const ByteRange& range,
                                                std::string& checksum) {
    auto result = reader.seek(range.start);
    if (!result) {
        return result;
    }

    crypto::ContentHasher hasher;
    std::vector<uint8_t> buffer;
    uint64_t remaining = range.length();
    while (remaining > 0) {
        if (is_cancelled()) {
            return cancelled_result();
        }
        auto want = static_cast<size_t>(std::min<uint64_t>(remaining, options_.chunk_size));
        result = reader.next_chunk(want, buffer);
        if (!result) {
            return result;
        }
        if (buffer.empty()) {
            return TransferResult(TransferError::SOURCE_TRUNCATED,
                                  reader.describe() + " ended before offset " + std::to_string(range.end));
        }
        hasher.update(buffer);
        remaining -= buffer.size();
    }

    checksum = crypto::hash_utils::hash_to_hex(hasher.finalize());
    return TransferResult();
}

TransferResult SplitUploader::prepare_asset_slot(network::ReleaseId release, const Part& part, bool retrying) {
    if (!assets_listed_ || retrying) {
        auto result = refresh_assets(release);
        if (!result) {
            return result;
        }
    }

    for (auto it = existing_assets_.begin(); it != existing_assets_.end();) {
        if (it->name != part.asset_name) {
            ++it;
            continue;
        }

        if (!retrying && !options_.replace_existing) {
            return TransferResult(TransferError::SINK_REJECTED,
                                  "Asset " + part.asset_name + " already exists in the release");
        }

        if (is_cancelled()) {
            return cancelled_result();
        }

        LOG_INFO("Deleting existing asset {} ({})", it->name, it->id);
        auto result = sink_.delete_asset(it->id);
        if (!result) {
            return result;
        }
        it = existing_assets_.erase(it);
    }

    return TransferResult();
}

TransferResult SplitUploader::refresh_assets(network::ReleaseId release) {
    std::vector<network::AssetInfo> assets;
    auto result = sink_.list_assets(release, assets);
    if (!result) {
        return result;
    }
    existing_assets_ = std::move(assets);
    assets_listed_ = true;
    return TransferResult();
}

std::optional<TransferResult> SplitUploader::backoff(BackoffState& state, const TransferResult& failure,
                                                     uint32_t part_index, bool replayable) {
    TransferResult terminal = failure;
    terminal.at_part(part_index);

    bool sink_side = is_sink_error(failure.error);
    if (!failure.transient() || (!sink_side && !replayable)) {
        LOG_ERROR("Part {} failed: {}", part_index, failure.describe());
        return terminal;
    }

    auto next = options_.retry.next(state);
    if (!next) {
        LOG_ERROR("Part {} failed after {} retries: {}", part_index, state.attempt, failure.describe());
        if (sink_side) {
            TransferResult exhausted(TransferError::PART_UPLOAD_FAILED, failure.message);
            exhausted.cause = failure.error;
            exhausted.http_status = failure.http_status;
            exhausted.at_part(part_index);
            return exhausted;
        }
        return terminal;
    }

    state = *next;
    total_retries_++;

    LOG_WARN("Part {} attempt failed ({}); retry {}/{} in {}", part_index, failure.describe(), state.attempt,
             options_.retry.max_retries, core::utils::StringUtils::format_duration(state.delay));
    if (listener_) {
        listener_->on_retry(part_index, state.attempt, state.delay, failure);
    }

    if (!clock_.sleep_for(state.delay, cancelled_) || is_cancelled()) {
        return cancelled_result().at_part(part_index);
    }
    return std::nullopt;
}

TransferResult SplitUploader::finish_part(network::AssetUpload& upload, Part& part) {
    network::AssetInfo created;
    auto result = upload.finish(created);
    if (!result) {
        return result;
    }

    if (created.size != part.range.length()) {
        LOG_WARN("Sink reports {} bytes for {}, expected {}", created.size, part.asset_name, part.range.length());
        auto removed = sink_.delete_asset(created.id);
        if (!removed) {
            LOG_WARN("Could not remove mismatched asset {}: {}", created.id, removed.describe());
        }
        return TransferResult(TransferError::SINK_UNAVAILABLE,
                              "Sink stored " + std::to_string(created.size) + " of " +
                              std::to_string(part.range.length()) + " bytes for " + part.asset_name);
    }

    part.sink_asset_id = created.id;
    part.download_url = created.download_url;
    existing_assets_.push_back(created);
    return TransferResult();
}

void SplitUploader::report(uint64_t delta, uint32_t part_index, TransferPhase phase) {
    if (listener_) {
        listener_->on_bytes(delta, part_index, phase);
    }
}

}
