#pragma once

#include "assetrelay/network/sink_client.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace assetrelay::test {

// In-memory release store. Failures are injected per asset name and attempt
// number (1-based count of begin_upload calls for that name).
class FakeSink : public network::SinkClient {
public:
    struct StoredAsset {
        network::AssetInfo info;
        std::vector<uint8_t> data;
    };

    struct Failure {
        core::TransferResult result;
        // Bytes accepted before the failure is reported from write().
        // nullopt fails begin_upload itself.
        std::optional<uint64_t> after_bytes;
    };

    explicit FakeSink(uint64_t max_asset_bytes) : max_asset_bytes_(max_asset_bytes) {}

    uint64_t max_asset_bytes() const override { return max_asset_bytes_; }

    core::TransferResult list_assets(network::ReleaseId release, std::vector<network::AssetInfo>& assets) override {
        std::lock_guard<std::mutex> lock(mutex_);
        list_calls_++;
        if (list_failures_ > 0) {
            list_failures_--;
            return core::TransferResult(core::TransferError::SINK_UNAVAILABLE, "listing unavailable")
                .with_status(503);
        }
        assets.clear();
        for (const auto& [id, asset] : assets_) {
            if (asset.info.state == "uploaded" && release_of_.at(id) == release) {
                assets.push_back(asset.info);
            }
        }
        return core::TransferResult();
    }

    core::TransferResult delete_asset(network::AssetId asset) override {
        std::lock_guard<std::mutex> lock(mutex_);
        deleted_.push_back(asset);
        assets_.erase(asset);
        release_of_.erase(asset);
        return core::TransferResult();
    }

    core::TransferResult begin_upload(network::ReleaseId release, const std::string& name, uint64_t size,
                                      std::unique_ptr<network::AssetUpload>& upload) override;

    // Upload attempt `attempt` of asset `name` fails with `failure`.
    void fail_attempt(const std::string& name, uint32_t attempt, Failure failure) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[{name, attempt}] = std::move(failure);
    }

    void fail_listings(uint32_t count) {
        std::lock_guard<std::mutex> lock(mutex_);
        list_failures_ = count;
    }

    // Reported size of the next created asset is off by `delta` bytes.
    void misreport_next_size(int64_t delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_misreport_ = delta;
    }

    // Called with (name, bytes written so far) after every write.
    void set_write_hook(std::function<void(const std::string&, uint64_t)> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_hook_ = std::move(hook);
    }

    network::AssetId add_existing(network::ReleaseId release, const std::string& name, std::vector<uint8_t> data) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        StoredAsset stored;
        stored.info = network::AssetInfo{id, name, data.size(), download_url(name), "uploaded"};
        stored.data = std::move(data);
        assets_[id] = std::move(stored);
        release_of_[id] = release;
        return id;
    }

    std::optional<StoredAsset> find(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, asset] : assets_) {
            if (asset.info.name == name && asset.info.state == "uploaded") {
                return asset;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> asset_names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [id, asset] : assets_) {
            if (asset.info.state == "uploaded") {
                names.push_back(asset.info.name);
            }
        }
        return names;
    }

    uint32_t attempts_for(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = attempts_.find(name);
        return it == attempts_.end() ? 0 : it->second;
    }

    std::vector<network::AssetId> get_deleted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return deleted_;
    }

    uint32_t get_list_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return list_calls_;
    }

    uint32_t get_aborted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return aborted_;
    }

private:
    friend class FakeUpload;

    mutable std::mutex mutex_;
    uint64_t max_asset_bytes_;
    network::AssetId next_id_ = 1000;
    std::map<network::AssetId, StoredAsset> assets_;
    std::map<network::AssetId, network::ReleaseId> release_of_;
    std::map<std::pair<std::string, uint32_t>, Failure> failures_;
    std::map<std::string, uint32_t> attempts_;
    std::vector<network::AssetId> deleted_;
    std::function<void(const std::string&, uint64_t)> write_hook_;
    std::optional<int64_t> size_misreport_;
    uint32_t list_failures_ = 0;
    uint32_t list_calls_ = 0;
    uint32_t aborted_ = 0;

    static std::string download_url(const std::string& name) {
        return "https://downloads.example/" + name;
    }
};

class FakeUpload : public network::AssetUpload {
public:
    FakeUpload(FakeSink& sink, network::ReleaseId release, std::string name, uint64_t size,
               std::optional<FakeSink::Failure> failure)
        : sink_(sink), release_(release), name_(std::move(name)), size_(size), failure_(std::move(failure)) {}

    core::TransferResult write(std::span<const uint8_t> data) override {
        if (closed_) {
            return core::TransferResult(core::TransferError::INVALID_STATE, "upload already closed");
        }
        if (failure_ && failure_->after_bytes && data_.size() + data.size() > *failure_->after_bytes) {
            closed_ = true;
            return failure_->result;
        }
        if (data_.size() + data.size() > size_) {
            closed_ = true;
            return core::TransferResult(core::TransferError::SINK_REJECTED, "body longer than declared")
                .with_status(400);
        }
        data_.insert(data_.end(), data.begin(), data.end());

        std::function<void(const std::string&, uint64_t)> hook;
        {
            std::lock_guard<std::mutex> lock(sink_.mutex_);
            hook = sink_.write_hook_;
        }
        if (hook) {
            hook(name_, data_.size());
        }
        return core::TransferResult();
    }

    core::TransferResult finish(network::AssetInfo& created) override {
        if (closed_) {
            return core::TransferResult(core::TransferError::INVALID_STATE, "upload already closed");
        }
        closed_ = true;
        if (data_.size() != size_) {
            return core::TransferResult(core::TransferError::SINK_REJECTED, "body shorter than declared")
                .with_status(400);
        }

        std::lock_guard<std::mutex> lock(sink_.mutex_);
        auto id = sink_.next_id_++;
        FakeSink::StoredAsset stored;
        stored.info = network::AssetInfo{id, name_, data_.size(), FakeSink::download_url(name_), "uploaded"};
        if (sink_.size_misreport_) {
            stored.info.size = static_cast<uint64_t>(static_cast<int64_t>(stored.info.size) + *sink_.size_misreport_);
            sink_.size_misreport_.reset();
        }
        stored.data = std::move(data_);
        created = stored.info;
        sink_.assets_[id] = std::move(stored);
        sink_.release_of_[id] = release_;
        finished_ = true;
        return core::TransferResult();
    }

    void abort() override {
        if (!finished_ && !aborted_) {
            aborted_ = true;
            closed_ = true;
            std::lock_guard<std::mutex> lock(sink_.mutex_);
            sink_.aborted_++;
        }
    }

private:
    FakeSink& sink_;
    network::ReleaseId release_;
    std::string name_;
    uint64_t size_;
    std::optional<FakeSink::Failure> failure_;
    std::vector<uint8_t> data_;
    bool closed_ = false;
    bool finished_ = false;
    bool aborted_ = false;
};

inline core::TransferResult FakeSink::begin_upload(network::ReleaseId release, const std::string& name,
                                                   uint64_t size, std::unique_ptr<network::AssetUpload>& upload) {
    std::optional<Failure> failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto attempt = ++attempts_[name];
        auto it = failures_.find({name, attempt});
        if (it != failures_.end()) {
            failure = it->second;
        }
        if (size > max_asset_bytes_) {
            return core::TransferResult(core::TransferError::SINK_QUOTA_EXCEEDED, "asset too large")
                .with_status(422);
        }
    }

    if (failure && !failure->after_bytes) {
        return failure->result;
    }
    upload = std::make_unique<FakeUpload>(*this, release, name, size, failure);
    return core::TransferResult();
}

} // namespace assetrelay::test
