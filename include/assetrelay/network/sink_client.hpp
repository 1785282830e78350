#pragma once

#include "assetrelay/core/errors.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace assetrelay::network {

using AssetId = uint64_t;
using ReleaseId = uint64_t;

struct AssetInfo {
    AssetId id = 0;
    std::string name;
    uint64_t size = 0;
    std::string download_url;
    std::string state;
};

// One streamed asset creation. The declared size passed to begin_upload()
// must be written exactly before finish().
class AssetUpload {
public:
    virtual ~AssetUpload() = default;

    virtual core::TransferResult write(std::span<const uint8_t> data) = 0;
    virtual core::TransferResult finish(AssetInfo& created) = 0;

    // Drops the upload without completing it. Safe to call more than once.
    virtual void abort() = 0;
};

// Release-asset store with a hard per-asset size ceiling.
class SinkClient {
public:
    virtual ~SinkClient() = default;

    virtual uint64_t max_asset_bytes() const = 0;

    virtual core::TransferResult list_assets(ReleaseId release, std::vector<AssetInfo>& assets) = 0;
    virtual core::TransferResult delete_asset(AssetId asset) = 0;

    virtual core::TransferResult begin_upload(ReleaseId release, const std::string& name, uint64_t size,
                                              std::unique_ptr<AssetUpload>& upload) = 0;
};

} // namespace assetrelay::network
