#pragma once

#include "assetrelay/core/config.hpp"
#include "assetrelay/network/http_connection.hpp"
#include "assetrelay/network/sink_client.hpp"
#include "assetrelay/network/url.hpp"
#include <optional>
#include <string>
#include <vector>

namespace assetrelay::network {

struct GithubSinkOptions {
    std::string api_url = "https://api.github.com";
    std::string upload_url = "https://uploads.github.com";
    std::string token;
    std::string repo;  // "owner/name"
    uint64_t max_asset_bytes = 2ULL * 1024 * 1024 * 1024;
    HttpOptions http;

    static GithubSinkOptions from_config(const core::Config& config);
};

struct ReleaseInfo {
    ReleaseId id = 0;
    std::string tag_name;
    std::string name;
};

// Maps a non-2xx sink reply to an error kind: 5xx, 408 and 429 are
// SINK_UNAVAILABLE; 413 and size/quota rejections are SINK_QUOTA_EXCEEDED;
// any other 4xx is SINK_REJECTED.
core::TransferResult classify_sink_status(int status, const std::string& body);

// SinkClient over the GitHub releases REST API.
class GithubReleaseSink : public SinkClient {
public:
    explicit GithubReleaseSink(GithubSinkOptions options);

    uint64_t max_asset_bytes() const override { return options_.max_asset_bytes; }

    core::TransferResult resolve_release(const std::string& tag, ReleaseInfo& release);

    core::TransferResult list_assets(ReleaseId release, std::vector<AssetInfo>& assets) override;
    core::TransferResult delete_asset(AssetId asset) override;
    core::TransferResult begin_upload(ReleaseId release, const std::string& name, uint64_t size,
                                      std::unique_ptr<AssetUpload>& upload) override;

    core::TransferResult find_asset(ReleaseId release, const std::string& name, std::optional<AssetInfo>& asset);

    const GithubSinkOptions& get_options() const { return options_; }

private:
    GithubSinkOptions options_;
    Url api_base_;
    Url upload_base_;

    core::TransferResult api_call(http::verb method, const std::string& path, StringResponse& response);

    template <typename Request>
    void apply_headers(Request& req, const Url& base) const;
};

} // namespace assetrelay::network
