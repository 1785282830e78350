#include "assetrelay/network/github_release_sink.hpp"
#include "assetrelay/core/logger.hpp"
#include "assetrelay/core/utils.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <sstream>
#include <stdexcept>

namespace assetrelay::network {

namespace pt = boost::property_tree;

using core::TransferError;
using core::TransferResult;
using core::utils::StringUtils;

namespace {

constexpr int ASSETS_PER_PAGE = 100;

bool parse_json(const std::string& body, pt::ptree& tree) {
    try {
        std::istringstream iss(body);
        pt::read_json(iss, tree);
        return true;
    } catch (const pt::json_parser_error& e) {
        LOG_DEBUG("Malformed JSON from sink: {}", e.what());
        return false;
    }
}

bool parse_asset(const pt::ptree& node, AssetInfo& asset) {
    auto id = node.get_optional<AssetId>("id");
    auto name = node.get_optional<std::string>("name");
    if (!id || !name) {
        return false;
    }
    asset.id = *id;
    asset.name = *name;
    asset.size = node.get<uint64_t>("size", 0);
    asset.download_url = node.get<std::string>("browser_download_url", "");
    asset.state = node.get<std::string>("state", "");
    return true;
}

std::string error_message(const std::string& body) {
    pt::ptree tree;
    if (!body.empty() && parse_json(body, tree)) {
        auto message = tree.get_optional<std::string>("message");
        if (message) {
            std::string text = *message;
            // Validation failures carry the detail in errors[].code
            if (auto errors = tree.get_child_optional("errors")) {
                for (const auto& [key, item] : *errors) {
                    auto code = item.get_optional<std::string>("code");
                    if (code) {
                        text += " (" + *code + ")";
                    }
                }
            }
            return text;
        }
    }
    if (body.size() > 200) {
        return body.substr(0, 200) + "...";
    }
    return body;
}

std::string join_path(const Url& base, const std::string& path) {
    std::string prefix = base.target;
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    return prefix + path;
}

TransferResult as_sink_failure(const TransferResult& transport) {
    return TransferResult(TransferError::SINK_UNAVAILABLE, transport.message);
}

}

TransferResult classify_sink_status(int status, const std::string& body) {
    if (status >= 200 && status < 300) {
        return TransferResult();
    }

    auto detail = error_message(body);
    auto message = "HTTP " + std::to_string(status) + (detail.empty() ? "" : ": " + detail);
    auto lowered = StringUtils::to_lower(detail);

    auto mentions = [&lowered](const char* word) { return lowered.find(word) != std::string::npos; };

    TransferError error = TransferError::SINK_REJECTED;
    if (status >= 500 || status == 408 || status == 429) {
        error = TransferError::SINK_UNAVAILABLE;
    } else if (status == 413) {
        error = TransferError::SINK_QUOTA_EXCEEDED;
    } else if (status == 422 && (mentions("size") || mentions("quota") || mentions("too large"))) {
        error = TransferError::SINK_QUOTA_EXCEEDED;
    } else if (status == 403 && (mentions("quota") || mentions("storage"))) {
        error = TransferError::SINK_QUOTA_EXCEEDED;
    } else if (status == 403 && mentions("rate limit")) {
        error = TransferError::SINK_UNAVAILABLE;
    }

    return TransferResult(error, message).with_status(status);
}

class GithubAssetUpload : public AssetUpload {
public:
    GithubAssetUpload(std::unique_ptr<HttpConnection> connection, std::string name, uint64_t declared_size)
        : connection_(std::move(connection))
        , name_(std::move(name))
        , declared_size_(declared_size)
        , written_(0)
        , closed_(false) {}

    ~GithubAssetUpload() override {
        abort();
    }

    TransferResult write(std::span<const uint8_t> data) override {
        if (closed_) {
            return TransferResult(TransferError::INVALID_STATE, "Upload of " + name_ + " is closed");
        }
        if (written_ + data.size() > declared_size_) {
            return TransferResult(TransferError::INVALID_STATE,
                                  "Upload of " + name_ + " exceeds its declared size");
        }

        auto result = connection_->write_body(data);
        if (!result) {
            // The server may have answered before the body was complete
            StringResponse response;
            if (connection_->is_open() && connection_->read_response(response)) {
                abort();
                auto status = classify_sink_status(static_cast<int>(response.result_int()), response.body());
                if (!status) {
                    return status;
                }
            }
            abort();
            return as_sink_failure(result);
        }

        written_ += data.size();
        return TransferResult();
    }

    TransferResult finish(AssetInfo& created) override {
        if (closed_) {
            return TransferResult(TransferError::INVALID_STATE, "Upload of " + name_ + " is closed");
        }
        if (written_ != declared_size_) {
            abort();
            return TransferResult(TransferError::INVALID_STATE,
                                  "Upload of " + name_ + " wrote " + std::to_string(written_) + " of " +
                                  std::to_string(declared_size_) + " bytes");
        }

        StringResponse response;
        auto result = connection_->read_response(response);
        abort();
        if (!result) {
            return as_sink_failure(result);
        }

        int status = static_cast<int>(response.result_int());
        if (status != 201) {
            auto classified = classify_sink_status(status, response.body());
            if (classified) {
                return TransferResult(TransferError::SINK_UNAVAILABLE,
                                      "Unexpected HTTP " + std::to_string(status) + " for asset upload")
                    .with_status(status);
            }
            return classified;
        }

        pt::ptree tree;
        if (!parse_json(response.body(), tree) || !parse_asset(tree, created)) {
            return TransferResult(TransferError::SINK_UNAVAILABLE, "Malformed asset upload response");
        }
        return TransferResult();
    }

    void abort() override {
        if (!closed_) {
            closed_ = true;
            connection_->close();
        }
    }

private:
    std::unique_ptr<HttpConnection> connection_;
    std::string name_;
    uint64_t declared_size_;
    uint64_t written_;
    bool closed_;
};

GithubSinkOptions GithubSinkOptions::from_config(const core::Config& config) {
    GithubSinkOptions options;
    options.api_url = config.get_string("github.api_url", options.api_url);
    options.upload_url = config.get_string("github.upload_url", options.upload_url);
    options.token = config.get_string("github.token");
    options.repo = config.get_string("github.repo");
    options.max_asset_bytes = config.get_uint64("sink.max_asset_bytes", options.max_asset_bytes);
    options.http.idle_timeout = std::chrono::seconds(
        config.get_uint64("network.idle_timeout_s", options.http.idle_timeout.count()));
    options.http.user_agent = config.get_string("http.user_agent", options.http.user_agent);
    return options;
}

GithubReleaseSink::GithubReleaseSink(GithubSinkOptions options)
    : options_(std::move(options)) {
    auto api = Url::parse(options_.api_url);
    if (!api) {
        throw std::invalid_argument("Invalid github.api_url: " + options_.api_url);
    }
    auto upload = Url::parse(options_.upload_url);
    if (!upload) {
        throw std::invalid_argument("Invalid github.upload_url: " + options_.upload_url);
    }
    if (options_.repo.empty() || options_.repo.find('/') == std::string::npos) {
        throw std::invalid_argument("github.repo must be of the form owner/name");
    }
    api_base_ = *api;
    upload_base_ = *upload;
}

template <typename Request>
void GithubReleaseSink::apply_headers(Request& req, const Url& base) const {
    req.set(http::field::host, base.host_header());
    req.set(http::field::accept, "application/vnd.github.v3+json");
    if (!options_.token.empty()) {
        req.set(http::field::authorization, "token " + options_.token);
    }
}

TransferResult GithubReleaseSink::api_call(http::verb method, const std::string& path, StringResponse& response) {
    HttpConnection connection(options_.http);
    auto result = connection.connect(api_base_);
    if (!result) {
        return as_sink_failure(result);
    }

    http::request<http::string_body> req{method, join_path(api_base_, path), 11};
    apply_headers(req, api_base_);
    req.keep_alive(false);

    result = connection.request(req, response);
    if (!result) {
        return as_sink_failure(result);
    }
    return TransferResult();
}

TransferResult GithubReleaseSink::resolve_release(const std::string& tag, ReleaseInfo& release) {
    StringResponse response;
    auto result = api_call(http::verb::get,
                           "/repos/" + options_.repo + "/releases/tags/" + StringUtils::url_encode(tag), response);
    if (!result) {
        return result;
    }

    auto status = static_cast<int>(response.result_int());
    if (status == 404) {
        return TransferResult(TransferError::SINK_REJECTED, "Release with tag " + tag + " not found")
            .with_status(status);
    }
    result = classify_sink_status(status, response.body());
    if (!result) {
        return result;
    }

    pt::ptree tree;
    if (!parse_json(response.body(), tree)) {
        return TransferResult(TransferError::SINK_UNAVAILABLE, "Malformed release response");
    }
    auto id = tree.get_optional<ReleaseId>("id");
    if (!id) {
        return TransferResult(TransferError::SINK_UNAVAILABLE, "Release response has no id");
    }

    release.id = *id;
    release.tag_name = tree.get<std::string>("tag_name", tag);
    release.name = tree.get<std::string>("name", "");
    LOG_DEBUG("Release {} resolved to id {}", tag, release.id);
    return TransferResult();
}

TransferResult GithubReleaseSink::list_assets(ReleaseId release, std::vector<AssetInfo>& assets) {
    assets.clear();

    for (int page = 1;; ++page) {
        StringResponse response;
        auto path = "/repos/" + options_.repo + "/releases/" + std::to_string(release) +
                    "/assets?per_page=" + std::to_string(ASSETS_PER_PAGE) + "&page=" + std::to_string(page);
        auto result = api_call(http::verb::get, path, response);
        if (!result) {
            return result;
        }

        result = classify_sink_status(static_cast<int>(response.result_int()), response.body());
        if (!result) {
            return result;
        }

        pt::ptree tree;
        if (!parse_json(response.body(), tree)) {
            return TransferResult(TransferError::SINK_UNAVAILABLE, "Malformed asset list response");
        }

        int count = 0;
        for (const auto& [key, node] : tree) {
            AssetInfo asset;
            if (parse_asset(node, asset)) {
                assets.push_back(std::move(asset));
            }
            count++;
        }

        if (count < ASSETS_PER_PAGE) {
            break;
        }
    }

    LOG_DEBUG("Release {} has {} asset(s)", release, assets.size());
    return TransferResult();
}

TransferResult GithubReleaseSink::delete_asset(AssetId asset) {
    StringResponse response;
    auto result = api_call(http::verb::delete_,
                           "/repos/" + options_.repo + "/releases/assets/" + std::to_string(asset), response);
    if (!result) {
        return result;
    }

    auto status = static_cast<int>(response.result_int());
    if (status == 204) {
        return TransferResult();
    }
    if (status == 404) {
        LOG_DEBUG("Asset {} was already gone", asset);
        return TransferResult();
    }
    return classify_sink_status(status, response.body());
}

TransferResult GithubReleaseSink::begin_upload(ReleaseId release, const std::string& name, uint64_t size,
                                               std::unique_ptr<AssetUpload>& upload) {
    if (size > options_.max_asset_bytes) {
        return TransferResult(TransferError::SINK_QUOTA_EXCEEDED,
                              "Asset " + name + " is larger than the sink limit of " +
                              StringUtils::format_bytes(options_.max_asset_bytes));
    }

    auto connection = std::make_unique<HttpConnection>(options_.http);
    auto result = connection->connect(upload_base_);
    if (!result) {
        return as_sink_failure(result);
    }

    auto target = join_path(upload_base_, "/repos/" + options_.repo + "/releases/" + std::to_string(release) +
                                          "/assets?name=" + StringUtils::url_encode(name));
    EmptyRequest req{http::verb::post, target, 11};
    apply_headers(req, upload_base_);
    req.set(http::field::content_type, "application/octet-stream");
    req.content_length(size);
    req.keep_alive(false);

    result = connection->begin_upload(req);
    if (!result) {
        return as_sink_failure(result);
    }

    LOG_DEBUG("Uploading {} ({} bytes) to release {}", name, size, release);
    upload = std::make_unique<GithubAssetUpload>(std::move(connection), name, size);
    return TransferResult();
}

TransferResult GithubReleaseSink::find_asset(ReleaseId release, const std::string& name,
                                             std::optional<AssetInfo>& asset) {
    asset.reset();
    std::vector<AssetInfo> assets;
    auto result = list_assets(release, assets);
    if (!result) {
        return result;
    }
    for (auto& item : assets) {
        if (item.name == name) {
            asset = std::move(item);
            break;
        }
    }
    return TransferResult();
}

}
