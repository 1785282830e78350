#include <gtest/gtest.h>
#include "assetrelay/network/github_release_sink.hpp"
#include <stdexcept>

using namespace assetrelay;
using namespace assetrelay::network;
using core::TransferError;

TEST(SinkStatusTest, SuccessIsNotAnError) {
    EXPECT_TRUE(classify_sink_status(200, ""));
    EXPECT_TRUE(classify_sink_status(201, "{}"));
}

TEST(SinkStatusTest, ServerErrorsAreTransient) {
    for (int status : {500, 502, 503, 504, 408, 429}) {
        auto result = classify_sink_status(status, "");
        EXPECT_EQ(result.error, TransferError::SINK_UNAVAILABLE) << status;
        EXPECT_EQ(result.http_status, status);
        EXPECT_TRUE(result.transient());
    }
}

TEST(SinkStatusTest, SizeRejectionsAreQuotaErrors) {
    EXPECT_EQ(classify_sink_status(413, "").error, TransferError::SINK_QUOTA_EXCEEDED);
    EXPECT_EQ(classify_sink_status(422, R"({"message":"Validation Failed: size is too large"})").error,
              TransferError::SINK_QUOTA_EXCEEDED);
    EXPECT_EQ(classify_sink_status(403, R"({"message":"Storage quota exhausted"})").error,
              TransferError::SINK_QUOTA_EXCEEDED);
}

TEST(SinkStatusTest, OtherClientErrorsAreRejections) {
    auto result = classify_sink_status(
        422, R"({"message":"Validation Failed","errors":[{"resource":"ReleaseAsset","code":"already_exists"}]})");
    EXPECT_EQ(result.error, TransferError::SINK_REJECTED);
    EXPECT_EQ(result.message, "HTTP 422: Validation Failed (already_exists)");
    EXPECT_FALSE(result.transient());

    EXPECT_EQ(classify_sink_status(401, R"({"message":"Bad credentials"})").error, TransferError::SINK_REJECTED);
    EXPECT_EQ(classify_sink_status(404, "").error, TransferError::SINK_REJECTED);
}

TEST(SinkStatusTest, RateLimitIsTransient) {
    auto result = classify_sink_status(403, R"({"message":"API rate limit exceeded for user"})");
    EXPECT_EQ(result.error, TransferError::SINK_UNAVAILABLE);
}

TEST(SinkStatusTest, NonJsonBodyIsQuotedTruncated) {
    auto result = classify_sink_status(400, std::string(300, 'x'));
    EXPECT_EQ(result.error, TransferError::SINK_REJECTED);
    EXPECT_EQ(result.message, "HTTP 400: " + std::string(200, 'x') + "...");
}

TEST(GithubSinkOptionsTest, ReadsConfig) {
    core::Config config;
    config.set("github.repo", "octo/widgets");
    config.set("github.token", "t0ken");
    config.set("github.api_url", "http://127.0.0.1:9000/api");
    config.set("sink.max_asset_bytes", "4096");
    config.set("network.idle_timeout_s", "5");

    auto options = GithubSinkOptions::from_config(config);
    EXPECT_EQ(options.repo, "octo/widgets");
    EXPECT_EQ(options.token, "t0ken");
    EXPECT_EQ(options.api_url, "http://127.0.0.1:9000/api");
    EXPECT_EQ(options.upload_url, "https://uploads.github.com");
    EXPECT_EQ(options.max_asset_bytes, 4096u);
    EXPECT_EQ(options.http.idle_timeout, std::chrono::seconds(5));
}

TEST(GithubSinkOptionsTest, ConstructorValidatesOptions) {
    GithubSinkOptions options;
    options.repo = "octo/widgets";
    EXPECT_NO_THROW(GithubReleaseSink sink(options));

    auto bad_repo = options;
    bad_repo.repo = "widgets";
    EXPECT_THROW(GithubReleaseSink sink(bad_repo), std::invalid_argument);

    auto bad_api = options;
    bad_api.api_url = "api.github.com";
    EXPECT_THROW(GithubReleaseSink sink(bad_api), std::invalid_argument);
}

TEST(GithubSinkOptionsTest, OversizedUploadIsRefusedLocally) {
    GithubSinkOptions options;
    options.repo = "octo/widgets";
    options.max_asset_bytes = 10;
    GithubReleaseSink sink(options);

    std::unique_ptr<AssetUpload> upload;
    auto result = sink.begin_upload(1, "big.bin", 11, upload);
    EXPECT_EQ(result.error, TransferError::SINK_QUOTA_EXCEEDED);
    EXPECT_FALSE(upload);
}
