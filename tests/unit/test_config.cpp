#include <gtest/gtest.h>
#include "assetrelay/core/config.hpp"
#include "assetrelay/storage/pipeline_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace assetrelay::core;
using assetrelay::storage::PipelineConfig;
using assetrelay::transfer::PartialAssetPolicy;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_config.txt";
    }

    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
        unsetenv("GITHUB_TOKEN");
        unsetenv("GITHUB_REPO");
        unsetenv("GITHUB_RELEASE_TAG");
        unsetenv("LOG_LEVEL");
    }

    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();

    config.set("test.key", "test_value");

    auto value = config.get("test.key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "test_value");
}

TEST_F(ConfigTest, GetNonExistent) {
    auto& config = Config::instance();

    auto value = config.get("nonexistent.key");
    EXPECT_FALSE(value.has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();

    config.set("bool.true", "true");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("size.value", "4294967296");
    config.set("double.value", "2.5");
    config.set("string.value", "hello world");

    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_uint64("size.value"), 4294967296ULL);
    EXPECT_DOUBLE_EQ(config.get_double("double.value"), 2.5);
    EXPECT_EQ(config.get_string("string.value"), "hello world");
}

TEST_F(ConfigTest, MalformedNumbersFallBack) {
    auto& config = Config::instance();

    config.set("size.negative", "-5");
    config.set("size.garbage", "12abc");

    EXPECT_EQ(config.get_uint64("size.negative", 7), 7u);
    EXPECT_EQ(config.get_uint64("size.garbage", 9), 9u);
    EXPECT_FALSE(config.get_as<int>("size.garbage").has_value());
}

TEST_F(ConfigTest, DefaultValues) {
    auto& config = Config::instance();

    EXPECT_FALSE(config.get_bool("nonexistent", false));
    EXPECT_TRUE(config.get_bool("nonexistent", true));
    EXPECT_EQ(config.get_int("nonexistent", 123), 123);
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "github.repo=owner/name\n";
    file << "retry.max_retries = 5 \n";
    file << "transfer.cleanup_on_failure=true\n";
    file << "not a setting\n";
    file.close();

    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_string("github.repo"), "owner/name");
    EXPECT_EQ(config.get_int("retry.max_retries"), 5);
    EXPECT_TRUE(config.get_bool("transfer.cleanup_on_failure"));
    EXPECT_FALSE(config.has("not a setting"));
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(Config::instance().load_from_file("does_not_exist.conf"));
}

TEST_F(ConfigTest, SaveToFile) {
    auto& config = Config::instance();
    config.set("test.key1", "value1");
    config.set("test.key2", "value2");

    EXPECT_TRUE(config.save_to_file(test_file));
    EXPECT_TRUE(std::filesystem::exists(test_file));

    Config new_config;
    EXPECT_TRUE(new_config.load_from_file(test_file));
    EXPECT_EQ(new_config.get_string("test.key1"), "value1");
    EXPECT_EQ(new_config.get_string("test.key2"), "value2");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("github.repo", "from/file");

    setenv("GITHUB_REPO", "from/env", 1);
    setenv("GITHUB_TOKEN", "secret", 1);
    setenv("GITHUB_RELEASE_TAG", "", 1);
    config.load_from_env();

    EXPECT_EQ(config.get_string("github.repo"), "from/env");
    EXPECT_EQ(config.get_string("github.token"), "secret");
    EXPECT_FALSE(config.has("github.release_tag"));
    EXPECT_EQ(config.get_string("log.level"), "info");
}

class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.set_defaults();
    }

    Config config;
};

TEST_F(PipelineConfigTest, DefaultsMatchConfigDefaults) {
    auto pipeline = PipelineConfig::from_config(config);

    EXPECT_EQ(pipeline.max_asset_bytes, 2147483648ULL);
    EXPECT_EQ(pipeline.max_file_size, 4294967296ULL);
    EXPECT_EQ(pipeline.chunk_size, 1048576u);
    EXPECT_EQ(pipeline.min_progress_interval, std::chrono::milliseconds(1000));
    EXPECT_EQ(pipeline.idle_timeout, std::chrono::seconds(60));
    EXPECT_EQ(pipeline.retry.max_retries, 3u);
    EXPECT_EQ(pipeline.retry.base_delay, std::chrono::milliseconds(1000));
    EXPECT_DOUBLE_EQ(pipeline.retry.factor, 2.0);
    EXPECT_EQ(pipeline.retry.max_delay, std::chrono::milliseconds(30000));
    EXPECT_EQ(pipeline.partial_asset_policy, PartialAssetPolicy::KEEP);
    EXPECT_TRUE(pipeline.resume_database.empty());
    EXPECT_TRUE(pipeline.validate());
}

TEST_F(PipelineConfigTest, ReadsOverrides) {
    config.set("sink.max_asset_bytes", "1000");
    config.set("transfer.chunk_size", "100");
    config.set("retry.max_retries", "7");
    config.set("transfer.cleanup_on_failure", "true");
    config.set("resume.database", "/tmp/assetrelay-resume.db");

    auto pipeline = PipelineConfig::from_config(config);

    EXPECT_EQ(pipeline.max_asset_bytes, 1000u);
    EXPECT_EQ(pipeline.chunk_size, 100u);
    EXPECT_EQ(pipeline.retry.max_retries, 7u);
    EXPECT_EQ(pipeline.partial_asset_policy, PartialAssetPolicy::DELETE_UPLOADED);
    EXPECT_EQ(pipeline.resume_database, std::filesystem::path("/tmp/assetrelay-resume.db"));
    EXPECT_TRUE(pipeline.validate());
}

TEST_F(PipelineConfigTest, RejectsInvalidSettings) {
    PipelineConfig pipeline;
    EXPECT_TRUE(pipeline.validate());

    auto broken = pipeline;
    broken.max_asset_bytes = 0;
    EXPECT_FALSE(broken.validate());

    broken = pipeline;
    broken.chunk_size = 0;
    EXPECT_FALSE(broken.validate());

    broken = pipeline;
    broken.max_asset_bytes = 10;
    broken.chunk_size = 11;
    EXPECT_FALSE(broken.validate());

    broken = pipeline;
    broken.retry.factor = 0.5;
    EXPECT_FALSE(broken.validate());

    broken = pipeline;
    broken.retry.base_delay = std::chrono::milliseconds(60000);
    EXPECT_FALSE(broken.validate());

    broken = pipeline;
    broken.idle_timeout = std::chrono::seconds(0);
    auto reason = broken.validation_error();
    ASSERT_TRUE(reason.has_value());
    EXPECT_NE(reason->find("idle_timeout"), std::string::npos);
}

TEST_F(PipelineConfigTest, EmptySpoolDirectoryUsesTemp) {
    PipelineConfig pipeline;
    EXPECT_EQ(pipeline.get_spool_directory(), std::filesystem::temp_directory_path());
    EXPECT_TRUE(pipeline.has_spool_space(1));
}
