#include <gtest/gtest.h>
#include "assetrelay/transfer/transfer_manager.hpp"
#include "support/fake_sink.hpp"
#include "support/manual_clock.hpp"
#include "support/scripted_reader.hpp"
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace assetrelay;
using namespace assetrelay::transfer;
using core::TransferError;
using core::TransferResult;
using test::FakeSink;
using test::ManualClock;
using test::make_payload;

namespace {

constexpr network::ReleaseId RELEASE = 7;

TransferRequest inline_request(std::vector<uint8_t> payload, const std::string& name) {
    TransferRequest request;
    request.source = InlineStream{std::make_shared<BufferReader>(std::move(payload))};
    request.target_asset_name = name;
    request.target_release_id = RELEASE;
    return request;
}

// Holds the sink's writer thread inside write() until released.
class WriteGate {
public:
    void install(FakeSink& sink, const std::string& asset_name) {
        sink.set_write_hook([this, asset_name](const std::string& name, uint64_t) {
            if (name != asset_name) {
                return;
            }
            entered_ = true;
            while (!released_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        });
    }

    bool wait_entered(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!entered_ && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return entered_;
    }

    void release() { released_ = true; }

private:
    std::atomic<bool> entered_{false};
    std::atomic<bool> released_{false};
};

}

class TransferSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        spool_dir = std::filesystem::temp_directory_path() / "assetrelay_session_test";
        config.max_asset_bytes = 1000;
        config.chunk_size = 256;
        config.min_progress_interval = std::chrono::milliseconds(0);
        config.spool_directory = spool_dir;
    }

    void TearDown() override {
        std::filesystem::remove_all(spool_dir);
    }

    std::filesystem::path spool_dir;
    storage::PipelineConfig config;
    ManualClock clock;
    FakeSink sink{1000};
};

TEST_F(TransferSessionTest, CompletesAndReportsOutcome) {
    TransferManager manager(sink, config, clock);
    SessionHandle handle;

    ASSERT_TRUE(manager.start(inline_request(make_payload(2500), "out.bin"), nullptr, handle));
    auto state = manager.wait(handle);

    ASSERT_TRUE(state);
    EXPECT_EQ(state->status, TransferStatus::COMPLETED);
    EXPECT_EQ(state->total_parts_planned, 3u);
    EXPECT_EQ(state->parts_completed.size(), 3u);
    EXPECT_EQ(state->bytes_transferred_total, 2500u);
    EXPECT_TRUE(state->finished_at.has_value());
    EXPECT_FALSE(state->last_error.has_value());
    ASSERT_TRUE(state->result);
    EXPECT_EQ(state->result->asset_ids.size(), 3u);
    EXPECT_EQ(state->result->part_sizes, (std::vector<uint64_t>{1000, 1000, 500}));
    EXPECT_EQ(state->result->total_bytes, 2500u);
    EXPECT_TRUE(handle.starts_with("transfer_"));
}

TEST_F(TransferSessionTest, ProgressIsMonotonicAndEndsAtTotal) {
    TransferManager manager(sink, config, clock);
    std::vector<ProgressEvent> events;
    std::mutex events_mutex;
    SessionHandle handle;

    auto callback = [&](const ProgressEvent& event) {
        std::lock_guard<std::mutex> lock(events_mutex);
        events.push_back(event);
    };
    ASSERT_TRUE(manager.start(inline_request(make_payload(2500), "mono.bin"), callback, handle));
    manager.wait(handle);

    std::lock_guard<std::mutex> lock(events_mutex);
    ASSERT_GE(events.size(), 2u);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GE(events[i].bytes_so_far, events[i - 1].bytes_so_far);
        EXPECT_GE(events[i].current_part, events[i - 1].current_part);
    }
    const auto& last = events.back();
    EXPECT_EQ(last.bytes_so_far, 2500u);
    ASSERT_TRUE(last.bytes_total);
    EXPECT_EQ(*last.bytes_total, 2500u);
    ASSERT_TRUE(last.percent);
    EXPECT_DOUBLE_EQ(*last.percent, 100.0);
    EXPECT_EQ(last.total_parts, 3u);
    EXPECT_EQ(last.phase, TransferPhase::UPLOADING);
}

TEST_F(TransferSessionTest, ThrowingCallbackDoesNotFailTransfer) {
    TransferManager manager(sink, config, clock);
    SessionHandle handle;

    auto callback = [](const ProgressEvent&) { throw std::runtime_error("display gone"); };
    ASSERT_TRUE(manager.start(inline_request(make_payload(300), "t.bin"), callback, handle));

    auto state = manager.wait(handle);
    ASSERT_TRUE(state);
    EXPECT_EQ(state->status, TransferStatus::COMPLETED);
}

TEST_F(TransferSessionTest, SecondStartWhileActiveIsBusy) {
    WriteGate gate;
    gate.install(sink, "first.bin");
    TransferManager manager(sink, config, clock);

    SessionHandle first;
    ASSERT_TRUE(manager.start(inline_request(make_payload(500), "first.bin"), nullptr, first));
    ASSERT_TRUE(gate.wait_entered());
    EXPECT_TRUE(manager.is_busy());

    SessionHandle second;
    auto busy = manager.start(inline_request(make_payload(500), "second.bin"), nullptr, second);
    EXPECT_EQ(busy.error, TransferError::SESSION_BUSY);
    EXPECT_TRUE(second.empty());

    gate.release();
    auto state = manager.wait(first);
    ASSERT_TRUE(state);
    EXPECT_EQ(state->status, TransferStatus::COMPLETED);
    EXPECT_FALSE(sink.find("second.bin").has_value());

    ASSERT_TRUE(manager.start(inline_request(make_payload(500), "second.bin"), nullptr, second));
    EXPECT_NE(first, second);
    EXPECT_EQ(manager.wait(second)->status, TransferStatus::COMPLETED);
    EXPECT_FALSE(manager.current_state(first).has_value());
}

TEST_F(TransferSessionTest, CancelStopsActiveTransfer) {
    WriteGate gate;
    gate.install(sink, "c.bin.002");
    TransferManager manager(sink, config, clock);

    SessionHandle handle;
    ASSERT_TRUE(manager.start(inline_request(make_payload(2500), "c.bin"), nullptr, handle));
    ASSERT_TRUE(gate.wait_entered());

    EXPECT_TRUE(manager.cancel(handle));
    gate.release();

    auto state = manager.wait(handle);
    ASSERT_TRUE(state);
    EXPECT_EQ(state->status, TransferStatus::CANCELLED);
    ASSERT_TRUE(state->last_error);
    EXPECT_EQ(state->last_error->error, TransferError::CANCELLED);
    EXPECT_EQ(state->parts_completed.size(), 1u);
    EXPECT_FALSE(state->result.has_value());

    EXPECT_EQ(manager.cancel(handle).error, TransferError::INVALID_STATE);
    EXPECT_FALSE(manager.is_busy());
}

TEST_F(TransferSessionTest, FailedTransferKeepsPartialAssetsByDefault) {
    sink.fail_attempt("p.bin.002", 1, FakeSink::Failure{
        TransferResult(TransferError::SINK_REJECTED, "Validation Failed").with_status(422), std::nullopt});
    TransferManager manager(sink, config, clock);

    SessionHandle handle;
    ASSERT_TRUE(manager.start(inline_request(make_payload(1500), "p.bin"), nullptr, handle));
    auto state = manager.wait(handle);

    ASSERT_TRUE(state);
    EXPECT_EQ(state->status, TransferStatus::FAILED);
    ASSERT_TRUE(state->last_error);
    EXPECT_EQ(state->last_error->error, TransferError::SINK_REJECTED);
    ASSERT_TRUE(state->last_error->part_index);
    EXPECT_EQ(*state->last_error->part_index, 1u);
    EXPECT_EQ(state->parts_completed.size(), 1u);
    EXPECT_TRUE(sink.find("p.bin.001").has_value());
    EXPECT_TRUE(sink.get_deleted().empty());
}

TEST_F(TransferSessionTest, DeleteUploadedPolicyRemovesPartialAssets) {
    config.partial_asset_policy = PartialAssetPolicy::DELETE_UPLOADED;
    sink.fail_attempt("p.bin.002", 1, FakeSink::Failure{
        TransferResult(TransferError::SINK_REJECTED, "Validation Failed").with_status(422), std::nullopt});
    TransferManager manager(sink, config, clock);

    SessionHandle handle;
    ASSERT_TRUE(manager.start(inline_request(make_payload(1500), "p.bin"), nullptr, handle));
    auto state = manager.wait(handle);

    ASSERT_TRUE(state);
    EXPECT_EQ(state->status, TransferStatus::FAILED);
    EXPECT_FALSE(sink.find("p.bin.001").has_value());
    EXPECT_EQ(sink.get_deleted().size(), 1u);
}

TEST_F(TransferSessionTest, RetriesAreCountedInState) {
    sink.fail_attempt("r.bin", 1, FakeSink::Failure{
        TransferResult(TransferError::SINK_UNAVAILABLE, "Service Unavailable").with_status(503), std::nullopt});
    TransferManager manager(sink, config, clock);

    SessionHandle handle;
    ASSERT_TRUE(manager.start(inline_request(make_payload(400), "r.bin"), nullptr, handle));
    auto state = manager.wait(handle);

    ASSERT_TRUE(state);
    EXPECT_EQ(state->status, TransferStatus::COMPLETED);
    EXPECT_EQ(state->total_retries, 1u);
    EXPECT_EQ(clock.get_sleeps(), (std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(1000)}));
}

TEST_F(TransferSessionTest, DeclaredSizeMismatchFails) {
    TransferManager manager(sink, config, clock);
    auto request = inline_request(make_payload(100), "d.bin");
    request.declared_size_bytes = 200;

    SessionHandle handle;
    ASSERT_TRUE(manager.start(std::move(request), nullptr, handle));
    auto state = manager.wait(handle);

    ASSERT_TRUE(state);
    EXPECT_EQ(state->status, TransferStatus::FAILED);
    EXPECT_EQ(state->last_error->error, TransferError::INVALID_REQUEST);
    EXPECT_TRUE(sink.asset_names().empty());
}

TEST_F(TransferSessionTest, StreamWithDeclaredSizeUsesKnownPlan) {
    auto payload = make_payload(1500);
    auto input = std::make_shared<std::istringstream>(std::string(payload.begin(), payload.end()));
    TransferRequest request;
    request.source = InlineStream{std::make_shared<StreamReader>(*input, 1500, "inline")};
    request.target_asset_name = "s.bin";
    request.target_release_id = RELEASE;
    request.declared_size_bytes = 1500;

    TransferManager manager(sink, config, clock);
    SessionHandle handle;
    ASSERT_TRUE(manager.start(std::move(request), nullptr, handle));
    auto state = manager.wait(handle);

    ASSERT_TRUE(state);
    EXPECT_EQ(state->status, TransferStatus::COMPLETED);
    EXPECT_EQ(state->total_parts_planned, 2u);
    ASSERT_TRUE(sink.find("s.bin.002"));
    EXPECT_EQ(sink.find("s.bin.002")->data, std::vector<uint8_t>(payload.begin() + 1000, payload.end()));
}

TEST_F(TransferSessionTest, FileOverTransferLimitFails) {
    config.max_file_size = 1000;
    TransferManager manager(sink, config, clock);

    SessionHandle handle;
    ASSERT_TRUE(manager.start(inline_request(make_payload(1200), "big.bin"), nullptr, handle));
    auto state = manager.wait(handle);

    ASSERT_TRUE(state);
    EXPECT_EQ(state->status, TransferStatus::FAILED);
    EXPECT_EQ(state->last_error->error, TransferError::INVALID_REQUEST);
}

TEST_F(TransferSessionTest, RemoteUrlGoesThroughReaderFactory) {
    TransferManager manager(sink, config, clock);
    auto payload = make_payload(1200);
    std::vector<std::string> requested;
    manager.set_reader_factory([&](const std::string& url) -> std::unique_ptr<ChunkedReader> {
        requested.push_back(url);
        return std::make_unique<BufferReader>(payload, url);
    });

    TransferRequest request;
    request.source = RemoteUrl{"https://files.example/archive.tar"};
    request.target_asset_name = "archive.tar";
    request.target_release_id = RELEASE;

    SessionHandle handle;
    ASSERT_TRUE(manager.start(std::move(request), nullptr, handle));
    auto state = manager.wait(handle);

    ASSERT_TRUE(state);
    EXPECT_EQ(state->status, TransferStatus::COMPLETED);
    EXPECT_EQ(requested, (std::vector<std::string>{"https://files.example/archive.tar"}));
    EXPECT_TRUE(sink.find("archive.tar.002").has_value());
}

TEST_F(TransferSessionTest, InvalidRequestsAreRejectedUpFront) {
    TransferManager manager(sink, config, clock);
    SessionHandle handle;

    EXPECT_EQ(manager.start(inline_request(make_payload(10), ""), nullptr, handle).error,
              TransferError::INVALID_REQUEST);
    EXPECT_EQ(manager.start(inline_request(make_payload(10), "a/b"), nullptr, handle).error,
              TransferError::INVALID_REQUEST);

    TransferRequest no_reader;
    no_reader.source = InlineStream{};
    no_reader.target_asset_name = "x.bin";
    EXPECT_EQ(manager.start(no_reader, nullptr, handle).error, TransferError::INVALID_REQUEST);

    TransferRequest empty_url;
    empty_url.source = RemoteUrl{""};
    empty_url.target_asset_name = "x.bin";
    EXPECT_EQ(manager.start(empty_url, nullptr, handle).error, TransferError::INVALID_REQUEST);

    TransferRequest url;
    url.source = RemoteUrl{"https://files.example/x.bin"};
    url.target_asset_name = "x.bin";
    EXPECT_EQ(manager.start(url, nullptr, handle).error, TransferError::INVALID_STATE);

    auto oversized = inline_request(make_payload(10), "x.bin");
    oversized.declared_size_bytes = config.max_file_size + 1;
    EXPECT_EQ(manager.start(oversized, nullptr, handle).error, TransferError::INVALID_REQUEST);

    EXPECT_TRUE(handle.empty());
    EXPECT_FALSE(manager.is_busy());
}

TEST_F(TransferSessionTest, UnknownHandleIsReported) {
    TransferManager manager(sink, config, clock);

    EXPECT_EQ(manager.cancel("transfer_missing").error, TransferError::INVALID_STATE);
    EXPECT_FALSE(manager.current_state("transfer_missing").has_value());
    EXPECT_FALSE(manager.wait_for("transfer_missing", std::chrono::milliseconds(1)).has_value());
}

TEST_F(TransferSessionTest, SessionRunsSynchronously) {
    TransferSession session("transfer_sync", inline_request(make_payload(700), "sync.bin"), sink, clock, config);
    EXPECT_EQ(session.get_status(), TransferStatus::PENDING);

    session.run();

    EXPECT_TRUE(session.is_finished());
    EXPECT_EQ(session.get_status(), TransferStatus::COMPLETED);
    EXPECT_TRUE(session.wait_for(std::chrono::milliseconds(0)));
}

TEST_F(TransferSessionTest, CancelBeforeRunEndsCancelled) {
    TransferSession session("transfer_early", inline_request(make_payload(700), "early.bin"), sink, clock, config);

    session.cancel();
    session.run();

    EXPECT_EQ(session.get_status(), TransferStatus::CANCELLED);
    EXPECT_TRUE(sink.asset_names().empty());
}
