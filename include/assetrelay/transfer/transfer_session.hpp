#pragma once

#include "assetrelay/core/clock.hpp"
#include "assetrelay/network/sink_client.hpp"
#include "assetrelay/storage/pipeline_config.hpp"
#include "assetrelay/transfer/chunked_reader.hpp"
#include "assetrelay/transfer/progress_throttle.hpp"
#include "assetrelay/transfer/split_uploader.hpp"
#include "assetrelay/transfer/transfer_types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace assetrelay::storage {
class ResumeJournal;
}

namespace assetrelay::transfer {

// Creates the reader for a RemoteUrl source.
using ReaderFactory = std::function<std::unique_ptr<ChunkedReader>(const std::string& url)>;

// Runs one TransferRequest end to end on its own worker thread.
//
// Pending -> Downloading -> Uploading -> Completed, with Failed reachable
// from Downloading/Uploading and Cancelled from any non-terminal state.
class TransferSession : public UploadListener {
public:
    TransferSession(std::string session_id, TransferRequest request, network::SinkClient& sink,
                    core::Clock& clock, storage::PipelineConfig config);
    ~TransferSession() override;

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    void set_progress_callback(ProgressCallback callback) { callback_ = std::move(callback); }
    void set_reader_factory(ReaderFactory factory) { reader_factory_ = std::move(factory); }
    void set_resume_journal(storage::ResumeJournal* journal) { journal_ = journal; }

    // Spawns the worker thread. Call once.
    void start();

    // Runs the transfer on the calling thread.
    void run();

    void cancel();
    void wait();
    bool wait_for(std::chrono::milliseconds timeout);

    TransferState get_state() const;
    TransferStatus get_status() const;
    bool is_finished() const;

    const std::string& get_session_id() const { return session_id_; }
    const TransferRequest& get_request() const { return request_; }

    // UploadListener
    void on_parts_planned(uint32_t total_parts, bool final_count) override;
    void on_part_started(const Part& part) override;
    void on_bytes(uint64_t delta, uint32_t part_index, TransferPhase phase) override;
    void on_upload_started(uint32_t part_index) override;
    void on_part_completed(const Part& part) override;
    void on_retry(uint32_t part_index, uint32_t retry, std::chrono::milliseconds delay,
                  const core::TransferResult& cause) override;

private:
    std::string session_id_;
    TransferRequest request_;
    network::SinkClient& sink_;
    core::Clock& clock_;
    storage::PipelineConfig config_;

    ProgressCallback callback_;
    ReaderFactory reader_factory_;
    storage::ResumeJournal* journal_;

    ProgressThrottle throttle_;
    std::atomic<bool> cancelled_;
    std::thread worker_;

    mutable std::mutex mutex_;
    std::condition_variable finished_cv_;
    TransferState state_;

    core::TransferResult execute();
    core::TransferResult resolve_reader(std::shared_ptr<ChunkedReader>& reader, std::string& source_identity);

    void set_status(TransferStatus status);
    void finalize(TransferStatus status, const core::TransferResult& result);
    void cleanup_partial_assets();
    void emit(const ProgressEvent& event);
};

} // namespace assetrelay::transfer
