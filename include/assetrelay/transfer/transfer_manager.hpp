#pragma once

#include "assetrelay/core/clock.hpp"
#include "assetrelay/core/errors.hpp"
#include "assetrelay/network/sink_client.hpp"
#include "assetrelay/storage/pipeline_config.hpp"
#include "assetrelay/transfer/transfer_session.hpp"
#include "assetrelay/transfer/transfer_types.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace assetrelay::storage {
class ResumeJournal;
}

namespace assetrelay::transfer {

using SessionHandle = std::string;

// Owns the single transfer slot. A second start() while a transfer is
// active fails with SESSION_BUSY; a finished session stays queryable until
// the next start() replaces it.
class TransferManager {
public:
    TransferManager(network::SinkClient& sink, storage::PipelineConfig config,
                    core::Clock& clock = core::SystemClock::instance());
    ~TransferManager();

    void set_reader_factory(ReaderFactory factory);
    void set_resume_journal(storage::ResumeJournal* journal);

    core::TransferResult start(TransferRequest request, ProgressCallback callback, SessionHandle& handle);
    core::TransferResult cancel(const SessionHandle& handle);

    std::optional<TransferState> current_state(const SessionHandle& handle) const;

    // Block until the session is terminal and return its final state.
    std::optional<TransferState> wait(const SessionHandle& handle);
    std::optional<TransferState> wait_for(const SessionHandle& handle, std::chrono::milliseconds timeout);

    bool is_busy() const;

    const storage::PipelineConfig& get_config() const { return config_; }

private:
    network::SinkClient& sink_;
    storage::PipelineConfig config_;
    core::Clock& clock_;

    ReaderFactory reader_factory_;
    storage::ResumeJournal* journal_;

    std::shared_ptr<TransferSession> current_;
    mutable std::mutex mutex_;

    std::shared_ptr<TransferSession> find_session(const SessionHandle& handle) const;
    core::TransferResult validate_request(const TransferRequest& request) const;
    std::string generate_session_id();
};

} // namespace assetrelay::transfer
