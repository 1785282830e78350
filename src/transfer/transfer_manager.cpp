#include "assetrelay/transfer/transfer_manager.hpp"
#include "assetrelay/core/logger.hpp"
#include <iomanip>
#include <random>
#include <sstream>

namespace assetrelay::transfer {

using core::TransferError;
using core::TransferResult;

TransferManager::TransferManager(network::SinkClient& sink, storage::PipelineConfig config, core::Clock& clock)
    : sink_(sink)
    , config_(std::move(config))
    , clock_(clock)
    , journal_(nullptr) {
}

TransferManager::~TransferManager() {
    std::shared_ptr<TransferSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = std::move(current_);
    }
    if (session) {
        session->cancel();
        session->wait();
    }
}

void TransferManager::set_reader_factory(ReaderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    reader_factory_ = std::move(factory);
}

void TransferManager::set_resume_journal(storage::ResumeJournal* journal) {
    std::lock_guard<std::mutex> lock(mutex_);
    journal_ = journal;
}

TransferResult TransferManager::start(TransferRequest request, ProgressCallback callback, SessionHandle& handle) {
    auto result = validate_request(request);
    if (!result) {
        return result;
    }

    std::shared_ptr<TransferSession> previous;
    std::shared_ptr<TransferSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (current_ && !current_->is_finished()) {
            return TransferResult(TransferError::SESSION_BUSY,
                                  "Transfer " + current_->get_session_id() + " is still active");
        }

        if (std::holds_alternative<RemoteUrl>(request.source) && !reader_factory_) {
            return TransferResult(TransferError::INVALID_STATE, "URL sources are not configured");
        }

        session = std::make_shared<TransferSession>(generate_session_id(), std::move(request), sink_, clock_,
                                                    config_);
        session->set_progress_callback(std::move(callback));
        session->set_reader_factory(reader_factory_);
        session->set_resume_journal(journal_);

        previous = std::move(current_);
        current_ = session;
        handle = session->get_session_id();
    }

    // The previous session is finished; dropping it joins its worker
    previous.reset();

    session->start();
    return TransferResult();
}

TransferResult TransferManager::cancel(const SessionHandle& handle) {
    auto session = find_session(handle);
    if (!session) {
        return TransferResult(TransferError::INVALID_STATE, "Unknown transfer " + handle);
    }
    if (session->is_finished()) {
        return TransferResult(TransferError::INVALID_STATE, "Transfer " + handle + " already finished");
    }
    session->cancel();
    return TransferResult();
}

std::optional<TransferState> TransferManager::current_state(const SessionHandle& handle) const {
    auto session = find_session(handle);
    if (!session) {
        return std::nullopt;
    }
    return session->get_state();
}

std::optional<TransferState> TransferManager::wait(const SessionHandle& handle) {
    auto session = find_session(handle);
    if (!session) {
        return std::nullopt;
    }
    session->wait();
    return session->get_state();
}

std::optional<TransferState> TransferManager::wait_for(const SessionHandle& handle,
                                                       std::chrono::milliseconds timeout) {
    auto session = find_session(handle);
    if (!session || !session->wait_for(timeout)) {
        return std::nullopt;
    }
    return session->get_state();
}

bool TransferManager::is_busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ && !current_->is_finished();
}

std::shared_ptr<TransferSession> TransferManager::find_session(const SessionHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ && current_->get_session_id() == handle) {
        return current_;
    }
    return nullptr;
}

TransferResult TransferManager::validate_request(const TransferRequest& request) const {
    if (request.target_asset_name.empty()) {
        return TransferResult(TransferError::INVALID_REQUEST, "Target asset name is empty");
    }
    if (request.target_asset_name.find('/') != std::string::npos) {
        return TransferResult(TransferError::INVALID_REQUEST, "Asset name must not contain '/'");
    }
    if (auto* inline_stream = std::get_if<InlineStream>(&request.source)) {
        if (!inline_stream->reader) {
            return TransferResult(TransferError::INVALID_REQUEST, "Inline stream has no reader");
        }
    } else if (std::get<RemoteUrl>(request.source).url.empty()) {
        return TransferResult(TransferError::INVALID_REQUEST, "Source URL is empty");
    }
    if (request.declared_size_bytes && *request.declared_size_bytes > config_.max_file_size) {
        return TransferResult(TransferError::INVALID_REQUEST, "Declared size exceeds the transfer limit");
    }
    return TransferResult();
}

std::string TransferManager::generate_session_id() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint32_t> dis(0, UINT32_MAX);

    std::ostringstream oss;
    oss << "transfer_" << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
    return oss.str();
}

}
