#pragma once

#include "assetrelay/core/clock.hpp"
#include "assetrelay/transfer/transfer_types.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace assetrelay::transfer {

// Turns raw byte-count deltas into rate-limited ProgressEvents.
//
// An event is emitted on the first observation and afterwards whenever at
// least `min_interval` has passed since the previous emitted event.
// finish() always emits, so the final byte count is never dropped.
class ProgressThrottle {
public:
    explicit ProgressThrottle(core::Clock& clock,
                              std::chrono::milliseconds min_interval = std::chrono::milliseconds(1000),
                              std::chrono::seconds eta_window = std::chrono::seconds(30));

    void reset(std::optional<uint64_t> total_bytes);

    void set_total(std::optional<uint64_t> total_bytes) { total_bytes_ = total_bytes; }
    void set_part(uint32_t current_part, uint32_t total_parts);
    void set_phase(TransferPhase phase) { phase_ = phase; }

    std::optional<ProgressEvent> observe(uint64_t bytes_delta);
    ProgressEvent finish();

    // Event for the current counters without touching the emit timestamp.
    ProgressEvent snapshot() const;

    uint64_t get_bytes_so_far() const { return bytes_so_far_; }
    uint64_t get_events_emitted() const { return events_emitted_; }

private:
    core::Clock& clock_;
    std::chrono::milliseconds min_interval_;
    std::chrono::seconds eta_window_;

    std::optional<uint64_t> total_bytes_;
    uint64_t bytes_so_far_;
    uint32_t current_part_;
    uint32_t total_parts_;
    TransferPhase phase_;

    bool observed_;
    core::Clock::time_point first_observation_;
    std::optional<core::Clock::time_point> last_emit_;
    uint64_t events_emitted_;

    std::deque<std::pair<core::Clock::time_point, uint64_t>> history_;

    ProgressEvent emit(core::Clock::time_point now);
    std::optional<uint64_t> calculate_eta(core::Clock::time_point now) const;
    void cleanup_old_history(core::Clock::time_point now);
};

} // namespace assetrelay::transfer
