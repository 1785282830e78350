#include "assetrelay/transfer/progress_throttle.hpp"
#include <algorithm>
#include <cmath>

namespace assetrelay::transfer {

ProgressThrottle::ProgressThrottle(core::Clock& clock,
                                   std::chrono::milliseconds min_interval,
                                   std::chrono::seconds eta_window)
    : clock_(clock)
    , min_interval_(min_interval)
    , eta_window_(eta_window)
    , bytes_so_far_(0)
    , current_part_(0)
    , total_parts_(0)
    , phase_(TransferPhase::DOWNLOADING)
    , observed_(false)
    , events_emitted_(0) {}

void ProgressThrottle::reset(std::optional<uint64_t> total_bytes) {
    total_bytes_ = total_bytes;
    bytes_so_far_ = 0;
    current_part_ = 0;
    total_parts_ = 0;
    phase_ = TransferPhase::DOWNLOADING;
    observed_ = false;
    last_emit_.reset();
    events_emitted_ = 0;
    history_.clear();
}

void ProgressThrottle::set_part(uint32_t current_part, uint32_t total_parts) {
    current_part_ = current_part;
    total_parts_ = total_parts;
}

std::optional<ProgressEvent> ProgressThrottle::observe(uint64_t bytes_delta) {
    auto now = clock_.now();

    if (!observed_) {
        observed_ = true;
        first_observation_ = now;
    }

    bytes_so_far_ += bytes_delta;
    if (bytes_delta > 0) {
        history_.emplace_back(now, bytes_delta);
    }
    cleanup_old_history(now);

    if (!last_emit_ || now - *last_emit_ >= min_interval_) {
        return emit(now);
    }
    return std::nullopt;
}

ProgressEvent ProgressThrottle::finish() {
    auto now = clock_.now();
    if (!observed_) {
        observed_ = true;
        first_observation_ = now;
    }
    return emit(now);
}

ProgressEvent ProgressThrottle::snapshot() const {
    ProgressEvent event;
    event.bytes_so_far = bytes_so_far_;
    event.bytes_total = total_bytes_;
    if (total_bytes_) {
        if (*total_bytes_ == 0) {
            event.percent = 100.0;
        } else {
            double pct = static_cast<double>(bytes_so_far_) / static_cast<double>(*total_bytes_) * 100.0;
            event.percent = std::min(pct, 100.0);
        }
    }
    event.current_part = current_part_;
    event.total_parts = total_parts_;
    event.phase = phase_;
    return event;
}

ProgressEvent ProgressThrottle::emit(core::Clock::time_point now) {
    auto event = snapshot();
    event.eta_seconds = calculate_eta(now);
    last_emit_ = now;
    events_emitted_++;
    return event;
}

std::optional<uint64_t> ProgressThrottle::calculate_eta(core::Clock::time_point now) const {
    if (!total_bytes_) {
        return std::nullopt;
    }
    if (bytes_so_far_ >= *total_bytes_) {
        return 0;
    }

    uint64_t remaining = *total_bytes_ - bytes_so_far_;

    // Windowed rate first, fall back to the average since the first observation
    double rate = 0.0;
    if (history_.size() > 1) {
        auto span = std::chrono::duration<double>(now - history_.front().first).count();
        if (span > 0.0) {
            uint64_t window_bytes = 0;
            for (const auto& [timestamp, bytes] : history_) {
                window_bytes += bytes;
            }
            rate = static_cast<double>(window_bytes) / span;
        }
    }
    if (rate <= 0.0) {
        auto elapsed = std::chrono::duration<double>(now - first_observation_).count();
        if (elapsed > 0.0) {
            rate = static_cast<double>(bytes_so_far_) / elapsed;
        }
    }

    if (rate <= 0.0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(std::ceil(static_cast<double>(remaining) / rate));
}

void ProgressThrottle::cleanup_old_history(core::Clock::time_point now) {
    auto cutoff = now - eta_window_;
    while (!history_.empty() && history_.front().first < cutoff) {
        history_.pop_front();
    }
}

}
