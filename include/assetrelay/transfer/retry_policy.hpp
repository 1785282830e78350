#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace assetrelay::transfer {

struct BackoffState {
    uint32_t attempt = 0;  // retries already scheduled
    std::chrono::milliseconds delay{0};
};

// Exponential backoff as a pure state transition. next() yields the delay to
// wait before the following retry, or nullopt once max_retries is used up.
struct RetryPolicy {
    uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    double factor = 2.0;
    std::chrono::milliseconds max_delay{30000};

    BackoffState initial() const { return BackoffState{}; }

    std::optional<BackoffState> next(const BackoffState& state) const;

    // Delay before retry number `retry` (1-based).
    std::chrono::milliseconds delay_for(uint32_t retry) const;
};

} // namespace assetrelay::transfer
