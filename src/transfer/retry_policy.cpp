#include "assetrelay/transfer/retry_policy.hpp"
#include <algorithm>
#include <cmath>

namespace assetrelay::transfer {

std::optional<BackoffState> RetryPolicy::next(const BackoffState& state) const {
    if (state.attempt >= max_retries) {
        return std::nullopt;
    }

    BackoffState next_state;
    next_state.attempt = state.attempt + 1;
    next_state.delay = delay_for(next_state.attempt);
    return next_state;
}

std::chrono::milliseconds RetryPolicy::delay_for(uint32_t retry) const {
    if (retry == 0) {
        return std::chrono::milliseconds(0);
    }

    double delay = static_cast<double>(base_delay.count()) * std::pow(factor, static_cast<double>(retry - 1));
    double cap = static_cast<double>(max_delay.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

}
