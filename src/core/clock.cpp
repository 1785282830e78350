#include "assetrelay/core/clock.hpp"
#include <algorithm>
#include <thread>

namespace assetrelay::core {

SystemClock& SystemClock::instance() {
    static SystemClock clock;
    return clock;
}

Clock::time_point SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

bool SystemClock::sleep_for(std::chrono::milliseconds duration,
                            const std::atomic<bool>* interrupt) {
    auto deadline = std::chrono::steady_clock::now() + duration;

    while (true) {
        if (interrupt && interrupt->load()) {
            return false;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining + std::chrono::milliseconds(1), POLL_INTERVAL));
    }
}

}
