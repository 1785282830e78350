#pragma once

#include <atomic>
#include <chrono>

namespace assetrelay::core {

// Time source for throttling and backoff. Injected so that tests can drive
// time without sleeping.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;

    // Blocks for `duration`. Returns false if `interrupt` became true first.
    virtual bool sleep_for(std::chrono::milliseconds duration,
                           const std::atomic<bool>* interrupt = nullptr) = 0;
};

class SystemClock : public Clock {
public:
    static SystemClock& instance();

    time_point now() const override;
    bool sleep_for(std::chrono::milliseconds duration,
                   const std::atomic<bool>* interrupt = nullptr) override;

private:
    static constexpr std::chrono::milliseconds POLL_INTERVAL{50};
};

} // namespace assetrelay::core
