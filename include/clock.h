#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace brook {

using TimePoint = std::chrono::steady_clock::time_point;

// Blocking waits re-check cancellation at least this often
constexpr std::chrono::milliseconds WAIT_SLICE{10};

/**
 * @brief Time source for timeouts, heartbeats and record timestamps
 *
 * now() drives deadlines measured against heartbeats, acknowledgments and
 * segment age; wall_time_ms() stamps records and drives time retention.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
    virtual uint64_t wall_time_ms() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::steady_clock::now();
    }

    uint64_t wall_time_ms() const override {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }
};

// Process-wide SystemClock used when no clock is injected
std::shared_ptr<Clock> system_clock();

/**
 * @brief Cooperative cancellation flag shared between a caller and the
 * operation it started
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

inline bool cancelled(const CancellationToken* token) {
    return token != nullptr && token->is_cancelled();
}

inline TimePoint deadline_after(std::chrono::milliseconds timeout) {
    return std::chrono::steady_clock::now() + timeout;
}

// Next wake-up for a sliced wait: the deadline or one WAIT_SLICE from now
inline TimePoint next_wakeup(TimePoint deadline) {
    return std::min(deadline, std::chrono::steady_clock::now() + WAIT_SLICE);
}

} // namespace brook
