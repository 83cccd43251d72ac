#pragma once

#include <chrono>
#include <deque>
#include <cstdint>

namespace peerlink::transfer {

// Transfer rate and ETA for one job, from the confirmed byte count over time.
// The current rate covers the last few seconds; before that window has any
// samples the average since start is used.
class RateMeter {
public:
    using Clock = std::chrono::steady_clock;

    RateMeter(std::uint64_t total_bytes, std::uint64_t bytes_done = 0, Clock::time_point now = Clock::now());

    void record(std::uint64_t bytes_done, Clock::time_point now = Clock::now());

    std::uint64_t bytes_done() const { return bytes_done_; }
    std::uint64_t total_bytes() const { return total_bytes_; }

    std::uint64_t current_rate(Clock::time_point now = Clock::now()) const;
    std::uint64_t average_rate(Clock::time_point now = Clock::now()) const;

    // Zero when done or when no rate is known yet.
    std::chrono::milliseconds eta(Clock::time_point now = Clock::now()) const;

    static constexpr std::chrono::seconds RATE_WINDOW{5};

private:
    void trim(Clock::time_point now);

    std::uint64_t total_bytes_;
    std::uint64_t start_bytes_;
    std::uint64_t bytes_done_;
    Clock::time_point start_time_;
    std::deque<std::pair<Clock::time_point, std::uint64_t>> samples_;
};

// Lets a progress event through at most once per interval; the event that
// reaches the total always passes.
class ProgressThrottle {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressThrottle(std::chrono::milliseconds interval);

    bool should_emit(std::uint64_t bytes_done, std::uint64_t total, Clock::time_point now = Clock::now());

private:
    std::chrono::milliseconds interval_;
    Clock::time_point last_emit_;
    bool emitted_any_;
    bool emitted_final_;
};

}
