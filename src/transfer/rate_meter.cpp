#include "peerlink/transfer/rate_meter.hpp"
#include <algorithm>

namespace peerlink::transfer {

RateMeter::RateMeter(std::uint64_t total_bytes, std::uint64_t bytes_done, Clock::time_point now)
    : total_bytes_(total_bytes)
    , start_bytes_(bytes_done)
    , bytes_done_(bytes_done)
    , start_time_(now) {
    samples_.emplace_back(now, bytes_done);
}

void RateMeter::record(std::uint64_t bytes_done, Clock::time_point now) {
    bytes_done_ = std::max(bytes_done_, std::min(bytes_done, total_bytes_));
    samples_.emplace_back(now, bytes_done_);
    trim(now);
}

std::uint64_t RateMeter::current_rate(Clock::time_point now) const {
    auto cutoff = now - RATE_WINDOW;
    auto first = std::find_if(samples_.begin(), samples_.end(),
                              [cutoff](const auto& sample) { return sample.first >= cutoff; });

    if (first == samples_.end() || first->first == samples_.back().first) {
        return average_rate(now);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(samples_.back().first - first->first);
    if (elapsed.count() <= 0) {
        return average_rate(now);
    }

    return (samples_.back().second - first->second) * 1000 / static_cast<std::uint64_t>(elapsed.count());
}

std::uint64_t RateMeter::average_rate(Clock::time_point now) const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_);
    if (elapsed.count() <= 0) {
        return 0;
    }
    return (bytes_done_ - start_bytes_) * 1000 / static_cast<std::uint64_t>(elapsed.count());
}

std::chrono::milliseconds RateMeter::eta(Clock::time_point now) const {
    if (bytes_done_ >= total_bytes_) {
        return std::chrono::milliseconds(0);
    }

    auto rate = current_rate(now);
    if (rate == 0) {
        return std::chrono::milliseconds(0);
    }

    auto remaining = total_bytes_ - bytes_done_;
    return std::chrono::milliseconds(remaining * 1000 / rate);
}

void RateMeter::trim(Clock::time_point now) {
    auto cutoff = now - RATE_WINDOW;
    // Keep one sample at or before the cutoff so the window has a left edge.
    while (samples_.size() > 2 && samples_[1].first <= cutoff) {
        samples_.pop_front();
    }
}

ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval)
    : interval_(interval)
    , emitted_any_(false)
    , emitted_final_(false) {
}

bool ProgressThrottle::should_emit(std::uint64_t bytes_done, std::uint64_t total, Clock::time_point now) {
    if (bytes_done >= total) {
        if (emitted_final_) {
            return false;
        }
        emitted_final_ = true;
        last_emit_ = now;
        emitted_any_ = true;
        return true;
    }

    if (emitted_any_ && now - last_emit_ < interval_) {
        return false;
    }

    last_emit_ = now;
    emitted_any_ = true;
    return true;
}

}
