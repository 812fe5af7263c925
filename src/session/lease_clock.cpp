#include "clu/session/lease_clock.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace clu::session {

SessionLeaseClock::SessionLeaseClock(std::chrono::milliseconds keepalive_interval,
                                     std::chrono::milliseconds idle_timeout)
    : interval_(keepalive_interval)
    , last_renewal_(steady_clock::now())
    , next_due_(last_renewal_ + keepalive_interval) {
    if (interval_ >= idle_timeout) {
        interval_ = idle_timeout / 2;
        spdlog::warn("Keepalive interval {}ms is not shorter than the idle timeout {}ms, using {}ms",
                     keepalive_interval.count(), idle_timeout.count(), interval_.count());
    }
    if (interval_.count() < 0) {
        interval_ = std::chrono::milliseconds{0};
    }
    next_due_ = last_renewal_ + interval_;
}

void SessionLeaseClock::record_renewal(steady_clock::time_point now) {
    last_renewal_ = now;
    next_due_ = now + interval_;

    if (expires_at_) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            *expires_at_ - system_clock::now());
        if (remaining.count() > 0) {
            next_due_ = std::min(next_due_, now + std::max(remaining / 2, min_spacing()));
        }
    }
}

void SessionLeaseClock::update_expiry(std::optional<system_clock::time_point> expires_at) {
    expires_at_ = expires_at;
    if (!expires_at_) {
        return;
    }

    // A shortened lease pulls the next keepalive forward; an expiry already
    // behind the local clock (skew) leaves the cadence unchanged
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        *expires_at_ - system_clock::now());
    if (remaining.count() <= 0) {
        return;
    }
    const auto halfway = steady_clock::now() + remaining / 2;
    next_due_ = std::min(next_due_, std::max(halfway, last_renewal_ + min_spacing()));
}

std::chrono::milliseconds SessionLeaseClock::min_spacing() const {
    return std::min(interval_, std::chrono::milliseconds(kMinKeepaliveSpacing));
}

bool SessionLeaseClock::keepalive_due(steady_clock::time_point now) const {
    return now >= next_due_;
}

SessionLeaseClock::steady_clock::time_point SessionLeaseClock::next_keepalive() const {
    return next_due_;
}

bool SessionLeaseClock::expired(system_clock::time_point now) const {
    return expires_at_.has_value() && now > *expires_at_;
}

} // namespace clu::session
