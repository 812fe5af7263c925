#pragma once

#include <chrono>
#include <optional>

namespace clu::session {

/**
 * @brief Tracks an update session's lease and the keepalive cadence it needs
 *
 * Two clocks are involved: the server's expiry is an absolute wall-clock
 * time (system_clock), while the cadence is measured on steady_clock. The
 * next keepalive is due at whichever comes first: one interval after the
 * last renewal, or halfway to the known expiry.
 */
class SessionLeaseClock {
public:
    using steady_clock = std::chrono::steady_clock;
    using system_clock = std::chrono::system_clock;

    static constexpr std::chrono::seconds kDefaultIdleTimeout{300};

    /// A shortened lease never schedules keepalives closer together than this.
    static constexpr std::chrono::seconds kMinKeepaliveSpacing{1};

    /// An interval that is not shorter than idle_timeout is clamped to half of it.
    explicit SessionLeaseClock(std::chrono::milliseconds keepalive_interval,
                               std::chrono::milliseconds idle_timeout = kDefaultIdleTimeout);

    /// A renewal (open or keepalive) happened at now.
    void record_renewal(steady_clock::time_point now);

    /// Server-reported expiry, from the latest refresh. An expiry already in
    /// the past (clock skew) is recorded but leaves the cadence alone.
    void update_expiry(std::optional<system_clock::time_point> expires_at);

    [[nodiscard]] bool keepalive_due(steady_clock::time_point now) const;
    [[nodiscard]] steady_clock::time_point next_keepalive() const;

    /// True only when an expiry is known and has passed.
    [[nodiscard]] bool expired(system_clock::time_point now) const;

    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }
    [[nodiscard]] std::optional<system_clock::time_point> expires_at() const noexcept { return expires_at_; }

private:
    std::chrono::milliseconds min_spacing() const;

    std::chrono::milliseconds interval_;
    steady_clock::time_point last_renewal_;
    steady_clock::time_point next_due_;
    std::optional<system_clock::time_point> expires_at_;
};

} // namespace clu::session
