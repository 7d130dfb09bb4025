#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace pve_session {

// Steady-state request rate plus the burst allowance above it. Both fields
// must be > 0. ValidateConfig rejects zero on the CLI path; a RateLimiter
// given a zero field logs a warning and stays disabled.
struct RateLimitConfig {
    uint32_t requests_per_second = 0;
    uint32_t burst_size = 0;
};

// ---------------------------------------------------------------------------
// RateLimiter: token bucket shared by every dispatch on one client.
//
// The bucket starts full (burst_size tokens) and refills continuously at
// requests_per_second. UntilReady() takes one token, sleeping the calling
// thread until the token is due when the bucket is empty. Callers that find
// the bucket empty reserve their token under the lock (the balance may go
// negative) and then sleep outside it, so waiters are released in arrival
// order and nobody spins.
//
// A limiter built from std::nullopt, or from a config with a zero field,
// never blocks and reports IsEnabled() == false.
// ---------------------------------------------------------------------------
class RateLimiter {
public:
    explicit RateLimiter(std::optional<RateLimitConfig> config);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Block until one request may proceed.
    void UntilReady();

    [[nodiscard]] bool IsEnabled() const noexcept { return config_.has_value(); }

    /// Time the next caller would have to wait, without consuming anything.
    [[nodiscard]] std::chrono::steady_clock::duration NextDelay() const;

private:
    using SteadyClock = std::chrono::steady_clock;

    void RefillLocked(SteadyClock::time_point now) const;

    std::optional<RateLimitConfig> config_;
    mutable std::mutex mutex_;
    mutable double tokens_ = 0.0;
    mutable SteadyClock::time_point last_refill_;
};

} // namespace pve_session
