#include <pve_session/http/rate_limiter.hpp>
#include <pve_session/core/log.hpp>

#include <algorithm>
#include <string>
#include <thread>

namespace pve_session {

namespace {

std::chrono::steady_clock::duration SecondsToDuration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

} // anonymous namespace

RateLimiter::RateLimiter(std::optional<RateLimitConfig> config)
    : config_(config), last_refill_(SteadyClock::now()) {
    if (config_.has_value() &&
        (config_->requests_per_second == 0 || config_->burst_size == 0)) {
        LogWarn("http", "Ignoring rate limit with zero rate or burst (" +
                            std::to_string(config_->requests_per_second) + "/s, burst " +
                            std::to_string(config_->burst_size) + ")");
        config_.reset();
    }
    if (config_.has_value()) {
        tokens_ = static_cast<double>(config_->burst_size);
    }
}

void RateLimiter::RefillLocked(SteadyClock::time_point now) const {
    if (now <= last_refill_) {
        return;
    }
    const double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    tokens_ = std::min(static_cast<double>(config_->burst_size),
                       tokens_ + elapsed * config_->requests_per_second);
    last_refill_ = now;
}

void RateLimiter::UntilReady() {
    if (!config_.has_value()) {
        return;
    }

    SteadyClock::duration wait{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RefillLocked(SteadyClock::now());
        tokens_ -= 1.0;
        if (tokens_ < 0.0) {
            wait = SecondsToDuration(-tokens_ / config_->requests_per_second);
        }
    }

    if (wait > SteadyClock::duration::zero()) {
        LogDebug("http", "Rate limit reached, waiting " +
                             std::to_string(std::chrono::duration_cast<
                                 std::chrono::milliseconds>(wait).count()) +
                             " ms");
        std::this_thread::sleep_for(wait);
    }
}

std::chrono::steady_clock::duration RateLimiter::NextDelay() const {
    if (!config_.has_value()) {
        return SteadyClock::duration::zero();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    RefillLocked(SteadyClock::now());
    if (tokens_ >= 1.0) {
        return SteadyClock::duration::zero();
    }
    return SecondsToDuration((1.0 - tokens_) / config_->requests_per_second);
}

} // namespace pve_session
