#pragma once

#include <pve_session/auth/credentials.hpp>
#include <pve_session/auth/login_exchange.hpp>
#include <pve_session/auth/session_store.hpp>
#include <pve_session/core/result.hpp>

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace pve_session {

// ---------------------------------------------------------------------------
// RefreshCoordinator: single-flight guard around re-login.
//
// Callers pass the store generation their failing request was built from.
//   - generation already advanced: someone refreshed since, return Ok.
//   - a login is in flight: wait for it and share its outcome.
//   - otherwise: become the leader, run LoginExchange outside every lock,
//     commit to the store on success, then wake the followers.
//
// A failed login leaves the store untouched and is reported to the leader
// and every follower of that flight.
// ---------------------------------------------------------------------------
class RefreshCoordinator {
public:
    RefreshCoordinator(const CredentialDescriptor& descriptor,
                       const LoginExchange& login,
                       SessionStore& store)
        : descriptor_(descriptor), login_(login), store_(store) {}

    RefreshCoordinator(const RefreshCoordinator&) = delete;
    RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

    [[nodiscard]] Result<void, Error> Refresh(uint64_t observed_generation);

    /// Logins actually performed (leaders only).
    [[nodiscard]] uint64_t LoginCount() const;

private:
    struct Flight {
        bool done = false;
        std::optional<Error> error;
    };

    const CredentialDescriptor& descriptor_;
    const LoginExchange& login_;
    SessionStore& store_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<Flight> in_flight_;
    uint64_t login_count_ = 0;
};

} // namespace pve_session
