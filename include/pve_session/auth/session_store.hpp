#pragma once

#include <pve_session/auth/session_tokens.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <shared_mutex>

namespace pve_session {

// State and the write count it was observed at, read under one lock.
struct SessionSnapshot {
    std::optional<AuthenticationState> state;
    uint64_t generation = 0;
};

// ---------------------------------------------------------------------------
// SessionStore: the single source of truth for "are we authenticated".
//
// Holds the current AuthenticationState (or nothing) behind a
// std::shared_mutex: readers proceed concurrently, a writer excludes
// everyone for the duration of the replacement. Callers always receive
// copies. Nothing executed under the lock performs I/O.
// ---------------------------------------------------------------------------
class SessionStore {
public:
    SessionStore() = default;

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /// Snapshot of the current state.
    [[nodiscard]] std::optional<AuthenticationState> Read() const;

    /// State plus generation, consistent with each other.
    [[nodiscard]] SessionSnapshot Snapshot() const;

    /// Atomically replace the current state.
    void Write(AuthenticationState state);

    /// True iff a state exists and its ticket is within `ticket_lifetime`.
    [[nodiscard]] bool IsAuthenticated(std::chrono::seconds ticket_lifetime) const;

    /// Number of completed writes. Monotonic.
    [[nodiscard]] uint64_t Generation() const;

private:
    mutable std::shared_mutex mutex_;
    std::optional<AuthenticationState> state_;
    uint64_t generation_ = 0;
};

} // namespace pve_session
