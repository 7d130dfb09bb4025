#include <pve_session/auth/session_store.hpp>

#include <mutex>

namespace pve_session {

std::optional<AuthenticationState> SessionStore::Read() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
}

SessionSnapshot SessionStore::Snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return SessionSnapshot{state_, generation_};
}

void SessionStore::Write(AuthenticationState state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    state_ = std::move(state);
    ++generation_;
}

bool SessionStore::IsAuthenticated(std::chrono::seconds ticket_lifetime) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_.has_value() && !state_->ticket.IsExpired(ticket_lifetime);
}

uint64_t SessionStore::Generation() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return generation_;
}

} // namespace pve_session
