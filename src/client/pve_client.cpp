#include <pve_session/client/pve_client.hpp>
#include <pve_session/auth/session_persistence.hpp>
#include <pve_session/core/log.hpp>

namespace pve_session {

PveClient::PveClient(CredentialDescriptor descriptor,
                     SessionConfig config,
                     const TransportOptions& transport_options)
    : PveClient(descriptor, std::move(config),
                std::make_unique<HttpTransport>(descriptor, transport_options)) {}

PveClient::PveClient(CredentialDescriptor descriptor,
                     SessionConfig config,
                     std::unique_ptr<IHttpTransport> transport)
    : descriptor_(std::move(descriptor)),
      config_(std::move(config)),
      transport_(std::move(transport)),
      login_(*transport_),
      limiter_(config_.rate_limit),
      coordinator_(descriptor_, login_, store_),
      dispatcher_(config_, *transport_, store_, limiter_, coordinator_) {
    LogDebug("client", "Client created for " + descriptor_.UserId() + " at " +
                           descriptor_.BaseUrl());
}

Result<void, Error> PveClient::Login() {
    return coordinator_.Refresh(store_.Generation());
}

bool PveClient::IsAuthenticated() const {
    return store_.IsAuthenticated(config_.ticket_lifetime);
}

std::optional<Ticket> PveClient::AuthToken() const {
    auto state = store_.Read();
    if (!state.has_value()) {
        return std::nullopt;
    }
    return state->ticket;
}

std::optional<CsrfToken> PveClient::CsrfToken() const {
    auto state = store_.Read();
    if (!state.has_value()) {
        return std::nullopt;
    }
    return state->csrf_token;
}

bool PveClient::IsTicketExpired() const {
    auto state = store_.Read();
    return !state.has_value() || state->ticket.IsExpired(config_.ticket_lifetime);
}

bool PveClient::IsCsrfExpired() const {
    auto state = store_.Read();
    return !state.has_value() || !state->csrf_token.has_value() ||
           state->csrf_token->IsExpired(config_.csrf_lifetime);
}

std::optional<std::string> PveClient::SerializeSession() const {
    auto state = store_.Read();
    if (!state.has_value()) {
        return std::nullopt;
    }
    return pve_session::SerializeSession(*state);
}

Result<void, Error> PveClient::RestoreSession(std::string_view bytes) {
    auto state = DeserializeSession(bytes, config_.csrf_lifetime,
                                    config_.ticket_lifetime);
    if (state.IsErr()) {
        return Result<void, Error>::Err(std::move(state).Error());
    }
    store_.Write(std::move(state).Value());
    return Result<void, Error>::Ok();
}

Result<size_t, Error> PveClient::SaveSession(const std::string& path) const {
    auto state = store_.Read();
    if (!state.has_value()) {
        LogDebug("session", "No session to save");
        return Result<size_t, Error>::Ok(0);
    }
    auto saved = SaveSessionFile(path, *state);
    if (saved.IsErr()) {
        return Result<size_t, Error>::Err(std::move(saved).Error());
    }
    return Result<size_t, Error>::Ok(pve_session::SerializeSession(*state).size());
}

Result<void, Error> PveClient::LoadSession(const std::string& path) {
    auto state = LoadSessionFile(path, config_.csrf_lifetime, config_.ticket_lifetime);
    if (state.IsErr()) {
        return Result<void, Error>::Err(std::move(state).Error());
    }
    store_.Write(std::move(state).Value());
    return Result<void, Error>::Ok();
}

} // namespace pve_session
