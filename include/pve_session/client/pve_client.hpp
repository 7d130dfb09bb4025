#pragma once

#include <pve_session/auth/credentials.hpp>
#include <pve_session/auth/login_exchange.hpp>
#include <pve_session/auth/session_store.hpp>
#include <pve_session/auth/session_tokens.hpp>
#include <pve_session/core/result.hpp>
#include <pve_session/http/http_transport.hpp>
#include <pve_session/http/i_http_transport.hpp>
#include <pve_session/http/rate_limiter.hpp>
#include <pve_session/http/refresh_coordinator.hpp>
#include <pve_session/http/request_dispatcher.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace pve_session {

// ---------------------------------------------------------------------------
// PveClient: authenticated access to one Proxmox VE endpoint.
//
// Owns the descriptor, session configuration, transport, session store,
// rate limiter, refresh coordinator and dispatcher. All members are safe to
// call from several threads at once; concurrent callers share one session
// and one rate-limit budget.
//
//   PveClient client(CredentialDescriptor("pve.lan", 8006, true,
//                                         "root", password, "pam"));
//   auto nodes = client.Get("nodes");
//
// Resource calls return nlohmann::json by default, or any T that
// nlohmann::json can convert to (a from_json overload).
// ---------------------------------------------------------------------------
class PveClient {
public:
    explicit PveClient(CredentialDescriptor descriptor,
                       SessionConfig config = {},
                       const TransportOptions& transport_options = {});

    /// Use a caller-supplied transport (tests, custom stacks).
    PveClient(CredentialDescriptor descriptor,
              SessionConfig config,
              std::unique_ptr<IHttpTransport> transport);

    PveClient(const PveClient&) = delete;
    PveClient& operator=(const PveClient&) = delete;

    // -- Session ------------------------------------------------------------

    /// Log in now, replacing any current session.
    [[nodiscard]] Result<void, Error> Login();

    [[nodiscard]] bool IsAuthenticated() const;
    [[nodiscard]] std::optional<Ticket> AuthToken() const;
    [[nodiscard]] std::optional<pve_session::CsrfToken> CsrfToken() const;

    /// True when there is no session or its ticket is past ticket_lifetime.
    [[nodiscard]] bool IsTicketExpired() const;

    /// True when there is no CSRF token or it is past csrf_lifetime.
    [[nodiscard]] bool IsCsrfExpired() const;

    /// Serialized current session, or nullopt when not logged in.
    [[nodiscard]] std::optional<std::string> SerializeSession() const;

    /// Adopt a serialized session. Expired or malformed input is a Session
    /// error and leaves the current session in place.
    [[nodiscard]] Result<void, Error> RestoreSession(std::string_view bytes);

    /// Write the session to `path` (mode 0600). Returns the bytes written,
    /// 0 when there is no session to save.
    [[nodiscard]] Result<size_t, Error> SaveSession(const std::string& path) const;

    [[nodiscard]] Result<void, Error> LoadSession(const std::string& path);

    // -- Resource calls -----------------------------------------------------

    template <typename T = nlohmann::json>
    [[nodiscard]] Result<T, Error> Get(std::string_view path) {
        return Decode<T>(dispatcher_.Execute(HttpMethod::Get, path));
    }

    template <typename T = nlohmann::json>
    [[nodiscard]] Result<T, Error> Post(std::string_view path,
                                        const nlohmann::json& body = nlohmann::json::object()) {
        return Decode<T>(dispatcher_.Execute(HttpMethod::Post, path, body));
    }

    template <typename T = nlohmann::json>
    [[nodiscard]] Result<T, Error> Put(std::string_view path,
                                       const nlohmann::json& body = nlohmann::json::object()) {
        return Decode<T>(dispatcher_.Execute(HttpMethod::Put, path, body));
    }

    template <typename T = nlohmann::json>
    [[nodiscard]] Result<T, Error> Delete(std::string_view path) {
        return Decode<T>(dispatcher_.Execute(HttpMethod::Delete, path));
    }

    [[nodiscard]] const CredentialDescriptor& Descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] const SessionConfig& Config() const noexcept { return config_; }

private:
    template <typename T>
    static Result<T, Error> Decode(Result<nlohmann::json, Error> response) {
        if (response.IsErr()) {
            return Result<T, Error>::Err(std::move(response).Error());
        }
        if constexpr (std::is_same_v<T, nlohmann::json>) {
            return response;
        } else {
            try {
                return Result<T, Error>::Ok(response.Value().template get<T>());
            } catch (const nlohmann::json::exception& e) {
                return Result<T, Error>::Err(Error{
                    "Decode", "", std::nullopt,
                    std::string("Failed to parse response: ") + e.what(),
                    std::nullopt, ErrorCategory::Connection});
            }
        }
    }

    CredentialDescriptor descriptor_;
    SessionConfig config_;
    std::unique_ptr<IHttpTransport> transport_;
    LoginExchange login_;
    SessionStore store_;
    RateLimiter limiter_;
    RefreshCoordinator coordinator_;
    RequestDispatcher dispatcher_;
};

} // namespace pve_session
