#pragma once

#include <pve_session/auth/session_store.hpp>
#include <pve_session/core/result.hpp>
#include <pve_session/http/i_http_transport.hpp>
#include <pve_session/http/rate_limiter.hpp>
#include <pve_session/http/refresh_coordinator.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string_view>

namespace pve_session {

// Token lifetimes and the optional request budget for one client.
struct SessionConfig {
    std::chrono::seconds ticket_lifetime{7200};
    std::chrono::seconds csrf_lifetime{300};
    std::optional<RateLimitConfig> rate_limit;
};

// ---------------------------------------------------------------------------
// RequestDispatcher: the authenticated request loop.
//
//   1. No ticket, or the ticket is past its lifetime: log in (coalesced).
//   2. Wait on the rate limiter.
//   3. Send with "Cookie: PVEAuthCookie=..." and, when the session has one,
//      "CSRFPreventionToken: ..." taken from a fresh store snapshot.
//   4. 401 on the first attempt: log in once more (coalesced), rebuild the
//      headers and resend the identical request. A second 401 is terminal.
//   5. Other non-2xx: Connection error with the status and a body excerpt.
//   6. 2xx: decode the body as JSON. An empty body decodes to null.
//
// The 401 retry also applies to POST/PUT/DELETE. Proxmox rejects an
// unauthenticated request before running any handler, so the first attempt
// is assumed to have had no effect.
// ---------------------------------------------------------------------------
class RequestDispatcher {
public:
    RequestDispatcher(const SessionConfig& config,
                      IHttpTransport& transport,
                      SessionStore& store,
                      RateLimiter& limiter,
                      RefreshCoordinator& coordinator)
        : config_(config),
          transport_(transport),
          store_(store),
          limiter_(limiter),
          coordinator_(coordinator) {}

    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    /// Log in unless the store already holds a ticket within its lifetime.
    [[nodiscard]] Result<void, Error> EnsureAuthenticated();

    /// Send `method` to the API path built from `path` and decode the reply.
    [[nodiscard]] Result<nlohmann::json, Error> Execute(
        HttpMethod method,
        std::string_view path,
        const std::optional<nlohmann::json>& body = std::nullopt);

private:
    // Fresh snapshot holding a usable ticket, logging in first if needed.
    Result<SessionSnapshot, Error> AuthorizedSnapshot();

    const SessionConfig& config_;
    IHttpTransport& transport_;
    SessionStore& store_;
    RateLimiter& limiter_;
    RefreshCoordinator& coordinator_;
};

// Cookie and CSRF headers for one request.
[[nodiscard]] HttpHeaders BuildAuthHeaders(const AuthenticationState& state);

} // namespace pve_session
