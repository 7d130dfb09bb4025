#pragma once

#include <pve_session/auth/credentials.hpp>
#include <pve_session/auth/session_tokens.hpp>
#include <pve_session/core/result.hpp>
#include <pve_session/http/i_http_transport.hpp>

#include <string_view>

namespace pve_session {

// Fixed ticket-issuance path.
inline constexpr std::string_view kTicketPath = "/api2/json/access/ticket";

// ---------------------------------------------------------------------------
// LoginExchange: trades a CredentialDescriptor for an AuthenticationState.
//
//   POST /api2/json/access/ticket
//   {"username": "...", "password": "...", "realm": "..."}
//   -> {"data": {"ticket": "...", "CSRFPreventionToken": "..."}}
//
// Status mapping:
//   200       -> tokens parsed and validated (failure: Validation)
//   401       -> Authentication, never retried here
//   400       -> Validation, tagged to the request shape
//   404, 503  -> Connection
//   other     -> Connection carrying the literal status
//   transport -> Connection carrying the cause
//
// Execute() never touches the SessionStore; the caller commits the result.
// ---------------------------------------------------------------------------
class LoginExchange {
public:
    explicit LoginExchange(IHttpTransport& transport) : transport_(transport) {}

    [[nodiscard]] Result<AuthenticationState, Error> Execute(
        const CredentialDescriptor& descriptor) const;

private:
    IHttpTransport& transport_;
};

// Parse and validate a 200 login response body. Exposed for tests.
[[nodiscard]] Result<AuthenticationState, Error> ParseLoginResponse(
    std::string_view body);

} // namespace pve_session
