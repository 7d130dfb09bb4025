#include <pve_session/auth/login_exchange.hpp>
#include <pve_session/core/log.hpp>

#include <nlohmann/json.hpp>

namespace pve_session {

namespace {

constexpr const char* kOperation = "Login";

Error MakeLoginError(std::optional<int> http_status,
                     const std::string& message,
                     ErrorCategory category) {
    return Error{kOperation, std::string(kTicketPath), http_status, message,
                 std::nullopt, category};
}

Error ErrorFromLoginStatus(int status_code) {
    switch (status_code) {
        case 401:
            return MakeLoginError(status_code, "Invalid credentials",
                                  ErrorCategory::Authentication);
        case 400:
            return MakeLoginError(status_code,
                                  "Invalid request format (username/password/realm)",
                                  ErrorCategory::Validation);
        case 404:
            return MakeLoginError(status_code, "Login endpoint not found",
                                  ErrorCategory::Connection);
        case 503:
            return MakeLoginError(status_code, "Proxmox service unavailable",
                                  ErrorCategory::Connection);
        default:
            return MakeLoginError(status_code,
                                  "Unexpected response status: " +
                                      std::to_string(status_code),
                                  ErrorCategory::Connection);
    }
}

// Re-tag token validation failures with the login operation and endpoint.
Error AsLoginValidationError(Error error) {
    error.message = error.operation + ": " + error.message;
    error.operation = kOperation;
    error.endpoint = std::string(kTicketPath);
    error.http_status = 200;
    error.category = ErrorCategory::Validation;
    return error;
}

} // anonymous namespace

Result<AuthenticationState, Error> ParseLoginResponse(std::string_view body) {
    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return Result<AuthenticationState, Error>::Err(MakeLoginError(
            200, "Failed to parse login response: malformed JSON",
            ErrorCategory::Validation));
    }
    if (!j.is_object() || !j.contains("data") || !j["data"].is_object()) {
        return Result<AuthenticationState, Error>::Err(MakeLoginError(
            200, "Failed to parse login response: missing 'data' object",
            ErrorCategory::Validation));
    }

    const auto& data = j["data"];
    if (!data.contains("ticket") || !data["ticket"].is_string()) {
        return Result<AuthenticationState, Error>::Err(MakeLoginError(
            200, "Failed to parse login response: missing 'ticket'",
            ErrorCategory::Validation));
    }

    auto ticket = Ticket::Create(data["ticket"].get<std::string>());
    if (ticket.IsErr()) {
        return Result<AuthenticationState, Error>::Err(
            AsLoginValidationError(std::move(ticket).Error()));
    }

    std::optional<CsrfToken> csrf;
    if (data.contains("CSRFPreventionToken") && !data["CSRFPreventionToken"].is_null()) {
        if (!data["CSRFPreventionToken"].is_string()) {
            return Result<AuthenticationState, Error>::Err(MakeLoginError(
                200, "Failed to parse login response: 'CSRFPreventionToken' is not a string",
                ErrorCategory::Validation));
        }
        auto token = CsrfToken::Create(data["CSRFPreventionToken"].get<std::string>());
        if (token.IsErr()) {
            return Result<AuthenticationState, Error>::Err(
                AsLoginValidationError(std::move(token).Error()));
        }
        csrf = std::move(token).Value();
    }

    return Result<AuthenticationState, Error>::Ok(
        AuthenticationState{std::move(ticket).Value(), std::move(csrf)});
}

Result<AuthenticationState, Error> LoginExchange::Execute(
    const CredentialDescriptor& descriptor) const {
    nlohmann::json request;
    request["username"] = descriptor.Username();
    request["password"] = descriptor.Password();
    request["realm"] = descriptor.Realm();

    LogInfo("auth", "Requesting ticket for " + descriptor.UserId() +
                        " at " + descriptor.BaseUrl());

    auto response = transport_.Post(kTicketPath, request.dump(),
                                    "application/json",
                                    {{"Accept", "application/json"}});
    if (response.IsErr()) {
        auto error = std::move(response).Error();
        LogWarn("auth", "Login transport failure: " + error.message);
        return Result<AuthenticationState, Error>::Err(Error{
            kOperation, std::string(kTicketPath), std::nullopt, error.message,
            std::nullopt, ErrorCategory::Connection});
    }

    const auto& resp = response.Value();
    if (resp.status_code != 200) {
        auto error = ErrorFromLoginStatus(resp.status_code);
        LogWarn("auth", error.ToString());
        return Result<AuthenticationState, Error>::Err(std::move(error));
    }

    auto parsed = ParseLoginResponse(resp.body);
    if (parsed.IsOk()) {
        LogInfo("auth", std::string("Ticket issued for ") + descriptor.UserId() +
                            (parsed.Value().csrf_token.has_value()
                                 ? " (with CSRF token)"
                                 : " (no CSRF token)"));
    } else {
        LogWarn("auth", parsed.Error().ToString());
    }
    return parsed;
}

} // namespace pve_session
