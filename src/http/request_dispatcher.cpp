#include <pve_session/http/request_dispatcher.hpp>
#include <pve_session/core/log.hpp>
#include <pve_session/core/url.hpp>

namespace pve_session {

namespace {

constexpr int kMaxAttempts = 2;
constexpr const char* kJsonContentType = "application/json";

bool IsSuccess(int status_code) {
    return status_code >= 200 && status_code < 300;
}

std::string OperationName(HttpMethod method) {
    return std::string("Request ") + HttpMethodName(method);
}

} // anonymous namespace

HttpHeaders BuildAuthHeaders(const AuthenticationState& state) {
    HttpHeaders headers;
    headers["Cookie"] = state.ticket.AsCookieHeader();
    if (state.csrf_token.has_value()) {
        headers[std::string(kCsrfHeaderName)] = state.csrf_token->Value();
    }
    headers["Accept"] = kJsonContentType;
    return headers;
}

Result<SessionSnapshot, Error> RequestDispatcher::AuthorizedSnapshot() {
    auto snapshot = store_.Snapshot();
    if (snapshot.state.has_value() &&
        !snapshot.state->ticket.IsExpired(config_.ticket_lifetime)) {
        return Result<SessionSnapshot, Error>::Ok(std::move(snapshot));
    }

    LogDebug("auth", snapshot.state.has_value()
                         ? "Ticket past its lifetime, logging in"
                         : "No ticket yet, logging in");
    auto refreshed = coordinator_.Refresh(snapshot.generation);
    if (refreshed.IsErr()) {
        return Result<SessionSnapshot, Error>::Err(std::move(refreshed).Error());
    }

    snapshot = store_.Snapshot();
    if (!snapshot.state.has_value()) {
        return Result<SessionSnapshot, Error>::Err(Error{
            "EnsureAuthenticated", "", std::nullopt,
            "Session store empty after successful login", std::nullopt,
            ErrorCategory::Internal});
    }
    return Result<SessionSnapshot, Error>::Ok(std::move(snapshot));
}

Result<void, Error> RequestDispatcher::EnsureAuthenticated() {
    auto snapshot = AuthorizedSnapshot();
    if (snapshot.IsErr()) {
        return Result<void, Error>::Err(std::move(snapshot).Error());
    }
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> RequestDispatcher::Execute(
    HttpMethod method,
    std::string_view path,
    const std::optional<nlohmann::json>& body) {
    const std::string api_path = ApiPath(path);
    const std::string operation = OperationName(method);
    const std::string payload = body.has_value() ? body->dump() : std::string();

    for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
        auto snapshot = AuthorizedSnapshot();
        if (snapshot.IsErr()) {
            return Result<nlohmann::json, Error>::Err(std::move(snapshot).Error());
        }
        const auto session = std::move(snapshot).Value();

        limiter_.UntilReady();

        auto response = transport_.Send(method, api_path, payload,
                                        kJsonContentType,
                                        BuildAuthHeaders(*session.state));
        if (response.IsErr()) {
            auto error = std::move(response).Error();
            error.operation = operation;
            error.endpoint = api_path;
            return Result<nlohmann::json, Error>::Err(std::move(error));
        }

        const auto& resp = response.Value();
        if (resp.status_code == 401) {
            if (attempt == kMaxAttempts) {
                LogWarn("auth", "Still unauthorized after re-login: " + api_path);
                return Result<nlohmann::json, Error>::Err(
                    Error::FromHttpStatus(operation, api_path, 401, resp.body));
            }
            LogInfo("auth", "Ticket rejected (401), re-authenticating");
            auto refreshed = coordinator_.Refresh(session.generation);
            if (refreshed.IsErr()) {
                return Result<nlohmann::json, Error>::Err(std::move(refreshed).Error());
            }
            continue;
        }

        if (!IsSuccess(resp.status_code)) {
            return Result<nlohmann::json, Error>::Err(
                Error::FromHttpStatus(operation, api_path, resp.status_code, resp.body));
        }

        if (resp.body.empty()) {
            return Result<nlohmann::json, Error>::Ok(nlohmann::json(nullptr));
        }
        auto decoded = nlohmann::json::parse(resp.body, nullptr,
                                             /*allow_exceptions=*/false);
        if (decoded.is_discarded()) {
            return Result<nlohmann::json, Error>::Err(Error{
                operation, api_path, resp.status_code,
                "Failed to parse response: body is not valid JSON",
                std::nullopt, ErrorCategory::Connection});
        }
        return Result<nlohmann::json, Error>::Ok(std::move(decoded));
    }

    // The loop either returns or continues into its final attempt, which
    // always returns.
    return Result<nlohmann::json, Error>::Err(Error{
        operation, api_path, std::nullopt, "Request attempts exhausted",
        std::nullopt, ErrorCategory::Internal});
}

} // namespace pve_session
