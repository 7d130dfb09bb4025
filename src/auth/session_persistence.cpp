#include <pve_session/auth/session_persistence.hpp>
#include <pve_session/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

#include <sys/stat.h>

namespace pve_session {

namespace {

Error MakeSessionError(const std::string& operation,
                       const std::string& endpoint,
                       const std::string& message) {
    return Error{operation, endpoint, std::nullopt, message, std::nullopt,
                 ErrorCategory::Session};
}

int64_t ToEpochSeconds(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(
               tp.time_since_epoch()).count();
}

// Largest epoch second representable as a Clock::time_point.
constexpr int64_t kMaxEpochSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count();

// Callers range-check `secs` against [0, kMaxEpochSeconds] first.
Clock::time_point FromEpochSeconds(int64_t secs) {
    return Clock::time_point(std::chrono::seconds(secs));
}

// Epoch seconds from a JSON integer, or nullopt when the value does not fit
// in a time_point.
std::optional<int64_t> ReadEpochSeconds(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        const auto secs = value.get<uint64_t>();
        if (secs > static_cast<uint64_t>(kMaxEpochSeconds)) {
            return std::nullopt;
        }
        return static_cast<int64_t>(secs);
    }
    const auto secs = value.get<int64_t>();
    if (secs < 0 || secs > kMaxEpochSeconds) {
        return std::nullopt;
    }
    return secs;
}

// Fetch a required string + timestamp pair from the session object.
Result<std::pair<std::string, Clock::time_point>, Error> ReadTokenFields(
    const nlohmann::json& j, const char* value_key, const char* created_key) {
    using R = Result<std::pair<std::string, Clock::time_point>, Error>;
    if (!j.contains(value_key) || !j[value_key].is_string()) {
        return R::Err(MakeSessionError("DeserializeSession", "",
                                       std::string("Missing or non-string '") +
                                           value_key + "'"));
    }
    if (!j.contains(created_key) || !j[created_key].is_number_integer()) {
        return R::Err(MakeSessionError("DeserializeSession", "",
                                       std::string("Missing or non-integer '") +
                                           created_key + "'"));
    }
    const auto secs = ReadEpochSeconds(j[created_key]);
    if (!secs.has_value()) {
        return R::Err(MakeSessionError("DeserializeSession", "",
                                       std::string("Out-of-range '") +
                                           created_key + "'"));
    }
    return R::Ok(std::make_pair(j[value_key].get<std::string>(),
                                FromEpochSeconds(*secs)));
}

} // anonymous namespace

std::string SerializeSession(const AuthenticationState& state) {
    nlohmann::json j;
    j["ticket"] = state.ticket.Value();
    j["ticket_created_at"] = ToEpochSeconds(state.ticket.CreatedAt());
    if (state.csrf_token.has_value()) {
        j["csrf_token"] = state.csrf_token->Value();
        j["csrf_created_at"] = ToEpochSeconds(state.csrf_token->CreatedAt());
    }
    return j.dump();
}

Result<AuthenticationState, Error> DeserializeSession(
    std::string_view bytes,
    std::chrono::seconds csrf_lifetime,
    std::chrono::seconds ticket_lifetime) {
    using R = Result<AuthenticationState, Error>;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(bytes);
    } catch (const nlohmann::json::parse_error& e) {
        return R::Err(MakeSessionError("DeserializeSession", "",
                                       "Malformed JSON: " + std::string(e.what())));
    }
    if (!j.is_object()) {
        return R::Err(MakeSessionError("DeserializeSession", "",
                                       "Session data must be a JSON object"));
    }

    auto ticket_fields = ReadTokenFields(j, "ticket", "ticket_created_at");
    if (ticket_fields.IsErr()) {
        return R::Err(std::move(ticket_fields).Error());
    }
    auto [ticket_value, ticket_created] = std::move(ticket_fields).Value();
    auto ticket = Ticket::Create(ticket_value, ticket_created);
    if (ticket.IsErr()) {
        return R::Err(MakeSessionError("DeserializeSession", "",
                                       "Invalid ticket: " + ticket.Error().message));
    }

    std::optional<CsrfToken> csrf;
    if (j.contains("csrf_token") && !j["csrf_token"].is_null()) {
        auto csrf_fields = ReadTokenFields(j, "csrf_token", "csrf_created_at");
        if (csrf_fields.IsErr()) {
            return R::Err(std::move(csrf_fields).Error());
        }
        auto [csrf_value, csrf_created] = std::move(csrf_fields).Value();
        auto token = CsrfToken::Create(csrf_value, csrf_created);
        if (token.IsErr()) {
            return R::Err(MakeSessionError("DeserializeSession", "",
                                           "Invalid CSRF token: " + token.Error().message));
        }
        csrf = std::move(token).Value();
    }

    if (csrf.has_value() && csrf->IsExpired(csrf_lifetime)) {
        return R::Err(MakeSessionError("DeserializeSession", "",
                                       "Loaded CSRF token is expired"));
    }
    if (ticket.Value().IsExpired(ticket_lifetime)) {
        return R::Err(MakeSessionError("DeserializeSession", "",
                                       "Loaded ticket is expired"));
    }

    return R::Ok(AuthenticationState{std::move(ticket).Value(), std::move(csrf)});
}

Result<void, Error> SaveSessionFile(const std::string& path,
                                    const AuthenticationState& state) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        return Result<void, Error>::Err(
            MakeSessionError("SaveSession", path, "Failed to open file for writing"));
    }
    // Restrict to owner read/write before any token bytes hit the disk.
    if (::chmod(path.c_str(), S_IRUSR | S_IWUSR) != 0) {
        return Result<void, Error>::Err(MakeSessionError(
            "SaveSession", path,
            "Failed to restrict file permissions: " + std::string(std::strerror(errno))));
    }
    ofs << SerializeSession(state);
    ofs.flush();
    if (!ofs) {
        return Result<void, Error>::Err(
            MakeSessionError("SaveSession", path, "Failed to write session file"));
    }
    LogInfo("session", "Session saved to " + path);
    return Result<void, Error>::Ok();
}

Result<AuthenticationState, Error> LoadSessionFile(
    const std::string& path,
    std::chrono::seconds csrf_lifetime,
    std::chrono::seconds ticket_lifetime) {
    std::ifstream ifs(path);
    if (!ifs) {
        return Result<AuthenticationState, Error>::Err(
            MakeSessionError("LoadSession", path, "Failed to open session file"));
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();

    auto state = DeserializeSession(buffer.str(), csrf_lifetime, ticket_lifetime);
    if (state.IsErr()) {
        auto error = std::move(state).Error();
        error.operation = "LoadSession";
        error.endpoint = path;
        return Result<AuthenticationState, Error>::Err(std::move(error));
    }
    LogInfo("session", "Session restored from " + path);
    return state;
}

} // namespace pve_session
