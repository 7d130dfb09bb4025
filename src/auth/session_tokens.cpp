#include <pve_session/auth/session_tokens.hpp>

#include <algorithm>
#include <cctype>
#include <vector>

namespace pve_session {

namespace {

constexpr size_t kMaxTicketLength = 4096;
constexpr size_t kMaxCsrfLength = 1024;
constexpr size_t kCsrfIdLength = 8;

Error MakeValidationError(const std::string& operation, const std::string& message) {
    return Error{operation, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Validation};
}

std::vector<std::string_view> SplitColon(std::string_view s) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        auto pos = s.find(':', start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool IsHex(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

bool IsBase64(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '+' || c == '/' || c == '=';
    });
}

bool HasSpaceOrControl(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c) != 0 || std::iscntrl(c) != 0;
    });
}

} // anonymous namespace

bool IsPastLifetime(Clock::time_point created_at,
                    std::chrono::seconds lifetime,
                    Clock::time_point now) {
    if (now < created_at) {
        return true;
    }
    return (now - created_at) > lifetime;
}

// ---------------------------------------------------------------------------
// Ticket
// ---------------------------------------------------------------------------
Result<Ticket, Error> Ticket::Create(std::string_view value,
                                     Clock::time_point created_at) {
    const std::string op = "Ticket";
    if (value.empty()) {
        return Result<Ticket, Error>::Err(
            MakeValidationError(op, "Ticket must not be empty"));
    }
    if (value.size() > kMaxTicketLength) {
        return Result<Ticket, Error>::Err(MakeValidationError(
            op, "Ticket must be at most " + std::to_string(kMaxTicketLength) +
                    " characters, got " + std::to_string(value.size())));
    }

    auto parts = SplitColon(value);
    if (parts.size() < 5 || parts[0] != "PVE") {
        return Result<Ticket, Error>::Err(MakeValidationError(
            op, "Invalid ticket format: must start with 'PVE:' and have at least 5 parts"));
    }

    const auto user_realm = parts[1];
    const auto at = user_realm.find('@');
    if (at == std::string_view::npos || at == 0 || at + 1 == user_realm.size() ||
        user_realm.find('@', at + 1) != std::string_view::npos ||
        HasSpaceOrControl(user_realm)) {
        return Result<Ticket, Error>::Err(
            MakeValidationError(op, "Invalid user@realm segment in ticket"));
    }

    if (parts[2].empty() || !IsHex(parts[2])) {
        return Result<Ticket, Error>::Err(
            MakeValidationError(op, "Ticket ID must be hexadecimal"));
    }
    if (!parts[3].empty()) {
        return Result<Ticket, Error>::Err(
            MakeValidationError(op, "Ticket ID must be followed by '::'"));
    }

    // Everything after "ID::" is the signature.
    const auto sig_offset = static_cast<size_t>(parts[4].data() - value.data());
    const auto signature = value.substr(sig_offset);
    if (signature.empty()) {
        return Result<Ticket, Error>::Err(
            MakeValidationError(op, "Ticket signature must not be empty"));
    }
    if (!IsBase64(signature)) {
        return Result<Ticket, Error>::Err(
            MakeValidationError(op, "Ticket signature contains invalid characters"));
    }

    return Result<Ticket, Error>::Ok(Ticket(std::string(value), created_at));
}

bool Ticket::IsExpired(std::chrono::seconds lifetime) const {
    return IsPastLifetime(created_at_, lifetime);
}

std::string Ticket::AsCookieHeader() const {
    return std::string(kTicketCookieName) + "=" + value_;
}

// ---------------------------------------------------------------------------
// CsrfToken
// ---------------------------------------------------------------------------
Result<CsrfToken, Error> CsrfToken::Create(std::string_view value,
                                           Clock::time_point created_at) {
    const std::string op = "CsrfToken";
    if (value.empty()) {
        return Result<CsrfToken, Error>::Err(
            MakeValidationError(op, "CSRF token must not be empty"));
    }
    if (value.size() > kMaxCsrfLength) {
        return Result<CsrfToken, Error>::Err(MakeValidationError(
            op, "CSRF token must be at most " + std::to_string(kMaxCsrfLength) +
                    " characters, got " + std::to_string(value.size())));
    }

    auto parts = SplitColon(value);
    if (parts.size() != 2) {
        return Result<CsrfToken, Error>::Err(MakeValidationError(
            op, "CSRF token must be in format TOKENID:VALUE"));
    }
    if (parts[0].size() != kCsrfIdLength || !IsHex(parts[0])) {
        return Result<CsrfToken, Error>::Err(MakeValidationError(
            op, "Token ID must be 8 hexadecimal characters"));
    }
    if (parts[1].empty()) {
        return Result<CsrfToken, Error>::Err(
            MakeValidationError(op, "Token value must not be empty"));
    }
    if (!IsBase64(parts[1])) {
        return Result<CsrfToken, Error>::Err(MakeValidationError(
            op, "Token value contains invalid characters"));
    }

    return Result<CsrfToken, Error>::Ok(CsrfToken(std::string(value), created_at));
}

bool CsrfToken::IsExpired(std::chrono::seconds lifetime) const {
    return IsPastLifetime(created_at_, lifetime);
}

std::string CsrfToken::AsHeader() const {
    return std::string(kCsrfHeaderName) + ": " + value_;
}

} // namespace pve_session
