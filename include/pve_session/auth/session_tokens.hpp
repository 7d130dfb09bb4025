#pragma once

#include <pve_session/core/result.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace pve_session {

using Clock = std::chrono::system_clock;

inline constexpr std::string_view kTicketCookieName = "PVEAuthCookie";
inline constexpr std::string_view kCsrfHeaderName = "CSRFPreventionToken";

// ---------------------------------------------------------------------------
// Ticket: validated Proxmox VE session ticket.
//
// Format: PVE:USER@REALM:ID::SIGNATURE
//   - 1..4096 characters
//   - prefix "PVE"
//   - exactly one '@' separating non-empty user and realm
//   - ID is hexadecimal, followed by an empty segment ("::")
//   - signature is non-empty base64 ([A-Za-z0-9+/=])
//
// The value is never mutated after Create(). Expiry is evaluated against a
// caller-supplied lifetime; the ticket itself never self-invalidates.
// ---------------------------------------------------------------------------
class Ticket {
public:
    static Result<Ticket, Error> Create(std::string_view value,
                                        Clock::time_point created_at = Clock::now());

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] Clock::time_point CreatedAt() const noexcept { return created_at_; }

    /// True once more than `lifetime` has elapsed since creation. A
    /// creation time in the future (clock rewind/skew) counts as expired.
    [[nodiscard]] bool IsExpired(std::chrono::seconds lifetime) const;

    /// "PVEAuthCookie=<ticket>", the value of the Cookie header.
    [[nodiscard]] std::string AsCookieHeader() const;

    bool operator==(const Ticket& other) const { return value_ == other.value_; }
    bool operator!=(const Ticket& other) const { return value_ != other.value_; }

private:
    Ticket(std::string value, Clock::time_point created_at)
        : value_(std::move(value)), created_at_(created_at) {}

    std::string value_;
    Clock::time_point created_at_;
};

// ---------------------------------------------------------------------------
// CsrfToken: validated CSRFPreventionToken.
//
// Format: TOKENID:VALUE
//   - 1..1024 characters
//   - TOKENID is exactly 8 hexadecimal digits
//   - VALUE is non-empty base64 ([A-Za-z0-9+/=])
// ---------------------------------------------------------------------------
class CsrfToken {
public:
    static Result<CsrfToken, Error> Create(std::string_view value,
                                           Clock::time_point created_at = Clock::now());

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] Clock::time_point CreatedAt() const noexcept { return created_at_; }

    [[nodiscard]] bool IsExpired(std::chrono::seconds lifetime) const;

    /// "CSRFPreventionToken: <value>".
    [[nodiscard]] std::string AsHeader() const;

    bool operator==(const CsrfToken& other) const { return value_ == other.value_; }
    bool operator!=(const CsrfToken& other) const { return value_ != other.value_; }

private:
    CsrfToken(std::string value, Clock::time_point created_at)
        : value_(std::move(value)), created_at_(created_at) {}

    std::string value_;
    Clock::time_point created_at_;
};

// ---------------------------------------------------------------------------
// AuthenticationState: the ticket plus the optional CSRF token issued with
// it. Held exclusively by SessionStore; everyone else works on copies.
// ---------------------------------------------------------------------------
struct AuthenticationState {
    Ticket ticket;
    std::optional<CsrfToken> csrf_token;
};

// Shared expiry rule: age > lifetime, and a negative age is expired.
bool IsPastLifetime(Clock::time_point created_at,
                    std::chrono::seconds lifetime,
                    Clock::time_point now = Clock::now());

} // namespace pve_session
