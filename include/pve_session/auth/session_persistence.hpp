#pragma once

#include <pve_session/auth/session_tokens.hpp>
#include <pve_session/core/result.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace pve_session {

// ---------------------------------------------------------------------------
// Session persistence
//
// File format (JSON, timestamps are whole seconds since the Unix epoch):
//   {
//     "ticket": "PVE:root@pam:4EEC61E2::...",
//     "ticket_created_at": 1700000000,
//     "csrf_token": "4EEC61E2:...",          (omitted when absent)
//     "csrf_created_at": 1700000000          (omitted when absent)
//   }
//
// Loading evaluates expiry against the lifetimes passed by the caller, never
// against anything stored in the file. Every failure is ErrorCategory::Session.
// ---------------------------------------------------------------------------

[[nodiscard]] std::string SerializeSession(const AuthenticationState& state);

[[nodiscard]] Result<AuthenticationState, Error> DeserializeSession(
    std::string_view bytes,
    std::chrono::seconds csrf_lifetime,
    std::chrono::seconds ticket_lifetime);

/// Write the serialized state to `path` with owner-only permissions (0600).
[[nodiscard]] Result<void, Error> SaveSessionFile(const std::string& path,
                                                  const AuthenticationState& state);

[[nodiscard]] Result<AuthenticationState, Error> LoadSessionFile(
    const std::string& path,
    std::chrono::seconds csrf_lifetime,
    std::chrono::seconds ticket_lifetime);

} // namespace pve_session
