#pragma once

#include <pve_session/core/url.hpp>

#include <cstdint>
#include <string>

namespace pve_session {

// ---------------------------------------------------------------------------
// CredentialDescriptor: immutable connection facts for one Proxmox VE
// endpoint. Values arrive already validated by the configuration layer;
// the descriptor is never mutated after construction and needs no
// synchronization.
// ---------------------------------------------------------------------------
class CredentialDescriptor {
public:
    CredentialDescriptor(std::string host,
                         uint16_t port,
                         bool use_https,
                         std::string username,
                         std::string password,
                         std::string realm,
                         bool accept_invalid_certs = false)
        : host_(std::move(host)),
          port_(port),
          use_https_(use_https),
          username_(std::move(username)),
          password_(std::move(password)),
          realm_(std::move(realm)),
          accept_invalid_certs_(accept_invalid_certs),
          base_url_(BuildBaseUrl(use_https_, host_, port_)) {}

    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] uint16_t Port() const noexcept { return port_; }
    [[nodiscard]] bool UseHttps() const noexcept { return use_https_; }
    [[nodiscard]] const std::string& Username() const noexcept { return username_; }
    [[nodiscard]] const std::string& Password() const noexcept { return password_; }
    [[nodiscard]] const std::string& Realm() const noexcept { return realm_; }
    [[nodiscard]] bool AcceptInvalidCerts() const noexcept { return accept_invalid_certs_; }

    /// "scheme://host:port" without a trailing slash.
    [[nodiscard]] const std::string& BaseUrl() const noexcept { return base_url_; }

    /// "user@realm", the identity Proxmox embeds in issued tickets.
    [[nodiscard]] std::string UserId() const { return username_ + "@" + realm_; }

private:
    std::string host_;
    uint16_t port_;
    bool use_https_;
    std::string username_;
    std::string password_;
    std::string realm_;
    bool accept_invalid_certs_;
    std::string base_url_;
};

} // namespace pve_session
