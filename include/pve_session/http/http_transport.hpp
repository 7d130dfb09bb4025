#pragma once

#include <pve_session/auth/credentials.hpp>
#include <pve_session/http/i_http_transport.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace pve_session {

// ---------------------------------------------------------------------------
// TransportOptions: knobs for the HTTP layer.
// ---------------------------------------------------------------------------
struct TransportOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{60};
    // Cloudflare Access service token, for endpoints published through a
    // Cloudflare tunnel. Sent as CF-Access-Client-Id: <id>.access and
    // CF-Access-Client-Secret on every request when set.
    std::optional<std::string> cf_access_client_id;
    std::optional<std::string> cf_access_client_secret;
};

// ---------------------------------------------------------------------------
// HttpTransport: IHttpTransport implementation using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header. Each request
// runs on its own httplib::Client so concurrent callers never serialize on
// a shared connection. Certificate verification follows the descriptor's
// AcceptInvalidCerts() flag.
// ---------------------------------------------------------------------------
class HttpTransport : public IHttpTransport {
public:
    HttpTransport(const CredentialDescriptor& descriptor,
                  const TransportOptions& options = {});

    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;
    HttpTransport(HttpTransport&&) = delete;
    HttpTransport& operator=(HttpTransport&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Put(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Delete(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pve_session
