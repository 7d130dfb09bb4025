#pragma once

#include <pve_session/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace pve_session {

// ---------------------------------------------------------------------------
// HttpHeaders: key-value pairs for HTTP headers.
// Header names are case-sensitive in this representation; callers normalise
// as needed.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse: the result of an HTTP request that reached the server.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

enum class HttpMethod {
    Get,
    Post,
    Put,
    Delete,
};

const char* HttpMethodName(HttpMethod method);

// ---------------------------------------------------------------------------
// IHttpTransport: abstract HTTP interface under the login exchange and the
// request dispatcher.
//
// Paths are absolute on the server ("/api2/json/..."); the transport owns
// the base URL. Any non-transport outcome (including 4xx/5xx) is returned as
// Ok(HttpResponse); Err is reserved for DNS, TCP, TLS and timeout failures,
// always with ErrorCategory::Connection.
//
// Implementations must tolerate concurrent calls from multiple threads.
// ---------------------------------------------------------------------------
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    // Non-copyable, non-movable (polymorphic base).
    IHttpTransport(const IHttpTransport&) = delete;
    IHttpTransport& operator=(const IHttpTransport&) = delete;
    IHttpTransport(IHttpTransport&&) = delete;
    IHttpTransport& operator=(IHttpTransport&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Put(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Delete(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

    /// Dispatch on a runtime verb. Bodies are ignored for GET and DELETE.
    [[nodiscard]] Result<HttpResponse, Error> Send(
        HttpMethod method,
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers);

protected:
    IHttpTransport() = default;
};

} // namespace pve_session
