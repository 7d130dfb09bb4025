#include <pve_session/http/http_transport.hpp>
#include <pve_session/core/log.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace pve_session {

namespace {

Error MakeTransportError(const std::string& operation,
                         const std::string& endpoint,
                         const std::string& message) {
    return Error{operation, endpoint, std::nullopt, message, std::nullopt,
                 ErrorCategory::Connection};
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool IsSensitiveHeader(std::string_view key) {
    const auto lower_key = ToLower(key);
    return lower_key == "cookie" ||
           lower_key == "set-cookie" ||
           lower_key == "authorization" ||
           lower_key == "csrfpreventiontoken" ||
           lower_key == "cf-access-client-secret";
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug("http", "  > " + k + ": <redacted>");
        } else {
            LogDebug("http", "  > " + k + ": " + v);
        }
    }
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    // Bodies of successful responses may carry tickets; only error bodies
    // are logged.
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: pimpl body holding connection settings and default headers.
// ---------------------------------------------------------------------------
struct HttpTransport::Impl {
    std::string base_url;
    bool use_https;
    bool accept_invalid_certs;
    TransportOptions options;
    httplib::Headers default_headers;

    Impl(const CredentialDescriptor& descriptor, const TransportOptions& opts)
        : base_url(descriptor.BaseUrl()),
          use_https(descriptor.UseHttps()),
          accept_invalid_certs(descriptor.AcceptInvalidCerts()),
          options(opts) {
        if (opts.cf_access_client_id.has_value() &&
            !opts.cf_access_client_id->empty()) {
            default_headers.emplace("CF-Access-Client-Id",
                                    *opts.cf_access_client_id + ".access");
            if (opts.cf_access_client_secret.has_value() &&
                !opts.cf_access_client_secret->empty()) {
                default_headers.emplace("CF-Access-Client-Secret",
                                        *opts.cf_access_client_secret);
            }
        }
    }

    std::unique_ptr<httplib::Client> MakeClient() const {
        auto client = std::make_unique<httplib::Client>(base_url);
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
        client->set_write_timeout(options.read_timeout);
        if (use_https && accept_invalid_certs) {
            client->enable_server_certificate_verification(false);
        }
        return client;
    }

    httplib::Headers BuildHeaders(const HttpHeaders& extra) const {
        httplib::Headers hdrs = default_headers;
        for (const auto& [key, value] : extra) {
            hdrs.emplace(key, value);
        }
        return hdrs;
    }

    Result<HttpResponse, Error> Execute(HttpMethod method,
                                        std::string_view path,
                                        std::string_view body,
                                        std::string_view content_type,
                                        const HttpHeaders& extra_headers) const {
        const std::string path_str(path);
        const auto hdrs = BuildHeaders(extra_headers);
        LogInfo("http", std::string(HttpMethodName(method)) + " " + path_str);
        LogRequestHeaders(hdrs);

        auto client = MakeClient();
        auto res = [&]() -> httplib::Result {
            switch (method) {
                case HttpMethod::Post:
                    return client->Post(path_str, hdrs, std::string(body),
                                        std::string(content_type));
                case HttpMethod::Put:
                    return client->Put(path_str, hdrs, std::string(body),
                                       std::string(content_type));
                case HttpMethod::Delete:
                    return client->Delete(path_str, hdrs);
                case HttpMethod::Get:
                    break;
            }
            return client->Get(path_str, hdrs);
        }();

        if (!res) {
            return Result<HttpResponse, Error>::Err(MakeTransportError(
                HttpMethodName(method), path_str,
                "HTTP request failed: " + httplib::to_string(res.error())));
        }
        LogResponse(res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }
};

// ---------------------------------------------------------------------------
// HttpTransport
// ---------------------------------------------------------------------------
HttpTransport::HttpTransport(const CredentialDescriptor& descriptor,
                             const TransportOptions& options)
    : impl_(std::make_unique<Impl>(descriptor, options)) {}

HttpTransport::~HttpTransport() = default;

Result<HttpResponse, Error> HttpTransport::Get(std::string_view path,
                                               const HttpHeaders& headers) {
    return impl_->Execute(HttpMethod::Get, path, {}, {}, headers);
}

Result<HttpResponse, Error> HttpTransport::Post(std::string_view path,
                                                std::string_view body,
                                                std::string_view content_type,
                                                const HttpHeaders& headers) {
    return impl_->Execute(HttpMethod::Post, path, body, content_type, headers);
}

Result<HttpResponse, Error> HttpTransport::Put(std::string_view path,
                                               std::string_view body,
                                               std::string_view content_type,
                                               const HttpHeaders& headers) {
    return impl_->Execute(HttpMethod::Put, path, body, content_type, headers);
}

Result<HttpResponse, Error> HttpTransport::Delete(std::string_view path,
                                                  const HttpHeaders& headers) {
    return impl_->Execute(HttpMethod::Delete, path, {}, {}, headers);
}

} // namespace pve_session
