#include <pve_session/http/i_http_transport.hpp>

namespace pve_session {

const char* HttpMethodName(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

Result<HttpResponse, Error> IHttpTransport::Send(HttpMethod method,
                                                 std::string_view path,
                                                 std::string_view body,
                                                 std::string_view content_type,
                                                 const HttpHeaders& headers) {
    switch (method) {
        case HttpMethod::Get:    return Get(path, headers);
        case HttpMethod::Post:   return Post(path, body, content_type, headers);
        case HttpMethod::Put:    return Put(path, body, content_type, headers);
        case HttpMethod::Delete: return Delete(path, headers);
    }
    return Get(path, headers);
}

} // namespace pve_session
