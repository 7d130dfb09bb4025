#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace pve_session {

// Prefix of every Proxmox VE JSON API path.
inline constexpr std::string_view kApiPrefix = "/api2/json/";

// Render "scheme://host:port". IPv6 literals are wrapped in brackets.
std::string BuildBaseUrl(bool use_https, const std::string& host, uint16_t port);

// Join a caller-relative resource path onto the API prefix:
//   "nodes/pve1/status"  -> "/api2/json/nodes/pve1/status"
//   "/cluster/resources" -> "/api2/json/cluster/resources"
// Paths that already start with the API prefix are returned unchanged.
std::string ApiPath(std::string_view relative_path);

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// Append "?k1=v1&k2=v2" (encoded) to a path. Empty params leave it unchanged.
std::string AppendQuery(std::string path,
                        const std::map<std::string, std::string>& params);

} // namespace pve_session
