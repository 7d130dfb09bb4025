#include <pve_session/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace pve_session {

std::string BuildBaseUrl(bool use_https, const std::string& host, uint16_t port) {
    std::string url = use_https ? "https://" : "http://";
    if (host.find(':') != std::string::npos && host.front() != '[') {
        url += "[" + host + "]";
    } else {
        url += host;
    }
    url += ":" + std::to_string(port);
    return url;
}

std::string ApiPath(std::string_view relative_path) {
    if (relative_path.substr(0, kApiPrefix.size()) == kApiPrefix) {
        return std::string(relative_path);
    }
    while (!relative_path.empty() && relative_path.front() == '/') {
        relative_path.remove_prefix(1);
    }
    return std::string(kApiPrefix) + std::string(relative_path);
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string AppendQuery(std::string path,
                        const std::map<std::string, std::string>& params) {
    if (params.empty()) return path;
    char sep = path.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : params) {
        path += sep;
        path += UrlEncode(key) + "=" + UrlEncode(value);
        sep = '&';
    }
    return path;
}

} // namespace pve_session
