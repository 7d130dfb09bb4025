#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pve_session {

inline constexpr uint16_t kDefaultPort = 8006;

struct ConnectionConfig {
    std::string host;
    std::optional<uint16_t> port;            // unset means kDefaultPort
    std::optional<bool> use_https;           // unset means HTTPS
    bool accept_invalid_certs = false;
    std::string user;
    std::string realm;
    std::string password;
    std::optional<std::string> password_env; // env var name to read password from
    std::optional<std::string> cf_access_client_id;
    std::optional<std::string> cf_access_client_secret;
};

struct SessionSettings {
    int ticket_lifetime_seconds = 7200;
    int csrf_lifetime_seconds = 300;
    std::optional<std::string> file;
};

struct RateLimitSettings {
    int requests_per_second = 0;
    int burst_size = 0;
};

struct AppConfig {
    ConnectionConfig connection;
    SessionSettings session;
    std::optional<RateLimitSettings> rate_limit;
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 60;
    std::optional<std::string> config_file;
    std::optional<std::string> request_data;  // JSON body for post/put
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
};

} // namespace pve_session
