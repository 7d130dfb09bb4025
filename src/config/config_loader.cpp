#include <pve_session/config/config_loader.hpp>

#include <pve_session/core/log.hpp>
#include <pve_session/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace pve_session {

namespace {

constexpr const char* kDefaultSessionFileName = ".pve-session.json";

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Validation};
}

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        // -- Connection --
        if (root["connection"]) {
            const auto& conn = root["connection"];
            if (conn["host"]) {
                config.connection.host = conn["host"].as<std::string>();
            }
            if (conn["port"]) {
                config.connection.port = conn["port"].as<uint16_t>();
            }
            if (conn["https"]) {
                config.connection.use_https = conn["https"].as<bool>();
            }
            if (conn["accept_invalid_certs"]) {
                config.connection.accept_invalid_certs =
                    conn["accept_invalid_certs"].as<bool>();
            }
            if (conn["user"]) {
                config.connection.user = conn["user"].as<std::string>();
            }
            if (conn["realm"]) {
                config.connection.realm = conn["realm"].as<std::string>();
            }
            if (conn["password"]) {
                config.connection.password = conn["password"].as<std::string>();
            }
            if (conn["password_env"]) {
                config.connection.password_env = conn["password_env"].as<std::string>();
            }
            if (conn["cf_access_client_id"]) {
                config.connection.cf_access_client_id =
                    conn["cf_access_client_id"].as<std::string>();
            }
            if (conn["cf_access_client_secret"]) {
                config.connection.cf_access_client_secret =
                    conn["cf_access_client_secret"].as<std::string>();
            }
        }

        // -- Session --
        if (root["session"]) {
            const auto& session = root["session"];
            if (session["ticket_lifetime"]) {
                config.session.ticket_lifetime_seconds = session["ticket_lifetime"].as<int>();
            }
            if (session["csrf_lifetime"]) {
                config.session.csrf_lifetime_seconds = session["csrf_lifetime"].as<int>();
            }
            if (session["file"]) {
                config.session.file = session["file"].as<std::string>();
            }
        }

        // -- Rate limit --
        if (root["rate_limit"]) {
            const auto& rl = root["rate_limit"];
            if (!rl["requests_per_second"] || !rl["burst_size"]) {
                return Result<AppConfig, Error>::Err(MakeConfigError(
                    "rate_limit requires both 'requests_per_second' and 'burst_size'"));
            }
            config.rate_limit = RateLimitSettings{
                rl["requests_per_second"].as<int>(),
                rl["burst_size"].as<int>(),
            };
        }

        // -- Timeouts --
        if (root["timeouts"]) {
            const auto& timeouts = root["timeouts"];
            if (timeouts["connect"]) {
                config.connect_timeout_seconds = timeouts["connect"].as<int>();
            }
            if (timeouts["read"]) {
                config.read_timeout_seconds = timeouts["read"].as<int>();
            }
        }

        // -- Options --
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("pve-session", kVersion,
                                     argparse::default_arguments::help);

    // Connection flags
    program.add_argument("--host")
        .help("Proxmox VE hostname or address");
    program.add_argument("--port")
        .help("API port (default 8006)")
        .scan<'i', int>();
    program.add_argument("--https")
        .help("Use HTTPS (default)")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--http")
        .help("Use plain HTTP")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--insecure")
        .help("Accept invalid or self-signed certificates")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--user")
        .help("Username without realm");
    program.add_argument("--realm")
        .help("Authentication realm (pam, pve, ...)");
    program.add_argument("--password")
        .help("Password");
    program.add_argument("--password-env")
        .help("Environment variable containing the password");

    // Session flags
    program.add_argument("--session-file")
        .help("Session file path (default ~/.pve-session.json)");
    program.add_argument("--rate")
        .help("Client-side request limit per second")
        .scan<'i', int>();
    program.add_argument("--burst")
        .help("Burst size for --rate")
        .scan<'i', int>();

    // Request flags
    program.add_argument("--data")
        .help("JSON request body for post/put");

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    } catch (const std::invalid_argument& e) {
        // Numeric flags with a non-numeric value.
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    // Connection
    if (auto val = program.present("--host")) {
        config.connection.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        if (*val <= 0 || *val > 65535) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --port: " + std::to_string(*val)));
        }
        config.connection.port = static_cast<uint16_t>(*val);
    }
    if (program.get<bool>("--https") && program.get<bool>("--http")) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Cannot use both --https and --http"));
    }
    if (program.get<bool>("--https")) {
        config.connection.use_https = true;
    }
    if (program.get<bool>("--http")) {
        config.connection.use_https = false;
    }
    if (program.get<bool>("--insecure")) {
        config.connection.accept_invalid_certs = true;
    }
    if (auto val = program.present("--user")) {
        config.connection.user = *val;
    }
    if (auto val = program.present("--realm")) {
        config.connection.realm = *val;
    }
    if (auto val = program.present("--password")) {
        config.connection.password = *val;
    }
    if (auto val = program.present("--password-env")) {
        config.connection.password_env = *val;
    }

    // Session
    if (auto val = program.present("--session-file")) {
        config.session.file = *val;
    }
    auto rate = program.present<int>("--rate");
    auto burst = program.present<int>("--burst");
    if (burst.has_value() && !rate.has_value()) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("--burst requires --rate"));
    }
    if (rate.has_value()) {
        // Without an explicit burst, allow one request at a time.
        config.rate_limit = RateLimitSettings{*rate, burst.value_or(1)};
    }

    // Request
    if (auto val = program.present("--data")) {
        config.request_data = *val;
    }

    // Options
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;
    const AppConfig defaults;

    // Connection overrides
    if (!cli_overrides.connection.host.empty()) {
        merged.connection.host = cli_overrides.connection.host;
    }
    if (cli_overrides.connection.port.has_value()) {
        merged.connection.port = cli_overrides.connection.port;
    }
    if (cli_overrides.connection.use_https.has_value()) {
        merged.connection.use_https = cli_overrides.connection.use_https;
    }
    if (cli_overrides.connection.accept_invalid_certs) {
        merged.connection.accept_invalid_certs = true;
    }
    if (!cli_overrides.connection.user.empty()) {
        merged.connection.user = cli_overrides.connection.user;
    }
    if (!cli_overrides.connection.realm.empty()) {
        merged.connection.realm = cli_overrides.connection.realm;
    }
    if (!cli_overrides.connection.password.empty()) {
        merged.connection.password = cli_overrides.connection.password;
    }
    if (cli_overrides.connection.password_env.has_value()) {
        merged.connection.password_env = cli_overrides.connection.password_env;
    }
    if (cli_overrides.connection.cf_access_client_id.has_value()) {
        merged.connection.cf_access_client_id = cli_overrides.connection.cf_access_client_id;
    }
    if (cli_overrides.connection.cf_access_client_secret.has_value()) {
        merged.connection.cf_access_client_secret =
            cli_overrides.connection.cf_access_client_secret;
    }

    // Session
    if (cli_overrides.session.ticket_lifetime_seconds !=
        defaults.session.ticket_lifetime_seconds) {
        merged.session.ticket_lifetime_seconds = cli_overrides.session.ticket_lifetime_seconds;
    }
    if (cli_overrides.session.csrf_lifetime_seconds !=
        defaults.session.csrf_lifetime_seconds) {
        merged.session.csrf_lifetime_seconds = cli_overrides.session.csrf_lifetime_seconds;
    }
    if (cli_overrides.session.file.has_value()) {
        merged.session.file = cli_overrides.session.file;
    }
    if (cli_overrides.rate_limit.has_value()) {
        merged.rate_limit = cli_overrides.rate_limit;
    }

    // Timeouts
    if (cli_overrides.connect_timeout_seconds != defaults.connect_timeout_seconds) {
        merged.connect_timeout_seconds = cli_overrides.connect_timeout_seconds;
    }
    if (cli_overrides.read_timeout_seconds != defaults.read_timeout_seconds) {
        merged.read_timeout_seconds = cli_overrides.read_timeout_seconds;
    }

    // Options
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.request_data.has_value()) {
        merged.request_data = cli_overrides.request_data;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolvePasswordEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config) {
    if (config.connection.password.empty() &&
        config.connection.password_env.has_value()) {
        const auto& env_var = *config.connection.password_env;
        auto env_val = GetEnv(env_var.c_str());
        if (!env_val.has_value()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by password_env)"));
        }
        config.connection.password = std::move(*env_val);
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ResolveCloudflareEnv
// ---------------------------------------------------------------------------
AppConfig ResolveCloudflareEnv(AppConfig config) {
    if (!config.connection.cf_access_client_id.has_value()) {
        config.connection.cf_access_client_id = GetEnv(kCfAccessClientIdEnv);
    }
    if (!config.connection.cf_access_client_secret.has_value()) {
        config.connection.cf_access_client_secret = GetEnv(kCfAccessClientSecretEnv);
    }
    if (config.connection.cf_access_client_id.has_value()) {
        LogDebug("config", "Cloudflare Access service token configured");
    }
    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.connection.host.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: host"));
    }
    if (config.connection.port == uint16_t{0}) {
        return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
    }
    if (config.connection.user.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: user"));
    }
    if (config.connection.realm.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: realm"));
    }
    if (config.connection.password.empty() &&
        !config.connection.password_env.has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: password or password_env"));
    }
    if (config.connection.cf_access_client_id.has_value() !=
        config.connection.cf_access_client_secret.has_value()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Cloudflare Access requires both client id and client secret"));
    }
    if (config.session.ticket_lifetime_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("ticket_lifetime must be positive, got " +
                            std::to_string(config.session.ticket_lifetime_seconds)));
    }
    if (config.session.csrf_lifetime_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("csrf_lifetime must be positive, got " +
                            std::to_string(config.session.csrf_lifetime_seconds)));
    }
    if (config.rate_limit.has_value()) {
        if (config.rate_limit->requests_per_second <= 0) {
            return Result<void, Error>::Err(
                MakeConfigError("requests_per_second must be positive, got " +
                                std::to_string(config.rate_limit->requests_per_second)));
        }
        if (config.rate_limit->burst_size <= 0) {
            return Result<void, Error>::Err(
                MakeConfigError("burst_size must be positive, got " +
                                std::to_string(config.rate_limit->burst_size)));
        }
    }
    if (config.connect_timeout_seconds <= 0 || config.read_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError("Timeouts must be positive"));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Conversions
// ---------------------------------------------------------------------------
std::string ResolveSessionFilePath(const AppConfig& config) {
    const auto home = GetEnv("HOME").value_or(".");
    if (!config.session.file.has_value()) {
        return home + "/" + kDefaultSessionFileName;
    }
    const auto& file = *config.session.file;
    if (file.size() >= 2 && file[0] == '~' && file[1] == '/') {
        return home + file.substr(1);
    }
    return file;
}

CredentialDescriptor ToCredentialDescriptor(const AppConfig& config) {
    const auto& conn = config.connection;
    return CredentialDescriptor(conn.host, conn.port.value_or(kDefaultPort),
                                conn.use_https.value_or(true),
                                conn.user, conn.password, conn.realm,
                                conn.accept_invalid_certs);
}

SessionConfig ToSessionConfig(const AppConfig& config) {
    SessionConfig session;
    session.ticket_lifetime = std::chrono::seconds(config.session.ticket_lifetime_seconds);
    session.csrf_lifetime = std::chrono::seconds(config.session.csrf_lifetime_seconds);
    if (config.rate_limit.has_value()) {
        session.rate_limit = RateLimitConfig{
            static_cast<uint32_t>(config.rate_limit->requests_per_second),
            static_cast<uint32_t>(config.rate_limit->burst_size),
        };
    }
    return session;
}

TransportOptions ToTransportOptions(const AppConfig& config) {
    TransportOptions options;
    options.connect_timeout = std::chrono::seconds(config.connect_timeout_seconds);
    options.read_timeout = std::chrono::seconds(config.read_timeout_seconds);
    options.cf_access_client_id = config.connection.cf_access_client_id;
    options.cf_access_client_secret = config.connection.cf_access_client_secret;
    return options;
}

} // namespace pve_session
