#pragma once

#include <pve_session/auth/credentials.hpp>
#include <pve_session/config/app_config.hpp>
#include <pve_session/core/result.hpp>
#include <pve_session/http/http_transport.hpp>
#include <pve_session/http/request_dispatcher.hpp>

#include <string>
#include <string_view>

namespace pve_session {

// Environment variables consulted by ResolveCloudflareEnv.
inline constexpr const char* kCfAccessClientIdEnv = "CF_ACCESS_CLIENT_ID";
inline constexpr const char* kCfAccessClientSecretEnv = "CF_ACCESS_CLIENT_SECRET";

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI flags (no command or path) into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Resolve password_env: if password is empty and password_env is set,
// read the environment variable and populate password.
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config);

// Fill unset Cloudflare Access credentials from CF_ACCESS_CLIENT_ID and
// CF_ACCESS_CLIENT_SECRET. Never overrides configured values.
AppConfig ResolveCloudflareEnv(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Session file path with a leading "~/" expanded from $HOME. Falls back to
// "$HOME/.pve-session.json" when none is configured.
std::string ResolveSessionFilePath(const AppConfig& config);

CredentialDescriptor ToCredentialDescriptor(const AppConfig& config);
SessionConfig ToSessionConfig(const AppConfig& config);
TransportOptions ToTransportOptions(const AppConfig& config);

} // namespace pve_session
