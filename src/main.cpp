#include <pve_session/client/pve_client.hpp>
#include <pve_session/config/config_loader.hpp>
#include <pve_session/core/log.hpp>
#include <pve_session/core/version.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage   = 4;

enum class Command {
    Login,
    Status,
    Get,
    Post,
    Put,
    Delete,
};

struct CommandParse {
    Command cmd;
    std::string path;     // empty for login/status
    int consumed;         // argv tokens taken by command + path
};

void PrintUsage(std::ostream& out) {
    out << "Usage: pve-session <command> [path] [flags]\n"
           "\n"
           "Commands:\n"
           "  login              Authenticate and save the session file\n"
           "  status             Show whether the saved session is still usable\n"
           "  get <path>         GET /api2/json/<path>\n"
           "  post <path>        POST /api2/json/<path> (body from --data)\n"
           "  put <path>         PUT /api2/json/<path> (body from --data)\n"
           "  delete <path>      DELETE /api2/json/<path>\n"
           "\n"
           "Run 'pve-session <command> --help' for the list of flags.\n";
}

// Check for --version before the first positional argument.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "pve-session " << pve_session::kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

pve_session::Result<CommandParse, pve_session::Error> ParseCommand(
    int argc, const char* const* argv) {
    using R = pve_session::Result<CommandParse, pve_session::Error>;
    auto usage_error = [](const std::string& message) {
        return pve_session::Error{"ParseCommand", "", std::nullopt, message,
                                  std::nullopt, pve_session::ErrorCategory::Validation};
    };

    std::string_view name{argv[1]};
    if (name == "login") return R::Ok(CommandParse{Command::Login, "", 1});
    if (name == "status") return R::Ok(CommandParse{Command::Status, "", 1});

    Command cmd = Command::Get;
    if (name == "get") {
        cmd = Command::Get;
    } else if (name == "post") {
        cmd = Command::Post;
    } else if (name == "put") {
        cmd = Command::Put;
    } else if (name == "delete") {
        cmd = Command::Delete;
    } else {
        return R::Err(usage_error("Unknown command '" + std::string(name) + "'"));
    }

    if (argc < 3 || argv[2][0] == '-') {
        return R::Err(usage_error("Command '" + std::string(name) +
                                  "' requires a resource path"));
    }
    return R::Ok(CommandParse{cmd, argv[2], 2});
}

// Build argv without the command and path tokens, so LoadFromCli sees plain flags.
std::vector<const char*> StripCommand(int argc, const char* const* argv, int consumed) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 1 + consumed; i < argc; ++i) {
        stripped.push_back(argv[i]);
    }
    return stripped;
}

void PrintError(const pve_session::Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

void InitLogging(const pve_session::AppConfig& config) {
    using namespace pve_session;

    auto level = LogLevel::Warn;
    if (config.verbose) level = LogLevel::Debug;
    if (config.quiet) level = LogLevel::Error;

    std::unique_ptr<ILogSink> sink =
        std::make_unique<ColorConsoleSink>(StderrSupportsColor());
    if (config.log_file.has_value()) {
        auto file_sink = std::make_unique<FileSink>(*config.log_file);
        if (file_sink->IsOpen()) {
            sink = std::make_unique<TeeSink>(std::move(sink), std::move(file_sink));
        } else {
            std::cerr << "Warning: cannot open log file " << file_sink->Path() << "\n";
        }
    }
    InitGlobalLogger(std::move(sink), level);
}

pve_session::Result<pve_session::AppConfig, pve_session::Error> BuildConfig(
    int argc, const char* const* argv) {
    using namespace pve_session;
    using R = Result<AppConfig, Error>;

    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        return cli_result;
    }
    auto config = std::move(cli_result).Value();

    if (config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*config.config_file);
        if (yaml_result.IsErr()) {
            return yaml_result;
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
    }

    auto resolved = ResolvePasswordEnv(std::move(config));
    if (resolved.IsErr()) {
        return resolved;
    }
    config = ResolveCloudflareEnv(std::move(resolved).Value());

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return R::Err(valid.Error());
    }
    return R::Ok(std::move(config));
}

int RunLogin(pve_session::PveClient& client, const std::string& session_file,
             bool json_output) {
    auto login = client.Login();
    if (login.IsErr()) {
        PrintError(login.Error(), json_output);
        return login.Error().ExitCode();
    }
    auto saved = client.SaveSession(session_file);
    if (saved.IsErr()) {
        PrintError(saved.Error(), json_output);
        return saved.Error().ExitCode();
    }

    nlohmann::json out;
    out["authenticated"] = true;
    out["user"] = client.Descriptor().UserId();
    out["session_file"] = session_file;
    std::cout << out.dump(2) << "\n";
    return kExitSuccess;
}

int RunStatus(pve_session::PveClient& client, const std::string& session_file,
              bool json_output) {
    auto loaded = client.LoadSession(session_file);
    if (loaded.IsErr()) {
        PrintError(loaded.Error(), json_output);
        return loaded.Error().ExitCode();
    }

    nlohmann::json out;
    out["authenticated"] = client.IsAuthenticated();
    out["user"] = client.Descriptor().UserId();
    out["ticket_expired"] = client.IsTicketExpired();
    out["csrf_expired"] = client.IsCsrfExpired();
    out["session_file"] = session_file;
    std::cout << out.dump(2) << "\n";
    return kExitSuccess;
}

int RunRequest(pve_session::PveClient& client, const CommandParse& command,
               const pve_session::AppConfig& config,
               const std::string& session_file) {
    using namespace pve_session;

    nlohmann::json body = nlohmann::json::object();
    if (config.request_data.has_value()) {
        if (command.cmd != Command::Post && command.cmd != Command::Put) {
            PrintError(Error{"ParseCommand", "", std::nullopt,
                             "--data is only valid for post and put",
                             std::nullopt, ErrorCategory::Validation},
                       config.json_output);
            return kExitUsage;
        }
        body = nlohmann::json::parse(*config.request_data, nullptr,
                                     /*allow_exceptions=*/false);
        if (body.is_discarded()) {
            PrintError(Error{"ParseCommand", "", std::nullopt,
                             "--data is not valid JSON", std::nullopt,
                             ErrorCategory::Validation},
                       config.json_output);
            return kExitUsage;
        }
    }

    auto loaded = client.LoadSession(session_file);
    if (loaded.IsErr()) {
        LogInfo("session", "No usable saved session (" + loaded.Error().message +
                               "), logging in");
    }

    Result<nlohmann::json, Error> result = [&] {
        switch (command.cmd) {
            case Command::Post:   return client.Post(command.path, body);
            case Command::Put:    return client.Put(command.path, body);
            case Command::Delete: return client.Delete(command.path);
            default:              return client.Get(command.path);
        }
    }();

    // Persist whatever session the call ended with, refreshed or not.
    auto saved = client.SaveSession(session_file);
    if (saved.IsErr()) {
        LogWarn("session", saved.Error().ToString());
    }

    if (result.IsErr()) {
        PrintError(result.Error(), config.json_output);
        return result.Error().ExitCode();
    }
    std::cout << result.Value().dump(2) << "\n";
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace pve_session;

    if (argc == 1) {
        PrintUsage(std::cout);
        return kExitSuccess;
    }
    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }
    auto first = std::string_view{argv[1]};
    if (first == "--help" || first == "-h") {
        PrintUsage(std::cout);
        return kExitSuccess;
    }

    auto parsed = ParseCommand(argc, argv);
    if (parsed.IsErr()) {
        PrintError(parsed.Error(), false);
        PrintUsage(std::cerr);
        return parsed.Error().ExitCode();
    }
    const auto command = std::move(parsed).Value();

    auto stripped = StripCommand(argc, argv, command.consumed);
    auto config_result = BuildConfig(static_cast<int>(stripped.size()), stripped.data());
    if (config_result.IsErr()) {
        PrintError(config_result.Error(), false);
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    InitLogging(config);

    const auto session_file = ResolveSessionFilePath(config);
    PveClient client(ToCredentialDescriptor(config), ToSessionConfig(config),
                     ToTransportOptions(config));

    switch (command.cmd) {
        case Command::Login:
            return RunLogin(client, session_file, config.json_output);
        case Command::Status:
            return RunStatus(client, session_file, config.json_output);
        default:
            return RunRequest(client, command, config, session_file);
    }
}
