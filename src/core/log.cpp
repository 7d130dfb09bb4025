#include <pve_session/core/log.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace pve_session {

namespace {

constexpr const char* kAnsiReset = "\033[0m";
constexpr const char* kAnsiDim   = "\033[90m";

struct LevelStyle {
    const char* name;   // "WARN"
    const char* tag;    // "WARN " (fixed width for the color layout)
    const char* ansi;
};

const LevelStyle& StyleOf(LogLevel level) {
    static const LevelStyle kStyles[] = {
        {"DEBUG", "DEBUG", "\033[90m"},
        {"INFO",  "INFO ", "\033[36m"},
        {"WARN",  "WARN ", "\033[33m"},
        {"ERROR", "ERROR", "\033[1;31m"},
    };
    static const LevelStyle kUnknown = {"UNKNOWN", "?????", ""};
    const auto index = static_cast<int>(level);
    if (index < 0 || index > static_cast<int>(LogLevel::Error)) return kUnknown;
    return kStyles[index];
}

// UTC with milliseconds for machine-readable output, local HH:MM:SS for the
// compact color layout.
std::string Timestamp(bool utc_with_millis) {
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::system_clock::to_time_t(now);

    std::tm parts{};
    std::ostringstream oss;
    if (utc_with_millis) {
        gmtime_r(&secs, &parts);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << millis << 'Z';
    } else {
        localtime_r(&secs, &parts);
        oss << std::put_time(&parts, "%H:%M:%S");
    }
    return oss.str();
}

// Response bodies land in debug messages verbatim and need not be UTF-8;
// invalid sequences become U+FFFD instead of failing the dump.
std::string JsonLine(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json record;
    record["ts"] = Timestamp(true);
    record["level"] = StyleOf(level).name;
    record["component"] = std::string(component);
    record["message"] = std::string(message);
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    const auto& style = StyleOf(level);
    if (!use_color_) {
        out_ << Timestamp(true) << " [" << style.name << "] [" << component
             << "] " << message << '\n';
        return;
    }

    out_ << kAnsiDim << Timestamp(false) << kAnsiReset << ' '
         << style.ansi << style.tag << kAnsiReset << ' '
         << kAnsiDim << '[' << component << ']' << kAnsiReset << ' ';
    if (level == LogLevel::Error) {
        out_ << style.ansi << message << kAnsiReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    out_ << JsonLine(level, component, message) << '\n';
}

// ---------------------------------------------------------------------------
// FileSink
// ---------------------------------------------------------------------------
FileSink::FileSink(const std::string& path)
    : path_(path), file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!file_.is_open()) return;
    // One flush per record so a crash or a concurrent tail -f never sees
    // half a line.
    file_ << JsonLine(level, component, message) << '\n';
    file_.flush();
}

// ---------------------------------------------------------------------------
// TeeSink
// ---------------------------------------------------------------------------
TeeSink::TeeSink(std::unique_ptr<ILogSink> first,
                 std::unique_ptr<ILogSink> second)
    : first_(std::move(first)), second_(std::move(second)) {}

void TeeSink::Write(LogLevel level, std::string_view component,
                    std::string_view message) {
    if (first_) first_->Write(level, component, message);
    if (second_) second_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) return;
    sink_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

bool StderrSupportsColor() {
    // https://no-color.org/
    if (std::getenv("NO_COLOR") != nullptr) return false;
    return isatty(STDERR_FILENO) != 0;
}

} // namespace pve_session
