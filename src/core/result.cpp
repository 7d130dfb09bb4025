#include <pve_session/core/result.hpp>

#include <nlohmann/json.hpp>

namespace pve_session {

namespace {

constexpr size_t kMaxBodyExcerpt = 512;

// Proxmox reports API failures as JSON, either as a top-level "message"
// string or as an "errors" object mapping parameter names to messages:
//   {"data":null,"errors":{"vmid":"value must be at least 100"}}
std::optional<std::string> ExtractServerError(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    if (j.contains("errors") && j["errors"].is_object() && !j["errors"].empty()) {
        std::string joined;
        for (const auto& [field, msg] : j["errors"].items()) {
            if (!joined.empty()) joined += "; ";
            joined += field + ": " +
                      (msg.is_string() ? msg.get<std::string>() : msg.dump());
        }
        return joined;
    }
    if (j.contains("message") && j["message"].is_string()) {
        auto msg = j["message"].get<std::string>();
        if (!msg.empty()) return msg;
    }
    return std::nullopt;
}

std::string BodyExcerpt(const std::string& body) {
    if (body.empty()) return "<empty body>";
    if (body.size() <= kMaxBodyExcerpt) return body;
    return body.substr(0, kMaxBodyExcerpt) + "... (truncated)";
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto server_error = ExtractServerError(response_body);

    if (status_code == 401) {
        return Error{operation, endpoint, status_code,
                     "Unauthorized after ticket refresh",
                     server_error, ErrorCategory::Authentication};
    }

    return Error{operation, endpoint, status_code,
                 "API error (" + std::to_string(status_code) + "): " +
                     BodyExcerpt(response_body),
                 server_error, ErrorCategory::Connection};
}

std::string Error::ToJson() const {
    nlohmann::json inner;
    inner["category"] = CategoryName();
    inner["operation"] = operation;
    if (!endpoint.empty()) {
        inner["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        inner["http_status"] = *http_status;
    }
    inner["message"] = message;
    if (server_error.has_value() && !server_error->empty()) {
        inner["server_error"] = *server_error;
    }
    inner["exit_code"] = ExitCode();

    nlohmann::json out;
    out["error"] = std::move(inner);
    return out.dump();
}

} // namespace pve_session
