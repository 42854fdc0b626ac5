#include <mcp_toolhost/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace mcp_toolhost {

namespace {

// Weather and similar REST APIs report failures as {"cod": ..., "message": ...}.
std::optional<std::string> ExtractUpstreamMessage(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

    auto it = parsed.find("message");
    if (it == parsed.end() || !it->is_string()) return std::nullopt;

    auto msg = it->get<std::string>();
    if (msg.empty()) return std::nullopt;
    return msg;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            int status_code,
                            const std::string& response_body) {
    auto upstream = ExtractUpstreamMessage(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Internal;
            message = "Bad request";
            break;
        case 401:
        case 403:
            category = ErrorCategory::Authentication;
            message = "Authentication failed, check the API key";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            category = ErrorCategory::Timeout;
            message = "Too many requests, retry later";
            break;
        case 500:
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Network;
            message = "Upstream service unavailable";
            break;
        default:
            category = ErrorCategory::Internal;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, message, upstream, status_code, category};
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Usage:          return 1;
        case ErrorCategory::Config:         return 2;
        case ErrorCategory::Authentication: return 3;
        case ErrorCategory::NotFound:       return 3;
        case ErrorCategory::Network:        return 4;
        case ErrorCategory::Timeout:        return 4;
        case ErrorCategory::Internal:       return 99;
    }
    return 99;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << ": " << *detail;
    }
    return oss.str();
}

} // namespace mcp_toolhost
