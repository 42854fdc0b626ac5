#include <mcp_toolhost/mcp/transport.hpp>

#include <mcp_toolhost/core/log.hpp>

namespace mcp_toolhost {

StreamTransport::StreamTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

std::optional<std::string> StreamTransport::ReadMessage() {
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    // Hosts on Windows terminate lines with CRLF.
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

bool StreamTransport::WriteMessage(std::string_view message) {
    out_ << message << '\n';
    out_.flush();
    if (!out_) {
        LogError("transport", "Failed to write to the output stream");
        return false;
    }
    return true;
}

} // namespace mcp_toolhost
