#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_toolhost {

// ---------------------------------------------------------------------------
// ITransport: one protocol message per line.
//
// The transport carries protocol bytes only; diagnostics go to the logger.
// Both calls block. There is no buffering of responses: a written message is
// flushed before WriteMessage returns.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;

    // Returns the next line without its terminator, or nullopt at end of stream.
    virtual std::optional<std::string> ReadMessage() = 0;

    // Writes one message followed by '\n'. Returns false if the peer is gone.
    virtual bool WriteMessage(std::string_view message) = 0;

protected:
    ITransport() = default;
};

// ---------------------------------------------------------------------------
// StreamTransport: newline-delimited messages over a pair of iostreams
// (stdin/stdout in production, string streams in tests).
// ---------------------------------------------------------------------------
class StreamTransport : public ITransport {
public:
    explicit StreamTransport(std::istream& in = std::cin,
                             std::ostream& out = std::cout);

    std::optional<std::string> ReadMessage() override;
    bool WriteMessage(std::string_view message) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace mcp_toolhost
