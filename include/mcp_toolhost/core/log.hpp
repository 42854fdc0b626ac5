#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace mcp_toolhost {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// One log event as handed to a sink.
struct LogRecord {
    LogLevel level;
    std::string_view component;
    std::string_view message;
};

// Where log records go. No sink may ever write to stdout: stdout carries
// the protocol stream.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Human-readable lines for a terminal, ANSI-colored when use_color is set.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;

private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"component","level","message","ts"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(const LogRecord& record) override;

private:
    std::ostream& out_;
};

// Appends to a log file, plain or JSON lines. A file that cannot be opened
// leaves the sink closed and every Write is dropped.
class FileSink : public ILogSink {
public:
    FileSink(const std::string& path, bool json_lines);

    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }
    void Write(const LogRecord& record) override;

private:
    std::ofstream file_;
    bool json_lines_;
};

// Filters by level and serializes writes to the sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void Log(LogLevel level, std::string_view component, std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    const LogLevel min_level_;
    std::mutex mutex_;
};

/// Install the process-wide logger. Until this is called, logging is a no-op.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace mcp_toolhost
