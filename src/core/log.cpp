#include <mcp_toolhost/core/log.hpp>
#include <mcp_toolhost/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcp_toolhost {

namespace {

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return ansi::kReset;
}

// UTC with milliseconds, e.g. 2025-03-26T14:30:00.123Z.
std::string Timestamp() {
    using std::chrono::system_clock;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string PlainLine(const LogRecord& r) {
    std::string line = Timestamp();
    line += " [";
    line += LevelName(r.level);
    line += "] [";
    line.append(r.component.data(), r.component.size());
    line += "] ";
    line.append(r.message.data(), r.message.size());
    line += '\n';
    return line;
}

// Messages can carry raw protocol input, so invalid UTF-8 is replaced
// instead of failing the dump.
std::string JsonLine(const LogRecord& r) {
    nlohmann::json j = {
        {"ts", Timestamp()},
        {"level", LevelName(r.level)},
        {"component", std::string(r.component)},
        {"message", std::string(r.message)},
    };
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

// HH:MM:SS LEVEL [component] message, level padded to five columns.
std::string ColorLine(const LogRecord& r) {
    const std::time_t secs = std::time(nullptr);
    std::tm local{};
    localtime_r(&secs, &local);

    const char* color = LevelColor(r.level);
    std::ostringstream oss;
    oss << ansi::kDim << std::put_time(&local, "%T") << ansi::kReset << ' '
        << color << std::left << std::setw(5) << LevelName(r.level) << ansi::kReset << ' '
        << ansi::kDim << '[' << r.component << ']' << ansi::kReset << ' ';
    if (r.level == LogLevel::Error) {
        oss << color << r.message << ansi::kReset;
    } else {
        oss << r.message;
    }
    oss << '\n';
    return oss.str();
}

class NullSink : public ILogSink {
public:
    void Write(const LogRecord&) override {}
};

std::unique_ptr<Logger>& GlobalLoggerSlot() {
    static auto logger = std::make_unique<Logger>(std::make_unique<NullSink>(),
                                                  LogLevel::Error);
    return logger;
}

} // anonymous namespace

ConsoleSink::ConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ConsoleSink::Write(const LogRecord& record) {
    out_ << (use_color_ ? ColorLine(record) : PlainLine(record));
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    out_ << JsonLine(record);
}

FileSink::FileSink(const std::string& path, bool json_lines)
    : file_(path, std::ios::out | std::ios::app), json_lines_(json_lines) {}

void FileSink::Write(const LogRecord& record) {
    if (!file_.is_open()) return;
    file_ << (json_lines_ ? JsonLine(record) : PlainLine(record));
    file_.flush();
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    if (level < min_level_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    sink_->Write(LogRecord{level, component, message});
}

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLoggerSlot()->Log(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLoggerSlot()->Log(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLoggerSlot()->Log(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLoggerSlot()->Log(LogLevel::Error, component, message);
}

} // namespace mcp_toolhost
