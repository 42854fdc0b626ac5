#pragma once

#include <cassert>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace mcp_toolhost {

// ---------------------------------------------------------------------------
// Result<T, E>: the outcome of a fallible startup or upstream operation.
//
// Config loading, tool-list loading and weather lookups return one of these;
// callers branch on IsOk() and read Value() or Error() accordingly.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result Err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return outcome_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return !IsOk(); }

    // Value()/Error() on the wrong alternative is a programming error.
    [[nodiscard]] const T& Value() const& {
        assert(IsOk());
        return std::get<0>(outcome_);
    }
    [[nodiscard]] T Value() && {
        assert(IsOk());
        return std::get<0>(std::move(outcome_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr());
        return std::get<1>(outcome_);
    }
    [[nodiscard]] E Error() && {
        assert(IsErr());
        return std::get<1>(std::move(outcome_));
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : outcome_(tag, std::forward<V>(v)) {}

    std::variant<T, E> outcome_;
};

// Success carries nothing; only the error is stored.
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_; }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr());
        return *error_;
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: decides the process exit code when startup fails.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Config,
    Usage,
    Authentication,
    NotFound,
    Network,
    Timeout,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error for startup and handler-side operations.
//
// Protocol-level failures never use this type; they are expressed as
// JSON-RPC error objects (see mcp/json_rpc.hpp).
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string message;
    std::optional<std::string> detail;
    std::optional<int> http_status;
    ErrorCategory category = ErrorCategory::Internal;

    /// Map an upstream HTTP status to an Error. The upstream JSON body's
    /// "message" field, when present, becomes the detail.
    static Error FromHttpStatus(const std::string& operation,
                                int status_code,
                                const std::string& response_body = "");

    [[nodiscard]] int ExitCode() const;

    // "operation (HTTP n): message: detail", omitting absent parts.
    [[nodiscard]] std::string ToString() const;
};

} // namespace mcp_toolhost
