#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <source_location>
#include <format>

namespace diffdb {

// Error category for classification
enum class ErrorCategory {
    None,
    InvalidArgument,        // Bad caller input (e.g. unknown open permission)
    NotFound,               // Required rows missing from the result file
    ReferentialIntegrity,   // Row references an id that was never loaded
    Parse,                  // Stored value does not match its expected format
    Database,               // Any SQLite failure, message passed through
    Internal
};

[[nodiscard]] constexpr std::string_view category_name(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:                 return "none";
        case ErrorCategory::InvalidArgument:      return "invalid argument";
        case ErrorCategory::NotFound:             return "not found";
        case ErrorCategory::ReferentialIntegrity: return "referential integrity";
        case ErrorCategory::Parse:                return "parse";
        case ErrorCategory::Database:             return "database";
        case ErrorCategory::Internal:             return "internal";
    }
    return "unknown";
}

// Error type with context
class Error {
public:
    Error() = default;

    explicit Error(std::string_view message,
                   ErrorCategory category = ErrorCategory::Internal,
                   std::source_location loc = std::source_location::current())
        : message_(message)
        , category_(category)
        , file_(loc.file_name())
        , line_(loc.line())
        , function_(loc.function_name())
    {}

    Error(std::string message,
          ErrorCategory category = ErrorCategory::Internal,
          std::source_location loc = std::source_location::current())
        : message_(std::move(message))
        , category_(category)
        , file_(loc.file_name())
        , line_(loc.line())
        , function_(loc.function_name())
    {}

    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }
    [[nodiscard]] std::string_view file() const noexcept { return file_; }
    [[nodiscard]] std::uint32_t line() const noexcept { return line_; }
    [[nodiscard]] std::string_view function() const noexcept { return function_; }

    [[nodiscard]] std::string format() const {
        return std::format("[{}:{}] {} ({}): {}",
                           file_, line_, function_, category_name(category_), message_);
    }

    // Chain errors, keeping the category and the original failure site
    [[nodiscard]] Error with_context(std::string_view context) const {
        return Error(std::format("{}: {}", context, message_), category_, file_, line_, function_);
    }

private:
    Error(std::string message, ErrorCategory category,
          std::string_view file, std::uint32_t line, std::string_view function)
        : message_(std::move(message))
        , category_(category)
        , file_(file)
        , line_(line)
        , function_(function)
    {}

    std::string message_;
    ErrorCategory category_{ErrorCategory::None};
    std::string_view file_;
    std::uint32_t line_{0};
    std::string_view function_;
};

// Result type alias using std::expected
template<typename T>
using Result = std::expected<T, Error>;

// Helper macros for error propagation
#define DIFFDB_TRY(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) return std::unexpected(_result.error()); \
        std::move(*_result); \
    })

#define DIFFDB_TRY_VOID(expr) \
    do { \
        auto&& _result = (expr); \
        if (!_result) return std::unexpected(_result.error()); \
    } while(0)

// Convenience error constructors
inline Error invalid_argument_error(std::string_view msg, std::source_location loc = std::source_location::current()) {
    return Error(msg, ErrorCategory::InvalidArgument, loc);
}

inline Error not_found_error(std::string_view msg, std::source_location loc = std::source_location::current()) {
    return Error(msg, ErrorCategory::NotFound, loc);
}

inline Error integrity_error(std::string_view msg, std::source_location loc = std::source_location::current()) {
    return Error(msg, ErrorCategory::ReferentialIntegrity, loc);
}

inline Error parse_error(std::string_view msg, std::source_location loc = std::source_location::current()) {
    return Error(msg, ErrorCategory::Parse, loc);
}

inline Error database_error(std::string_view msg, std::source_location loc = std::source_location::current()) {
    return Error(msg, ErrorCategory::Database, loc);
}

inline Error internal_error(std::string_view msg, std::source_location loc = std::source_location::current()) {
    return Error(msg, ErrorCategory::Internal, loc);
}

} // namespace diffdb
