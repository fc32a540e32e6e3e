#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include "dotenv/export.hpp"

namespace dotenv {

enum class ErrorCode {
    Unknown = 1,
    // Grammar errors raised while parsing a document.
    InvalidKey,
    MissingVariableName,
    MissingAssignment,
    UnterminatedString,
    // Collaborator errors.
    InvalidArgument,
    InvalidConfig,
    NotFound,
    IoError,
    EnvironmentError,
    RequiredMissing,
    ConversionFailed,
    UnsupportedType,
};

class DOTENV_API Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    Error(ErrorCode code, std::string message, std::size_t line)
        : code_(code), message_(std::move(message)), line_(line) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    /// 1-based source line the error was detected on, 0 when unknown.
    [[nodiscard]] auto line() const noexcept -> std::size_t { return line_; }

    [[nodiscard]] auto what() const -> std::string {
        std::string out;
        if (line_ != 0) {
            out = "line " + std::to_string(line_) + ": ";
        }
        out += message_;
        if (!detail_.empty()) {
            out += ": " + detail_;
        }
        return out;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
    std::size_t line_ = 0;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Build a positioned grammar error.
inline auto make_parse_error(ErrorCode code, std::string message, std::size_t line) -> Error {
    return Error(code, std::move(message), line);
}

/// True for the four codes the document parser can produce.
inline auto is_parse_error(ErrorCode code) noexcept -> bool {
    return code == ErrorCode::InvalidKey ||
           code == ErrorCode::MissingVariableName ||
           code == ErrorCode::MissingAssignment ||
           code == ErrorCode::UnterminatedString;
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidKey: return "INVALID_KEY";
        case ErrorCode::MissingVariableName: return "MISSING_VARIABLE_NAME";
        case ErrorCode::MissingAssignment: return "MISSING_ASSIGNMENT";
        case ErrorCode::UnterminatedString: return "UNTERMINATED_STRING";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::EnvironmentError: return "ENVIRONMENT_ERROR";
        case ErrorCode::RequiredMissing: return "REQUIRED_MISSING";
        case ErrorCode::ConversionFailed: return "CONVERSION_FAILED";
        case ErrorCode::UnsupportedType: return "UNSUPPORTED_TYPE";
        default: return "UNKNOWN";
    }
}

} // namespace dotenv
