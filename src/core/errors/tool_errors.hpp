#pragma once
#include <string>
#include <variant>
#include <utility>

namespace cloudctx::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        UnknownTool,             // Tool name not present in the registry
        MissingRequiredArgument, // Schema-required argument absent
        TypeMismatch,            // Argument has the wrong JSON type
        InvalidArgument,         // Enum, pattern or bounds violation
        CommandNotFound,         // External program not on the search path
        CommandTimedOut,         // External program ran past its timeout
        CommandNonZeroExit,      // External program reported failure
        MalformedCommandOutput,  // Program succeeded but stdout was not JSON
        ExtractionError,         // Expected vendor structure absent or empty
        ResolutionError,         // Dependent lookup yielded nothing
        Input,                   // Server command-line usage error
        Internal                 // Pipe/fork failure or unexpected exception
    };

    // The standardized error payload
    struct ToolError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a ToolError.
    template <typename T>
    using Result = std::variant<T, ToolError>;

    // Result for operations that produce nothing on success.
    using Status = Result<std::monostate>;

    inline Status ok() { return std::monostate{}; }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ToolError>(result);
    }

    template <typename T>
    const ToolError& get_error(const Result<T>& result) {
        return std::get<ToolError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::UnknownTool: return "unknown_tool";
            case ErrorCategory::MissingRequiredArgument: return "missing_required_argument";
            case ErrorCategory::TypeMismatch: return "type_mismatch";
            case ErrorCategory::InvalidArgument: return "invalid_argument";
            case ErrorCategory::CommandNotFound: return "command_not_found";
            case ErrorCategory::CommandTimedOut: return "command_timed_out";
            case ErrorCategory::CommandNonZeroExit: return "command_non_zero_exit";
            case ErrorCategory::MalformedCommandOutput: return "malformed_command_output";
            case ErrorCategory::ExtractionError: return "extraction_error";
            case ErrorCategory::ResolutionError: return "resolution_error";
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace cloudctx::core::errors
