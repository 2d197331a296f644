#pragma once
#include <string>
#include <variant>

namespace askai::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., empty text, unknown operation or provider
        Execution,  // E.g., the request was cancelled
        Provider,   // E.g., the provider CLI timed out or exited nonzero
        Internal    // E.g., pipe/fork failure
    };

    // The standardized error payload. `code` carries the failure kind
    // ("timeout", "unknown_provider", ...); `message` is shown to the user.
    struct AskAiError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. A Result holds either a value of type T, OR an AskAiError.
    template <typename T>
    using Result = std::variant<T, AskAiError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AskAiError>(result);
    }

    template <typename T>
    const AskAiError& get_error(const Result<T>& result) {
        return std::get<AskAiError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Provider failures are recovered by trying the next provider in the chain.
    inline bool is_retryable(const AskAiError& error) {
        return error.category == ErrorCategory::Provider;
    }

} // namespace askai::core::errors
