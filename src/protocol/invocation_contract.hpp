#pragma once

#include <map>
#include <optional>
#include <string>
#include "core/errors/askai_errors.hpp"

namespace askai::protocol {

// Named request parameters, e.g. {"language", "French"} or {"prompt", "..."}.
using ParamMap = std::map<std::string, std::string>;

// One text operation requested by a caller.
struct InvocationRequest {
    std::string operation_id;
    std::string text;
    ParamMap params;
    std::optional<std::string> provider_id;  // default provider when unset
};

// Success carries the provider's trimmed output.
using InvocationResult = core::errors::Result<std::string>;

// Flattened (success, text) pair handed to presentation code.
struct OperationOutcome {
    bool success = false;
    std::string text;
};

inline OperationOutcome to_outcome(const InvocationResult& result) {
    if (core::errors::is_error(result)) {
        return OperationOutcome{false, core::errors::get_error(result).message};
    }
    return OperationOutcome{true, core::errors::get_value(result)};
}

}  // namespace askai::protocol
