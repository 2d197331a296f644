#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "protocol/invocation_contract.hpp"

namespace askai::protocol {

    enum class CliCommand {
        Run,         // perform an operation on text
        Call,        // send a raw prompt
        Test,        // probe provider connectivity
        Operations,  // list operations
        Check        // report configuration issues
    };

    // Validated command-line input
    struct CliRequest {
        CliCommand command = CliCommand::Run;
        std::string operation_id;
        std::optional<std::string> text;  // read from stdin when unset
        ParamMap params;
        std::optional<std::string> provider_id;
        std::string prompt;
        std::optional<std::string> config_path;
        std::optional<std::chrono::milliseconds> timeout;
        bool verbose = false;
    };

} // namespace askai::protocol
