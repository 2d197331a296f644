#pragma once
#include <string>
#include "protocol/cli_request.hpp"
#include "core/errors/askai_errors.hpp"

namespace askai::app::cli {
    askai::core::errors::Result<askai::protocol::CliRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
