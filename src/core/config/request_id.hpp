#pragma once
#include <string>
#include <random>
#include <sstream>

namespace askai::core::config {

    // Generates an 8-character hex ID prefixed with "req-", used to tag the
    // log lines of one request.
    inline std::string generate_request_id() {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "req-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace askai::core::config
