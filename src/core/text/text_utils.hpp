#pragma once

#include <string>

namespace askai::core::text {

// Removes leading and trailing whitespace (spaces, tabs, CR, LF, VT, FF).
std::string trim(const std::string& value);

bool is_blank(const std::string& value);

// Expands a leading "~" and any "$HOME" using the HOME environment variable.
// The input is returned unchanged when HOME is not set.
std::string expand_home(const std::string& path);

// Formats a duration in seconds without trailing zeros: 30 -> "30",
// 0.25 -> "0.25".
std::string format_seconds(double seconds);

}  // namespace askai::core::text
