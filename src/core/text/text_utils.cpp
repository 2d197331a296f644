#include "core/text/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace askai::core::text {

namespace {

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string trim(const std::string& value) {
    const auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    if (begin == value.end()) {
        return "";
    }
    const auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    return std::string(begin, end);
}

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), is_space);
}

std::string expand_home(const std::string& path) {
    const char* home = std::getenv("HOME");
    if (home == nullptr || path.empty()) {
        return path;
    }

    std::string expanded = path;
    if (expanded[0] == '~' && (expanded.size() == 1 || expanded[1] == '/')) {
        expanded = std::string(home) + expanded.substr(1);
    }

    const std::string token = "$HOME";
    std::size_t pos = expanded.find(token);
    while (pos != std::string::npos) {
        expanded.replace(pos, token.size(), home);
        pos = expanded.find(token, pos + std::char_traits<char>::length(home));
    }
    return expanded;
}

std::string format_seconds(const double seconds) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3f", seconds);
    std::string formatted(buffer);
    while (!formatted.empty() && formatted.back() == '0') {
        formatted.pop_back();
    }
    if (!formatted.empty() && formatted.back() == '.') {
        formatted.pop_back();
    }
    return formatted;
}

}  // namespace askai::core::text
