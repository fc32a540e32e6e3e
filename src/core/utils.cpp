#include "dotenv/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace dotenv::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto starts_with(std::string_view s, std::string_view prefix) -> bool {
    return s.starts_with(prefix);
}

} // namespace dotenv::utils
