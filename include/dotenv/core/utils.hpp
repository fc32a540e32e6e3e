#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "dotenv/export.hpp"

namespace dotenv::utils {

DOTENV_API auto trim(std::string_view s) -> std::string;
DOTENV_API auto split(std::string_view s, char delim) -> std::vector<std::string>;
DOTENV_API auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;
DOTENV_API auto to_lower(std::string_view s) -> std::string;
DOTENV_API auto starts_with(std::string_view s, std::string_view prefix) -> bool;

} // namespace dotenv::utils
