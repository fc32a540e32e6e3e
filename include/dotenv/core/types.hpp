#pragma once

#include <map>
#include <string>

namespace dotenv {

/// Variable name -> value. Keys are unique; a later definition replaces
/// an earlier one.
using EnvMap = std::map<std::string, std::string>;

} // namespace dotenv
