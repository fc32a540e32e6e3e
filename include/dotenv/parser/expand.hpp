#pragma once

#include <string>
#include <string_view>

#include "dotenv/core/types.hpp"
#include "dotenv/export.hpp"

namespace dotenv::parser {

/// Substitute `${NAME}` and then `$NAME` references in `value` with entries
/// from `env`.
///
/// The braced form is resolved over the whole value first; the bare form
/// then runs over that result. Unknown names are left verbatim and
/// substituted text is never rescanned.
DOTENV_API auto expand_variables(std::string_view value, const EnvMap& env) -> std::string;

} // namespace dotenv::parser
