#pragma once

// Standard library
#include <string>

namespace fitsview {
/// Returns the value of the named environment variable, or an empty string.
std::string const get_env(char const* name);

/// Returns the value of the named environment variable, or @c def when it is
/// unset or empty.
std::string const get_env(char const* name, std::string const& def);
}  // namespace fitsview
