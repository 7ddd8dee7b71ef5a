#include "get_env.hxx"

// Standard library
#include <cstdlib>

namespace fitsview {
std::string const get_env(char const* name) {
    char const* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string const get_env(char const* name, std::string const& def) {
    char const* value = std::getenv(name);
    return (value && *value) ? std::string(value) : def;
}
}  // namespace fitsview
