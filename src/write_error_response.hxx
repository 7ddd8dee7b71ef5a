#pragma once

// Standard library
#include <exception>
#include <ostream>
#include <string>

namespace fitsview {
void write_error_response(std::ostream& stream, std::string const& protocol,
                          std::exception const& e, bool include_body = true);
void write_error_response(std::ostream& stream, std::string const& protocol,
                          bool include_body = true);
}  // namespace fitsview
