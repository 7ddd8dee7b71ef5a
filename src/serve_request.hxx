#pragma once

// Standard library
#include <ostream>

namespace fitsview {
/// Serves the CGI request described by the process environment, writing the
/// non-parsed-header response to @a out. Returns the process exit status.
int serve_request(int argc, char const* const* argv, std::ostream& out);
}  // namespace fitsview
