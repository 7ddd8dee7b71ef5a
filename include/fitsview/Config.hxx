#pragma once

// Local headers
#include "fitsview_filesystem.hxx"

// External APIs
#include <spdlog/spdlog.h>

// Standard library
#include <string>

namespace fitsview {
/** Process settings, read once from the environment at startup.
 */
struct Config {
    /// Directory that logical request paths are resolved against.
    fs::path data_root;
    spdlog::level::level_enum log_level = spdlog::level::info;
    /// Log file to append to; empty means standard error.
    std::string log_file;

    static Config from_environment();
};

/// Parses a log level name (@c trace through @c off).
spdlog::level::level_enum parse_log_level(std::string const& name);
}  // namespace fitsview
