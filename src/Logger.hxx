#pragma once

// Local headers
#include "Config.hxx"

#define FITSVIEW_LOGGER_TAG "fitsview"
#define FITSVIEW_LOGGER_PATTERN "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [pid %P] %v"

namespace fitsview {
namespace logger {
/// Routes the spdlog default logger to standard error until the
/// configuration has been read. Standard output carries the response.
void init_bootstrap_logger();

/// Installs the process-wide @c fitsview logger as the spdlog default.
void init_logger(Config const& config);

void flush();
}  // namespace logger
}  // namespace fitsview
