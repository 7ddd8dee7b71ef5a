#include "Config.hxx"

// Local headers
#include "HttpException.hxx"
#include "get_env.hxx"

// External APIs
#include <fmt/format.h>

#ifndef FITSVIEW_DATA_ROOT
#define FITSVIEW_DATA_ROOT "/data"
#endif

namespace fitsview {
spdlog::level::level_enum parse_log_level(std::string const& name) {
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str() maps every unrecognized name to off
    if (level == spdlog::level::off && name != "off") {
        throw HTTP_EXCEPT(HttpResponseCode::INTERNAL_SERVER_ERROR,
                          fmt::format("Invalid FITSVIEW_LOG_LEVEL value: '{}'", name));
    }
    return level;
}

/** Builds the configuration from FITSVIEW_DATA_ROOT, FITSVIEW_LOG_LEVEL and
 * FITSVIEW_LOG_FILE, falling back on compiled-in defaults.
 */
Config Config::from_environment() {
    Config config;
    config.data_root = fs::path(get_env("FITSVIEW_DATA_ROOT", FITSVIEW_DATA_ROOT));
    config.log_level = parse_log_level(get_env("FITSVIEW_LOG_LEVEL", "info"));
    config.log_file = get_env("FITSVIEW_LOG_FILE");
    return config;
}
}  // namespace fitsview
