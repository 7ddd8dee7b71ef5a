#include "Logger.hxx"

// External APIs
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

// Standard library
#include <memory>

namespace fitsview {
namespace logger {
namespace {
void install(spdlog::sink_ptr sink, spdlog::level::level_enum level) {
    sink->set_pattern(FITSVIEW_LOGGER_PATTERN);

    auto default_logger = std::make_shared<spdlog::logger>(FITSVIEW_LOGGER_TAG, sink);
    default_logger->set_level(level);
    default_logger->flush_on(spdlog::level::warn);

    spdlog::drop(FITSVIEW_LOGGER_TAG);
    spdlog::register_logger(default_logger);
    spdlog::set_default_logger(default_logger);
}
}  // namespace

void init_bootstrap_logger() {
    install(std::make_shared<spdlog::sinks::stderr_sink_mt>(), spdlog::level::info);
}

void init_logger(Config const& config) {
    spdlog::sink_ptr sink;
    if (config.log_file.empty()) {
        // The web server copies standard error into its own error log
        sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file);
    }
    install(sink, config.log_level);
}

void flush() {
    spdlog::default_logger()->flush();
}
}  // namespace logger
}  // namespace fitsview
