#include "serve_request.hxx"

// Local headers
#include "Config.hxx"
#include "Environment.hxx"
#include "HttpException.hxx"
#include "Logger.hxx"
#include "PathResolver.hxx"
#include "handlers.hxx"
#include "write_error_response.hxx"

// External APIs
#include <spdlog/spdlog.h>

// Standard library
#include <string>

namespace fitsview {
int serve_request(int argc, char const* const* argv, std::ostream& out) {
    // Nothing may reach standard output ahead of the status line
    logger::init_bootstrap_logger();

    std::string protocol;
    bool include_body = true;
    try {
        Environment env(argc, argv);
        protocol = env.get_server_protocol();
        include_body = env.get_request_method() != "HEAD";
        Config const config = Config::from_environment();
        logger::init_logger(config);

        DataRootResolver resolver(config.data_root);
        Response const response = dispatch(env, resolver);
        response.write(out, protocol, include_body);
        logger::flush();
        return response.get_response_code().is_server_error() ? 1 : 0;
    } catch (HttpException const& hex) {
        spdlog::error("{} [{}:{}]", hex.get_message(), hex.get_file(), hex.get_line());
        hex.to_response().write(out, protocol, include_body);
    } catch (std::exception const& ex) {
        spdlog::error("Caught std::exception: {}", ex.what());
        write_error_response(out, protocol, ex, include_body);
    } catch (...) {
        spdlog::error("Unexpected exception.");
        write_error_response(out, protocol, include_body);
    }
    logger::flush();
    return 1;
}
}  // namespace fitsview
