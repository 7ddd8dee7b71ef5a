#include "handlers.hxx"

// Local headers
#include "Errors.hxx"
#include "FitsReader.hxx"
#include "GZIPWriter.hxx"
#include "HttpException.hxx"
#include "MemoryWriter.hxx"
#include "SliceRange.hxx"
#include "extract_block.hxx"

// External APIs
#include <fmt/format.h>
#include <spdlog/spdlog.h>

// Standard library
#include <cerrno>
#include <cstdlib>
#include <regex>
#include <set>
#include <utility>

namespace fitsview {
namespace {
// Reject parameters the endpoint does not understand.
void check_parameters(Environment const& env, std::set<std::string> const& allowed) {
    std::vector<std::string> keys = env.get_keys();
    for (std::vector<std::string>::const_iterator i = keys.begin(), e = keys.end();
         i != e; ++i) {
        if (allowed.count(*i) != 1) {
            throw HTTP_EXCEPT(HttpResponseCode::BAD_REQUEST,
                              fmt::format("unknown parameter: {}", *i));
        }
        if (env.get_num_values(*i) > 1) {
            throw HTTP_EXCEPT(
                    HttpResponseCode::BAD_REQUEST,
                    fmt::format("Multiple values specified for parameter {}", *i));
        }
    }
}

// Return the boolean value of the given query parameter or default_value.
bool parse_bool(Environment const& env, std::string const& key, bool default_value) {
    static std::regex const true_regex("^\\s*(1|on|y(es)?|t(rue)?)\\s*",
                                       std::regex::icase);
    static std::regex const false_regex("^\\s*(0|no?|off|f(alse)?)\\s*",
                                        std::regex::icase);
    if (!env.has_key(key)) {
        return default_value;
    }

    std::string const value = env.get_value(key);
    if (std::regex_match(value, true_regex)) {
        return true;
    } else if (std::regex_match(value, false_regex)) {
        return false;
    }
    throw HTTP_EXCEPT(HttpResponseCode::BAD_REQUEST,
                      fmt::format("Value of {} parameter must equal (case insensitively) "
                                  "one of 1,y[es],t[rue],on or 0,n[o],f[alse],off",
                                  key));
}

// Return the HDU index named by the hdu parameter; defaults to the primary HDU.
size_t parse_hdu(Environment const& env) {
    std::string const value = env.get_value_or_default("hdu", "0");
    char* end = nullptr;
    errno = 0;
    long long hdu = std::strtoll(value.c_str(), &end, 10);
    if (value.empty() || end != value.c_str() + value.size() || errno == ERANGE ||
        hdu < 0) {
        throw HTTP_EXCEPT(HttpResponseCode::BAD_REQUEST,
                          "Value of hdu parameter must be a non-negative integer");
    }
    return static_cast<size_t>(hdu);
}

/** Translates a data access failure into an HttpException. Failures that are
 * the server's fault are reported with @c context prepended.
 */
HttpException to_http_exception(DataAccessError const& e, std::string const& context) {
    if (dynamic_cast<NotFoundError const*>(&e) != nullptr) {
        return HTTP_EXCEPT(HttpResponseCode::NOT_FOUND, e.what());
    } else if (dynamic_cast<ParseError const*>(&e) != nullptr ||
               dynamic_cast<RangeError const*>(&e) != nullptr ||
               dynamic_cast<NoDataError const*>(&e) != nullptr) {
        return HTTP_EXCEPT(HttpResponseCode::BAD_REQUEST, e.what());
    }
    return HTTP_EXCEPT(HttpResponseCode::INTERNAL_SERVER_ERROR, context + e.what());
}

fs::path resolve_path(PathResolver const& resolver, std::string const& path) {
    try {
        return resolver.resolve(path);
    } catch (DataAccessError const& e) {
        throw to_http_exception(e, "");
    }
}

Json::Value to_json(std::vector<long> const& shape) {
    Json::Value result(Json::arrayValue);
    for (std::vector<long>::const_iterator i = shape.begin(), e = shape.end(); i != e;
         ++i) {
        result.append(Json::Int64(*i));
    }
    return result;
}

Json::Value to_json(HduInfo const& info) {
    Json::Value hdu(Json::objectValue);
    hdu["index"] = Json::UInt64(info.index);
    hdu["name"] = info.name;
    hdu["type"] = hdu_type_name(info.kind);
    hdu["header"] = info.header_text;
    if (info.has_data()) {
        hdu["shape"] = to_json(*info.shape);
        hdu["arrayType"] = to_wire_name(*info.element_type);
    } else {
        hdu["shape"] = Json::Value(Json::nullValue);
        hdu["arrayType"] = Json::Value(Json::nullValue);
    }
    return hdu;
}

std::string describe_request(Environment const& env) {
    return fmt::format("{} {}", env.get_request_method(),
                       env.get_path_info().empty() ? std::string("/")
                                                   : env.get_path_info());
}
}  // unnamed namespace

Response handle_metadata(Environment const& env, PathResolver const& resolver) {
    check_parameters(env, {"path"});
    std::string const path = env.get_value("path");
    spdlog::debug("metadata: path={}", path);

    fs::path const diskpath = resolve_path(resolver, path);
    Json::Value result(Json::objectValue);
    try {
        fits::FitsFile file = open(diskpath);
        spdlog::debug("opened {}", diskpath.string());
        std::vector<HduInfo> infos = list_hdus(file);
        Json::Value hdus(Json::arrayValue);
        for (std::vector<HduInfo>::const_iterator i = infos.begin(), e = infos.end();
             i != e; ++i) {
            hdus.append(to_json(*i));
        }
        result["path"] = path;
        result["n_extensions"] = Json::UInt64(infos.size());
        result["hdus"] = hdus;
    } catch (DataAccessError const& e) {
        throw HTTP_EXCEPT(HttpResponseCode::INTERNAL_SERVER_ERROR,
                          std::string("Error reading FITS file: ") + e.what());
    }
    return make_json_response(HttpResponseCode::OK, result);
}

Response handle_slice(Environment const& env, PathResolver const& resolver) {
    check_parameters(env, {"path", "hdu", "slices", "gzip"});
    std::string const path = env.get_value("path");
    std::string const slices = env.get_value("slices");
    size_t const hdu_index = parse_hdu(env);
    bool const gzip = parse_bool(env, "gzip", false);
    spdlog::debug("slice: path={} hdu={} slices={} gzip={}", path, hdu_index, slices,
                  gzip);

    // Reject a malformed slice specification before touching the file
    std::vector<SliceRange> ranges;
    try {
        ranges = parse_slices(slices);
    } catch (DataAccessError const& e) {
        throw to_http_exception(e, "");
    }

    fs::path const diskpath = resolve_path(resolver, path);
    ExtractedBlock block;
    try {
        fits::FitsFile file = open(diskpath);
        spdlog::debug("opened {}", diskpath.string());
        HduInfo info = describe_hdu(file, hdu_index);
        if (!info.has_data()) {
            throw NoDataError(fmt::format("HDU {} has no data", hdu_index));
        }
        validate_slices(ranges, *info.shape);
        block = extract(load_array(file, hdu_index), ranges);
    } catch (DataAccessError const& e) {
        throw to_http_exception(e, "Error reading FITS data: ");
    }

    Response response(HttpResponseCode::OK);
    response.set_header("Content-Type", "application/octet-stream");
    response.set_header("X-FITS-Shape", to_json_string(to_json(block.shape)));
    response.set_header("X-FITS-Type", to_wire_name(block.element_type));
    if (gzip) {
        MemoryWriter writer(block.bytes.size() / 2 + 64);
        GZIPWriter gzwriter(writer);
        gzwriter.write(block.bytes.data(), block.bytes.size());
        gzwriter.finish();
        response.set_header("Content-Encoding", "gzip");
        response.set_body(writer.release());
    } else {
        response.set_body(std::move(block.bytes));
    }
    return response;
}

Response dispatch(Environment const& env, PathResolver const& resolver) {
    std::string const request = describe_request(env);
    Response response;
    try {
        std::string endpoint = env.get_path_info();
        while (endpoint.size() > 1 && endpoint[endpoint.size() - 1] == '/') {
            endpoint.erase(endpoint.size() - 1);
        }
        Response (*handler)(Environment const&, PathResolver const&) = nullptr;
        if (endpoint == "/metadata") {
            handler = handle_metadata;
        } else if (endpoint == "/slice") {
            handler = handle_slice;
        } else {
            throw HTTP_EXCEPT(HttpResponseCode::NOT_FOUND,
                              fmt::format("Unknown endpoint: {}", env.get_path_info()));
        }
        std::string const& method = env.get_request_method();
        if (method != "GET" && method != "HEAD") {
            HttpException hex = HTTP_EXCEPT(
                    HttpResponseCode::METHOD_NOT_ALLOWED,
                    fmt::format("Method {} is not allowed; use GET or HEAD", method));
            response = hex.to_response();
            response.set_header("Allow", "GET, HEAD");
            spdlog::warn("{} -> {} {}", request, hex.get_response_code().get_code(),
                         hex.get_message());
            return response;
        }
        response = handler(env, resolver);
    } catch (HttpException const& hex) {
        response = hex.to_response();
        HttpResponseCode const& code = hex.get_response_code();
        if (code.is_server_error()) {
            spdlog::error("{} -> {} {} [{}:{} {}]", request, code.get_code(),
                          hex.get_message(), hex.get_file(), hex.get_line(),
                          hex.get_function());
        } else {
            spdlog::warn("{} -> {} {}", request, code.get_code(), hex.get_message());
        }
        return response;
    } catch (std::exception const& e) {
        response = make_error_response(HttpResponseCode::INTERNAL_SERVER_ERROR,
                                       std::string("Caught std::exception: ") + e.what());
        spdlog::error("{} -> 500 {}", request, e.what());
        return response;
    }
    spdlog::info("{} -> {} ({} bytes)", request, response.get_response_code().get_code(),
                 response.get_body().size());
    return response;
}
}  // namespace fitsview
