#include "Environment.hxx"

// Local headers
#include "HttpException.hxx"
#include "get_env.hxx"

// External APIs
#include <fmt/format.h>

// Standard library
#include <cctype>
#include <utility>

namespace fitsview {
/** Reads the request from the CGI environment. When no query string is
 * present, the first command line argument is parsed in its place, which
 * allows the program to be run by hand.
 */
Environment::Environment(int argc, char const* const* argv)
        : server_protocol_(get_env("SERVER_PROTOCOL")),
          request_method_(get_env("REQUEST_METHOD", "GET")),
          path_info_(get_env("PATH_INFO")),
          query_string_(get_env("QUERY_STRING")),
          kv_map_() {
    if (query_string_.empty() && argc > 1 && argv != 0 && argv[1] != 0) {
        query_string_ = argv[1];
    }
    parse_input(query_string_);
}

Environment::Environment(std::string const& request_method,
                         std::string const& path_info, std::string const& query_string,
                         std::string const& server_protocol)
        : server_protocol_(server_protocol),
          request_method_(request_method.empty() ? std::string("GET") : request_method),
          path_info_(path_info),
          query_string_(query_string),
          kv_map_() {
    parse_input(query_string_);
}

Environment::~Environment() {}

/** Returns a vector of all the query parameter names.
 */
std::vector<std::string> const Environment::get_keys() const {
    std::vector<std::string> keys;
    keys.reserve(kv_map_.size());
    KeyValueIter i = kv_map_.begin();
    KeyValueIter const e = kv_map_.end();
    for (; i != e; ++i) {
        if (keys.size() == 0 || keys.back() != i->first) {
            keys.push_back(i->first);
        }
    }
    return keys;
}

/** Returns the value of the query parameter with the given name. The
 * parameter must be given exactly once.
 */
std::string const& Environment::get_value(std::string const& key) const {
    size_t n = get_num_values(key);
    if (n == 0) {
        throw HTTP_EXCEPT(HttpResponseCode::BAD_REQUEST,
                          fmt::format("No value specified for parameter {}", key));
    } else if (n > 1) {
        throw HTTP_EXCEPT(HttpResponseCode::BAD_REQUEST,
                          fmt::format("Multiple values specified for parameter {}", key));
    }
    return kv_map_.find(key)->second;
}

/** Returns the value of the query parameter with the given name, or
 * the specified default if the parameter is unavailable.
 */
std::string Environment::get_value_or_default(std::string const& key,
                                              std::string const& def) const {
    size_t n = get_num_values(key);
    if (n == 0) {
        return def;
    } else if (n > 1) {
        throw HTTP_EXCEPT(HttpResponseCode::BAD_REQUEST,
                          fmt::format("Multiple values specified for parameter {}", key));
    }
    return kv_map_.find(key)->second;
}

/** Returns the vector of values associated with the query parameter
 * of the given name.
 */
std::vector<std::string> const Environment::get_values(std::string const& key) const {
    std::vector<std::string> values;
    std::pair<KeyValueIter, KeyValueIter> const range = kv_map_.equal_range(key);
    for (KeyValueIter i = range.first; i != range.second; ++i) {
        values.push_back(i->second);
    }
    return values;
}

std::string const Environment::url_decode(std::string const& src) {
    std::string result;
    result.reserve(src.size());
    for (std::string::size_type i = 0, n = src.size(); i < n; ++i) {
        if (src[i] == '+') {
            result.append(1, ' ');
        } else if (src[i] != '%') {
            result.append(1, src[i]);
        } else {
            int c = '%';
            if (n - i > 2) {
                char c1 = src[i + 1];
                char c2 = src[i + 2];
                if (std::isxdigit(static_cast<unsigned char>(c1)) &&
                    std::isxdigit(static_cast<unsigned char>(c2))) {
                    c = (c1 >= 'A' ? (c1 & 0xDF) - 'A' + 10 : c1 - '0') * 16;
                    c += (c2 >= 'A') ? (c2 & 0xDF) - 'A' + 10 : c2 - '0';
                    i += 2;
                }
            }
            result.append(1, static_cast<char>(c));
        }
    }
    return result;
}

/** Splits an application/x-www-form-urlencoded string into key/value
 * pairs. A bare key without '=' is recorded with an empty value.
 */
void Environment::parse_input(std::string const& data) {
    if (data.empty()) {
        return;
    }
    std::string::size_type prev = 0;
    while (prev <= data.size()) {
        std::string::size_type amp = data.find_first_of('&', prev);
        std::string pair = (amp == std::string::npos) ? data.substr(prev)
                                                       : data.substr(prev, amp - prev);
        if (!pair.empty()) {
            std::string::size_type eq = pair.find_first_of('=');
            std::string key, value;
            if (eq == std::string::npos) {
                key = url_decode(pair);
            } else {
                key = url_decode(pair.substr(0, eq));
                value = url_decode(pair.substr(eq + 1));
            }
            kv_map_.insert(std::make_pair(key, value));
        }
        if (amp == std::string::npos) {
            break;
        }
        prev = amp + 1;
    }
}
}  // namespace fitsview
