#pragma once

// Local headers
#include "HttpResponseCode.hxx"

// External APIs
#include <json/json.h>

// Standard library
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace fitsview {
/** A fully materialized HTTP response. Handlers build one of these before
 * any byte goes out, so a failure never leaves a partial body on the wire.
 */
class Response {
public:
    using Header = std::pair<std::string, std::string>;

    explicit Response(HttpResponseCode const& code = HttpResponseCode::OK);

    HttpResponseCode const& get_response_code() const { return *code_; }
    void set_response_code(HttpResponseCode const& code) { code_ = &code; }

    /// Sets a header, replacing any previous value with the same name.
    void set_header(std::string const& name, std::string const& value);

    /// Returns the value of the named header, or @c nullptr.
    std::string const* find_header(std::string const& name) const;
    std::vector<Header> const& get_headers() const { return headers_; }

    void set_body(std::vector<unsigned char> body) { body_ = std::move(body); }
    void set_body(std::string const& body);
    std::vector<unsigned char> const& get_body() const { return body_; }
    std::string get_body_string() const;

    /// Writes a non-parsed-header CGI response: status line, headers and
    /// (optionally) the body. Content-Length always describes the full body.
    void write(std::ostream& stream, std::string const& protocol,
               bool include_body = true) const;

private:
    HttpResponseCode const* code_;
    std::vector<Header> headers_;
    std::vector<unsigned char> body_;
};

/// Serializes @c value without indentation.
std::string to_json_string(Json::Value const& value);

/// Builds a response carrying a JSON document.
Response make_json_response(HttpResponseCode const& code, Json::Value const& value);

/// Builds the <tt>{"error": message}</tt> response used for every failure.
Response make_error_response(HttpResponseCode const& code, std::string const& message);
}  // namespace fitsview
