#include "Response.hxx"

namespace fitsview {
Response::Response(HttpResponseCode const& code) : code_(&code), headers_(), body_() {}

void Response::set_header(std::string const& name, std::string const& value) {
    for (std::vector<Header>::iterator i = headers_.begin(), e = headers_.end(); i != e;
         ++i) {
        if (i->first == name) {
            i->second = value;
            return;
        }
    }
    headers_.push_back(std::make_pair(name, value));
}

std::string const* Response::find_header(std::string const& name) const {
    for (std::vector<Header>::const_iterator i = headers_.begin(), e = headers_.end();
         i != e; ++i) {
        if (i->first == name) {
            return &i->second;
        }
    }
    return nullptr;
}

void Response::set_body(std::string const& body) {
    body_.assign(body.begin(), body.end());
}

std::string Response::get_body_string() const {
    return std::string(body_.begin(), body_.end());
}

void Response::write(std::ostream& stream, std::string const& protocol,
                     bool include_body) const {
    stream << (protocol.empty() ? std::string("HTTP/1.0") : protocol) << " "
           << code_->get_code() << " " << code_->get_summary() << "\r\n";
    for (std::vector<Header>::const_iterator i = headers_.begin(), e = headers_.end();
         i != e; ++i) {
        stream << i->first << ": " << i->second << "\r\n";
    }
    stream << "Content-Length: " << body_.size() << "\r\n\r\n";
    if (include_body && !body_.empty()) {
        stream.write(reinterpret_cast<char const*>(body_.data()),
                     static_cast<std::streamsize>(body_.size()));
    }
    stream.flush();
}

std::string to_json_string(Json::Value const& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Response make_json_response(HttpResponseCode const& code, Json::Value const& value) {
    Response response(code);
    response.set_header("Content-Type", "application/json; charset=utf-8");
    response.set_header("Cache-Control", "no-cache");
    response.set_body(to_json_string(value));
    return response;
}

Response make_error_response(HttpResponseCode const& code, std::string const& message) {
    Json::Value error(Json::objectValue);
    error["error"] = message;
    return make_json_response(code, error);
}
}  // namespace fitsview
