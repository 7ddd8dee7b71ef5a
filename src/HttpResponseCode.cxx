#include "HttpResponseCode.hxx"

namespace fitsview {
HttpResponseCode const HttpResponseCode::OK(200, "OK");
HttpResponseCode const HttpResponseCode::BAD_REQUEST(400, "Bad Request");
HttpResponseCode const HttpResponseCode::NOT_FOUND(404, "Not Found");
HttpResponseCode const HttpResponseCode::METHOD_NOT_ALLOWED(405, "Method Not Allowed");
HttpResponseCode const HttpResponseCode::INTERNAL_SERVER_ERROR(500,
                                                               "Internal Server Error");

HttpResponseCode::HttpResponseCode(int code, char const* summary)
        : code_(code), summary_(summary) {}

HttpResponseCode::~HttpResponseCode() {}
}  // namespace fitsview
