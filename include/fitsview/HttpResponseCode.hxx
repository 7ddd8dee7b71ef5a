#pragma once

namespace fitsview {
/** The HTTP response codes the fitsview endpoints can produce.
 */
class HttpResponseCode {
public:
    static HttpResponseCode const OK;
    static HttpResponseCode const BAD_REQUEST;
    static HttpResponseCode const NOT_FOUND;
    static HttpResponseCode const METHOD_NOT_ALLOWED;
    static HttpResponseCode const INTERNAL_SERVER_ERROR;

    ~HttpResponseCode();

    int get_code() const { return code_; }
    char const* get_summary() const { return summary_; }

    bool is_server_error() const { return code_ >= 500; }

private:
    HttpResponseCode(int code, char const* summary);

    // disable copy construction and assignment
    HttpResponseCode(HttpResponseCode const&) = delete;
    HttpResponseCode& operator=(HttpResponseCode const&) = delete;

    int code_;
    char const* summary_;
};
}  // namespace fitsview
