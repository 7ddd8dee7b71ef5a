#include "HttpException.hxx"

namespace fitsview {
/** Creates an HttpException from throw-site information.
 *
 * @param[in] file  Filename. Must be a compile-time string,
 *                  automatically passed in by HTTP_EXCEPT.
 * @param[in] line  Line number. Automatically passed in by HTTP_EXCEPT.
 * @param[in] func  Function name. Must be a compile-time string,
 *                  automatically passed in by HTTP_EXCEPT.
 * @param[in] msg   Informational string.
 */
HttpException::HttpException(char const* file, int line, char const* func,
                             HttpResponseCode const& code, std::string const& msg)
        : file_(file), line_(line), func_(func), code_(code), msg_(msg) {}

HttpException::HttpException(char const* file, int line, char const* func,
                             HttpResponseCode const& code, char const* msg)
        : file_(file), line_(line), func_(func), code_(code), msg_(msg) {}

HttpException::~HttpException() throw() {}

/** Returns the JSON error response for this exception. The message falls
 * back on the response code summary when none was given.
 */
Response HttpException::to_response() const {
    return make_error_response(code_, msg_.empty() ? std::string(code_.get_summary())
                                                   : msg_);
}

/** Returns a character string representing this exception.  Falls back on
 * get_type_name() if an exception is thrown.
 *
 * @return String representation of this exception; must not be deleted.
 */
char const* HttpException::what() const throw() {
    try {
        return msg_.c_str();
    } catch (...) {
        return get_type_name();
    }
}

/** Returns the fully-qualified type name of the exception.  This must be
 * overridden by derived classes.
 *
 * @return Fully qualified exception type name; must not be deleted.
 */
char const* HttpException::get_type_name() const throw() {
    return "fitsview::HttpException";
}
}  // namespace fitsview
