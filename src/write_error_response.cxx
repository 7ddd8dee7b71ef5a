#include "write_error_response.hxx"

// Local headers
#include "HttpResponseCode.hxx"
#include "Response.hxx"

namespace fitsview {
void write_error_response(std::ostream& stream, std::string const& protocol,
                          std::exception const& e, bool include_body) {
    make_error_response(HttpResponseCode::INTERNAL_SERVER_ERROR,
                        std::string("Caught std::exception: ") + e.what())
            .write(stream, protocol, include_body);
}

void write_error_response(std::ostream& stream, std::string const& protocol,
                          bool include_body) {
    make_error_response(HttpResponseCode::INTERNAL_SERVER_ERROR, "Unexpected exception.")
            .write(stream, protocol, include_body);
}
}  // namespace fitsview
