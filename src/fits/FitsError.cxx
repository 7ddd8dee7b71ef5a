#include "fits/FitsError.hxx"

// External APIs
#include <fitsio.h>

// Standard library
#include <sstream>

namespace fits {
FitsError::FitsError(int status) : FitsError(get_error_message(status), status) {}
FitsError::FitsError(const std::string& message, int status)
        : std::runtime_error(message), status_(status) {}

int FitsError::status() const { return status_; }

bool FitsError::is_io_error() const {
    switch (status_) {
        case TOO_MANY_FILES:
        case FILE_NOT_OPENED:
        case FILE_NOT_CREATED:
        case END_OF_FILE:
        case READ_ERROR:
        case SEEK_ERROR:
        case MEMORY_ALLOCATION:
            return true;
        default:
            return false;
    }
}

std::string FitsError::get_error_message(int status) {
    std::stringstream ss;

    // Get short error message corresponding to given status.
    char msg[FLEN_STATUS];
    fits_get_errstatus(status, msg);
    ss << msg;

    // Flush error message stack to result string.
    char err[FLEN_ERRMSG];
    while (fits_read_errmsg(err) > 0) ss << "; " << err;

    return ss.str();
}
}  // namespace fits
