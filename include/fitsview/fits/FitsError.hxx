#pragma once

// Standard library
#include <stdexcept>
#include <string>

namespace fits {

// An error reported by a cfitsio operation.
class FitsError : public std::runtime_error {
public:
    FitsError(int status);
    FitsError(const std::string& message, int status);

    int status() const;

    // True for statuses raised while opening, seeking or reading the underlying
    // file, as opposed to statuses raised while interpreting its contents.
    bool is_io_error() const;

    // Gets the error type of the given status and flushes the cfitsio error message
    // queue to the resulting string.
    static std::string get_error_message(int status);

private:
    int status_;
};
}  // namespace fits
