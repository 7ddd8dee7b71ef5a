#pragma once

// Standard library
#include <stdexcept>
#include <string>

namespace fitsview {
/** Base class for failures raised while locating, reading or slicing data.
 * Request handlers translate these into HTTP responses.
 */
class DataAccessError : public std::runtime_error {
public:
    explicit DataAccessError(std::string const& msg) : std::runtime_error(msg) {}
    virtual ~DataAccessError() throw();
};

/// A logical path does not resolve to a readable file.
class NotFoundError : public DataAccessError {
public:
    explicit NotFoundError(std::string const& msg) : DataAccessError(msg) {}
    virtual ~NotFoundError() throw();
};

/// A slice specification is syntactically malformed.
class ParseError : public DataAccessError {
public:
    explicit ParseError(std::string const& msg) : DataAccessError(msg) {}
    virtual ~ParseError() throw();
};

/// A well-formed request falls outside the data: bad HDU index, wrong
/// number of axes, or out-of-bounds ranges.
class RangeError : public DataAccessError {
public:
    explicit RangeError(std::string const& msg) : DataAccessError(msg) {}
    virtual ~RangeError() throw();
};

/// The selected HDU carries no array data.
class NoDataError : public DataAccessError {
public:
    explicit NoDataError(std::string const& msg) : DataAccessError(msg) {}
    virtual ~NoDataError() throw();
};

/// The file is not valid FITS.
class FormatError : public DataAccessError {
public:
    explicit FormatError(std::string const& msg) : DataAccessError(msg) {}
    virtual ~FormatError() throw();
};

/// The file could not be opened or read.
class IoError : public DataAccessError {
public:
    explicit IoError(std::string const& msg) : DataAccessError(msg) {}
    virtual ~IoError() throw();
};
}  // namespace fitsview
