#include "Errors.hxx"

namespace fitsview {
DataAccessError::~DataAccessError() throw() {}
NotFoundError::~NotFoundError() throw() {}
ParseError::~ParseError() throw() {}
RangeError::~RangeError() throw() {}
NoDataError::~NoDataError() throw() {}
FormatError::~FormatError() throw() {}
IoError::~IoError() throw() {}
}  // namespace fitsview
