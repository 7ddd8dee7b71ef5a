#include "PathResolver.hxx"

// Local headers
#include "Errors.hxx"

// External APIs
#include <fmt/format.h>

// Standard library
#include <system_error>

namespace fitsview {
DataRootResolver::DataRootResolver(fs::path const& data_root) : data_root_(data_root) {}

DataRootResolver::~DataRootResolver() {}

fs::path DataRootResolver::resolve(std::string const& logical_path) const {
    std::string const not_found = fmt::format("File not found: {}", logical_path);
    if (logical_path.empty() || logical_path.find('\0') != std::string::npos) {
        throw NotFoundError(not_found);
    }
    fs::path relative(logical_path);
    if (relative.is_absolute() || relative.has_root_name()) {
        throw NotFoundError(not_found);
    }
    for (fs::path::const_iterator i = relative.begin(), e = relative.end(); i != e; ++i) {
        if (*i == "..") {
            throw NotFoundError(not_found);
        }
    }
    fs::path path = data_root_ / relative;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        throw NotFoundError(not_found);
    }
    return path;
}
}  // namespace fitsview
