#pragma once

// Local headers
#include "fitsview_filesystem.hxx"

// Standard library
#include <string>

namespace fitsview {
/** Maps the logical path named in a request to a file on disk.
 */
class PathResolver {
public:
    virtual ~PathResolver() {}

    /// Returns the on-disk path of a readable regular file, or throws
    /// NotFoundError.
    virtual fs::path resolve(std::string const& logical_path) const = 0;
};

/** Resolves logical paths relative to a fixed data root. Absolute paths
 * and paths containing ".." are never resolved.
 */
class DataRootResolver : public PathResolver {
public:
    explicit DataRootResolver(fs::path const& data_root);
    virtual ~DataRootResolver();

    fs::path const& get_data_root() const { return data_root_; }

    virtual fs::path resolve(std::string const& logical_path) const;

private:
    fs::path data_root_;
};
}  // namespace fitsview
