#pragma once

// Local headers
#include "PixelFormat.hxx"

// External APIs
#include <fitsio.h>

// Standard library
#include <memory>
#include <string>

namespace fits {
class HDU;
class HDUIterator;

/** A read-only cfitsio handle. Copies share the underlying file, which is
 * closed when the last copy goes away.
 */
class FitsFile {
public:
    struct deleter {
        using element_type = fitsfile;
        using pointer = fitsfile*;

        void operator()(pointer fptr);
    };

    using iterator = HDUIterator;

    // Opens a FITS file on disk. The path is taken literally: cfitsio's extended
    // filename syntax is not interpreted.
    explicit FitsFile(const std::string& path);

    bool operator==(const FitsFile& other) const;

    fitsfile* get();
    const fitsfile* get() const;

    size_t hdu_count();

    iterator begin();
    iterator end();

    // Moves to the HDU with the given 1-based number.
    HDU make_hdu_current(size_t hdu_num);

private:
    static fitsfile* open_fits_file(const std::string& path);

    std::shared_ptr<fitsfile> fptr_;
};
}  // namespace fits
