#include "fits/FitsFile.hxx"

// Local headers
#include "fits/FitsError.hxx"
#include "fits/HDU.hxx"
#include "fits/HDUIterator.hxx"

namespace fits {
void FitsFile::deleter::operator()(pointer fptr) {
    int status = 0;
    fits_close_file(fptr, &status);
}

FitsFile::FitsFile(const std::string& path) : fptr_(open_fits_file(path), deleter()) {}

bool FitsFile::operator==(const FitsFile& other) const { return fptr_ == other.fptr_; }

fitsfile* FitsFile::get() { return fptr_.get(); }
const fitsfile* FitsFile::get() const { return fptr_.get(); }

size_t FitsFile::hdu_count() {
    int status = 0;
    int result = 0;
    if (fits_get_num_hdus(fptr_.get(), &result, &status) > 0) throw FitsError(status);
    return static_cast<size_t>(result);
}

FitsFile::iterator FitsFile::begin() { return HDUIterator(*this, 1); }
FitsFile::iterator FitsFile::end() { return HDUIterator(*this, hdu_count() + 1); }

HDU FitsFile::make_hdu_current(size_t hdu_num) {
    int status = 0;
    int ext_type = 0;
    if (fits_movabs_hdu(fptr_.get(), static_cast<int>(hdu_num), &ext_type, &status) >
        0) {
        throw FitsError(status);
    }
    return HDU(*this, hdu_num);
}

fitsfile* FitsFile::open_fits_file(const std::string& path) {
    fitsfile* result = nullptr;
    int status = 0;
    if (fits_open_diskfile(&result, path.c_str(), READONLY, &status) > 0) {
        // cfitsio may hand back a partially opened file on failure
        if (result != nullptr) {
            int ignored = 0;
            fits_close_file(result, &ignored);
        }
        throw FitsError(status);
    }
    return result;
}
}  // namespace fits
