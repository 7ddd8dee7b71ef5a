#include "fits/HDUIterator.hxx"

namespace fits {
HDUIterator::HDUIterator(const FitsFile& fits, size_t hdu_num)
        : fits_(fits), hdu_num_(hdu_num) {}

bool HDUIterator::operator==(const HDUIterator& right) const {
    return fits_ == right.fits_ && hdu_num_ == right.hdu_num_;
}

HDUIterator::reference HDUIterator::operator*() { return HDU(fits_, hdu_num_); }

HDUIterator& HDUIterator::operator++() {
    hdu_num_++;
    return *this;
}
HDUIterator HDUIterator::operator++(int) {
    HDUIterator result = *this;
    ++*this;
    return result;
}
}  // namespace fits
