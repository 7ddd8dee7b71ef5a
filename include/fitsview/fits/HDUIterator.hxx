#pragma once

// Standard library
#include <iterator>

// Local headers
#include "FitsFile.hxx"
#include "HDU.hxx"

namespace fits {
class HDUIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = HDU;
    using reference = value_type;
    using difference_type = std::ptrdiff_t;
    using pointer = void;

    HDUIterator(const FitsFile& fits, size_t hdu_num);

    bool operator==(const HDUIterator& right) const;
    inline bool operator!=(const HDUIterator& right) const { return !(*this == right); }

    reference operator*();

    HDUIterator& operator++();
    HDUIterator operator++(int);

private:
    FitsFile fits_;
    size_t hdu_num_;
};
}  // namespace fits
