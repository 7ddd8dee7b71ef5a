#pragma once

// Local headers
#include "FitsReader.hxx"
#include "SliceRange.hxx"
#include "TypedArray.hxx"

// Standard library
#include <vector>

namespace fitsview {
/// A sub-array cut out of an image, serialized row-major and little-endian.
struct ExtractedBlock {
    std::vector<long> shape;
    TypedArrayTag element_type = TypedArrayTag::f64;
    std::vector<unsigned char> bytes;
};

/** Copies the hyper-rectangle addressed by @c ranges out of @c array.
 * The outermost axis varies slowest in the output, every element is
 * converted to little-endian, and the element type is preserved.
 * Throws RangeError when the ranges do not fit the array.
 */
ExtractedBlock extract(RawArray const& array, std::vector<SliceRange> const& ranges);
}  // namespace fitsview
