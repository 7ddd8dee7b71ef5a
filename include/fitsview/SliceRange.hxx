#pragma once

// Standard library
#include <string>
#include <vector>

namespace fitsview {
/// Half-open index range [start, stop) along one axis.
struct SliceRange {
    long start;
    long stop;

    long size() const { return stop - start; }
};

/** Parses a slice specification such as "0:10,5:15": one start:stop pair
 * per axis, outermost axis first. Throws ParseError for malformed text and
 * RangeError for negative bounds or start >= stop.
 */
std::vector<SliceRange> parse_slices(std::string const& text);

/// Checks ranges against an array shape. Throws RangeError.
void validate_slices(std::vector<SliceRange> const& ranges,
                     std::vector<long> const& shape);

std::vector<SliceRange> parse_and_validate(std::string const& text,
                                           std::vector<long> const& shape);

/// Formats a shape as a list, e.g. "[10, 10]".
std::string format_shape(std::vector<long> const& shape);
}  // namespace fitsview
