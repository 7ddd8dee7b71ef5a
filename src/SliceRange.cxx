#include "SliceRange.hxx"

// Local headers
#include "Errors.hxx"

// External APIs
#include <fmt/format.h>
#include <fmt/ranges.h>

// Standard library
#include <cerrno>
#include <cstdlib>

namespace fitsview {
namespace {
std::string strip(std::string const& s) {
    static char const* const ws = " \t\r\n\f\v";
    std::string::size_type first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return std::string();
    }
    return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

std::vector<std::string> split(std::string const& s, char sep) {
    std::vector<std::string> parts;
    std::string::size_type prev = 0;
    while (true) {
        std::string::size_type i = s.find(sep, prev);
        if (i == std::string::npos) {
            parts.push_back(s.substr(prev));
            return parts;
        }
        parts.push_back(s.substr(prev, i - prev));
        prev = i + 1;
    }
}

long parse_index(std::string const& field, std::string const& axis) {
    std::string text = strip(field);
    if (text.empty()) {
        throw ParseError(fmt::format("Invalid slice format: '{}'. Expected 'start:stop'.",
                                     axis));
    }
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (end != text.c_str() + text.size() || errno == ERANGE) {
        throw ParseError(fmt::format("Invalid integer '{}' in slice '{}'", text, axis));
    }
    return value;
}
}  // namespace

std::vector<SliceRange> parse_slices(std::string const& text) {
    std::vector<SliceRange> ranges;
    std::vector<std::string> axes = split(text, ',');
    for (std::vector<std::string>::const_iterator a = axes.begin(), e = axes.end();
         a != e; ++a) {
        std::vector<std::string> parts = split(strip(*a), ':');
        if (parts.size() != 2) {
            throw ParseError(fmt::format(
                    "Invalid slice format: '{}'. Expected 'start:stop'.", *a));
        }
        SliceRange range;
        range.start = parse_index(parts[0], *a);
        range.stop = parse_index(parts[1], *a);
        if (range.start < 0 || range.stop < 0) {
            throw RangeError(fmt::format("Negative indices not supported: '{}'", *a));
        }
        if (range.start >= range.stop) {
            throw RangeError(fmt::format("Start must be less than stop: '{}'", *a));
        }
        ranges.push_back(range);
    }
    return ranges;
}

void validate_slices(std::vector<SliceRange> const& ranges,
                     std::vector<long> const& shape) {
    if (ranges.size() != shape.size()) {
        throw RangeError(fmt::format(
                "Number of slice dimensions ({}) does not match data dimensions ({}). "
                "Data shape: {}",
                ranges.size(), shape.size(), format_shape(shape)));
    }
    for (size_t axis = 0; axis < ranges.size(); ++axis) {
        if (ranges[axis].stop > shape[axis]) {
            throw RangeError(fmt::format(
                    "Slice [{}:{}] on axis {} out of bounds for dimension size {}. "
                    "Data shape: {}",
                    ranges[axis].start, ranges[axis].stop, axis, shape[axis],
                    format_shape(shape)));
        }
    }
}

std::vector<SliceRange> parse_and_validate(std::string const& text,
                                           std::vector<long> const& shape) {
    std::vector<SliceRange> ranges = parse_slices(text);
    validate_slices(ranges, shape);
    return ranges;
}

std::string format_shape(std::vector<long> const& shape) {
    return fmt::format("[{}]", fmt::join(shape, ", "));
}
}  // namespace fitsview
