#include "extract_block.hxx"

// Local headers
#include "Errors.hxx"

// External APIs
#include <fmt/format.h>

// Standard library
#include <cstdint>
#include <cstring>

namespace fitsview {
namespace {
template <typename T>
void bswap_elements(unsigned char* buf, size_t nelem, T (*swap)(T)) {
    for (size_t i = 0; i < nelem; ++i, buf += sizeof(T)) {
        T v;
        std::memcpy(&v, buf, sizeof(T));
        v = swap(v);
        std::memcpy(buf, &v, sizeof(T));
    }
}

uint16_t bswap16(uint16_t v) { return __builtin_bswap16(v); }
uint32_t bswap32(uint32_t v) { return __builtin_bswap32(v); }
uint64_t bswap64(uint64_t v) { return __builtin_bswap64(v); }

void bswap_pixels(std::vector<unsigned char>& buf, size_t elem_size) {
    switch (elem_size) {
        case 2:
            bswap_elements(buf.data(), buf.size() / 2, bswap16);
            break;
        case 4:
            bswap_elements(buf.data(), buf.size() / 4, bswap32);
            break;
        case 8:
            bswap_elements(buf.data(), buf.size() / 8, bswap64);
            break;
        default:
            break;
    }
}
}  // namespace

ExtractedBlock extract(RawArray const& array, std::vector<SliceRange> const& ranges) {
    validate_slices(ranges, array.shape);
    size_t const ndim = ranges.size();
    size_t const elem_size = element_size(array.element_type);

    size_t total = 1;
    for (size_t d = 0; d < ndim; ++d) {
        if (ranges[d].start < 0 || ranges[d].start >= ranges[d].stop) {
            throw RangeError(fmt::format("Invalid range [{}:{}] on axis {}",
                                         ranges[d].start, ranges[d].stop, d));
        }
        total *= static_cast<size_t>(array.shape[d]);
    }
    if (array.bytes.size() < total * elem_size) {
        throw RangeError(fmt::format("Array holds {} bytes, shape {} needs {}",
                                     array.bytes.size(), format_shape(array.shape),
                                     total * elem_size));
    }

    ExtractedBlock block;
    block.element_type = array.element_type;
    size_t out_elems = 1;
    for (size_t d = 0; d < ndim; ++d) {
        block.shape.push_back(ranges[d].size());
        out_elems *= static_cast<size_t>(ranges[d].size());
    }
    block.bytes.resize(out_elems * elem_size);
    if (ndim == 0) {
        return block;
    }

    // Element stride of each source axis
    std::vector<size_t> stride(ndim, 1);
    for (size_t d = ndim - 1; d > 0; --d) {
        stride[d - 1] = stride[d] * static_cast<size_t>(array.shape[d]);
    }

    // Walk the outer axes like an odometer, copying one innermost row at a time
    size_t const row_elems = static_cast<size_t>(ranges[ndim - 1].size());
    size_t const row_bytes = row_elems * elem_size;
    size_t const nrows = out_elems / row_elems;
    std::vector<long> index(ndim);
    for (size_t d = 0; d < ndim; ++d) {
        index[d] = ranges[d].start;
    }
    unsigned char* out = block.bytes.data();
    for (size_t r = 0; r < nrows; ++r, out += row_bytes) {
        size_t offset = 0;
        for (size_t d = 0; d < ndim; ++d) {
            offset += static_cast<size_t>(index[d]) * stride[d];
        }
        std::memcpy(out, array.bytes.data() + offset * elem_size, row_bytes);
        for (size_t d = ndim - 1; d-- > 0;) {
            if (++index[d] < ranges[d].stop) {
                break;
            }
            index[d] = ranges[d].start;
        }
    }

    if (array.byte_order != ByteOrder::little) {
        bswap_pixels(block.bytes, elem_size);
    }
    return block;
}
}  // namespace fitsview
