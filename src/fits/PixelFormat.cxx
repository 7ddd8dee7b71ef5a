#include "fits/PixelFormat.hxx"

// Standard library
#include <cstdlib>

namespace fits {
size_t sizeof_pixel(PixelFormat pixel_format) {
    return static_cast<size_t>(std::abs(static_cast<int>(pixel_format)) / 8);
}

TableDataType pixel_data_type(PixelFormat pixel_format) {
    switch (pixel_format) {
        case PixelFormat::byte_8bit:
            return TableDataType::byte_t;
        case PixelFormat::int_16bit:
            return TableDataType::short_t;
        case PixelFormat::int_32bit:
            // TINT is 4 bytes on every platform cfitsio supports
            return TableDataType::int_t;
        case PixelFormat::int_64bit:
            return TableDataType::longlong_t;
        case PixelFormat::float_32bit:
            return TableDataType::float_t;
        case PixelFormat::double_64bit:
            return TableDataType::double_t;
        default:
            return TableDataType::unknown;
    }
}
}  // namespace fits
