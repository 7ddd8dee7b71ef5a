#pragma once

// Third-party headers
#include <fitsio.h>

// Standard library
#include <cstddef>

namespace fits {

// Raw BITPIX values of FITS images. BZERO/BSCALE are not taken into account.
enum class PixelFormat {
    unknown = 0,
    byte_8bit = BYTE_IMG,
    int_16bit = SHORT_IMG,
    int_32bit = LONG_IMG,
    int_64bit = LONGLONG_IMG,
    float_32bit = FLOAT_IMG,
    double_64bit = DOUBLE_IMG,
};

// cfitsio data type codes used when cfitsio decodes pixels for us.
enum class TableDataType {
    unknown = 0,
    byte_t = TBYTE,
    short_t = TSHORT,
    int_t = TINT,
    longlong_t = TLONGLONG,
    float_t = TFLOAT,
    double_t = TDOUBLE,
};

// Get the data type of a given pixel format.
TableDataType pixel_data_type(PixelFormat pixel_format);

// Gets the size, in bytes, of a pixel format.
size_t sizeof_pixel(PixelFormat pixel_format);
}  // namespace fits
