#include "TypedArray.hxx"

// Standard library
#include <endian.h>
#include <cstdlib>

#if __BYTE_ORDER != __LITTLE_ENDIAN && __BYTE_ORDER != __BIG_ENDIAN
#error Unknown byte order!
#endif

namespace fitsview {
TypedArrayTag map_element_type(NumericKind kind, size_t byte_width) {
    switch (kind) {
        case NumericKind::signed_integer:
            switch (byte_width) {
                case 1:
                    return TypedArrayTag::i8;
                case 2:
                    return TypedArrayTag::i16;
                case 4:
                    return TypedArrayTag::i32;
                case 8:
                    return TypedArrayTag::i64;
            }
            break;
        case NumericKind::unsigned_integer:
            switch (byte_width) {
                case 1:
                    return TypedArrayTag::u8;
                case 2:
                    return TypedArrayTag::u16;
                case 4:
                    return TypedArrayTag::u32;
                case 8:
                    return TypedArrayTag::u64;
            }
            break;
        case NumericKind::boolean:
            return TypedArrayTag::u8;
        case NumericKind::floating_point:
            if (byte_width == 4) {
                return TypedArrayTag::f32;
            }
            break;
        case NumericKind::other:
            break;
    }
    return TypedArrayTag::f64;
}

char const* to_wire_name(TypedArrayTag tag) {
    switch (tag) {
        case TypedArrayTag::i8:
            return "i8";
        case TypedArrayTag::i16:
            return "i16";
        case TypedArrayTag::i32:
            return "i32";
        case TypedArrayTag::i64:
            return "i64";
        case TypedArrayTag::u8:
            return "u8";
        case TypedArrayTag::u16:
            return "u16";
        case TypedArrayTag::u32:
            return "u32";
        case TypedArrayTag::u64:
            return "u64";
        case TypedArrayTag::f32:
            return "f32";
        case TypedArrayTag::f64:
            return "f64";
    }
    return "f64";
}

size_t element_size(TypedArrayTag tag) {
    switch (tag) {
        case TypedArrayTag::i8:
        case TypedArrayTag::u8:
            return 1;
        case TypedArrayTag::i16:
        case TypedArrayTag::u16:
            return 2;
        case TypedArrayTag::i32:
        case TypedArrayTag::u32:
        case TypedArrayTag::f32:
            return 4;
        case TypedArrayTag::i64:
        case TypedArrayTag::u64:
        case TypedArrayTag::f64:
            return 8;
    }
    return 8;
}

TypedArrayTag element_type_of(fits::PixelFormat format) {
    int bitpix = static_cast<int>(format);
    size_t width = static_cast<size_t>(std::abs(bitpix) / 8);
    switch (format) {
        case fits::PixelFormat::byte_8bit:
            return map_element_type(NumericKind::unsigned_integer, width);
        case fits::PixelFormat::int_16bit:
        case fits::PixelFormat::int_32bit:
        case fits::PixelFormat::int_64bit:
            return map_element_type(NumericKind::signed_integer, width);
        case fits::PixelFormat::float_32bit:
        case fits::PixelFormat::double_64bit:
            return map_element_type(NumericKind::floating_point, width);
        default:
            return map_element_type(NumericKind::other, width);
    }
}

ByteOrder native_byte_order() {
#if __BYTE_ORDER == __LITTLE_ENDIAN
    return ByteOrder::little;
#else
    return ByteOrder::big;
#endif
}
}  // namespace fitsview
