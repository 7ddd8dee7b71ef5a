#pragma once

// Local headers
#include "fits/PixelFormat.hxx"

// Standard library
#include <cstddef>

namespace fitsview {
/// Element types a client can decode. The wire name of each is its
/// enumerator name.
enum class TypedArrayTag { i8, i16, i32, i64, u8, u16, u32, u64, f32, f64 };

/// Broad classification of a numeric element type.
enum class NumericKind {
    signed_integer,
    unsigned_integer,
    boolean,
    floating_point,
    other
};

enum class ByteOrder { little, big };

/** Maps a numeric kind and width to a typed array tag. Every input has an
 * answer; combinations with no better match fall back to @c f64.
 */
TypedArrayTag map_element_type(NumericKind kind, size_t byte_width);

/// Returns the lowercase wire name, e.g. @c "f32".
char const* to_wire_name(TypedArrayTag tag);

/// Returns the size of one element in bytes.
size_t element_size(TypedArrayTag tag);

/// Classifies a raw BITPIX value.
TypedArrayTag element_type_of(fits::PixelFormat format);

ByteOrder native_byte_order();
}  // namespace fitsview
