#include <gtest/gtest.h>

#include "TypedArray.hxx"

using namespace fitsview;

TEST(TypedArrayTest, MapsSignedIntegers) {
    EXPECT_EQ(map_element_type(NumericKind::signed_integer, 1), TypedArrayTag::i8);
    EXPECT_EQ(map_element_type(NumericKind::signed_integer, 2), TypedArrayTag::i16);
    EXPECT_EQ(map_element_type(NumericKind::signed_integer, 4), TypedArrayTag::i32);
    EXPECT_EQ(map_element_type(NumericKind::signed_integer, 8), TypedArrayTag::i64);
}

TEST(TypedArrayTest, MapsUnsignedIntegers) {
    EXPECT_EQ(map_element_type(NumericKind::unsigned_integer, 1), TypedArrayTag::u8);
    EXPECT_EQ(map_element_type(NumericKind::unsigned_integer, 2), TypedArrayTag::u16);
    EXPECT_EQ(map_element_type(NumericKind::unsigned_integer, 4), TypedArrayTag::u32);
    EXPECT_EQ(map_element_type(NumericKind::unsigned_integer, 8), TypedArrayTag::u64);
}

TEST(TypedArrayTest, MapsFloatsAndBooleans) {
    EXPECT_EQ(map_element_type(NumericKind::floating_point, 4), TypedArrayTag::f32);
    EXPECT_EQ(map_element_type(NumericKind::floating_point, 8), TypedArrayTag::f64);
    EXPECT_EQ(map_element_type(NumericKind::boolean, 1), TypedArrayTag::u8);
    EXPECT_EQ(map_element_type(NumericKind::boolean, 4), TypedArrayTag::u8);
}

TEST(TypedArrayTest, FallsBackToFloat64) {
    EXPECT_EQ(map_element_type(NumericKind::other, 4), TypedArrayTag::f64);
    EXPECT_EQ(map_element_type(NumericKind::other, 16), TypedArrayTag::f64);
    EXPECT_EQ(map_element_type(NumericKind::signed_integer, 3), TypedArrayTag::f64);
    EXPECT_EQ(map_element_type(NumericKind::unsigned_integer, 16), TypedArrayTag::f64);
    EXPECT_EQ(map_element_type(NumericKind::floating_point, 2), TypedArrayTag::f64);
    EXPECT_EQ(map_element_type(NumericKind::floating_point, 16), TypedArrayTag::f64);
}

TEST(TypedArrayTest, WireNamesAndSizes) {
    struct {
        TypedArrayTag tag;
        char const* name;
        size_t size;
    } const table[] = {
            {TypedArrayTag::i8, "i8", 1},   {TypedArrayTag::i16, "i16", 2},
            {TypedArrayTag::i32, "i32", 4}, {TypedArrayTag::i64, "i64", 8},
            {TypedArrayTag::u8, "u8", 1},   {TypedArrayTag::u16, "u16", 2},
            {TypedArrayTag::u32, "u32", 4}, {TypedArrayTag::u64, "u64", 8},
            {TypedArrayTag::f32, "f32", 4}, {TypedArrayTag::f64, "f64", 8},
    };
    for (auto const& row : table) {
        EXPECT_STREQ(to_wire_name(row.tag), row.name);
        EXPECT_EQ(element_size(row.tag), row.size);
    }
}

TEST(TypedArrayTest, DecodesRawBitpix) {
    EXPECT_EQ(element_type_of(fits::PixelFormat::byte_8bit), TypedArrayTag::u8);
    EXPECT_EQ(element_type_of(fits::PixelFormat::int_16bit), TypedArrayTag::i16);
    EXPECT_EQ(element_type_of(fits::PixelFormat::int_32bit), TypedArrayTag::i32);
    EXPECT_EQ(element_type_of(fits::PixelFormat::int_64bit), TypedArrayTag::i64);
    EXPECT_EQ(element_type_of(fits::PixelFormat::float_32bit), TypedArrayTag::f32);
    EXPECT_EQ(element_type_of(fits::PixelFormat::double_64bit), TypedArrayTag::f64);
    EXPECT_EQ(element_type_of(fits::PixelFormat::unknown), TypedArrayTag::f64);
}
