#pragma once

// Local headers
#include "TypedArray.hxx"
#include "fits/FitsFile.hxx"
#include "fitsview_filesystem.hxx"

// Standard library
#include <optional>
#include <string>
#include <vector>

namespace fitsview {
/// Kind of a header/data unit. @c compressed_image counts as an image and
/// the two table kinds count as tables.
enum class HduKind {
    primary,
    image,
    compressed_image,
    ascii_table,
    binary_table,
    unknown
};

/// Returns the client-facing type name of an HDU kind, e.g. @c "BinTableHDU".
char const* hdu_type_name(HduKind kind);

/** Metadata of one header/data unit.
 */
struct HduInfo {
    /// 0-based position in the file.
    size_t index = 0;
    std::string name;
    HduKind kind = HduKind::unknown;
    /// Verbatim 80-column header records joined with '\n'.
    std::string header_text;
    /// Axis lengths, outermost (slowest varying) first; absent without array data.
    std::optional<std::vector<long>> shape;
    std::optional<TypedArrayTag> element_type;

    bool has_data() const { return shape.has_value(); }
};

/** The complete data array of an image HDU.
 */
struct RawArray {
    std::vector<long> shape;
    TypedArrayTag element_type = TypedArrayTag::f64;
    ByteOrder byte_order = ByteOrder::big;
    std::vector<unsigned char> bytes;
};

/// Opens a FITS file read-only. Throws FormatError or IoError.
fits::FitsFile open(fs::path const& path);

/// Describes every HDU in file order without reading pixel data.
std::vector<HduInfo> list_hdus(fits::FitsFile& file);

/// Describes the HDU at the given 0-based index. Throws RangeError when the
/// index is past the last HDU.
HduInfo describe_hdu(fits::FitsFile& file, size_t hdu_index);

/// Reads the full data array of an HDU. Throws RangeError or NoDataError.
RawArray load_array(fits::FitsFile& file, size_t hdu_index);
}  // namespace fitsview
