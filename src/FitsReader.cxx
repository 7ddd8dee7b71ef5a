#include "FitsReader.hxx"

// Local headers
#include "Errors.hxx"
#include "fits/FitsError.hxx"
#include "fits/HDU.hxx"
#include "fits/HDUIterator.hxx"

// External APIs
#include <fmt/format.h>

// Standard library
#include <algorithm>
#include <functional>
#include <numeric>

namespace fitsview {
namespace {
[[noreturn]] void rethrow(fits::FitsError const& e) {
    if (e.is_io_error()) {
        throw IoError(e.what());
    }
    throw FormatError(e.what());
}

std::string trim_right(std::string const& s) {
    std::string::size_type end = s.find_last_not_of(' ');
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

HduKind classify(fits::HDU& hdu) {
    fits::HDU::Type const type = hdu.ext_type();
    if (hdu.hdu_num() == 1) {
        return type == fits::HDU::Type::image ? HduKind::primary : HduKind::unknown;
    }
    // Tile-compressed images are stored in binary tables
    if (hdu.is_compressed_image()) {
        return HduKind::compressed_image;
    }
    switch (type) {
        case fits::HDU::Type::image: {
            std::string xtension =
                    trim_right(hdu.read_key_string("XTENSION").value_or(""));
            if (xtension == "IMAGE" || xtension == "IUEIMAGE") {
                return HduKind::image;
            }
            return HduKind::unknown;
        }
        case fits::HDU::Type::ascii:
            return HduKind::ascii_table;
        case fits::HDU::Type::binary:
            return HduKind::binary_table;
        default:
            return HduKind::unknown;
    }
}

bool is_image_kind(HduKind kind) {
    return kind == HduKind::primary || kind == HduKind::image ||
           kind == HduKind::compressed_image;
}

HduInfo describe(fits::HDU& hdu) {
    HduInfo info;
    info.index = hdu.hdu_num() - 1;
    info.kind = classify(hdu);
    info.header_text = hdu.header_text();

    std::optional<std::string> extname = hdu.read_key_string("EXTNAME");
    if (extname) {
        info.name = trim_right(*extname);
    } else if (info.kind == HduKind::primary) {
        info.name = "PRIMARY";
    }

    if (is_image_kind(info.kind)) {
        std::vector<long> naxes = hdu.naxes();
        bool has_data = !naxes.empty() && std::all_of(naxes.begin(), naxes.end(),
                                                      [](long n) { return n > 0; });
        if (has_data) {
            // FITS lists the fastest varying axis first
            info.shape = std::vector<long>(naxes.rbegin(), naxes.rend());
            info.element_type = element_type_of(hdu.pixel_format());
        }
    }
    return info;
}

void check_index(fits::FitsFile& file, size_t hdu_index) {
    size_t n = file.hdu_count();
    if (hdu_index >= n) {
        throw RangeError(fmt::format("HDU index {} out of range (file has {} HDUs)",
                                     hdu_index, n));
    }
}
}  // namespace

char const* hdu_type_name(HduKind kind) {
    switch (kind) {
        case HduKind::primary:
            return "PrimaryHDU";
        case HduKind::image:
            return "ImageHDU";
        case HduKind::compressed_image:
            return "CompImageHDU";
        case HduKind::ascii_table:
            return "TableHDU";
        case HduKind::binary_table:
            return "BinTableHDU";
        case HduKind::unknown:
            break;
    }
    return "NonstandardExtHDU";
}

fits::FitsFile open(fs::path const& path) {
    try {
        return fits::FitsFile(path.string());
    } catch (fits::FitsError const& e) {
        rethrow(e);
    }
}

std::vector<HduInfo> list_hdus(fits::FitsFile& file) {
    try {
        std::vector<HduInfo> result;
        for (fits::HDU hdu : file) {
            result.push_back(describe(hdu));
        }
        return result;
    } catch (fits::FitsError const& e) {
        rethrow(e);
    }
}

HduInfo describe_hdu(fits::FitsFile& file, size_t hdu_index) {
    try {
        check_index(file, hdu_index);
        fits::HDU hdu = file.make_hdu_current(hdu_index + 1);
        return describe(hdu);
    } catch (fits::FitsError const& e) {
        rethrow(e);
    }
}

/** Reads the data array of an image HDU. Uncompressed data is copied
 * straight from the data segment and stays big-endian; tile-compressed
 * data can only be decoded by cfitsio, which yields native byte order.
 */
RawArray load_array(fits::FitsFile& file, size_t hdu_index) {
    try {
        HduInfo info = describe_hdu(file, hdu_index);
        if (!info.has_data()) {
            throw NoDataError(fmt::format("HDU {} has no data", hdu_index));
        }
        fits::HDU hdu = file.make_hdu_current(hdu_index + 1);

        RawArray array;
        array.shape = *info.shape;
        array.element_type = *info.element_type;
        size_t nelem = std::accumulate(array.shape.begin(), array.shape.end(), size_t(1),
                                       std::multiplies<size_t>());
        if (info.kind == HduKind::compressed_image) {
            array.byte_order = native_byte_order();
            array.bytes = hdu.read_image();
        } else {
            array.byte_order = ByteOrder::big;
            array.bytes = hdu.read_data_segment(nelem * element_size(array.element_type));
        }
        return array;
    } catch (fits::FitsError const& e) {
        rethrow(e);
    }
}
}  // namespace fitsview
