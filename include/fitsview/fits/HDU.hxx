#pragma once

// Local headers
#include "FitsFile.hxx"
#include "PixelFormat.hxx"

// Standard library
#include <optional>
#include <string>
#include <vector>

namespace fits {
class HDU {
public:
    enum class Type {
        image = IMAGE_HDU,
        ascii = ASCII_TBL,
        binary = BINARY_TBL,
        any = ANY_HDU,
    };

    HDU(FitsFile& owner, size_t hdu_num);

    // 1-based position of this HDU in its file.
    size_t hdu_num() const;

    size_t naxis();
    std::vector<long> naxes();

    Type ext_type();

    PixelFormat pixel_format();

    void make_current();

    size_t keyword_count();

    // Reads the 0-based header record, padded with blanks to 80 columns.
    std::string read_record(size_t index);

    // All header records in stored order, joined with '\n'. END is not included.
    std::string header_text();

    // Reads a string-valued keyword, or nothing if the keyword is absent.
    std::optional<std::string> read_key_string(const std::string& key);

    bool is_compressed_image();

    void clear_bscale();

    // Reads the first nbytes bytes of the data segment exactly as stored.
    std::vector<unsigned char> read_data_segment(size_t nbytes);

    // Decodes every pixel of the image through cfitsio, in native byte order
    // and with scaling disabled.
    std::vector<unsigned char> read_image();

private:
    FitsFile owner_;
    size_t hdu_num_;
};
}  // namespace fits
