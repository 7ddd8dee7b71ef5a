#include "fits/HDU.hxx"

// Local headers
#include "fits/FitsError.hxx"

// Standard library
#include <functional>
#include <numeric>

namespace fits {
namespace {
constexpr size_t FITS_CARD_LENGTH = 80;
}  // namespace

HDU::HDU(FitsFile& owner, size_t hdu_num) : owner_(owner), hdu_num_(hdu_num) {}

size_t HDU::hdu_num() const { return hdu_num_; }

size_t HDU::naxis() {
    make_current();

    int result = 0;
    int status = 0;
    if (fits_get_img_dim(owner_.get(), &result, &status) > 0) {
        throw FitsError(status);
    }
    return static_cast<size_t>(result);
}
std::vector<long> HDU::naxes() {
    make_current();

    std::vector<long> result(naxis());
    if (result.empty()) {
        return result;
    }
    int status = 0;
    if (fits_get_img_size(owner_.get(), static_cast<int>(result.size()), result.data(),
                          &status) > 0) {
        throw FitsError(status);
    }
    return result;
}

HDU::Type HDU::ext_type() {
    make_current();

    int status = 0;
    int ext_type = 0;
    if (fits_get_hdu_type(owner_.get(), &ext_type, &status) > 0) {
        throw FitsError(status);
    }
    return static_cast<Type>(ext_type);
}

PixelFormat HDU::pixel_format() {
    make_current();

    int status = 0;
    int result = 0;
    if (fits_get_img_type(owner_.get(), &result, &status) > 0) {
        throw FitsError(status);
    }
    return static_cast<PixelFormat>(result);
}

void HDU::make_current() { owner_.make_hdu_current(hdu_num_); }

size_t HDU::keyword_count() {
    make_current();

    int status = 0;
    int nkeys = 0;
    if (fits_get_hdrspace(owner_.get(), &nkeys, nullptr, &status) > 0) {
        throw FitsError(status);
    }
    return static_cast<size_t>(nkeys);
}

std::string HDU::read_record(size_t index) {
    make_current();

    char card[FLEN_CARD];
    int status = 0;
    if (fits_read_record(owner_.get(), static_cast<int>(index + 1), card, &status) > 0) {
        throw FitsError(status);
    }
    std::string result(card);
    if (result.size() < FITS_CARD_LENGTH) {
        result.append(FITS_CARD_LENGTH - result.size(), ' ');
    }
    return result;
}

std::string HDU::header_text() {
    size_t nkeys = keyword_count();
    std::string result;
    result.reserve(nkeys * (FITS_CARD_LENGTH + 1));
    for (size_t k = 0; k < nkeys; ++k) {
        if (k != 0) {
            result.append(1, '\n');
        }
        result.append(read_record(k));
    }
    return result;
}

std::optional<std::string> HDU::read_key_string(const std::string& key) {
    make_current();

    char value[FLEN_VALUE];
    int status = 0;
    if (fits_read_key_str(owner_.get(), key.c_str(), value, nullptr, &status) > 0) {
        if (status == KEY_NO_EXIST) {
            fits_clear_errmsg();
            return std::nullopt;
        }
        throw FitsError(status);
    }
    return std::string(value);
}

bool HDU::is_compressed_image() {
    make_current();

    int status = 0;
    return fits_is_compressed_image(owner_.get(), &status) != 0;
}

void HDU::clear_bscale() {
    make_current();

    int status = 0;
    if (fits_set_bscale(owner_.get(), 1.0, 0.0, &status) > 0) {
        throw FitsError(status);
    }
}

std::vector<unsigned char> HDU::read_data_segment(size_t nbytes) {
    make_current();

    LONGLONG data_start = 0;
    LONGLONG data_end = 0;
    int status = 0;
    if (fits_get_hduaddrll(owner_.get(), nullptr, &data_start, &data_end, &status) > 0) {
        throw FitsError(status);
    }
    if (static_cast<LONGLONG>(nbytes) > data_end - data_start) {
        throw FitsError("Data segment is shorter than the image it describes",
                        END_OF_FILE);
    }
    std::vector<unsigned char> result(nbytes);
    if (nbytes == 0) {
        return result;
    }
    // Move to the initial copy position
    if (ffmbyt(owner_.get(), data_start, REPORT_EOF, &status) > 0) {
        throw FitsError(status);
    }
    if (ffgbyt(owner_.get(), static_cast<LONGLONG>(nbytes), result.data(), &status) > 0) {
        throw FitsError(status);
    }
    return result;
}

std::vector<unsigned char> HDU::read_image() {
    PixelFormat format = pixel_format();
    TableDataType datatype = pixel_data_type(format);
    if (datatype == TableDataType::unknown) {
        throw FitsError("Unsupported BITPIX value", BAD_BITPIX);
    }
    std::vector<long> axes = naxes();
    size_t nelem = std::accumulate(axes.begin(), axes.end(), size_t(1),
                                   std::multiplies<size_t>());
    std::vector<unsigned char> result(nelem * sizeof_pixel(format));
    if (nelem == 0) {
        return result;
    }

    clear_bscale();
    int status = 0;
    int anynul = 0;
    if (fits_read_img(owner_.get(), static_cast<int>(datatype), 1,
                      static_cast<LONGLONG>(nelem), nullptr, result.data(), &anynul,
                      &status) > 0) {
        throw FitsError(status);
    }
    return result;
}
}  // namespace fits
