#include "GZIPWriter.hxx"

// Local headers
#include "HttpException.hxx"
#include "HttpResponseCode.hxx"

// External APIs
#include <fmt/format.h>

// Standard library
#include <algorithm>
#include <limits>

namespace fitsview {
GZIPWriter::GZIPWriter(Writer& writer, size_t const chunk_size, int const level,
                       size_t const max_input)
        : writer_(&writer),
          chunk_size_(chunk_size),
          max_input_(std::min<size_t>(std::max<size_t>(max_input, 1),
                                      std::numeric_limits<uInt>::max())),
          stream_(),
          buffer_(chunk_size) {
    // setup zlib (15 window bits, add 16 to indicate a gzip compatible header is
    // desired)
    if (::deflateInit2(&stream_, level, Z_DEFLATED, MAX_WBITS + 16, MAX_MEM_LEVEL,
                       Z_DEFAULT_STRATEGY) != Z_OK) {
        throw HTTP_EXCEPT(
                HttpResponseCode::INTERNAL_SERVER_ERROR,
                "[zlib] deflateInit2() failed to initialize compression stream");
    }
    stream_.next_out = buffer_.data();
    stream_.avail_out = static_cast<uInt>(chunk_size_);
}

GZIPWriter::~GZIPWriter() { ::deflateEnd(&stream_); }

void GZIPWriter::flush_buffer(size_t len) {
    writer_->write(buffer_.data(), len);
    stream_.next_out = buffer_.data();
    stream_.avail_out = static_cast<uInt>(chunk_size_);
}

void GZIPWriter::write(unsigned char const* const buf, size_t const len) {
    if (buf == nullptr || len == 0) {
        return;
    }
    // avail_in is a uInt, so larger inputs are handed to zlib in pieces
    size_t offset = 0;
    while (offset < len) {
        size_t const piece = std::min(len - offset, max_input_);
        stream_.next_in = const_cast<Bytef*>(buf + offset);
        stream_.avail_in = static_cast<uInt>(piece);

        // deflate/write until the piece has been consumed
        do {
            if (stream_.avail_out == 0) {
                // no more space left in buffer_, write it out
                flush_buffer(chunk_size_);
            }
            int const zret = ::deflate(&stream_, Z_NO_FLUSH);
            if (zret != Z_OK) {
                throw HTTP_EXCEPT(
                        HttpResponseCode::INTERNAL_SERVER_ERROR,
                        fmt::format("[zlib] deflate() failed, return code: {}", zret));
            }
        } while (stream_.avail_in != 0);
        offset += piece;
    }
}

void GZIPWriter::finish() {
    if (stream_.avail_out == 0) {
        flush_buffer(chunk_size_);
    }
    while (true) {
        int const zret = ::deflate(&stream_, Z_FINISH);
        if (zret == Z_STREAM_END) {
            writer_->write(buffer_.data(), chunk_size_ - stream_.avail_out);
            break;
        } else if (zret == Z_OK) {
            if (stream_.avail_out != 0) {
                throw HTTP_EXCEPT(HttpResponseCode::INTERNAL_SERVER_ERROR,
                                  "[zlib] deflate() failed to fill output buffer");
            }
            flush_buffer(chunk_size_);
        } else {
            throw HTTP_EXCEPT(
                    HttpResponseCode::INTERNAL_SERVER_ERROR,
                    fmt::format("[zlib] deflate() failed, return code: {}", zret));
        }
    }
    writer_->finish();
}
}  // namespace fitsview
