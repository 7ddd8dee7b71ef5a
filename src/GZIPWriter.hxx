#pragma once

// Local headers
#include "Writer.hxx"

// External APIs
#include <zlib.h>

// Standard library
#include <limits>
#include <vector>

namespace fitsview {
/** Writes GZIP compressed output to another writer.
 */
class GZIPWriter : public Writer {
public:
    /// @a max_input bounds how much input is handed to zlib per deflate
    /// pass; it may not exceed what a @c uInt can count.
    explicit GZIPWriter(Writer& writer, size_t const chunk_size = 8192,
                        int const level = Z_BEST_SPEED,
                        size_t const max_input = std::numeric_limits<uInt>::max());
    virtual ~GZIPWriter();

    virtual void write(unsigned char const* const buf, size_t const size);
    virtual void finish();

    size_t get_chunk_size() const { return chunk_size_; }

private:
    // disable copy construction and assignment
    GZIPWriter(GZIPWriter const&) = delete;
    GZIPWriter& operator=(GZIPWriter const&) = delete;

    void flush_buffer(size_t len);

    Writer* writer_;
    size_t const chunk_size_;            ///< output granularity
    size_t const max_input_;             ///< input granularity
    z_stream stream_;                    ///< zlib state
    std::vector<unsigned char> buffer_;  ///< compressed output buffer
};
}  // namespace fitsview
