#pragma once

// Local headers
#include "Writer.hxx"

// Standard library
#include <vector>

namespace fitsview {
/** Writes output to an in-memory buffer.
 */
class MemoryWriter : public Writer {
public:
    explicit MemoryWriter(size_t initial_capacity = 64 * 1024);
    virtual ~MemoryWriter();

    virtual void write(unsigned char const* const buf, size_t const len);
    virtual void finish();

    bool is_finished() const { return finished_; }
    size_t get_content_length() const { return content_.size(); }

    /// Hands the buffered bytes over to the caller, leaving this writer empty.
    std::vector<unsigned char> release();

private:
    // disable copy construction and assignment
    MemoryWriter(MemoryWriter const&) = delete;
    MemoryWriter& operator=(MemoryWriter const&) = delete;

    std::vector<unsigned char> content_;
    bool finished_;
};
}  // namespace fitsview
