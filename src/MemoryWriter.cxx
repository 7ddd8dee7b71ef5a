#include "MemoryWriter.hxx"

// Local headers
#include "HttpException.hxx"
#include "HttpResponseCode.hxx"

namespace fitsview {
MemoryWriter::MemoryWriter(size_t initial_capacity) : content_(), finished_(false) {
    content_.reserve(initial_capacity);
}

MemoryWriter::~MemoryWriter() {}

void MemoryWriter::write(unsigned char const* const buf, size_t const len) {
    if (finished_) {
        throw HTTP_EXCEPT(HttpResponseCode::INTERNAL_SERVER_ERROR,
                          "write to a finished memory writer");
    }
    if (buf == nullptr || len == 0) {
        return;
    }
    if (content_.size() + len < content_.size()) {
        throw HTTP_EXCEPT(HttpResponseCode::INTERNAL_SERVER_ERROR,
                          "too much data to buffer in memory");
    }
    content_.insert(content_.end(), buf, buf + len);
}

void MemoryWriter::finish() { finished_ = true; }

std::vector<unsigned char> MemoryWriter::release() {
    std::vector<unsigned char> result;
    result.swap(content_);
    return result;
}
}  // namespace fitsview
