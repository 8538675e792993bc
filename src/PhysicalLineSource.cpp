#include "PhysicalLineSource.hpp"
#include <ios>
#include <stdexcept>
#include "LineUtils.hpp"

StreamLineSource::StreamLineSource(std::istream& in)
    : in_(in) {
    if (in_.fail()) {
        throw std::ios_base::failure("stream is in a failed state");
    }
}

StreamLineSource::StreamLineSource(std::unique_ptr<std::istream> owned)
    : owned_(std::move(owned)),
      in_(*owned_) {}

bool StreamLineSource::readLine(std::string& line) {
    if (exhausted_) {
        return false;
    }
    if (!read_physical_line(in_, line)) {
        exhausted_ = true;
        return false;
    }
    return true;
}

MappedLineSource::MappedLineSource(std::shared_ptr<const MemorySegment> segment)
    : segment_(std::move(segment)) {
    if (!segment_) {
        throw std::invalid_argument("MappedLineSource requires a segment");
    }
    const char* data = segment_->data();
    if (segment_->size() >= 3 && data[0] == '\xEF' && data[1] == '\xBB' && data[2] == '\xBF') {
        bom_ = true;
        pos_ = 3;
    }
}

bool MappedLineSource::readLine(std::string& line) {
    size_t start_byte = 0;
    size_t bytes_len = 0;
    if (!next_line_range(segment_->data(), segment_->size(), pos_, start_byte, bytes_len)) {
        return false;
    }
    line.assign(segment_->data() + start_byte, bytes_len);
    return true;
}

bool MappedLineSource::hasUtf8Bom() const {
    return bom_;
}
