#include <tcpmcp/frame_decoder.hpp>

namespace tcpmcp {

namespace {

// Consumed prefix is only dropped once it dominates the buffer
constexpr std::size_t kCompactThreshold = 4096;

} // namespace

FrameDecoder::FrameDecoder() : cursor_(0) {
}

void FrameDecoder::feed(const char* data, std::size_t length) {
    if (length == 0) return;
    compact();
    buffer_.append(data, length);
}

bool FrameDecoder::next_frame(std::string& frame) {
    while (cursor_ < buffer_.size()) {
        std::size_t newline = buffer_.find(kDelimiter, cursor_);
        if (newline == std::string::npos) {
            return false;
        }

        std::size_t end = newline;
        if (end > cursor_ && buffer_[end - 1] == '\r') {
            --end;
        }

        std::size_t start = cursor_;
        cursor_ = newline + 1;

        if (end == start) {
            continue;  // blank line
        }

        frame.assign(buffer_, start, end - start);
        return true;
    }
    return false;
}

void FrameDecoder::reset() {
    buffer_.clear();
    cursor_ = 0;
}

void FrameDecoder::compact() {
    if (cursor_ == buffer_.size()) {
        buffer_.clear();
        cursor_ = 0;
    } else if (cursor_ >= kCompactThreshold && cursor_ * 2 >= buffer_.size()) {
        buffer_.erase(0, cursor_);
        cursor_ = 0;
    }
}

} // namespace tcpmcp
