#ifndef TCPMCP_FRAME_DECODER_HPP
#define TCPMCP_FRAME_DECODER_HPP

#include <cstddef>
#include <string>

namespace tcpmcp {

/**
 * Splits an append-only byte stream into newline-delimited text frames.
 *
 * Bytes are appended with feed() as they arrive from the socket; next_frame()
 * then yields every complete frame currently buffered, one per call, and
 * returns false once only an undelimited tail (or nothing) remains. The
 * sequence is restartable: feeding more bytes makes further frames available.
 * A trailing '\r' is stripped and blank lines are skipped.
 */
class FrameDecoder {
public:
    static constexpr char kDelimiter = '\n';

    FrameDecoder();

    void feed(const char* data, std::size_t length);
    void feed(const std::string& data) { feed(data.data(), data.size()); }

    // Moves the next complete frame into `frame`. Returns false when no
    // delimiter is buffered past the cursor.
    bool next_frame(std::string& frame);

    // Bytes received but not yet consumed as part of a frame
    std::size_t pending_bytes() const { return buffer_.size() - cursor_; }
    bool has_partial_frame() const { return pending_bytes() > 0; }

    void reset();

private:
    void compact();

    std::string buffer_;
    std::size_t cursor_;
};

} // namespace tcpmcp

#endif // TCPMCP_FRAME_DECODER_HPP
