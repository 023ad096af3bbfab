#ifndef TCPMCP_ERRORS_HPP
#define TCPMCP_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tcpmcp {

// Base class for every failure raised by the protocol engine
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Socket could not be established (refused, unreachable, DNS failure, timeout),
// or the connection must be reopened before it can carry another request.
class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string& what) : Error(what) {}
};

// Read or write failed at the transport layer mid-session
class IOError : public Error {
public:
    explicit IOError(const std::string& what) : Error(what) {}
};

// No complete frame arrived before the deadline. Retryable.
class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& what) : Error(what) {}
};

// Peer closed the stream gracefully. Not retryable on this connection.
class ConnectionClosed : public Error {
public:
    explicit ConnectionClosed(const std::string& what) : Error(what) {}
};

class ProtocolDecodeError : public Error {
public:
    ProtocolDecodeError(const std::string& raw, const std::string& cause)
        : Error("Malformed frame: " + cause), raw_(raw), cause_(cause) {}

    const std::string& raw() const { return raw_; }
    const std::string& cause() const { return cause_; }

private:
    std::string raw_;
    std::string cause_;
};

// Terminal message id does not match the outstanding request
class CorrelationError : public Error {
public:
    CorrelationError(const std::string& expected, const std::string& received)
        : Error("Correlation mismatch: expected id '" + expected + "', received '" + received + "'")
        , expected_(expected)
        , received_(received) {}

    const std::string& expected() const { return expected_; }
    const std::string& received() const { return received_; }

private:
    std::string expected_;
    std::string received_;
};

} // namespace tcpmcp

#endif // TCPMCP_ERRORS_HPP
