#ifndef TCPMCP_CONNECTION_HPP
#define TCPMCP_CONNECTION_HPP

#include <chrono>
#include <mutex>
#include <string>

#include <tcpmcp/errors.hpp>
#include <tcpmcp/frame_decoder.hpp>
#include <tcpmcp/message.hpp>

namespace tcpmcp {

// now + timeout, saturating at time_point::max() for very large timeouts
std::chrono::steady_clock::time_point deadline_after(std::chrono::milliseconds timeout);

/**
 * One TCP connection to an MCP server speaking newline-delimited JSON.
 *
 * The connection owns the socket and the frame decoder's input buffer. At most
 * one request/response exchange may use it at a time; an Exchange object
 * claims it for the duration of that exchange.
 *
 * close() may be called from another thread to abort a blocked send() or
 * receive_next(), which then throws ConnectionClosed. The descriptor is only
 * released once no call is using it.
 */
class Connection {
public:
    Connection();
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Throws ConnectionError on refusal, DNS failure or timeout
    void connect(const std::string& host, int port, std::chrono::milliseconds timeout);

    // Writes one delimited frame. Throws IOError and closes the socket on failure,
    // or ConnectionClosed when the connection is (or gets) closed.
    void send(const Request& request);

    // Blocks until a complete frame is decoded or the timeout elapses.
    // Throws TimeoutError, ConnectionClosed (EOF or local close) or IOError.
    Message receive_next(std::chrono::milliseconds timeout);

    // Idempotent; safe after a prior error
    void close();

    bool is_connected() const;

    // Set after an exchange ended in a state that leaves unread data for
    // the old request on the wire. Cleared by the next connect().
    void require_reconnect(const std::string& reason);
    bool needs_reconnect() const { return !reconnect_reason_.empty(); }
    const std::string& reconnect_reason() const { return reconnect_reason_; }

    const std::string& host() const { return host_; }
    int port() const { return port_; }

    void set_trace(bool enabled) { trace_ = enabled; }

    /**
     * Claims the connection for one exchange. Constructing a second Exchange
     * while one is alive throws std::logic_error.
     */
    class Exchange {
    public:
        explicit Exchange(Connection& connection);
        ~Exchange();

        Exchange(const Exchange&) = delete;
        Exchange& operator=(const Exchange&) = delete;

        Connection& connection() { return connection_; }

    private:
        Connection& connection_;
    };

    bool in_exchange() const { return in_exchange_; }

private:
    int acquire(const std::string& action);
    bool release();
    void close_locked();

    mutable std::mutex mutex_;
    int fd_;
    bool open_;
    int users_;
    bool close_pending_;

    FrameDecoder decoder_;

    std::string host_;
    int port_;
    std::string reconnect_reason_;
    bool in_exchange_;
    bool trace_;
};

} // namespace tcpmcp

#endif // TCPMCP_CONNECTION_HPP
