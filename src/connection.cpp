#include <tcpmcp/connection.hpp>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <iostream>
#include <memory>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tcpmcp {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kReadChunk = 4096;

// Milliseconds left until `deadline`, rounded up and clamped for poll()
int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::microseconds>(deadline - Clock::now());
    if (left.count() <= 0) return 0;
    long long ms = (left.count() + 999) / 1000;
    return static_cast<int>(std::min<long long>(ms, INT_MAX));
}

// Attempts one resolved address. Returns a connected blocking socket or -1.
int connect_one(const addrinfo* ai, Clock::time_point deadline, std::string& error) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
        error = std::strerror(errno);
        return -1;
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        error = std::strerror(errno);
        ::close(fd);
        return -1;
    }

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
        if (errno != EINPROGRESS) {
            error = std::strerror(errno);
            ::close(fd);
            return -1;
        }

        pollfd pfd{fd, POLLOUT, 0};
        for (;;) {
            int wait = remaining_ms(deadline);
            int ready = wait > 0 ? ::poll(&pfd, 1, wait) : 0;
            if (ready < 0 && errno == EINTR) continue;
            if (ready < 0) {
                error = std::strerror(errno);
                ::close(fd);
                return -1;
            }
            if (ready == 0) {
                error = "connection timed out";
                ::close(fd);
                return -1;
            }
            break;
        }

        int so_error = 0;
        socklen_t length = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &length) < 0) {
            so_error = errno;
        }
        if (so_error != 0) {
            error = std::strerror(so_error);
            ::close(fd);
            return -1;
        }
    }

    ::fcntl(fd, F_SETFL, flags);

    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return fd;
}

} // namespace

Clock::time_point deadline_after(std::chrono::milliseconds timeout) {
    const auto now = Clock::now();
    if (timeout.count() <= 0) return now;
    // Compared in milliseconds; now + timeout would overflow the clock's nanoseconds
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (timeout >= headroom) return Clock::time_point::max();
    return now + timeout;
}

Connection::Connection()
    : fd_(-1)
    , open_(false)
    , users_(0)
    , close_pending_(false)
    , port_(0)
    , in_exchange_(false)
    , trace_(false) {
}

Connection::~Connection() {
    close();
}

void Connection::connect(const std::string& host, int port, std::chrono::milliseconds timeout) {
    if (in_exchange_) {
        throw std::logic_error("Cannot reconnect while an exchange is using the connection");
    }
    close();

    std::cerr << "Connecting to MCP server via TCP: " << host << ":" << port << std::endl;

    if (port <= 0 || port > 65535) {
        throw ConnectionError("Invalid port: " + std::to_string(port));
    }

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addresses = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &addresses);
    if (rc != 0) {
        throw ConnectionError("Failed to resolve " + host + ": " + ::gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> address_guard(addresses, &::freeaddrinfo);

    const auto deadline = deadline_after(timeout);
    std::string last_error = "no usable address";
    int fd = -1;
    for (const addrinfo* ai = addresses; ai != nullptr && fd < 0; ai = ai->ai_next) {
        fd = connect_one(ai, deadline, last_error);
    }

    if (fd < 0) {
        throw ConnectionError("Failed to connect to " + host + ":" + std::to_string(port) + ": " + last_error);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        fd_ = fd;
        open_ = true;
        users_ = 0;
        close_pending_ = false;
    }
    decoder_.reset();
    host_ = host;
    port_ = port;
    reconnect_reason_.clear();

    std::cerr << "✓ Connected to " << host << ":" << port << std::endl;
}

void Connection::send(const Request& request) {
    std::string frame = request.serialize();
    frame += FrameDecoder::kDelimiter;

    int fd = acquire("send '" + request.method + "'");

    if (trace_) {
        std::cerr << "-> " << frame.substr(0, frame.size() - 1) << std::endl;
    }

    std::size_t sent = 0;
    int error = 0;
    while (sent < frame.size()) {
        ssize_t written = ::send(fd, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR) continue;
            error = errno;
            break;
        }
        sent += static_cast<std::size_t>(written);
    }

    if (!release()) {
        if (error != 0) {
            throw ConnectionClosed("Connection closed while sending '" + request.method + "'");
        }
        return;
    }
    if (error != 0) {
        close();
        throw IOError(std::string("Failed to write request: ") + std::strerror(error));
    }
}

Message Connection::receive_next(std::chrono::milliseconds timeout) {
    const auto deadline = deadline_after(timeout);
    std::string frame;
    char chunk[kReadChunk];

    for (;;) {
        // Drain complete frames before touching the socket again
        if (decoder_.next_frame(frame)) {
            if (trace_) {
                std::cerr << "<- " << frame << std::endl;
            }
            return parse_message(frame);
        }

        int fd = acquire("receive");
        int ready = 0;
        ssize_t received = 0;
        int error = 0;

        pollfd pfd{fd, POLLIN, 0};
        ready = ::poll(&pfd, 1, remaining_ms(deadline));
        if (ready < 0) {
            error = errno;
        } else if (ready > 0) {
            received = ::recv(fd, chunk, sizeof(chunk), 0);
            if (received < 0) error = errno;
        }

        if (!release()) {
            throw ConnectionClosed("Connection closed while waiting for a message");
        }

        if (ready < 0) {
            if (error == EINTR) continue;
            close();
            throw IOError(std::string("Failed to wait for data: ") + std::strerror(error));
        }
        if (ready == 0) {
            throw TimeoutError("No message received within " + std::to_string(timeout.count()) + " ms");
        }
        if (received < 0) {
            if (error == EINTR || error == EAGAIN || error == EWOULDBLOCK) continue;
            close();
            throw IOError(std::string("Failed to read from socket: ") + std::strerror(error));
        }
        if (received == 0) {
            if (decoder_.has_partial_frame()) {
                std::cerr << "Discarding " << decoder_.pending_bytes()
                          << " undelimited bytes at end of stream" << std::endl;
            }
            close();
            throw ConnectionClosed("Server closed the connection");
        }

        decoder_.feed(chunk, static_cast<std::size_t>(received));
    }
}

void Connection::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

bool Connection::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

void Connection::require_reconnect(const std::string& reason) {
    reconnect_reason_ = reason;
    std::cerr << "Connection requires reconnect: " << reason << std::endl;
}

// Marks the descriptor in use so a concurrent close() only shuts it down
int Connection::acquire(const std::string& action) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        throw ConnectionClosed("Cannot " + action + ": connection is not open");
    }
    ++users_;
    return fd_;
}

// The last user out closes a descriptor that close() left pending.
// Returns false when the connection was closed meanwhile.
bool Connection::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    --users_;
    if (close_pending_ && users_ == 0) {
        ::close(fd_);
        fd_ = -1;
        close_pending_ = false;
    }
    return open_;
}

void Connection::close_locked() {
    if (!open_) return;
    open_ = false;

    // Wakes a sender or reader blocked on the socket; the last of them releases the descriptor
    ::shutdown(fd_, SHUT_RDWR);
    if (users_ > 0) {
        close_pending_ = true;
    } else {
        ::close(fd_);
        fd_ = -1;
    }
    std::cerr << "Disconnected from MCP server" << std::endl;
}

Connection::Exchange::Exchange(Connection& connection) : connection_(connection) {
    if (connection_.in_exchange_) {
        throw std::logic_error("Another exchange is already using this connection");
    }
    connection_.in_exchange_ = true;
}

Connection::Exchange::~Exchange() {
    connection_.in_exchange_ = false;
}

} // namespace tcpmcp
