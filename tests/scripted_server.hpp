// Loopback MCP server used by the tests: serves clients one at a time,
// records every request line and answers with scripted raw writes.
#ifndef TCPMCP_TESTS_SCRIPTED_SERVER_HPP
#define TCPMCP_TESTS_SCRIPTED_SERVER_HPP

#include <tcpmcp/frame_decoder.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using json = nlohmann::json;

namespace tcpmcp {
namespace testing {

struct Reply {
    // Written verbatim, in order; "{id}" is replaced by the request id
    std::vector<std::string> writes;
    // Close the client socket after writing
    bool close = false;
    // Split every write into pieces of this size (0 = whole)
    size_t chunk_size = 0;
};

using RequestHandler = std::function<Reply(const json& request)>;

class ScriptedServer {
public:
    explicit ScriptedServer(RequestHandler handler)
        : handler_(std::move(handler)), listen_fd_(-1), client_fd_(-1), port_(0), stopping_(false) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }
        int one = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(listen_fd_, 1) < 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }

        socklen_t length = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &length);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~ScriptedServer() {
        stopping_ = true;
        ::shutdown(listen_fd_, SHUT_RDWR);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (client_fd_ >= 0) ::shutdown(client_fd_, SHUT_RDWR);
        }
        if (thread_.joinable()) thread_.join();
        ::close(listen_fd_);
    }

    ScriptedServer(const ScriptedServer&) = delete;
    ScriptedServer& operator=(const ScriptedServer&) = delete;

    int port() const { return port_; }

    size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::vector<json> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    // Replies with `frames`, each followed by a newline
    static Reply frames(std::vector<std::string> lines, size_t chunk_size = 0) {
        Reply reply;
        for (auto& line : lines) {
            reply.writes.push_back(line + "\n");
        }
        reply.chunk_size = chunk_size;
        return reply;
    }

private:
    // Clients are served one after another until the server is destroyed
    void serve() {
        while (!stopping_) {
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) return;
            serve_client(fd);
        }
    }

    void serve_client(int fd) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            client_fd_ = fd;
        }

        FrameDecoder decoder;
        char buffer[1024];
        bool open = true;

        while (open && !stopping_) {
            ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) break;
            decoder.feed(buffer, static_cast<size_t>(n));

            std::string line;
            while (open && decoder.next_frame(line)) {
                json request = json::parse(line, nullptr, false);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    requests_.push_back(request);
                }
                std::string id = request.is_object() && request.contains("id") && request["id"].is_string()
                                     ? request["id"].get<std::string>() : "";
                Reply reply = handler_(request);
                for (auto write : reply.writes) {
                    substitute(write, id);
                    send_chunked(fd, write, reply.chunk_size);
                }
                if (reply.close) open = false;
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ::close(fd);
        client_fd_ = -1;
    }

    static void substitute(std::string& text, const std::string& id) {
        const std::string token = "{id}";
        size_t pos = 0;
        while ((pos = text.find(token, pos)) != std::string::npos) {
            text.replace(pos, token.size(), id);
            pos += id.size();
        }
    }

    static void send_chunked(int fd, const std::string& data, size_t chunk_size) {
        size_t step = chunk_size == 0 ? data.size() : chunk_size;
        for (size_t offset = 0; offset < data.size(); offset += step) {
            size_t length = std::min(step, data.size() - offset);
            if (::send(fd, data.data() + offset, length, MSG_NOSIGNAL) < 0) return;
            if (chunk_size != 0) {
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
        }
    }

    RequestHandler handler_;
    int listen_fd_;
    int client_fd_;
    int port_;
    std::atomic<bool> stopping_;
    mutable std::mutex mutex_;
    std::vector<json> requests_;
    std::thread thread_;
};

} // namespace testing
} // namespace tcpmcp

#endif // TCPMCP_TESTS_SCRIPTED_SERVER_HPP
