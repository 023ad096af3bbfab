#ifndef TCPMCP_CONFIG_HPP
#define TCPMCP_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string>

#include <tcpmcp/session.hpp>

namespace tcpmcp {

constexpr const char* kDefaultHost = "localhost";
constexpr int kDefaultPort = 9000;

// Longest connect or request timeout accepted from the environment or argv
constexpr std::chrono::hours kMaxTimeout{24};

/**
 * Client settings.
 *
 * from_environment() starts from the defaults and overlays:
 *   MCP_HOST, MCP_PORT, MCP_CONNECT_TIMEOUT_MS, MCP_REQUEST_TIMEOUT_MS,
 *   MCP_SKIP_MALFORMED (1 = skip malformed frames), MCP_VERBOSE (1 = trace frames)
 * An unparsable value throws std::invalid_argument naming the variable.
 */
struct ClientConfig {
    std::string host = kDefaultHost;
    int port = kDefaultPort;
    std::chrono::milliseconds connect_timeout{5000};
    // Matches the server's per-command limit
    std::chrono::milliseconds request_timeout{30000};
    MalformedPolicy malformed_policy = MalformedPolicy::ABORT;
    bool verbose = false;

    static ClientConfig from_environment();
};

// Parsing helpers shared with the command line front end
int parse_port(const std::string& value, const std::string& source);
std::chrono::milliseconds parse_timeout_ms(const std::string& value, const std::string& source);
std::size_t parse_count(const std::string& value, const std::string& source);
bool parse_flag(const std::string& value, const std::string& source);

} // namespace tcpmcp

#endif // TCPMCP_CONFIG_HPP
