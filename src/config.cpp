#include <tcpmcp/config.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace tcpmcp {

namespace {

long long parse_integer(const std::string& value, const std::string& source) {
    if (value.empty()) {
        throw std::invalid_argument(source + " is empty");
    }
    std::size_t consumed = 0;
    long long number;
    try {
        number = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(source + " is not a number: '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(source + " is not a number: '" + value + "'");
    }
    return number;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // namespace

int parse_port(const std::string& value, const std::string& source) {
    long long port = parse_integer(value, source);
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument(source + " is out of range: " + value);
    }
    return static_cast<int>(port);
}

std::chrono::milliseconds parse_timeout_ms(const std::string& value, const std::string& source) {
    long long ms = parse_integer(value, source);
    if (ms < 0) {
        throw std::invalid_argument(source + " must not be negative: " + value);
    }
    if (ms > std::chrono::duration_cast<std::chrono::milliseconds>(kMaxTimeout).count()) {
        throw std::invalid_argument(source + " is out of range (at most " +
                                    std::to_string(kMaxTimeout.count()) + " hours): " + value);
    }
    return std::chrono::milliseconds(ms);
}

std::size_t parse_count(const std::string& value, const std::string& source) {
    long long count = parse_integer(value, source);
    if (count < 0) {
        throw std::invalid_argument(source + " must not be negative: " + value);
    }
    return static_cast<std::size_t>(count);
}

bool parse_flag(const std::string& value, const std::string& source) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw std::invalid_argument(source + " is not a boolean: '" + value + "'");
}

ClientConfig ClientConfig::from_environment() {
    ClientConfig config;

    if (const char* host = env("MCP_HOST")) {
        config.host = host;
    }
    if (const char* port = env("MCP_PORT")) {
        config.port = parse_port(port, "MCP_PORT");
    }
    if (const char* timeout = env("MCP_CONNECT_TIMEOUT_MS")) {
        config.connect_timeout = parse_timeout_ms(timeout, "MCP_CONNECT_TIMEOUT_MS");
    }
    if (const char* timeout = env("MCP_REQUEST_TIMEOUT_MS")) {
        config.request_timeout = parse_timeout_ms(timeout, "MCP_REQUEST_TIMEOUT_MS");
    }
    if (const char* skip = env("MCP_SKIP_MALFORMED")) {
        config.malformed_policy = parse_flag(skip, "MCP_SKIP_MALFORMED") ? MalformedPolicy::SKIP
                                                                         : MalformedPolicy::ABORT;
    }
    if (const char* verbose = env("MCP_VERBOSE")) {
        config.verbose = parse_flag(verbose, "MCP_VERBOSE");
    }

    return config;
}

} // namespace tcpmcp
