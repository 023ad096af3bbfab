#ifndef TCPMCP_CORRELATOR_HPP
#define TCPMCP_CORRELATOR_HPP

#include <cstdint>
#include <string>

#include <tcpmcp/connection.hpp>
#include <tcpmcp/message.hpp>

namespace tcpmcp {

/**
 * Stamps outgoing requests with identifiers and checks terminal messages
 * against them.
 *
 * Ids are decimal strings of a counter that only grows ("1", "2", ...). They
 * are never reused, including across reconnects of the same Connection.
 */
class RequestCorrelator {
public:
    explicit RequestCorrelator(Connection& connection);

    std::string next_id();

    // Assigns an id and sends the request. Throws ConnectionError when the
    // connection has to be reopened first, plus anything Connection::send throws.
    std::string issue(const std::string& method, const json& params = json::object());

    // True when a terminal message answers the request with `id`
    static bool matches(const Message& message, const std::string& id);

    std::uint64_t issued_count() const { return counter_; }

private:
    Connection& connection_;
    std::uint64_t counter_;
};

} // namespace tcpmcp

#endif // TCPMCP_CORRELATOR_HPP
