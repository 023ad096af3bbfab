#include <tcpmcp/correlator.hpp>

namespace tcpmcp {

RequestCorrelator::RequestCorrelator(Connection& connection)
    : connection_(connection)
    , counter_(0) {
}

std::string RequestCorrelator::next_id() {
    return std::to_string(++counter_);
}

std::string RequestCorrelator::issue(const std::string& method, const json& params) {
    if (connection_.needs_reconnect()) {
        throw ConnectionError("Connection must be reopened before sending '" + method +
                              "': " + connection_.reconnect_reason());
    }

    Request request;
    request.id = next_id();
    request.method = method;
    request.params = params;

    connection_.send(request);
    return request.id;
}

bool RequestCorrelator::matches(const Message& message, const std::string& id) {
    return message.is_terminal() && message.has_id && message.id == id;
}

} // namespace tcpmcp
