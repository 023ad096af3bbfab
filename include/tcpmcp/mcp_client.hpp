#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include <tcpmcp/config.hpp>
#include <tcpmcp/connection.hpp>
#include <tcpmcp/correlator.hpp>
#include <tcpmcp/errors.hpp>
#include <tcpmcp/message.hpp>
#include <tcpmcp/session.hpp>

using json = nlohmann::json;

namespace tcpmcp {

// A metadata request (anything but call_tool) did not complete
class RequestError : public Error {
public:
    RequestError(const std::string& method, const SessionOutcome& outcome);

    const std::string& method() const { return method_; }
    SessionState state() const { return state_; }
    FailureKind failure() const { return failure_; }
    const std::string& detail() const { return detail_; }

private:
    std::string method_;
    SessionState state_;
    FailureKind failure_;
    std::string detail_;
};

// Everything observed during one call_tool exchange
struct ToolOutcome {
    SessionState state = SessionState::PENDING;
    FailureKind failure = FailureKind::NONE;
    std::string request_id;
    std::vector<Notification> notifications;
    ToolCallResult result;   // valid when state == COMPLETED
    std::string error;

    bool ok() const { return state == SessionState::COMPLETED; }
};

/**
 * MCP Client for the shell server's line-delimited JSON protocol over TCP.
 *
 * One request is outstanding at a time. Tool failures reported by the server
 * come back as data in ToolOutcome; metadata requests throw RequestError.
 * After a timeout or a desynchronized exchange the client refuses new
 * requests (ConnectionError) until reconnect().
 */
class MCPClient {
public:
    explicit MCPClient(const ClientConfig& config = ClientConfig());
    ~MCPClient();

    MCPClient(const MCPClient&) = delete;
    MCPClient& operator=(const MCPClient&) = delete;

    // Connection methods
    void connect();
    void connect(const std::string& host, int port);
    void reconnect();
    void disconnect();
    bool is_connected() const { return connection_.is_connected(); }

    // MCP Protocol methods
    ServerInfo initialize();
    std::vector<ToolDescriptor> list_tools();
    ToolOutcome call_tool(const std::string& name, const json& arguments = json::object(),
                          ToolSession::NotificationHandler on_notification = nullptr);
    ExecutionStatus get_execution_status(const std::string& execution_id);
    std::string cancel_execution(const std::string& execution_id);

    // Utility methods
    std::string get_server_name() const { return server_name_; }
    std::string get_server_version() const { return server_version_; }
    const ClientConfig& config() const { return config_; }
    Connection& connection() { return connection_; }

private:
    SessionOutcome run_exchange(const std::string& method, const json& params,
                                ToolSession::NotificationHandler on_notification);
    json request_result(const std::string& method, const json& params = json::object());

    ClientConfig config_;
    Connection connection_;
    RequestCorrelator correlator_;

    std::string server_name_;
    std::string server_version_;
};

} // namespace tcpmcp
