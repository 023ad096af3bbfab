#include <tcpmcp/mcp_client.hpp>
#include <iostream>

namespace tcpmcp {

RequestError::RequestError(const std::string& method, const SessionOutcome& outcome)
    : Error("Request '" + method + "' ended " + to_string(outcome.state) +
            (outcome.error.empty() ? std::string() : ": " + outcome.error))
    , method_(method)
    , state_(outcome.state)
    , failure_(outcome.failure)
    , detail_(outcome.error) {
}

MCPClient::MCPClient(const ClientConfig& config)
    : config_(config)
    , correlator_(connection_) {
    connection_.set_trace(config_.verbose);
}

MCPClient::~MCPClient() {
    disconnect();
}

void MCPClient::connect() {
    connect(config_.host, config_.port);
}

void MCPClient::connect(const std::string& host, int port) {
    connection_.connect(host, port, config_.connect_timeout);
    config_.host = host;
    config_.port = port;
}

void MCPClient::reconnect() {
    connection_.close();
    connection_.connect(config_.host, config_.port, config_.connect_timeout);
}

void MCPClient::disconnect() {
    connection_.close();
}

ServerInfo MCPClient::initialize() {
    json result = request_result(method::kInitialize);
    ServerInfo info = server_info_from(result);

    server_name_ = info.server;
    server_version_ = info.version;

    std::cerr << "✓ Connected to: " << server_name_ << " v" << server_version_ << std::endl;
    return info;
}

std::vector<ToolDescriptor> MCPClient::list_tools() {
    return tools_from(request_result(method::kListTools));
}

ToolOutcome MCPClient::call_tool(const std::string& name, const json& arguments,
                                 ToolSession::NotificationHandler on_notification) {
    json params = {
        {"tool", name},
        {"args", arguments.is_null() ? json::object() : arguments}
    };

    SessionOutcome session = run_exchange(method::kCallTool, params, std::move(on_notification));

    ToolOutcome outcome;
    outcome.state = session.state;
    outcome.failure = session.failure;
    outcome.request_id = session.request_id;
    outcome.notifications = std::move(session.notifications);
    outcome.error = session.error;

    if (session.completed()) {
        try {
            outcome.result = tool_call_result_from(session.result);
        } catch (const ProtocolDecodeError& e) {
            outcome.state = SessionState::FAILED;
            outcome.failure = FailureKind::DECODE;
            outcome.error = e.what();
        }
    }

    return outcome;
}

ExecutionStatus MCPClient::get_execution_status(const std::string& execution_id) {
    return execution_status_from(request_result(method::kGetExecutionStatus,
                                                {{"execution_id", execution_id}}));
}

std::string MCPClient::cancel_execution(const std::string& execution_id) {
    json result = request_result(method::kCancelExecution, {{"execution_id", execution_id}});
    auto status = result.find("status");
    if (status == result.end() || !status->is_string()) {
        throw ProtocolDecodeError(result.dump(), "cancel_execution result without string 'status'");
    }
    return status->get<std::string>();
}

SessionOutcome MCPClient::run_exchange(const std::string& method, const json& params,
                                       ToolSession::NotificationHandler on_notification) {
    Connection::Exchange exchange(connection_);

    if (!connection_.is_connected()) {
        throw ConnectionError("Not connected to an MCP server");
    }

    std::string id;
    try {
        id = correlator_.issue(method, params);
    } catch (const IOError& e) {
        SessionOutcome failed;
        failed.state = SessionState::CONNECTION_LOST;
        failed.failure = FailureKind::IO;
        failed.error = e.what();
        return failed;
    } catch (const ConnectionClosed& e) {
        SessionOutcome failed;
        failed.state = SessionState::CONNECTION_LOST;
        failed.failure = FailureKind::CONNECTION_CLOSED;
        failed.error = e.what();
        return failed;
    }

    ToolSession session(id, config_.malformed_policy);
    session.set_notification_handler(std::move(on_notification));
    session.run(connection_, config_.request_timeout);
    return session.take_outcome();
}

json MCPClient::request_result(const std::string& method, const json& params) {
    SessionOutcome outcome = run_exchange(method, params, nullptr);
    if (!outcome.completed()) {
        throw RequestError(method, outcome);
    }
    return outcome.result;
}

} // namespace tcpmcp
