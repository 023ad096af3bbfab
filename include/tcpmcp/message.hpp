#ifndef TCPMCP_MESSAGE_HPP
#define TCPMCP_MESSAGE_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tcpmcp {

// Method names understood by the shell MCP server
namespace method {
constexpr const char* kInitialize = "initialize";
constexpr const char* kListTools = "list_tools";
constexpr const char* kCallTool = "call_tool";
constexpr const char* kGetExecutionStatus = "get_execution_status";
constexpr const char* kCancelExecution = "cancel_execution";
} // namespace method

// Request envelope: {"id", "method", "params"}
struct Request {
    std::string id;
    std::string method;
    json params = json::object();

    std::string serialize() const;
};

// Wire-level message shapes
enum class MessageType {
    RESPONSE,
    ERROR,
    NOTIFICATION,
    MALFORMED
};

const char* to_string(MessageType type);

/**
 * One decoded frame.
 *
 * Only the fields of the active variant are meaningful:
 *   RESPONSE      id, result
 *   ERROR         id (empty when the server sent "id": null), has_id, error
 *   NOTIFICATION  event, text
 *   MALFORMED     raw, cause
 */
struct Message {
    MessageType type = MessageType::MALFORMED;

    std::string id;
    bool has_id = false;
    json result;
    std::string error;

    std::string event;
    std::string text;

    std::string raw;
    std::string cause;

    bool is_terminal() const {
        return type == MessageType::RESPONSE || type == MessageType::ERROR;
    }

    static Message response(const std::string& id, const json& result);
    static Message failure(const std::string& id, const std::string& error);
    static Message notification(const std::string& event, const std::string& text);
    static Message malformed(const std::string& raw, const std::string& cause);
};

// Parses one text frame. Never throws: anything that is not a recognized
// response/error/notification comes back as MALFORMED.
Message parse_message(const std::string& frame);

// Progress event forwarded to the caller while a call is running
struct Notification {
    std::string event;
    std::string message;
};

// Element of the list_tools result
struct ToolDescriptor {
    std::string name;
    std::string description;
};

// initialize result
struct ServerInfo {
    std::string server;
    std::string version;
    json raw;
};

// call_tool result
struct ToolCallResult {
    std::string output;
    int exit_code = -1;
    json raw;

    // exit_code as a process status: 0..255, with a missing or negative code as 1
    int exit_status() const;
};

// get_execution_status result
struct ExecutionStatus {
    std::string execution_id;
    std::string tool;
    std::string status;
    long elapsed_time = 0;
    int pid = -1;
};

// Typed views over result objects. Missing fields keep their defaults; a
// field of the wrong JSON type throws ProtocolDecodeError.
ServerInfo server_info_from(const json& result);
std::vector<ToolDescriptor> tools_from(const json& result);
ToolCallResult tool_call_result_from(const json& result);
ExecutionStatus execution_status_from(const json& result);

} // namespace tcpmcp

#endif // TCPMCP_MESSAGE_HPP
