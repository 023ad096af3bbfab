#include <tcpmcp/message.hpp>
#include <tcpmcp/errors.hpp>

namespace tcpmcp {

namespace {

std::string string_field(const json& object, const char* key, const std::string& fallback = "") {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw ProtocolDecodeError(object.dump(), std::string("field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

template <typename T>
T integer_field(const json& object, const char* key, T fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw ProtocolDecodeError(object.dump(), std::string("field '") + key + "' is not an integer");
    }
    return it->get<T>();
}

void require_object(const json& result, const char* what) {
    if (!result.is_object()) {
        throw ProtocolDecodeError(result.dump(), std::string(what) + " result is not an object");
    }
}

} // namespace

std::string Request::serialize() const {
    json request = {
        {"id", id},
        {"method", method},
        {"params", params.is_null() ? json::object() : params}
    };
    return request.dump();
}

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::RESPONSE: return "response";
        case MessageType::ERROR: return "error";
        case MessageType::NOTIFICATION: return "notification";
        case MessageType::MALFORMED: return "malformed";
    }
    return "unknown";
}

Message Message::response(const std::string& id, const json& result) {
    Message message;
    message.type = MessageType::RESPONSE;
    message.id = id;
    message.has_id = true;
    message.result = result;
    return message;
}

Message Message::failure(const std::string& id, const std::string& error) {
    Message message;
    message.type = MessageType::ERROR;
    message.id = id;
    message.has_id = true;
    message.error = error;
    return message;
}

Message Message::notification(const std::string& event, const std::string& text) {
    Message message;
    message.type = MessageType::NOTIFICATION;
    message.event = event;
    message.text = text;
    return message;
}

Message Message::malformed(const std::string& raw, const std::string& cause) {
    Message message;
    message.type = MessageType::MALFORMED;
    message.raw = raw;
    message.cause = cause;
    return message;
}

Message parse_message(const std::string& frame) {
    json object;
    try {
        object = json::parse(frame);
    } catch (const json::exception& e) {
        return Message::malformed(frame, std::string("invalid JSON: ") + e.what());
    }

    if (!object.is_object()) {
        return Message::malformed(frame, "frame is not a JSON object");
    }

    auto type_it = object.find("type");
    if (type_it == object.end()) {
        return Message::malformed(frame, "missing 'type' field");
    }
    if (!type_it->is_string()) {
        return Message::malformed(frame, "'type' is not a string");
    }

    const std::string type = type_it->get<std::string>();
    auto id_it = object.find("id");

    if (type == "notification") {
        auto event = object.find("event");
        if (event == object.end() || !event->is_string()) {
            return Message::malformed(frame, "notification without string 'event'");
        }
        auto text = object.find("message");
        if (text != object.end() && !text->is_string() && !text->is_null()) {
            return Message::malformed(frame, "notification 'message' is not a string");
        }
        // Notifications carry "id": null; they belong to the outstanding request
        return Message::notification(event->get<std::string>(),
                                     text == object.end() || text->is_null() ? "" : text->get<std::string>());
    }

    if (type == "response") {
        if (id_it == object.end() || !id_it->is_string()) {
            return Message::malformed(frame, "response without string 'id'");
        }
        auto result = object.find("result");
        if (result != object.end() && !result->is_object()) {
            return Message::malformed(frame, "response 'result' is not an object");
        }
        return Message::response(id_it->get<std::string>(),
                                 result == object.end() ? json::object() : *result);
    }

    if (type == "error") {
        auto error = object.find("error");
        if (error == object.end() || !error->is_string()) {
            return Message::malformed(frame, "error without string 'error'");
        }
        if (id_it != object.end() && !id_it->is_null() && !id_it->is_string()) {
            return Message::malformed(frame, "error 'id' is neither a string nor null");
        }
        Message message = Message::failure("", error->get<std::string>());
        if (id_it != object.end() && id_it->is_string()) {
            message.id = id_it->get<std::string>();
        } else {
            message.has_id = false;
        }
        return message;
    }

    return Message::malformed(frame, "unknown message type '" + type + "'");
}

ServerInfo server_info_from(const json& result) {
    require_object(result, "initialize");
    ServerInfo info;
    info.server = string_field(result, "server");
    info.version = string_field(result, "version");
    info.raw = result;
    return info;
}

std::vector<ToolDescriptor> tools_from(const json& result) {
    require_object(result, "list_tools");
    std::vector<ToolDescriptor> tools;

    auto it = result.find("tools");
    if (it == result.end() || it->is_null()) {
        return tools;
    }
    if (!it->is_array()) {
        throw ProtocolDecodeError(result.dump(), "'tools' is not an array");
    }

    tools.reserve(it->size());
    for (const auto& tool_json : *it) {
        if (!tool_json.is_object()) {
            throw ProtocolDecodeError(tool_json.dump(), "tool entry is not an object");
        }
        ToolDescriptor tool;
        tool.name = string_field(tool_json, "name");
        tool.description = string_field(tool_json, "description");
        tools.push_back(tool);
    }
    return tools;
}

ToolCallResult tool_call_result_from(const json& result) {
    require_object(result, "call_tool");
    ToolCallResult call;
    call.output = string_field(result, "output");
    call.exit_code = integer_field<int>(result, "exit_code", -1);
    call.raw = result;
    return call;
}

int ToolCallResult::exit_status() const {
    if (exit_code < 0) return 1;
    return exit_code > 255 ? 255 : exit_code;
}

ExecutionStatus execution_status_from(const json& result) {
    require_object(result, "get_execution_status");
    ExecutionStatus status;
    status.execution_id = string_field(result, "execution_id");
    status.tool = string_field(result, "tool");
    status.status = string_field(result, "status");
    status.elapsed_time = integer_field<long>(result, "elapsed_time", 0);
    status.pid = integer_field<int>(result, "pid", -1);
    return status;
}

} // namespace tcpmcp
