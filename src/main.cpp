#include <tcpmcp/mcp_client.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace tcpmcp;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command> [arguments]\n";
    std::cout << "Commands:\n";
    std::cout << "  info                         Show server identity\n";
    std::cout << "  tools [N]                    List tools (first N when given)\n";
    std::cout << "  call TOOL [key=value ...]    Run a tool and stream its progress\n";
    std::cout << "  status EXECUTION_ID          Query a running execution\n";
    std::cout << "  cancel EXECUTION_ID          Cancel a running execution\n";
    std::cout << "Options:\n";
    std::cout << "  --host HOST      Server host (default: $MCP_HOST or localhost)\n";
    std::cout << "  --port PORT      Server port (default: $MCP_PORT or 9000)\n";
    std::cout << "  --timeout MS     Per-request timeout in milliseconds\n";
    std::cout << "  --verbose        Trace every frame on stderr\n";
    std::cout << "  --help           Show this help\n";
}

void print_separator(const std::string& title) {
    std::cout << std::string(70, '-') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(70, '-') << std::endl;
}

// key=value pairs become string arguments; integers stay integers
json parse_tool_args(const std::vector<std::string>& pairs) {
    json args = json::object();
    for (const auto& pair : pairs) {
        size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw std::invalid_argument("Tool argument must be key=value: " + pair);
        }
        std::string key = pair.substr(0, eq);
        std::string value = pair.substr(eq + 1);

        json parsed = json::parse(value, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_number_integer()) {
            args[key] = parsed;
        } else {
            args[key] = value;
        }
    }
    return args;
}

int run_command(MCPClient& client, const std::string& command, const std::vector<std::string>& operands) {
    if (command == "info") {
        ServerInfo info = client.initialize();
        std::cout << "Server: " << info.server << " v" << info.version << std::endl;
        return 0;
    }

    if (command == "tools") {
        size_t limit = 0;
        if (!operands.empty()) {
            limit = parse_count(operands[0], "Tool count");
        }

        client.initialize();
        auto tools = client.list_tools();
        print_separator("Available Tools");
        std::cout << "Found " << tools.size() << " tools:" << std::endl;

        size_t shown = 0;
        for (const auto& tool : tools) {
            if (limit != 0 && shown == limit) break;
            std::cout << "  • " << tool.name << ": " << tool.description << std::endl;
            ++shown;
        }
        if (shown < tools.size()) {
            std::cout << "  ... and " << (tools.size() - shown) << " more tools" << std::endl;
        }
        return 0;
    }

    if (command == "call") {
        if (operands.empty()) {
            std::cerr << "Error: call requires a tool name" << std::endl;
            return 1;
        }
        json args = parse_tool_args(std::vector<std::string>(operands.begin() + 1, operands.end()));

        client.initialize();
        print_separator("Calling Tool: " + operands[0]);

        ToolOutcome outcome = client.call_tool(operands[0], args, [](const Notification& n) {
            std::cout << "[*] " << n.event << ": " << n.message << std::endl;
        });

        if (!outcome.ok()) {
            std::cerr << "❌ " << to_string(outcome.state) << " (" << to_string(outcome.failure)
                      << "): " << outcome.error << std::endl;
            return 1;
        }

        std::cout << "✓ Exit code: " << outcome.result.exit_code << std::endl;
        if (!outcome.result.output.empty()) {
            std::cout << outcome.result.output;
            if (outcome.result.output.back() != '\n') std::cout << std::endl;
        }
        return outcome.result.exit_status();
    }

    if (command == "status" || command == "cancel") {
        if (operands.empty()) {
            std::cerr << "Error: " << command << " requires an execution id" << std::endl;
            return 1;
        }
        client.initialize();

        if (command == "status") {
            ExecutionStatus status = client.get_execution_status(operands[0]);
            std::cout << "Execution " << status.execution_id << ": " << status.status
                      << " (tool " << status.tool << ", pid " << status.pid
                      << ", " << status.elapsed_time << "s)" << std::endl;
        } else {
            std::cout << "Execution " << operands[0] << ": "
                      << client.cancel_execution(operands[0]) << std::endl;
        }
        return 0;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    ClientConfig config;
    std::string command;
    std::vector<std::string> operands;

    try {
        config = ClientConfig::from_environment();

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--host" && i + 1 < argc) {
                config.host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                config.port = parse_port(argv[++i], "--port");
            } else if (arg == "--timeout" && i + 1 < argc) {
                config.request_timeout = parse_timeout_ms(argv[++i], "--timeout");
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (command.empty()) {
                command = arg;
            } else {
                operands.push_back(arg);
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (command.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    MCPClient client(config);

    try {
        client.connect();
        int status = run_command(client, command, operands);
        client.disconnect();
        return status;
    } catch (const std::exception& e) {
        std::cerr << "\n❌ Error: " << e.what() << std::endl;
        client.disconnect();
        return 1;
    }
}
