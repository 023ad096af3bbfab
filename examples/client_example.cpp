/**
 * MCP Client Example
 *
 * Connects to the shell's MCP server over TCP, lists the first tools and
 * runs `pwd` and `echo`, printing progress notifications as they arrive.
 *
 * Start the shell with USHELL_MCP_ENABLED=1; set MCP_HOST / MCP_PORT to
 * point elsewhere than localhost:9000.
 */

#include <tcpmcp/mcp_client.hpp>
#include <iostream>

namespace {

void report(const tcpmcp::ToolOutcome& outcome) {
    if (outcome.ok()) {
        std::cout << "  exit code: " << outcome.result.exit_code << "\n";
        std::cout << "  output: " << outcome.result.output << "\n\n";
    } else {
        std::cout << "  " << tcpmcp::to_string(outcome.state) << ": " << outcome.error << "\n\n";
    }
}

} // namespace

int main() {
    std::cout << "MCP Client Example\n";
    std::cout << "==================\n\n";

    tcpmcp::MCPClient client(tcpmcp::ClientConfig::from_environment());

    try {
        client.connect();

        auto info = client.initialize();
        std::cout << "Server: " << info.server << " v" << info.version << "\n\n";

        // Server order is the display rank
        auto tools = client.list_tools();
        std::cout << "Available tools (" << tools.size() << "):\n";
        for (size_t i = 0; i < tools.size() && i < 10; ++i) {
            std::cout << "  - " << tools[i].name << ": " << tools[i].description << "\n";
        }
        std::cout << "\n";

        auto print_progress = [](const tcpmcp::Notification& n) {
            std::cout << "  [" << n.event << "] " << n.message << "\n";
        };

        std::cout << "Calling 'pwd'...\n";
        report(client.call_tool("pwd", json::object(), print_progress));

        std::cout << "Calling 'echo'...\n";
        report(client.call_tool("echo", {{"text", "Hello from the C++ MCP client!"}}, print_progress));
    } catch (const tcpmcp::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    client.disconnect();
    std::cout << "Disconnected.\n";
    return 0;
}
