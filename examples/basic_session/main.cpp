// Example: Basic Agent Session
//
// Spawns an MCP server, lists its tools, calls one and pings it.

#include <mcpipe/client/agent_session.hpp>
#include <mcpipe/log/spdlog_logger.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using namespace mcpipe;
using Json = nlohmann::json;

int main(int argc, char* argv[]) {
    // Default to the filesystem server; anything on the command line replaces it
    std::string command = "npx";
    std::vector<std::string> args = {"-y", "@modelcontextprotocol/server-filesystem", "/tmp"};
    if (argc > 1) {
        command = argv[1];
        args.assign(argv + 2, argv + argc);
    }

    set_logger(make_spdlog_console_logger(LogLevel::Warn));

    std::cout << "=== Basic Agent Session Example ===\n\n";

    // 1. Configure the session
    AgentSessionConfig config;
    config.process.command = command;
    config.process.args = args;
    config.request_timeout = std::chrono::seconds(30);
    config.notification_sink = [](const std::string& method, const Json&) {
        std::cout << "  [notification] " << method << "\n";
    };

    std::cout << "Starting server: " << command;
    for (const auto& a : args) std::cout << " " << a;
    std::cout << "\n\n";

    // 2. Spawn and handshake
    AgentSession session(config);
    auto started = session.start();
    if (!started) {
        std::cerr << "ERROR: " << started.error().describe() << "\n";
        return 1;
    }

    if (auto info = session.server_info()) {
        std::cout << "Server: " << info->name;
        if (!info->version.empty()) {
            std::cout << " v" << info->version;
        }
        std::cout << "\n\n";
    }

    // 3. Tools found during the handshake
    std::cout << "=== Available Tools ===\n";
    auto tools = session.list_tools();
    if (tools && tools->empty()) {
        std::cout << "  (no tools available)\n";
    } else if (tools) {
        for (const auto& tool : *tools) {
            std::cout << "  - " << tool.name;
            if (tool.description) {
                std::cout << ": " << *tool.description;
            }
            std::cout << "\n";
        }
    }
    std::cout << "\n";

    // 4. Call a safe tool if the server has one
    if (tools) {
        for (const auto& tool : *tools) {
            if (tool.name != "list_directory" && tool.name != "echo") {
                continue;
            }
            std::cout << "=== Calling Tool: " << tool.name << " ===\n";
            const Json arguments = tool.name == "echo" ? Json{{"text", "hello"}} : Json{{"path", "/tmp"}};

            auto result = session.call_tool(tool.name, arguments);
            if (result) {
                std::cout << result->text() << "\n";
            } else {
                std::cerr << "  Tool call failed: " << result.error().describe() << "\n";
            }
            std::cout << "\n";
            break;
        }
    }

    // 5. Ping
    std::cout << "=== Ping ===\n";
    auto pong = session.ping();
    if (pong) {
        std::cout << "  Pong! Server is responsive.\n";
    } else {
        std::cerr << "  Ping failed: " << pong.error().describe() << "\n";
    }
    std::cout << "\n";

    // 6. Clean shutdown
    std::cout << "Closing...\n";
    session.close();
    std::cout << "Done!\n";

    return 0;
}
