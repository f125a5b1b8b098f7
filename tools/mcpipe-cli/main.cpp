// ─────────────────────────────────────────────────────────────────────────────
// mcpipe-cli - drive an MCP server over stdio
// ─────────────────────────────────────────────────────────────────────────────
// Spawns a server, runs the handshake and performs one action.
//
// Usage:
//   mcpipe-cli -c npx -a -y -a @modelcontextprotocol/server-filesystem -a /tmp --list-tools
//   mcpipe-cli -c ./server --call echo --tool-args '{"text":"hi"}'
//   mcpipe-cli -c ./server --watch 30 --heartbeat-ms 1000 --metrics-ms 5000
//
// Logs go to stderr through spdlog; results go to stdout.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include "mcpipe/client/agent_session.hpp"
#include "mcpipe/log/logger.hpp"
#include "mcpipe/log/spdlog_logger.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

using namespace mcpipe;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* magenta = "\033[35m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

namespace {

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j, bool compact = false) {
    std::cout << (compact ? j.dump() : j.dump(2)) << "\n";
}

std::string describe(const ClientError& err) {
    std::string out = err.describe();
    if (err.cause) {
        out += " (cause: " + std::string(to_string(*err.cause)) + ")";
    }
    if (err.rpc_error) {
        out += " [rpc " + std::to_string(err.rpc_error->code) + "]";
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_list_tools(AgentSession& session, bool json_output) {
    auto tools = session.list_tools();
    if (!tools) {
        print_error(describe(tools.error()));
        return 1;
    }

    if (json_output) {
        Json output = Json::array();
        for (const auto& tool : *tools) {
            output.push_back(tool.to_json());
        }
        print_json(output);
        return 0;
    }

    print_header("Tools");
    if (tools->empty()) {
        std::cout << color::c(color::dim) << "(no tools available)" << color::c(color::reset) << "\n";
        return 0;
    }
    for (const auto& tool : *tools) {
        std::cout << color::c(color::bold) << color::c(color::yellow)
                  << "• " << tool.name << color::c(color::reset);
        if (tool.description) {
            std::cout << "\n  " << color::c(color::dim) << *tool.description << color::c(color::reset);
        }
        if (tool.annotations) {
            std::vector<std::string> hints;
            if (tool.annotations->read_only_hint.value_or(false)) hints.push_back("read-only");
            if (tool.annotations->destructive_hint.value_or(false)) hints.push_back("destructive");
            if (tool.annotations->idempotent_hint.value_or(false)) hints.push_back("idempotent");
            if (tool.annotations->open_world_hint.value_or(false)) hints.push_back("open-world");
            if (!hints.empty()) {
                std::cout << "\n  " << color::c(color::magenta) << "[";
                for (size_t i = 0; i < hints.size(); ++i) {
                    if (i > 0) std::cout << ", ";
                    std::cout << hints[i];
                }
                std::cout << "]" << color::c(color::reset);
            }
        }
        std::cout << "\n\n";
    }
    return 0;
}

int cmd_call_tool(AgentSession& session, const std::string& tool_name,
                  const std::string& args_json, bool json_output) {
    Json args = Json::object();
    if (!args_json.empty()) {
        try {
            args = Json::parse(args_json);
        } catch (const Json::parse_error& e) {
            print_error("Invalid JSON arguments: " + std::string(e.what()));
            return 1;
        }
    }

    auto result = session.call_tool(tool_name, std::move(args));
    if (!result) {
        print_error(describe(result.error()));
        return 1;
    }

    if (json_output) {
        print_json(result->raw);
        return result->is_error ? 1 : 0;
    }

    if (result->is_error) {
        print_error("Tool returned error");
    }
    for (const auto& content : result->content) {
        if (const auto* text = std::get_if<TextContent>(&content)) {
            std::cout << text->text << "\n";
        } else if (const auto* image = std::get_if<ImageContent>(&content)) {
            std::cout << color::c(color::dim) << "[Image: " << image->mime_type << ", "
                      << image->data.size() << " bytes base64]" << color::c(color::reset) << "\n";
        } else if (const auto* audio = std::get_if<AudioContent>(&content)) {
            std::cout << color::c(color::dim) << "[Audio: " << audio->mime_type << ", "
                      << audio->data.size() << " bytes base64]" << color::c(color::reset) << "\n";
        } else if (const auto* resource = std::get_if<EmbeddedResource>(&content)) {
            std::cout << color::c(color::dim) << "[Resource: " << resource->uri << "]"
                      << color::c(color::reset) << "\n";
            if (resource->text) {
                std::cout << *resource->text << "\n";
            }
        }
    }
    if (result->structured_content) {
        print_json(*result->structured_content);
    }
    return result->is_error ? 1 : 0;
}

int cmd_ping(AgentSession& session, bool json_output) {
    const auto started = std::chrono::steady_clock::now();
    auto result = session.ping();
    if (!result) {
        print_error(describe(result.error()));
        return 1;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (json_output) {
        print_json({{"status", "ok"}, {"roundTripMs", elapsed.count()}});
    } else {
        print_success("Server is alive (" + std::to_string(elapsed.count()) + " ms)");
    }
    return 0;
}

int cmd_info(AgentSession& session, bool json_output) {
    const auto info = session.server_info().value_or(Implementation{});
    const auto caps = session.server_capabilities().value_or(ServerCapabilities{});
    const auto instructions = session.server_instructions();
    const auto tool_count = session.list_tools().map([](const auto& tools) { return tools.size(); }).value_or(0);

    if (json_output) {
        Json output = {
            {"server", {{"name", info.name}, {"version", info.version}}},
            {"capabilities", {
                {"tools", caps.tools.has_value()},
                {"resources", caps.resources},
                {"prompts", caps.prompts},
                {"logging", caps.logging}
            }},
            {"toolCount", tool_count}
        };
        if (auto pid = session.pid()) {
            output["pid"] = *pid;
        }
        if (instructions) {
            output["instructions"] = *instructions;
        }
        print_json(output);
        return 0;
    }

    print_header("Server Info");
    std::cout << color::c(color::bold) << "Name:     " << color::c(color::reset) << info.name << "\n";
    std::cout << color::c(color::bold) << "Version:  " << color::c(color::reset) << info.version << "\n";
    if (auto pid = session.pid()) {
        std::cout << color::c(color::bold) << "PID:      " << color::c(color::reset) << *pid << "\n";
    }
    std::cout << color::c(color::bold) << "Tools:    " << color::c(color::reset) << tool_count << "\n";

    std::cout << "\n" << color::c(color::bold) << "Capabilities:" << color::c(color::reset) << "\n";
    std::cout << "  • Tools:     " << (caps.tools ? "✓" : "✗") << "\n";
    std::cout << "  • Resources: " << (caps.resources ? "✓" : "✗") << "\n";
    std::cout << "  • Prompts:   " << (caps.prompts ? "✓" : "✗") << "\n";
    std::cout << "  • Logging:   " << (caps.logging ? "✓" : "✗") << "\n";

    if (instructions) {
        std::cout << "\n" << color::c(color::bold) << "Instructions:" << color::c(color::reset) << "\n"
                  << *instructions << "\n";
    }
    return 0;
}

volatile std::sig_atomic_t g_interrupted = 0;

// Keep the session open and let heartbeat/metrics run until the time is up,
// the server goes away or Ctrl-C.
int cmd_watch(AgentSession& session, int seconds, bool json_output) {
    std::signal(SIGINT, [](int) { g_interrupted = 1; });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (g_interrupted == 0 && session.is_ready() &&
           (seconds <= 0 || std::chrono::steady_clock::now() < deadline)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    const auto snapshot = session.metrics();
    if (json_output) {
        print_json(snapshot.to_json());
    } else {
        print_header("Session Metrics");
        for (const auto& [key, value] : snapshot.to_json().items()) {
            std::cout << "  " << color::c(color::bold) << key << color::c(color::reset)
                      << ": " << value.dump() << "\n";
        }
    }
    return snapshot.state == SessionState::Ready ? 0 : 1;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpipe-cli", "MCP stdio client");

    options.add_options()
        ("c,command", "Server command to execute", cxxopts::value<std::string>())
        ("a,args", "Argument for the server command (repeatable)", cxxopts::value<std::vector<std::string>>()->default_value(""))

        // Commands
        ("list-tools", "List available tools")
        ("call", "Call a tool by name", cxxopts::value<std::string>())
        ("tool-args", "JSON arguments for --call", cxxopts::value<std::string>()->default_value("{}"))
        ("ping", "Ping the server")
        ("info", "Show server info")
        ("watch", "Keep the session open for N seconds (0: until Ctrl-C) and print metrics",
            cxxopts::value<int>())

        // Session options
        ("content-length", "Use Content-Length framing (default: newline-delimited JSON)")
        ("timeout-ms", "Per-request timeout", cxxopts::value<int>()->default_value("60000"))
        ("heartbeat-ms", "Heartbeat interval (0 disables)", cxxopts::value<int>()->default_value("0"))
        ("metrics-ms", "Metrics interval (0 disables)", cxxopts::value<int>()->default_value("0"))
        ("server-stderr", "Show the server's stderr in the log")

        // Output options
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Write the log to this file instead of stderr", cxxopts::value<std::string>())
        ("v,verbose", "Same as --log-level debug")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    mcpipe-cli -c npx -a -y -a @modelcontextprotocol/server-filesystem -a /tmp --list-tools\n";
            std::cout << "    mcpipe-cli -c python -a server.py --call read_file --tool-args '{\"path\":\"/tmp/a\"}'\n";
            std::cout << "    mcpipe-cli -c ./server --watch 0 --heartbeat-ms 1000 --metrics-ms 5000 -v\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        if (!result.count("command")) {
            print_error("Must specify --command");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        auto level = parse_log_level(result["log-level"].as<std::string>());
        if (!level) {
            print_error("Unknown log level: " + result["log-level"].as<std::string>());
            return 1;
        }
        if (result.count("verbose")) {
            level = LogLevel::Debug;
        }
        if (result.count("log-file")) {
            set_logger(make_spdlog_file_logger(result["log-file"].as<std::string>(), *level));
        } else {
            set_logger(make_spdlog_console_logger(*level));
        }

        AgentSessionConfig config;
        config.process.command = result["command"].as<std::string>();
        for (const auto& arg : result["args"].as<std::vector<std::string>>()) {
            if (!arg.empty()) {
                config.process.args.push_back(arg);
            }
        }
        config.process.skip_command_validation = true;  // CLI user controls the command
        if (result.count("server-stderr")) {
            config.process.stderr_handling = StderrHandling::Capture;
            config.process.stderr_callback = [](std::string_view line) {
                MCPIPE_LOG_INFO("[server] " + std::string(line));
            };
        }

        if (result.count("content-length")) {
            config.codec.framing = Framing::ContentLength;
        }
        config.request_timeout = std::chrono::milliseconds(result["timeout-ms"].as<int>());
        config.handshake.timeout = config.request_timeout;
        config.heartbeat.interval = std::chrono::milliseconds(result["heartbeat-ms"].as<int>());
        config.metrics.interval = std::chrono::milliseconds(result["metrics-ms"].as<int>());

        config.heartbeat_sink = [](const HeartbeatEvent& event) {
            if (!event.ok) {
                MCPIPE_LOG_WARN("Heartbeat missed (" + std::to_string(event.consecutive_failures) + " in a row)");
            }
        };
        config.metrics_sink = [](const MetricsSnapshot& snapshot) {
            MCPIPE_LOG_INFO("Metrics: " + snapshot.to_json().dump());
        };
        config.notification_sink = [](const std::string& method, const Json& params) {
            MCPIPE_LOG_INFO("Notification " + method + (params.is_null() ? "" : " " + params.dump()));
        };

        AgentSession session(std::move(config));
        if (auto started = session.start(); !started) {
            print_error("Failed to start session: " + describe(started.error()));
            return 1;
        }

        int exit_code = 0;
        if (result.count("list-tools")) {
            exit_code = cmd_list_tools(session, json_output);
        } else if (result.count("call")) {
            exit_code = cmd_call_tool(session, result["call"].as<std::string>(),
                                      result["tool-args"].as<std::string>(), json_output);
        } else if (result.count("ping")) {
            exit_code = cmd_ping(session, json_output);
        } else if (result.count("watch")) {
            exit_code = cmd_watch(session, result["watch"].as<int>(), json_output);
        } else {
            exit_code = cmd_info(session, json_output);
        }

        session.close();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const spdlog::spdlog_ex& e) {
        print_error(std::string("Cannot open log: ") + e.what());
        return 1;
    }
}
