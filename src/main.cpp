#include "config.hpp"
#include "diagnostics.hpp"
#include "dispatcher.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "tool_call.hpp"
#include "tool_registry.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>

static void print_usage() {
    std::cout << "Usage: toolgate [options]\n"
              << "\n"
              << "Options:\n"
              << "  --list               Print every tool definition as JSON\n"
              << "  --enabled            With --list: only tools enabled in the config\n"
              << "  --tool NAME          Run one tool call and print the result JSON\n"
              << "  --args JSON          Arguments for --tool (default: {})\n"
              << "  -q, --quiet          Do not print diagnostic steps to stderr\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Without options, reads calls from stdin, one per line:\n"
              << "  NAME {json arguments}\n"
              << "  /list                List enabled tools\n"
              << "  /quit, /exit         Exit\n"
              << "\n"
              << "Configuration: ~/.toolgate/config.json\n"
              << "Environment variables:\n"
              << "  TOOLGATE_FILESYSTEM_ROOT      Root for filesystem tools\n"
              << "  TOOLGATE_OBSIDIAN_VAULT       Vault for note tools\n"
              << "  TOOLGATE_TERMINAL_TRANSCRIPT  Output file of the persistent terminal\n";
}

static void print_definitions(const std::vector<toolgate::ToolDefinition>& defs) {
    nlohmann::json out = defs;
    std::cout << out.dump(2) << '\n';
}

// Returns false when the call could not be dispatched at all.
static bool run_call(toolgate::ToolDispatcher& dispatcher, const std::string& name,
                     const std::string& args_json) {
    nlohmann::json args;
    toolgate::ToolResult result;
    try {
        args = toolgate::parse_tool_arguments(args_json);
        result = dispatcher.execute(name, args);
    } catch (const toolgate::ToolError& e) {
        if (e.kind() == toolgate::ToolErrorKind::UnknownTool) {
            std::cerr << "Error: " << e.what() << "\n";
            return false;
        }
        result = toolgate::ToolResult::failure(e.what());
    }
    nlohmann::json out = result;
    std::cout << out.dump(2) << '\n';
    return true;
}

static void run_repl(toolgate::ToolDispatcher& dispatcher) {
    std::cout << "toolgate: enter NAME {json}, /list or /quit\n";
    std::string line;
    while (true) {
        std::cout << "toolgate> " << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }
        line = toolgate::trim(line);
        if (line.empty()) continue;

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") break;
            if (line == "/list") {
                for (const auto& def : toolgate::enabled_tool_definitions(dispatcher.settings())) {
                    std::cout << "  " << def.name << "  [" << def.id << ", "
                              << toolgate::tool_risk_name(def.risk) << "]\n";
                }
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        auto space = line.find(' ');
        std::string name = line.substr(0, space);
        std::string args = space == std::string::npos ? "" : line.substr(space + 1);
        run_call(dispatcher, name, args);
    }
}

int main(int argc, char* argv[]) try {
    bool list = false;
    bool enabled_only = false;
    bool quiet = false;
    std::string tool_name;
    std::string tool_args;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--list") == 0) {
            list = true;
        } else if (std::strcmp(argv[i], "--enabled") == 0) {
            enabled_only = true;
        } else if (std::strcmp(argv[i], "-q") == 0 || std::strcmp(argv[i], "--quiet") == 0) {
            quiet = true;
        } else if (std::strcmp(argv[i], "--tool") == 0 && i + 1 < argc) {
            tool_name = argv[++i];
        } else if (std::strcmp(argv[i], "--args") == 0 && i + 1 < argc) {
            tool_args = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = toolgate::Config::load();

    if (list) {
        print_definitions(enabled_only ? toolgate::enabled_tool_definitions(config.tools)
                                       : toolgate::all_tool_definitions());
        return 0;
    }

    toolgate::http_init();
    toolgate::CurlHttpClient http_client;
    toolgate::EventBus bus;
    toolgate::DiagnosticLogger diag_logger(bus);
    diag_logger.set_quiet(quiet || config.diagnostics.quiet);

    toolgate::TerminalSessionManager terminal(toolgate::detect_terminal_capability(),
                                              config.terminal_options());
    toolgate::ToolDispatcher dispatcher(http_client, terminal, config.tools,
                                        toolgate::system_browser_opener(), &bus);

    int rc = 0;
    if (!tool_name.empty()) {
        rc = run_call(dispatcher, tool_name, tool_args) ? 0 : 1;
    } else {
        run_repl(dispatcher);
    }

    toolgate::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
