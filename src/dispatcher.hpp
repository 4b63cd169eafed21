#pragma once
#include "http.hpp"
#include "tool.hpp"
#include "tool_call.hpp"
#include "tool_registry.hpp"
#include "tools/terminal_session.hpp"
#include "tools/web_fetch.hpp"
#include "tools/web_search.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>

namespace toolgate {

class EventBus;

// Single entry point for tool calls. Resolves the name to a typed call,
// enforces the configured roots and converts every handler error into a
// ToolResult with ok == false. Only an unknown tool name throws.
class ToolDispatcher {
public:
    ToolDispatcher(HttpClient& http, TerminalSessionManager& terminal,
                   ToolSettings settings = {},
                   BrowserOpener browser = system_browser_opener(),
                   EventBus* bus = nullptr,
                   YearProvider year = nullptr);

    // Roots are passed explicitly; nullopt or blank means not configured.
    ToolResult execute_tool(const std::string& name, const nlohmann::json& args,
                            const std::optional<std::string>& filesystem_root,
                            const std::optional<std::string>& obsidian_vault);

    // Settings-aware: a call into a disabled group fails with
    // CapabilityDisabled, roots come from the current settings.
    ToolResult execute(const std::string& name, const nlohmann::json& args);

    void update_settings(const ToolSettings& settings);
    ToolSettings settings() const;

private:
    ToolResult run(const ToolCall& call, const std::optional<std::string>& filesystem_root,
                   const std::optional<std::string>& obsidian_vault, DiagnosticTrace& trace);

    friend struct CallRunner;

    HttpClient& http_;
    TerminalSessionManager& terminal_;
    BrowserOpener browser_;
    EventBus* bus_;
    WebSearchOrchestrator search_;

    mutable std::mutex settings_mutex_;
    ToolSettings settings_;
};

} // namespace toolgate
