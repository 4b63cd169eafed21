#include "dispatcher.hpp"
#include "diagnostics.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include "tools/command_policy.hpp"
#include "tools/file_ops.hpp"
#include <chrono>
#include <filesystem>

namespace toolgate {

ToolDispatcher::ToolDispatcher(HttpClient& http, TerminalSessionManager& terminal,
                               ToolSettings settings, BrowserOpener browser,
                               EventBus* bus, YearProvider year)
    : http_(http),
      terminal_(terminal),
      browser_(std::move(browser)),
      bus_(bus),
      search_(http, std::move(year)),
      settings_(std::move(settings)) {}

void ToolDispatcher::update_settings(const ToolSettings& settings) {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    settings_ = settings;
}

ToolSettings ToolDispatcher::settings() const {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return settings_;
}

static std::filesystem::path require_root(const std::optional<std::string>& root) {
    if (!root || trim(*root).empty()) throw ToolError(ToolErrorKind::RootNotConfigured);
    return std::filesystem::path(trim(*root));
}

// One overload per call type; std::visit rejects a missing one at compile time.
struct CallRunner {
    ToolDispatcher& d;
    const std::optional<std::string>& fs_root;
    const std::optional<std::string>& vault;
    DiagnosticTrace& trace;

    ToolResult operator()(const ReadFileArgs& a) const {
        return ToolResult::success(read_file(require_root(fs_root), a.path, a.head, a.tail));
    }
    ToolResult operator()(const WriteFileArgs& a) const {
        return ToolResult::success(write_file(require_root(fs_root), a.path, a.content));
    }
    ToolResult operator()(const ListDirArgs& a) const {
        return ToolResult::success(list_dir(require_root(fs_root), a.path, a.depth));
    }
    ToolResult operator()(const ReadNoteArgs& a) const {
        return ToolResult::success(read_file(require_root(vault), a.path));
    }
    ToolResult operator()(const WriteNoteArgs& a) const {
        return ToolResult::success(write_file(require_root(vault), a.path, a.content));
    }
    ToolResult operator()(const ListNotesArgs& a) const {
        return ToolResult::success(list_dir(require_root(vault), a.path, a.depth));
    }
    ToolResult operator()(const WebSearchArgs& a) const {
        return d.search_.search({a.query, a.max_results, a.include_page_excerpts}, trace);
    }
    ToolResult operator()(const FetchUrlArgs& a) const {
        return ToolResult::success(fetch_url(d.http_, a.url, a.max_chars));
    }
    ToolResult operator()(const RunCommandArgs& a) const {
        return ToolResult::success(run_command(a.command, a.working_directory));
    }
    ToolResult operator()(const OpenTerminalArgs& a) const {
        TerminalRequest req;
        req.command = a.command;
        req.shell = a.shell;
        req.keep_open = a.keep_open;
        req.working_directory = a.working_directory;
        req.new_tab = a.new_tab;
        return ToolResult::success(d.terminal_.open_and_run(req, trace).content);
    }
    ToolResult operator()(const OpenBrowserSearchArgs& a) const {
        return ToolResult::success(open_browser_search(d.http_, d.browser_, a.url, a.query,
                                                       a.engine));
    }
};

ToolResult ToolDispatcher::run(const ToolCall& call,
                               const std::optional<std::string>& filesystem_root,
                               const std::optional<std::string>& obsidian_vault,
                               DiagnosticTrace& trace) {
    try {
        return std::visit(CallRunner{*this, filesystem_root, obsidian_vault, trace}, call);
    } catch (const ToolError& e) {
        return ToolResult::failure(e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        return ToolResult::failure(ToolError(ToolErrorKind::Io, e.what()).what());
    } catch (const nlohmann::json::exception& e) {
        return ToolResult::failure(ToolError(ToolErrorKind::InvalidArg, e.what()).what());
    } catch (const std::exception& e) {
        return ToolResult::failure(ToolError(ToolErrorKind::Io, e.what()).what());
    }
}

ToolResult ToolDispatcher::execute_tool(const std::string& name, const nlohmann::json& args,
                                        const std::optional<std::string>& filesystem_root,
                                        const std::optional<std::string>& obsidian_vault) {
    std::optional<ToolCall> call;
    ToolResult result;
    try {
        call = parse_tool_call(name, args);
    } catch (const ToolError& e) {
        if (e.kind() == ToolErrorKind::UnknownTool) throw;
        result = ToolResult::failure(e.what());
    }

    if (bus_) {
        ToolCallRequestEvent ev;
        ev.tool_name = name;
        ev.arguments = args.dump();
        bus_->publish(ev);
    }

    auto start = std::chrono::steady_clock::now();
    DiagnosticTrace trace(name, bus_);
    if (call) result = run(*call, filesystem_root, obsidian_vault, trace);
    if (!trace.empty()) result.diagnostic_steps = trace.take();

    if (bus_) {
        ToolCallResultEvent ev;
        ev.tool_name = name;
        ev.ok = result.ok;
        ev.error = result.error.value_or("");
        ev.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count());
        bus_->publish(ev);
    }
    return result;
}

ToolResult ToolDispatcher::execute(const std::string& name, const nlohmann::json& args) {
    const char* group = tool_group(name);
    if (!group) throw ToolError(ToolErrorKind::UnknownTool, name);

    ToolSettings current = settings();
    if (!is_group_enabled(current, group)) {
        return ToolResult::failure(ToolError(ToolErrorKind::CapabilityDisabled, group).what());
    }
    return execute_tool(name, args, effective_filesystem_root(current),
                        effective_obsidian_vault(current));
}

} // namespace toolgate
