#include "tool_registry.hpp"
#include "util.hpp"

namespace toolgate {

using nlohmann::json;

static const char* const kRootScope = "Sandboxed to user-selected root";
static const char* const kVaultScope = "Obsidian vault path";
static const char* const kInternetScope = "Internet (opt-in)";
static const char* const kLocalScope = "Local system (opt-in)";

static json object_schema(json properties, json required = json::array()) {
    json schema = {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"additionalProperties", false},
    };
    if (!required.empty()) schema["required"] = std::move(required);
    return schema;
}

static json depth_schema() {
    return {{"type", "integer"}, {"minimum", 1}, {"maximum", 3}, {"default", 1}};
}

static std::vector<ToolDefinition> filesystem_definitions() {
    return {
        {tool_groups::Filesystem, "read_file",
         "Read a UTF-8 text file. Only within the selected root directory. "
         "Use relative path from root.",
         kRootScope, ToolRisk::ReadOnly,
         object_schema({
             {"path", {{"type", "string"}, {"description", "Relative path to file from root"}}},
             {"head", {{"type", "integer"}, {"minimum", 1},
                       {"description", "Return only first N lines"}}},
             {"tail", {{"type", "integer"}, {"minimum", 1},
                       {"description", "Return only last N lines"}}},
         }, {"path"})},
        {tool_groups::Filesystem, "write_file",
         "Write a UTF-8 text file. Only within the selected root. "
         "Creates parent directories if needed.",
         kRootScope, ToolRisk::Write,
         object_schema({
             {"path", {{"type", "string"}, {"description", "Relative path from root"}}},
             {"content", {{"type", "string"}, {"description", "File content"}}},
         }, {"path", "content"})},
        {tool_groups::Filesystem, "list_dir",
         "List directory contents (names, with / for dirs). Only within the selected root.",
         kRootScope, ToolRisk::ReadOnly,
         object_schema({
             {"path", {{"type", "string"}, {"default", "."},
                       {"description", "Relative path to directory from root"}}},
             {"depth", depth_schema()},
         })},
    };
}

static std::vector<ToolDefinition> obsidian_definitions() {
    return {
        {tool_groups::Obsidian, "obsidian_read_note",
         "Read an Obsidian note (Markdown) from the vault. Path is vault-relative "
         "(e.g. 'Daily/2026-02-10.md'). Preserves frontmatter.",
         kVaultScope, ToolRisk::ReadOnly,
         object_schema({
             {"path", {{"type", "string"},
                       {"description", "Vault-relative path, e.g. 'Daily/2026-02-10.md'"}}},
         }, {"path"})},
        {tool_groups::Obsidian, "obsidian_write_note",
         "Write an Obsidian note (Markdown) to the vault. "
         "Preserve frontmatter if present in content.",
         kVaultScope, ToolRisk::Write,
         object_schema({
             {"path", {{"type", "string"}, {"description", "Vault-relative path"}}},
             {"content", {{"type", "string"},
                          {"description", "Markdown content (include frontmatter if desired)"}}},
         }, {"path", "content"})},
        {tool_groups::Obsidian, "obsidian_list_notes",
         "List note files in a vault folder. Path is vault-relative.",
         kVaultScope, ToolRisk::ReadOnly,
         object_schema({
             {"path", {{"type", "string"}, {"default", "."},
                       {"description", "Vault-relative path to directory"}}},
             {"depth", depth_schema()},
         })},
    };
}

static std::vector<ToolDefinition> web_search_definitions() {
    return {
        {tool_groups::WebSearch, "web_search",
         "Search the web (DuckDuckGo). Returns title, snippet, URL, and optional page "
         "excerpts so you can summarize the pages (not just list links). Use for current "
         "info and to summarize what each result says. Cite results.",
         kInternetScope, ToolRisk::Network,
         object_schema({
             {"query", {{"type", "string"}, {"description", "Search query"}}},
             {"max_results", {{"type", "integer"}, {"minimum", 1}, {"maximum", 10},
                              {"default", 5}}},
             {"include_page_excerpts", {{"type", "boolean"}, {"default", true},
                                        {"description", "When true (default), fetch each result "
                                         "URL and include a text excerpt so you can summarize "
                                         "the page content."}}},
         }, {"query"})},
    };
}

static std::vector<ToolDefinition> fetch_url_definitions() {
    return {
        {tool_groups::Web, "fetch_url",
         "Fetch a URL and return the page content as plain text. Use when the user asks to "
         "summarize a link, explain a page, or gives you a URL. You receive the content as "
         "context and summarize or answer from it; the user does not need to copy-paste "
         "anything.",
         kInternetScope, ToolRisk::Network,
         object_schema({
             {"url", {{"type", "string"},
                      {"description", "Full URL to fetch (e.g. https://example.com/article)"}}},
             {"max_chars", {{"type", "integer"}, {"minimum", 500}, {"maximum", 20000},
                            {"default", 12000},
                            {"description", "Max plain-text characters to return "
                                            "(for context window)"}}},
         }, {"url"})},
    };
}

static std::vector<ToolDefinition> terminal_definitions() {
    return {
        {tool_groups::Terminal, "run_command",
         "Execute a shell command. Returns stdout and stderr. One command per call. "
         "Use with caution: commands run with your user permissions.",
         kLocalScope, ToolRisk::High,
         object_schema({
             {"command", {{"type", "string"},
                          {"description", "Command to execute (e.g. 'ls -la')"}}},
             {"working_directory", {{"type", "string"},
                                    {"description", "Optional: working directory (absolute "
                                     "path). Defaults to the user's home directory."}}},
         }, {"command"})},
        {tool_groups::Terminal, "open_terminal_and_run",
         "Run a command in a persistent shell session. By default reuses the same session; "
         "set new_tab=true for a separate window. Default working directory is the user's "
         "home directory.",
         kLocalScope, ToolRisk::High,
         object_schema({
             {"shell", {{"type", "string"}, {"enum", {"sh", "bash", "xterm"}},
                        {"default", "sh"}}},
             {"command", {{"type", "string"}, {"description", "Command to run in the terminal"}}},
             {"keep_open", {{"type", "boolean"}, {"default", true}}},
             {"working_directory", {{"type", "string"},
                                    {"description", "Optional: working directory. Defaults to "
                                     "the last directory used, then the home directory."}}},
             {"new_tab", {{"type", "boolean"}, {"default", false},
                          {"description", "If true, open a new terminal window. If false "
                                          "(default), reuse the same session."}}},
         }, {"command"})},
    };
}

static std::vector<ToolDefinition> browser_definitions() {
    return {
        {tool_groups::Browser, "open_browser_search",
         "Open the default browser to a URL or search page. The opened page (or first "
         "DuckDuckGo result) is also fetched and its text returned in the tool response. "
         "Use that content as context to summarize or answer; do not ask the user to paste.",
         "Local (opens browser)", ToolRisk::Low,
         object_schema({
             {"url", {{"type", "string"},
                      {"description", "Direct URL to open (e.g. https://duckduckgo.com/?q=...)"}}},
             {"query", {{"type", "string"}, {"description", "Search query when using engine"}}},
             {"engine", {{"type", "string"}, {"enum", {"duckduckgo", "bing", "google"}},
                         {"default", "duckduckgo"},
                         {"description", "Search engine when using query"}}},
         })},
    };
}

static void append(std::vector<ToolDefinition>& out, std::vector<ToolDefinition> defs) {
    for (auto& d : defs) out.push_back(std::move(d));
}

std::vector<ToolDefinition> all_tool_definitions() {
    std::vector<ToolDefinition> out = filesystem_definitions();
    append(out, obsidian_definitions());
    append(out, web_search_definitions());
    append(out, fetch_url_definitions());
    append(out, terminal_definitions());
    append(out, browser_definitions());
    return out;
}

std::vector<ToolDefinition> enabled_tool_definitions(bool filesystem_enabled,
                                                     const std::string& filesystem_root,
                                                     bool obsidian_enabled,
                                                     const std::string& obsidian_vault,
                                                     bool web_search_enabled,
                                                     bool terminal_enabled) {
    std::vector<ToolDefinition> out;
    if (filesystem_enabled && !trim(filesystem_root).empty()) {
        append(out, filesystem_definitions());
    }
    if (obsidian_enabled && !trim(obsidian_vault).empty()) {
        append(out, obsidian_definitions());
    }
    if (web_search_enabled) {
        append(out, web_search_definitions());
        append(out, fetch_url_definitions());
        append(out, browser_definitions());
    }
    if (terminal_enabled) {
        append(out, terminal_definitions());
    }
    return out;
}

std::vector<ToolDefinition> enabled_tool_definitions(const ToolSettings& settings) {
    return enabled_tool_definitions(settings.filesystem_enabled,
                                    effective_filesystem_root(settings).value_or(""),
                                    settings.obsidian_enabled,
                                    settings.obsidian_vault_path,
                                    settings.web_search_enabled,
                                    settings.terminal_enabled);
}

std::optional<std::string> effective_filesystem_root(const ToolSettings& settings) {
    if (!settings.filesystem_enabled) return std::nullopt;
    std::string root = trim(settings.filesystem_root);
    if (root.empty()) root = home_dir();
    if (root.empty()) return std::nullopt;
    return expand_home(root);
}

std::optional<std::string> effective_obsidian_vault(const ToolSettings& settings) {
    if (!settings.obsidian_enabled) return std::nullopt;
    std::string vault = trim(settings.obsidian_vault_path);
    if (vault.empty()) return std::nullopt;
    return expand_home(vault);
}

const char* tool_group(const std::string& tool_name) {
    static const std::vector<ToolDefinition> catalog = all_tool_definitions();
    for (const auto& def : catalog) {
        if (def.name == tool_name) {
            if (def.id == tool_groups::Filesystem) return tool_groups::Filesystem;
            if (def.id == tool_groups::Obsidian) return tool_groups::Obsidian;
            if (def.id == tool_groups::WebSearch) return tool_groups::WebSearch;
            if (def.id == tool_groups::Web) return tool_groups::Web;
            if (def.id == tool_groups::Browser) return tool_groups::Browser;
            return tool_groups::Terminal;
        }
    }
    return nullptr;
}

bool is_group_enabled(const ToolSettings& settings, const std::string& group) {
    if (group == tool_groups::Filesystem) return settings.filesystem_enabled;
    if (group == tool_groups::Obsidian) return settings.obsidian_enabled;
    if (group == tool_groups::WebSearch || group == tool_groups::Web ||
        group == tool_groups::Browser) {
        return settings.web_search_enabled;
    }
    if (group == tool_groups::Terminal) return settings.terminal_enabled;
    return false;
}

} // namespace toolgate
