#pragma once
#include "tools/terminal_session.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace toolgate {

// ── Per-tool arguments ──────────────────────────────────────────

struct ReadFileArgs {
    std::string path;
    std::optional<uint32_t> head;
    std::optional<uint32_t> tail;
};

struct WriteFileArgs {
    std::string path;
    std::string content;
};

struct ListDirArgs {
    std::string path = ".";
    std::optional<uint32_t> depth;
};

struct ReadNoteArgs {
    std::string path;
};

struct WriteNoteArgs {
    std::string path;
    std::string content;
};

struct ListNotesArgs {
    std::string path = ".";
    std::optional<uint32_t> depth;
};

struct WebSearchArgs {
    std::string query;
    uint32_t max_results = 5;
    bool include_page_excerpts = true;
};

struct FetchUrlArgs {
    std::string url;
    std::optional<uint32_t> max_chars;
};

struct RunCommandArgs {
    std::string command;
    std::optional<std::string> working_directory;
};

struct OpenTerminalArgs {
    std::string command;
    std::optional<TerminalShell> shell;
    bool keep_open = true;
    std::optional<std::string> working_directory;
    bool new_tab = false;
};

struct OpenBrowserSearchArgs {
    std::optional<std::string> url;
    std::optional<std::string> query;
    std::optional<std::string> engine;
};

using ToolCall = std::variant<ReadFileArgs, WriteFileArgs, ListDirArgs,
                              ReadNoteArgs, WriteNoteArgs, ListNotesArgs,
                              WebSearchArgs, FetchUrlArgs, RunCommandArgs,
                              OpenTerminalArgs, OpenBrowserSearchArgs>;

// Build the typed call for `name`. Throws ToolError(UnknownTool) for a name
// outside the catalog and ToolError(InvalidArg) for a missing required field
// or a field of the wrong JSON type. Unknown fields are ignored.
ToolCall parse_tool_call(const std::string& name, const nlohmann::json& args);

// Parse a JSON argument string; empty means no arguments.
nlohmann::json parse_tool_arguments(const std::string& args_json);

const char* tool_call_name(const ToolCall& call);

} // namespace toolgate
