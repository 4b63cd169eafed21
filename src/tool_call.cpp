#include "tool_call.hpp"
#include "tool.hpp"
#include "util.hpp"
#include <functional>
#include <limits>
#include <unordered_map>

namespace toolgate {

namespace {

// Typed access to the optional-field bag. A JSON null counts as absent.
class ArgReader {
public:
    explicit ArgReader(const nlohmann::json& args) : args_(args) {}

    std::optional<std::string> text(const char* field) const {
        const nlohmann::json* v = find(field);
        if (!v) return std::nullopt;
        if (!v->is_string()) invalid(field, "a string");
        return v->get<std::string>();
    }

    std::optional<uint32_t> count(const char* field) const {
        const nlohmann::json* v = find(field);
        if (!v) return std::nullopt;
        if (!v->is_number_integer()) invalid(field, "an integer");
        if (!v->is_number_unsigned() && v->get<int64_t>() < 0) {
            invalid(field, "a non-negative integer");
        }
        auto n = v->get<uint64_t>();
        if (n > std::numeric_limits<uint32_t>::max()) invalid(field, "a 32-bit count");
        return static_cast<uint32_t>(n);
    }

    std::optional<bool> flag(const char* field) const {
        const nlohmann::json* v = find(field);
        if (!v) return std::nullopt;
        if (!v->is_boolean()) invalid(field, "a boolean");
        return v->get<bool>();
    }

    std::string required_string(const char* field) const {
        auto v = text(field);
        if (!v) throw ToolError(ToolErrorKind::InvalidArg, std::string(field) + " required");
        return *v;
    }

private:
    const nlohmann::json* find(const char* field) const {
        if (!args_.is_object()) return nullptr;
        auto it = args_.find(field);
        if (it == args_.end() || it->is_null()) return nullptr;
        return &*it;
    }

    [[noreturn]] static void invalid(const char* field, const char* expected) {
        throw ToolError(ToolErrorKind::InvalidArg,
                        std::string("Invalid arguments: ") + field + " must be " + expected);
    }

    const nlohmann::json& args_;
};

using Parser = std::function<ToolCall(const ArgReader&)>;

const std::unordered_map<std::string, Parser>& parsers() {
    static const std::unordered_map<std::string, Parser> table = {
        {"read_file", [](const ArgReader& a) -> ToolCall {
            return ReadFileArgs{a.required_string("path"), a.count("head"), a.count("tail")};
        }},
        {"write_file", [](const ArgReader& a) -> ToolCall {
            return WriteFileArgs{a.required_string("path"), a.text("content").value_or("")};
        }},
        {"list_dir", [](const ArgReader& a) -> ToolCall {
            return ListDirArgs{a.text("path").value_or("."), a.count("depth")};
        }},
        {"obsidian_read_note", [](const ArgReader& a) -> ToolCall {
            return ReadNoteArgs{a.required_string("path")};
        }},
        {"obsidian_write_note", [](const ArgReader& a) -> ToolCall {
            return WriteNoteArgs{a.required_string("path"), a.text("content").value_or("")};
        }},
        {"obsidian_list_notes", [](const ArgReader& a) -> ToolCall {
            return ListNotesArgs{a.text("path").value_or("."), a.count("depth")};
        }},
        {"web_search", [](const ArgReader& a) -> ToolCall {
            return WebSearchArgs{a.required_string("query"),
                                 a.count("max_results").value_or(5),
                                 a.flag("include_page_excerpts").value_or(true)};
        }},
        {"fetch_url", [](const ArgReader& a) -> ToolCall {
            auto url = a.text("url");
            if (!url || trim(*url).empty()) {
                throw ToolError(ToolErrorKind::InvalidArg, "url required");
            }
            return FetchUrlArgs{trim(*url), a.count("max_chars")};
        }},
        {"run_command", [](const ArgReader& a) -> ToolCall {
            std::string command = trim(a.required_string("command"));
            if (command.empty()) {
                throw ToolError(ToolErrorKind::InvalidArg, "command cannot be empty");
            }
            return RunCommandArgs{command, a.text("working_directory")};
        }},
        {"open_terminal_and_run", [](const ArgReader& a) -> ToolCall {
            OpenTerminalArgs args;
            args.command = trim(a.required_string("command"));
            if (auto shell = a.text("shell")) {
                args.shell = parse_terminal_shell(*shell);
                if (!args.shell) {
                    throw ToolError(ToolErrorKind::InvalidArg,
                                    "unsupported shell: " + *shell + " (expected sh, bash or xterm)");
                }
            }
            args.keep_open = a.flag("keep_open").value_or(true);
            args.working_directory = a.text("working_directory");
            args.new_tab = a.flag("new_tab").value_or(false);
            return args;
        }},
        {"open_browser_search", [](const ArgReader& a) -> ToolCall {
            return OpenBrowserSearchArgs{a.text("url"), a.text("query"), a.text("engine")};
        }},
    };
    return table;
}

} // namespace

ToolCall parse_tool_call(const std::string& name, const nlohmann::json& args) {
    const auto& table = parsers();
    auto it = table.find(name);
    if (it == table.end()) throw ToolError(ToolErrorKind::UnknownTool, name);
    if (!args.is_null() && !args.is_object()) {
        throw ToolError(ToolErrorKind::InvalidArg, "Invalid arguments: expected a JSON object");
    }
    return it->second(ArgReader(args));
}

nlohmann::json parse_tool_arguments(const std::string& args_json) {
    if (trim(args_json).empty()) return nlohmann::json::object();
    try {
        return nlohmann::json::parse(args_json);
    } catch (const nlohmann::json::parse_error& e) {
        throw ToolError(ToolErrorKind::InvalidArg,
                        std::string("Failed to parse arguments: ") + e.what());
    }
}

namespace {

struct CallName {
    const char* operator()(const ReadFileArgs&) const { return "read_file"; }
    const char* operator()(const WriteFileArgs&) const { return "write_file"; }
    const char* operator()(const ListDirArgs&) const { return "list_dir"; }
    const char* operator()(const ReadNoteArgs&) const { return "obsidian_read_note"; }
    const char* operator()(const WriteNoteArgs&) const { return "obsidian_write_note"; }
    const char* operator()(const ListNotesArgs&) const { return "obsidian_list_notes"; }
    const char* operator()(const WebSearchArgs&) const { return "web_search"; }
    const char* operator()(const FetchUrlArgs&) const { return "fetch_url"; }
    const char* operator()(const RunCommandArgs&) const { return "run_command"; }
    const char* operator()(const OpenTerminalArgs&) const { return "open_terminal_and_run"; }
    const char* operator()(const OpenBrowserSearchArgs&) const { return "open_browser_search"; }
};

} // namespace

const char* tool_call_name(const ToolCall& call) {
    return std::visit(CallName{}, call);
}

} // namespace toolgate
