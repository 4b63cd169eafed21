#include <catch2/catch.hpp>
#include "tool_call.hpp"
#include "tool.hpp"
#include "tool_registry.hpp"

using namespace toolgate;
using nlohmann::json;

static std::string invalid_arg_detail(const std::string& name, const json& args) {
    try {
        parse_tool_call(name, args);
    } catch (const ToolError& e) {
        REQUIRE(e.kind() == ToolErrorKind::InvalidArg);
        return e.detail();
    }
    FAIL("expected ToolError");
    return "";
}

// ── Filesystem and notes ────────────────────────────────────────

TEST_CASE("parse_tool_call: read_file with head", "[tool_call]") {
    auto call = parse_tool_call("read_file", {{"path", "a.txt"}, {"head", 10}});
    auto& args = std::get<ReadFileArgs>(call);
    REQUIRE(args.path == "a.txt");
    REQUIRE(args.head == std::optional<uint32_t>(10));
    REQUIRE_FALSE(args.tail.has_value());
}

TEST_CASE("parse_tool_call: read_file requires path", "[tool_call]") {
    REQUIRE(invalid_arg_detail("read_file", json::object()) == "path required");
    REQUIRE(invalid_arg_detail("read_file", {{"path", nullptr}}) == "path required");
}

TEST_CASE("parse_tool_call: wrong field types rejected", "[tool_call]") {
    REQUIRE(invalid_arg_detail("read_file", {{"path", 5}}) ==
            "Invalid arguments: path must be a string");
    REQUIRE(invalid_arg_detail("read_file", {{"path", "a"}, {"head", "ten"}}) ==
            "Invalid arguments: head must be an integer");
    REQUIRE(invalid_arg_detail("read_file", {{"path", "a"}, {"tail", -3}}) ==
            "Invalid arguments: tail must be a non-negative integer");
    REQUIRE(invalid_arg_detail("web_search", {{"query", "x"}, {"include_page_excerpts", "yes"}}) ==
            "Invalid arguments: include_page_excerpts must be a boolean");
}

TEST_CASE("parse_tool_call: write_file content defaults to empty", "[tool_call]") {
    auto call = parse_tool_call("write_file", {{"path", "out.txt"}});
    auto& args = std::get<WriteFileArgs>(call);
    REQUIRE(args.path == "out.txt");
    REQUIRE(args.content.empty());
}

TEST_CASE("parse_tool_call: list tools default path to '.'", "[tool_call]") {
    auto dir = parse_tool_call("list_dir", json::object());
    REQUIRE(std::get<ListDirArgs>(dir).path == ".");
    REQUIRE_FALSE(std::get<ListDirArgs>(dir).depth.has_value());

    auto notes = parse_tool_call("obsidian_list_notes", {{"depth", 2}});
    REQUIRE(std::get<ListNotesArgs>(notes).path == ".");
    REQUIRE(std::get<ListNotesArgs>(notes).depth == std::optional<uint32_t>(2));
}

TEST_CASE("parse_tool_call: null args treated as empty object", "[tool_call]") {
    auto call = parse_tool_call("list_dir", json(nullptr));
    REQUIRE(std::get<ListDirArgs>(call).path == ".");
}

TEST_CASE("parse_tool_call: non-object args rejected", "[tool_call]") {
    REQUIRE(invalid_arg_detail("list_dir", json::array({1, 2})) ==
            "Invalid arguments: expected a JSON object");
}

TEST_CASE("parse_tool_call: unknown fields ignored", "[tool_call]") {
    auto call = parse_tool_call("obsidian_read_note", {{"path", "Daily/x.md"}, {"extra", true}});
    REQUIRE(std::get<ReadNoteArgs>(call).path == "Daily/x.md");
}

// ── Web ─────────────────────────────────────────────────────────

TEST_CASE("parse_tool_call: web_search defaults", "[tool_call]") {
    auto call = parse_tool_call("web_search", {{"query", "rust"}});
    auto& args = std::get<WebSearchArgs>(call);
    REQUIRE(args.query == "rust");
    REQUIRE(args.max_results == 5);
    REQUIRE(args.include_page_excerpts);
}

TEST_CASE("parse_tool_call: fetch_url trims and requires url", "[tool_call]") {
    auto call = parse_tool_call("fetch_url", {{"url", "  https://x.org  "}, {"max_chars", 800}});
    auto& args = std::get<FetchUrlArgs>(call);
    REQUIRE(args.url == "https://x.org");
    REQUIRE(args.max_chars == std::optional<uint32_t>(800));

    REQUIRE(invalid_arg_detail("fetch_url", {{"url", "   "}}) == "url required");
    REQUIRE(invalid_arg_detail("fetch_url", json::object()) == "url required");
}

TEST_CASE("parse_tool_call: open_browser_search all optional", "[tool_call]") {
    auto call = parse_tool_call("open_browser_search", {{"query", "news"}, {"engine", "bing"}});
    auto& args = std::get<OpenBrowserSearchArgs>(call);
    REQUIRE_FALSE(args.url.has_value());
    REQUIRE(args.query == std::optional<std::string>("news"));
    REQUIRE(args.engine == std::optional<std::string>("bing"));
}

// ── Terminal ────────────────────────────────────────────────────

TEST_CASE("parse_tool_call: run_command rejects empty command", "[tool_call]") {
    REQUIRE(invalid_arg_detail("run_command", {{"command", "   "}}) == "command cannot be empty");
    REQUIRE(invalid_arg_detail("run_command", json::object()) == "command required");

    auto call = parse_tool_call("run_command", {{"command", " ls "}, {"working_directory", "/tmp"}});
    auto& args = std::get<RunCommandArgs>(call);
    REQUIRE(args.command == "ls");
    REQUIRE(args.working_directory == std::optional<std::string>("/tmp"));
}

TEST_CASE("parse_tool_call: open_terminal_and_run defaults", "[tool_call]") {
    auto call = parse_tool_call("open_terminal_and_run", {{"command", "pwd"}});
    auto& args = std::get<OpenTerminalArgs>(call);
    REQUIRE(args.command == "pwd");
    REQUIRE_FALSE(args.shell.has_value());
    REQUIRE(args.keep_open);
    REQUIRE_FALSE(args.new_tab);
    REQUIRE_FALSE(args.working_directory.has_value());
}

TEST_CASE("parse_tool_call: open_terminal_and_run shell names", "[tool_call]") {
    auto call = parse_tool_call("open_terminal_and_run",
                                {{"command", "pwd"}, {"shell", "bash"}, {"new_tab", true},
                                 {"keep_open", false}});
    auto& args = std::get<OpenTerminalArgs>(call);
    REQUIRE(args.shell == std::optional<TerminalShell>(TerminalShell::Bash));
    REQUIRE(args.new_tab);
    REQUIRE_FALSE(args.keep_open);

    REQUIRE(invalid_arg_detail("open_terminal_and_run", {{"command", "pwd"}, {"shell", "fish"}}) ==
            "unsupported shell: fish (expected sh, bash or xterm)");
}

// ── Names ───────────────────────────────────────────────────────

TEST_CASE("parse_tool_call: unknown tool", "[tool_call]") {
    try {
        parse_tool_call("format_disk", json::object());
        FAIL("expected ToolError");
    } catch (const ToolError& e) {
        REQUIRE(e.kind() == ToolErrorKind::UnknownTool);
        REQUIRE(std::string(e.what()) == "Tool not found: format_disk");
    }
}

TEST_CASE("tool_call_name: round-trips every catalog tool", "[tool_call]") {
    const json minimal = {{"path", "a"}, {"query", "q"}, {"url", "https://x"}, {"command", "ls"}};
    for (const auto& def : all_tool_definitions()) {
        auto call = parse_tool_call(def.name, minimal);
        REQUIRE(std::string(tool_call_name(call)) == def.name);
    }
}

// ── parse_tool_arguments ────────────────────────────────────────

TEST_CASE("parse_tool_arguments: empty string is an empty object", "[tool_call]") {
    REQUIRE(parse_tool_arguments("") == json::object());
    REQUIRE(parse_tool_arguments("   ") == json::object());
}

TEST_CASE("parse_tool_arguments: valid JSON", "[tool_call]") {
    auto j = parse_tool_arguments(R"({"path": "a.txt"})");
    REQUIRE(j["path"] == "a.txt");
}

TEST_CASE("parse_tool_arguments: malformed JSON is an argument error", "[tool_call]") {
    try {
        parse_tool_arguments("{ path: ");
        FAIL("expected ToolError");
    } catch (const ToolError& e) {
        REQUIRE(e.kind() == ToolErrorKind::InvalidArg);
        REQUIRE(e.detail().rfind("Failed to parse arguments: ", 0) == 0);
    }
}
