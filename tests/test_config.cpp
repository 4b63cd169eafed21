#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <sstream>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace toolgate;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values keep every capability off", "[config]") {
    Config cfg;
    REQUIRE_FALSE(cfg.tools.filesystem_enabled);
    REQUIRE_FALSE(cfg.tools.obsidian_enabled);
    REQUIRE_FALSE(cfg.tools.web_search_enabled);
    REQUIRE_FALSE(cfg.tools.terminal_enabled);
    REQUIRE(cfg.tools.filesystem_root.empty());
    REQUIRE(cfg.terminal.default_shell == TerminalShell::Sh);
    REQUIRE_FALSE(cfg.diagnostics.quiet);
}

TEST_CASE("Config::defaults_json: has every section", "[config]") {
    auto j = Config::defaults_json();
    REQUIRE(j["tools"]["filesystem_enabled"] == false);
    REQUIRE(j["tools"]["obsidian_vault_path"] == "");
    REQUIRE(j["terminal"]["transcript_path"] == "~/.toolgate/terminal.log");
    REQUIRE(j["terminal"]["default_shell"] == "sh");
    REQUIRE(j["diagnostics"]["quiet"] == false);
}

// ── Load from file ───────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "toolgate_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static nlohmann::json read_json(const std::string& path) {
    std::ifstream f(path);
    return nlohmann::json::parse(f);
}

static std::string slurp(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// RAII guard: points HOME at a temp dir, clears env overrides, restores on exit
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("TOOLGATE_FILESYSTEM_ROOT");
        unsetenv("TOOLGATE_OBSIDIAN_VAULT");
        unsetenv("TOOLGATE_TERMINAL_TRANSCRIPT");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.toolgate/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.toolgate");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));

    Config cfg = Config::load();

    REQUIRE(std::filesystem::exists(g.config_path()));
    REQUIRE(read_json(g.config_path()) == Config::defaults_json());
    REQUIRE_FALSE(cfg.tools.filesystem_enabled);
}

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "tools": {
            "filesystem_enabled": true,
            "filesystem_root": "/srv/files",
            "obsidian_enabled": true,
            "obsidian_vault_path": "~/vault",
            "web_search_enabled": true,
            "terminal_enabled": true
        },
        "terminal": {
            "transcript_path": "/tmp/term.log",
            "default_shell": "bash"
        },
        "diagnostics": { "quiet": true }
    })");

    Config cfg = Config::load();

    REQUIRE(cfg.tools.filesystem_enabled);
    REQUIRE(cfg.tools.filesystem_root == "/srv/files");
    REQUIRE(cfg.tools.obsidian_enabled);
    REQUIRE(cfg.tools.obsidian_vault_path == "~/vault");
    REQUIRE(cfg.tools.web_search_enabled);
    REQUIRE(cfg.tools.terminal_enabled);
    REQUIRE(cfg.terminal.transcript_path == "/tmp/term.log");
    REQUIRE(cfg.terminal.default_shell == TerminalShell::Bash);
    REQUIRE(cfg.diagnostics.quiet);
}

TEST_CASE("Config::load: partial config is migrated with new defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"tools": {"filesystem_enabled": true}, "custom": 1})");

    Config cfg = Config::load();
    REQUIRE(cfg.tools.filesystem_enabled);
    REQUIRE_FALSE(cfg.tools.terminal_enabled);

    auto written = read_json(g.config_path());
    REQUIRE(written["tools"]["filesystem_enabled"] == true);
    REQUIRE(written["tools"]["terminal_enabled"] == false);
    REQUIRE(written["terminal"]["default_shell"] == "sh");
    REQUIRE(written["custom"] == 1);
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("{ not json");

    Config cfg = Config::load();
    REQUIRE_FALSE(cfg.tools.filesystem_enabled);
    REQUIRE(cfg.terminal.default_shell == TerminalShell::Sh);
    // The user's file is left untouched
    REQUIRE(slurp(g.config_path()) == "{ not json");
}

TEST_CASE("Config::load: non-object JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("[1, 2, 3]");

    Config cfg = Config::load();
    REQUIRE_FALSE(cfg.tools.web_search_enabled);
    REQUIRE(slurp(g.config_path()) == "[1, 2, 3]");
}

TEST_CASE("Config::load: wrong value types are ignored", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"tools": {"filesystem_enabled": "yes", "filesystem_root": 42}})");

    Config cfg = Config::load();
    REQUIRE_FALSE(cfg.tools.filesystem_enabled);
    REQUIRE(cfg.tools.filesystem_root.empty());
}

TEST_CASE("Config::load: unknown default_shell keeps sh", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"terminal": {"default_shell": "powershell"}})");

    Config cfg = Config::load();
    REQUIRE(cfg.terminal.default_shell == TerminalShell::Sh);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"tools": {"filesystem_root": "/from/file"}})");
    setenv("TOOLGATE_FILESYSTEM_ROOT", "/from/env", 1);
    setenv("TOOLGATE_OBSIDIAN_VAULT", "/vault/env", 1);
    setenv("TOOLGATE_TERMINAL_TRANSCRIPT", "/tmp/env.log", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.tools.filesystem_root == "/from/env");
    REQUIRE(cfg.tools.obsidian_vault_path == "/vault/env");
    REQUIRE(cfg.terminal.transcript_path == "/tmp/env.log");

    unsetenv("TOOLGATE_FILESYSTEM_ROOT");
    unsetenv("TOOLGATE_OBSIDIAN_VAULT");
    unsetenv("TOOLGATE_TERMINAL_TRANSCRIPT");
}

TEST_CASE("Config::load_from: explicit path", "[config]") {
    ConfigTestGuard g;
    std::string path = g.dir + "/custom/settings.json";

    Config cfg = Config::load_from(path);
    REQUIRE(std::filesystem::exists(path));
    REQUIRE_FALSE(cfg.tools.obsidian_enabled);
}

// ── terminal_options ─────────────────────────────────────────────

TEST_CASE("Config::terminal_options: expands home in transcript path", "[config]") {
    ConfigTestGuard g;
    Config cfg;
    cfg.terminal.transcript_path = "~/logs/term.log";
    cfg.terminal.default_shell = TerminalShell::Bash;

    auto opts = cfg.terminal_options();
    REQUIRE(opts.transcript_path == g.dir + "/logs/term.log");
    REQUIRE(opts.default_shell == TerminalShell::Bash);
}

TEST_CASE("Config::terminal_options: blank path uses default", "[config]") {
    ConfigTestGuard g;
    Config cfg;
    cfg.terminal.transcript_path = "  ";

    REQUIRE(cfg.terminal_options().transcript_path == g.dir + "/.toolgate/terminal.log");
}
