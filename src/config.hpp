#pragma once
#include "tool_registry.hpp"
#include "tools/terminal_session.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace toolgate {

struct TerminalConfig {
    std::string transcript_path;   // "~/.toolgate/terminal.log" when unset
    TerminalShell default_shell = TerminalShell::Sh;
};

struct DiagnosticsConfig {
    bool quiet = false;            // suppress [diag] lines on stderr
};

struct Config {
    ToolSettings tools;
    TerminalConfig terminal;
    DiagnosticsConfig diagnostics;

    // Load from ~/.toolgate/config.json + env vars
    static Config load();

    // Load from an explicit path. A missing file is created with defaults,
    // missing keys are merged in and written back, a malformed file is
    // ignored in favour of defaults.
    static Config load_from(const std::string& config_path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    static std::string default_path();

    TerminalOptions terminal_options() const;
};

} // namespace toolgate
