#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace toolgate {

nlohmann::json Config::defaults_json() {
    return {
        {"tools", {
            {"filesystem_enabled", false},
            {"filesystem_root", ""},
            {"obsidian_enabled", false},
            {"obsidian_vault_path", ""},
            {"web_search_enabled", false},
            {"terminal_enabled", false}
        }},
        {"terminal", {
            {"transcript_path", "~/.toolgate/terminal.log"},
            {"default_shell", "sh"}
        }},
        {"diagnostics", {
            {"quiet", false}
        }}
    };
}

std::string Config::default_path() {
    return expand_home("~/.toolgate/config.json");
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void write_config(const std::string& config_path, const nlohmann::json& j) {
    if (!atomic_write_file(config_path, j.dump(4) + "\n")) {
        std::cerr << "[config] Failed to write config: " << config_path << "\n";
    }
}

Config Config::load() {
    return load_from(default_path());
}

Config Config::load_from(const std::string& config_path) {
    Config cfg;
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        nlohmann::json original = nlohmann::json::parse(file, nullptr, false);
        file.close();
        if (original.is_discarded() || !original.is_object()) {
            // Malformed: use defaults, leave the user's file alone
            std::cerr << "[config] Ignoring malformed config: " << config_path << "\n";
            j = defaults_json();
        } else {
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                write_config(config_path, j);
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        }
    } else {
        j = defaults_json();
        write_config(config_path, j);
        std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    if (j.contains("tools") && j["tools"].is_object()) {
        auto& t = j["tools"];
        if (t.contains("filesystem_enabled") && t["filesystem_enabled"].is_boolean())
            cfg.tools.filesystem_enabled = t["filesystem_enabled"].get<bool>();
        if (t.contains("filesystem_root") && t["filesystem_root"].is_string())
            cfg.tools.filesystem_root = t["filesystem_root"].get<std::string>();
        if (t.contains("obsidian_enabled") && t["obsidian_enabled"].is_boolean())
            cfg.tools.obsidian_enabled = t["obsidian_enabled"].get<bool>();
        if (t.contains("obsidian_vault_path") && t["obsidian_vault_path"].is_string())
            cfg.tools.obsidian_vault_path = t["obsidian_vault_path"].get<std::string>();
        if (t.contains("web_search_enabled") && t["web_search_enabled"].is_boolean())
            cfg.tools.web_search_enabled = t["web_search_enabled"].get<bool>();
        if (t.contains("terminal_enabled") && t["terminal_enabled"].is_boolean())
            cfg.tools.terminal_enabled = t["terminal_enabled"].get<bool>();
    }

    if (j.contains("terminal") && j["terminal"].is_object()) {
        auto& t = j["terminal"];
        if (t.contains("transcript_path") && t["transcript_path"].is_string())
            cfg.terminal.transcript_path = t["transcript_path"].get<std::string>();
        if (t.contains("default_shell") && t["default_shell"].is_string()) {
            std::string name = t["default_shell"].get<std::string>();
            if (auto shell = parse_terminal_shell(name)) {
                cfg.terminal.default_shell = *shell;
            } else {
                std::cerr << "[config] Unknown terminal.default_shell '" << name
                          << "', using sh\n";
            }
        }
    }

    if (j.contains("diagnostics") && j["diagnostics"].is_object()) {
        auto& d = j["diagnostics"];
        if (d.contains("quiet") && d["quiet"].is_boolean())
            cfg.diagnostics.quiet = d["quiet"].get<bool>();
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("TOOLGATE_FILESYSTEM_ROOT"))
        cfg.tools.filesystem_root = v;
    if (const char* v = std::getenv("TOOLGATE_OBSIDIAN_VAULT"))
        cfg.tools.obsidian_vault_path = v;
    if (const char* v = std::getenv("TOOLGATE_TERMINAL_TRANSCRIPT"))
        cfg.terminal.transcript_path = v;

    return cfg;
}

TerminalOptions Config::terminal_options() const {
    TerminalOptions opts;
    std::string path = trim(terminal.transcript_path);
    opts.transcript_path = expand_home(path.empty() ? "~/.toolgate/terminal.log" : path);
    opts.default_shell = terminal.default_shell;
    return opts;
}

} // namespace toolgate
