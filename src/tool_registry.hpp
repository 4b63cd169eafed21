#pragma once
#include "tool.hpp"
#include <optional>
#include <string>
#include <vector>

namespace toolgate {

// Capability group ids.
namespace tool_groups {
    constexpr const char* Filesystem = "filesystem";
    constexpr const char* Obsidian   = "obsidian";
    constexpr const char* WebSearch  = "web_search";
    constexpr const char* Web        = "web";
    constexpr const char* Browser    = "browser";
    constexpr const char* Terminal   = "terminal";
} // namespace tool_groups

// User-facing enable flags and boundaries, one per capability group.
struct ToolSettings {
    bool filesystem_enabled = false;
    std::string filesystem_root;       // empty means the home directory
    bool obsidian_enabled = false;
    std::string obsidian_vault_path;
    bool web_search_enabled = false;   // also gates fetch_url and open_browser_search
    bool terminal_enabled = false;
};

// Root handed to filesystem tools: none when the group is off, else the
// configured root or, when that is blank, the home directory.
std::optional<std::string> effective_filesystem_root(const ToolSettings& settings);

// Vault handed to note tools: none when off or blank.
std::optional<std::string> effective_obsidian_vault(const ToolSettings& settings);

// Every definition, regardless of settings.
std::vector<ToolDefinition> all_tool_definitions();

// Groups whose flag is on and, for filesystem / obsidian, whose root is
// non-blank. Advisory only: the dispatcher enforces roots itself.
std::vector<ToolDefinition> enabled_tool_definitions(bool filesystem_enabled,
                                                     const std::string& filesystem_root,
                                                     bool obsidian_enabled,
                                                     const std::string& obsidian_vault,
                                                     bool web_search_enabled,
                                                     bool terminal_enabled);

// Same, with the filesystem root resolved as effective_filesystem_root does.
std::vector<ToolDefinition> enabled_tool_definitions(const ToolSettings& settings);

// Capability group of a catalog tool, or nullptr for an unknown name.
const char* tool_group(const std::string& tool_name);

// Whether the settings enable a capability group.
bool is_group_enabled(const ToolSettings& settings, const std::string& group);

} // namespace toolgate
