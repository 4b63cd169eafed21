#pragma once
#include <optional>
#include <string>
#include <vector>

namespace toolgate {

// Destructive-command deny list, matched as lower-case substrings.
const std::vector<std::string>& blocked_command_patterns();

// True when the trimmed, lower-cased command contains any blocked pattern.
bool is_command_blocked(const std::string& command);

// Throws ToolError(CommandFailed) for a blocked command.
void ensure_command_allowed(const std::string& command);

// Resolve a caller working directory: explicit (must exist and be a
// directory, else InvalidArg) or the user's home directory.
std::string resolve_working_directory(const std::optional<std::string>& working_directory);

// One-shot `sh -c <command>`. The report echoes command and directory, then
// the exit code and whatever stdout / stderr were produced. A non-zero exit
// is data, not an error.
std::string run_command(const std::string& command,
                        const std::optional<std::string>& working_directory);

} // namespace toolgate
