#include "command_policy.hpp"
#include "process.hpp"
#include "../tool.hpp"
#include "../util.hpp"
#include <algorithm>
#include <filesystem>

namespace toolgate {

const std::vector<std::string>& blocked_command_patterns() {
    static const std::vector<std::string> patterns = {
        "rm -rf /",
        "rm -rf /*",
        "del /s /q c:\\",
        "format c:",
        "format d:",
        "mkfs",
        ":(){:|:&};:",      // fork bomb
        "shutdown",
        "reboot",
        "halt",
        "poweroff",
        "init 0",
        "init 6",
        "dd if=",           // raw disk write
        "diskpart",
        "bcdedit",
        "reg delete",
        "net user",         // account manipulation
        "net localgroup",
        "schtasks /delete",
        "wmic os delete",
        "cipher /w:",       // secure wipe
    };
    return patterns;
}

bool is_command_blocked(const std::string& command) {
    std::string lower = trim(to_lower(command));
    const auto& patterns = blocked_command_patterns();
    return std::any_of(patterns.begin(), patterns.end(),
                       [&](const std::string& p) { return lower.find(p) != std::string::npos; });
}

void ensure_command_allowed(const std::string& command) {
    if (is_command_blocked(command)) {
        throw ToolError(ToolErrorKind::CommandFailed,
                        "Command blocked: this command is on the safety blocklist. "
                        "Dangerous system commands are not allowed.");
    }
}

std::string resolve_working_directory(const std::optional<std::string>& working_directory) {
    if (!working_directory || trim(*working_directory).empty()) {
        return home_dir();
    }
    std::string wd = trim(*working_directory);
    std::error_code ec;
    if (!std::filesystem::exists(wd, ec)) {
        throw ToolError(ToolErrorKind::InvalidArg, "Working directory does not exist: " + wd);
    }
    if (!std::filesystem::is_directory(wd, ec)) {
        throw ToolError(ToolErrorKind::InvalidArg, "Working directory is not a directory: " + wd);
    }
    return wd;
}

std::string run_command(const std::string& command,
                        const std::optional<std::string>& working_directory) {
    ensure_command_allowed(command);
    std::string wd = resolve_working_directory(working_directory);

    CommandOutput output = run_captured({"/bin/sh", "-c", command}, wd);

    std::vector<std::string> sections;
    sections.push_back("Command: " + command);
    sections.push_back("Working directory: " + wd);
    sections.push_back("Exit code: " + std::to_string(output.exit_code));
    if (!output.stdout_text.empty()) sections.push_back("STDOUT:\n" + output.stdout_text);
    if (!output.stderr_text.empty()) sections.push_back("STDERR:\n" + output.stderr_text);
    if (output.stdout_text.empty() && output.stderr_text.empty()) {
        sections.push_back("(No output)");
    }

    std::string report;
    for (size_t i = 0; i < sections.size(); ++i) {
        if (i > 0) report += "\n\n";
        report += sections[i];
    }
    return report;
}

} // namespace toolgate
