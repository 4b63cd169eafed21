#include "terminal_session.hpp"
#include "command_policy.hpp"
#include "../diagnostics.hpp"
#include "../tool.hpp"
#include "../util.hpp"
#include <filesystem>
#include <unistd.h>

namespace toolgate {

std::optional<TerminalShell> parse_terminal_shell(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n.empty() || n == "sh") return TerminalShell::Sh;
    if (n == "bash") return TerminalShell::Bash;
    if (n == "xterm") return TerminalShell::Xterm;
    return std::nullopt;
}

const char* terminal_shell_name(TerminalShell shell) {
    switch (shell) {
        case TerminalShell::Sh:    return "sh";
        case TerminalShell::Bash:  return "bash";
        case TerminalShell::Xterm: return "xterm";
    }
    return "sh";
}

TerminalCapability detect_terminal_capability() {
    TerminalCapability cap;
#if defined(__unix__) || defined(__APPLE__)
    if (access("/bin/sh", X_OK) == 0) {
        cap.supported = true;
    } else {
        cap.reason = "/bin/sh is not executable";
    }
#else
    cap.reason = "persistent terminals need a POSIX shell";
#endif
    return cap;
}

static std::string shell_quote(const std::string& s) {
    return "'" + replace_all(s, "'", "'\\''") + "'";
}

TerminalSessionManager::TerminalSessionManager(TerminalCapability capability,
                                               TerminalOptions options)
    : capability_(std::move(capability)), options_(std::move(options)) {}

TerminalSessionManager::~TerminalSessionManager() {
    std::optional<ChildProcess> old;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        old.swap(session_);
    }
    if (old) release_process(*old);
}

void TerminalSessionManager::reset() {
    std::optional<ChildProcess> old;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        old.swap(session_);
    }
    if (old) terminate_process(*old);
}

bool TerminalSessionManager::has_live_session() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!session_) return false;
    if (is_process_alive(session_->pid)) return true;
    session_->pid = -1;
    return false;
}

std::string TerminalSessionManager::last_working_directory() const {
    std::lock_guard<std::mutex> lock(last_wd_mutex_);
    return last_wd_;
}

std::string TerminalSessionManager::resolve_wd(
        const std::optional<std::string>& explicit_wd) const {
    if (explicit_wd && !trim(*explicit_wd).empty()) {
        return resolve_working_directory(explicit_wd);
    }
    {
        std::lock_guard<std::mutex> lock(last_wd_mutex_);
        if (!last_wd_.empty()) return last_wd_;
    }
    return home_dir();
}

TerminalOutcome TerminalSessionManager::open_and_run(const TerminalRequest& request,
                                                     DiagnosticTrace& trace) {
    TerminalShell shell = request.shell.value_or(options_.default_shell);
    trace.info("open_terminal_and_run: validating arguments",
               {{"shell", terminal_shell_name(shell)},
                {"keep_open", request.keep_open},
                {"new_tab", request.new_tab},
                {"working_directory", request.working_directory
                     ? nlohmann::json(*request.working_directory) : nlohmann::json(nullptr)}});

    std::string command = trim(request.command);
    if (command.empty()) {
        trace.error("open_terminal_and_run: command cannot be empty");
        throw ToolError(ToolErrorKind::InvalidArg, "command cannot be empty");
    }
    if (is_command_blocked(command)) {
        trace.error("open_terminal_and_run: command rejected by safety blocklist");
        ensure_command_allowed(command);
    }
    if (!capability_.supported) {
        trace.error("open_terminal_and_run: persistent terminal not available",
                    {{"reason", capability_.reason}});
        throw ToolError(ToolErrorKind::Unsupported,
                        "open_terminal_and_run is not available on this platform (" +
                        capability_.reason + "); use run_command instead");
    }

    if (!request.new_tab) {
        if (auto reused = try_reuse(request, command, trace)) return *reused;
    }

    std::string wd = resolve_wd(request.working_directory);
    if (request.new_tab) {
        return run_in_new_tab(shell, command, request.keep_open, wd, trace);
    }
    return start_session(shell, command, wd, trace);
}

std::optional<TerminalOutcome> TerminalSessionManager::try_reuse(const TerminalRequest& request,
                                                                 const std::string& command,
                                                                 DiagnosticTrace& trace) {
    std::optional<ChildProcess> dead;
    std::optional<TerminalOutcome> outcome;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (!session_) return std::nullopt;
        bool alive = is_process_alive(session_->pid);
        if (alive && write_all(session_->stdin_fd, command + "\n")) {
            outcome = TerminalOutcome{
                "Ran in existing terminal (" + session_shell_ + ").\nCommand: " + command,
                session_shell_};
        } else {
            // Already reaped by the liveness check; only the pipe is left.
            if (!alive) session_->pid = -1;
            dead.swap(session_);
        }
    }
    if (dead) {
        trace.warn("Persistent terminal is no longer running; starting a new one");
        release_process(*dead);
        return std::nullopt;
    }
    if (request.working_directory) {
        trace.warn("working_directory ignored: existing terminal keeps its directory",
                   {{"working_directory", *request.working_directory}});
    }
    trace.info("Reused existing terminal; command sent (no directory change).",
               {{"command", command}});
    return outcome;
}

TerminalOutcome TerminalSessionManager::start_session(TerminalShell shell,
                                                      const std::string& command,
                                                      const std::string& wd,
                                                      DiagnosticTrace& trace) {
    std::string shell_path = "/bin/sh";
    TerminalShell used = TerminalShell::Sh;
    if (shell == TerminalShell::Bash) {
        std::string bash = find_executable("bash");
        if (!bash.empty()) {
            shell_path = bash;
            used = TerminalShell::Bash;
        } else {
            trace.warn("bash not found; falling back to sh");
        }
    } else if (shell == TerminalShell::Xterm) {
        trace.warn("xterm cannot host a reusable session; falling back to sh");
    }

    const std::string& transcript = options_.transcript_path;
    if (!transcript.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(transcript).parent_path(), ec);
    }

    trace.info(std::string("Step: starting persistent ") + terminal_shell_name(used) +
               " session (reuse same session)",
               {{"shell_path", shell_path}, {"transcript", transcript}});

    ChildProcess child;
    try {
        child = spawn_with_input_pipe({shell_path}, wd, transcript);
    } catch (const ToolError& e) {
        trace.error("Failed to start persistent terminal", {{"error", e.detail()}});
        throw;
    }

    std::string script = "cd " + shell_quote(wd) + "\n" + command + "\n";
    if (!write_all(child.stdin_fd, script)) {
        terminate_process(child);
        trace.error("Failed to send command to new terminal");
        throw ToolError(ToolErrorKind::CommandFailed, "write to terminal failed");
    }

    std::optional<ChildProcess> displaced;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (session_) displaced.swap(session_);
        session_ = child;
        session_shell_ = terminal_shell_name(used);
    }
    if (displaced) release_process(*displaced);
    {
        std::lock_guard<std::mutex> lock(last_wd_mutex_);
        last_wd_ = wd;
    }

    trace.info("Persistent terminal started; future commands will reuse this session.",
               {{"working_directory", wd}});

    std::string content = "Opened terminal (reuse same session for next commands).\n"
                          "Working directory: " + wd + "\nCommand: " + command;
    if (!transcript.empty()) content += "\nTranscript: " + transcript;
    return TerminalOutcome{content, terminal_shell_name(used)};
}

TerminalOutcome TerminalSessionManager::run_in_new_tab(TerminalShell shell,
                                                       const std::string& command,
                                                       bool keep_open,
                                                       const std::string& wd,
                                                       DiagnosticTrace& trace) {
    const std::string& transcript = options_.transcript_path;
    TerminalShell used = shell;
    bool launched = false;

    if (shell == TerminalShell::Xterm) {
        trace.info(keep_open ? "Step: xterm -hold -e sh -c" : "Step: xterm -e sh -c");
        std::string xterm = find_executable("xterm");
        if (xterm.empty()) {
            trace.warn("xterm not found; falling back to sh");
        } else {
            std::vector<std::string> argv = {xterm};
            if (keep_open) argv.push_back("-hold");
            argv.insert(argv.end(), {"-e", "/bin/sh", "-c", command});
            try {
                spawn_detached(argv, wd);
                launched = true;
            } catch (const ToolError& e) {
                trace.warn("xterm failed; falling back to sh", {{"error", e.detail()}});
            }
        }
        if (!launched) used = TerminalShell::Sh;
    }

    if (!launched && used == TerminalShell::Bash) {
        trace.info("Step: bash -c (detached)");
        std::string bash = find_executable("bash");
        if (bash.empty()) {
            trace.warn("bash not found; falling back to sh");
            used = TerminalShell::Sh;
        } else {
            try {
                spawn_detached({bash, "-c", command}, wd, transcript);
                launched = true;
            } catch (const ToolError& e) {
                trace.warn("bash failed; falling back to sh", {{"error", e.detail()}});
                used = TerminalShell::Sh;
            }
        }
    }

    if (!launched) {
        trace.info("Step: sh -c (detached)");
        try {
            spawn_detached({"/bin/sh", "-c", command}, wd, transcript);
        } catch (const ToolError& e) {
            trace.error("Failed to open new terminal", {{"error", e.detail()}});
            throw;
        }
    }

    std::string shell_used = terminal_shell_name(used);
    trace.info("Opened new terminal tab. Shell: " + shell_used, {{"shell_used", shell_used}});
    return TerminalOutcome{"Opened new terminal window.\nShell: " + shell_used +
                           "\nCommand: " + command + "\nWorking directory: " + wd,
                           shell_used};
}

} // namespace toolgate
