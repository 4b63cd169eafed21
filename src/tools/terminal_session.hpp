#pragma once
#include "process.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace toolgate {

class DiagnosticTrace;

enum class TerminalShell { Sh, Bash, Xterm };

std::optional<TerminalShell> parse_terminal_shell(const std::string& name);
const char* terminal_shell_name(TerminalShell shell);

// Resolved once at startup. When persistent terminals are unsupported the
// manager keeps the same interface but every call fails with Unsupported.
struct TerminalCapability {
    bool supported = false;
    std::string reason;
};

TerminalCapability detect_terminal_capability();

struct TerminalOptions {
    std::string transcript_path;             // shell output is appended here
    TerminalShell default_shell = TerminalShell::Sh;
};

struct TerminalRequest {
    std::string command;
    std::optional<TerminalShell> shell;
    bool keep_open = true;
    std::optional<std::string> working_directory;
    bool new_tab = false;
};

struct TerminalOutcome {
    std::string content;
    std::string shell_used;
};

// Owns the single shared shell session. The (process, pipe) pair and the
// last working directory sit behind two independent mutexes; neither is
// held while a process is being spawned.
//
// State machine:
//   NoSession --(new_tab=false)--> Active(child, pipe, last_wd)
//   Active --(new_tab=false, alive)--> Active   command written, no cd
//   Active --(new_tab=false, dead)--> discarded, then a fresh Active
//   Active --(displaced or destroyed)--> input closed, queued commands finish
//   any --(new_tab=true)--> unchanged; a detached process is started
class TerminalSessionManager {
public:
    TerminalSessionManager(TerminalCapability capability, TerminalOptions options);
    ~TerminalSessionManager();

    TerminalSessionManager(const TerminalSessionManager&) = delete;
    TerminalSessionManager& operator=(const TerminalSessionManager&) = delete;

    TerminalOutcome open_and_run(const TerminalRequest& request, DiagnosticTrace& trace);

    bool has_live_session();
    std::string last_working_directory() const;
    const TerminalOptions& options() const { return options_; }

    // Kill the shared session, if any, dropping commands it has not run.
    // Destruction instead closes the session's input and lets it finish.
    void reset();

private:
    std::optional<TerminalOutcome> try_reuse(const TerminalRequest& request,
                                             const std::string& command,
                                             DiagnosticTrace& trace);
    TerminalOutcome start_session(TerminalShell shell, const std::string& command,
                                  const std::string& wd, DiagnosticTrace& trace);
    TerminalOutcome run_in_new_tab(TerminalShell shell, const std::string& command,
                                   bool keep_open, const std::string& wd,
                                   DiagnosticTrace& trace);
    std::string resolve_wd(const std::optional<std::string>& explicit_wd) const;

    TerminalCapability capability_;
    TerminalOptions options_;

    std::mutex session_mutex_;
    std::optional<ChildProcess> session_;
    std::string session_shell_;

    mutable std::mutex last_wd_mutex_;
    std::string last_wd_;
};

} // namespace toolgate
