#pragma once
#include <string>
#include <vector>
#include <sys/types.h>

namespace toolgate {

struct CommandOutput {
    int exit_code = -1; // -1 when terminated by a signal
    std::string stdout_text;
    std::string stderr_text;
};

// A live child whose stdin is the write end we hold.
struct ChildProcess {
    pid_t pid = -1;
    int stdin_fd = -1;
};

// Run argv to completion in working_dir with stdin at /dev/null, capturing
// both streams. Throws ToolError(CommandFailed) when the program cannot be
// started (fork, chdir or exec failure).
CommandOutput run_captured(const std::vector<std::string>& argv,
                           const std::string& working_dir);

// Start argv in working_dir with a piped stdin. stdout and stderr are
// appended to output_path (or /dev/null when empty).
ChildProcess spawn_with_input_pipe(const std::vector<std::string>& argv,
                                   const std::string& working_dir,
                                   const std::string& output_path);

// Start argv fully detached (own session, reparented to init). Output goes to
// output_path when given, else /dev/null. Returns once exec has succeeded;
// throws ToolError(CommandFailed) otherwise.
void spawn_detached(const std::vector<std::string>& argv, const std::string& working_dir,
                    const std::string& output_path = "");

// Non-blocking liveness check; reaps the child when it has exited.
bool is_process_alive(pid_t pid);

// Write the whole buffer; false on a short write or a closed reader.
bool write_all(int fd, const std::string& data);

// Close our pipe end, kill the child and reap it.
void terminate_process(ChildProcess& child);

// Close our pipe end so the child sees EOF once it has consumed what was
// already written. Reaps it only if it has exited; never blocks.
void release_process(ChildProcess& child);

// First match of `name` in $PATH, or empty.
std::string find_executable(const std::string& name);

} // namespace toolgate
