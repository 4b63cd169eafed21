#include "process.hpp"
#include "../tool.hpp"
#include "../util.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolgate {

// A dead reader on a terminal pipe must surface as EPIPE, not kill us.
static void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

static std::vector<char*> to_argv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

// Error channel from child to parent: the write end is close-on-exec, so a
// successful exec yields EOF and a failure yields "<stage>:<errno>".
struct ExecReport {
    int fds[2] = {-1, -1};

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }

    [[noreturn]] void child_fail(const char* stage) {
        int err = errno;
        std::string msg = std::string(stage) + ":" + std::to_string(err);
        ssize_t n = write(fds[1], msg.data(), msg.size());
        (void)n;
        _exit(127);
    }

    // Parent side: returns empty on success, else a readable message.
    std::string parent_collect() {
        close(fds[1]);
        fds[1] = -1;
        std::string msg;
        std::array<char, 128> buf;
        ssize_t n;
        while ((n = read(fds[0], buf.data(), buf.size())) != 0) {
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            msg.append(buf.data(), static_cast<size_t>(n));
        }
        close(fds[0]);
        fds[0] = -1;
        if (msg.empty()) return {};
        auto colon = msg.find(':');
        int err = std::atoi(msg.c_str() + colon + 1);
        return msg.substr(0, colon) + " failed: " + std::strerror(err);
    }

    void close_all() {
        if (fds[0] >= 0) close(fds[0]);
        if (fds[1] >= 0) close(fds[1]);
        fds[0] = fds[1] = -1;
    }
};

static void redirect_stdin_devnull() {
    int fd = ::open("/dev/null", O_RDONLY);
    if (fd >= 0) {
        dup2(fd, STDIN_FILENO);
        close(fd);
    }
}

CommandOutput run_captured(const std::vector<std::string>& args,
                           const std::string& working_dir) {
    if (args.empty()) throw ToolError(ToolErrorKind::CommandFailed, "empty argv");

    int out_pipe[2];
    int err_pipe[2];
    ExecReport report;
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw ToolError(ToolErrorKind::CommandFailed, "Failed to create pipes");
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw ToolError(ToolErrorKind::CommandFailed, "Failed to create pipes");
    }
    if (!report.open()) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        throw ToolError(ToolErrorKind::CommandFailed, "Failed to create pipes");
    }

    auto argv = to_argv(args);
    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        report.close_all();
        throw ToolError(ToolErrorKind::CommandFailed,
                        std::string("Failed to execute command: fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        close(report.fds[0]);
        close(out_pipe[0]);
        close(err_pipe[0]);
        redirect_stdin_devnull();
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);
        close(err_pipe[1]);
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) report.child_fail("chdir");
        execvp(argv[0], argv.data());
        report.child_fail("exec");
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    std::string launch_error = report.parent_collect();

    CommandOutput result;
    std::array<char, 4096> buffer;
    struct pollfd pfds[2];
    pfds[0] = {out_pipe[0], POLLIN, 0};
    pfds[1] = {err_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    int open_streams = 2;

    while (open_streams > 0) {
        int ret = poll(pfds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            ssize_t n = read(pfds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(pfds[i].fd);
                pfds[i].fd = -1;
                --open_streams;
            }
        }
    }
    for (auto& p : pfds) {
        if (p.fd >= 0) close(p.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (!launch_error.empty()) {
        throw ToolError(ToolErrorKind::CommandFailed, "Failed to execute command: " + launch_error);
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

ChildProcess spawn_with_input_pipe(const std::vector<std::string>& args,
                                   const std::string& working_dir,
                                   const std::string& output_path) {
    if (args.empty()) throw ToolError(ToolErrorKind::CommandFailed, "empty argv");
    ignore_sigpipe();

    int out_fd = ::open(output_path.empty() ? "/dev/null" : output_path.c_str(),
                        O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (out_fd < 0) {
        throw ToolError(ToolErrorKind::CommandFailed,
                        "cannot open terminal transcript " + output_path + ": " + std::strerror(errno));
    }

    int in_pipe[2];
    ExecReport report;
    if (pipe2(in_pipe, O_CLOEXEC) != 0) {
        close(out_fd);
        throw ToolError(ToolErrorKind::CommandFailed, "Failed to create pipes");
    }
    if (!report.open()) {
        close(out_fd);
        close(in_pipe[0]);
        close(in_pipe[1]);
        throw ToolError(ToolErrorKind::CommandFailed, "Failed to create pipes");
    }

    auto argv = to_argv(args);
    pid_t pid = fork();
    if (pid < 0) {
        close(out_fd);
        close(in_pipe[0]);
        close(in_pipe[1]);
        report.close_all();
        throw ToolError(ToolErrorKind::CommandFailed,
                        std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        setsid();
        close(report.fds[0]);
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_fd, STDOUT_FILENO);
        dup2(out_fd, STDERR_FILENO);
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) report.child_fail("chdir");
        execvp(argv[0], argv.data());
        report.child_fail("exec");
    }

    close(in_pipe[0]);
    close(out_fd);
    std::string launch_error = report.parent_collect();
    if (!launch_error.empty()) {
        close(in_pipe[1]);
        int status = 0;
        waitpid(pid, &status, 0);
        throw ToolError(ToolErrorKind::CommandFailed, args[0] + " spawn failed: " + launch_error);
    }
    return ChildProcess{pid, in_pipe[1]};
}

void spawn_detached(const std::vector<std::string>& args, const std::string& working_dir,
                    const std::string& output_path) {
    if (args.empty()) throw ToolError(ToolErrorKind::CommandFailed, "empty argv");

    ExecReport report;
    if (!report.open()) throw ToolError(ToolErrorKind::CommandFailed, "Failed to create pipes");

    auto argv = to_argv(args);
    pid_t pid = fork();
    if (pid < 0) {
        report.close_all();
        throw ToolError(ToolErrorKind::CommandFailed,
                        std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Intermediate child: start a new session, fork the real process and
        // exit so the grandchild is reparented and never becomes our zombie.
        setsid();
        close(report.fds[0]);
        pid_t grandchild = fork();
        if (grandchild < 0) report.child_fail("fork");
        if (grandchild > 0) _exit(0);

        redirect_stdin_devnull();
        int out_fd = output_path.empty()
            ? ::open("/dev/null", O_WRONLY)
            : ::open(output_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
        if (out_fd >= 0) {
            dup2(out_fd, STDOUT_FILENO);
            dup2(out_fd, STDERR_FILENO);
            close(out_fd);
        }
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) report.child_fail("chdir");
        execvp(argv[0], argv.data());
        report.child_fail("exec");
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    std::string launch_error = report.parent_collect();
    if (!launch_error.empty()) {
        throw ToolError(ToolErrorKind::CommandFailed, args[0] + " spawn failed: " + launch_error);
    }
}

bool is_process_alive(pid_t pid) {
    if (pid <= 0) return false;
    int status = 0;
    pid_t r = waitpid(pid, &status, WNOHANG);
    return r == 0;
}

bool write_all(int fd, const std::string& data) {
    ignore_sigpipe();
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        written += static_cast<size_t>(n);
    }
    return true;
}

void terminate_process(ChildProcess& child) {
    if (child.stdin_fd >= 0) {
        close(child.stdin_fd);
        child.stdin_fd = -1;
    }
    if (child.pid > 0) {
        kill(child.pid, SIGKILL);
        int status = 0;
        waitpid(child.pid, &status, 0);
        child.pid = -1;
    }
}

void release_process(ChildProcess& child) {
    if (child.stdin_fd >= 0) {
        close(child.stdin_fd);
        child.stdin_fd = -1;
    }
    if (child.pid > 0) {
        int status = 0;
        waitpid(child.pid, &status, WNOHANG);
        child.pid = -1;
    }
}

std::string find_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : std::string();
    }
    const char* path_env = std::getenv("PATH");
    if (!path_env) return {};
    for (const auto& dir : split(path_env, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return {};
}

} // namespace toolgate
