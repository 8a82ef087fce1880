#include "core/process/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace acpbridge::core::process {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

enum class ChildStage : int {
    Chdir = 1,
    Exec = 2
};

struct ChildFailure {
    int stage = 0;
    int error = 0;
};

void child_report_and_exit(const int status_fd, const ChildStage stage) {
    ChildFailure failure{static_cast<int>(stage), errno};
    static_cast<void>(::write(status_fd, &failure, sizeof(failure)));
    _exit(127);
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

WaitOutcome decode_status(const int status) {
    WaitOutcome outcome;
    outcome.state = WaitState::Exited;
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.signal = WTERMSIG(status);
        outcome.exit_code = 128 + outcome.signal;
    }
    return outcome;
}

bool is_executable_file(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

}  // namespace

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

bool write_all(const int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
    return true;
}

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        static_cast<void>(sigaction(SIGPIPE, &action, nullptr));
    });
}

bool find_executable(const std::string& command) {
    if (command.empty()) {
        return false;
    }
    if (command.find('/') != std::string::npos) {
        return is_executable_file(command);
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }
    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        if (is_executable_file(dir + "/" + command)) {
            return true;
        }
    }
    return false;
}

core::errors::Result<SpawnedProcess> spawn_process(const SpawnOptions& options) {
    if (options.argv.empty() || options.argv.front().empty()) {
        return core::errors::invalid_params("Command cannot be empty.");
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    const bool pipes_ok =
        (!options.pipe_stdin || pipe2(stdin_pipe, O_CLOEXEC) == 0) &&
        pipe2(stdout_pipe, O_CLOEXEC) == 0 &&
        (options.merge_stderr || pipe2(stderr_pipe, O_CLOEXEC) == 0) &&
        pipe2(status_pipe, O_CLOEXEC) == 0;
    if (!pipes_ok) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return core::errors::internal("Failed to create process pipes.",
                                      "pipe_creation_failed");
    }

    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string cwd =
        options.working_directory.has_value() ? options.working_directory->string() : "";

    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return core::errors::internal("Failed to fork process.", "fork_failed");
    }

    if (pid == 0) {
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        if (options.new_process_group) {
            static_cast<void>(setpgid(0, 0));
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            child_report_and_exit(status_pipe[1], ChildStage::Chdir);
        }
        if (options.pipe_stdin) {
            static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        } else {
            const int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                static_cast<void>(dup2(devnull, STDIN_FILENO));
                static_cast<void>(::close(devnull));
            }
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(
            dup2(options.merge_stderr ? stdout_pipe[1] : stderr_pipe[1], STDERR_FILENO));
        // Every pipe end is close-on-exec; dup2 clears the flag on 0/1/2 only.
        execvp(argv[0], argv.data());
        child_report_and_exit(status_pipe[1], ChildStage::Exec);
    }

    close_fd(status_pipe[1]);
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);

    ChildFailure failure;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);

        const std::string reason = std::strerror(failure.error);
        if (failure.stage == static_cast<int>(ChildStage::Chdir)) {
            return core::errors::invalid_params("Working directory is not usable: " +
                                                cwd + " (" + reason + ")");
        }
        if (failure.error == ENOENT) {
            return core::errors::not_found("Command not found: " + options.argv.front(),
                                           "command_not_found");
        }
        return BridgeError{ErrorCategory::Resource,
                           "Failed to execute " + options.argv.front() + ": " + reason,
                           "exec_failed", "", core::errors::rpc::kInternalError};
    }

    SpawnedProcess spawned;
    spawned.pid = pid;
    spawned.stdin_fd = stdin_pipe[1];
    spawned.stdout_fd = stdout_pipe[0];
    spawned.stderr_fd = stderr_pipe[0];
    return spawned;
}

WaitOutcome wait_for(const pid_t pid, const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int status = 0;
        const pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return decode_status(status);
        }
        if (waited < 0 && errno != EINTR) {
            // Reaped elsewhere (for example by the signal-safe kill path).
            WaitOutcome gone;
            gone.state = WaitState::Gone;
            return gone;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return WaitOutcome{};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

WaitOutcome terminate(const pid_t pid, const std::chrono::milliseconds grace,
                      const bool process_group) {
    const pid_t target = process_group ? -pid : pid;
    static_cast<void>(kill(target, SIGTERM));
    WaitOutcome outcome = wait_for(pid, grace);
    if (outcome.state != WaitState::Running) {
        return outcome;
    }

    static_cast<void>(kill(target, SIGKILL));
    // SIGKILL cannot be caught, so this wait is short in practice.
    return wait_for(pid, std::chrono::milliseconds(2000));
}

}  // namespace acpbridge::core::process
