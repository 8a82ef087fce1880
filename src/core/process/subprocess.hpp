#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include "core/errors/bridge_errors.hpp"

namespace acpbridge::core::process {

struct SpawnOptions {
    std::vector<std::string> argv;
    std::optional<std::filesystem::path> working_directory;
    bool pipe_stdin = true;
    // Route stderr into the stdout pipe instead of a separate one.
    bool merge_stderr = false;
    bool new_process_group = true;
};

struct SpawnedProcess {
    pid_t pid = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

enum class WaitState {
    Exited,
    Running,
    Gone
};

struct WaitOutcome {
    WaitState state = WaitState::Running;
    int exit_code = -1;
    int signal = 0;
};

// fork/exec with piped stdio. Exec and chdir failures are reported
// synchronously through a close-on-exec status pipe.
core::errors::Result<SpawnedProcess> spawn_process(const SpawnOptions& options);

// True if command is an executable path or resolves on $PATH.
bool find_executable(const std::string& command);

// Non-blocking reap when timeout is zero, otherwise polls until the deadline.
WaitOutcome wait_for(pid_t pid, std::chrono::milliseconds timeout);

// SIGTERM, wait up to grace, then SIGKILL and reap.
WaitOutcome terminate(pid_t pid, std::chrono::milliseconds grace, bool process_group);

void set_nonblocking(int fd);
void close_fd(int& fd);

// Writes the whole buffer, retrying on EINTR. Returns false on EPIPE and other errors.
bool write_all(int fd, const std::string& data);

// Makes writes to a closed pipe fail with EPIPE instead of killing the process.
void ignore_sigpipe();

}  // namespace acpbridge::core::process
