#include "handlers/terminal_manager.hpp"

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include "core/config/durations.hpp"
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "core/process/subprocess.hpp"

namespace acpbridge::handlers {

using core::errors::invalid_params;
using nlohmann::json;

struct TerminalManager::Terminal {
    std::string id;
    pid_t pid = -1;
    int output_fd = -1;

    mutable std::mutex mutex;
    mutable std::condition_variable exited_cv;
    std::string output;
    bool done = false;
    ExitStatus status;

    std::atomic_bool abandoned{false};
    std::thread pump;

    ~Terminal() { core::process::close_fd(output_fd); }

    void mark_exited(const core::process::WaitOutcome& outcome) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (done) {
                return;
            }
            done = true;
            status.exit_code = outcome.exit_code;
            if (outcome.signal != 0) {
                status.signal = outcome.signal;
            }
        }
        exited_cv.notify_all();
    }

    // Drains output and reaps the child. Keeps draining after exit until the
    // pipe closes, since grandchildren may still hold it open.
    void pump_loop() {
        core::process::set_nonblocking(output_fd);
        bool output_open = true;
        bool child_exited = false;
        char buffer[4096];

        const auto drain = [&]() {
            while (output_open) {
                const ssize_t n = ::read(output_fd, buffer, sizeof(buffer));
                if (n > 0) {
                    std::lock_guard<std::mutex> lock(mutex);
                    output.append(buffer, static_cast<std::size_t>(n));
                    continue;
                }
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    break;
                }
                output_open = false;
            }
        };

        while (!abandoned.load() && (output_open || !child_exited)) {
            if (output_open) {
                pollfd fd{output_fd, POLLIN, 0};
                static_cast<void>(poll(&fd, 1, 50));
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            drain();

            if (!child_exited) {
                const auto outcome =
                    core::process::wait_for(pid, std::chrono::milliseconds(0));
                if (outcome.state != core::process::WaitState::Running) {
                    child_exited = true;
                    // Whatever the child wrote before exiting is in the pipe now.
                    drain();
                    mark_exited(outcome);
                }
            }
        }
    }
};

TerminalManager::~TerminalManager() {
    release_all();
}

core::errors::Result<std::string> TerminalManager::create(
    const std::vector<std::string>& command,
    const std::optional<std::filesystem::path>& cwd) {
    if (command.empty()) {
        return invalid_params("command list cannot be empty");
    }

    core::process::SpawnOptions options;
    options.argv = command;
    options.working_directory = cwd;
    options.pipe_stdin = false;
    options.merge_stderr = true;

    auto spawned = core::process::spawn_process(options);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    const auto& process = core::errors::get_value(spawned);

    auto terminal = std::make_shared<Terminal>();
    terminal->pid = process.pid;
    terminal->output_fd = process.stdout_fd;

    std::string terminal_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        do {
            terminal_id = core::config::generate_id("term");
        } while (terminals_.find(terminal_id) != terminals_.end());
        terminal->id = terminal_id;
        terminals_.emplace(terminal_id, terminal);
    }
    terminal->pump = std::thread([terminal]() { terminal->pump_loop(); });

    LOG_INFO("TerminalManager: " + terminal_id + " started " + command.front() + " (pid " +
             std::to_string(process.pid) + ")");
    return terminal_id;
}

core::errors::Result<std::shared_ptr<TerminalManager::Terminal>> TerminalManager::find(
    const std::string& terminal_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = terminals_.find(terminal_id);
    if (it == terminals_.end()) {
        return core::errors::not_found("Terminal not found: " + terminal_id,
                                       "terminal_not_found");
    }
    return it->second;
}

core::errors::Result<TerminalOutput> TerminalManager::output(
    const std::string& terminal_id) const {
    auto found = find(terminal_id);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const auto& terminal = core::errors::get_value(found);

    std::lock_guard<std::mutex> lock(terminal->mutex);
    TerminalOutput result;
    result.output = terminal->output;
    result.done = terminal->done;
    if (terminal->done) {
        result.exit_code = terminal->status.exit_code;
    }
    return result;
}

core::errors::Result<ExitStatus> TerminalManager::wait_for_exit(
    const std::string& terminal_id,
    const std::optional<std::chrono::milliseconds> timeout) const {
    auto found = find(terminal_id);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const auto& terminal = core::errors::get_value(found);

    std::unique_lock<std::mutex> lock(terminal->mutex);
    if (timeout.has_value()) {
        const bool exited = terminal->exited_cv.wait_for(
            lock, *timeout, [&terminal]() { return terminal->done; });
        if (!exited) {
            return core::errors::timed_out("Terminal wait timed out after " +
                                           std::to_string(timeout->count()) + " ms");
        }
    } else {
        terminal->exited_cv.wait(lock, [&terminal]() { return terminal->done; });
    }
    return terminal->status;
}

core::errors::Result<bool> TerminalManager::kill(const std::string& terminal_id) const {
    auto found = find(terminal_id);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const auto& terminal = core::errors::get_value(found);

    {
        std::lock_guard<std::mutex> lock(terminal->mutex);
        if (terminal->done) {
            return true;
        }
    }
    // The child leads its own process group, so this reaches its children too.
    if (::kill(-terminal->pid, SIGTERM) != 0 && errno != ESRCH) {
        LOG_WARN("TerminalManager: failed to signal " + terminal_id);
    }
    return true;
}

core::errors::Result<bool> TerminalManager::release(const std::string& terminal_id) {
    std::shared_ptr<Terminal> terminal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = terminals_.find(terminal_id);
        if (it == terminals_.end()) {
            return core::errors::not_found("Terminal not found: " + terminal_id,
                                           "terminal_not_found");
        }
        terminal = it->second;
        terminals_.erase(it);
    }

    bool running = false;
    {
        std::lock_guard<std::mutex> lock(terminal->mutex);
        running = !terminal->done;
    }
    if (running) {
        static_cast<void>(::kill(-terminal->pid, SIGKILL));
    }
    terminal->abandoned.store(true);
    if (terminal->pump.joinable()) {
        terminal->pump.join();
    }
    if (running) {
        terminal->mark_exited(
            core::process::wait_for(terminal->pid, std::chrono::milliseconds(2000)));
    }

    LOG_DEBUG("TerminalManager: released " + terminal_id);
    return true;
}

void TerminalManager::release_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : terminals_) {
            ids.push_back(entry.first);
        }
    }
    for (const auto& id : ids) {
        static_cast<void>(release(id));
    }
}

std::size_t TerminalManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminals_.size();
}

namespace {

core::errors::Result<std::string> require_terminal_id(const json& params) {
    if (!params.is_object() || !params.contains("terminalId")) {
        return invalid_params("Missing required parameter: terminalId");
    }
    if (!params.at("terminalId").is_string()) {
        return invalid_params("terminalId must be a string");
    }
    return params.at("terminalId").get<std::string>();
}

json success_payload() {
    return json{{"success", true}};
}

}  // namespace

core::errors::Result<json> TerminalManager::handle_create(const json& params) {
    if (!params.is_object() || !params.contains("command")) {
        return invalid_params("Missing required parameter: command");
    }
    const json& command = params.at("command");
    if (!command.is_array()) {
        return invalid_params("command must be a list of strings");
    }
    if (command.empty()) {
        return invalid_params("command list cannot be empty");
    }

    std::vector<std::string> argv;
    for (const auto& arg : command) {
        if (!arg.is_string()) {
            return invalid_params("command must be a list of strings");
        }
        argv.push_back(arg.get<std::string>());
    }

    std::optional<std::filesystem::path> cwd;
    const auto cwd_it = params.find("cwd");
    if (cwd_it != params.end() && !cwd_it->is_null()) {
        if (!cwd_it->is_string()) {
            return invalid_params("cwd must be a string");
        }
        cwd = cwd_it->get<std::string>();
    }

    auto created = create(argv, cwd);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    return json{{"terminalId", core::errors::get_value(created)}};
}

core::errors::Result<json> TerminalManager::handle_output(const json& params) const {
    auto id = require_terminal_id(params);
    if (core::errors::is_error(id)) {
        return core::errors::get_error(id);
    }
    auto result = output(core::errors::get_value(id));
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& captured = core::errors::get_value(result);
    json payload;
    payload["output"] = captured.output;
    payload["done"] = captured.done;
    if (captured.exit_code.has_value()) {
        payload["exitCode"] = *captured.exit_code;
    }
    return payload;
}

core::errors::Result<json> TerminalManager::handle_wait_for_exit(const json& params) const {
    auto id = require_terminal_id(params);
    if (core::errors::is_error(id)) {
        return core::errors::get_error(id);
    }

    std::optional<std::chrono::milliseconds> timeout;
    const auto timeout_it = params.find("timeout");
    if (timeout_it != params.end() && !timeout_it->is_null()) {
        if (!timeout_it->is_number() || timeout_it->get<double>() < 0) {
            return invalid_params("timeout must be a non-negative number of seconds");
        }
        timeout = core::config::seconds_to_millis(timeout_it->get<double>());
    }

    auto result = wait_for_exit(core::errors::get_value(id), timeout);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& status = core::errors::get_value(result);
    json payload;
    payload["exitCode"] = status.exit_code;
    payload["signal"] = status.signal.has_value() ? json(*status.signal) : json(nullptr);
    return payload;
}

core::errors::Result<json> TerminalManager::handle_kill(const json& params) const {
    auto id = require_terminal_id(params);
    if (core::errors::is_error(id)) {
        return core::errors::get_error(id);
    }
    auto killed = kill(core::errors::get_value(id));
    if (core::errors::is_error(killed)) {
        return core::errors::get_error(killed);
    }
    return success_payload();
}

core::errors::Result<json> TerminalManager::handle_release(const json& params) {
    auto id = require_terminal_id(params);
    if (core::errors::is_error(id)) {
        return core::errors::get_error(id);
    }
    auto released = release(core::errors::get_value(id));
    if (core::errors::is_error(released)) {
        return core::errors::get_error(released);
    }
    return success_payload();
}

}  // namespace acpbridge::handlers
