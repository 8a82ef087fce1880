#include "client/protocol_client.hpp"

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <deque>
#include <exception>
#include <poll.h>
#include <unistd.h>
#include <unordered_map>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/process/subprocess.hpp"
#include "protocol/message_codec.hpp"

namespace acpbridge::client {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::RequestId;

namespace {

constexpr int kPollIntervalMs = 100;

struct Outgoing {
    std::string line;
    std::optional<RequestId> request_id;
};

BridgeError transport_error(const std::string& message, const std::string& code) {
    return BridgeError{ErrorCategory::Transport, message, code, "",
                       core::errors::rpc::kInternalError};
}

PendingCall ready_call(CallResult result) {
    std::promise<CallResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

// Reads whatever is available without blocking. Returns false once the pipe
// reached EOF or failed.
bool drain_pipe(const int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

template <typename Fn>
void for_each_line(std::string& buffer, Fn&& fn) {
    std::size_t pos = 0;
    while ((pos = buffer.find('\n')) != std::string::npos) {
        std::string line = buffer.substr(0, pos);
        buffer.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        fn(line);
    }
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

struct ProtocolClient::Shared : std::enable_shared_from_this<ProtocolClient::Shared> {
    protocol::MessageCodec codec;

    std::atomic<ClientState> state{ClientState::NotStarted};
    std::atomic_bool stop_requested{false};
    std::atomic_bool worker_exited{false};
    std::atomic<pid_t> pid{-1};

    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;

    mutable std::mutex pending_mutex;
    std::unordered_map<RequestId, std::promise<CallResult>> pending;
    bool accepting = false;

    std::mutex handlers_mutex;
    std::vector<NotificationHandler> notification_handlers;
    std::vector<RequestHandler> request_handlers;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<Outgoing> queue;
    bool queue_closed = false;

    // Serializes access to stdin so lines never interleave.
    std::mutex write_mutex;

    std::mutex inflight_mutex;
    std::condition_variable inflight_cv;
    std::size_t inflight_requests = 0;

    std::promise<void> reader_done;
    std::promise<void> writer_done;

    ~Shared() {
        core::process::close_fd(stdin_fd);
        core::process::close_fd(stdout_fd);
        core::process::close_fd(stderr_fd);
    }

    bool register_pending(const RequestId id, std::promise<CallResult> promise) {
        std::lock_guard<std::mutex> lock(pending_mutex);
        if (!accepting) {
            return false;
        }
        pending.emplace(id, std::move(promise));
        return true;
    }

    // Pops before resolving so a second resolution for the same id is a no-op.
    bool resolve(const RequestId id, CallResult result) {
        std::promise<CallResult> promise;
        {
            std::lock_guard<std::mutex> lock(pending_mutex);
            auto it = pending.find(id);
            if (it == pending.end()) {
                return false;
            }
            promise = std::move(it->second);
            pending.erase(it);
        }
        promise.set_value(std::move(result));
        return true;
    }

    // Our requests only ever carry integer ids.
    bool resolve_wire(const protocol::MessageId& id, CallResult result) {
        const auto* number = std::get_if<std::int64_t>(&id);
        return number != nullptr && resolve(*number, std::move(result));
    }

    void fail_all(const BridgeError& error) {
        std::unordered_map<RequestId, std::promise<CallResult>> orphaned;
        {
            std::lock_guard<std::mutex> lock(pending_mutex);
            accepting = false;
            orphaned.swap(pending);
        }
        if (!orphaned.empty()) {
            LOG_WARN("ProtocolClient: failing " + std::to_string(orphaned.size()) +
                     " pending call(s): " + error.message);
        }
        for (auto& entry : orphaned) {
            entry.second.set_value(error);
        }
    }

    bool enqueue(std::string line, const std::optional<RequestId> request_id) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            if (queue_closed) {
                return false;
            }
            queue.push_back(Outgoing{std::move(line), request_id});
        }
        queue_cv.notify_one();
        return true;
    }

    void close_queue() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            queue_closed = true;
        }
        queue_cv.notify_all();
    }

    void writer_loop() {
        while (true) {
            Outgoing item;
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                queue_cv.wait(lock, [this]() { return queue_closed || !queue.empty(); });
                if (queue.empty()) {
                    break;
                }
                item = std::move(queue.front());
                queue.pop_front();
            }

            bool written = false;
            {
                std::lock_guard<std::mutex> lock(write_mutex);
                written = stdin_fd >= 0 &&
                          core::process::write_all(stdin_fd, item.line + "\n");
            }
            if (written) {
                continue;
            }

            LOG_WARN("ProtocolClient: write to agent stdin failed");
            if (item.request_id.has_value()) {
                resolve(*item.request_id,
                        transport_error("Failed to write request to agent subprocess.",
                                        "write_failed"));
            }
        }
        writer_done.set_value();
    }

    void reader_loop() {
        core::process::set_nonblocking(stdout_fd);
        if (stderr_fd >= 0) {
            core::process::set_nonblocking(stderr_fd);
        }

        std::string out_buffer;
        std::string err_buffer;
        bool out_open = true;
        bool err_open = stderr_fd >= 0;

        while (!stop_requested.load() && out_open) {
            pollfd fds[2];
            nfds_t nfds = 0;
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
            if (err_open) {
                fds[nfds].fd = stderr_fd;
                fds[nfds].events = POLLIN;
                ++nfds;
            }
            static_cast<void>(poll(fds, nfds, kPollIntervalMs));

            out_open = drain_pipe(stdout_fd, out_buffer);
            if (err_open) {
                err_open = drain_pipe(stderr_fd, err_buffer);
                for_each_line(err_buffer, [](const std::string& line) {
                    LOG_DEBUG("agent stderr: " + line);
                });
            }

            for_each_line(out_buffer, [this](const std::string& line) {
                if (!stop_requested.load() && !is_blank(line)) {
                    dispatch(line);
                }
            });
        }

        if (!stop_requested.load() && !is_blank(out_buffer)) {
            dispatch(out_buffer);
        }

        LOG_DEBUG("ProtocolClient: reader exiting");
        worker_exited.store(true);
        fail_all(transport_error("Agent subprocess terminated.", "subprocess_terminated"));
        reader_done.set_value();
    }

    void dispatch(const std::string& line) {
        auto parsed = codec.parse_line(line);
        if (core::errors::is_error(parsed)) {
            LOG_WARN("ProtocolClient: skipping malformed line: " +
                     core::errors::get_error(parsed).message);
            return;
        }
        const protocol::Message& message = core::errors::get_value(parsed);

        if (const auto* response = std::get_if<protocol::Response>(&message)) {
            if (!resolve_wire(response->id, response->result)) {
                LOG_DEBUG("ProtocolClient: dropping response for unknown id " +
                          protocol::to_string(response->id));
            }
            return;
        }

        if (const auto* error = std::get_if<protocol::ErrorMessage>(&message)) {
            BridgeError failure{ErrorCategory::Protocol, error->message, "agent_error", "",
                                error->code};
            if (!resolve_wire(error->id, failure)) {
                LOG_DEBUG("ProtocolClient: dropping error for unknown id " +
                          protocol::to_string(error->id));
            }
            return;
        }

        if (const auto* notification = std::get_if<protocol::Notification>(&message)) {
            std::vector<NotificationHandler> handlers;
            {
                std::lock_guard<std::mutex> lock(handlers_mutex);
                handlers = notification_handlers;
            }
            for (const auto& handler : handlers) {
                try {
                    handler(notification->method, notification->params);
                } catch (const std::exception& e) {
                    LOG_ERROR("ProtocolClient: notification handler failed for " +
                              notification->method + ": " + e.what());
                } catch (...) {
                    LOG_ERROR("ProtocolClient: notification handler failed for " +
                              notification->method + ": unknown exception");
                }
            }
            return;
        }

        // Agent -> orchestrator call. Handlers may block (interactive prompt,
        // terminal waits), so they run off the reader thread.
        const auto& request = std::get<protocol::Request>(message);
        {
            std::lock_guard<std::mutex> lock(inflight_mutex);
            ++inflight_requests;
        }
        std::thread([self = shared_from_this(), request]() {
            self->handle_request(request);
        }).detach();
    }

    void handle_request(const protocol::Request& request) {
        std::vector<RequestHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex);
            handlers = request_handlers;
        }

        std::optional<CallResult> outcome;
        for (const auto& handler : handlers) {
            try {
                outcome = handler(request.method, request.params);
            } catch (const std::exception& e) {
                LOG_ERROR("ProtocolClient: request handler failed for " + request.method +
                          ": " + e.what());
                outcome = core::errors::internal(e.what(), "handler_failed");
            } catch (...) {
                LOG_ERROR("ProtocolClient: request handler failed for " + request.method +
                          ": unknown exception");
                outcome = core::errors::internal("Request handler failed.", "handler_failed");
            }
            if (outcome.has_value()) {
                break;
            }
        }

        if (!outcome.has_value()) {
            outcome = BridgeError{ErrorCategory::Input,
                                  "Method not found: " + request.method,
                                  "method_not_found", "",
                                  core::errors::rpc::kMethodNotFound};
        }

        std::string line;
        if (core::errors::is_error(*outcome)) {
            const auto& error = core::errors::get_error(*outcome);
            line = codec.encode_error(request.id, error.rpc_code, error.message);
        } else {
            line = codec.encode_response(request.id, core::errors::get_value(*outcome));
        }
        if (!enqueue(std::move(line), std::nullopt)) {
            LOG_DEBUG("ProtocolClient: client stopped before reply to " + request.method);
        }

        {
            std::lock_guard<std::mutex> lock(inflight_mutex);
            --inflight_requests;
        }
        inflight_cv.notify_all();
    }
};

ProtocolClient::ProtocolClient(ClientOptions options)
    : options_(std::move(options)), shared_(std::make_shared<Shared>()) {}

ProtocolClient::~ProtocolClient() {
    stop();
}

core::errors::Result<pid_t> ProtocolClient::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    const ClientState current = shared_->state.load();
    if (current == ClientState::Running) {
        return BridgeError{ErrorCategory::Input, "ACP client is already running.",
                           "already_running"};
    }
    if (current == ClientState::Stopped) {
        return BridgeError{ErrorCategory::Input, "ACP client was stopped and cannot restart.",
                           "client_stopped"};
    }

    core::process::ignore_sigpipe();

    core::process::SpawnOptions spawn_options;
    spawn_options.argv.push_back(options_.command);
    spawn_options.argv.insert(spawn_options.argv.end(), options_.args.begin(),
                              options_.args.end());
    spawn_options.working_directory = options_.working_directory;

    auto spawned = core::process::spawn_process(spawn_options);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    const auto& process = core::errors::get_value(spawned);

    shared_->stdin_fd = process.stdin_fd;
    shared_->stdout_fd = process.stdout_fd;
    shared_->stderr_fd = process.stderr_fd;
    shared_->pid.store(process.pid);
    {
        std::lock_guard<std::mutex> pending_lock(shared_->pending_mutex);
        shared_->accepting = true;
    }
    shared_->state.store(ClientState::Running);

    auto shared = shared_;
    reader_ = std::thread([shared]() { shared->reader_loop(); });
    writer_ = std::thread([shared]() { shared->writer_loop(); });

    LOG_INFO("ProtocolClient: started " + options_.command + " (pid " +
             std::to_string(process.pid) + ")");
    return process.pid;
}

PendingCall ProtocolClient::send_request(const std::string& method, const json& params) {
    if (shared_->state.load() != ClientState::Running) {
        return ready_call(
            transport_error("ACP client is not running.", "client_not_running"));
    }

    auto encoded = shared_->codec.encode_request(method, params);
    std::promise<CallResult> promise;
    PendingCall call = promise.get_future();
    if (!shared_->register_pending(encoded.id, std::move(promise))) {
        return ready_call(
            transport_error("Agent subprocess terminated.", "subprocess_terminated"));
    }

    if (!shared_->enqueue(std::move(encoded.line), encoded.id)) {
        shared_->resolve(encoded.id,
                         transport_error("ACP client is shutting down.", "client_stopped"));
    }
    return call;
}

bool ProtocolClient::send_notification(const std::string& method, const json& params) {
    if (shared_->state.load() != ClientState::Running) {
        return false;
    }
    return shared_->enqueue(shared_->codec.encode_notification(method, params),
                            std::nullopt);
}

void ProtocolClient::on_notification(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(shared_->handlers_mutex);
    shared_->notification_handlers.push_back(std::move(handler));
}

void ProtocolClient::on_request(RequestHandler handler) {
    std::lock_guard<std::mutex> lock(shared_->handlers_mutex);
    shared_->request_handlers.push_back(std::move(handler));
}

void ProtocolClient::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shared_->state.load() != ClientState::Running) {
        shared_->state.store(ClientState::Stopped);
        return;
    }
    shared_->state.store(ClientState::Stopped);

    // 1. Cancel the reader with a bounded wait.
    shared_->stop_requested.store(true);
    auto reader_done = shared_->reader_done.get_future();
    if (reader_done.wait_for(options_.worker_grace) != std::future_status::ready) {
        LOG_WARN("ProtocolClient: reader did not stop within grace period");
    }

    // 2. Terminate the subprocess, escalating to SIGKILL.
    const pid_t pid = shared_->pid.exchange(-1);
    if (pid > 0) {
        const auto outcome =
            core::process::terminate(pid, options_.terminate_grace, true);
        if (outcome.state == core::process::WaitState::Exited) {
            LOG_INFO("ProtocolClient: agent exited with code " +
                     std::to_string(outcome.exit_code));
        }
    }

    // 3. Let the writer drain what it can into the dead pipe, then stop it.
    shared_->close_queue();
    auto writer_done = shared_->writer_done.get_future();
    const bool writer_stopped =
        writer_done.wait_for(options_.worker_grace) == std::future_status::ready;
    const bool reader_stopped =
        reader_done.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;

    if (reader_.joinable()) {
        if (reader_stopped) {
            reader_.join();
        } else {
            reader_.detach();
        }
    }
    if (writer_.joinable()) {
        if (writer_stopped) {
            writer_.join();
        } else {
            LOG_WARN("ProtocolClient: writer did not stop within grace period");
            writer_.detach();
        }
    }

    // 4. Give in-flight callback handlers a bounded chance to finish.
    {
        std::unique_lock<std::mutex> inflight_lock(shared_->inflight_mutex);
        shared_->inflight_cv.wait_for(inflight_lock, options_.worker_grace, [this]() {
            return shared_->inflight_requests == 0;
        });
    }

    shared_->fail_all(transport_error("ACP client stopped.", "client_stopped"));
    LOG_INFO("ProtocolClient: stopped");
}

ClientState ProtocolClient::state() const {
    return shared_->state.load();
}

bool ProtocolClient::is_running() const {
    return shared_->state.load() == ClientState::Running && !shared_->worker_exited.load();
}

pid_t ProtocolClient::pid() const {
    return shared_->pid.load();
}

std::size_t ProtocolClient::pending_count() const {
    std::lock_guard<std::mutex> lock(shared_->pending_mutex);
    return shared_->pending.size();
}

std::optional<CallResult> ProtocolClient::wait(PendingCall& call,
                                               const std::chrono::milliseconds timeout) {
    if (!call.valid()) {
        return std::nullopt;
    }
    if (call.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return call.get();
}

}  // namespace acpbridge::client
