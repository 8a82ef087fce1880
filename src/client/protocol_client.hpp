#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace acpbridge::client {

enum class ClientState {
    NotStarted,
    Running,
    Stopped
};

using CallResult = core::errors::Result<nlohmann::json>;

// Completion handle for one outstanding request. Resolved exactly once, with
// the agent's result or with an error (agent error reply, write failure,
// subprocess termination, client stop).
using PendingCall = std::future<CallResult>;

using NotificationHandler =
    std::function<void(const std::string& method, const nlohmann::json& params)>;

// Returns std::nullopt to pass the request on to the next handler.
using RequestHandler = std::function<std::optional<CallResult>(
    const std::string& method, const nlohmann::json& params)>;

struct ClientOptions {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> working_directory;
    std::chrono::milliseconds worker_grace{2000};
    std::chrono::milliseconds terminate_grace{5000};
};

// Owns one agent subprocess speaking newline-delimited JSON-RPC on stdio.
// A single reader thread drains stdout; a single writer thread owns stdin.
class ProtocolClient {
public:
    explicit ProtocolClient(ClientOptions options);
    ~ProtocolClient();

    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    // Spawns the subprocess and the worker threads. Returns the child pid.
    core::errors::Result<pid_t> start();

    PendingCall send_request(const std::string& method, const nlohmann::json& params);

    // Fire-and-forget. Returns false if the client is not running.
    bool send_notification(const std::string& method, const nlohmann::json& params);

    void on_notification(NotificationHandler handler);
    void on_request(RequestHandler handler);

    // Idempotent. Every wait inside is bounded.
    void stop();

    ClientState state() const;
    bool is_running() const;
    pid_t pid() const;
    std::size_t pending_count() const;

    // Waits for a handle with a deadline. A timeout leaves the call pending.
    static std::optional<CallResult> wait(PendingCall& call,
                                          std::chrono::milliseconds timeout);

private:
    struct Shared;

    ClientOptions options_;
    std::shared_ptr<Shared> shared_;
    std::thread reader_;
    std::thread writer_;
    std::mutex lifecycle_mutex_;
};

}  // namespace acpbridge::client
