#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "client/protocol_client.hpp"
#include "core/config/adapter_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "handlers/callback_handlers.hpp"
#include "protocol/tool_response.hpp"
#include "session/session.hpp"

namespace acpbridge::adapter {

// Drives one ACP-compliant agent for the orchestration loop: lazy handshake,
// prompt turns, callback routing, shutdown.
class AcpAdapter {
public:
    // Throws std::invalid_argument for an unrecognized permission mode.
    explicit AcpAdapter(core::config::AdapterConfig config = {},
                        handlers::PermissionLogFn on_permission_log = nullptr,
                        handlers::TerminalPrompt prompt = handlers::TerminalPrompt::standard());
    ~AcpAdapter();

    AcpAdapter(const AcpAdapter&) = delete;
    AcpAdapter& operator=(const AcpAdapter&) = delete;

    const std::string& name() const { return name_; }
    const core::config::AdapterConfig& config() const { return config_; }

    // True iff the agent command resolves on PATH. No side effects.
    bool check_availability() const;
    bool available() const { return available_; }
    std::string describe() const;

    // initialize + session/new. Idempotent; returns the session id.
    core::errors::Result<std::string> initialize();

    // Never throws. Every outcome is folded into the response.
    protocol::ToolResponse execute(const std::string& prompt,
                                   const protocol::ExecuteOptions& options = {});
    std::future<protocol::ToolResponse> execute_async(std::string prompt,
                                                      protocol::ExecuteOptions options = {});

    void shutdown();

    // Async-signal-safe: no allocation, no locks. SIGTERM, short grace, SIGKILL.
    void kill_subprocess_sync() noexcept;

    // The protocol carries no billing metadata.
    double estimate_cost(const std::string& prompt) const;

    bool is_initialized() const;
    std::optional<std::string> session_id() const;
    std::shared_ptr<const session::Session> session() const;

    nlohmann::json permission_stats() const;
    std::vector<handlers::DecisionRecord> permission_history() const;
    void clear_permission_history();

    // Routes SIGINT/SIGTERM to kill_subprocess_sync, then to the previous
    // disposition. Only one adapter can own the handlers at a time.
    void install_signal_handlers();
    void restore_signal_handlers();
    bool shutdown_requested() const { return shutdown_requested_.load(); }

    static std::string enhance_prompt(const std::string& prompt);

private:
    struct SessionSink;

    core::errors::Result<nlohmann::json> call(client::ProtocolClient& client,
                                              const std::string& method,
                                              const nlohmann::json& params,
                                              std::chrono::milliseconds timeout);
    core::errors::Result<std::string> handshake(client::ProtocolClient& client);
    protocol::ToolResponse run_turn(const std::string& prompt,
                                    std::chrono::milliseconds timeout);
    protocol::ToolResponse failure(const std::string& message) const;
    nlohmann::json base_metadata() const;
    std::chrono::milliseconds timeout_for(const protocol::ExecuteOptions& options) const;

    const std::string name_ = "acp";
    core::config::AdapterConfig config_;
    bool available_ = false;
    std::shared_ptr<handlers::CallbackHandlers> callbacks_;
    std::shared_ptr<SessionSink> sink_;

    mutable std::mutex mutex_;
    std::shared_ptr<client::ProtocolClient> client_;
    std::shared_ptr<session::Session> session_;
    bool initialized_ = false;

    // One prompt turn at a time.
    std::mutex turn_mutex_;

    std::atomic<pid_t> agent_pid_{-1};
    std::atomic_bool shutdown_requested_{false};
    bool signal_handlers_installed_ = false;
};

}  // namespace acpbridge::adapter
