#include "adapter/acp_adapter.hpp"

#include <cerrno>
#include <filesystem>
#include <csignal>
#include <ctime>
#include <exception>
#include <sys/wait.h>
#include <utility>
#include "core/config/durations.hpp"
#include "core/logging/logger.hpp"
#include "core/process/subprocess.hpp"
#include "protocol/acp_methods.hpp"

namespace acpbridge::adapter {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ToolResponse;
namespace methods = protocol::methods;

static_assert(std::atomic<pid_t>::is_always_lock_free,
              "kill_subprocess_sync relies on a lock-free pid");

namespace {

constexpr int kKillGraceSteps = 60;  // 60 x 50ms
constexpr long kKillStepNanos = 50L * 1000L * 1000L;
constexpr std::chrono::milliseconds kCancelGrace{2000};

std::atomic<AcpAdapter*> g_signal_target{nullptr};
struct sigaction g_previous_sigint {};
struct sigaction g_previous_sigterm {};

extern "C" void handle_shutdown_signal(int signum) {
    const int saved_errno = errno;
    AcpAdapter* target = g_signal_target.load();
    if (target != nullptr) {
        target->kill_subprocess_sync();
    }

    // Hand the signal on to whatever was installed before us.
    const struct sigaction& previous =
        signum == SIGINT ? g_previous_sigint : g_previous_sigterm;
    static_cast<void>(sigaction(signum, &previous, nullptr));
    static_cast<void>(raise(signum));
    errno = saved_errno;
}

BridgeError handshake_error(const std::string& message) {
    return BridgeError{ErrorCategory::Protocol, message, "handshake_failed",
                       "Check that the agent command speaks ACP over stdio."};
}

bool is_transport_failure(const BridgeError& error) {
    return error.category == ErrorCategory::Transport;
}

}  // namespace

// Lets the notification handler outlive a torn-down session.
struct AcpAdapter::SessionSink {
    std::mutex mutex;
    std::shared_ptr<session::Session> session;

    void route(const std::string& method, const json& params) {
        if (method != methods::kSessionUpdate) {
            return;
        }
        std::shared_ptr<session::Session> target;
        {
            std::lock_guard<std::mutex> lock(mutex);
            target = session;
        }
        if (target) {
            target->process_update(params);
        }
    }

    void set(std::shared_ptr<session::Session> next) {
        std::lock_guard<std::mutex> lock(mutex);
        session = std::move(next);
    }
};

AcpAdapter::AcpAdapter(core::config::AdapterConfig config,
                       handlers::PermissionLogFn on_permission_log,
                       handlers::TerminalPrompt prompt)
    : config_(std::move(config)),
      callbacks_(std::make_shared<handlers::CallbackHandlers>(
          config_.permission_mode, config_.permission_allowlist,
          std::move(on_permission_log), std::move(prompt))),
      sink_(std::make_shared<SessionSink>()) {
    available_ = check_availability();
    if (!available_) {
        LOG_WARN("AcpAdapter: agent command not found on PATH: " + config_.agent_command);
    }
}

AcpAdapter::~AcpAdapter() {
    restore_signal_handlers();
    shutdown();
}

bool AcpAdapter::check_availability() const {
    return core::process::find_executable(config_.agent_command);
}

std::string AcpAdapter::describe() const {
    return name_ + " (available: " + (available_ ? "true" : "false") + ")";
}

double AcpAdapter::estimate_cost(const std::string&) const {
    return 0.0;
}

std::chrono::milliseconds AcpAdapter::timeout_for(
    const protocol::ExecuteOptions& options) const {
    const double seconds = options.timeout_seconds.value_or(config_.timeout_seconds);
    return core::config::seconds_to_millis(seconds);
}

core::errors::Result<json> AcpAdapter::call(client::ProtocolClient& client,
                                            const std::string& method,
                                            const json& params,
                                            const std::chrono::milliseconds timeout) {
    client::PendingCall pending = client.send_request(method, params);
    auto outcome = client::ProtocolClient::wait(pending, timeout);
    if (!outcome.has_value()) {
        return core::errors::timed_out(method + " timed out after " +
                                       std::to_string(timeout.count()) + " ms");
    }
    return std::move(*outcome);
}

core::errors::Result<std::string> AcpAdapter::handshake(client::ProtocolClient& client) {
    const auto timeout = core::config::seconds_to_millis(config_.timeout_seconds);

    json init_params;
    init_params["protocolVersion"] = methods::kProtocolVersion;
    init_params["capabilities"] = {{"fs", true}, {"terminal", true}};

    auto init = call(client, methods::kInitialize, init_params, timeout);
    if (core::errors::is_error(init)) {
        const auto& error = core::errors::get_error(init);
        if (error.category == ErrorCategory::Timeout) {
            return BridgeError{ErrorCategory::Timeout, "Initialization timed out",
                               "handshake_timeout", "", error.rpc_code};
        }
        return error;
    }
    const json& init_result = core::errors::get_value(init);
    if (!init_result.is_object() || !init_result.contains("protocolVersion")) {
        return handshake_error("Invalid initialize response: missing protocolVersion");
    }

    json session_params = json::object();
    session_params["cwd"] = config_.working_directory.has_value()
                                ? config_.working_directory->string()
                                : std::filesystem::current_path().string();
    session_params["mcpServers"] = json::array();

    auto created = call(client, methods::kSessionNew, session_params, timeout);
    if (core::errors::is_error(created)) {
        const auto& error = core::errors::get_error(created);
        if (error.category == ErrorCategory::Timeout) {
            return BridgeError{ErrorCategory::Timeout, "Initialization timed out",
                               "handshake_timeout", "", error.rpc_code};
        }
        return error;
    }
    const json& session_result = core::errors::get_value(created);
    const auto id = session_result.is_object() ? session_result.find("sessionId")
                                               : session_result.end();
    if (id == session_result.end() || !id->is_string() ||
        id->get<std::string>().empty()) {
        return handshake_error("Invalid session/new response: missing sessionId");
    }
    return id->get<std::string>();
}

core::errors::Result<std::string> AcpAdapter::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_ && session_ && client_ && client_->is_running()) {
        return session_->id();
    }
    if (client_) {
        LOG_WARN("AcpAdapter: agent is no longer running; reconnecting");
        client_->stop();
        client_.reset();
        session_.reset();
        sink_->set(nullptr);
        initialized_ = false;
    }

    client::ClientOptions options;
    options.command = config_.agent_command;
    options.args = config_.agent_args;
    options.working_directory = config_.working_directory;
    auto client = std::make_shared<client::ProtocolClient>(std::move(options));

    auto sink = sink_;
    client->on_notification([sink](const std::string& method, const json& params) {
        sink->route(method, params);
    });
    auto callbacks = callbacks_;
    client->on_request([callbacks](const std::string& method, const json& params) {
        return callbacks->handle(method, params);
    });

    auto started = client->start();
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }
    agent_pid_.store(core::errors::get_value(started));

    auto session_id = handshake(*client);
    if (core::errors::is_error(session_id)) {
        LOG_ERROR("AcpAdapter: handshake failed: " +
                  core::errors::get_error(session_id).message);
        agent_pid_.store(-1);
        client->stop();
        return core::errors::get_error(session_id);
    }

    const std::string& id = core::errors::get_value(session_id);
    session_ = std::make_shared<session::Session>(id);
    sink_->set(session_);
    client_ = std::move(client);
    initialized_ = true;

    core::logging::Logger::get().set_context(id);
    LOG_INFO("AcpAdapter: session " + id + " established with " + config_.agent_command);
    return id;
}

std::string AcpAdapter::enhance_prompt(const std::string& prompt) {
    static const std::string kMarker = "ORCHESTRATION CONTEXT:";
    if (prompt.find(kMarker) != std::string::npos) {
        return prompt;
    }
    return kMarker +
           "\nYou are running inside an automated loop that re-issues this prompt until "
           "the task is done.\n"
           "- Make concrete progress on the task below in this iteration.\n"
           "- Use the file system and terminal capabilities offered by the client; "
           "changes persist between iterations.\n"
           "- When the task is fully complete, state that explicitly in your final "
           "message.\n\n"
           "TASK:\n" +
           prompt;
}

json AcpAdapter::base_metadata() const {
    json metadata;
    metadata["tool"] = name_;
    metadata["agent"] = config_.agent_command;
    const auto id = session_id();
    metadata["session_id"] = id.has_value() ? json(*id) : json(nullptr);
    return metadata;
}

ToolResponse AcpAdapter::failure(const std::string& message) const {
    ToolResponse response;
    response.success = false;
    response.error = message;
    response.metadata = base_metadata();
    return response;
}

ToolResponse AcpAdapter::run_turn(const std::string& prompt,
                                  const std::chrono::milliseconds timeout) {
    std::shared_ptr<client::ProtocolClient> client;
    std::shared_ptr<session::Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = client_;
        session = session_;
    }
    if (!client || !session) {
        return failure("ACP error: session is not initialized");
    }

    session->begin_turn();
    json params;
    params["sessionId"] = session->id();
    params["prompt"] = json::array({{{"type", "text"}, {"text", prompt}}});

    client::PendingCall pending = client->send_request(methods::kSessionPrompt, params);
    auto outcome = client::ProtocolClient::wait(pending, timeout);
    if (!outcome.has_value()) {
        static_cast<void>(client->send_notification(
            methods::kSessionCancel, json{{"sessionId", session->id()}}));
        // Let the cancelled turn finish so its late updates stay out of the next turn.
        if (!client::ProtocolClient::wait(pending, kCancelGrace).has_value()) {
            LOG_WARN("AcpAdapter: agent did not acknowledge session/cancel");
        }
        const auto error = core::errors::timed_out(
            std::string(methods::kSessionPrompt) + " timed out after " +
            std::to_string(timeout.count()) + " ms");
        ToolResponse response = failure("ACP error: " + error.message);
        response.output = session->turn_output();
        response.metadata["error_code"] = error.code;
        return response;
    }

    auto result = std::move(*outcome);
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        ToolResponse response = failure("ACP error: " + error.message);
        response.output = session->turn_output();
        response.metadata["error_code"] = error.code;
        if (is_transport_failure(error)) {
            LOG_WARN("AcpAdapter: agent connection lost; next execute will reconnect");
            shutdown();
        }
        return response;
    }

    const json& reply = core::errors::get_value(result);
    std::string stop_reason = "end_turn";
    if (reply.is_object() && reply.contains("stopReason") &&
        reply.at("stopReason").is_string()) {
        stop_reason = reply.at("stopReason").get<std::string>();
    }

    ToolResponse response;
    response.success = stop_reason != "refusal" && stop_reason != "cancelled";
    response.output = session->turn_output();
    if (!response.success) {
        response.error = "Agent stopped: " + stop_reason;
    }
    response.metadata = base_metadata();
    response.metadata["stop_reason"] = stop_reason;
    response.metadata["tool_calls"] = session->tool_calls().size();
    response.metadata["updates"] = session->update_count();
    return response;
}

ToolResponse AcpAdapter::execute(const std::string& prompt,
                                 const protocol::ExecuteOptions& options) {
    if (!available_) {
        return failure("ACP adapter not available: " + config_.agent_command + " not found");
    }

    try {
        std::lock_guard<std::mutex> turn_lock(turn_mutex_);
        auto initialized = initialize();
        if (core::errors::is_error(initialized)) {
            ToolResponse response =
                failure("ACP error: " + core::errors::get_error(initialized).message);
            response.metadata["error_code"] = core::errors::get_error(initialized).code;
            return response;
        }
        return run_turn(enhance_prompt(prompt), timeout_for(options));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("AcpAdapter: execute failed: ") + e.what());
        return failure(e.what());
    }
}

std::future<ToolResponse> AcpAdapter::execute_async(std::string prompt,
                                                    protocol::ExecuteOptions options) {
    return std::async(std::launch::async,
                      [this, prompt = std::move(prompt), options = std::move(options)]() {
                          return execute(prompt, options);
                      });
}

void AcpAdapter::shutdown() {
    std::shared_ptr<client::ProtocolClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = std::move(client_);
        session_.reset();
        initialized_ = false;
    }
    sink_->set(nullptr);
    agent_pid_.store(-1);
    if (client) {
        client->stop();
    }
}

void AcpAdapter::kill_subprocess_sync() noexcept {
    const pid_t pid = agent_pid_.exchange(-1);
    if (pid <= 0) {
        return;
    }
    shutdown_requested_.store(true);

    static_cast<void>(::kill(-pid, SIGTERM));
    for (int step = 0; step < kKillGraceSteps; ++step) {
        int status = 0;
        const pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid || (waited < 0 && errno == ECHILD)) {
            return;
        }
        struct timespec pause {0, kKillStepNanos};
        static_cast<void>(nanosleep(&pause, nullptr));
    }
    static_cast<void>(::kill(-pid, SIGKILL));
}

bool AcpAdapter::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

std::optional<std::string> AcpAdapter::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return std::nullopt;
    }
    return session_->id();
}

std::shared_ptr<const session::Session> AcpAdapter::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

json AcpAdapter::permission_stats() const {
    const auto& permissions = callbacks_->permissions();
    return json{{"approved_count", permissions.approved_count()},
                {"denied_count", permissions.denied_count()}};
}

std::vector<handlers::DecisionRecord> AcpAdapter::permission_history() const {
    return callbacks_->permissions().history();
}

void AcpAdapter::clear_permission_history() {
    callbacks_->permissions().clear_history();
}

void AcpAdapter::install_signal_handlers() {
    if (signal_handlers_installed_) {
        return;
    }
    struct sigaction action {};
    action.sa_handler = handle_shutdown_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    g_signal_target.store(this);
    if (sigaction(SIGINT, &action, &g_previous_sigint) != 0 ||
        sigaction(SIGTERM, &action, &g_previous_sigterm) != 0) {
        LOG_WARN("AcpAdapter: failed to install signal handlers");
    }
    signal_handlers_installed_ = true;
}

void AcpAdapter::restore_signal_handlers() {
    if (!signal_handlers_installed_) {
        return;
    }
    static_cast<void>(sigaction(SIGINT, &g_previous_sigint, nullptr));
    static_cast<void>(sigaction(SIGTERM, &g_previous_sigterm, nullptr));
    AcpAdapter* self = this;
    g_signal_target.compare_exchange_strong(self, nullptr);
    signal_handlers_installed_ = false;
}

}  // namespace acpbridge::adapter
