#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace acpbridge::handlers {

enum class PermissionMode {
    AutoApprove,
    DenyAll,
    Allowlist,
    Interactive
};

// Throws std::invalid_argument for an unrecognized mode.
PermissionMode parse_permission_mode(const std::string& mode);
std::string to_string(PermissionMode mode);

struct PermissionRequest {
    std::string operation;
    std::optional<std::string> path;
    std::optional<std::string> command;
    nlohmann::json arguments = nlohmann::json::object();

    static PermissionRequest from_params(const nlohmann::json& params);
};

struct PermissionDecision {
    bool approved = false;
    std::string reason;
    PermissionMode mode = PermissionMode::DenyAll;
};

struct DecisionRecord {
    PermissionRequest request;
    PermissionDecision decision;
    std::chrono::system_clock::time_point decided_at;
};

// Source of interactive answers. The default reads the controlling terminal;
// tests substitute their own.
struct TerminalPrompt {
    std::function<bool()> is_interactive;
    // std::nullopt means end-of-input or interrupt.
    std::function<std::optional<std::string>(const std::string& question)> read_line;

    static TerminalPrompt standard();
};

using PermissionLogFn = std::function<void(const std::string& line)>;

class PermissionEngine {
public:
    explicit PermissionEngine(const std::string& mode = "auto_approve",
                              std::vector<std::string> allowlist = {},
                              PermissionLogFn on_log = nullptr,
                              TerminalPrompt prompt = TerminalPrompt::standard());

    PermissionDecision evaluate(const PermissionRequest& request);

    // session/request_permission: echoes one of the agent's option ids on
    // approval, returns a cancelled outcome on denial.
    nlohmann::json handle_request_permission(const nlohmann::json& params);

    // Exact match, glob (* and ?), or /regex/. An invalid regex never matches.
    static bool matches_pattern(const std::string& operation, const std::string& pattern);

    std::vector<DecisionRecord> history() const;
    void clear_history();
    std::size_t approved_count() const;
    std::size_t denied_count() const;

    PermissionMode mode() const { return mode_; }
    const std::vector<std::string>& allowlist() const { return allowlist_; }

    static constexpr std::size_t kMaxHistory = 1000;

private:
    PermissionDecision decide(const PermissionRequest& request);
    PermissionDecision ask_user(const PermissionRequest& request);
    void record(const PermissionRequest& request, const PermissionDecision& decision);
    static std::string select_option(const nlohmann::json& options);

    PermissionMode mode_;
    std::vector<std::string> allowlist_;
    PermissionLogFn on_log_;
    TerminalPrompt prompt_;

    mutable std::mutex mutex_;
    std::deque<DecisionRecord> history_;
    // Only one question on the terminal at a time.
    std::mutex prompt_mutex_;
};

}  // namespace acpbridge::handlers
