#include "handlers/permission_engine.hpp"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace acpbridge::handlers {

using nlohmann::json;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::optional<std::string> optional_string(const json& params, const char* key) {
    const auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::string option_field(const json& option, const char* primary, const char* fallback) {
    for (const char* key : {primary, fallback}) {
        const auto it = option.find(key);
        if (it != option.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

bool is_glob(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

}  // namespace

PermissionMode parse_permission_mode(const std::string& mode) {
    if (mode == "auto_approve") return PermissionMode::AutoApprove;
    if (mode == "deny_all") return PermissionMode::DenyAll;
    if (mode == "allowlist") return PermissionMode::Allowlist;
    if (mode == "interactive") return PermissionMode::Interactive;
    throw std::invalid_argument("Invalid permission_mode: '" + mode +
                                "'. Must be one of: auto_approve, deny_all, "
                                "allowlist, interactive");
}

std::string to_string(const PermissionMode mode) {
    switch (mode) {
        case PermissionMode::AutoApprove:
            return "auto_approve";
        case PermissionMode::DenyAll:
            return "deny_all";
        case PermissionMode::Allowlist:
            return "allowlist";
        case PermissionMode::Interactive:
            return "interactive";
        default:
            return "unknown";
    }
}

PermissionRequest PermissionRequest::from_params(const json& params) {
    PermissionRequest request;
    if (!params.is_object()) {
        return request;
    }
    request.arguments = params;
    request.path = optional_string(params, "path");
    request.command = optional_string(params, "command");

    const auto operation = optional_string(params, "operation");
    if (operation.has_value()) {
        request.operation = *operation;
    } else if (params.contains("toolCall") && params.at("toolCall").is_object()) {
        request.operation = optional_string(params.at("toolCall"), "title").value_or("");
    }
    return request;
}

TerminalPrompt TerminalPrompt::standard() {
    TerminalPrompt prompt;
    prompt.is_interactive = []() { return isatty(STDIN_FILENO) != 0; };
    prompt.read_line = [](const std::string& question) -> std::optional<std::string> {
        std::cerr << question << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            std::cin.clear();
            return std::nullopt;
        }
        return answer;
    };
    return prompt;
}

PermissionEngine::PermissionEngine(const std::string& mode,
                                   std::vector<std::string> allowlist,
                                   PermissionLogFn on_log, TerminalPrompt prompt)
    : mode_(parse_permission_mode(mode)),
      allowlist_(std::move(allowlist)),
      on_log_(std::move(on_log)),
      prompt_(std::move(prompt)) {}

bool PermissionEngine::matches_pattern(const std::string& operation,
                                       const std::string& pattern) {
    if (pattern.size() >= 2 && pattern.front() == '/' && pattern.back() == '/') {
        try {
            const std::regex expression(pattern.substr(1, pattern.size() - 2));
            return std::regex_search(operation, expression,
                                     std::regex_constants::match_continuous);
        } catch (const std::regex_error& e) {
            LOG_WARN("PermissionEngine: invalid allowlist regex " + pattern + ": " +
                     e.what());
            return false;
        }
    }
    if (is_glob(pattern)) {
        return fnmatch(pattern.c_str(), operation.c_str(), 0) == 0;
    }
    return operation == pattern;
}

PermissionDecision PermissionEngine::decide(const PermissionRequest& request) {
    switch (mode_) {
        case PermissionMode::AutoApprove:
            return PermissionDecision{true, "auto_approve mode", mode_};
        case PermissionMode::DenyAll:
            return PermissionDecision{false, "deny_all mode", mode_};
        case PermissionMode::Allowlist:
            for (const auto& pattern : allowlist_) {
                if (matches_pattern(request.operation, pattern)) {
                    return PermissionDecision{true, "matches allowlist pattern: " + pattern,
                                              mode_};
                }
            }
            return PermissionDecision{false, "no matching allowlist pattern", mode_};
        case PermissionMode::Interactive:
            return ask_user(request);
        default:
            return PermissionDecision{false, "unknown permission mode", mode_};
    }
}

PermissionDecision PermissionEngine::ask_user(const PermissionRequest& request) {
    if (!prompt_.is_interactive || !prompt_.is_interactive()) {
        return PermissionDecision{false, "no interactive terminal available", mode_};
    }

    std::string question = "\nPermission requested: " + request.operation + "\n";
    if (request.path.has_value()) {
        question += "  path: " + *request.path + "\n";
    }
    if (request.command.has_value()) {
        question += "  command: " + *request.command + "\n";
    }
    question += "Approve? [y/N]: ";

    std::optional<std::string> answer;
    {
        std::lock_guard<std::mutex> lock(prompt_mutex_);
        answer = prompt_.read_line ? prompt_.read_line(question) : std::nullopt;
    }
    if (!answer.has_value()) {
        return PermissionDecision{false, "prompt interrupted", mode_};
    }

    const std::string normalized = lowercase(trim(*answer));
    if (normalized == "y" || normalized == "yes") {
        return PermissionDecision{true, "approved by user", mode_};
    }
    return PermissionDecision{false, "denied by user", mode_};
}

PermissionDecision PermissionEngine::evaluate(const PermissionRequest& request) {
    const PermissionDecision decision = decide(request);
    record(request, decision);
    return decision;
}

void PermissionEngine::record(const PermissionRequest& request,
                              const PermissionDecision& decision) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(
            DecisionRecord{request, decision, std::chrono::system_clock::now()});
        while (history_.size() > kMaxHistory) {
            history_.pop_front();
        }
    }

    const std::string line = std::string("Permission ") +
                             (decision.approved ? "APPROVED" : "DENIED") + ": " +
                             request.operation + " (" + decision.reason + ")";
    LOG_DEBUG("PermissionEngine: " + line);
    if (on_log_) {
        on_log_(line);
    }
}

std::string PermissionEngine::select_option(const json& options) {
    if (!options.is_array() || options.empty()) {
        return "allow";
    }
    std::string first;
    for (const auto& option : options) {
        if (!option.is_object()) {
            continue;
        }
        const std::string id = option_field(option, "id", "optionId");
        if (id.empty()) {
            continue;
        }
        if (first.empty()) {
            first = id;
        }
        const std::string kind = option_field(option, "type", "kind");
        if (kind.rfind("allow", 0) == 0) {
            return id;
        }
    }
    return first.empty() ? "allow" : first;
}

json PermissionEngine::handle_request_permission(const json& params) {
    const PermissionRequest request = PermissionRequest::from_params(params);
    const PermissionDecision decision = evaluate(request);
    if (!decision.approved) {
        return json{{"outcome", {{"outcome", "cancelled"}}}};
    }

    const json options = params.is_object() && params.contains("options")
                             ? params.at("options")
                             : json::array();
    return json{{"outcome", {{"outcome", "selected"}, {"optionId", select_option(options)}}}};
}

std::vector<DecisionRecord> PermissionEngine::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<DecisionRecord>(history_.begin(), history_.end());
}

void PermissionEngine::clear_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

std::size_t PermissionEngine::approved_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(history_.begin(), history_.end(),
                      [](const DecisionRecord& r) { return r.decision.approved; }));
}

std::size_t PermissionEngine::denied_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(history_.begin(), history_.end(),
                      [](const DecisionRecord& r) { return !r.decision.approved; }));
}

}  // namespace acpbridge::handlers
