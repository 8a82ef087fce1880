#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace acpbridge::handlers {

struct TerminalOutput {
    std::string output;
    bool done = false;
    std::optional<int> exit_code;
};

struct ExitStatus {
    int exit_code = -1;
    std::optional<int> signal;
};

// Agent-spawned processes keyed by opaque ids. Each terminal captures its
// combined stdout/stderr on a pump thread until released.
class TerminalManager {
public:
    TerminalManager() = default;
    ~TerminalManager();

    TerminalManager(const TerminalManager&) = delete;
    TerminalManager& operator=(const TerminalManager&) = delete;

    core::errors::Result<std::string> create(
        const std::vector<std::string>& command,
        const std::optional<std::filesystem::path>& cwd = std::nullopt);

    core::errors::Result<TerminalOutput> output(const std::string& terminal_id) const;

    // Without a timeout, blocks until exit. On timeout the process keeps running.
    core::errors::Result<ExitStatus> wait_for_exit(
        const std::string& terminal_id,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    // Best effort. Killing an exited process succeeds without doing anything.
    core::errors::Result<bool> kill(const std::string& terminal_id) const;

    core::errors::Result<bool> release(const std::string& terminal_id);

    void release_all();
    std::size_t size() const;

    core::errors::Result<nlohmann::json> handle_create(const nlohmann::json& params);
    core::errors::Result<nlohmann::json> handle_output(const nlohmann::json& params) const;
    core::errors::Result<nlohmann::json> handle_wait_for_exit(
        const nlohmann::json& params) const;
    core::errors::Result<nlohmann::json> handle_kill(const nlohmann::json& params) const;
    core::errors::Result<nlohmann::json> handle_release(const nlohmann::json& params);

private:
    struct Terminal;

    core::errors::Result<std::shared_ptr<Terminal>> find(const std::string& terminal_id) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Terminal>> terminals_;
};

}  // namespace acpbridge::handlers
