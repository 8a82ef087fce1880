#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace acpbridge::session {

struct ToolCallRecord {
    std::string id;
    std::string title;
    std::string kind;
    std::string status;
};

struct PlanEntry {
    std::string content;
    std::string priority;
    std::string status;
};

// State accumulated from "session/update" notifications. Written by the
// client's reader thread, read by whoever drives the prompt turn.
class Session {
public:
    explicit Session(std::string session_id);

    const std::string& id() const { return session_id_; }

    // Applies one session/update payload. Updates addressed to another
    // session are ignored; unknown update kinds are only counted.
    void process_update(const nlohmann::json& params);

    // Marks the start of a prompt turn; turn_output() only covers text
    // received after this point.
    void begin_turn();

    std::string turn_output() const;
    std::string output() const;
    std::string thoughts() const;
    std::vector<ToolCallRecord> tool_calls() const;
    std::vector<PlanEntry> plan() const;
    std::size_t update_count() const;
    std::size_t ignored_update_count() const;

private:
    void upsert_tool_call(const nlohmann::json& update, bool is_update);

    const std::string session_id_;

    mutable std::mutex mutex_;
    std::string output_;
    std::size_t turn_offset_ = 0;
    std::string thoughts_;
    std::vector<ToolCallRecord> tool_calls_;
    std::vector<PlanEntry> plan_;
    std::size_t update_count_ = 0;
    std::size_t ignored_update_count_ = 0;
};

}  // namespace acpbridge::session
