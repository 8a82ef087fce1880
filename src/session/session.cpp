#include "session/session.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace acpbridge::session {

using nlohmann::json;

namespace {

std::string string_field(const json& object, const char* key) {
    if (!object.is_object()) {
        return "";
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

// Content blocks arrive as {type:"text", text}, as a bare string, or as a
// list of blocks.
std::string content_text(const json& content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    if (content.is_object()) {
        return string_field(content, "text");
    }
    if (content.is_array()) {
        std::string text;
        for (const auto& block : content) {
            text += content_text(block);
        }
        return text;
    }
    return "";
}

}  // namespace

Session::Session(std::string session_id) : session_id_(std::move(session_id)) {}

void Session::process_update(const json& params) {
    if (!params.is_object()) {
        return;
    }

    const std::string target = string_field(params, "sessionId");
    if (!target.empty() && target != session_id_) {
        LOG_DEBUG("Session: ignoring update for session " + target);
        return;
    }

    const auto update_it = params.find("update");
    const json& update = update_it != params.end() ? *update_it : params;
    const std::string kind = string_field(update, "sessionUpdate");
    const json content = update.is_object() && update.contains("content")
                             ? update.at("content")
                             : json();

    std::lock_guard<std::mutex> lock(mutex_);
    ++update_count_;

    if (kind == "agent_message_chunk") {
        output_ += content_text(content);
    } else if (kind == "agent_thought_chunk") {
        thoughts_ += content_text(content);
    } else if (kind == "tool_call") {
        upsert_tool_call(update, false);
    } else if (kind == "tool_call_update") {
        upsert_tool_call(update, true);
    } else if (kind == "plan") {
        plan_.clear();
        const auto entries = update.find("entries");
        if (entries != update.end() && entries->is_array()) {
            for (const auto& entry : *entries) {
                plan_.push_back(PlanEntry{string_field(entry, "content"),
                                          string_field(entry, "priority"),
                                          string_field(entry, "status")});
            }
        }
    } else {
        ++ignored_update_count_;
    }
}

void Session::upsert_tool_call(const json& update, const bool is_update) {
    const std::string id = string_field(update, "toolCallId");
    for (auto& record : tool_calls_) {
        if (record.id != id) {
            continue;
        }
        const std::string status = string_field(update, "status");
        const std::string title = string_field(update, "title");
        if (!status.empty()) record.status = status;
        if (!title.empty()) record.title = title;
        return;
    }
    if (is_update && id.empty()) {
        ++ignored_update_count_;
        return;
    }

    ToolCallRecord record;
    record.id = id;
    record.title = string_field(update, "title");
    record.kind = string_field(update, "kind");
    record.status = string_field(update, "status");
    if (record.status.empty()) {
        record.status = "pending";
    }
    tool_calls_.push_back(std::move(record));
}

void Session::begin_turn() {
    std::lock_guard<std::mutex> lock(mutex_);
    turn_offset_ = output_.size();
}

std::string Session::turn_output() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return output_.substr(turn_offset_);
}

std::string Session::output() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return output_;
}

std::string Session::thoughts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thoughts_;
}

std::vector<ToolCallRecord> Session::tool_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tool_calls_;
}

std::vector<PlanEntry> Session::plan() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return plan_;
}

std::size_t Session::update_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return update_count_;
}

std::size_t Session::ignored_update_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ignored_update_count_;
}

}  // namespace acpbridge::session
