// Scripted ACP agent used by the unit tests. Speaks newline-delimited
// JSON-RPC on stdio. Behavior is chosen by argv[1]:
//   normal | no-version | no-session | silent | hang-prompt | crash |
//   malformed | callbacks <dir> | string-ids <dir> | stderr-noise |
//   duplicate-reply | closed-stdin | slow-cancel
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

class FakeAgent {
public:
    FakeAgent(std::string mode, std::string work_dir)
        : mode_(std::move(mode)), work_dir_(std::move(work_dir)) {}

    int run() {
        if (mode_ == "closed-stdin") {
            ::close(STDIN_FILENO);
            emit(json{{"jsonrpc", "2.0"}, {"method", "test/stdin_closed"}});
            while (true) {
                ::pause();
            }
        }
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }
            const json message = json::parse(line, nullptr, false);
            if (message.is_discarded() || !message.is_object()) {
                continue;
            }
            if (mode_ == "silent") {
                continue;
            }
            if (!message.contains("method")) {
                continue;  // stray response
            }
            const std::string method = message.at("method").get<std::string>();
            const json params = message.value("params", json::object());
            if (!message.contains("id")) {
                on_notification(method, params);
                continue;
            }
            const std::int64_t id = message.at("id").get<std::int64_t>();
            if (!dispatch(id, method, params)) {
                return 3;
            }
        }
        return 0;
    }

private:
    void emit(const json& message) {
        if (mode_ == "malformed") {
            std::cout << "this is not json {" << "\n";
        }
        if (mode_ == "stderr-noise") {
            std::cerr << "fake agent diagnostic line" << std::endl;
        }
        std::cout << message.dump() << "\n" << std::flush;
    }

    void reply(std::int64_t id, const json& result) {
        emit(json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
    }

    void reply_error(std::int64_t id, int code, const std::string& text) {
        emit(json{{"jsonrpc", "2.0"}, {"id", id},
                  {"error", {{"code", code}, {"message", text}}}});
    }

    void update(const json& body) {
        emit(json{{"jsonrpc", "2.0"}, {"method", "session/update"},
                  {"params", {{"sessionId", kSessionId}, {"update", body}}}});
    }

    void chunk(const std::string& kind, const std::string& text) {
        update(json{{"sessionUpdate", kind}, {"content", {{"type", "text"}, {"text", text}}}});
    }

    // Sends a request to the client and blocks until its response arrives.
    json ask(const std::string& method, const json& params) {
        const json id = mode_ == "string-ids" ? json("req-" + std::to_string(next_id_++))
                                              : json(next_id_++);
        emit(json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});
        std::string line;
        while (std::getline(std::cin, line)) {
            const json message = json::parse(line, nullptr, false);
            if (message.is_discarded() || !message.is_object() || message.contains("method")) {
                continue;
            }
            if (message.value("id", json(nullptr)) != id) {
                continue;
            }
            if (message.contains("error")) {
                return json{{"error", message.at("error")}};
            }
            return message.value("result", json(nullptr));
        }
        return json{{"error", "stdin closed"}};
    }

    void on_notification(const std::string& method, const json&) {
        if (method != "session/cancel") {
            return;
        }
        std::cerr << "fake agent: cancel received" << std::endl;
        if (held_prompt_.has_value()) {
            chunk("agent_message_chunk", "late");
            reply(*held_prompt_, json{{"stopReason", "cancelled"}});
            held_prompt_.reset();
        }
    }

    bool dispatch(std::int64_t id, const std::string& method, const json& params) {
        if (method == "initialize") {
            if (mode_ == "no-version") {
                reply(id, json{{"agentCapabilities", json::object()}});
            } else {
                reply(id, json{{"protocolVersion", params.value("protocolVersion", "2024-01")},
                               {"agentCapabilities", json::object()}});
            }
            return true;
        }
        if (method == "session/new") {
            if (mode_ == "no-session") {
                reply(id, json::object());
            } else {
                reply(id, json{{"sessionId", kSessionId}});
            }
            return true;
        }
        if (method == "session/prompt") {
            return prompt(id, params);
        }
        if (method == "echo") {
            reply(id, params);
            if (mode_ == "duplicate-reply") {
                reply_error(id, -32000, "second reply for the same id");
                reply(id + 1000000, json{{"stray", true}});
                emit(json{{"jsonrpc", "2.0"}, {"id", "ghost"}, {"result", {{"stray", true}}}});
            }
            return true;
        }
        if (method == "fail") {
            reply_error(id, -32000, "requested failure");
            return true;
        }
        if (method == "exit") {
            return false;
        }
        reply_error(id, -32601, "Method not found: " + method);
        return true;
    }

    bool prompt(std::int64_t id, const json& params) {
        if (mode_ == "crash") {
            chunk("agent_message_chunk", "partial");
            return false;
        }
        if (mode_ == "hang-prompt") {
            return true;
        }
        if (mode_ == "slow-cancel" && !first_prompt_seen_) {
            first_prompt_seen_ = true;
            held_prompt_ = id;
            return true;
        }

        std::string text;
        if (params.contains("prompt") && params.at("prompt").is_array() &&
            !params.at("prompt").empty()) {
            text = params.at("prompt").at(0).value("text", "");
        }

        if (mode_ == "callbacks" || mode_ == "string-ids") {
            run_callbacks();
        } else {
            chunk("agent_thought_chunk", "thinking");
            update(json{{"sessionUpdate", "tool_call"}, {"toolCallId", "call-1"},
                        {"title", "Read file"}, {"kind", "read"}, {"status", "pending"}});
            update(json{{"sessionUpdate", "tool_call_update"}, {"toolCallId", "call-1"},
                        {"status", "completed"}});
            update(json{{"sessionUpdate", "plan"},
                        {"entries", json::array({{{"content", "step one"},
                                                  {"priority", "high"},
                                                  {"status", "pending"}}})}});
            chunk("agent_message_chunk", "Hello ");
            chunk("agent_message_chunk", "world");
            if (text.find("REFUSE") != std::string::npos) {
                reply(id, json{{"stopReason", "refusal"}});
                return true;
            }
        }
        reply(id, json{{"stopReason", "end_turn"}});
        return true;
    }

    void run_callbacks() {
        const std::string path = work_dir_ + "/agent_note.txt";

        const json permission = ask("session/request_permission",
                                    json{{"sessionId", kSessionId},
                                         {"toolCall", {{"title", "write_file"}}},
                                         {"path", path},
                                         {"options", json::array({
                                             {{"optionId", "reject"}, {"kind", "reject_once"}},
                                             {{"optionId", "ok"}, {"kind", "allow_once"}}})}});
        const std::string outcome = permission.contains("outcome")
                                        ? permission.at("outcome").value("outcome", "")
                                        : "";
        chunk("agent_message_chunk", "permission=" + outcome + ";");
        if (outcome != "selected") {
            return;
        }

        ask("fs/write_text_file", json{{"sessionId", kSessionId}, {"path", path},
                                        {"content", "from agent"}});
        const json read = ask("fs/read_text_file",
                              json{{"sessionId", kSessionId}, {"path", path}});
        chunk("agent_message_chunk", "read=" + read.value("content", std::string("?")) + ";");

        const json created = ask("terminal/create",
                                 json{{"sessionId", kSessionId},
                                      {"command", json::array({"sh", "-c", "echo term-ok"})}});
        const std::string terminal = created.value("terminalId", "");
        const json waited = ask("terminal/wait_for_exit",
                                json{{"sessionId", kSessionId}, {"terminalId", terminal}});
        const json output = ask("terminal/output",
                                json{{"sessionId", kSessionId}, {"terminalId", terminal}});
        ask("terminal/release", json{{"sessionId", kSessionId}, {"terminalId", terminal}});

        std::string printed = output.value("output", std::string());
        while (!printed.empty() && (printed.back() == '\n' || printed.back() == '\r')) {
            printed.pop_back();
        }
        chunk("agent_message_chunk",
              "exit=" + std::to_string(waited.value("exitCode", -1)) + ";out=" + printed);
    }

    static constexpr const char* kSessionId = "sess-fake";

    std::string mode_;
    std::string work_dir_;
    std::int64_t next_id_ = 1000;
    bool first_prompt_seen_ = false;
    std::optional<std::int64_t> held_prompt_;
};

}  // namespace

int main(int argc, char* argv[]) {
    const std::string mode = argc > 1 ? argv[1] : "normal";
    const std::string work_dir = argc > 2 ? argv[2] : ".";
    FakeAgent agent(mode, work_dir);
    return agent.run();
}
