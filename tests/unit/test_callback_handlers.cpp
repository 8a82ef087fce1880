#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/id_generator.hpp"
#include "core/errors/bridge_errors.hpp"
#include "handlers/callback_handlers.hpp"

namespace {

using acpbridge::core::errors::get_error;
using acpbridge::core::errors::get_value;
using acpbridge::core::errors::is_error;
using acpbridge::handlers::CallbackHandlers;
using acpbridge::handlers::TerminalPrompt;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_callback_handlers_" + acpbridge::core::config::generate_id("ws"));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

TerminalPrompt headless() {
    TerminalPrompt prompt;
    prompt.is_interactive = []() { return false; };
    prompt.read_line = [](const std::string&) { return std::optional<std::string>(); };
    return prompt;
}

TEST(CallbackHandlersTest, UnknownMethodIsNotServed) {
    CallbackHandlers handlers("auto_approve", {}, nullptr, headless());
    EXPECT_FALSE(handlers.handle("session/unknown", json::object()).has_value());
}

TEST(CallbackHandlersTest, RoutesFileRoundTrip) {
    TempWorkspace workspace;
    CallbackHandlers handlers("auto_approve", {}, nullptr, headless());
    const std::string path = (workspace.root() / "a.txt").string();

    auto written = handlers.handle("fs/write_text_file", json{{"path", path}, {"content", "abc"}});
    ASSERT_TRUE(written.has_value());
    ASSERT_FALSE(is_error(*written));

    auto read = handlers.handle("fs/read_text_file", json{{"path", path}});
    ASSERT_TRUE(read.has_value());
    ASSERT_FALSE(is_error(*read));
    EXPECT_EQ(get_value(*read).at("content"), "abc");
}

TEST(CallbackHandlersTest, RoutesPermissionRequests) {
    CallbackHandlers handlers("deny_all", {}, nullptr, headless());
    auto reply = handlers.handle("session/request_permission", json{{"operation", "write"}});
    ASSERT_TRUE(reply.has_value());
    ASSERT_FALSE(is_error(*reply));
    EXPECT_EQ(get_value(*reply).at("outcome").at("outcome"), "cancelled");
    EXPECT_EQ(handlers.permissions().denied_count(), 1u);
}

TEST(CallbackHandlersTest, RoutesTerminalLifecycle) {
    CallbackHandlers handlers("auto_approve", {}, nullptr, headless());
    auto created = handlers.handle("terminal/create", json{{"command", json::array({"sh", "-c", "echo routed"})}});
    ASSERT_TRUE(created.has_value());
    ASSERT_FALSE(is_error(*created));
    const json id = get_value(*created).at("terminalId");

    auto waited = handlers.handle("terminal/wait_for_exit", json{{"terminalId", id}});
    ASSERT_TRUE(waited.has_value());
    ASSERT_FALSE(is_error(*waited));
    EXPECT_EQ(get_value(*waited).at("exitCode"), 0);

    auto output = handlers.handle("terminal/output", json{{"terminalId", id}});
    ASSERT_TRUE(output.has_value());
    ASSERT_FALSE(is_error(*output));
    EXPECT_EQ(get_value(*output).at("output"), "routed\n");

    auto killed = handlers.handle("terminal/kill", json{{"terminalId", id}});
    ASSERT_TRUE(killed.has_value());
    EXPECT_FALSE(is_error(*killed));

    auto released = handlers.handle("terminal/release", json{{"terminalId", id}});
    ASSERT_TRUE(released.has_value());
    EXPECT_FALSE(is_error(*released));
    EXPECT_EQ(handlers.terminals().size(), 0u);
}

TEST(CallbackHandlersTest, HandlerErrorsKeepWireCodes) {
    CallbackHandlers handlers("auto_approve", {}, nullptr, headless());
    auto missing = handlers.handle("terminal/output", json{{"terminalId", "term-nothere"}});
    ASSERT_TRUE(missing.has_value());
    ASSERT_TRUE(is_error(*missing));
    EXPECT_EQ(get_error(*missing).rpc_code, -32001);

    auto relative = handlers.handle("fs/read_text_file", json{{"path", "not/absolute"}});
    ASSERT_TRUE(relative.has_value());
    ASSERT_TRUE(is_error(*relative));
    EXPECT_EQ(get_error(*relative).rpc_code, -32602);
}

}  // namespace
