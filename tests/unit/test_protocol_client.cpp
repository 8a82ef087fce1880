#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "client/protocol_client.hpp"
#include "core/errors/bridge_errors.hpp"

namespace {

using acpbridge::client::CallResult;
using acpbridge::client::ClientOptions;
using acpbridge::client::ClientState;
using acpbridge::client::PendingCall;
using acpbridge::client::ProtocolClient;
using acpbridge::core::errors::ErrorCategory;
using acpbridge::core::errors::get_error;
using acpbridge::core::errors::get_value;
using acpbridge::core::errors::is_error;
using nlohmann::json;

constexpr std::chrono::milliseconds kWait{10000};

ClientOptions fake_agent(const std::string& mode) {
    ClientOptions options;
    options.command = FAKE_ACP_AGENT_PATH;
    options.args = {mode};
    options.worker_grace = std::chrono::milliseconds(1000);
    options.terminate_grace = std::chrono::milliseconds(1000);
    return options;
}

CallResult call(ProtocolClient& client, const std::string& method, const json& params) {
    PendingCall pending = client.send_request(method, params);
    auto outcome = ProtocolClient::wait(pending, kWait);
    if (!outcome.has_value()) {
        ADD_FAILURE() << method << " did not complete";
        return acpbridge::core::errors::timed_out("test wait");
    }
    return std::move(*outcome);
}

TEST(ProtocolClientTest, RequestResolvesWithAgentResult) {
    ProtocolClient client(fake_agent("normal"));
    auto started = client.start();
    ASSERT_FALSE(is_error(started));
    EXPECT_GT(get_value(started), 0);
    EXPECT_TRUE(client.is_running());

    auto result = call(client, "echo", json{{"value", 42}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("value"), 42);
    EXPECT_EQ(client.pending_count(), 0u);
    client.stop();
}

TEST(ProtocolClientTest, AgentErrorReplyBecomesProtocolError) {
    ProtocolClient client(fake_agent("normal"));
    ASSERT_FALSE(is_error(client.start()));

    auto failed = call(client, "fail", json::object());
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).category, ErrorCategory::Protocol);
    EXPECT_EQ(get_error(failed).rpc_code, -32000);
    EXPECT_EQ(get_error(failed).message, "requested failure");

    auto unknown = call(client, "no/such/method", json::object());
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).rpc_code, -32601);
    client.stop();
}

TEST(ProtocolClientTest, ConcurrentRequestsEachGetTheirOwnResponse) {
    ProtocolClient client(fake_agent("normal"));
    ASSERT_FALSE(is_error(client.start()));

    std::vector<std::future<bool>> workers;
    for (int i = 0; i < 16; ++i) {
        workers.push_back(std::async(std::launch::async, [&client, i]() {
            auto result = call(client, "echo", json{{"n", i}});
            return !is_error(result) && get_value(result).at("n") == i;
        }));
    }
    for (auto& worker : workers) {
        EXPECT_TRUE(worker.get());
    }
    client.stop();
}

TEST(ProtocolClientTest, MalformedLinesAreSkipped) {
    ProtocolClient client(fake_agent("malformed"));
    ASSERT_FALSE(is_error(client.start()));

    auto result = call(client, "echo", json{{"ok", true}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("ok"), true);
    EXPECT_TRUE(client.is_running());
    client.stop();
}

TEST(ProtocolClientTest, SubprocessExitFailsPendingCalls) {
    ProtocolClient client(fake_agent("normal"));
    ASSERT_FALSE(is_error(client.start()));

    auto result = call(client, "exit", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Transport);
    EXPECT_EQ(get_error(result).code, "subprocess_terminated");

    const auto deadline = std::chrono::steady_clock::now() + kWait;
    while (client.is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_FALSE(client.is_running());

    auto late = call(client, "echo", json::object());
    ASSERT_TRUE(is_error(late));
    EXPECT_EQ(get_error(late).category, ErrorCategory::Transport);
    client.stop();
}

TEST(ProtocolClientTest, StopFailsPendingCallsAndIsIdempotent) {
    ProtocolClient client(fake_agent("silent"));
    ASSERT_FALSE(is_error(client.start()));

    PendingCall pending = client.send_request("echo", json::object());
    EXPECT_EQ(client.pending_count(), 1u);

    const auto begin = std::chrono::steady_clock::now();
    client.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(8));

    auto outcome = ProtocolClient::wait(pending, kWait);
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(is_error(*outcome));
    EXPECT_EQ(get_error(*outcome).category, ErrorCategory::Transport);

    client.stop();
    EXPECT_EQ(client.state(), ClientState::Stopped);
    EXPECT_EQ(client.pending_count(), 0u);

    auto restarted = client.start();
    ASSERT_TRUE(is_error(restarted));
    EXPECT_EQ(get_error(restarted).code, "client_stopped");
}

TEST(ProtocolClientTest, SendBeforeStartFailsFast) {
    ProtocolClient client(fake_agent("normal"));
    PendingCall pending = client.send_request("echo", json::object());
    auto outcome = ProtocolClient::wait(pending, std::chrono::milliseconds(0));
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(is_error(*outcome));
    EXPECT_EQ(get_error(*outcome).code, "client_not_running");
    EXPECT_FALSE(client.send_notification("session/cancel", json::object()));
}

TEST(ProtocolClientTest, StartTwiceIsRejected) {
    ProtocolClient client(fake_agent("normal"));
    ASSERT_FALSE(is_error(client.start()));
    auto again = client.start();
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "already_running");
    client.stop();
}

TEST(ProtocolClientTest, MissingCommandIsReportedAtStart) {
    ClientOptions options;
    options.command = "acpbridge-definitely-not-installed";
    ProtocolClient client(options);
    auto started = client.start();
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).code, "command_not_found");
    EXPECT_NE(get_error(started).message.find("acpbridge-definitely-not-installed"),
              std::string::npos);
}

TEST(ProtocolClientTest, DispatchesNotificationsAndAnswersAgentRequests) {
    ProtocolClient client(fake_agent("callbacks"));

    std::mutex text_mutex;
    std::string text;
    client.on_notification([&](const std::string& method, const json& params) {
        if (method != "session/update") return;
        const json& content = params.at("update").at("content");
        std::lock_guard<std::mutex> lock(text_mutex);
        text += content.value("text", "");
    });

    std::vector<std::string> seen;
    std::mutex seen_mutex;
    client.on_request([&](const std::string& method, const json&) -> std::optional<CallResult> {
        {
            std::lock_guard<std::mutex> lock(seen_mutex);
            seen.push_back(method);
        }
        if (method != "session/request_permission") {
            return std::nullopt;
        }
        return CallResult{json{{"outcome", {{"outcome", "cancelled"}}}}};
    });

    ASSERT_FALSE(is_error(client.start()));
    auto result = call(client, "session/prompt",
                       json{{"sessionId", "sess-fake"},
                            {"prompt", json::array({{{"type", "text"}, {"text", "go"}}})}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("stopReason"), "end_turn");
    {
        std::lock_guard<std::mutex> lock(text_mutex);
        EXPECT_EQ(text, "permission=cancelled;");
    }
    {
        std::lock_guard<std::mutex> lock(seen_mutex);
        ASSERT_EQ(seen.size(), 1u);
        EXPECT_EQ(seen.front(), "session/request_permission");
    }
    client.stop();
}

TEST(ProtocolClientTest, ThrowingHandlerBecomesErrorReply) {
    ProtocolClient client(fake_agent("callbacks"));
    std::string text;
    std::mutex text_mutex;
    client.on_notification([&](const std::string&, const json& params) {
        std::lock_guard<std::mutex> lock(text_mutex);
        text += params.at("update").at("content").value("text", "");
    });
    client.on_request([](const std::string&, const json&) -> std::optional<CallResult> {
        throw std::runtime_error("handler exploded");
    });

    ASSERT_FALSE(is_error(client.start()));
    auto result = call(client, "session/prompt", json{{"sessionId", "sess-fake"}});
    ASSERT_FALSE(is_error(result));
    std::lock_guard<std::mutex> lock(text_mutex);
    EXPECT_EQ(text, "permission=;");
    client.stop();
}

TEST(ProtocolClientTest, NonStandardHandlerExceptionBecomesErrorReply) {
    ProtocolClient client(fake_agent("callbacks"));
    std::string text;
    std::mutex text_mutex;
    client.on_notification([&](const std::string&, const json& params) {
        std::lock_guard<std::mutex> lock(text_mutex);
        text += params.at("update").at("content").value("text", "");
    });
    client.on_request([](const std::string&, const json&) -> std::optional<CallResult> {
        throw 42;
    });

    ASSERT_FALSE(is_error(client.start()));
    auto result = call(client, "session/prompt", json{{"sessionId", "sess-fake"}});
    ASSERT_FALSE(is_error(result));
    std::lock_guard<std::mutex> lock(text_mutex);
    EXPECT_EQ(text, "permission=;");
    client.stop();
}

TEST(ProtocolClientTest, AnswersAgentRequestsThatUseStringIds) {
    ProtocolClient client(fake_agent("string-ids"));
    std::string text;
    std::mutex text_mutex;
    client.on_notification([&](const std::string&, const json& params) {
        std::lock_guard<std::mutex> lock(text_mutex);
        text += params.at("update").at("content").value("text", "");
    });
    client.on_request([](const std::string& method, const json&) -> std::optional<CallResult> {
        if (method != "session/request_permission") {
            return std::nullopt;
        }
        return CallResult{json{{"outcome", {{"outcome", "cancelled"}}}}};
    });

    ASSERT_FALSE(is_error(client.start()));
    auto result = call(client, "session/prompt", json{{"sessionId", "sess-fake"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("stopReason"), "end_turn");
    std::lock_guard<std::mutex> lock(text_mutex);
    EXPECT_EQ(text, "permission=cancelled;");
    client.stop();
}

TEST(ProtocolClientTest, RequestHandlersRunInOrderAndFirstAnswerWins) {
    ProtocolClient client(fake_agent("callbacks"));
    std::string text;
    std::mutex mutex;
    std::vector<std::string> order;
    client.on_notification([&](const std::string&, const json& params) {
        std::lock_guard<std::mutex> lock(mutex);
        text += params.at("update").at("content").value("text", "");
    });
    client.on_request([&](const std::string&, const json&) -> std::optional<CallResult> {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back("first");
        return std::nullopt;
    });
    client.on_request([&](const std::string&, const json&) -> std::optional<CallResult> {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back("second");
        return CallResult{json{{"outcome", {{"outcome", "cancelled"}}}}};
    });
    client.on_request([&](const std::string&, const json&) -> std::optional<CallResult> {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back("third");
        return CallResult{json{{"outcome", {{"outcome", "selected"}, {"optionId", "ok"}}}}};
    });

    ASSERT_FALSE(is_error(client.start()));
    auto result = call(client, "session/prompt", json{{"sessionId", "sess-fake"}});
    ASSERT_FALSE(is_error(result));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(text, "permission=cancelled;");
    EXPECT_EQ(order, (std::vector<std::string>{"first", "second"}));
    client.stop();
}

TEST(ProtocolClientTest, DuplicateAndUnknownResponsesAreDropped) {
    ProtocolClient client(fake_agent("duplicate-reply"));
    ASSERT_FALSE(is_error(client.start()));

    auto first = call(client, "echo", json{{"n", 1}});
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first).at("n"), 1);

    // The stray replies for the first call must not touch later ones.
    auto second = call(client, "echo", json{{"n", 2}});
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).at("n"), 2);
    EXPECT_FALSE(get_value(second).contains("stray"));

    EXPECT_EQ(client.pending_count(), 0u);
    EXPECT_TRUE(client.is_running());
    client.stop();
}

TEST(ProtocolClientTest, WriteFailureFailsOnlyThatCall) {
    ProtocolClient client(fake_agent("closed-stdin"));
    std::promise<void> closed;
    auto closed_signal = closed.get_future();
    std::once_flag once;
    client.on_notification([&](const std::string& method, const json&) {
        if (method == "test/stdin_closed") {
            std::call_once(once, [&]() { closed.set_value(); });
        }
    });
    ASSERT_FALSE(is_error(client.start()));
    ASSERT_EQ(closed_signal.wait_for(kWait), std::future_status::ready);

    auto first = call(client, "echo", json::object());
    ASSERT_TRUE(is_error(first));
    EXPECT_EQ(get_error(first).category, ErrorCategory::Transport);
    EXPECT_EQ(get_error(first).code, "write_failed");

    // The reader is still alive, so later calls fail on their own.
    EXPECT_TRUE(client.is_running());
    auto second = call(client, "echo", json::object());
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).code, "write_failed");
    EXPECT_EQ(client.pending_count(), 0u);
    client.stop();
}

TEST(ProtocolClientTest, ThrowingNotificationHandlerDoesNotStopReader) {
    ProtocolClient client(fake_agent("normal"));
    client.on_notification([](const std::string&, const json&) {
        throw std::runtime_error("notification handler exploded");
    });
    client.on_notification([](const std::string&, const json&) {
        throw 7;
    });
    std::mutex text_mutex;
    std::string text;
    client.on_notification([&](const std::string& method, const json& params) {
        if (method != "session/update") return;
        const json& update = params.at("update");
        if (update.value("sessionUpdate", "") != "agent_message_chunk") return;
        std::lock_guard<std::mutex> lock(text_mutex);
        text += update.at("content").value("text", "");
    });

    ASSERT_FALSE(is_error(client.start()));
    auto result = call(client, "session/prompt",
                       json{{"sessionId", "sess-fake"},
                            {"prompt", json::array({{{"type", "text"}, {"text", "hi"}}})}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("stopReason"), "end_turn");
    {
        std::lock_guard<std::mutex> lock(text_mutex);
        EXPECT_EQ(text, "Hello world");
    }

    auto after = call(client, "echo", json{{"still", "alive"}});
    ASSERT_FALSE(is_error(after));
    EXPECT_TRUE(client.is_running());
    client.stop();
}

}  // namespace
