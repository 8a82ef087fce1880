#include "protocol/message_codec.hpp"

#include <utility>

namespace acpbridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

std::atomic<RequestId> MessageCodec::next_id_{1};

namespace {

constexpr const char* kJsonRpcVersion = "2.0";

BridgeError parse_failure(const std::string& message) {
    return BridgeError{ErrorCategory::Protocol, message, "parse_error", "",
                       core::errors::rpc::kParseError};
}

bool read_id(const json& payload, MessageId& id) {
    const auto it = payload.find("id");
    if (it == payload.end()) {
        return false;
    }
    if (it->is_number_integer()) {
        id = it->get<std::int64_t>();
        return true;
    }
    if (it->is_string()) {
        id = it->get<std::string>();
        return true;
    }
    return false;
}

json id_to_json(const MessageId& id) {
    if (const auto* number = std::get_if<std::int64_t>(&id)) {
        return *number;
    }
    return std::get<std::string>(id);
}

// File contents may hold invalid UTF-8; replace it rather than throw.
std::string dump_line(const json& payload) {
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

json params_or_empty(const json& payload) {
    const auto it = payload.find("params");
    if (it == payload.end() || it->is_null()) {
        return json::object();
    }
    return *it;
}

}  // namespace

EncodedRequest MessageCodec::encode_request(const std::string& method,
                                            const json& params) const {
    const RequestId id = next_id_.fetch_add(1);
    json payload;
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id;
    payload["method"] = method;
    payload["params"] = params;
    return EncodedRequest{id, dump_line(payload)};
}

std::string MessageCodec::encode_notification(const std::string& method,
                                              const json& params) const {
    json payload;
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method;
    payload["params"] = params;
    return dump_line(payload);
}

std::string MessageCodec::encode_response(const MessageId& id, const json& result) const {
    json payload;
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_to_json(id);
    payload["result"] = result;
    return dump_line(payload);
}

std::string MessageCodec::encode_error(const MessageId& id, const int code,
                                       const std::string& message) const {
    json payload;
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_to_json(id);
    payload["error"] = {{"code", code}, {"message", message}};
    return dump_line(payload);
}

core::errors::Result<Message> MessageCodec::parse_line(const std::string& line) const {
    const json payload = json::parse(line, nullptr, false);
    if (payload.is_discarded()) {
        return parse_failure("Invalid JSON: " + line.substr(0, 120));
    }
    if (!payload.is_object()) {
        return parse_failure("JSON-RPC message must be an object.");
    }

    const bool has_method = payload.contains("method");
    const bool has_id = payload.contains("id") && !payload.at("id").is_null();
    MessageId id = std::int64_t{0};
    if (has_id && !read_id(payload, id)) {
        return parse_failure("JSON-RPC id must be an integer or a string.");
    }

    if (has_method) {
        if (!payload.at("method").is_string()) {
            return parse_failure("JSON-RPC method must be a string.");
        }
        const std::string method = payload.at("method").get<std::string>();
        if (has_id) {
            return Message{Request{id, method, params_or_empty(payload)}};
        }
        return Message{Notification{method, params_or_empty(payload)}};
    }

    if (!has_id) {
        return parse_failure("Message has neither method nor id.");
    }

    if (payload.contains("error")) {
        const json& error = payload.at("error");
        ErrorMessage message{id, core::errors::rpc::kInternalError, "Unknown error",
                             json()};
        if (error.is_object()) {
            const auto code = error.find("code");
            if (code != error.end() && code->is_number_integer()) {
                message.code = code->get<int>();
            }
            const auto text = error.find("message");
            if (text != error.end() && text->is_string()) {
                message.message = text->get<std::string>();
            }
            const auto data = error.find("data");
            if (data != error.end()) {
                message.data = *data;
            }
        }
        return Message{std::move(message)};
    }

    if (payload.contains("result")) {
        return Message{Response{id, payload.at("result")}};
    }

    return parse_failure("Message with id has neither result nor error.");
}

}  // namespace acpbridge::protocol
