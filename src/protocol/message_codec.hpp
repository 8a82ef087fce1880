#pragma once

#include <atomic>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/message.hpp"

namespace acpbridge::protocol {

// Builds and parses newline-delimited JSON-RPC 2.0 messages. No I/O.
class MessageCodec {
public:
    // Ids are drawn from a process-wide counter, so two codecs never hand out
    // the same id.
    EncodedRequest encode_request(const std::string& method,
                                  const nlohmann::json& params) const;

    std::string encode_notification(const std::string& method,
                                    const nlohmann::json& params) const;

    // Replies carry the request's id unchanged, integer or string.
    std::string encode_response(const MessageId& id, const nlohmann::json& result) const;

    std::string encode_error(const MessageId& id, int code, const std::string& message) const;

    // Classifies one line by shape. Malformed input yields a Protocol error.
    core::errors::Result<Message> parse_line(const std::string& line) const;

private:
    static std::atomic<RequestId> next_id_;
};

}  // namespace acpbridge::protocol
