#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace acpbridge::protocol {

    // Ids this side allocates for its own requests.
    using RequestId = std::int64_t;

    // Id as it appeared on the wire. Peers may use strings; replies echo it back.
    using MessageId = std::variant<std::int64_t, std::string>;

    inline std::string to_string(const MessageId& id) {
        if (const auto* number = std::get_if<std::int64_t>(&id)) {
            return std::to_string(*number);
        }
        return "\"" + std::get<std::string>(id) + "\"";
    }

    // Agent or orchestrator asks the other side to do something; expects a reply.
    struct Request {
        MessageId id;
        std::string method;
        nlohmann::json params;
    };

    // Successful reply to a Request with the same id.
    struct Response {
        MessageId id;
        nlohmann::json result;
    };

    // Failed reply to a Request with the same id.
    struct ErrorMessage {
        MessageId id;
        int code;
        std::string message;
        nlohmann::json data;
    };

    // One-way message. Never carries an id.
    struct Notification {
        std::string method;
        nlohmann::json params;
    };

    using Message = std::variant<Request, Response, ErrorMessage, Notification>;

    // A request already serialized and ready for the wire.
    struct EncodedRequest {
        RequestId id;
        std::string line;
    };

} // namespace acpbridge::protocol
