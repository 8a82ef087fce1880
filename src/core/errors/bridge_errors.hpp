#pragma once
#include <string>
#include <variant>

namespace acpbridge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., a callback arrived with a missing or malformed parameter
        Transport,  // E.g., the agent subprocess died or a pipe write failed
        Protocol,   // E.g., a line on the wire was not valid JSON-RPC
        Policy,     // E.g., permission denied by the configured mode
        Timeout,    // E.g., a request or a terminal wait exceeded its deadline
        Resource,   // E.g., unknown terminal id, path is a directory
        Internal    // E.g., C++ logic bug or an OS call we did not expect to fail
    };

    // JSON-RPC numeric codes written back to the agent.
    namespace rpc {
        constexpr int kParseError = -32700;
        constexpr int kMethodNotFound = -32601;
        constexpr int kInvalidParams = -32602;
        constexpr int kInternalError = -32603;
        constexpr int kOperationTimeout = -32000;
        constexpr int kResourceNotFound = -32001;
        constexpr int kInvalidResourceState = -32002;
    }  // namespace rpc

    // The standardized error payload
    struct BridgeError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        int rpc_code = rpc::kInternalError;
    };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // --- Shorthands for the errors that travel back over the wire ---

    inline BridgeError invalid_params(const std::string& message) {
        return BridgeError{ErrorCategory::Input, message, "invalid_params", "",
                           rpc::kInvalidParams};
    }

    inline BridgeError not_found(const std::string& message, const std::string& code) {
        return BridgeError{ErrorCategory::Resource, message, code, "",
                           rpc::kResourceNotFound};
    }

    inline BridgeError invalid_state(const std::string& message, const std::string& code) {
        return BridgeError{ErrorCategory::Resource, message, code, "",
                           rpc::kInvalidResourceState};
    }

    inline BridgeError timed_out(const std::string& message) {
        return BridgeError{ErrorCategory::Timeout, message, "operation_timeout", "",
                           rpc::kOperationTimeout};
    }

    inline BridgeError internal(const std::string& message, const std::string& code) {
        return BridgeError{ErrorCategory::Internal, message, code, "",
                           rpc::kInternalError};
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::Policy: return "policy";
            case ErrorCategory::Timeout: return "timeout";
            case ErrorCategory::Resource: return "resource";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace acpbridge::core::errors
