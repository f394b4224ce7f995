//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures for the client engine: JSON-RPC error mapping, engine error classes,
//          transport exceptions and structured operation outcomes
//==========================================================================================================

#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

#include "mcpio/JSONRPCTypes.h"

namespace mcpio {
namespace errors {

///////////////////////////////////////// JSON-RPC errors ///////////////////////////////////////////
// Categorization of JSON-RPC and MCP error codes seen by the client.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    RequestCancelled,
    Unknown
};

// Typed view of a JSON-RPC error object.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::RequestCancelled: return ErrorCategory::RequestCancelled;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetIntMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(code.value());
    e.message = std::move(message.value());
    if (const JSONValue* data = FindMember(errVal, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

///////////////////////////////////////// Cancellation ///////////////////////////////////////////
constexpr int CANCELLED_ERROR_CODE = JSONRPCErrorCodes::RequestCancelled;

//==========================================================================================================
// IsRequestCancelledError
// Purpose: True when an error object (or a message carrying one under "error" or "params") reports a
//          cancelled request: code -32800, or a message mentioning "cancelled" in any letter case.
//==========================================================================================================
inline bool IsRequestCancelledError(const JSONValue& value) {
    if (!value.isObject()) {
        return false;
    }
    if (auto code = GetIntMember(value, "code"); code.has_value() && code.value() == CANCELLED_ERROR_CODE) {
        return true;
    }
    if (auto msg = GetStringMember(value, "message"); msg.has_value()) {
        std::string lower = msg.value();
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower.find("cancelled") != std::string::npos) {
            return true;
        }
    }
    if (const JSONValue* inner = FindMember(value, "error")) {
        return IsRequestCancelledError(*inner);
    }
    return false;
}

// Error object { code: -32800, message: "Request cancelled[: reason]" }
inline JSONValue CreateCancellationError(const std::optional<std::string>& reason = std::nullopt) {
    std::string message = "Request cancelled";
    if (reason.has_value() && !reason->empty()) {
        message += ": " + reason.value();
    }
    return CreateErrorObject(CANCELLED_ERROR_CODE, message);
}

///////////////////////////////////////// Engine errors ///////////////////////////////////////////
//==========================================================================================================
// ErrorClass
// Purpose: Taxonomy of errors reported to error observers.
//   Framing: malformed header, invalid length or unparsable JSON span. Local and recoverable.
//   Transport: spawn failure, startup timeout, stream error, unexpected exit. Fatal to one channel.
//   ProtocolLogic: operations on unknown or finished ids and resources. Returned as outcomes.
//   ResourceExhaustion: buffer ceiling exceeded; buffer reset.
//==========================================================================================================
enum class ErrorClass {
    Framing,
    Transport,
    ProtocolLogic,
    ResourceExhaustion
};

inline const char* errorClassName(ErrorClass c) {
    switch (c) {
        case ErrorClass::Framing: return "framing";
        case ErrorClass::Transport: return "transport";
        case ErrorClass::ProtocolLogic: return "protocol";
        case ErrorClass::ResourceExhaustion: return "resource-exhaustion";
    }
    return "unknown";
}

struct EngineError {
    ErrorClass errorClass{ErrorClass::Framing};
    std::string message;
};

///////////////////////////////////////// Transport errors ///////////////////////////////////////////
enum class TransportErrc {
    AlreadyStarted,
    SpawnFailed,
    StartupTimeout,
    ProcessExitedEarly,
    NotConnected,
    WriteFailed,
    WriteQueueOverflow,
    Closed
};

inline const char* transportErrcName(TransportErrc c) {
    switch (c) {
        case TransportErrc::AlreadyStarted: return "AlreadyStarted";
        case TransportErrc::SpawnFailed: return "SpawnFailed";
        case TransportErrc::StartupTimeout: return "StartupTimeout";
        case TransportErrc::ProcessExitedEarly: return "ProcessExitedEarly";
        case TransportErrc::NotConnected: return "NotConnected";
        case TransportErrc::WriteFailed: return "WriteFailed";
        case TransportErrc::WriteQueueOverflow: return "WriteQueueOverflow";
        case TransportErrc::Closed: return "Closed";
    }
    return "Unknown";
}

//==========================================================================================================
// TransportError
// Purpose: Exception set on futures returned by Start/Send when the channel fails outright.
// Fields:
//   code(): Failure kind.
//   exitCode(): Child exit status for ProcessExitedEarly (127 when exec itself failed).
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    TransportError(TransportErrc code, const std::string& what, std::optional<int> exitCode = std::nullopt)
        : std::runtime_error(std::string(transportErrcName(code)) + ": " + what),
          errc(code), exit(exitCode) {}

    TransportErrc code() const noexcept { return errc; }
    std::optional<int> exitCode() const noexcept { return exit; }

private:
    TransportErrc errc;
    std::optional<int> exit;
};

///////////////////////////////////////// Outcomes ///////////////////////////////////////////
enum class OutcomeCode {
    Ok,
    NotFound,
    UnsupportedByServer,
    NotInitialized,
    SendFailed,
    RemoteError,
    Exception
};

inline const char* outcomeCodeName(OutcomeCode c) {
    switch (c) {
        case OutcomeCode::Ok: return "Ok";
        case OutcomeCode::NotFound: return "NotFound";
        case OutcomeCode::UnsupportedByServer: return "UnsupportedByServer";
        case OutcomeCode::NotInitialized: return "NotInitialized";
        case OutcomeCode::SendFailed: return "SendFailed";
        case OutcomeCode::RemoteError: return "RemoteError";
        case OutcomeCode::Exception: return "Exception";
    }
    return "Unknown";
}

//==========================================================================================================
// Outcome
// Purpose: Structured result for protocol-logic operations (subscribe, unsubscribe, outbound sends).
//==========================================================================================================
struct Outcome {
    bool success{true};
    OutcomeCode code{OutcomeCode::Ok};
    std::string message;

    static Outcome Ok() { return Outcome{}; }
    static Outcome Fail(OutcomeCode c, std::string msg) { return Outcome{false, c, std::move(msg)}; }
};

//==========================================================================================================
// CancellationResult
// Purpose: One cancel outcome. reason echoes the caller's reason; error explains a failure.
//==========================================================================================================
struct CancellationResult {
    bool success{false};
    JSONRPCId requestId;
    std::optional<std::string> reason;
    std::optional<std::string> error;
};

} // namespace errors
} // namespace mcpio
