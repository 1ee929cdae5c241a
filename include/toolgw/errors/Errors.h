//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Gateway error taxonomy, JSON error-object mapping helpers, and the synchronous exception type
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolgw/JSONRPCTypes.h"

namespace toolgw {
namespace errors {

// Categorization of gateway failures. Standard JSON-RPC codes map onto the generic categories.
enum class ErrorCategory {
    ConfigNotFound,
    ServerDisabled,
    ConnectionFailed,
    Timeout,
    ProtocolError,
    ProcessExited,
    UnknownAction,
    UnknownTool,
    SessionNotFound,
    InvalidRequest,
    InvalidParams,
    ResourceNotFound,
    Internal
};

// Typed error representation used across the gateway.
struct GatewayError {
    int code{JSONRPCErrorCodes::InternalError};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Internal};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or gateway-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Internal when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ConfigNotFound: return ErrorCategory::ConfigNotFound;
        case JSONRPCErrorCodes::ServerDisabled: return ErrorCategory::ServerDisabled;
        case JSONRPCErrorCodes::ConnectionFailed: return ErrorCategory::ConnectionFailed;
        case JSONRPCErrorCodes::Timeout: return ErrorCategory::Timeout;
        case JSONRPCErrorCodes::ProtocolError: return ErrorCategory::ProtocolError;
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::ProtocolError;
        case JSONRPCErrorCodes::ProcessExited: return ErrorCategory::ProcessExited;
        case JSONRPCErrorCodes::UnknownAction: return ErrorCategory::UnknownAction;
        case JSONRPCErrorCodes::UnknownTool: return ErrorCategory::UnknownTool;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::UnknownTool;
        case JSONRPCErrorCodes::SessionNotFound: return ErrorCategory::SessionNotFound;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::InvalidRequest;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::InvalidParams;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::ResourceNotFound;
        default: return ErrorCategory::Internal;
    }
}

// Canonical code for a category (inverse of errorCategoryFromCode for gateway codes).
inline int codeForCategory(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ConfigNotFound: return JSONRPCErrorCodes::ConfigNotFound;
        case ErrorCategory::ServerDisabled: return JSONRPCErrorCodes::ServerDisabled;
        case ErrorCategory::ConnectionFailed: return JSONRPCErrorCodes::ConnectionFailed;
        case ErrorCategory::Timeout: return JSONRPCErrorCodes::Timeout;
        case ErrorCategory::ProtocolError: return JSONRPCErrorCodes::ProtocolError;
        case ErrorCategory::ProcessExited: return JSONRPCErrorCodes::ProcessExited;
        case ErrorCategory::UnknownAction: return JSONRPCErrorCodes::UnknownAction;
        case ErrorCategory::UnknownTool: return JSONRPCErrorCodes::UnknownTool;
        case ErrorCategory::SessionNotFound: return JSONRPCErrorCodes::SessionNotFound;
        case ErrorCategory::InvalidRequest: return JSONRPCErrorCodes::InvalidRequest;
        case ErrorCategory::InvalidParams: return JSONRPCErrorCodes::InvalidParams;
        case ErrorCategory::ResourceNotFound: return JSONRPCErrorCodes::ResourceNotFound;
        case ErrorCategory::Internal: return JSONRPCErrorCodes::InternalError;
    }
    return JSONRPCErrorCodes::InternalError;
}

inline const char* categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ConfigNotFound: return "ConfigNotFound";
        case ErrorCategory::ServerDisabled: return "ServerDisabled";
        case ErrorCategory::ConnectionFailed: return "ConnectionFailed";
        case ErrorCategory::Timeout: return "Timeout";
        case ErrorCategory::ProtocolError: return "ProtocolError";
        case ErrorCategory::ProcessExited: return "ProcessExited";
        case ErrorCategory::UnknownAction: return "UnknownAction";
        case ErrorCategory::UnknownTool: return "UnknownTool";
        case ErrorCategory::SessionNotFound: return "SessionNotFound";
        case ErrorCategory::InvalidRequest: return "InvalidRequest";
        case ErrorCategory::InvalidParams: return "InvalidParams";
        case ErrorCategory::ResourceNotFound: return "ResourceNotFound";
        case ErrorCategory::Internal: return "Internal";
    }
    return "Internal";
}

// Coarse HTTP-like status class for a category (404/400/502/504/500).
inline int statusClassFor(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ConfigNotFound:
        case ErrorCategory::SessionNotFound:
        case ErrorCategory::ResourceNotFound:
        case ErrorCategory::UnknownTool:
            return 404;
        case ErrorCategory::ServerDisabled:
        case ErrorCategory::InvalidRequest:
        case ErrorCategory::InvalidParams:
        case ErrorCategory::UnknownAction:
            return 400;
        case ErrorCategory::ConnectionFailed:
        case ErrorCategory::ProtocolError:
        case ErrorCategory::ProcessExited:
            return 502;
        case ErrorCategory::Timeout:
            return 504;
        case ErrorCategory::Internal:
            return 500;
    }
    return 500;
}

// Message safe to hand back to callers. Internal errors never expose their detail.
inline std::string publicMessage(const GatewayError& err) {
    if (err.category == ErrorCategory::Internal || err.message.empty()) {
        return "Internal error";
    }
    return err.message;
}

// Build a typed error for a category with the category's canonical code.
inline GatewayError makeError(ErrorCategory category, std::string message,
                              std::optional<JSONValue> data = std::nullopt) {
    GatewayError e;
    e.code = codeForCategory(category);
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = category;
    return e;
}

// Convert a JSON error object (shape: { code, message, data? }) to GatewayError.
// A bare string is accepted as a message with the ProtocolError code.
// Returns std::nullopt when the input is neither.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<GatewayError> populated when shape is valid.
inline std::optional<GatewayError> gatewayErrorFromErrorValue(const JSONValue& errVal) {
    if (std::holds_alternative<std::string>(errVal.value)) {
        return makeError(ErrorCategory::ProtocolError, std::get<std::string>(errVal.value));
    }
    if (!std::holds_alternative<JSONValue::Object>(errVal.value)) {
        return std::nullopt;
    }
    auto message = GetString(errVal, "message");
    if (!message) {
        return std::nullopt;
    }
    auto code = GetInteger(errVal, "code");

    GatewayError e;
    e.code = code ? static_cast<int>(*code) : JSONRPCErrorCodes::ProtocolError;
    e.message = std::move(*message);
    if (const JSONValue* d = FindMember(errVal, "data")) {
        e.data = *d;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract GatewayError from a JSONRPCResponse if it carries an error.
inline std::optional<GatewayError> gatewayErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return gatewayErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed GatewayError.
inline JSONValue makeErrorValue(const GatewayError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from GatewayError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const GatewayError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// GatewayException
// Purpose: Thrown by synchronous gateway entry points (ResolveServer, AvailableActions, ...). Carries the
//          typed error so boundaries can map it to a status class.
//==========================================================================================================
class GatewayException : public std::runtime_error {
public:
    explicit GatewayException(GatewayError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}
    GatewayException(ErrorCategory category, const std::string& message)
        : GatewayException(makeError(category, message)) {}

    const GatewayError& error() const noexcept { return error_; }
    ErrorCategory category() const noexcept { return error_.category; }
    int statusClass() const noexcept { return statusClassFor(error_.category); }

private:
    GatewayError error_;
};

} // namespace errors
} // namespace toolgw
