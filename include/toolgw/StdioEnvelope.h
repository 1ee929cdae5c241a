//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioEnvelope.h
// Purpose: Building outbound stdio envelopes and interpreting inbound replies
//==========================================================================================================
#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>

#include "toolgw/JSONRPCTypes.h"

namespace toolgw {

// {id, type:"readResource", resource:uri}
JSONValue MakeReadResourceEnvelope(const std::string& id, const std::string& uri);
// {id, type:"callTool", tool:name, parameters:params}
JSONValue MakeCallToolEnvelope(const std::string& id, const std::string& toolName, const JSONValue& params);
// {id, type:"getCapabilities"}
JSONValue MakeGetCapabilitiesEnvelope(const std::string& id);
// {id, method, params?}
JSONValue MakeMethodEnvelope(const std::string& id, const std::string& method, const std::optional<JSONValue>& params);

// Correlation id of a reply: "id" (string or integer) or the legacy "requestId".
std::optional<std::string> ReplyId(const JSONValue& reply);

//==========================================================================================================
// ResponseFromReply
// Purpose: Maps a reply object onto a JSONRPCResponse.
//   - error object {code?, message}: kept (code defaults to ProtocolError)
//   - error string or status:"error": ProtocolError with that message
//   - otherwise: result member when present, else the whole reply
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> ResponseFromReply(const std::string& id, const JSONValue& reply);

// Future that is already satisfied with the given response.
std::future<std::unique_ptr<JSONRPCResponse>> MakeReadyFuture(std::unique_ptr<JSONRPCResponse> response);

// Future that is already satisfied with an error response.
std::future<std::unique_ptr<JSONRPCResponse>> MakeErrorFuture(const std::string& id, int code, const std::string& message);

// Future that is already satisfied with a success response.
std::future<std::unique_ptr<JSONRPCResponse>> MakeResultFuture(const std::string& id, JSONValue result);

} // namespace toolgw
