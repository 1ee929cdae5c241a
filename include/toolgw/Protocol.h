//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Wire constants shared by the stdio envelope protocol and the remote JSON-RPC client
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"

namespace toolgw {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version announced by the remote client during initialize
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

// Client identity announced to remote servers and used in default capabilities
constexpr const char* CLIENT_NAME = "toolgw";

///////////////////////////////////////// Remote JSON-RPC methods ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
}

///////////////////////////////////////// Stdio envelope types ///////////////////////////////////////////
// Value of the "type" member on line-delimited stdio requests.
namespace EnvelopeTypes {
    constexpr const char* ReadResource = "readResource";
    constexpr const char* CallTool = "callTool";
    constexpr const char* GetCapabilities = "getCapabilities";
}

// Member names used by stdio envelopes and replies.
namespace EnvelopeFields {
    constexpr const char* Id = "id";
    constexpr const char* LegacyId = "requestId";
    constexpr const char* Type = "type";
    constexpr const char* Method = "method";
    constexpr const char* Params = "params";
    constexpr const char* Resource = "resource";
    constexpr const char* Tool = "tool";
    constexpr const char* Parameters = "parameters";
    constexpr const char* Result = "result";
    constexpr const char* Error = "error";
    constexpr const char* Status = "status";
}

} // namespace toolgw
