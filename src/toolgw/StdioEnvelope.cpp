//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioEnvelope.cpp
// Purpose: Stdio envelope construction and reply interpretation
//==========================================================================================================

#include "toolgw/StdioEnvelope.h"
#include "toolgw/Protocol.h"

namespace toolgw {

namespace {
JSONValue::Object baseEnvelope(const std::string& id) {
    JSONValue::Object obj;
    SetMember(obj, EnvelopeFields::Id, JSONValue(id));
    return obj;
}

// Codes in the gateway's own range describe gateway-side conditions; a server cannot claim them.
int upstreamCode(const std::optional<int64_t>& code) {
    if (!code || (*code >= JSONRPCErrorCodes::ResourceNotFound && *code <= JSONRPCErrorCodes::ConfigNotFound)) {
        return JSONRPCErrorCodes::ProtocolError;
    }
    return static_cast<int>(*code);
}
} // namespace

JSONValue MakeReadResourceEnvelope(const std::string& id, const std::string& uri) {
    auto obj = baseEnvelope(id);
    SetMember(obj, EnvelopeFields::Type, JSONValue(EnvelopeTypes::ReadResource));
    SetMember(obj, EnvelopeFields::Resource, JSONValue(uri));
    return JSONValue(std::move(obj));
}

JSONValue MakeCallToolEnvelope(const std::string& id, const std::string& toolName, const JSONValue& params) {
    auto obj = baseEnvelope(id);
    SetMember(obj, EnvelopeFields::Type, JSONValue(EnvelopeTypes::CallTool));
    SetMember(obj, EnvelopeFields::Tool, JSONValue(toolName));
    SetMember(obj, EnvelopeFields::Parameters, params);
    return JSONValue(std::move(obj));
}

JSONValue MakeGetCapabilitiesEnvelope(const std::string& id) {
    auto obj = baseEnvelope(id);
    SetMember(obj, EnvelopeFields::Type, JSONValue(EnvelopeTypes::GetCapabilities));
    return JSONValue(std::move(obj));
}

JSONValue MakeMethodEnvelope(const std::string& id, const std::string& method, const std::optional<JSONValue>& params) {
    auto obj = baseEnvelope(id);
    SetMember(obj, EnvelopeFields::Method, JSONValue(method));
    if (params.has_value()) {
        SetMember(obj, EnvelopeFields::Params, params.value());
    }
    return JSONValue(std::move(obj));
}

std::optional<std::string> ReplyId(const JSONValue& reply) {
    for (const char* key : {EnvelopeFields::Id, EnvelopeFields::LegacyId}) {
        const JSONValue* v = FindMember(reply, key);
        if (!v) {
            continue;
        }
        if (v->IsString()) {
            return std::get<std::string>(v->value);
        }
        if (std::holds_alternative<int64_t>(v->value)) {
            return std::to_string(std::get<int64_t>(v->value));
        }
    }
    return std::nullopt;
}

std::unique_ptr<JSONRPCResponse> ResponseFromReply(const std::string& id, const JSONValue& reply) {
    const JSONValue* err = FindMember(reply, EnvelopeFields::Error);
    const bool statusError = GetString(reply, EnvelopeFields::Status).value_or("") == "error";
    if (err && !err->IsNull()) {
        if (err->IsObject()) {
            auto code = GetInteger(*err, "code");
            auto message = GetString(*err, "message").value_or("Unknown error");
            std::optional<JSONValue> data;
            if (const JSONValue* d = FindMember(*err, "data")) {
                data = *d;
            }
            return CreateErrorResponse(id, upstreamCode(code), message, data);
        }
        if (err->IsString()) {
            return CreateErrorResponse(id, JSONRPCErrorCodes::ProtocolError, std::get<std::string>(err->value));
        }
        return CreateErrorResponse(id, JSONRPCErrorCodes::ProtocolError, SerializeJSON(*err));
    }
    if (statusError) {
        return CreateErrorResponse(id, JSONRPCErrorCodes::ProtocolError,
                                   GetString(reply, "message").value_or("Unknown error"));
    }
    const JSONValue* result = FindMember(reply, EnvelopeFields::Result);
    if (result && !result->IsNull()) {
        return std::make_unique<JSONRPCResponse>(id, *result);
    }
    return std::make_unique<JSONRPCResponse>(id, reply);
}

std::future<std::unique_ptr<JSONRPCResponse>> MakeReadyFuture(std::unique_ptr<JSONRPCResponse> response) {
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto fut = promise.get_future();
    promise.set_value(std::move(response));
    return fut;
}

std::future<std::unique_ptr<JSONRPCResponse>> MakeErrorFuture(const std::string& id, int code, const std::string& message) {
    return MakeReadyFuture(CreateErrorResponse(id, code, message));
}

std::future<std::unique_ptr<JSONRPCResponse>> MakeResultFuture(const std::string& id, JSONValue result) {
    return MakeReadyFuture(std::make_unique<JSONRPCResponse>(id, std::move(result)));
}

} // namespace toolgw
