//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: ServerConfig JSON mapping and the in-memory configuration store
//==========================================================================================================

#include <algorithm>
#include <format>

#include "logging/Logger.h"
#include "toolgw/ServerConfig.h"
#include "toolgw/errors/Errors.h"

namespace toolgw {

using errors::ErrorCategory;
using errors::GatewayException;

const char* TransportKindName(TransportKind kind) {
    return kind == TransportKind::Remote ? "remote" : "stdio";
}

ServerConfig ParseServerConfig(const JSONValue& json) {
    FUNC_SCOPE();
    if (!json.IsObject()) {
        throw GatewayException(ErrorCategory::InvalidRequest, "Server config must be an object");
    }
    ServerConfig config;
    auto id = GetString(json, "id");
    if (!id || id->empty()) {
        throw GatewayException(ErrorCategory::InvalidRequest, "Server config requires a non-empty id");
    }
    config.id = *id;
    config.name = GetString(json, "name").value_or(config.id);
    config.enabled = GetBool(json, "enabled").value_or(true);

    const std::string type = GetString(json, "type").value_or("stdio");
    if (type == "stdio") {
        StdioSettings s;
        auto command = GetString(json, "command");
        if (!command || command->empty()) {
            throw GatewayException(ErrorCategory::InvalidRequest,
                                   std::format("Server '{}' of type stdio requires a command", config.id));
        }
        s.command = *command;
        if (const JSONValue* args = FindMember(json, "args"); args && args->IsArray()) {
            for (const auto& a : std::get<JSONValue::Array>(args->value)) {
                if (!a || !a->IsString()) {
                    throw GatewayException(ErrorCategory::InvalidRequest,
                                           std::format("Server '{}' args must be strings", config.id));
                }
                s.args.push_back(std::get<std::string>(a->value));
            }
        }
        s.workingDirectory = GetString(json, "workingDirectory").value_or("");
        if (const JSONValue* env = FindMember(json, "env"); env && env->IsObject()) {
            for (const auto& [k, v] : std::get<JSONValue::Object>(env->value)) {
                if (v && v->IsString()) {
                    s.env.emplace_back(k, std::get<std::string>(v->value));
                }
            }
            std::sort(s.env.begin(), s.env.end());
        }
        config.settings = std::move(s);
    } else if (type == "remote" || type == "sse") {
        auto url = GetString(json, "url");
        if (!url || url->empty()) {
            throw GatewayException(ErrorCategory::InvalidRequest,
                                   std::format("Server '{}' of type {} requires a url", config.id, type));
        }
        config.settings = RemoteSettings{*url};
    } else {
        throw GatewayException(ErrorCategory::InvalidRequest,
                               std::format("Server '{}' has unknown type '{}'", config.id, type));
    }
    return config;
}

JSONValue ServerConfigToJSON(const ServerConfig& config) {
    JSONValue::Object obj;
    SetMember(obj, "id", JSONValue(config.id));
    SetMember(obj, "name", JSONValue(config.name));
    SetMember(obj, "enabled", JSONValue(config.enabled));
    SetMember(obj, "type", JSONValue(TransportKindName(config.Kind())));
    if (const StdioSettings* s = config.Stdio()) {
        SetMember(obj, "command", JSONValue(s->command));
        JSONValue::Array args;
        for (const auto& a : s->args) {
            args.push_back(std::make_shared<JSONValue>(a));
        }
        SetMember(obj, "args", JSONValue(std::move(args)));
        if (!s->workingDirectory.empty()) {
            SetMember(obj, "workingDirectory", JSONValue(s->workingDirectory));
        }
        if (!s->env.empty()) {
            JSONValue::Object env;
            for (const auto& [k, v] : s->env) {
                SetMember(env, k, JSONValue(v));
            }
            SetMember(obj, "env", JSONValue(std::move(env)));
        }
    } else if (const RemoteSettings* r = config.Remote()) {
        SetMember(obj, "url", JSONValue(r->url));
    }
    return JSONValue(std::move(obj));
}

std::optional<ServerConfig> InMemoryServerConfigStore::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(id);
    if (it == configs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ServerConfig> InMemoryServerConfigStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerConfig> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(configs_.at(id));
    }
    return out;
}

bool InMemoryServerConfigStore::Add(ServerConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (configs_.count(config.id) != 0) {
        return false;
    }
    order_.push_back(config.id);
    const std::string id = config.id;
    configs_.emplace(id, std::move(config));
    LOG_DEBUG("Config store: added '{}'", id);
    return true;
}

bool InMemoryServerConfigStore::Update(ServerConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(config.id);
    if (it == configs_.end()) {
        return false;
    }
    if (it->second.Kind() != config.Kind()) {
        throw GatewayException(ErrorCategory::InvalidRequest,
                               std::format("Server '{}' transport kind cannot change from {} to {}", config.id,
                                           TransportKindName(it->second.Kind()), TransportKindName(config.Kind())));
    }
    it->second = std::move(config);
    return true;
}

bool InMemoryServerConfigStore::Remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (configs_.erase(id) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return true;
}

std::size_t InMemoryServerConfigStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configs_.size();
}

std::size_t LoadServerConfigs(const std::string& json, InMemoryServerConfigStore& store) {
    FUNC_SCOPE();
    JSONValue doc = ParseJSON(json);
    const JSONValue* list = &doc;
    if (doc.IsObject()) {
        list = FindMember(doc, "servers");
    }
    if (!list || !list->IsArray()) {
        throw GatewayException(ErrorCategory::InvalidRequest, "Expected a \"servers\" array");
    }
    std::size_t loaded = 0;
    for (const auto& entry : std::get<JSONValue::Array>(list->value)) {
        if (!entry) {
            continue;
        }
        ServerConfig config = ParseServerConfig(*entry);
        const std::string id = config.id;
        if (!store.Add(config) && !store.Update(std::move(config))) {
            throw GatewayException(ErrorCategory::Internal, std::format("Server '{}' could not be stored", id));
        }
        ++loaded;
    }
    LOG_INFO("Loaded {} server configuration(s)", loaded);
    return loaded;
}

} // namespace toolgw
