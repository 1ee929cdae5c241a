//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command-line gateway example: loads server configs, dispatches one request, runs one action
//==========================================================================================================

#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "logging/Logger.h"
#include "toolgw/Gateway.h"
#include "toolgw/GatewayOptions.h"
#include "toolgw/agent/CadCamAgent.h"

using namespace toolgw;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--server")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static std::optional<std::string> readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void printUsage() {
    std::cout << "usage: stdio_gateway --config=servers.json --server=<id>\n"
                 "         [--tool=<name> --params=<json> | --resource=<uri>]\n"
                 "         [--options=\"request_timeout_ms=5000;ready_delay_ms=500\"] [--log=debug]\n"
                 "         [--action=<name> --context=<json>]\n";
}

static int printResponse(const std::unique_ptr<JSONRPCResponse>& response) {
    if (!response) {
        std::cerr << "no response" << std::endl;
        return 1;
    }
    if (response->IsError()) {
        auto err = errors::gatewayErrorFromResponse(*response);
        std::cerr << "error [" << (err ? errors::categoryName(err->category) : "Internal") << "] "
                  << GetString(*response->error, "message").value_or("") << std::endl;
        return 2;
    }
    std::cout << SerializeJSON(response->result.value_or(JSONValue())) << std::endl;
    return 0;
}

int main(int argc, char** argv) {
    if (auto lvl = getArgValue(argc, argv, "--log")) {
        Logger::setLogLevel(Logger::levelFromString(*lvl));
    } else {
        Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    }

    const GatewayOptions options = ParseGatewayOptions(getArgValue(argc, argv, "--options").value_or(""));

    InMemoryServerConfigStore store;
    if (auto path = getArgValue(argc, argv, "--config")) {
        auto text = readFile(*path);
        if (!text) {
            LOG_ERROR("Cannot read config file {}", *path);
            return 1;
        }
        try {
            const std::size_t n = LoadServerConfigs(*text, store);
            LOG_INFO("Loaded {} server configuration(s) from {}", n, *path);
        } catch (const std::exception& e) {
            LOG_ERROR("Invalid config file {}: {}", *path, e.what());
            return 1;
        }
    }

    StdioProcessManager processes(options.ProcessOptions());
    FilesystemServerRegistry filesystems(options.FilesystemOptions());
    TransportClientManager remotes;
    SessionManager sessions(options.maxHistoryItems);
    agent::CadCamAgent agent;
    Gateway gateway(store, processes, filesystems, remotes, sessions, agent);

    int rc = 0;
    auto server = getArgValue(argc, argv, "--server");
    auto action = getArgValue(argc, argv, "--action");
    if (!server && !action) {
        printUsage();
        return 1;
    }

    if (server) {
        std::unique_ptr<JSONRPCResponse> response;
        if (auto tool = getArgValue(argc, argv, "--tool")) {
            JSONValue params{JSONValue::Object{}};
            if (auto raw = getArgValue(argc, argv, "--params")) {
                try {
                    params = ParseJSON(*raw);
                } catch (const std::exception& e) {
                    LOG_ERROR("Invalid --params: {}", e.what());
                    return 1;
                }
            }
            response = gateway.Dispatch(*server, ToolCall{*tool, params}).get();
        } else if (auto uri = getArgValue(argc, argv, "--resource")) {
            response = gateway.Dispatch(*server, ResourceRef{*uri}).get();
        } else {
            response = gateway.GetCapabilities(*server).get();
        }
        rc = printResponse(response);
    }

    if (action && rc == 0) {
        const SessionInfo session = gateway.OpenSession();
        try {
            if (auto rawContext = getArgValue(argc, argv, "--context")) {
                gateway.ProcessContext(session.sessionId, ParseJSON(*rawContext));
            }
            for (const auto& candidate : gateway.AvailableActions(session.sessionId)) {
                LOG_INFO("available: {} ({})", candidate.name, candidate.description);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Context rejected: {}", e.what());
            rc = 1;
        }
        if (rc == 0) {
            agent::ActionRequest request;
            request.sessionId = session.sessionId;
            request.action = *action;
            ExecuteActionResponse result = gateway.ExecuteAction(request);
            std::cout << SerializeJSON(ExecuteActionResponseToJSON(result)) << std::endl;
            rc = result.success ? 0 : 2;
        }
    }

    gateway.Shutdown();
    return rc;
}
