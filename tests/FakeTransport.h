//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FakeTransport.h
// Purpose: In-process ITransport that answers initialize, tools/call and resources/read for tests
//==========================================================================================================

#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "toolgw/JSONRPCTypes.h"
#include "toolgw/Transport.h"

namespace toolgw {
namespace testing_support {

// Observable state shared by every transport a FakeTransportFactory creates.
struct FakeServerState {
    std::mutex mutex;
    std::vector<std::string> methods;
    std::vector<std::string> notifications;
    std::vector<std::string> configs;
    bool failInitialize{false};
    bool failNotifications{false};
    std::atomic<int> closes{0};

    std::vector<std::string> Methods() {
        std::lock_guard<std::mutex> lock(mutex);
        return methods;
    }
};

class FakeTransport : public ITransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeServerState> state) : state_(std::move(state)) {}

    std::future<void> Start() override {
        connected_ = true;
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }

    std::future<void> Close() override {
        connected_ = false;
        ++state_->closes;
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }

    bool IsConnected() const override { return connected_; }

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(std::unique_ptr<JSONRPCRequest> request) override {
        std::promise<std::unique_ptr<JSONRPCResponse>> p;
        auto fut = p.get_future();
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->methods.push_back(request->method);
        }
        const JSONValue params = request->params.value_or(JSONValue(JSONValue::Object{}));
        if (request->method == "initialize") {
            if (state_->failInitialize) {
                p.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::InternalError, "not today"));
            } else {
                p.set_value(std::make_unique<JSONRPCResponse>(
                    request->id, ParseJSON(R"({"serverInfo":{"name":"fake-remote","version":"0.1"},"capabilities":{"tools":{}}})")));
            }
        } else if (request->method == "tools/call" && GetString(params, "name").value_or("") == "missing") {
            p.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::MethodNotFound, "Tool not found: missing"));
        } else {
            JSONValue::Object result;
            SetMember(result, "method", JSONValue(request->method));
            SetMember(result, "params", params);
            p.set_value(std::make_unique<JSONRPCResponse>(request->id, JSONValue(std::move(result))));
        }
        return fut;
    }

    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->notifications.push_back(notification->method);
        }
        std::promise<void> p;
        if (state_->failNotifications) {
            p.set_exception(std::make_exception_ptr(std::runtime_error("notify endpoint unavailable")));
        } else {
            p.set_value();
        }
        return p.get_future();
    }

    void SetErrorHandler(ErrorHandler) override {}

private:
    std::shared_ptr<FakeServerState> state_;
    std::atomic<bool> connected_{false};
};

class FakeTransportFactory : public ITransportFactory {
public:
    explicit FakeTransportFactory(std::shared_ptr<FakeServerState> state) : state_(std::move(state)) {}

    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->configs.push_back(config);
        }
        return std::make_unique<FakeTransport>(state_);
    }

private:
    std::shared_ptr<FakeServerState> state_;
};

} // namespace testing_support
} // namespace toolgw
