//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.hpp
// Purpose: Coroutine-based HTTP/HTTPS JSON-RPC client transport using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <future>
#include <optional>

#include "toolgw/Transport.h"

namespace toolgw {

//==========================================================================================================
// HTTPTransport
// Purpose: Remote tool-server endpoint reached by one POST per message. Requests and notifications share
//          the endpoint path; each POST runs as a coroutine on the transport's io_context thread.
//==========================================================================================================
class HTTPTransport : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   scheme: "http" or "https"
    //   host/port: Endpoint address
    //   path: Request target for every POST
    //   serverName: TLS SNI and hostname verification name (https only; defaults to host)
    //   caFile/caPath: Optional trust store overrides
    //   connectTimeoutMs/readTimeoutMs: Per-POST socket deadlines
    //==========================================================================================================
    struct Options {
        std::string scheme{"https"};
        std::string host{"localhost"};
        std::string port{"443"};
        std::string path{"/rpc"};
        std::string serverName;
        std::string caFile;
        std::string caPath;
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};

        // "scheme://host[:port]/path"; std::nullopt when the scheme is not http/https, the host is empty
        // or the port is not a number in range.
        static std::optional<Options> FromUrl(const std::string& url);
    };

    explicit HTTPTransport(const Options& opts);
    ~HTTPTransport() override;

    std::future<void> Start() override;

    // Stops the I/O thread; requests still in flight complete with ConnectionFailed.
    std::future<void> Close() override;

    bool IsConnected() const override;

    //==========================================================================================================
    // Sends a JSON-RPC request. Connection failures complete with ConnectionFailed; an empty or unparseable
    // body completes with ProtocolError.
    //==========================================================================================================
    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetErrorHandler(ErrorHandler handler) override;

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// HTTPTransportFactory
// Purpose: Creates HTTP/HTTPS transports from a URL or from "key=value;" pairs
//          (url, scheme, host, port, path, serverName, caFile, caPath, connectTimeoutMs, readTimeoutMs).
//==========================================================================================================
class HTTPTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace toolgw
