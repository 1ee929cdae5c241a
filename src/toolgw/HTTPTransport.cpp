//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/toolgw/HTTPTransport.cpp
// Purpose: HTTP/HTTPS JSON-RPC client transport using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "toolgw/JSONRPCTypes.h"
#include "toolgw/HTTPTransport.hpp"
#include "toolgw/StdioEnvelope.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace toolgw {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
// Outcome of one POST. error is set when no HTTP response was read.
struct PostResult {
    unsigned int status{0};
    std::string body;
    std::string error;
};

bool isPortString(const std::string& s) {
    if (s.empty() || s.size() > 5) {
        return false;
    }
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return std::stoul(s) <= 65535u;
}

std::string trimmed(const std::string& s) {
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// Writes the request and reads one response on an already connected stream.
template <typename Stream>
net::awaitable<PostResult> exchange(Stream& stream, http::request<http::string_body>& req, unsigned int readTimeoutMs) {
    beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(readTimeoutMs));
    co_await http::async_write(stream, req, net::use_awaitable);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, net::use_awaitable);
    PostResult out;
    out.status = res.result_int();
    out.body = std::move(res.body());
    co_return out;
}
} // namespace

std::optional<HTTPTransport::Options> HTTPTransport::Options::FromUrl(const std::string& url) {
    Options opts;
    std::string rest = url;
    if (const auto sep = url.find("://"); sep != std::string::npos) {
        opts.scheme = url.substr(0, sep);
        rest = url.substr(sep + 3);
    } else {
        opts.scheme = "http";
    }
    if (opts.scheme != "http" && opts.scheme != "https") {
        return std::nullopt;
    }

    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    opts.path = slash == std::string::npos ? std::string("/") : rest.substr(slash);

    if (const auto colon = authority.find(':'); colon != std::string::npos) {
        opts.host = authority.substr(0, colon);
        opts.port = authority.substr(colon + 1);
        if (!isPortString(opts.port)) {
            return std::nullopt;
        }
    } else {
        opts.host = authority;
        opts.port = opts.scheme == "https" ? "443" : "80";
    }
    if (opts.host.empty()) {
        return std::nullopt;
    }
    opts.serverName = opts.host;
    return opts;
}

class HTTPTransport::Impl {
public:
    using ResponsePromise = std::promise<std::unique_ptr<JSONRPCResponse>>;

    HTTPTransport::Options opts;
    std::string endpoint; // host:port/path, for log lines
    std::atomic<bool> connected{false};

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::unique_ptr<ssl::context> sslCtx;
    std::string trustError; // non-empty when a configured CA could not be loaded

    std::mutex handlerMutex;
    HTTPTransport::ErrorHandler errorHandler;

    // Keyed by a per-POST ticket so duplicate JSON-RPC ids cannot collide.
    std::mutex inFlightMutex;
    uint64_t nextTicket{0};
    std::unordered_map<uint64_t, std::pair<JSONRPCId, ResponsePromise>> inFlight;

    explicit Impl(const HTTPTransport::Options& o)
        : opts(o), endpoint(std::format("{}:{}{}", o.host, o.port, o.path)) {
        if (opts.scheme == "https") {
            initTls();
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void initTls() {
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        ::ERR_clear_error();
        sslCtx->set_verify_mode(ssl::verify_peer);

        boost::system::error_code ec;
        if (opts.caFile.empty() && opts.caPath.empty()) {
            sslCtx->set_default_verify_paths(ec);
            if (ec) {
                LOG_DEBUG("HTTPS {}: no default trust store: {}", endpoint, ec.message());
            }
            return;
        }
        if (!opts.caFile.empty()) {
            sslCtx->load_verify_file(opts.caFile, ec);
        }
        if (!ec && !opts.caPath.empty()) {
            sslCtx->add_verify_path(opts.caPath, ec);
        }
        if (ec) {
            trustError = std::format("HTTPS: failed to load caFile/caPath: {}", ec.message());
            LOG_ERROR("{} ({})", trustError, endpoint);
        }
    }

    void reportError(const std::string& msg) {
        LOG_WARN("HTTPTransport[{}]: {}", endpoint, msg);
        HTTPTransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(msg);
        }
    }

    http::request<http::string_body> makeRequest(std::string body) const {
        http::request<http::string_body> req{http::verb::post, opts.path, 11};
        req.set(http::field::host, opts.serverName.empty() ? opts.host : opts.serverName);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        req.body() = std::move(body);
        req.prepare_payload();
        return req;
    }

    // One POST on a fresh connection.
    net::awaitable<PostResult> coPost(std::string body) {
        auto req = makeRequest(std::move(body));
        auto executor = co_await net::this_coro::executor;
        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);

        if (!sslCtx) {
            beast::tcp_stream stream(executor);
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);
            PostResult out = co_await exchange(stream, req, opts.readTimeoutMs);
            boost::system::error_code ignored;
            stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
            co_return out;
        }

        if (!trustError.empty()) {
            throw std::runtime_error(trustError);
        }
        beast::ssl_stream<beast::tcp_stream> stream(executor, *sslCtx);
        const std::string& name = opts.serverName.empty() ? opts.host : opts.serverName;
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), name.c_str()) ||
            !::SSL_set1_host(stream.native_handle(), name.c_str())) {
            throw std::runtime_error("HTTPS: failed to set server name " + name);
        }
        beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
        co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
        PostResult out = co_await exchange(stream, req, opts.readTimeoutMs);
        boost::system::error_code ignored;
        stream.shutdown(ignored);
        co_return out;
    }

    // Runs coPost on the I/O thread and hands the outcome to done; connection errors land in result.error.
    void post(std::string body, std::function<void(PostResult)> done) {
        net::co_spawn(ioc, coPost(std::move(body)),
            [this, done = std::move(done)](std::exception_ptr eptr, PostResult result) {
                if (eptr) {
                    try {
                        std::rethrow_exception(eptr);
                    } catch (const std::exception& e) {
                        result.error = std::format("HTTP request failed: {}", e.what());
                    }
                }
                if (!result.error.empty()) {
                    reportError(result.error);
                }
                done(std::move(result));
            });
    }

    uint64_t track(const JSONRPCId& id, ResponsePromise promise) {
        std::lock_guard<std::mutex> lk(inFlightMutex);
        const uint64_t ticket = ++nextTicket;
        inFlight.emplace(ticket, std::make_pair(id, std::move(promise)));
        return ticket;
    }

    void complete(uint64_t ticket, std::unique_ptr<JSONRPCResponse> response) {
        ResponsePromise promise;
        {
            std::lock_guard<std::mutex> lk(inFlightMutex);
            auto it = inFlight.find(ticket);
            if (it == inFlight.end()) {
                return; // already failed by Close()
            }
            promise = std::move(it->second.second);
            inFlight.erase(it);
        }
        promise.set_value(std::move(response));
    }

    void failInFlight(const std::string& message) {
        std::unordered_map<uint64_t, std::pair<JSONRPCId, ResponsePromise>> drained;
        {
            std::lock_guard<std::mutex> lk(inFlightMutex);
            drained.swap(inFlight);
        }
        for (auto& [ticket, entry] : drained) {
            entry.second.set_value(CreateErrorResponse(entry.first, JSONRPCErrorCodes::ConnectionFailed, message));
        }
    }
};

HTTPTransport::HTTPTransport(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPTransport::~HTTPTransport() {
    if (pImpl->connected.load() || pImpl->ioThread.joinable()) {
        Close().get();
    }
}

std::future<void> HTTPTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->ioThread.joinable()) {
        ready.set_value();
        return fut;
    }
    pImpl->ioc.restart();
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
        net::make_work_guard(pImpl->ioc));
    pImpl->connected.store(true);
    Impl* impl = pImpl.get();
    pImpl->ioThread = std::thread([impl]() {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            impl->reportError(std::format("I/O loop stopped: {}", e.what()));
        }
    });
    LOG_DEBUG("HTTPTransport[{}] started", pImpl->endpoint);
    ready.set_value();
    return fut;
}

std::future<void> HTTPTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->connected.store(false);
    pImpl->workGuard.reset();
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    pImpl->failInFlight("Transport closed");
    done.set_value();
    return fut;
}

bool HTTPTransport::IsConnected() const {
    return pImpl->connected.load();
}

const HTTPTransport::Options& HTTPTransport::GetOptions() const {
    return pImpl->opts;
}

std::future<std::unique_ptr<JSONRPCResponse>> HTTPTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    if (!request) {
        return MakeReadyFuture(CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Null request"));
    }
    if (!pImpl->connected.load()) {
        return MakeReadyFuture(
            CreateErrorResponse(request->id, JSONRPCErrorCodes::ConnectionFailed, "Transport not connected"));
    }

    Impl::ResponsePromise promise;
    auto fut = promise.get_future();
    const JSONRPCId id = request->id;
    const uint64_t ticket = pImpl->track(id, std::move(promise));

    Impl* impl = pImpl.get();
    pImpl->post(request->Serialize(), [impl, ticket, id](PostResult result) {
        if (!result.error.empty()) {
            impl->complete(ticket, CreateErrorResponse(id, JSONRPCErrorCodes::ConnectionFailed, result.error));
            return;
        }
        auto response = std::make_unique<JSONRPCResponse>();
        if (result.body.empty() || !response->Deserialize(result.body)) {
            impl->complete(ticket, CreateErrorResponse(id, JSONRPCErrorCodes::ProtocolError,
                std::format("Invalid/empty HTTP response (status {})", result.status)));
            return;
        }
        impl->complete(ticket, std::move(response));
    });
    return fut;
}

std::future<void> HTTPTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    if (!notification) {
        done->set_value();
        return fut;
    }
    if (!pImpl->connected.load()) {
        done->set_exception(std::make_exception_ptr(std::runtime_error("Transport not connected")));
        return fut;
    }
    pImpl->post(notification->Serialize(), [done](PostResult result) {
        if (!result.error.empty()) {
            done->set_exception(std::make_exception_ptr(std::runtime_error(result.error)));
        } else if (result.status >= 400) {
            done->set_exception(std::make_exception_ptr(
                std::runtime_error(std::format("Notification rejected with HTTP status {}", result.status))));
        } else {
            done->set_value();
        }
    });
    return fut;
}

void HTTPTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

std::unique_ptr<ITransport> HTTPTransportFactory::CreateTransport(const std::string& config) {
    if (config.find("://") != std::string::npos && config.find('=') == std::string::npos) {
        auto fromUrl = HTTPTransport::Options::FromUrl(config);
        if (!fromUrl) {
            LOG_ERROR("HTTPTransportFactory: invalid URL '{}'", config);
            return nullptr;
        }
        return std::make_unique<HTTPTransport>(*fromUrl);
    }

    HTTPTransport::Options opts;
    auto setMs = [](unsigned int& target) {
        return [&target](const std::string& val) {
            try {
                target = static_cast<unsigned int>(std::stoul(val));
                return true;
            } catch (const std::logic_error&) {
                return false;
            }
        };
    };
    auto setText = [](std::string& target) {
        return [&target](const std::string& val) {
            target = val;
            return true;
        };
    };
    const std::unordered_map<std::string, std::function<bool(const std::string&)>> setters{
        {"url", [&opts](const std::string& val) {
             auto parsed = HTTPTransport::Options::FromUrl(val);
             if (!parsed) {
                 return false;
             }
             parsed->caFile = opts.caFile;
             parsed->caPath = opts.caPath;
             parsed->connectTimeoutMs = opts.connectTimeoutMs;
             parsed->readTimeoutMs = opts.readTimeoutMs;
             opts = *parsed;
             return true;
         }},
        {"scheme", setText(opts.scheme)},
        {"host", setText(opts.host)},
        {"port", setText(opts.port)},
        {"path", setText(opts.path)},
        {"serverName", setText(opts.serverName)},
        {"caFile", setText(opts.caFile)},
        {"caPath", setText(opts.caPath)},
        {"connectTimeoutMs", setMs(opts.connectTimeoutMs)},
        {"readTimeoutMs", setMs(opts.readTimeoutMs)},
    };

    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) {
            sep = config.size();
        }
        const std::string item = config.substr(start, sep - start);
        start = sep + 1;
        const auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key = trimmed(item.substr(0, eq));
        const std::string val = trimmed(item.substr(eq + 1));
        auto it = setters.find(key);
        if (it == setters.end()) {
            LOG_WARN("HTTPTransportFactory: unknown option '{}'", key);
        } else if (!it->second(val)) {
            LOG_WARN("HTTPTransportFactory: ignoring invalid {}='{}'", key, val);
        }
    }
    return std::make_unique<HTTPTransport>(opts);
}

} // namespace toolgw
