//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FilesystemServerAdapter.cpp
// Purpose: Filesystem tool server adapter and registry
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "logging/Logger.h"
#include "toolgw/ChildProcess.hpp"
#include "toolgw/ContentFramer.h"
#include "toolgw/FilesystemServerAdapter.hpp"
#include "toolgw/PendingOperations.h"
#include "toolgw/Protocol.h"
#include "toolgw/StdioEnvelope.h"
#include "toolgw/errors/Errors.h"

namespace fs = std::filesystem;

namespace toolgw {

using errors::ErrorCategory;
using errors::GatewayException;

namespace {
constexpr const char* kFilesystemMarker = "server-filesystem";
constexpr const char* kResourcePrefix = "resource://";

std::atomic<uint64_t> gFsOperationCounter{0};

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tmv{};
    gmtime_r(&t, &tmv);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmv);
    return std::string(buf);
}

JSONValue toolParam(const char* description) {
    JSONValue::Object p;
    SetMember(p, "type", JSONValue("string"));
    SetMember(p, "description", JSONValue(description));
    return JSONValue(std::move(p));
}

JSONValue toolDescriptor(const char* name, const char* description,
                         std::vector<std::pair<const char*, const char*>> props,
                         std::vector<const char*> required) {
    JSONValue::Object properties;
    for (const auto& [key, desc] : props) {
        SetMember(properties, key, toolParam(desc));
    }
    JSONValue::Array req;
    for (const char* r : required) {
        req.push_back(std::make_shared<JSONValue>(r));
    }
    JSONValue::Object schema;
    SetMember(schema, "type", JSONValue("object"));
    SetMember(schema, "properties", JSONValue(std::move(properties)));
    SetMember(schema, "required", JSONValue(std::move(req)));

    JSONValue::Object tool;
    SetMember(tool, "name", JSONValue(name));
    SetMember(tool, "description", JSONValue(description));
    SetMember(tool, "parameters", JSONValue(std::move(schema)));
    return JSONValue(std::move(tool));
}

JSONValue resourceDescriptor(const char* name, const char* description, const char* uriTemplate) {
    JSONValue::Object r;
    SetMember(r, "name", JSONValue(name));
    SetMember(r, "description", JSONValue(description));
    SetMember(r, "uriTemplate", JSONValue(uriTemplate));
    return JSONValue(std::move(r));
}

bool isSupportedEncoding(const std::optional<std::string>& encoding) {
    return !encoding || *encoding == "utf8" || *encoding == "utf-8";
}
} // namespace

bool IsFilesystemServer(const ServerConfig& config) {
    const StdioSettings* s = config.Stdio();
    if (!s) {
        return false;
    }
    if (s->command.find(kFilesystemMarker) != std::string::npos) {
        return true;
    }
    return std::any_of(s->args.begin(), s->args.end(),
                       [](const std::string& a) { return a.find(kFilesystemMarker) != std::string::npos; });
}

std::string ResolveFilesystemRoot(const StdioSettings& settings) {
    std::error_code ec;
    fs::path root;
    if (!settings.workingDirectory.empty()) {
        root = settings.workingDirectory;
    } else {
        for (auto it = settings.args.rbegin(); it != settings.args.rend(); ++it) {
            if (fs::is_directory(*it, ec)) {
                root = *it;
                break;
            }
        }
    }
    if (root.empty()) {
        root = fs::current_path(ec);
    }
    fs::path canonical = fs::weakly_canonical(root, ec);
    return ec ? root.lexically_normal().string() : canonical.string();
}

class FilesystemServerAdapter::Impl {
public:
    ServerConfig config;
    FilesystemAdapterOptions options;
    std::string rootDirectory;

    std::mutex lifecycleMutex;
    std::unique_ptr<ChildProcess> process;
    std::unique_ptr<IContentFramer> framer;
    std::string buffer; // reader thread only
    std::shared_ptr<PendingOperations> pending;
    std::atomic<bool> ready{false};
    std::atomic<bool> stopping{false};
    std::chrono::system_clock::time_point startedAt{};

    std::mutex exitMutex;
    std::condition_variable exitCv;
    bool exited{false};

    std::atomic<bool> sweeping{false};
    std::mutex sweepMutex;
    std::condition_variable sweepCv;
    std::thread sweeperThread;

    Impl(ServerConfig cfg, FilesystemAdapterOptions opts)
        : config(std::move(cfg)), options(opts), pending(std::make_shared<PendingOperations>()) {
        if (const StdioSettings* s = config.Stdio()) {
            rootDirectory = ResolveFilesystemRoot(*s);
        }
    }

    void startSweeper() {
        sweeping = true;
        sweeperThread = std::thread([this]() {
            while (sweeping) {
                {
                    std::unique_lock<std::mutex> lk(sweepMutex);
                    sweepCv.wait_for(lk, std::chrono::milliseconds(50), [this]() { return !sweeping.load(); });
                }
                (void)pending->ExpireDue(PendingOperations::Clock::now());
            }
        });
    }

    void stopSweeper() {
        sweeping = false;
        sweepCv.notify_all();
        if (sweeperThread.joinable()) {
            sweeperThread.join();
        }
    }

    bool running() const {
        return ready && process && process->IsRunning();
    }

    void onStdout(const std::string& chunk) {
        buffer.append(chunk);
        while (auto object = framer->tryDecode(buffer)) {
            handleObject(*object);
        }
    }

    void handleObject(const std::string& text) {
        JSONValue reply;
        try {
            reply = ParseJSON(text);
        } catch (const std::runtime_error& e) {
            LOG_DEBUG("[{}] ProtocolError: brace-matched text is not JSON ({})", config.id, e.what());
            return;
        }
        auto id = ReplyId(reply);
        if (!id) {
            LOG_DEBUG("[{}] object without id ignored", config.id);
            return;
        }
        if (!pending->Complete(*id, ResponseFromReply(*id, reply))) {
            LOG_DEBUG("[{}] reply for unknown operation '{}' dropped", config.id, *id);
        }
    }

    void onExit(const ExitStatus& status) {
        ready = false;
        const std::string reason = stopping ? std::string("Process terminated") : DescribeExit(status);
        std::size_t failed = pending->FailAll(JSONRPCErrorCodes::ProcessExited, reason);
        LOG_INFO("Filesystem server '{}': {} ({} pending operation(s) failed)", config.id, reason, failed);
        {
            std::lock_guard<std::mutex> lk(exitMutex);
            exited = true;
        }
        exitCv.notify_all();
    }

    //==========================================================================================================
    // resolvePath
    // Purpose: Maps a tool path (relative to the root, or absolute) to a canonical path inside the root.
    // Throws:
    //   GatewayException(InvalidParams) when the path escapes the root.
    //==========================================================================================================
    fs::path resolvePath(const std::string& requested) const {
        const fs::path root(rootDirectory);
        fs::path candidate(requested.empty() ? std::string(".") : requested);
        if (candidate.is_relative()) {
            candidate = root / candidate;
        }
        std::error_code ec;
        fs::path resolved = fs::weakly_canonical(candidate, ec);
        if (ec) {
            resolved = candidate.lexically_normal();
        }
        fs::path rel = resolved.lexically_relative(root);
        if (rel.empty() || *rel.begin() == "..") {
            throw GatewayException(ErrorCategory::InvalidParams,
                                   std::format("Path escapes the allowed directory: {}", requested));
        }
        return resolved;
    }

    static std::string requirePath(const JSONValue& params) {
        auto path = GetString(params, "path");
        if (!path) {
            throw GatewayException(ErrorCategory::InvalidParams, "Missing required parameter: path");
        }
        return *path;
    }

    JSONValue readFile(const JSONValue& params) const {
        const std::string path = requirePath(params);
        if (!isSupportedEncoding(GetString(params, "encoding"))) {
            throw GatewayException(ErrorCategory::InvalidParams, "Unsupported encoding");
        }
        fs::path target = resolvePath(path);
        std::error_code ec;
        if (!fs::exists(target, ec)) {
            throw GatewayException(ErrorCategory::ResourceNotFound, std::format("File not found: {}", path));
        }
        if (!fs::is_regular_file(target, ec)) {
            throw GatewayException(ErrorCategory::InvalidParams, std::format("Not a file: {}", path));
        }
        std::ifstream in(target, std::ios::binary);
        if (!in) {
            throw GatewayException(ErrorCategory::Internal, std::format("Cannot open {}", target.string()));
        }
        std::ostringstream content;
        content << in.rdbuf();

        JSONValue::Object out;
        SetMember(out, "content", JSONValue(content.str()));
        SetMember(out, "path", JSONValue(path));
        return JSONValue(std::move(out));
    }

    JSONValue writeFile(const JSONValue& params) const {
        const std::string path = requirePath(params);
        auto content = GetString(params, "content");
        if (!content) {
            throw GatewayException(ErrorCategory::InvalidParams, "Missing required parameter: content");
        }
        if (!isSupportedEncoding(GetString(params, "encoding"))) {
            throw GatewayException(ErrorCategory::InvalidParams, "Unsupported encoding");
        }
        fs::path target = resolvePath(path);
        std::error_code ec;
        if (fs::is_directory(target, ec)) {
            throw GatewayException(ErrorCategory::InvalidParams, std::format("Not a file: {}", path));
        }
        if (!fs::is_directory(target.parent_path(), ec)) {
            throw GatewayException(ErrorCategory::ResourceNotFound, std::format("Directory not found for {}", path));
        }
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << *content;
        out.close();
        if (!out) {
            throw GatewayException(ErrorCategory::Internal, std::format("Cannot write {}", target.string()));
        }
        JSONValue::Object result;
        SetMember(result, "success", JSONValue(true));
        SetMember(result, "path", JSONValue(path));
        return JSONValue(std::move(result));
    }

    JSONValue listFiles(const JSONValue& params) const {
        const std::string path = GetString(params, "path").value_or(".");
        fs::path target = resolvePath(path);
        std::error_code ec;
        if (!fs::is_directory(target, ec)) {
            throw GatewayException(ErrorCategory::ResourceNotFound, std::format("Directory not found: {}", path));
        }
        std::vector<fs::directory_entry> entries;
        for (fs::directory_iterator it(target, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(*it);
        }
        if (ec) {
            throw GatewayException(ErrorCategory::Internal, std::format("Cannot list {}: {}", target.string(), ec.message()));
        }
        std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
            return a.path().filename() < b.path().filename();
        });
        JSONValue::Array listing;
        for (const auto& e : entries) {
            std::error_code typeEc;
            JSONValue::Object item;
            SetMember(item, "name", JSONValue(e.path().filename().string()));
            SetMember(item, "isDirectory", JSONValue(e.is_directory(typeEc)));
            SetMember(item, "isFile", JSONValue(e.is_regular_file(typeEc)));
            listing.push_back(std::make_shared<JSONValue>(std::move(item)));
        }
        return JSONValue(std::move(listing));
    }

    JSONValue status() const {
        JSONValue::Object out;
        SetMember(out, "status", JSONValue("running"));
        SetMember(out, "pid", JSONValue(static_cast<int64_t>(process ? process->GetPid() : 0)));
        SetMember(out, "startedAt", JSONValue(isoTimestamp(startedAt)));
        SetMember(out, "rootDirectory", JSONValue(rootDirectory));
        return JSONValue(std::move(out));
    }

    ResponseFuture forward(const std::string& toolName, const JSONValue& params) {
        const std::string opId = std::format("{}-fs-{}", config.id, ++gFsOperationCounter);
        JSONValue envelope = MakeMethodEnvelope(opId, toolName, params);
        SetMember(std::get<JSONValue::Object>(envelope.value), "jsonrpc", JSONValue("2.0"));
        auto future = pending->Add(opId, toolName, options.requestTimeout);
        LOG_DEBUG("[{}] forwarding tool '{}' as {}", config.id, toolName, opId);
        if (!process->Write(framer->encode(SerializeJSON(envelope)))) {
            (void)pending->Fail(opId, JSONRPCErrorCodes::ProcessExited,
                                std::format("Failed to write to filesystem server {}", config.id));
        }
        return future;
    }

    ResponseFuture notRunning(const std::string& opName) const {
        return MakeErrorFuture(opName, JSONRPCErrorCodes::ProcessExited,
                               std::format("Filesystem server {} is not running", config.id));
    }
};

FilesystemServerAdapter::FilesystemServerAdapter(ServerConfig config, FilesystemAdapterOptions options)
    : pImpl(std::make_unique<Impl>(std::move(config), options)) {
    FUNC_SCOPE();
}

FilesystemServerAdapter::~FilesystemServerAdapter() {
    FUNC_SCOPE();
    (void)Stop();
}

bool FilesystemServerAdapter::Start() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->lifecycleMutex);
    if (pImpl->running()) {
        return true;
    }
    const StdioSettings* settings = pImpl->config.Stdio();
    if (!settings) {
        LOG_ERROR("Filesystem server '{}' has no stdio settings", pImpl->config.id);
        return false;
    }
    if (pImpl->process) {
        // Previous incarnation exited; reap it before spawning again
        pImpl->process->Terminate(pImpl->options.stopGrace);
        pImpl->stopSweeper();
    }

    pImpl->process = std::make_unique<ChildProcess>();
    pImpl->framer = MakeObjectScanFramer(pImpl->options.maxBufferBytes);
    pImpl->buffer.clear();
    pImpl->stopping = false;
    pImpl->ready = false;
    {
        std::lock_guard<std::mutex> lk(pImpl->exitMutex);
        pImpl->exited = false;
    }

    SpawnOptions spawn;
    spawn.command = settings->command;
    spawn.args = settings->args;
    spawn.workingDirectory = pImpl->rootDirectory;
    spawn.env = settings->env;
    spawn.env.emplace_back("TOOLGW_SERVER_ID", pImpl->config.id);
    spawn.env.emplace_back("MCP_SERVER_ID", pImpl->config.id);

    Impl* impl = pImpl.get();
    pImpl->process->SetStdoutHandler([impl](const std::string& chunk) { impl->onStdout(chunk); });
    pImpl->process->SetStderrHandler([impl](const std::string& chunk) {
        std::string text = chunk;
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
            text.pop_back();
        }
        LOG_INFO("[{} stderr] {}", impl->config.id, text);
    });
    pImpl->process->SetExitHandler([impl](const ExitStatus& status) { impl->onExit(status); });

    LOG_INFO("Starting filesystem server '{}' in {}", pImpl->config.id, pImpl->rootDirectory);
    std::string error;
    if (!pImpl->process->Spawn(spawn, error)) {
        LOG_ERROR("ConnectionFailed: could not start filesystem server '{}': {}", pImpl->config.id, error);
        pImpl->process.reset();
        return false;
    }
    pImpl->startedAt = std::chrono::system_clock::now();
    pImpl->startSweeper();

    // The server prints no ready signal; wait the grace delay unless it dies first
    bool died = false;
    {
        std::unique_lock<std::mutex> lk(pImpl->exitMutex);
        died = pImpl->exitCv.wait_for(lk, pImpl->options.readyDelay, [impl]() { return impl->exited; });
    }
    if (died) {
        LOG_ERROR("ConnectionFailed: filesystem server '{}' exited during startup", pImpl->config.id);
        return false;
    }
    pImpl->ready = true;
    return true;
}

bool FilesystemServerAdapter::Stop() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->lifecycleMutex);
    if (!pImpl->process) {
        pImpl->stopSweeper();
        return true;
    }
    pImpl->stopping = true;
    pImpl->ready = false;
    (void)pImpl->pending->FailAll(JSONRPCErrorCodes::ProcessExited, "Process terminated");
    pImpl->process->Terminate(pImpl->options.stopGrace);
    pImpl->process.reset();
    pImpl->stopSweeper();
    return true;
}

bool FilesystemServerAdapter::IsRunning() const {
    return pImpl->running();
}

FilesystemServerAdapter::ResponseFuture FilesystemServerAdapter::GetCapabilities() {
    if (!pImpl->running()) {
        return pImpl->notRunning(EnvelopeTypes::GetCapabilities);
    }
    return MakeResultFuture(EnvelopeTypes::GetCapabilities, DefaultCapabilities());
}

FilesystemServerAdapter::ResponseFuture FilesystemServerAdapter::ReadResource(const std::string& uri) {
    FUNC_SCOPE();
    if (!pImpl->running()) {
        return pImpl->notRunning(uri);
    }
    const std::string prefix(kResourcePrefix);
    if (uri.compare(0, prefix.size(), prefix) != 0) {
        return MakeErrorFuture(uri, JSONRPCErrorCodes::ResourceNotFound, std::format("Invalid resource URI: {}", uri));
    }
    const std::string rest = uri.substr(prefix.size());
    const std::size_t slash = rest.find('/');
    const std::string kind = rest.substr(0, slash);
    const std::string path = slash == std::string::npos ? std::string() : rest.substr(slash + 1);

    if (kind == "status" && path.empty()) {
        return MakeResultFuture(uri, pImpl->status());
    }
    JSONValue::Object params;
    if (kind == "directory") {
        SetMember(params, "path", JSONValue(path.empty() ? std::string(".") : path));
        return CallTool("listFiles", JSONValue(std::move(params)));
    }
    if (kind == "file" && !path.empty()) {
        SetMember(params, "path", JSONValue(path));
        return CallTool("readFile", JSONValue(std::move(params)));
    }
    return MakeErrorFuture(uri, JSONRPCErrorCodes::ResourceNotFound, std::format("Unknown resource: {}", uri));
}

FilesystemServerAdapter::ResponseFuture FilesystemServerAdapter::CallTool(const std::string& toolName,
                                                                          const JSONValue& params) {
    FUNC_SCOPE();
    if (!pImpl->running()) {
        return pImpl->notRunning(toolName);
    }
    try {
        if (toolName == "readFile") {
            return MakeResultFuture(toolName, pImpl->readFile(params));
        }
        if (toolName == "writeFile") {
            return MakeResultFuture(toolName, pImpl->writeFile(params));
        }
        if (toolName == "listFiles") {
            return MakeResultFuture(toolName, pImpl->listFiles(params));
        }
    } catch (const GatewayException& e) {
        LOG_WARN("[{}] {} failed: {}", pImpl->config.id, toolName, e.what());
        return MakeReadyFuture(errors::makeErrorResponse(toolName, e.error()));
    }
    return pImpl->forward(toolName, params);
}

const std::string& FilesystemServerAdapter::ServerId() const {
    return pImpl->config.id;
}

const std::string& FilesystemServerAdapter::RootDirectory() const {
    return pImpl->rootDirectory;
}

std::size_t FilesystemServerAdapter::PendingCount() const {
    return pImpl->pending->Size();
}

JSONValue FilesystemServerAdapter::DefaultCapabilities() {
    JSONValue::Array resources;
    resources.push_back(std::make_shared<JSONValue>(
        resourceDescriptor("Directory", "Directory contents", "resource://directory/{path}")));
    resources.push_back(std::make_shared<JSONValue>(
        resourceDescriptor("File", "File contents", "resource://file/{path}")));
    resources.push_back(std::make_shared<JSONValue>(
        resourceDescriptor("Status", "Server status information", "resource://status")));

    JSONValue::Array tools;
    tools.push_back(std::make_shared<JSONValue>(toolDescriptor(
        "readFile", "Read a file from the filesystem",
        {{"path", "Path to the file"}, {"encoding", "File encoding (default: utf8)"}}, {"path"})));
    tools.push_back(std::make_shared<JSONValue>(toolDescriptor(
        "writeFile", "Write a file to the filesystem",
        {{"path", "Path to the file"}, {"content", "Content to write"}, {"encoding", "File encoding (default: utf8)"}},
        {"path", "content"})));
    tools.push_back(std::make_shared<JSONValue>(toolDescriptor(
        "listFiles", "List files in a directory", {{"path", "Path to the directory"}}, {"path"})));

    JSONValue::Object caps;
    SetMember(caps, "name", JSONValue("filesystem"));
    SetMember(caps, "version", JSONValue("1.0.0"));
    SetMember(caps, "resources", JSONValue(std::move(resources)));
    SetMember(caps, "tools", JSONValue(std::move(tools)));
    return JSONValue(std::move(caps));
}

//////////////////////////////////////////// FilesystemServerRegistry ////////////////////////////////////////////

FilesystemServerRegistry::FilesystemServerRegistry(FilesystemAdapterOptions options) : options_(options) {}

FilesystemServerRegistry::~FilesystemServerRegistry() {
    StopAllServers();
}

bool FilesystemServerRegistry::StartServer(const ServerConfig& config) {
    FUNC_SCOPE();
    if (config.Kind() != TransportKind::Stdio) {
        LOG_ERROR("Filesystem server '{}' must use the stdio transport", config.id);
        return false;
    }
    std::lock_guard<std::mutex> startLock(startMutex_);
    std::shared_ptr<FilesystemServerAdapter> adapter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(config.id);
        if (it == servers_.end()) {
            adapter = std::make_shared<FilesystemServerAdapter>(config, options_);
            servers_.emplace(config.id, adapter);
        } else {
            adapter = it->second;
        }
    }
    return adapter->Start();
}

std::shared_ptr<FilesystemServerAdapter> FilesystemServerRegistry::GetServer(const std::string& serverId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(serverId);
    return it == servers_.end() ? nullptr : it->second;
}

bool FilesystemServerRegistry::StopServer(const std::string& serverId) {
    FUNC_SCOPE();
    std::shared_ptr<FilesystemServerAdapter> adapter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(serverId);
        if (it == servers_.end()) {
            return false;
        }
        adapter = it->second;
        servers_.erase(it);
    }
    return adapter->Stop();
}

void FilesystemServerRegistry::StopAllServers() {
    for (const auto& id : ListServers()) {
        (void)StopServer(id);
    }
}

std::vector<std::string> FilesystemServerRegistry::ListServers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(servers_.size());
    for (const auto& kv : servers_) {
        ids.push_back(kv.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace toolgw
