//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioProcessManager.cpp
// Purpose: Stdio tool-server supervision and request correlation
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "toolgw/ChildProcess.hpp"
#include "toolgw/ContentFramer.h"
#include "toolgw/PendingOperations.h"
#include "toolgw/Protocol.h"
#include "toolgw/StdioEnvelope.h"
#include "toolgw/StdioProcessManager.hpp"
#include "toolgw/errors/Errors.h"

namespace toolgw {

namespace {
std::atomic<uint64_t> gOperationCounter{0};

int64_t steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

JSONValue defaultCapabilities(const std::string& name, const std::string& reason) {
    JSONValue::Object caps;
    SetMember(caps, "name", JSONValue(name));
    SetMember(caps, "version", JSONValue("1.0.0"));
    SetMember(caps, "instructions", JSONValue(std::format("stdio server capabilities could not be retrieved: {}", reason)));
    SetMember(caps, "resources", JSONValue(JSONValue::Array{}));
    SetMember(caps, "tools", JSONValue(JSONValue::Array{}));
    return JSONValue(std::move(caps));
}
} // namespace

class StdioProcessManager::Impl {
public:
    struct Entry {
        std::string serverId;
        std::string serverName;
        std::unique_ptr<ChildProcess> process;
        std::unique_ptr<IContentFramer> framer;
        std::string buffer; // touched only by the process reader thread
        PendingOperations pending;
        std::atomic<bool> stopping{false};
        std::atomic<int64_t> lastActivityMs{steadyNowMs()};
        std::mutex readyMutex;
        std::condition_variable readyCv;
        bool ready{false};
    };

    ProcessManagerOptions options;
    std::mutex startMutex;
    mutable std::mutex entriesMutex;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries;

    std::atomic<bool> sweeping{true};
    std::mutex sweepMutex;
    std::condition_variable sweepCv;
    std::thread sweeperThread;

    explicit Impl(ProcessManagerOptions opts) : options(opts) {
        sweeperThread = std::thread([this]() { sweepLoop(); });
    }

    ~Impl() {
        sweeping = false;
        sweepCv.notify_all();
        if (sweeperThread.joinable()) {
            sweeperThread.join();
        }
    }

    void sweepLoop() {
        while (sweeping) {
            {
                std::unique_lock<std::mutex> lk(sweepMutex);
                sweepCv.wait_for(lk, std::chrono::milliseconds(50), [this]() { return !sweeping.load(); });
            }
            auto now = PendingOperations::Clock::now();
            for (const auto& entry : snapshot()) {
                (void)entry->pending.ExpireDue(now);
            }
        }
    }

    std::vector<std::shared_ptr<Entry>> snapshot() const {
        std::lock_guard<std::mutex> lock(entriesMutex);
        std::vector<std::shared_ptr<Entry>> out;
        out.reserve(entries.size());
        for (const auto& kv : entries) {
            out.push_back(kv.second);
        }
        return out;
    }

    std::shared_ptr<Entry> find(const std::string& serverId) const {
        std::lock_guard<std::mutex> lock(entriesMutex);
        auto it = entries.find(serverId);
        return it == entries.end() ? nullptr : it->second;
    }

    static void markReady(Entry& entry) {
        {
            std::lock_guard<std::mutex> lk(entry.readyMutex);
            entry.ready = true;
        }
        entry.readyCv.notify_all();
    }

    void onStdout(Entry& entry, const std::string& chunk) {
        entry.lastActivityMs = steadyNowMs();
        entry.buffer.append(chunk);
        if (chunk.find('\n') != std::string::npos) {
            markReady(entry);
        }
        while (auto line = entry.framer->tryDecode(entry.buffer)) {
            handleLine(entry, *line);
        }
    }

    void handleLine(Entry& entry, const std::string& line) {
        LOG_DEBUG("[{}] <- {}", entry.serverId, line);
        JSONValue reply;
        try {
            reply = ParseJSON(line);
        } catch (const std::runtime_error& e) {
            LOG_WARN("[{}] ProtocolError: dropping unparseable line ({}): {}", entry.serverId, e.what(), line);
            return;
        }
        if (!reply.IsObject()) {
            LOG_WARN("[{}] ProtocolError: dropping non-object message: {}", entry.serverId, line);
            return;
        }
        auto id = ReplyId(reply);
        if (!id) {
            LOG_DEBUG("[{}] message without id ignored", entry.serverId);
            return;
        }
        if (!entry.pending.Complete(*id, ResponseFromReply(*id, reply))) {
            LOG_WARN("[{}] ProtocolError: reply for unknown operation '{}' dropped", entry.serverId, *id);
        }
    }

    void onExit(const std::shared_ptr<Entry>& entry, const ExitStatus& status) {
        {
            std::lock_guard<std::mutex> lock(entriesMutex);
            auto it = entries.find(entry->serverId);
            if (it != entries.end() && it->second == entry) {
                entries.erase(it);
            }
        }
        const std::string reason = entry->stopping ? std::string("Process terminated") : DescribeExit(status);
        std::size_t failed = entry->pending.FailAll(JSONRPCErrorCodes::ProcessExited, reason);
        if (!entry->stopping) {
            LOG_WARN("[{}] {} ({} pending operation(s) failed)", entry->serverId, reason, failed);
        }
        markReady(*entry);
    }

    ResponseFuture dispatch(const std::string& serverId, const std::string& opId, const std::string& requestType,
                            const JSONValue& envelope) {
        auto entry = find(serverId);
        if (!entry || !entry->process->IsRunning()) {
            return MakeErrorFuture(opId, JSONRPCErrorCodes::ProcessExited,
                                   std::format("Process for server {} is not running", serverId));
        }
        auto future = entry->pending.Add(opId, requestType, options.requestTimeout);
        entry->lastActivityMs = steadyNowMs();
        const std::string frame = entry->framer->encode(SerializeJSON(envelope));
        LOG_DEBUG("[{}] -> {} ({} bytes)", serverId, requestType, frame.size());
        if (!entry->process->Write(frame)) {
            (void)entry->pending.Fail(opId, JSONRPCErrorCodes::ProcessExited,
                                      std::format("Failed to write to process for server {}", serverId));
        }
        return future;
    }

    static std::string nextOperationId(const std::string& serverId) {
        return std::format("{}-{}", serverId, ++gOperationCounter);
    }
};

StdioProcessManager::StdioProcessManager(ProcessManagerOptions options)
    : pImpl(std::make_unique<Impl>(options)) {
    FUNC_SCOPE();
}

StdioProcessManager::~StdioProcessManager() {
    FUNC_SCOPE();
    StopAllProcesses();
}

bool StdioProcessManager::StartProcess(const ServerConfig& config) {
    FUNC_SCOPE();
    const StdioSettings* settings = config.Stdio();
    if (!settings) {
        LOG_ERROR("StartProcess: server '{}' is not a stdio server", config.id);
        return false;
    }

    std::lock_guard<std::mutex> startLock(pImpl->startMutex);
    if (auto existing = pImpl->find(config.id)) {
        if (existing->process->IsRunning()) {
            existing->lastActivityMs = steadyNowMs();
            return true;
        }
    }

    auto entry = std::make_shared<Impl::Entry>();
    entry->serverId = config.id;
    entry->serverName = config.name;
    entry->process = std::make_unique<ChildProcess>();
    entry->framer = MakeLineFramer(pImpl->options.maxLineBytes);

    SpawnOptions spawn;
    spawn.command = settings->command;
    spawn.args = settings->args;
    spawn.workingDirectory = settings->workingDirectory;
    spawn.env = settings->env;
    spawn.env.emplace_back("TOOLGW_SERVER_ID", config.id);
    spawn.env.emplace_back("MCP_SERVER_ID", config.id);

    Impl* impl = pImpl.get();
    std::weak_ptr<Impl::Entry> weak = entry;
    entry->process->SetStdoutHandler([impl, weak](const std::string& chunk) {
        if (auto e = weak.lock()) {
            impl->onStdout(*e, chunk);
        }
    });
    entry->process->SetStderrHandler([weak](const std::string& chunk) {
        if (auto e = weak.lock()) {
            e->lastActivityMs = steadyNowMs();
            std::string text = chunk;
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
                text.pop_back();
            }
            LOG_INFO("[{} stderr] {}", e->serverId, text);
        }
    });
    entry->process->SetExitHandler([impl, weak](const ExitStatus& status) {
        if (auto e = weak.lock()) {
            impl->onExit(e, status);
        }
    });

    LOG_INFO("Starting stdio server '{}': {}", config.id, settings->command);
    {
        // Registered before spawning so the exit handler always finds its own entry
        std::lock_guard<std::mutex> lock(pImpl->entriesMutex);
        pImpl->entries[config.id] = entry;
    }
    std::string error;
    if (!entry->process->Spawn(spawn, error)) {
        {
            std::lock_guard<std::mutex> lock(pImpl->entriesMutex);
            auto it = pImpl->entries.find(config.id);
            if (it != pImpl->entries.end() && it->second == entry) {
                pImpl->entries.erase(it);
            }
        }
        LOG_ERROR("ConnectionFailed: could not start server '{}': {}", config.id, error);
        return false;
    }

    {
        std::unique_lock<std::mutex> lk(entry->readyMutex);
        entry->readyCv.wait_for(lk, pImpl->options.readyDelay, [&entry]() { return entry->ready; });
    }
    if (!entry->process->IsRunning()) {
        LOG_ERROR("ConnectionFailed: server '{}' exited during startup", config.id);
        return false;
    }
    LOG_INFO("Stdio server '{}' is ready (pid {})", config.id, entry->process->GetPid());
    return true;
}

bool StdioProcessManager::IsRunning(const std::string& serverId) const {
    auto entry = pImpl->find(serverId);
    return entry && entry->process->IsRunning();
}

std::optional<pid_t> StdioProcessManager::ProcessId(const std::string& serverId) const {
    auto entry = pImpl->find(serverId);
    if (!entry || !entry->process->IsRunning()) {
        return std::nullopt;
    }
    return entry->process->GetPid();
}

StdioProcessManager::ResponseFuture StdioProcessManager::ReadResource(const std::string& serverId, const std::string& uri) {
    FUNC_SCOPE();
    const std::string opId = Impl::nextOperationId(serverId);
    return pImpl->dispatch(serverId, opId, EnvelopeTypes::ReadResource, MakeReadResourceEnvelope(opId, uri));
}

StdioProcessManager::ResponseFuture StdioProcessManager::CallTool(const std::string& serverId, const std::string& toolName,
                                                                  const JSONValue& params) {
    FUNC_SCOPE();
    const std::string opId = Impl::nextOperationId(serverId);
    return pImpl->dispatch(serverId, opId, EnvelopeTypes::CallTool, MakeCallToolEnvelope(opId, toolName, params));
}

StdioProcessManager::ResponseFuture StdioProcessManager::GetCapabilities(const std::string& serverId) {
    FUNC_SCOPE();
    auto entry = pImpl->find(serverId);
    const std::string name = entry ? entry->serverName : serverId;
    const std::string opId = Impl::nextOperationId(serverId);
    auto inner = pImpl->dispatch(serverId, opId, EnvelopeTypes::GetCapabilities, MakeGetCapabilitiesEnvelope(opId));
    return std::async(std::launch::async, [inner = std::move(inner), opId, name, serverId]() mutable {
        auto response = inner.get();
        if (!response || !response->IsError()) {
            return response;
        }
        auto err = errors::gatewayErrorFromResponse(*response);
        // Only a server that answered gets the fallback; timeouts and dead processes stay errors
        if (!err || err->category == errors::ErrorCategory::Timeout ||
            err->category == errors::ErrorCategory::ProcessExited) {
            return response;
        }
        LOG_WARN("[{}] getCapabilities failed ({}); using defaults", serverId, err->message);
        return std::make_unique<JSONRPCResponse>(opId, defaultCapabilities(name, err->message));
    });
}

StdioProcessManager::ResponseFuture StdioProcessManager::SendRequest(const std::string& serverId, const std::string& method,
                                                                     const std::optional<JSONValue>& params) {
    FUNC_SCOPE();
    const std::string opId = Impl::nextOperationId(serverId);
    return pImpl->dispatch(serverId, opId, method, MakeMethodEnvelope(opId, method, params));
}

bool StdioProcessManager::StopProcess(const std::string& serverId) {
    FUNC_SCOPE();
    std::shared_ptr<Impl::Entry> entry;
    {
        std::lock_guard<std::mutex> lock(pImpl->entriesMutex);
        auto it = pImpl->entries.find(serverId);
        if (it == pImpl->entries.end()) {
            return false;
        }
        entry = it->second;
        pImpl->entries.erase(it);
    }
    entry->stopping = true;
    std::size_t failed = entry->pending.FailAll(JSONRPCErrorCodes::ProcessExited, "Process terminated");
    LOG_INFO("Stopping stdio server '{}' ({} pending operation(s) failed)", serverId, failed);
    entry->process->Terminate(pImpl->options.stopGrace);
    return true;
}

void StdioProcessManager::StopAllProcesses() {
    FUNC_SCOPE();
    for (const auto& id : ListServers()) {
        (void)StopProcess(id);
    }
}

std::vector<std::string> StdioProcessManager::ListServers() const {
    std::lock_guard<std::mutex> lock(pImpl->entriesMutex);
    std::vector<std::string> ids;
    ids.reserve(pImpl->entries.size());
    for (const auto& kv : pImpl->entries) {
        if (kv.second->process->IsRunning()) {
            ids.push_back(kv.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t StdioProcessManager::CleanupIdleProcesses(std::chrono::milliseconds maxIdle) {
    FUNC_SCOPE();
    const int64_t now = steadyNowMs();
    std::vector<std::string> idle;
    for (const auto& entry : pImpl->snapshot()) {
        if (now - entry->lastActivityMs.load() >= maxIdle.count() && entry->pending.Size() == 0) {
            idle.push_back(entry->serverId);
        }
    }
    std::size_t stopped = 0;
    for (const auto& id : idle) {
        LOG_INFO("Stopping idle stdio server '{}'", id);
        if (StopProcess(id)) {
            ++stopped;
        }
    }
    return stopped;
}

std::size_t StdioProcessManager::PendingCount(const std::string& serverId) const {
    auto entry = pImpl->find(serverId);
    return entry ? entry->pending.Size() : 0;
}

const ProcessManagerOptions& StdioProcessManager::Options() const {
    return pImpl->options;
}

} // namespace toolgw
