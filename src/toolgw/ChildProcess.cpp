//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.cpp
// Purpose: fork/exec child process supervision with epoll-driven pipe reading
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <csignal>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/wait.h>

#include <array>
#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "logging/Logger.h"
#include "toolgw/ChildProcess.hpp"

extern char** environ;

namespace toolgw {

namespace {
void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() {
        // Broken child pipes surface as EPIPE from write() instead of terminating the host
        ::signal(SIGPIPE, SIG_IGN);
    });
}

std::vector<std::string> buildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::unordered_set<std::string> overridden;
    for (const auto& kv : overrides) {
        overridden.insert(kv.first);
    }
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && overridden.count(entry.substr(0, eq)) != 0) {
            continue;
        }
        out.push_back(std::move(entry));
    }
    for (const auto& [k, v] : overrides) {
        out.push_back(k + "=" + v);
    }
    return out;
}
} // namespace

std::string DescribeExit(const ExitStatus& status) {
    if (status.signaled) {
        return std::format("Process killed by signal {}", status.value);
    }
    return std::format("Process exited with code {}", status.value);
}

class ChildProcess::Impl {
public:
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int wakeEventFd{-1};
    std::atomic<bool> running{false};
    std::mutex writeMutex;
    std::mutex stateMutex;
    std::condition_variable exitCv;
    bool exited{false};
    ExitStatus exitStatus;
    std::thread readerThread;
    OutputHandler stdoutHandler;
    OutputHandler stderrHandler;
    ExitHandler exitHandler;

    ~Impl() {
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
        closeFd(wakeEventFd);
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("ChildProcess: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            break;
        }
    }

    // Reads everything currently available. Returns false on EOF or hard error.
    bool drain(int fd, const OutputHandler& handler) {
        std::array<char, 4096> tmp{};
        for (;;) {
            ssize_t n = ::read(fd, tmp.data(), tmp.size());
            if (n > 0) {
                if (handler) {
                    handler(std::string(tmp.data(), static_cast<std::size_t>(n)));
                }
                continue;
            }
            if (n == 0) {
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return true;
            }
            LOG_WARN("ChildProcess[{}]: read failed (errno={} msg={})", pid, errno, ::strerror(errno));
            return false;
        }
    }

    void readLoop() {
        constexpr int waitTimeoutMs = 50;
        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            LOG_ERROR("ChildProcess[{}]: epoll_create1 failed (errno={} msg={})", pid, errno, ::strerror(errno));
        } else {
            for (int fd : {stdoutFd, stderrFd, wakeEventFd}) {
                if (fd < 0) {
                    continue;
                }
                epoll_event ev{};
                ev.events = EPOLLIN | EPOLLRDHUP;
                ev.data.fd = fd;
                if (::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &ev) != 0) {
                    LOG_WARN("ChildProcess[{}]: epoll_ctl failed (errno={} msg={})", pid, errno, ::strerror(errno));
                }
            }
        }

        bool outOpen = true;
        bool errOpen = true;
        ExitStatus status;
        for (;;) {
            if (ep >= 0) {
                epoll_event events[3];
                int rc = ::epoll_wait(ep, events, 3, waitTimeoutMs);
                if (rc < 0 && errno != EINTR) {
                    LOG_ERROR("ChildProcess[{}]: epoll_wait failed (errno={} msg={})", pid, errno, ::strerror(errno));
                    std::this_thread::sleep_for(std::chrono::milliseconds(waitTimeoutMs));
                }
                for (int k = 0; k < rc; ++k) {
                    int fd = events[k].data.fd;
                    if (fd == stdoutFd && outOpen) {
                        if (!drain(stdoutFd, stdoutHandler)) {
                            outOpen = false;
                            (void)::epoll_ctl(ep, EPOLL_CTL_DEL, stdoutFd, nullptr);
                        }
                    } else if (fd == stderrFd && errOpen) {
                        if (!drain(stderrFd, stderrHandler)) {
                            errOpen = false;
                            (void)::epoll_ctl(ep, EPOLL_CTL_DEL, stderrFd, nullptr);
                        }
                    } else if (fd == wakeEventFd) {
                        uint64_t v = 0;
                        ssize_t r;
                        do {
                            r = ::read(wakeEventFd, &v, sizeof(v));
                        } while (r < 0 && errno == EINTR);
                    }
                }
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(waitTimeoutMs));
                if (outOpen) { outOpen = drain(stdoutFd, stdoutHandler); }
                if (errOpen) { errOpen = drain(stderrFd, stderrHandler); }
            }

            int raw = 0;
            pid_t r = ::waitpid(pid, &raw, WNOHANG);
            if (r == pid) {
                // Output written right before exit is still buffered in the pipes
                if (outOpen) { (void)drain(stdoutFd, stdoutHandler); }
                if (errOpen) { (void)drain(stderrFd, stderrHandler); }
                if (WIFSIGNALED(raw)) {
                    status.signaled = true;
                    status.value = WTERMSIG(raw);
                } else {
                    status.value = WIFEXITED(raw) ? WEXITSTATUS(raw) : -1;
                }
                break;
            }
            if (r < 0 && errno != EINTR) {
                LOG_ERROR("ChildProcess[{}]: waitpid failed (errno={} msg={})", pid, errno, ::strerror(errno));
                status.value = -1;
                break;
            }
        }
        if (ep >= 0) {
            ::close(ep);
        }

        running = false;
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            closeFd(stdinFd);
        }
        LOG_INFO("ChildProcess[{}]: {}", pid, DescribeExit(status));
        if (exitHandler) {
            exitHandler(status);
        }
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            exited = true;
            exitStatus = status;
        }
        exitCv.notify_all();
    }

    bool waitExited(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(stateMutex);
        return exitCv.wait_for(lk, timeout, [this]() { return exited; });
    }

    bool hasExited() {
        std::lock_guard<std::mutex> lk(stateMutex);
        return exited;
    }
};

ChildProcess::ChildProcess() : pImpl(std::make_shared<Impl>()) { FUNC_SCOPE(); }

ChildProcess::~ChildProcess() {
    FUNC_SCOPE();
    if (pImpl->running) {
        Terminate(std::chrono::milliseconds(2000));
    }
    if (pImpl->readerThread.joinable()) {
        if (pImpl->readerThread.get_id() == std::this_thread::get_id()) {
            // Released from inside the exit handler; the thread owns its own reference to Impl
            pImpl->readerThread.detach();
        } else {
            pImpl->readerThread.join();
        }
    }
}

void ChildProcess::SetStdoutHandler(OutputHandler handler) { FUNC_SCOPE(); pImpl->stdoutHandler = std::move(handler); }
void ChildProcess::SetStderrHandler(OutputHandler handler) { FUNC_SCOPE(); pImpl->stderrHandler = std::move(handler); }
void ChildProcess::SetExitHandler(ExitHandler handler) { FUNC_SCOPE(); pImpl->exitHandler = std::move(handler); }

bool ChildProcess::Spawn(const SpawnOptions& options, std::string& error) {
    FUNC_SCOPE();
    if (pImpl->pid > 0) {
        error = "Process already spawned";
        return false;
    }
    if (options.command.empty()) {
        error = "Empty command";
        return false;
    }
    ignoreSigpipeOnce();

    int inPipe[2]{-1, -1};
    int outPipe[2]{-1, -1};
    int errPipe[2]{-1, -1};
    int statusPipe[2]{-1, -1};
    auto closeAll = [&]() {
        for (int* p : {inPipe, outPipe, errPipe, statusPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };
    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(statusPipe, O_CLOEXEC) != 0) {
        error = std::format("pipe2() failed: {}", ::strerror(errno));
        closeAll();
        return false;
    }

    // Everything the child needs is prepared before fork; only async-signal-safe calls follow in the child
    std::vector<std::string> argvStorage;
    argvStorage.reserve(options.args.size() + 1);
    argvStorage.push_back(options.command);
    argvStorage.insert(argvStorage.end(), options.args.begin(), options.args.end());
    std::vector<char*> argv;
    for (auto& a : argvStorage) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);
    std::vector<std::string> envStorage = buildEnvironment(options.env);
    std::vector<char*> envp;
    for (auto& e : envStorage) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);
    const char* workDir = options.workingDirectory.empty() ? nullptr : options.workingDirectory.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::format("fork() failed: {}", ::strerror(errno));
        closeAll();
        return false;
    }

    if (pid == 0) {
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        int err = 0;
        if (workDir && ::chdir(workDir) != 0) {
            err = errno;
        } else {
            environ = envp.data();
            ::execvp(argv[0], argv.data());
            err = errno;
        }
        ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    // exec succeeded when the close-on-exec status pipe reports EOF
    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(statusPipe[0]);
    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int raw = 0;
        (void)::waitpid(pid, &raw, 0);
        error = workDir
            ? std::format("Failed to start '{}' in '{}': {}", options.command, options.workingDirectory, ::strerror(childErr))
            : std::format("Failed to start '{}': {}", options.command, ::strerror(childErr));
        closeAll();
        return false;
    }

    for (int fd : {outPipe[0], errPipe[0]}) {
        int fl = ::fcntl(fd, F_GETFL, 0);
        if (fl >= 0) {
            (void)::fcntl(fd, F_SETFL, fl | O_NONBLOCK);
        }
    }
    pImpl->pid = pid;
    pImpl->stdinFd = inPipe[1];
    pImpl->stdoutFd = outPipe[0];
    pImpl->stderrFd = errPipe[0];
    pImpl->wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (pImpl->wakeEventFd < 0) {
        LOG_WARN("ChildProcess: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
    }
    pImpl->running = true;
    pImpl->readerThread = std::thread([impl = pImpl]() { impl->readLoop(); });
    LOG_INFO("Spawned '{}' (pid {})", options.command, pid);
    return true;
}

bool ChildProcess::Write(const std::string& data) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    if (pImpl->stdinFd < 0) {
        return false;
    }
    std::size_t total = 0;
    while (total < data.size()) {
        ssize_t w = ::write(pImpl->stdinFd, data.data() + total, data.size() - total);
        if (w > 0) {
            total += static_cast<std::size_t>(w);
        } else if (w < 0 && errno == EINTR) {
            continue;
        } else {
            LOG_WARN("ChildProcess[{}]: write failed (errno={} msg={})", pImpl->pid, errno, ::strerror(errno));
            return false;
        }
    }
    return true;
}

void ChildProcess::Terminate(std::chrono::milliseconds grace) {
    FUNC_SCOPE();
    if (pImpl->pid <= 0) {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
        closeFd(pImpl->stdinFd);
    }
    const bool onReader = pImpl->readerThread.get_id() == std::this_thread::get_id();
    if (!pImpl->hasExited() && !onReader) {
        if (::kill(pImpl->pid, SIGTERM) != 0 && errno != ESRCH) {
            LOG_WARN("ChildProcess[{}]: SIGTERM failed (errno={} msg={})", pImpl->pid, errno, ::strerror(errno));
        }
        if (!pImpl->waitExited(grace)) {
            LOG_WARN("ChildProcess[{}]: still running after {} ms; sending SIGKILL", pImpl->pid,
                     static_cast<long long>(grace.count()));
            (void)::kill(pImpl->pid, SIGKILL);
            if (!pImpl->waitExited(std::chrono::milliseconds(5000))) {
                LOG_ERROR("ChildProcess[{}]: did not exit after SIGKILL", pImpl->pid);
            }
        }
    }
    pImpl->wake();
    if (pImpl->readerThread.joinable() && !onReader && pImpl->hasExited()) {
        pImpl->readerThread.join();
    }
}

bool ChildProcess::IsRunning() const { return pImpl->running.load(); }
pid_t ChildProcess::GetPid() const { return pImpl->pid; }

} // namespace toolgw
