//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.hpp
// Purpose: Spawned child process with piped stdin/stdout/stderr and a supervising reader thread
//==========================================================================================================
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace toolgw {

//==========================================================================================================
// SpawnOptions
// Purpose: What to execute. The command is resolved through PATH. env entries are added to (or override)
//          the parent environment.
//==========================================================================================================
struct SpawnOptions {
    std::string command;
    std::vector<std::string> args;
    std::string workingDirectory;
    std::vector<std::pair<std::string, std::string>> env;
};

//==========================================================================================================
// ExitStatus
// Purpose: How a child terminated. value is the exit code, or the signal number when signaled is true.
//==========================================================================================================
struct ExitStatus {
    bool signaled{false};
    int value{0};
};

// "Process exited with code N" or "Process killed by signal S".
std::string DescribeExit(const ExitStatus& status);

//==========================================================================================================
// ChildProcess
// Purpose: Owns one OS child. A reader thread polls stdout, stderr, and a wake eventfd, forwards output
//          chunks to the registered handlers, reaps the child, and reports its exit exactly once.
// Notes:
//   - Handlers run on the reader thread and must be registered before Spawn().
//   - Write() is serialized by an internal mutex so concurrent callers never interleave bytes.
//   - Destroying the object terminates a still-running child.
//==========================================================================================================
class ChildProcess {
public:
    using OutputHandler = std::function<void(const std::string& chunk)>;
    using ExitHandler = std::function<void(const ExitStatus& status)>;

    ChildProcess();
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    void SetStdoutHandler(OutputHandler handler);
    void SetStderrHandler(OutputHandler handler);
    void SetExitHandler(ExitHandler handler);

    //==========================================================================================================
    // Spawn
    // Purpose: fork/exec the command with pipes attached. exec failures (missing binary, bad working
    //          directory) are detected synchronously through a close-on-exec status pipe.
    // Args:
    //   options: Command, arguments, working directory, and extra environment.
    //   error: Receives a description when spawning fails.
    // Returns:
    //   true when the child is running.
    //==========================================================================================================
    bool Spawn(const SpawnOptions& options, std::string& error);

    //==========================================================================================================
    // Write
    // Purpose: Writes all bytes to the child's stdin. Returns false if the pipe is closed or broken.
    //==========================================================================================================
    bool Write(const std::string& data);

    //==========================================================================================================
    // Terminate
    // Purpose: Closes stdin, sends SIGTERM, escalates to SIGKILL after the grace period, and waits for the
    //          reader thread to report the exit.
    //==========================================================================================================
    void Terminate(std::chrono::milliseconds grace);

    bool IsRunning() const;
    pid_t GetPid() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace toolgw
