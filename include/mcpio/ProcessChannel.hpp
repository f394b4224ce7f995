//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessChannel.hpp
// Purpose: Child-process channel speaking framed JSON-RPC over the child's stdin/stdout
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpio/JSONRPCTypes.h"
#include "mcpio/MessageFramer.h"
#include "mcpio/errors/Errors.h"

namespace mcpio {

// Defaults, overridable through MCPIO_STARTUP_TIMEOUT_MS and MCPIO_MAX_BUFFER_SIZE
std::chrono::milliseconds DefaultStartupTimeout();
std::size_t DefaultMaxBufferSize();

//==========================================================================================================
// ProcessConfig
// Purpose: How to launch one server process and the limits applied to its channel.
// Fields:
//   command: Executable name (searched on PATH) or path.
//   args: Arguments after argv[0].
//   env: Variables added to (or replacing those of) the parent environment.
//   cwd: Working directory for the child; empty keeps the parent's.
//   quiet: Pipe the child's stderr into LOG_DEBUG instead of inheriting it.
//   startupTimeout: Limit for the child to exec successfully.
//   maxBufferSize: Ceiling for buffered undecoded stdout bytes and for a declared Content-Length.
//   killTimeout: Wait after SIGTERM before escalating to SIGKILL.
//   killGrace: Wait after SIGKILL before the channel is declared closed regardless.
//   writeQueueMaxBytes: Bound for frames queued but not yet written to stdin.
//==========================================================================================================
struct ProcessConfig {
    std::string command;
    std::vector<std::string> args;
    std::unordered_map<std::string, std::string> env;
    std::string cwd;
    bool quiet{false};
    std::chrono::milliseconds startupTimeout{DefaultStartupTimeout()};
    std::size_t maxBufferSize{DefaultMaxBufferSize()};
    std::chrono::milliseconds killTimeout{5000};
    std::chrono::milliseconds killGrace{100};
    std::size_t writeQueueMaxBytes{8 * 1024 * 1024};
};

//==========================================================================================================
// ParseProcessConfig
// Purpose: Parses "key=value" pairs separated by ';'.
//   Keys: command, args (comma separated), cwd, quiet (1|true|0|false), startup_timeout_ms,
//         max_buffer_size, kill_timeout_ms, write_queue_max_bytes, env (K=V pairs, comma separated).
//   Malformed values and unknown keys are logged and ignored.
// Example:
//   "command=node; args=server.js,--stdio; quiet=1; env=DEBUG=0,MODE=test"
//==========================================================================================================
ProcessConfig ParseProcessConfig(const std::string& text);

//==========================================================================================================
// ProcessChannel
// Purpose: Owns exactly one child process. Outbound messages are encoded header-framed and written to
//          the child's stdin; the child's stdout is decoded in either wire format and delivered to the
//          message handler in byte order.
// Threading:
//   All handlers run on the channel's I/O thread. Set handlers before Start().
//==========================================================================================================
class ProcessChannel {
public:
    using MessageHandler = std::function<void(const JSONValue& message)>;
    using ErrorHandler = std::function<void(const errors::EngineError& error)>;
    using CloseHandler = std::function<void(std::optional<int> exitCode)>;
    using SpawnHandler = std::function<void(int pid)>;

    ProcessChannel();
    ~ProcessChannel();

    ProcessChannel(const ProcessChannel&) = delete;
    ProcessChannel& operator=(const ProcessChannel&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Spawns the child and waits for it to exec.
    // Returns:
    //   Future completing once the child is running. Fails with TransportError:
    //     AlreadyStarted on a second call, SpawnFailed when pipes or fork fail, StartupTimeout when the
    //     child does not exec in time (it is killed), ProcessExitedEarly when exec fails (exit code 127).
    //==========================================================================================================
    std::future<void> Start(const ProcessConfig& config);

    //==========================================================================================================
    // Send
    // Purpose: Encodes one message and queues it for the child's stdin.
    // Returns:
    //   Future completing when the OS write of the whole frame has completed. Fails with NotConnected,
    //   WriteQueueOverflow, WriteFailed, or Closed when the channel shuts down first.
    //==========================================================================================================
    std::future<void> Send(const JSONValue& message);

    //==========================================================================================================
    // Close
    // Purpose: SIGTERM, then SIGKILL after killTimeout, then give up after killGrace. Stops the I/O
    //          thread and clears buffers. Idempotent.
    // Returns:
    //   Future that is ready when the channel is closed.
    //==========================================================================================================
    std::future<void> Close();

    bool IsConnected() const;
    bool IsStarted() const;
    int Pid() const;
    // Exit status once reaped: the exit code, or 128 + signal number for a signalled child
    std::optional<int> ExitCode() const;
    std::size_t BufferedBytes() const;

    void SetMessageHandler(MessageHandler handler);
    void SetErrorHandler(ErrorHandler handler);
    void SetCloseHandler(CloseHandler handler);
    void SetSpawnHandler(SpawnHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpio
