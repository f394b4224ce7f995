//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessChannel.cpp
// Purpose: Child process spawn/shutdown and Boost.Asio driven stdio plumbing for one MCP server
//==========================================================================================================

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <deque>
#include <format>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include <boost/asio.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpio/ProcessChannel.hpp"
#include "mcpio/async/Task.h"

extern char** environ;

namespace mcpio {
namespace net = boost::asio;

namespace {
constexpr std::chrono::milliseconds kReapPoll{10};
// After stdout EOF the child normally exits right away; wait this long before killing it
constexpr std::chrono::milliseconds kReapAfterEof{500};
// exec failure is reported by the child immediately before _exit(127)
constexpr std::chrono::milliseconds kReapAfterExecFailure{1000};
constexpr std::size_t kMaxStderrLine = 64 * 1024;

std::optional<uint64_t> envNumber(const char* name) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return std::nullopt;
    }
    auto v = GetEnvUInt64(name);
    if (!v.has_value() || v.value() == 0) {
        LOG_WARN("Ignoring malformed {}='{}'", name, raw);
        return std::nullopt;
    }
    return v;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string describeExit(const std::optional<int>& status) {
    return status.has_value() ? std::format("exit code {}", status.value()) : std::string("exit status unknown");
}

void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        // Writes to a dead child must surface as EPIPE on the write, not kill the host
        ::signal(SIGPIPE, SIG_IGN);
    });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

[[noreturn]] void reportExecFailure(int statusFd) {
    const int err = errno;
    // Only async-signal-safe calls are allowed here; a failed write leaves the parent with exit code 127
    const ssize_t written = ::write(statusFd, &err, sizeof(err));
    ::_exit(written == static_cast<ssize_t>(sizeof(err)) ? 127 : 126);
}

std::exception_ptr transportFailure(errors::TransportErrc code, const std::string& what,
                                    std::optional<int> exitCode = std::nullopt) {
    return std::make_exception_ptr(errors::TransportError(code, what, exitCode));
}
} // namespace

std::chrono::milliseconds DefaultStartupTimeout() {
    return std::chrono::milliseconds(envNumber("MCPIO_STARTUP_TIMEOUT_MS").value_or(30000));
}

std::size_t DefaultMaxBufferSize() {
    return static_cast<std::size_t>(envNumber("MCPIO_MAX_BUFFER_SIZE").value_or(DEFAULT_MAX_BUFFER_SIZE));
}

//----------------------------------------------------------------------------------------------------------
// ParseProcessConfig
//----------------------------------------------------------------------------------------------------------
namespace {
std::string trimSpaces(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitList(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos <= s.size()) {
        const std::size_t next = s.find(sep, pos);
        std::string item = trimSpaces(s.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        if (next == std::string::npos) {
            break;
        }
        pos = next + 1;
    }
    return out;
}

std::optional<uint64_t> parseUnsigned(const std::string& s) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(s));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}
} // namespace

ProcessConfig ParseProcessConfig(const std::string& text) {
    FUNC_SCOPE();
    ProcessConfig config;
    for (const std::string& pair : splitList(text, ';')) {
        const auto eq = pair.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("Ignoring config entry without '=': '{}'", pair);
            continue;
        }
        const std::string key = trimSpaces(pair.substr(0, eq));
        const std::string val = trimSpaces(pair.substr(eq + 1));
        auto number = [&key, &val]() {
            auto v = parseUnsigned(val);
            if (!v.has_value()) {
                LOG_WARN("Ignoring malformed value for {}: '{}'", key, val);
            }
            return v;
        };
        if (key == "command") {
            config.command = val;
        } else if (key == "args") {
            config.args = splitList(val, ',');
        } else if (key == "cwd") {
            config.cwd = val;
        } else if (key == "quiet") {
            config.quiet = (val == "1" || val == "true" || val == "TRUE" || val == "yes");
        } else if (key == "startup_timeout_ms") {
            if (auto v = number()) config.startupTimeout = std::chrono::milliseconds(*v);
        } else if (key == "max_buffer_size") {
            if (auto v = number()) config.maxBufferSize = static_cast<std::size_t>(*v);
        } else if (key == "kill_timeout_ms") {
            if (auto v = number()) config.killTimeout = std::chrono::milliseconds(*v);
        } else if (key == "write_queue_max_bytes") {
            if (auto v = number()) config.writeQueueMaxBytes = static_cast<std::size_t>(*v);
        } else if (key == "env") {
            for (const std::string& kv : splitList(val, ',')) {
                const auto e = kv.find('=');
                if (e == std::string::npos || e == 0) {
                    LOG_WARN("Ignoring malformed env entry '{}'", kv);
                    continue;
                }
                config.env[kv.substr(0, e)] = kv.substr(e + 1);
            }
        } else {
            LOG_WARN("Ignoring unknown config key '{}'", key);
        }
    }
    return config;
}

//----------------------------------------------------------------------------------------------------------
// Impl
//----------------------------------------------------------------------------------------------------------
class ProcessChannel::Impl {
public:
    struct PendingWrite {
        std::string frame;
        std::shared_ptr<std::promise<void>> done;
    };

    ProcessConfig config;
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;

    std::atomic<bool> spawned{false};
    std::atomic<bool> started{false};
    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> closeNotified{false};
    std::atomic<int> pid{-1};
    std::atomic<std::size_t> bufferedBytes{0};

    mutable std::mutex reapMutex; // protects reaped/exitStatus and serializes kill() against waitpid()
    bool reaped{false};
    std::optional<int> exitStatus;

    std::mutex closeMutex;
    bool closed{false};

    // Sends posted to the I/O thread that have not reached the write queue yet
    std::mutex postMutex;
    bool postsClosed{false};
    std::unordered_set<std::shared_ptr<std::promise<void>>> posted;

    // I/O thread state
    std::unique_ptr<net::posix::stream_descriptor> stdinPipe;
    std::unique_ptr<net::posix::stream_descriptor> stdoutPipe;
    std::unique_ptr<net::posix::stream_descriptor> stderrPipe;
    std::unique_ptr<net::posix::stream_descriptor> statusPipe;
    std::unique_ptr<net::steady_timer> startupTimer;
    std::unique_ptr<IMessageFramer> encoder{MakeMessageFramer()};
    std::unique_ptr<StreamDecoder> decoder;
    std::array<char, 64 * 1024> readBuf{};
    std::array<char, 4096> errBuf{};
    std::array<char, sizeof(int)> statusBuf{};
    std::string errLine;
    std::deque<PendingWrite> writeQueue;
    std::size_t queuedBytes{0};
    bool writeInFlight{false};

    ProcessChannel::MessageHandler messageHandler;
    ProcessChannel::ErrorHandler errorHandler;
    ProcessChannel::CloseHandler closeHandler;
    ProcessChannel::SpawnHandler spawnHandler;

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            if (ioThread.get_id() == std::this_thread::get_id()) {
                ioThread.detach();
            } else {
                ioThread.join();
            }
        }
    }

    ///////////////////////////////////////// Observers ///////////////////////////////////////////
    void emitError(errors::ErrorClass cls, const std::string& message) {
        if (!errorHandler) {
            return;
        }
        try {
            errorHandler(errors::EngineError{cls, message});
        } catch (const std::exception& e) {
            LOG_ERROR("ProcessChannel: error handler threw: {}", e.what());
        }
    }

    void deliverMessage(const JSONValue& message, WireMode mode) {
        LOG_DEBUG("ProcessChannel: received {} message ({})", MessageKindName(ClassifyMessage(message)), wireModeName(mode));
        if (!messageHandler) {
            return;
        }
        try {
            messageHandler(message);
        } catch (const std::exception& e) {
            LOG_ERROR("ProcessChannel: message handler threw: {}", e.what());
        }
    }

    void notifyClosed(std::optional<int> status) {
        if (closeNotified.exchange(true) || !closeHandler) {
            return;
        }
        try {
            closeHandler(status);
        } catch (const std::exception& e) {
            LOG_ERROR("ProcessChannel: close handler threw: {}", e.what());
        }
    }

    ///////////////////////////////////////// Process state ///////////////////////////////////////////
    bool tryReap() {
        std::lock_guard<std::mutex> lk(reapMutex);
        if (reaped) {
            return true;
        }
        const int p = pid.load();
        if (p <= 0) {
            return true;
        }
        int status = 0;
        const pid_t r = ::waitpid(p, &status, WNOHANG);
        if (r == p) {
            reaped = true;
            exitStatus = decodeWaitStatus(status);
            return true;
        }
        if (r < 0 && errno == ECHILD) {
            reaped = true;
            return true;
        }
        return false;
    }

    bool waitForExit(std::chrono::milliseconds limit) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!tryReap()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(kReapPoll);
        }
        return true;
    }

    void signalChild(int sig) {
        std::lock_guard<std::mutex> lk(reapMutex);
        const int p = pid.load();
        if (reaped || p <= 0) {
            return;
        }
        if (::kill(p, sig) != 0 && errno != ESRCH) {
            LOG_WARN("ProcessChannel: kill({}, {}) failed: {}", p, sig, std::strerror(errno));
        }
    }

    std::optional<int> currentExitStatus() const {
        std::lock_guard<std::mutex> lk(reapMutex);
        return exitStatus;
    }

    ///////////////////////////////////////// Spawn ///////////////////////////////////////////
    bool spawnChild(int& inFd, int& outFd, int& errFd, int& statusFd, std::string& error) {
        int inPipe[2]{-1, -1};
        int outPipe[2]{-1, -1};
        int errPipe[2]{-1, -1};
        int statPipe[2]{-1, -1};
        int* allPipes[] = {inPipe, outPipe, errPipe, statPipe};
        auto closeAll = [&allPipes]() {
            for (int* p : allPipes) {
                closeFd(p[0]);
                closeFd(p[1]);
            }
        };
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
            (config.quiet && ::pipe2(errPipe, O_CLOEXEC) != 0) || ::pipe2(statPipe, O_CLOEXEC) != 0) {
            error = std::format("pipe2 failed: {}", std::strerror(errno));
            closeAll();
            return false;
        }

        // Build argv/envp before fork; the child must not allocate
        std::vector<std::string> argStore;
        argStore.reserve(config.args.size() + 1);
        argStore.push_back(config.command);
        argStore.insert(argStore.end(), config.args.begin(), config.args.end());
        std::vector<char*> argv;
        for (auto& a : argStore) argv.push_back(a.data());
        argv.push_back(nullptr);

        std::vector<std::string> envStore;
        for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
            std::string entry(*e);
            const auto eq = entry.find('=');
            if (eq != std::string::npos && config.env.count(entry.substr(0, eq)) > 0) {
                continue;
            }
            envStore.push_back(std::move(entry));
        }
        for (const auto& [key, value] : config.env) {
            envStore.push_back(key + "=" + value);
        }
        std::vector<char*> envp;
        for (auto& e : envStore) envp.push_back(e.data());
        envp.push_back(nullptr);

        const pid_t child = ::fork();
        if (child < 0) {
            error = std::format("fork failed: {}", std::strerror(errno));
            closeAll();
            return false;
        }
        if (child == 0) {
            if (::dup2(inPipe[0], STDIN_FILENO) < 0 || ::dup2(outPipe[1], STDOUT_FILENO) < 0 ||
                (config.quiet && ::dup2(errPipe[1], STDERR_FILENO) < 0)) {
                reportExecFailure(statPipe[1]);
            }
            if (!config.cwd.empty() && ::chdir(config.cwd.c_str()) != 0) {
                reportExecFailure(statPipe[1]);
            }
            ::execvpe(argv[0], argv.data(), envp.data());
            reportExecFailure(statPipe[1]);
        }

        pid.store(static_cast<int>(child));
        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        closeFd(statPipe[1]);
        inFd = inPipe[1];
        outFd = outPipe[0];
        errFd = errPipe[0];
        statusFd = statPipe[0];
        return true;
    }

    std::future<void> start(const ProcessConfig& cfg) {
        config = cfg;
        ignoreSigpipe();
        if (config.command.empty()) {
            LOG_ERROR("ProcessChannel: no command configured");
            return async::makeExceptionalFuture<void>(
                transportFailure(errors::TransportErrc::SpawnFailed, "no command configured"));
        }

        decoder = std::make_unique<StreamDecoder>(config.maxBufferSize);
        decoder->SetMessageCallback([this](JSONValue message, WireMode mode) { deliverMessage(message, mode); });
        decoder->SetErrorCallback([this](const errors::EngineError& e) { emitError(e.errorClass, e.message); });

        int inFd = -1, outFd = -1, errFd = -1, statusFd = -1;
        std::string error;
        if (!spawnChild(inFd, outFd, errFd, statusFd, error)) {
            const std::string msg = std::format("failed to spawn '{}': {}", config.command, error);
            LOG_ERROR("ProcessChannel: {}", msg);
            emitError(errors::ErrorClass::Transport, msg);
            return async::makeExceptionalFuture<void>(transportFailure(errors::TransportErrc::SpawnFailed, msg));
        }
        stdinPipe = std::make_unique<net::posix::stream_descriptor>(ioc, inFd);
        stdoutPipe = std::make_unique<net::posix::stream_descriptor>(ioc, outFd);
        statusPipe = std::make_unique<net::posix::stream_descriptor>(ioc, statusFd);
        if (errFd >= 0) {
            stderrPipe = std::make_unique<net::posix::stream_descriptor>(ioc, errFd);
        }
        LOG_INFO("ProcessChannel: spawned '{}' (pid {})", config.command, pid.load());

        auto ready = std::make_shared<std::promise<void>>();
        auto fut = ready->get_future();
        auto settled = std::make_shared<bool>(false); // touched on the I/O thread only

        startupTimer = std::make_unique<net::steady_timer>(ioc, config.startupTimeout);
        startupTimer->async_wait([this, ready, settled](const boost::system::error_code& ec) {
            if (ec || *settled) {
                return;
            }
            *settled = true;
            onStartupTimeout(*ready);
        });
        // The status pipe closes on successful exec (CLOEXEC) or carries errno when exec fails
        net::async_read(*statusPipe, net::buffer(statusBuf), net::transfer_exactly(statusBuf.size()),
            [this, ready, settled](const boost::system::error_code& ec, std::size_t n) {
                if (*settled) {
                    return;
                }
                *settled = true;
                startupTimer->cancel();
                if (n > 0) {
                    int err = 0;
                    std::memcpy(&err, statusBuf.data(), std::min(n, sizeof(err)));
                    onExecFailed(*ready, err);
                    return;
                }
                if (ec && ec != net::error::eof) {
                    onStartupPipeError(*ready, ec);
                    return;
                }
                onSpawned(*ready);
            });

        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() { runIo(); });
        return fut;
    }

    void runIo() {
        try {
            ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("ProcessChannel: I/O loop terminated: {}", e.what());
            connected.store(false);
            emitError(errors::ErrorClass::Transport, std::string("I/O loop terminated: ") + e.what());
        }
    }

    void onSpawned(std::promise<void>& ready) {
        closeDescriptor(statusPipe);
        spawned.store(true);
        connected.store(true);
        if (spawnHandler) {
            try {
                spawnHandler(pid.load());
            } catch (const std::exception& e) {
                LOG_ERROR("ProcessChannel: spawn handler threw: {}", e.what());
            }
        }
        ready.set_value();
        readStdout();
        if (stderrPipe) {
            readStderr();
        }
    }

    void onExecFailed(std::promise<void>& ready, int err) {
        waitForExit(kReapAfterExecFailure);
        const int code = currentExitStatus().value_or(127);
        const std::string msg = std::format("'{}' could not be started: {}", config.command, std::strerror(err));
        LOG_ERROR("ProcessChannel: {} ({})", msg, describeExit(code));
        closeDescriptors();
        emitError(errors::ErrorClass::Transport, msg);
        ready.set_exception(transportFailure(errors::TransportErrc::ProcessExitedEarly, msg, code));
    }

    void onStartupPipeError(std::promise<void>& ready, const boost::system::error_code& ec) {
        const std::string msg = std::format("startup handshake with '{}' failed: {}", config.command, ec.message());
        LOG_ERROR("ProcessChannel: {}", msg);
        signalChild(SIGKILL);
        waitForExit(config.killGrace);
        closeDescriptors();
        emitError(errors::ErrorClass::Transport, msg);
        ready.set_exception(transportFailure(errors::TransportErrc::SpawnFailed, msg));
    }

    void onStartupTimeout(std::promise<void>& ready) {
        const std::string msg = std::format("'{}' did not start within {} ms", config.command, config.startupTimeout.count());
        LOG_ERROR("ProcessChannel: {}; killing pid {}", msg, pid.load());
        signalChild(SIGKILL);
        waitForExit(config.killGrace);
        closeDescriptors();
        emitError(errors::ErrorClass::Transport, msg);
        ready.set_exception(transportFailure(errors::TransportErrc::StartupTimeout, msg));
    }

    ///////////////////////////////////////// Reading ///////////////////////////////////////////
    void readStdout() {
        if (!stdoutPipe || !stdoutPipe->is_open()) {
            return;
        }
        stdoutPipe->async_read_some(net::buffer(readBuf), [this](const boost::system::error_code& ec, std::size_t n) {
            if (n > 0) {
                decoder->Feed(readBuf.data(), n);
                bufferedBytes.store(decoder->BufferedBytes());
            }
            if (ec) {
                if (ec == net::error::operation_aborted || closing.load()) {
                    return;
                }
                onStdoutClosed(ec);
                return;
            }
            if (closing.load()) {
                return;
            }
            readStdout();
        });
    }

    void readStderr() {
        if (!stderrPipe || !stderrPipe->is_open()) {
            return;
        }
        stderrPipe->async_read_some(net::buffer(errBuf), [this](const boost::system::error_code& ec, std::size_t n) {
            errLine.append(errBuf.data(), n);
            std::size_t nl;
            while ((nl = errLine.find('\n')) != std::string::npos) {
                LOG_DEBUG("[{} stderr] {}", config.command, errLine.substr(0, nl));
                errLine.erase(0, nl + 1);
            }
            if (errLine.size() > kMaxStderrLine) {
                LOG_DEBUG("[{} stderr] {}", config.command, errLine);
                errLine.clear();
            }
            if (ec || closing.load()) {
                if (!errLine.empty()) {
                    LOG_DEBUG("[{} stderr] {}", config.command, errLine);
                    errLine.clear();
                }
                return;
            }
            readStderr();
        });
    }

    // stdout reached EOF (or failed) without Close(): the server went away
    void onStdoutClosed(const boost::system::error_code& ec) {
        connected.store(false);
        if (ec != net::error::eof) {
            LOG_ERROR("ProcessChannel: reading stdout of '{}' failed: {}", config.command, ec.message());
        }
        if (!waitForExit(kReapAfterEof)) {
            LOG_WARN("ProcessChannel: '{}' closed stdout but is still running; killing pid {}", config.command, pid.load());
            signalChild(SIGKILL);
            waitForExit(config.killGrace);
        }
        const auto status = currentExitStatus();
        const std::string msg = std::format("server process '{}' exited unexpectedly ({})", config.command, describeExit(status));
        LOG_ERROR("ProcessChannel: {}", msg);
        closeDescriptors();
        failPendingWrites(errors::TransportErrc::Closed, msg);
        emitError(errors::ErrorClass::Transport, msg);
        notifyClosed(status);
    }

    ///////////////////////////////////////// Writing ///////////////////////////////////////////
    bool admitPost(const std::shared_ptr<std::promise<void>>& done) {
        std::lock_guard<std::mutex> lk(postMutex);
        if (postsClosed) {
            return false;
        }
        posted.insert(done);
        return true;
    }

    // False when close() already failed this send
    bool claimPost(const std::shared_ptr<std::promise<void>>& done) {
        std::lock_guard<std::mutex> lk(postMutex);
        return posted.erase(done) > 0;
    }

    void failPostedWrites(errors::TransportErrc code, const std::string& msg) {
        std::unordered_set<std::shared_ptr<std::promise<void>>> orphaned;
        {
            std::lock_guard<std::mutex> lk(postMutex);
            postsClosed = true;
            orphaned.swap(posted);
        }
        for (const auto& done : orphaned) {
            done->set_exception(transportFailure(code, msg));
        }
    }

    void enqueueWrite(std::string frame, std::shared_ptr<std::promise<void>> done) {
        if (!connected.load() || !stdinPipe || !stdinPipe->is_open()) {
            done->set_exception(transportFailure(errors::TransportErrc::NotConnected, "server process is not running"));
            return;
        }
        // A single oversized frame is accepted into an empty queue
        if (!writeQueue.empty() && queuedBytes + frame.size() > config.writeQueueMaxBytes) {
            const std::string msg = std::format("write queue limit {} bytes exceeded ({} queued, frame {})",
                                                config.writeQueueMaxBytes, queuedBytes, frame.size());
            LOG_ERROR("ProcessChannel: {}", msg);
            done->set_exception(transportFailure(errors::TransportErrc::WriteQueueOverflow, msg));
            emitError(errors::ErrorClass::Transport, msg);
            return;
        }
        queuedBytes += frame.size();
        writeQueue.push_back(PendingWrite{std::move(frame), std::move(done)});
        if (!writeInFlight) {
            writeNext();
        }
    }

    void writeNext() {
        if (writeQueue.empty() || !stdinPipe || !stdinPipe->is_open()) {
            return;
        }
        writeInFlight = true;
        net::async_write(*stdinPipe, net::buffer(writeQueue.front().frame),
            [this](const boost::system::error_code& ec, std::size_t) {
                writeInFlight = false;
                if (writeQueue.empty()) {
                    return; // already failed by shutdown
                }
                PendingWrite item = std::move(writeQueue.front());
                writeQueue.pop_front();
                queuedBytes -= item.frame.size();
                if (ec) {
                    const std::string msg = std::format("write to '{}' stdin failed: {}", config.command, ec.message());
                    LOG_ERROR("ProcessChannel: {}", msg);
                    item.done->set_exception(transportFailure(errors::TransportErrc::WriteFailed, msg));
                    failPendingWrites(errors::TransportErrc::WriteFailed, msg);
                    emitError(errors::ErrorClass::Transport, msg);
                    return;
                }
                item.done->set_value();
                writeNext();
            });
    }

    void failPendingWrites(errors::TransportErrc code, const std::string& msg) {
        for (auto& item : writeQueue) {
            item.done->set_exception(transportFailure(code, msg));
        }
        writeQueue.clear();
        queuedBytes = 0;
    }

    ///////////////////////////////////////// Shutdown ///////////////////////////////////////////
    static void closeDescriptor(std::unique_ptr<net::posix::stream_descriptor>& d) {
        if (d && d->is_open()) {
            boost::system::error_code ec;
            d->close(ec);
            if (ec) {
                LOG_DEBUG("ProcessChannel: closing descriptor failed: {}", ec.message());
            }
        }
    }

    void closeDescriptors() {
        closeDescriptor(stdinPipe);
        closeDescriptor(stdoutPipe);
        closeDescriptor(stderrPipe);
        closeDescriptor(statusPipe);
    }

    void stopIoThread() {
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        // Close() may run inside a handler on the I/O thread; that thread is joined by the destructor
        if (ioThread.joinable() && ioThread.get_id() != std::this_thread::get_id()) {
            ioThread.join();
        }
    }

    void close() {
        std::optional<int> status;
        {
            std::lock_guard<std::mutex> lk(closeMutex);
            if (closed) {
                return;
            }
            closed = true;
            closing.store(true);
            connected.store(false);

            if (pid.load() > 0 && !tryReap()) {
                LOG_INFO("ProcessChannel: stopping '{}' (pid {}) with SIGTERM", config.command, pid.load());
                signalChild(SIGTERM);
                if (!waitForExit(config.killTimeout)) {
                    LOG_WARN("ProcessChannel: '{}' ignored SIGTERM for {} ms; sending SIGKILL",
                             config.command, config.killTimeout.count());
                    signalChild(SIGKILL);
                    if (!waitForExit(config.killGrace)) {
                        LOG_ERROR("ProcessChannel: pid {} still running after SIGKILL; giving up", pid.load());
                    }
                }
            }

            stopIoThread();
            closeDescriptors();
            failPendingWrites(errors::TransportErrc::Closed, "channel closed");
            failPostedWrites(errors::TransportErrc::Closed, "channel closed");
            if (decoder) {
                decoder->Reset();
            }
            bufferedBytes.store(0);
            errLine.clear();
            status = currentExitStatus();
            if (spawned.load()) {
                LOG_INFO("ProcessChannel: closed '{}' ({})", config.command, describeExit(status));
            }
        }
        if (spawned.load()) {
            notifyClosed(status);
        }
    }
};

//----------------------------------------------------------------------------------------------------------
// ProcessChannel
//----------------------------------------------------------------------------------------------------------
ProcessChannel::ProcessChannel() : pImpl(std::make_unique<Impl>()) {}

ProcessChannel::~ProcessChannel() {
    if (pImpl) {
        // Owners are being torn down; no close notification from the destructor
        pImpl->closeNotified.store(true);
        pImpl->close();
    }
}

std::future<void> ProcessChannel::Start(const ProcessConfig& config) {
    FUNC_SCOPE();
    if (pImpl->started.exchange(true)) {
        return async::makeExceptionalFuture<void>(
            transportFailure(errors::TransportErrc::AlreadyStarted, "channel was already started"));
    }
    return pImpl->start(config);
}

std::future<void> ProcessChannel::Send(const JSONValue& message) {
    if (!pImpl->connected.load()) {
        return async::makeExceptionalFuture<void>(
            transportFailure(errors::TransportErrc::NotConnected, "server process is not running"));
    }
    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    if (!pImpl->admitPost(done)) {
        return async::makeExceptionalFuture<void>(transportFailure(errors::TransportErrc::Closed, "channel closed"));
    }
    std::string frame = pImpl->encoder->encode(message);
    Impl* impl = pImpl.get();
    net::post(impl->ioc, [impl, frame = std::move(frame), done]() mutable {
        if (impl->claimPost(done)) {
            impl->enqueueWrite(std::move(frame), std::move(done));
        }
    });
    return fut;
}

std::future<void> ProcessChannel::Close() {
    FUNC_SCOPE();
    pImpl->close();
    return async::makeReadyFuture();
}

bool ProcessChannel::IsConnected() const { return pImpl->connected.load(); }
bool ProcessChannel::IsStarted() const { return pImpl->spawned.load(); }
int ProcessChannel::Pid() const { return pImpl->pid.load(); }
std::optional<int> ProcessChannel::ExitCode() const { return pImpl->currentExitStatus(); }
std::size_t ProcessChannel::BufferedBytes() const { return pImpl->bufferedBytes.load(); }

void ProcessChannel::SetMessageHandler(MessageHandler handler) { pImpl->messageHandler = std::move(handler); }
void ProcessChannel::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }
void ProcessChannel::SetCloseHandler(CloseHandler handler) { pImpl->closeHandler = std::move(handler); }
void ProcessChannel::SetSpawnHandler(SpawnHandler handler) { pImpl->spawnHandler = std::move(handler); }

} // namespace mcpio
