//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessSession.cpp
// Purpose: fork/exec of the server process and Boost.Asio pipe I/O
//==========================================================================================================

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <future>
#include <mutex>
#include <thread>

#include <boost/asio/buffer.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include "logging/Logger.h"
#include "mcpexec/ProcessSession.hpp"
#include "mcpexec/errors/Errors.h"

namespace mcpexec {

namespace {

std::once_flag gSigpipeOnce;

// A dead child must surface as a write error rather than terminate the caller.
void ignoreSigpipe() {
    std::call_once(gSigpipeOnce, []() {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_IGN;
        if (::sigaction(SIGPIPE, &sa, nullptr) != 0) {
            LOG_WARN("ProcessSession: failed to ignore SIGPIPE (errno={} msg={})", errno, ::strerror(errno));
        }
    });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

ExitStatus decodeWaitStatus(int status) {
    ExitStatus s;
    s.known = true;
    if (WIFEXITED(status)) {
        s.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        s.signal = WTERMSIG(status);
    }
    return s;
}

// Blocks until pid is reaped; returns the raw wait status or -1 with errno preserved.
int reap(pid_t pid) {
    int status = 0;
    while (true) {
        pid_t r = ::waitpid(pid, &status, 0);
        if (r == pid) {
            return status;
        }
        if (r == -1 && errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace

std::string ExitStatus::Describe() const {
    if (!known) {
        return "unknown exit status";
    }
    if (signal != 0) {
        std::string name = ::strsignal(signal) ? std::string(::strsignal(signal)) : std::to_string(signal);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return "signal: " + name;
    }
    return "exit status " + std::to_string(code);
}

class ProcessSession::Impl {
public:
    boost::asio::io_context io;
    boost::asio::posix::stream_descriptor stdinPipe{io};
    boost::asio::posix::stream_descriptor stdoutPipe{io};
    boost::asio::posix::stream_descriptor stderrPipe{io};

    // Persistent so bytes read ahead of a newline survive between ReadLine calls
    boost::asio::streambuf stdoutBuf;

    std::array<char, 4096> stderrChunk{};
    mutable std::mutex stderrMutex;
    std::string stderrBuf;
    std::promise<void> stderrClosed;
    std::shared_future<void> stderrClosedFuture{stderrClosed.get_future().share()};
    std::thread drainThread;

    pid_t pid{-1};
    bool reaped{false};
    ExitStatus exitStatus;
    bool initialized{false};

    ~Impl() {
        boost::system::error_code ec;
        stdinPipe.close(ec);
        stdoutPipe.close(ec);
        if (pid > 0 && !reaped) {
            LOG_DEBUG("ProcessSession: killing pid {} on teardown", pid);
            ::kill(pid, SIGKILL);
            int status = reap(pid);
            reaped = true;
            if (status != -1) {
                exitStatus = decodeWaitStatus(status);
            }
        }
        // A grandchild may still hold stderr open; stop rather than wait for EOF
        io.stop();
        if (drainThread.joinable()) {
            drainThread.join();
        }
        stderrPipe.close(ec);
    }

    void startDrain() {
        stderrPipe.async_read_some(
            boost::asio::buffer(stderrChunk),
            [this](const boost::system::error_code& ec, std::size_t n) {
                if (n > 0) {
                    std::lock_guard<std::mutex> lock(stderrMutex);
                    stderrBuf.append(stderrChunk.data(), n);
                }
                if (ec) {
                    if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                        LOG_DEBUG("ProcessSession: stderr drain stopped: {}", ec.message());
                    }
                    stderrClosed.set_value();
                    return;
                }
                startDrain();
            });
    }
};

ProcessSession::ProcessSession() : pImpl(std::make_unique<Impl>()) {}

ProcessSession::~ProcessSession() = default;

void ProcessSession::Spawn(const std::vector<std::string>& command) {
    FUNC_SCOPE();
    if (command.empty()) {
        throw errors::SpawnError("no command specified for stdio transport");
    }
    if (pImpl->pid > 0) {
        throw errors::SpawnError("process session already started");
    }
    ignoreSigpipe();

    // argv is prepared before fork; the child only calls async-signal-safe functions
    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* p : {inPipe, outPipe, errPipe, statusPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };

    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(statusPipe, O_CLOEXEC) != 0) {
        const int err = errno;
        closeAll();
        throw errors::SpawnError(std::string("error creating pipes: ") + ::strerror(err));
    }

    pid_t child = ::fork();
    if (child < 0) {
        const int err = errno;
        closeAll();
        throw errors::SpawnError(std::string("error starting command: ") + ::strerror(err));
    }

    if (child == 0) {
        // The server starts with default SIGPIPE handling; an ignored disposition survives exec
        struct sigaction dfl;
        std::memset(&dfl, 0, sizeof(dfl));
        dfl.sa_handler = SIG_DFL;
        ::sigaction(SIGPIPE, &dfl, nullptr);
        // dup2 clears FD_CLOEXEC on the target descriptors
        if (::dup2(inPipe[0], STDIN_FILENO) < 0 || ::dup2(outPipe[1], STDOUT_FILENO) < 0 ||
            ::dup2(errPipe[1], STDERR_FILENO) < 0) {
            int err = errno;
            ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    // Zero bytes means exec succeeded and the close-on-exec status pipe was closed
    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (n != 0) {
        if (n < 0) {
            childErrno = errno;
        }
        reap(child);
        closeAll();
        throw errors::SpawnError(std::string("error starting command: ") + command[0] + ": " + ::strerror(childErrno));
    }

    pImpl->pid = child;
    pImpl->stdinPipe.assign(inPipe[1]);
    pImpl->stdoutPipe.assign(outPipe[0]);
    pImpl->stderrPipe.assign(errPipe[0]);

    pImpl->startDrain();
    pImpl->drainThread = std::thread([impl = pImpl.get()]() {
        impl->io.run();
    });
    LOG_DEBUG("ProcessSession: started '{}' as pid {}", command[0], child);
}

void ProcessSession::WriteLine(const std::string& line) {
    if (!pImpl->stdinPipe.is_open()) {
        throw errors::TransportWriteError("error writing bytes to stdin: stdin is closed");
    }
    std::string data = line;
    data.push_back('\n');
    boost::system::error_code ec;
    boost::asio::write(pImpl->stdinPipe, boost::asio::buffer(data), ec);
    if (ec) {
        throw errors::TransportWriteError("error writing bytes to stdin: " + ec.message());
    }
}

std::string ProcessSession::ReadLine() {
    if (!pImpl->stdoutPipe.is_open()) {
        throw errors::TransportReadError("error reading from stdout: stdout is closed");
    }
    boost::system::error_code ec;
    std::size_t n = boost::asio::read_until(pImpl->stdoutPipe, pImpl->stdoutBuf, '\n', ec);
    if (ec) {
        if (ec == boost::asio::error::eof) {
            throw errors::TransportReadError("error reading from stdout: EOF");
        }
        throw errors::TransportReadError("error reading from stdout: " + ec.message());
    }
    auto begin = boost::asio::buffers_begin(pImpl->stdoutBuf.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(n));
    pImpl->stdoutBuf.consume(n);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    return line;
}

void ProcessSession::CloseStdin() {
    boost::system::error_code ec;
    pImpl->stdinPipe.close(ec);
    if (ec) {
        LOG_DEBUG("ProcessSession: closing stdin failed: {}", ec.message());
    }
}

ExitOutcome ProcessSession::WaitOrKill(std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    ExitOutcome outcome;
    if (pImpl->pid <= 0 || pImpl->reaped) {
        outcome.status = pImpl->exitStatus;
        return outcome;
    }
    const pid_t pid = pImpl->pid;
    auto waiter = std::async(std::launch::async, [pid]() { return reap(pid); });
    if (waiter.wait_for(timeout) == std::future_status::timeout) {
        LOG_DEBUG("ProcessSession: pid {} still running after {}ms, sending SIGKILL", pid, timeout.count());
        ::kill(pid, SIGKILL);
        outcome.killed = true;
    }
    // The kill releases the waiter; joining here keeps it from outliving the call
    const int status = waiter.get();
    pImpl->reaped = true;
    if (status != -1) {
        pImpl->exitStatus = decodeWaitStatus(status);
    }
    outcome.status = pImpl->exitStatus;
    return outcome;
}

bool ProcessSession::WaitStderrClosed(std::chrono::milliseconds timeout) {
    if (pImpl->pid <= 0) {
        return true;
    }
    return pImpl->stderrClosedFuture.wait_for(timeout) == std::future_status::ready;
}

std::size_t ProcessSession::StderrSize() const {
    std::lock_guard<std::mutex> lock(pImpl->stderrMutex);
    return pImpl->stderrBuf.size();
}

std::string ProcessSession::DrainStderr() {
    std::lock_guard<std::mutex> lock(pImpl->stderrMutex);
    std::string out;
    out.swap(pImpl->stderrBuf);
    return out;
}

bool ProcessSession::IsInitialized() const {
    return pImpl->initialized;
}

void ProcessSession::MarkInitialized() {
    pImpl->initialized = true;
}

int ProcessSession::GetPid() const {
    return static_cast<int>(pImpl->pid);
}

bool ProcessSession::IsRunning() {
    if (pImpl->pid <= 0 || pImpl->reaped) {
        return false;
    }
    int status = 0;
    pid_t r = ::waitpid(pImpl->pid, &status, WNOHANG);
    if (r == pImpl->pid) {
        pImpl->reaped = true;
        pImpl->exitStatus = decodeWaitStatus(status);
        return false;
    }
    return r == 0;
}

} // namespace mcpexec
