//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessSession.hpp
// Purpose: One spawned MCP server process with its stdin/stdout pipes and captured stderr
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace mcpexec {

//==========================================================================================================
// ExitStatus
// Purpose: How a reaped child terminated.
// Fields:
//   known: false when the status could not be collected (waitpid failed).
//   code: Exit code when the child exited normally, -1 otherwise.
//   signal: Terminating signal number, 0 when the child exited normally.
//==========================================================================================================
struct ExitStatus {
    bool known{false};
    int code{-1};
    int signal{0};

    bool Success() const { return known && signal == 0 && code == 0; }

    // "exit status N", "signal: killed", or "unknown exit status".
    std::string Describe() const;
};

// Result of WaitOrKill.
struct ExitOutcome {
    bool killed{false};
    ExitStatus status;
};

//==========================================================================================================
// ProcessSession
// Purpose: Owns a child process started with stdin/stdout connected as pipes. Stderr is drained into
//          an in-memory buffer by a background thread so the child never blocks on a full pipe.
// Notes:
//   - Not thread-safe apart from the stderr buffer; used by one Execute call at a time.
//   - Destruction closes the pipes, kills and reaps a child that was not reaped yet, and joins
//     the drain thread.
//==========================================================================================================
class ProcessSession {
public:
    ProcessSession();
    ~ProcessSession();

    ProcessSession(const ProcessSession&) = delete;
    ProcessSession& operator=(const ProcessSession&) = delete;

    //==========================================================================================================
    // Spawn
    // Purpose: Starts command[0] (resolved through PATH) with command[1..] as arguments.
    // Throws:
    //   errors::SpawnError when the command is empty, pipes cannot be created, or the process cannot
    //   be started (including exec failures in the child).
    //==========================================================================================================
    void Spawn(const std::vector<std::string>& command);

    //==========================================================================================================
    // WriteLine
    // Purpose: Writes line followed by '\n' to the child's stdin; all bytes are written.
    // Throws:
    //   errors::TransportWriteError when the pipe is closed or the write fails.
    //==========================================================================================================
    void WriteLine(const std::string& line);

    //==========================================================================================================
    // ReadLine
    // Purpose: Returns the next '\n'-terminated line from the child's stdout without the terminator.
    //          Bytes read past the newline stay buffered for the next call.
    // Throws:
    //   errors::TransportReadError on end of stream or I/O failure.
    //==========================================================================================================
    std::string ReadLine();

    // Closes the write end of the child's stdin so the child sees end of input.
    void CloseStdin();

    //==========================================================================================================
    // WaitOrKill
    // Purpose: Waits for the child to exit. When timeout elapses first, the child is sent SIGKILL and
    //          reaped; the returned outcome then has killed == true. Idempotent after the first reap.
    //==========================================================================================================
    ExitOutcome WaitOrKill(std::chrono::milliseconds timeout);

    // Blocks until the child's stderr reached end of stream or timeout elapsed; true when closed.
    bool WaitStderrClosed(std::chrono::milliseconds timeout);

    std::size_t StderrSize() const;

    // Returns everything captured so far and empties the buffer.
    std::string DrainStderr();

    bool IsInitialized() const;
    void MarkInitialized();

    int GetPid() const;
    bool IsRunning();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpexec
