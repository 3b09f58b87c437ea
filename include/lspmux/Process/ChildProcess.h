//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Child process with piped stdin/stdout.
///
/// The child runs in its own working directory with a supplied environment.
/// Stderr is discarded. Exec failures are reported synchronously from
/// `spawn` through a close-on-exec status pipe.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_PROCESS_CHILD_PROCESS_H
#define LSPMUX_PROCESS_CHILD_PROCESS_H

#include "lspmux/Config/ConfigSchema.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace lspmux
{

/// @brief Outcome of one `ChildProcess::read` call.
enum class ReadStatus
{
    Data,
    Timeout,
    EndOfFile,
    Failed,
};

/// @brief Owned child process. Killing and reaping happen on destruction.
class ChildProcess final
{
    struct ConstructionKey
    {
        explicit ConstructionKey() = default;
    };

public:
    /// @brief Starts `program` with `arguments`.
    /// @param[in] program Absolute path of the executable.
    /// @param[in] arguments Full argv including argv[0].
    /// @param[in] environment Complete child environment.
    /// @param[in] workingDirectory Child working directory.
    /// @return Running process, or an error describing the fork/exec failure.
    [[nodiscard]] static llvm::Expected<std::unique_ptr<ChildProcess>> spawn(llvm::StringRef                 program,
                                                                             const std::vector<std::string>& arguments,
                                                                             const EnvironmentMap& environment,
                                                                             llvm::StringRef       workingDirectory);

    ChildProcess(ConstructionKey, pid_t pid, int stdinFd, int stdoutFd);
    ~ChildProcess();

    ChildProcess(const ChildProcess&)            = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// @brief Writes all bytes to the child's stdin.
    /// @param[in] data Bytes to write.
    /// @return `true` when every byte was written.
    [[nodiscard]] bool write(llvm::StringRef data);

    /// @brief Reads available stdout bytes, waiting at most `timeout`.
    /// @param[out] out Receives the bytes read (replaced).
    /// @param[in] timeout Maximum wait.
    /// @return Read status.
    [[nodiscard]] ReadStatus read(std::string& out, std::chrono::milliseconds timeout);

    /// @brief Closes the child's stdin.
    void closeStdin();

    /// @brief Sends a signal when the child has not been reaped yet.
    /// @param[in] signal Signal number.
    void kill(int signal);

    /// @brief Returns whether the child is still running.
    [[nodiscard]] bool running();

    /// @brief Waits for exit, polling until `timeout` elapses.
    /// @param[in] timeout Maximum wait.
    /// @return `true` when the child has exited.
    [[nodiscard]] bool waitForExit(std::chrono::milliseconds timeout);

    /// @brief Returns the raw wait status once reaped.
    [[nodiscard]] std::optional<int> exitStatus();

    [[nodiscard]] pid_t pid() const
    {
        return pid_;
    }

private:
    bool reapLocked(bool block);

    pid_t              pid_;
    int                stdinFd_;
    int                stdoutFd_;
    std::mutex         stdinMutex_;
    std::mutex         stateMutex_;
    std::optional<int> exitStatus_;
};

}  // namespace lspmux

#endif  // LSPMUX_PROCESS_CHILD_PROCESS_H
