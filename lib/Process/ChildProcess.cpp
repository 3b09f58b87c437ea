//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements POSIX child process management.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Process/ChildProcess.h"

#include "lspmux/Support/Cancellation.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lspmux
{
namespace
{

/// Blocks SIGPIPE on the calling thread for the guard's lifetime. A SIGPIPE raised by a write made under the guard
/// is consumed before the previous mask is restored, so the process disposition is never touched.
class SigpipeGuard final
{
public:
    SigpipeGuard()
    {
        sigemptyset(&pipeSet_);
        sigaddset(&pipeSet_, SIGPIPE);
        sigemptyset(&previous_);
        ::pthread_sigmask(SIG_BLOCK, &pipeSet_, &previous_);
        sigset_t pending;
        sigemptyset(&pending);
        alreadyPending_ = ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
    }

    ~SigpipeGuard()
    {
        if (raised_ && !alreadyPending_)
        {
            const timespec zero{0, 0};
            while (::sigtimedwait(&pipeSet_, nullptr, &zero) < 0 && errno == EINTR)
            {
            }
        }
        ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&)            = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

    void noteBrokenPipe()
    {
        raised_ = true;
    }

private:
    sigset_t pipeSet_{};
    sigset_t previous_{};
    bool     alreadyPending_ = false;
    bool     raised_         = false;
};

void closeIfOpen(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

llvm::Error systemError(llvm::StringRef what, const int error)
{
    return llvm::createStringError(std::error_code(error, std::generic_category()),
                                   "%s: %s",
                                   what.str().c_str(),
                                   std::strerror(error));
}

[[noreturn]] void failInChild(const int statusFd)
{
    const int error = errno;
    [[maybe_unused]] const ssize_t written = ::write(statusFd, &error, sizeof(error));
    ::_exit(127);
}

}  // namespace

llvm::Expected<std::unique_ptr<ChildProcess>> ChildProcess::spawn(llvm::StringRef                 program,
                                                                  const std::vector<std::string>& arguments,
                                                                  const EnvironmentMap&           environment,
                                                                  llvm::StringRef                 workingDirectory)
{
    // Everything the child touches is prepared before fork.
    const std::string  programPath = program.str();
    const std::string  directory   = workingDirectory.str();
    std::vector<char*> argv;
    argv.reserve(arguments.size() + 1U);
    for (const std::string& argument : arguments)
    {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStrings;
    envStrings.reserve(environment.size());
    for (const auto& [name, value] : environment)
    {
        envStrings.push_back(name + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1U);
    for (std::string& entry : envStrings)
    {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::array<int, 2> stdinPipe{-1, -1};
    std::array<int, 2> stdoutPipe{-1, -1};
    std::array<int, 2> statusPipe{-1, -1};
    auto               closeAll = [&]() {
        for (int* fd : {&stdinPipe[0], &stdinPipe[1], &stdoutPipe[0], &stdoutPipe[1], &statusPipe[0], &statusPipe[1]})
        {
            closeIfOpen(*fd);
        }
    };

    if (::pipe2(stdinPipe.data(), O_CLOEXEC) != 0 || ::pipe2(stdoutPipe.data(), O_CLOEXEC) != 0 ||
        ::pipe2(statusPipe.data(), O_CLOEXEC) != 0)
    {
        const int error = errno;
        closeAll();
        return systemError("pipe", error);
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        const int error = errno;
        closeAll();
        return systemError("fork", error);
    }

    if (pid == 0)
    {
        if (::dup2(stdinPipe[0], STDIN_FILENO) < 0 || ::dup2(stdoutPipe[1], STDOUT_FILENO) < 0)
        {
            failInChild(statusPipe[1]);
        }
        const int devNull = ::open("/dev/null", O_WRONLY);
        if (devNull >= 0)
        {
            ::dup2(devNull, STDERR_FILENO);
            ::close(devNull);
        }
        if (!directory.empty() && ::chdir(directory.c_str()) != 0)
        {
            failInChild(statusPipe[1]);
        }
        ::execve(programPath.c_str(), argv.data(), envp.data());
        failInChild(statusPipe[1]);
    }

    closeIfOpen(stdinPipe[0]);
    closeIfOpen(stdoutPipe[1]);
    closeIfOpen(statusPipe[1]);

    int     childError = 0;
    ssize_t received   = 0;
    do
    {
        received = ::read(statusPipe[0], &childError, sizeof(childError));
    } while (received < 0 && errno == EINTR);
    closeIfOpen(statusPipe[0]);

    if (received == static_cast<ssize_t>(sizeof(childError)))
    {
        int status = 0;
        ::waitpid(pid, &status, 0);
        closeAll();
        return systemError("exec " + programPath, childError);
    }

    return std::make_unique<ChildProcess>(ConstructionKey{}, pid, stdinPipe[1], stdoutPipe[0]);
}

ChildProcess::ChildProcess(ConstructionKey, const pid_t pid, const int stdinFd, const int stdoutFd)
    : pid_(pid)
    , stdinFd_(stdinFd)
    , stdoutFd_(stdoutFd)
{
}

ChildProcess::~ChildProcess()
{
    closeStdin();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!exitStatus_)
        {
            ::kill(pid_, SIGKILL);
            reapLocked(/*block=*/true);
        }
    }
    closeIfOpen(stdoutFd_);
}

bool ChildProcess::write(llvm::StringRef data)
{
    std::lock_guard<std::mutex> lock(stdinMutex_);
    if (stdinFd_ < 0)
    {
        return false;
    }

    SigpipeGuard guard;
    const char*  cursor    = data.data();
    std::size_t  remaining = data.size();
    while (remaining > 0U)
    {
        const ssize_t written = ::write(stdinFd_, cursor, remaining);
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (errno == EPIPE)
            {
                guard.noteBrokenPipe();
            }
            return false;
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return true;
}

ReadStatus ChildProcess::read(std::string& out, const std::chrono::milliseconds timeout)
{
    out.clear();
    if (stdoutFd_ < 0)
    {
        return ReadStatus::EndOfFile;
    }

    pollfd descriptor{};
    descriptor.fd     = stdoutFd_;
    descriptor.events = POLLIN;
    const int ready   = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
    if (ready == 0)
    {
        return ReadStatus::Timeout;
    }
    if (ready < 0)
    {
        return errno == EINTR ? ReadStatus::Timeout : ReadStatus::Failed;
    }

    std::array<char, 8192> buffer{};
    const ssize_t          received = ::read(stdoutFd_, buffer.data(), buffer.size());
    if (received > 0)
    {
        out.assign(buffer.data(), static_cast<std::size_t>(received));
        return ReadStatus::Data;
    }
    if (received == 0)
    {
        return ReadStatus::EndOfFile;
    }
    return errno == EINTR || errno == EAGAIN ? ReadStatus::Timeout : ReadStatus::Failed;
}

void ChildProcess::closeStdin()
{
    std::lock_guard<std::mutex> lock(stdinMutex_);
    closeIfOpen(stdinFd_);
}

void ChildProcess::kill(const int signal)
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!exitStatus_ && !reapLocked(/*block=*/false))
    {
        ::kill(pid_, signal);
    }
}

bool ChildProcess::running()
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return !exitStatus_ && !reapLocked(/*block=*/false);
}

bool ChildProcess::waitForExit(const std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (!running())
        {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(AbortPollInterval);
    }
}

std::optional<int> ChildProcess::exitStatus()
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!exitStatus_)
    {
        reapLocked(/*block=*/false);
    }
    return exitStatus_;
}

bool ChildProcess::reapLocked(const bool block)
{
    int   status = 0;
    pid_t result = 0;
    do
    {
        result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == pid_)
    {
        exitStatus_ = status;
        return true;
    }
    if (result < 0)
    {
        // ECHILD: already reaped elsewhere.
        exitStatus_ = -1;
        return true;
    }
    return false;
}

}  // namespace lspmux
