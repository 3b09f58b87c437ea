//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Trace-level filtered log forwarding.
///
/// Library components never print directly. They hand messages to a `Logger`,
/// which filters by trace level and forwards to an embedder-supplied sink.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_SUPPORT_LOGGING_H
#define LSPMUX_SUPPORT_LOGGING_H

#include "llvm/ADT/StringRef.h"

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace lspmux
{

/// @brief Trace verbosity level for log output.
enum class TraceLevel
{
    /// @brief Disable log output.
    Off,

    /// @brief Emit lifecycle and failure messages.
    Basic,

    /// @brief Emit per-request and per-notification traces.
    Verbose,
};

/// @brief Parses `off`, `basic`, or `verbose` (case-insensitive).
/// @param[in] text Raw level text.
/// @return Parsed level, or `std::nullopt` for unknown text.
[[nodiscard]] std::optional<TraceLevel> parseTraceLevel(llvm::StringRef text);

/// @brief Sink callback receiving filtered log lines.
using LogSink = std::function<void(TraceLevel level, llvm::StringRef message)>;

/// @brief Thread-safe level-filtered log forwarder.
class Logger final
{
public:
    Logger() = default;

    /// @brief Creates a logger forwarding to `sink` up to `level`.
    /// @param[in] sink Destination callback. Empty sink discards everything.
    /// @param[in] level Maximum level forwarded.
    Logger(LogSink sink, TraceLevel level);

    /// @brief Emits a lifecycle/failure message.
    /// @param[in] message Message text.
    void basic(llvm::StringRef message) const;

    /// @brief Emits a verbose trace message.
    /// @param[in] message Message text.
    void verbose(llvm::StringRef message) const;

    /// @brief Returns whether verbose traces are forwarded.
    [[nodiscard]] bool verboseEnabled() const
    {
        return sink_ && level_ == TraceLevel::Verbose;
    }

private:
    void emit(TraceLevel level, llvm::StringRef message) const;

    LogSink            sink_;
    TraceLevel         level_{TraceLevel::Off};
    mutable std::mutex mutex_;
};

}  // namespace lspmux

#endif  // LSPMUX_SUPPORT_LOGGING_H
