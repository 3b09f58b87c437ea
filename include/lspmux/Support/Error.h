//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Structured error taxonomy for server spawn, transport, and request failures.
///
/// Errors travel between components as `llvm::Error` values carrying an
/// `LspError` payload. The orchestrator flattens them into `StructuredError`
/// records so callers always receive a code and a message.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_SUPPORT_ERROR_H
#define LSPMUX_SUPPORT_ERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace lspmux
{

/// @brief Failure category shared by every component.
enum class ErrorCode
{
    /// @brief Process could not be resolved or started.
    Spawn,

    /// @brief The `initialize` handshake failed.
    Init,

    /// @brief A request or diagnostics wait exceeded its budget.
    TimedOut,

    /// @brief The process exited or the transport broke.
    Pipe,

    /// @brief The key is backing off and was not attempted.
    Broken,

    /// @brief The caller cancelled the operation.
    Aborted,

    /// @brief The server answered with a JSON-RPC error object.
    Remote,

    /// @brief Any other failure coerced into the taxonomy.
    Internal,
};

/// @brief Returns the wire/display spelling of a code (`ESPAWN`, `EPIPE`, ...).
/// @param[in] code Error code.
/// @return Stable code string.
[[nodiscard]] llvm::StringRef errorCodeName(ErrorCode code);

/// @brief Where a failed spawn was attempted.
struct SpawnContext final
{
    std::string              root;
    std::vector<std::string> command;
};

/// @brief Error payload carried inside `llvm::Error`.
class LspError final : public llvm::ErrorInfo<LspError>
{
public:
    static char ID;

    /// @brief Creates an error payload.
    /// @param[in] code Error category.
    /// @param[in] message Human-readable message.
    /// @param[in] remoteCode JSON-RPC error code for `ErrorCode::Remote`.
    LspError(ErrorCode code, std::string message, std::optional<std::int64_t> remoteCode = std::nullopt);

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

    [[nodiscard]] ErrorCode code() const
    {
        return code_;
    }

    /// @brief Returns the message without the code prefix.
    [[nodiscard]] const std::string& text() const
    {
        return message_;
    }

    [[nodiscard]] std::optional<std::int64_t> remoteCode() const
    {
        return remoteCode_;
    }

    /// @brief Returns the display code, `LSP_<n>` for remote errors.
    /// @return Code string.
    [[nodiscard]] std::string codeString() const;

    [[nodiscard]] const std::optional<SpawnContext>& spawnContext() const
    {
        return spawnContext_;
    }

    void setSpawnContext(SpawnContext context)
    {
        spawnContext_ = std::move(context);
    }

private:
    ErrorCode                   code_;
    std::string                 message_;
    std::optional<std::int64_t> remoteCode_;
    std::optional<SpawnContext> spawnContext_;
};

/// @brief Convenience constructor for an `LspError`-backed `llvm::Error`.
/// @param[in] code Error category.
/// @param[in] message Human-readable message.
/// @return Error value.
[[nodiscard]] llvm::Error makeError(ErrorCode code, std::string message);

/// @brief Creates an `ESPAWN` error that records the root and command.
[[nodiscard]] llvm::Error makeSpawnError(std::string message, SpawnContext context);

/// @brief Flattened error record surfaced to orchestrator callers.
struct StructuredError final
{
    /// @brief Server id the failure belongs to.
    std::string serverId;

    /// @brief Error code string (`ESPAWN`, `EPIPE`, `LSP_-32601`, ...).
    std::string code;

    /// @brief Human-readable message.
    std::string message;

    /// @brief Root of the failed spawn; empty for other failures.
    std::string root;

    /// @brief Command of the failed spawn; empty for other failures.
    std::vector<std::string> command;

    /// @brief Returns whether the code denotes a timeout.
    [[nodiscard]] bool timedOut() const
    {
        return code == errorCodeName(ErrorCode::TimedOut);
    }
};

/// @brief Consumes an error and converts it into a structured record.
///
/// Errors without an `LspError` payload are coerced into `EINTERNAL` with the
/// original message preserved.
///
/// @param[in] serverId Server id to attribute the error to.
/// @param[in] error Error to consume.
/// @return Structured record.
[[nodiscard]] StructuredError toStructuredError(llvm::StringRef serverId, llvm::Error error);

/// @brief Serializes a record; `root` and `command` appear only for spawn failures.
[[nodiscard]] llvm::json::Value toJSON(const StructuredError& error);

}  // namespace lspmux

#endif  // LSPMUX_SUPPORT_ERROR_H
