//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the structured error payload and its flattening helpers.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Support/Error.h"

#include "llvm/Support/raw_ostream.h"

#include <memory>
#include <string>
#include <utility>

namespace lspmux
{

char LspError::ID = 0;

llvm::StringRef errorCodeName(const ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::Spawn:
        return "ESPAWN";
    case ErrorCode::Init:
        return "EINIT";
    case ErrorCode::TimedOut:
        return "ETIMEDOUT";
    case ErrorCode::Pipe:
        return "EPIPE";
    case ErrorCode::Broken:
        return "EBROKEN";
    case ErrorCode::Aborted:
        return "EABORTED";
    case ErrorCode::Remote:
        return "LSP";
    case ErrorCode::Internal:
        return "EINTERNAL";
    }
    return "EINTERNAL";
}

LspError::LspError(const ErrorCode code, std::string message, const std::optional<std::int64_t> remoteCode)
    : code_(code)
    , message_(std::move(message))
    , remoteCode_(remoteCode)
{
}

void LspError::log(llvm::raw_ostream& os) const
{
    os << codeString() << ": " << message_;
}

std::error_code LspError::convertToErrorCode() const
{
    switch (code_)
    {
    case ErrorCode::TimedOut:
        return std::make_error_code(std::errc::timed_out);
    case ErrorCode::Pipe:
        return std::make_error_code(std::errc::broken_pipe);
    case ErrorCode::Aborted:
        return std::make_error_code(std::errc::operation_canceled);
    default:
        return llvm::inconvertibleErrorCode();
    }
}

std::string LspError::codeString() const
{
    if (code_ == ErrorCode::Remote && remoteCode_)
    {
        return "LSP_" + std::to_string(*remoteCode_);
    }
    return errorCodeName(code_).str();
}

llvm::Error makeError(const ErrorCode code, std::string message)
{
    return llvm::make_error<LspError>(code, std::move(message));
}

llvm::Error makeSpawnError(std::string message, SpawnContext context)
{
    auto payload = std::make_unique<LspError>(ErrorCode::Spawn, std::move(message));
    payload->setSpawnContext(std::move(context));
    return llvm::Error(std::move(payload));
}

StructuredError toStructuredError(llvm::StringRef serverId, llvm::Error error)
{
    StructuredError out;
    out.serverId = serverId.str();
    bool first   = true;
    llvm::handleAllErrors(
        std::move(error),
        [&out, &first](const LspError& payload) {
            if (first)
            {
                out.code    = payload.codeString();
                out.message = payload.text();
                if (const std::optional<SpawnContext>& context = payload.spawnContext())
                {
                    out.root    = context->root;
                    out.command = context->command;
                }
                first = false;
                return;
            }
            out.message += "; " + payload.text();
        },
        [&out, &first](const llvm::ErrorInfoBase& payload) {
            if (first)
            {
                out.code    = errorCodeName(ErrorCode::Internal).str();
                out.message = payload.message();
                first       = false;
                return;
            }
            out.message += "; " + payload.message();
        });
    if (first)
    {
        out.code    = errorCodeName(ErrorCode::Internal).str();
        out.message = "unknown error";
    }
    return out;
}

llvm::json::Value toJSON(const StructuredError& error)
{
    llvm::json::Object out{
        {"serverId", error.serverId},
        {"code", error.code},
        {"message", error.message},
    };
    if (!error.root.empty())
    {
        out["root"] = error.root;
    }
    if (!error.command.empty())
    {
        llvm::json::Array command;
        for (const std::string& part : error.command)
        {
            command.push_back(part);
        }
        out["command"] = std::move(command);
    }
    return out;
}

}  // namespace lspmux
