//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Code-intelligence operations executed through the orchestrator.
///
/// An operation validates its input, enforces the workspace path boundary,
/// warms the document, sends the matching LSP request(s) to every server for
/// the file, and flattens the per-server answers into one result list.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_RUNTIME_OPERATIONS_H
#define LSPMUX_RUNTIME_OPERATIONS_H

#include "lspmux/Runtime/Orchestrator.h"
#include "lspmux/Support/Cancellation.h"
#include "lspmux/Support/Error.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <string>
#include <vector>

namespace lspmux
{

/// @brief Returns every supported operation name.
[[nodiscard]] llvm::ArrayRef<llvm::StringLiteral> operationNames();

[[nodiscard]] bool isKnownOperation(llvm::StringRef operation);

/// @brief Symbol kinds kept by `workspaceSymbol`.
[[nodiscard]] bool isWorkspaceSymbolKind(std::int64_t kind);

/// @brief Maximum workspace symbols kept per server.
inline constexpr std::size_t WorkspaceSymbolLimit = 10;

/// @brief Keeps type-like symbols, at most `WorkspaceSymbolLimit` of them.
[[nodiscard]] llvm::json::Array filterWorkspaceSymbols(const llvm::json::Value& symbols);

struct OperationInput final
{
    std::string  operation;
    std::string  filePath;
    std::int64_t line{0};
    std::int64_t character{0};
};

/// @brief Checks the operation name and 1-based position.
[[nodiscard]] llvm::Error validateOperationInput(const OperationInput& input);

struct OperationResult final
{
    std::string                  operation;
    llvm::json::Array            results;
    std::vector<StructuredError> errors;
    bool                         timedOut{false};

    /// @brief Some servers failed while others produced results.
    bool partial{false};

    std::vector<std::string> warnings;
};

/// @brief Runs one operation for a file.
/// @param[in] orchestrator Orchestrator owning the clients.
/// @param[in] input Operation request.
/// @param[in] cwd Caller working directory.
/// @param[in] signal Abort signal.
/// @return Flattened result, or an error for invalid input, a path outside the
///         boundary, a missing file, or a file type no server handles.
[[nodiscard]] llvm::Expected<OperationResult> executeOperation(Orchestrator&         orchestrator,
                                                               const OperationInput& input,
                                                               llvm::StringRef       cwd,
                                                               const AbortSignal&    signal = {});

[[nodiscard]] llvm::json::Value toJSON(const OperationResult& result);

/// @brief Renders results as pretty JSON, or a "No results found" line.
[[nodiscard]] std::string formatOperationOutput(const OperationResult& result);

}  // namespace lspmux

#endif  // LSPMUX_RUNTIME_OPERATIONS_H
