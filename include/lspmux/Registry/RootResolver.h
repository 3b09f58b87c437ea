//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Per-server workspace root resolution from marker files.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_REGISTRY_ROOT_RESOLVER_H
#define LSPMUX_REGISTRY_ROOT_RESOLVER_H

#include "lspmux/Registry/ServerRegistry.h"

#include "llvm/ADT/StringRef.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lspmux
{

/// @brief Returns whether a root marker matches inside `directory`.
///
/// Plain markers are existence checks of `directory/marker`; a trailing `/`
/// is ignored. Markers with glob metacharacters are matched against the names
/// of the directory entries.
///
/// @param[in] marker Marker text.
/// @param[in] directory Directory to test.
/// @return `true` on match.
[[nodiscard]] bool markerMatchesDirectory(llvm::StringRef marker, llvm::StringRef directory);

/// @brief Walks up from the file's directory looking for any marker.
/// @param[in] filePath File path.
/// @param[in] markers Marker list.
/// @param[in] boundaryRoot Directory the walk must not leave; empty for none.
/// @return First matching directory.
[[nodiscard]] std::optional<std::string> findRootByMarkers(llvm::StringRef                 filePath,
                                                           const std::vector<std::string>& markers,
                                                           llvm::StringRef                 boundaryRoot);

/// @brief Resolves the root directory a server instance should use for a file.
/// @param[in] filePath File path.
/// @param[in] server Server definition.
/// @param[in] workspaceRoot Workspace boundary.
/// @return Root, or `std::nullopt` when excluded or when `marker-only` finds no marker.
[[nodiscard]] std::optional<std::string> resolveServerRoot(llvm::StringRef         filePath,
                                                           const ServerDefinition& server,
                                                           llvm::StringRef         workspaceRoot);

/// @brief Builds the client key `serverId::root`.
[[nodiscard]] std::string serverRootKey(llvm::StringRef serverId, llvm::StringRef root);

/// @brief Splits a client key at the first `::`.
/// @param[in] key Client key.
/// @return `(serverId, root)`, or `std::nullopt` when the separator is missing.
[[nodiscard]] std::optional<std::pair<std::string, std::string>> parseServerRootKey(llvm::StringRef key);

}  // namespace lspmux

#endif  // LSPMUX_REGISTRY_ROOT_RESOLVER_H
