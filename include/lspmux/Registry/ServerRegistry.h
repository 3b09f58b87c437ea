//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Server definitions built from the builtin catalog and loaded config.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_REGISTRY_SERVER_REGISTRY_H
#define LSPMUX_REGISTRY_SERVER_REGISTRY_H

#include "lspmux/Config/ConfigLoader.h"
#include "lspmux/Config/ConfigSchema.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <map>
#include <string>
#include <vector>

namespace lspmux
{

/// @brief Fully resolved, immutable description of one language server.
struct ServerDefinition final
{
    std::string id;

    /// @brief `true` when disabled by config or unusable (custom without extensions).
    bool disabled{false};

    ServerSource source{ServerSource::Builtin};

    /// @brief Command line; empty when none is configured.
    std::vector<std::string> command;

    /// @brief Lower-case extensions with a leading dot.
    std::vector<std::string> extensions;

    EnvironmentMap           env;
    llvm::json::Object       initialization;
    std::vector<std::string> roots;
    std::vector<std::string> excludeRoots;
    RootMode                 rootMode{RootMode::WorkspaceOrMarker};
};

/// @brief Builtin server entries keyed by id.
using ServerCatalog = std::map<std::string, ServerConfig>;

/// @brief Registry of server definitions keyed (and ordered) by id.
using ServerRegistry = std::map<std::string, ServerDefinition>;

/// @brief Returns the builtin catalog.
///
/// Covers typescript, pyright, gopls, rust-analyzer, clangd, lua, bash, and
/// css with their default commands, extensions, and root markers.
[[nodiscard]] ServerCatalog builtinServerCatalog();

/// @brief Lower-cases an extension and adds a leading dot.
/// @param[in] extension Raw extension (`TS`, `.ts`, ` .Ts `).
/// @return Normalized extension, or empty for blank input.
[[nodiscard]] std::string normalizeExtension(llvm::StringRef extension);

/// @brief Builds the registry from the catalog and loaded config.
/// @param[in] loaded Loaded config.
/// @param[in] catalog Builtin catalog.
/// @return Registry; empty when the config disables all servers.
[[nodiscard]] ServerRegistry buildServerRegistry(const LoadedConfig& loaded, const ServerCatalog& catalog);

/// @brief Returns enabled servers handling the file's extension, in id order.
/// @param[in] filePath File path.
/// @param[in] registry Server registry.
/// @return Candidate definitions.
[[nodiscard]] std::vector<const ServerDefinition*> candidatesForFile(llvm::StringRef       filePath,
                                                                     const ServerRegistry& registry);

}  // namespace lspmux

#endif  // LSPMUX_REGISTRY_SERVER_REGISTRY_H
