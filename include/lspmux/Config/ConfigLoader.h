//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Layered configuration loading with a project trust boundary.
///
/// The global file (`~/.lspmux/lsp.json`) is authoritative for security
/// settings. The nearest project file (`<dir>/.lspmux/lsp.json`) may override
/// server entries, but `command` and `env` overrides are only honored when the
/// project is trusted, and project `security` fields are never honored.
/// Loading never fails: problems surface as warnings.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_CONFIG_CONFIG_LOADER_H
#define LSPMUX_CONFIG_CONFIG_LOADER_H

#include "lspmux/Config/ConfigSchema.h"

#include "llvm/ADT/StringRef.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lspmux
{

/// @brief Origin of a server definition.
enum class ServerSource
{
    Builtin,
    Global,
    Project,
    Merged,
};

/// @brief Returns `builtin`, `global`, `project`, or `merged`.
[[nodiscard]] llvm::StringRef serverSourceName(ServerSource source);

/// @brief Non-fatal problem found while loading configuration.
struct LoadWarning final
{
    /// @brief Warning category (`config-parse`, `project-override-blocked`, ...).
    std::string type;

    /// @brief Human-readable message.
    std::string message;

    /// @brief Config file the warning refers to, when known.
    std::string filePath;

    /// @brief Server id the warning refers to, when known.
    std::string serverId;

    /// @brief Offending field name, when known.
    std::string field;
};

/// @brief Overrides for file locations, used by tests and embedders.
struct LoaderOptions final
{
    /// @brief Global config file. Empty selects `<home>/.lspmux/lsp.json`.
    std::string globalConfigPath;

    /// @brief Home directory for `~` expansion. Empty selects the user's home.
    std::string homeDirectory;
};

/// @brief Result of loading and merging both config layers.
struct LoadedConfig final
{
    NormalizedConfig config;

    /// @brief Validated global file (empty on failure or absence).
    ConfigFile globalConfig;

    /// @brief Validated and sanitized project file.
    ConfigFile projectConfig;

    std::string                globalPath;
    std::optional<std::string> projectPath;
    std::string                projectRoot;
    std::string                workspaceRoot;
    std::vector<LoadWarning>   warnings;
    bool                       trustedProject{false};

    /// @brief Which file(s) configured each server id.
    std::map<std::string, ServerSource> serverSource;
};

/// @brief Outcome of trusted-root matching.
struct TrustMatchResult final
{
    bool                     trusted{false};
    std::vector<LoadWarning> warnings;
};

/// @brief Returns the nearest ancestor of `cwd` containing `.git` or `.jj`.
/// @param[in] cwd Starting directory.
/// @return Workspace root, or the real `cwd` when no marker exists.
[[nodiscard]] std::string resolveWorkspaceRoot(llvm::StringRef cwd);

/// @brief Returns the nearest `.lspmux/lsp.json` walking up from `cwd`.
/// @param[in] cwd Starting directory.
/// @return Path of the project config, if any.
[[nodiscard]] std::optional<std::string> findNearestProjectConfig(llvm::StringRef cwd);

/// @brief Tests a project root against `trustedProjectRoots` entries.
///
/// Entries may start with `~`. Entries containing glob metacharacters are
/// matched against the whole root; others match the root or any descendant.
///
/// @param[in] projectRoot Candidate project root.
/// @param[in] entries Raw trusted-root entries.
/// @param[in] homeDir Home directory used for `~` expansion.
/// @return Trust decision plus entry warnings.
[[nodiscard]] TrustMatchResult matchTrustedProjectRoot(llvm::StringRef                 projectRoot,
                                                       const std::vector<std::string>& entries,
                                                       llvm::StringRef                 homeDir);

/// @brief Loads, validates, sanitizes, and merges the config layers.
/// @param[in] cwd Working directory used to locate the project layer.
/// @param[in] options Location overrides.
/// @return Loaded config. Never fails.
[[nodiscard]] LoadedConfig loadConfig(llvm::StringRef cwd, const LoaderOptions& options = {});

/// @brief Returns a string that changes whenever the effective config changes.
/// @param[in] loaded Loaded config.
/// @return Signature covering the normalized config, project path, and warnings.
[[nodiscard]] std::string configSignature(const LoadedConfig& loaded);

}  // namespace lspmux

#endif  // LSPMUX_CONFIG_CONFIG_LOADER_H
