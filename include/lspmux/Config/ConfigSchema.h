//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Typed model and strict schema for `lsp.json` configuration files.
///
/// A config file carries three optional sections: `lsp` (either `false` or a
/// map of per-server overrides), `security` and `timing`. Files are validated
/// strictly: unknown keys and ill-typed values reject the whole file.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_CONFIG_CONFIG_SCHEMA_H
#define LSPMUX_CONFIG_CONFIG_SCHEMA_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lspmux
{

/// @brief Policy deciding whether project-level overrides are honored.
enum class ProjectConfigPolicy
{
    /// @brief Trust projects below a configured trusted root.
    TrustedOnly,

    /// @brief Trust every project.
    Always,

    /// @brief Trust no project.
    Never,
};

/// @brief How a server's root is chosen when no marker matches.
enum class RootMode
{
    /// @brief Fall back to the workspace root (or the file directory).
    WorkspaceOrMarker,

    /// @brief Require a marker match; otherwise the server is skipped.
    MarkerOnly,
};

/// @brief Returns the config spelling (`trusted-only`, `always`, `never`).
[[nodiscard]] llvm::StringRef projectConfigPolicyName(ProjectConfigPolicy policy);

[[nodiscard]] std::optional<ProjectConfigPolicy> parseProjectConfigPolicy(llvm::StringRef text);

/// @brief Returns the config spelling (`workspace-or-marker`, `marker-only`).
[[nodiscard]] llvm::StringRef rootModeName(RootMode mode);

[[nodiscard]] std::optional<RootMode> parseRootMode(llvm::StringRef text);

/// @brief Map of environment variable names to values.
using EnvironmentMap = std::map<std::string, std::string>;

/// @brief One entry of the `lsp` map. Every field is optional.
struct ServerConfig final
{
    std::optional<bool>                     disabled;
    std::optional<std::vector<std::string>> command;
    std::optional<std::vector<std::string>> extensions;
    std::optional<EnvironmentMap>           env;
    std::optional<llvm::json::Object>       initialization;
    std::optional<std::vector<std::string>> roots;
    std::optional<std::vector<std::string>> excludeRoots;
    std::optional<RootMode>                 rootMode;
};

/// @brief Ordered map of server id to override entry.
using ServerConfigMap = std::map<std::string, ServerConfig>;

/// @brief Raw `security` section of one file.
struct SecuritySection final
{
    std::optional<ProjectConfigPolicy>      projectConfigPolicy;
    std::optional<std::vector<std::string>> trustedProjectRoots;
    std::optional<bool>                     allowExternalPaths;

    [[nodiscard]] bool empty() const
    {
        return !projectConfigPolicy && !trustedProjectRoots && !allowExternalPaths;
    }
};

/// @brief Raw `timing` section of one file.
struct TimingSection final
{
    std::optional<std::int64_t> requestTimeoutMs;
    std::optional<std::int64_t> diagnosticsWaitTimeoutMs;
    std::optional<std::int64_t> initializeTimeoutMs;
};

/// @brief One validated config file.
struct ConfigFile final
{
    /// @brief `true` when the file sets `lsp: false`.
    bool lspDisabled{false};

    /// @brief Per-server overrides from the `lsp` map.
    ServerConfigMap servers;

    SecuritySection security;
    TimingSection   timing;
};

/// @brief Effective timing budgets.
struct TimingConfig final
{
    std::int64_t requestTimeoutMs{10000};
    std::int64_t diagnosticsWaitTimeoutMs{3000};
    std::int64_t initializeTimeoutMs{15000};
};

/// @brief Merged configuration with every default applied.
struct NormalizedConfig final
{
    /// @brief `true` when either file disabled the registry with `lsp: false`.
    bool lspDisabled{false};

    ServerConfigMap servers;

    ProjectConfigPolicy      projectConfigPolicy{ProjectConfigPolicy::TrustedOnly};
    std::vector<std::string> trustedProjectRoots;
    bool                     allowExternalPaths{false};

    TimingConfig timing;
};

/// @brief Validates a parsed config document and converts it to the typed model.
/// @param[in] document Parsed JSON document.
/// @return Typed config, or an error listing every schema violation as `<path> <message>`.
[[nodiscard]] llvm::Expected<ConfigFile> parseConfigFile(const llvm::json::Value& document);

/// @brief Deep-merges two JSON values.
///
/// Objects merge key by key; arrays and scalars in `override` replace `base`.
///
/// @param[in] base Base value.
/// @param[in] override Overriding value.
/// @return Merged value.
[[nodiscard]] llvm::json::Value mergeJson(const llvm::json::Value& base, const llvm::json::Value& override);

/// @brief Merges one server entry over another with the deep-merge rules.
/// @param[in] base Base entry.
/// @param[in] override Overriding entry.
/// @return Merged entry.
[[nodiscard]] ServerConfig mergeServerConfig(const ServerConfig& base, const ServerConfig& override);

/// @brief Merges a whole file over another with the deep-merge rules.
/// @param[in] base Base file.
/// @param[in] override Overriding file.
/// @return Merged file. `lsp: false` in either input disables the result.
[[nodiscard]] ConfigFile mergeConfigFiles(const ConfigFile& base, const ConfigFile& override);

/// @brief Applies defaults to a merged file.
/// @param[in] merged Merged file.
/// @return Normalized config.
[[nodiscard]] NormalizedConfig normalizeConfig(const ConfigFile& merged);

/// @brief Serializes a server entry, omitting absent fields.
[[nodiscard]] llvm::json::Value toJSON(const ServerConfig& server);

/// @brief Serializes a normalized config deterministically.
[[nodiscard]] llvm::json::Value toJSON(const NormalizedConfig& config);

}  // namespace lspmux

#endif  // LSPMUX_CONFIG_CONFIG_SCHEMA_H
