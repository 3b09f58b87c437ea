//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Server binary resolution, auto-install, and process start.
///
/// Binaries are looked up on `PATH` and in a managed directory. Builtin
/// npm-backed servers that are missing and still use their default command
/// are installed into the managed directory on first use. Concurrent callers
/// for the same server share one installation attempt.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_PROCESS_SPAWNER_H
#define LSPMUX_PROCESS_SPAWNER_H

#include "lspmux/Process/ChildProcess.h"
#include "lspmux/Registry/ServerRegistry.h"
#include "lspmux/Support/Logging.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lspmux
{

/// @brief Environment variable that disables auto-install when truthy.
inline constexpr llvm::StringLiteral DisableAutoInstallEnvVar = "LSPMUX_DISABLE_AUTO_INSTALL";

/// @brief npm packages providing a builtin server binary.
struct NpmInstallSpec final
{
    std::vector<std::string> packages;
    std::string              binary;
};

/// @brief Installer callback: installs `spec` into `directory`.
using InstallRunner =
    std::function<llvm::Error(const NpmInstallSpec& spec, llvm::StringRef directory, const EnvironmentMap& environment)>;

/// @brief Returns the npm-backed install strategies (typescript, pyright, bash, css).
[[nodiscard]] std::map<std::string, NpmInstallSpec> builtinInstallSpecs();

/// @brief Returns `$HOME/.local/share/lspmux/lsp-bin`.
[[nodiscard]] std::string defaultManagedBinDirectory();

/// @brief Returns whether an environment value is `1`, `true`, `yes`, or `on`.
[[nodiscard]] bool isTruthyEnv(llvm::StringRef value);

/// @brief Returns the current process environment as a map.
[[nodiscard]] EnvironmentMap currentEnvironment();

/// @brief Overlays the server's `env` on top of `baseEnvironment`.
[[nodiscard]] EnvironmentMap buildSpawnEnvironment(const ServerDefinition& server,
                                                   const EnvironmentMap&   baseEnvironment);

/// @brief Runs `npm install --prefix <dir> --no-audit --no-fund <packages>`.
[[nodiscard]] llvm::Error runNpmInstall(const NpmInstallSpec& spec,
                                        llvm::StringRef       directory,
                                        const EnvironmentMap& environment);

/// @brief Started server process plus the command actually used.
struct SpawnedServer final
{
    std::unique_ptr<ChildProcess> process;
    std::vector<std::string>      command;
};

/// @brief Spawner configuration.
struct SpawnerOptions final
{
    /// @brief Builtin catalog, used to recognize default commands.
    ServerCatalog catalog;

    /// @brief Managed binary directory. Empty selects the default.
    std::string managedBinDirectory;

    /// @brief Install strategies keyed by server id.
    std::map<std::string, NpmInstallSpec> installSpecs;

    /// @brief Installer. Empty selects `runNpmInstall`.
    InstallRunner installer;
};

/// @brief Resolves, bootstraps, and starts server processes.
class ServerSpawner final
{
public:
    /// @brief Creates a spawner.
    /// @param[in] options Spawner configuration.
    /// @param[in] logger Logger used for install traces; must outlive the spawner.
    ServerSpawner(SpawnerOptions options, const Logger& logger);

    ServerSpawner(const ServerSpawner&)            = delete;
    ServerSpawner& operator=(const ServerSpawner&) = delete;

    /// @brief Resolves a binary name to an executable path.
    /// @param[in] binary Binary name or path.
    /// @param[in] environment Spawn environment providing `PATH`.
    /// @return Executable path, if found.
    [[nodiscard]] std::optional<std::string> resolveBinary(llvm::StringRef binary, const EnvironmentMap& environment) const;

    /// @brief Resolves the command line, bootstrapping the binary when allowed.
    /// @param[in] server Server definition.
    /// @param[in] root Server root, for error messages.
    /// @param[in] environment Spawn environment.
    /// @return Command with an executable first element, or an `ESPAWN` error.
    [[nodiscard]] llvm::Expected<std::vector<std::string>> resolveCommand(const ServerDefinition& server,
                                                                          llvm::StringRef         root,
                                                                          const EnvironmentMap&   environment);

    /// @brief Starts a server process in `root`.
    /// @param[in] server Server definition.
    /// @param[in] root Working directory and LSP root.
    /// @param[in] baseEnvironment Environment before server overrides.
    /// @return Spawned server, or an `ESPAWN` error.
    [[nodiscard]] llvm::Expected<SpawnedServer> spawn(const ServerDefinition& server,
                                                      llvm::StringRef         root,
                                                      const EnvironmentMap&   baseEnvironment);

    /// @brief Forgets in-flight installs, forcing the next miss to retry.
    void clearBootstrapCache();

    [[nodiscard]] const std::string& managedBinDirectory() const
    {
        return options_.managedBinDirectory;
    }

private:
    bool isDefaultCatalogCommand(const ServerDefinition& server) const;

    std::optional<std::string> bootstrap(const std::string& serverId, const EnvironmentMap& environment);

    std::optional<std::string> installNow(const std::string& serverId, const EnvironmentMap& environment);

    struct PendingInstall final
    {
        std::shared_future<std::optional<std::string>> result;
        std::uint64_t                                  generation{0};
    };

    SpawnerOptions                        options_;
    const Logger&                         logger_;
    std::mutex                            mutex_;
    std::map<std::string, PendingInstall> inFlight_;
};

}  // namespace lspmux

#endif  // LSPMUX_PROCESS_SPAWNER_H
