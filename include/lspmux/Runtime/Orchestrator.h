//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runtime orchestrator owning every live language server client.
///
/// Clients are keyed by `serverId::root`. The orchestrator reloads the
/// configuration on every access, spawns missing clients concurrently with one
/// attempt in flight per key, fans requests out to all matching clients, and
/// keeps a backoff record for keys whose server failed.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_RUNTIME_ORCHESTRATOR_H
#define LSPMUX_RUNTIME_ORCHESTRATOR_H

#include "lspmux/Config/ConfigLoader.h"
#include "lspmux/Process/Spawner.h"
#include "lspmux/Protocol/Client.h"
#include "lspmux/Registry/ServerRegistry.h"
#include "lspmux/Runtime/Backoff.h"
#include "lspmux/Runtime/Snapshot.h"
#include "lspmux/Support/Cancellation.h"
#include "lspmux/Support/Error.h"
#include "lspmux/Support/Logging.h"
#include "lspmux/Support/Telemetry.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lspmux
{

/// @brief Orchestrator construction options.
struct OrchestratorOptions final
{
    /// @brief Config file locations.
    LoaderOptions loader;

    /// @brief Spawner settings. An empty catalog is replaced by `catalog`.
    SpawnerOptions spawner;

    /// @brief Server catalog. Unset selects `builtinServerCatalog()`.
    std::optional<ServerCatalog> catalog;

    /// @brief Base spawn environment. Unset selects the current process environment.
    std::optional<EnvironmentMap> environment;

    /// @brief Diagnostics debounce override.
    std::optional<std::int64_t> diagnosticsDebounceMs;
};

/// @brief Result of one request against one client.
struct RequestOutcome final
{
    std::string                    serverId;
    std::string                    key;
    bool                           ok{false};
    llvm::json::Value              value = nullptr;
    std::optional<StructuredError> error;
    bool                           timedOut{false};
};

/// @brief Outcome set of a fan-out request.
struct RunSummary final
{
    /// @brief Number of server/root keys addressed.
    std::size_t                 hits{0};
    std::vector<RequestOutcome> outcomes;
    std::vector<std::string>    warnings;
};

/// @brief A key that could not provide a client.
struct KeyError final
{
    std::string     key;
    StructuredError error;
};

/// @brief Clients chosen for a file.
struct ClientSelection final
{
    std::vector<std::shared_ptr<ProtocolClient>> clients;
    std::vector<KeyError>                        errors;
    std::vector<std::string>                     requestedKeys;
};

/// @brief Result of touching a file on every matching client.
struct TouchSummary final
{
    bool                         touched{false};
    bool                         timedOut{false};
    bool                         aborted{false};
    std::vector<StructuredError> errors;
};

/// @brief 1-based position as supplied by callers.
struct TextPosition final
{
    std::int64_t line{1};
    std::int64_t character{1};
};

/// @brief Converts a 1-based position to an LSP (0-based) position object.
[[nodiscard]] llvm::json::Object toProtocolPosition(const TextPosition& position);

/// @brief Request callback executed against each selected client.
using RequestFunction = std::function<llvm::Expected<llvm::json::Value>(ProtocolClient& client)>;

/// @brief Multiplexes requests over per-root language server clients.
class Orchestrator final
{
public:
    /// @brief Creates an orchestrator and loads the configuration for `cwd`.
    /// @param[in] cwd Working directory used for config discovery.
    /// @param[in] logger Trace logger; must outlive the orchestrator.
    /// @param[in] options Construction options.
    Orchestrator(std::string cwd, const Logger& logger, OrchestratorOptions options = {});

    ~Orchestrator();

    Orchestrator(const Orchestrator&)            = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// @brief Switches the working directory and reloads when it changed.
    void setCwd(llvm::StringRef cwd);

    /// @brief Reloads the configuration and prunes stale clients.
    void reloadConfig();

    /// @brief Resolves, reuses, or spawns the clients for a file.
    [[nodiscard]] ClientSelection selectClientsForFile(llvm::StringRef filePath);

    /// @brief Returns the ready clients for a file, spawning as needed.
    [[nodiscard]] std::vector<std::shared_ptr<ProtocolClient>> getClientsForFile(llvm::StringRef filePath);

    /// @brief Runs `request` on every client for a file concurrently.
    [[nodiscard]] RunSummary run(llvm::StringRef filePath, const RequestFunction& request);

    /// @brief Sends a position request (`textDocument` + `position`) for a file.
    /// @param[in] filePath Absolute file path.
    /// @param[in] method LSP method name.
    /// @param[in] position 1-based position.
    /// @param[in] signal Abort signal.
    [[nodiscard]] RunSummary run(llvm::StringRef     filePath,
                                 llvm::StringRef     method,
                                 const TextPosition& position,
                                 const AbortSignal&  signal = {});

    /// @brief Runs `request` on every active client concurrently.
    [[nodiscard]] RunSummary runAll(const RequestFunction& request);

    /// @brief Opens or refreshes a file on every matching client.
    [[nodiscard]] TouchSummary touchFile(llvm::StringRef    filePath,
                                         bool               waitForDiagnostics,
                                         const AbortSignal& signal = {});

    /// @brief Returns whether some candidate server could serve the file now.
    [[nodiscard]] bool hasAvailableClientForFile(llvm::StringRef filePath);

    /// @brief Returns the workspace root and, when nested in it, the project root.
    [[nodiscard]] std::vector<std::string> getBoundaryRoots();

    [[nodiscard]] bool getAllowExternalPaths();

    [[nodiscard]] std::string getWorkspaceRoot();

    /// @brief Returns the messages of the current load warnings.
    [[nodiscard]] std::vector<std::string> getWarnings();

    [[nodiscard]] ServerRegistry getConfiguredServers();

    /// @brief Aggregates diagnostics of all active clients keyed by file path.
    [[nodiscard]] std::map<std::string, llvm::json::Array> diagnostics();

    [[nodiscard]] Snapshot getSnapshot();

    /// @brief Returns the backoff record for a key, if any.
    [[nodiscard]] std::optional<BrokenState> brokenState(llvm::StringRef key) const;

    /// @brief Shuts every client down one by one and clears all state.
    void shutdownAll();

    [[nodiscard]] Telemetry& telemetry()
    {
        return telemetry_;
    }

private:
    struct ClientEntry final
    {
        std::shared_ptr<ProtocolClient> client;
        ServerDefinition                server;
        std::vector<std::string>        command;
    };

    struct OwnedSpawn final
    {
        std::string             key;
        ServerDefinition        server;
        std::string             root;
        std::promise<void>      done;
    };

    void applyConfig(LoadedConfig loaded, bool forceReset);
    void ensureConfig();
    bool isActiveLocked(const ServerDefinition& server, llvm::StringRef root) const;
    std::vector<std::shared_ptr<ProtocolClient>> pruneLocked();
    void dropClosedClientsLocked();
    void spawnClient(OwnedSpawn& spawn);
    void recordBrokenLocked(const std::string& key, const std::string& message);
    RequestOutcome runOne(const std::string& key, ProtocolClient& client, const RequestFunction& request);
    void shutdownClients(const std::vector<std::shared_ptr<ProtocolClient>>& clients);

    const Logger&  logger_;
    ServerCatalog  catalog_;
    LoaderOptions  loaderOptions_;
    EnvironmentMap environment_;
    ServerSpawner  spawner_;
    Telemetry      telemetry_;

    std::optional<std::int64_t> debounceOverride_;

    mutable std::mutex                            mutex_;
    std::string                                   cwd_;
    LoadedConfig                                  loaded_;
    std::string                                   signature_;
    ServerRegistry                                registry_;
    std::map<std::string, ClientEntry>            clients_;
    std::map<std::string, std::shared_future<void>> spawning_;
    std::map<std::string, BrokenState>            broken_;
    std::map<std::string, StructuredError>        spawnFailures_;
};

}  // namespace lspmux

#endif  // LSPMUX_RUNTIME_ORCHESTRATOR_H
