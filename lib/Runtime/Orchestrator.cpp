//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements client selection, fan-out, backoff, and config invalidation.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Runtime/Orchestrator.h"

#include "lspmux/Registry/RootResolver.h"
#include "lspmux/Support/Paths.h"

#include "llvm/ADT/ScopeExit.h"

#include <algorithm>
#include <chrono>
#include <utility>

namespace lspmux
{
namespace
{

SpawnerOptions prepareSpawnerOptions(SpawnerOptions options, const ServerCatalog& catalog)
{
    if (options.catalog.empty())
    {
        options.catalog = catalog;
    }
    if (options.installSpecs.empty())
    {
        options.installSpecs = builtinInstallSpecs();
    }
    return options;
}

bool withinWorkspace(llvm::StringRef path, llvm::StringRef workspaceRoot)
{
    return isWithinRoot(realPathOrAbsolute(path), realPathOrAbsolute(workspaceRoot));
}

struct TouchOutcome final
{
    TouchFileResult                result;
    std::optional<StructuredError> error;
};

}  // namespace

llvm::json::Object toProtocolPosition(const TextPosition& position)
{
    return llvm::json::Object{
        {"line", std::max<std::int64_t>(0, position.line - 1)},
        {"character", std::max<std::int64_t>(0, position.character - 1)},
    };
}

Orchestrator::Orchestrator(std::string cwd, const Logger& logger, OrchestratorOptions options)
    : logger_(logger)
    , catalog_(options.catalog ? std::move(*options.catalog) : builtinServerCatalog())
    , loaderOptions_(std::move(options.loader))
    , environment_(options.environment ? std::move(*options.environment) : currentEnvironment())
    , spawner_(prepareSpawnerOptions(std::move(options.spawner), catalog_), logger)
    , debounceOverride_(options.diagnosticsDebounceMs)
    , cwd_(std::move(cwd))
{
    reloadConfig();
}

Orchestrator::~Orchestrator()
{
    shutdownAll();
}

void Orchestrator::setCwd(llvm::StringRef cwd)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cwd_ == cwd)
        {
            return;
        }
        cwd_ = cwd.str();
    }
    reloadConfig();
}

void Orchestrator::reloadConfig()
{
    std::string cwd;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cwd = cwd_;
    }
    applyConfig(loadConfig(cwd, loaderOptions_), true);
}

void Orchestrator::ensureConfig()
{
    std::string cwd;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cwd = cwd_;
    }
    applyConfig(loadConfig(cwd, loaderOptions_), false);
}

void Orchestrator::applyConfig(LoadedConfig loaded, const bool forceReset)
{
    const std::string                            signature = configSignature(loaded);
    const std::string                            workspace = loaded.workspaceRoot;
    bool                                         changed   = false;
    std::vector<std::shared_ptr<ProtocolClient>> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = signature != signature_;
        if (!changed && !forceReset)
        {
            return;
        }
        if (changed)
        {
            broken_.clear();
            spawnFailures_.clear();
        }
        loaded_    = std::move(loaded);
        signature_ = signature;
        registry_  = buildServerRegistry(loaded_, catalog_);
        stale      = pruneLocked();
    }

    if (changed)
    {
        spawner_.clearBootstrapCache();
        logger_.verbose("configuration loaded for workspace " + workspace);
    }
    shutdownClients(stale);
}

bool Orchestrator::isActiveLocked(const ServerDefinition& server, llvm::StringRef root) const
{
    const auto it = registry_.find(server.id);
    if (it == registry_.end() || it->second.disabled)
    {
        return false;
    }
    return withinWorkspace(root, loaded_.workspaceRoot);
}

std::vector<std::shared_ptr<ProtocolClient>> Orchestrator::pruneLocked()
{
    std::vector<std::shared_ptr<ProtocolClient>> stale;
    for (auto it = clients_.begin(); it != clients_.end();)
    {
        if (isActiveLocked(it->second.server, it->second.client->root()))
        {
            ++it;
            continue;
        }
        logger_.basic("stopping " + it->second.server.id + " in " + it->second.client->root() +
                      ": no longer configured for this workspace");
        stale.push_back(it->second.client);
        broken_.erase(it->first);
        spawnFailures_.erase(it->first);
        it = clients_.erase(it);
    }

    const auto outOfScope = [this](const std::string& key) {
        const auto parsed = parseServerRootKey(key);
        if (!parsed)
        {
            return true;
        }
        return registry_.count(parsed->first) == 0 || !withinWorkspace(parsed->second, loaded_.workspaceRoot);
    };
    for (auto it = broken_.begin(); it != broken_.end();)
    {
        it = outOfScope(it->first) ? broken_.erase(it) : std::next(it);
    }
    for (auto it = spawnFailures_.begin(); it != spawnFailures_.end();)
    {
        it = outOfScope(it->first) ? spawnFailures_.erase(it) : std::next(it);
    }
    return stale;
}

void Orchestrator::dropClosedClientsLocked()
{
    for (auto it = clients_.begin(); it != clients_.end();)
    {
        if (it->second.client->state() == ClientState::Closed)
        {
            // An exit between requests counts as a broken pipe.
            logger_.verbose("dropping closed client " + it->first);
            recordBrokenLocked(it->first, it->second.server.id + " " + it->second.client->closedReason());
            it = clients_.erase(it);
            continue;
        }
        ++it;
    }
}

void Orchestrator::recordBrokenLocked(const std::string& key, const std::string& message)
{
    const auto        it       = broken_.find(key);
    const BrokenState previous = it == broken_.end() ? BrokenState{} : it->second;
    BrokenState       next     = nextBrokenState(it == broken_.end() ? nullptr : &previous,
                                       message,
                                       std::chrono::system_clock::now(),
                                       randomJitterFactor());
    broken_[key]               = std::move(next);
}

void Orchestrator::spawnClient(OwnedSpawn& spawn)
{
    auto release = llvm::make_scope_exit([this, &spawn] {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            spawning_.erase(spawn.key);
        }
        spawn.done.set_value();
    });

    const ServerDefinition& server = spawn.server;
    logger_.basic("spawning " + server.id + " in " + spawn.root);

    ClientTiming timing;
    std::string  signature;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        signature                       = signature_;
        timing.requestTimeoutMs         = loaded_.config.timing.requestTimeoutMs;
        timing.diagnosticsWaitTimeoutMs = loaded_.config.timing.diagnosticsWaitTimeoutMs;
        timing.initializeTimeoutMs      = loaded_.config.timing.initializeTimeoutMs;
    }
    if (debounceOverride_)
    {
        timing.diagnosticsDebounceMs = *debounceOverride_;
    }

    std::shared_ptr<ProtocolClient> client;
    std::vector<std::string>        command;
    std::optional<StructuredError>  failure;

    llvm::Expected<SpawnedServer> spawned = spawner_.spawn(server, spawn.root, environment_);
    if (!spawned)
    {
        failure = toStructuredError(server.id, spawned.takeError());
    }
    else
    {
        command = spawned->command;
        client  = std::make_shared<ProtocolClient>(server.id,
                                                  spawn.root,
                                                  std::move(spawned->process),
                                                  timing,
                                                  logger_,
                                                  &telemetry_);
        if (llvm::Error error = client->initialize(server.initialization))
        {
            failure = toStructuredError(server.id, std::move(error));
            client.reset();
        }
    }

    std::shared_ptr<ProtocolClient> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure)
        {
            recordBrokenLocked(spawn.key, failure->message);
            spawnFailures_[spawn.key] = *failure;
        }
        else if (signature != signature_ || !isActiveLocked(server, spawn.root))
        {
            // The configuration changed while the server was starting.
            StructuredError error;
            error.serverId            = server.id;
            error.code                = errorCodeName(ErrorCode::Aborted).str();
            error.message             = "Spawn of " + server.id + " in " + spawn.root + " cancelled: configuration changed";
            spawnFailures_[spawn.key] = error;
            cancelled                 = std::move(client);
        }
        else
        {
            clients_[spawn.key] = ClientEntry{client, server, std::move(command)};
            broken_.erase(spawn.key);
            spawnFailures_.erase(spawn.key);
        }
    }
    if (failure)
    {
        logger_.basic(failure->message);
    }
    if (cancelled)
    {
        logger_.basic("stopping " + server.id + " in " + spawn.root + ": configuration changed while starting");
        cancelled->shutdown();
    }
}

ClientSelection Orchestrator::selectClientsForFile(llvm::StringRef filePath)
{
    ensureConfig();

    ClientSelection                          selection;
    std::map<std::string, KeyError>          errorByKey;
    std::vector<std::shared_future<void>>    waits;
    std::vector<std::unique_ptr<OwnedSpawn>> owned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropClosedClientsLocked();

        const auto now = std::chrono::system_clock::now();
        for (const ServerDefinition* server : candidatesForFile(filePath, registry_))
        {
            if (server->disabled)
            {
                continue;
            }
            const std::optional<std::string> root = resolveServerRoot(filePath, *server, loaded_.workspaceRoot);
            if (!root)
            {
                continue;
            }

            const std::string key = serverRootKey(server->id, *root);
            selection.requestedKeys.push_back(key);

            const auto broken = broken_.find(key);
            if (broken != broken_.end() && broken->second.backingOff(now))
            {
                StructuredError error;
                error.serverId = server->id;
                error.code     = errorCodeName(ErrorCode::Broken).str();
                error.message  = "Server " + server->id + " is backing off until " +
                                formatTimestamp(broken->second.retryAt) + ": " + broken->second.lastError;
                errorByKey[key] = KeyError{key, std::move(error)};
                continue;
            }

            if (clients_.count(key) != 0)
            {
                continue;
            }

            const auto inFlight = spawning_.find(key);
            if (inFlight != spawning_.end())
            {
                waits.push_back(inFlight->second);
                continue;
            }

            auto spawn    = std::make_unique<OwnedSpawn>();
            spawn->key    = key;
            spawn->server = *server;
            spawn->root   = *root;
            std::shared_future<void> done = spawn->done.get_future().share();
            spawning_[key]                = done;
            waits.push_back(done);
            owned.push_back(std::move(spawn));
        }
    }

    std::vector<std::future<void>> tasks;
    std::size_t                    launched = 0;
    // Spawns that never got a thread must not leave waiters behind.
    auto abandonUnlaunched = llvm::make_scope_exit([this, &owned, &launched] {
        for (std::size_t index = launched; index < owned.size(); ++index)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                spawning_.erase(owned[index]->key);
            }
            owned[index]->done.set_value();
        }
    });
    tasks.reserve(owned.size());
    for (const std::unique_ptr<OwnedSpawn>& spawn : owned)
    {
        OwnedSpawn* target = spawn.get();
        tasks.push_back(std::async(std::launch::async, [this, target] { spawnClient(*target); }));
        ++launched;
    }
    for (std::future<void>& task : tasks)
    {
        task.get();
    }
    for (const std::shared_future<void>& wait : waits)
    {
        wait.wait();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const std::string& key : selection.requestedKeys)
    {
        const auto entry = clients_.find(key);
        if (entry != clients_.end() && entry->second.client->isReady())
        {
            selection.clients.push_back(entry->second.client);
            continue;
        }
        const auto error = errorByKey.find(key);
        if (error != errorByKey.end())
        {
            selection.errors.push_back(error->second);
            continue;
        }
        const auto failure = spawnFailures_.find(key);
        if (failure != spawnFailures_.end())
        {
            selection.errors.push_back(KeyError{key, failure->second});
        }
    }
    return selection;
}

std::vector<std::shared_ptr<ProtocolClient>> Orchestrator::getClientsForFile(llvm::StringRef filePath)
{
    return selectClientsForFile(filePath).clients;
}

RequestOutcome Orchestrator::runOne(const std::string& key, ProtocolClient& client, const RequestFunction& request)
{
    RequestOutcome outcome;
    outcome.serverId = client.serverId();
    outcome.key      = key;

    llvm::Expected<llvm::json::Value> value = request(client);
    if (value)
    {
        outcome.ok    = true;
        outcome.value = std::move(*value);
        std::lock_guard<std::mutex> lock(mutex_);
        broken_.erase(key);
        return outcome;
    }

    StructuredError error = toStructuredError(client.serverId(), value.takeError());
    outcome.timedOut      = error.timedOut();
    if (error.code == errorCodeName(ErrorCode::Pipe))
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recordBrokenLocked(key, error.message);
        // Already counted; the closed-client sweep must not count it again.
        const auto entry = clients_.find(key);
        if (entry != clients_.end() && entry->second.client.get() == &client)
        {
            clients_.erase(entry);
        }
    }
    outcome.error = std::move(error);
    return outcome;
}

RunSummary Orchestrator::run(llvm::StringRef filePath, const RequestFunction& request)
{
    ClientSelection selection = selectClientsForFile(filePath);

    RunSummary summary;
    summary.hits = selection.requestedKeys.size();
    for (KeyError& failure : selection.errors)
    {
        RequestOutcome outcome;
        outcome.serverId = failure.error.serverId;
        outcome.key      = failure.key;
        outcome.timedOut = failure.error.timedOut();
        outcome.error    = std::move(failure.error);
        summary.outcomes.push_back(std::move(outcome));
    }

    std::vector<std::future<RequestOutcome>> pending;
    pending.reserve(selection.clients.size());
    for (const std::shared_ptr<ProtocolClient>& client : selection.clients)
    {
        pending.push_back(std::async(std::launch::async, [this, client, &request] {
            return runOne(serverRootKey(client->serverId(), client->root()), *client, request);
        }));
    }
    for (std::future<RequestOutcome>& outcome : pending)
    {
        summary.outcomes.push_back(outcome.get());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const LoadWarning& warning : loaded_.warnings)
    {
        summary.warnings.push_back(warning.message);
    }
    return summary;
}

RunSummary Orchestrator::run(llvm::StringRef     filePath,
                             llvm::StringRef     method,
                             const TextPosition& position,
                             const AbortSignal&  signal)
{
    const std::string uri = pathToFileUri(filePath);
    return run(filePath, [&](ProtocolClient& client) {
        RequestOptions options;
        options.signal = signal;
        return client.request(method,
                              llvm::json::Object{
                                  {"textDocument", llvm::json::Object{{"uri", uri}}},
                                  {"position", toProtocolPosition(position)},
                              },
                              options);
    });
}

RunSummary Orchestrator::runAll(const RequestFunction& request)
{
    ensureConfig();

    std::vector<std::pair<std::string, std::shared_ptr<ProtocolClient>>> active;
    RunSummary                                                           summary;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropClosedClientsLocked();
        for (const auto& [key, entry] : clients_)
        {
            if (entry.client->isReady() && isActiveLocked(entry.server, entry.client->root()))
            {
                active.emplace_back(key, entry.client);
            }
        }
        for (const LoadWarning& warning : loaded_.warnings)
        {
            summary.warnings.push_back(warning.message);
        }
    }

    summary.hits = active.size();
    std::vector<std::future<RequestOutcome>> pending;
    pending.reserve(active.size());
    for (const auto& [key, client] : active)
    {
        pending.push_back(std::async(std::launch::async, [this, key = key, client = client, &request] {
            return runOne(key, *client, request);
        }));
    }
    for (std::future<RequestOutcome>& outcome : pending)
    {
        summary.outcomes.push_back(outcome.get());
    }
    return summary;
}

TouchSummary Orchestrator::touchFile(llvm::StringRef filePath, const bool waitForDiagnostics, const AbortSignal& signal)
{
    ClientSelection selection = selectClientsForFile(filePath);

    TouchSummary summary;
    for (KeyError& failure : selection.errors)
    {
        summary.errors.push_back(std::move(failure.error));
    }
    if (selection.clients.empty())
    {
        return summary;
    }
    summary.touched = true;

    const std::string                      path = filePath.str();
    std::vector<std::future<TouchOutcome>> pending;
    pending.reserve(selection.clients.size());
    for (const std::shared_ptr<ProtocolClient>& client : selection.clients)
    {
        pending.push_back(std::async(std::launch::async, [client, &path, waitForDiagnostics, &signal] {
            TouchOutcome                    outcome;
            llvm::Expected<TouchFileResult> touched = client->touchFile(path, waitForDiagnostics, signal);
            if (touched)
            {
                outcome.result = *touched;
            }
            else
            {
                outcome.error = toStructuredError(client->serverId(), touched.takeError());
            }
            return outcome;
        }));
    }
    for (std::future<TouchOutcome>& future : pending)
    {
        TouchOutcome outcome = future.get();
        summary.timedOut     = summary.timedOut || outcome.result.timedOut;
        summary.aborted      = summary.aborted || outcome.result.aborted;
        if (outcome.error)
        {
            summary.errors.push_back(std::move(*outcome.error));
        }
    }
    return summary;
}

bool Orchestrator::hasAvailableClientForFile(llvm::StringRef filePath)
{
    ensureConfig();

    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  now = std::chrono::system_clock::now();
    for (const ServerDefinition* server : candidatesForFile(filePath, registry_))
    {
        if (server->disabled)
        {
            continue;
        }
        const std::optional<std::string> root = resolveServerRoot(filePath, *server, loaded_.workspaceRoot);
        if (!root)
        {
            continue;
        }
        const auto broken = broken_.find(serverRootKey(server->id, *root));
        if (broken != broken_.end() && broken->second.backingOff(now))
        {
            continue;
        }
        return true;
    }
    return false;
}

std::vector<std::string> Orchestrator::getBoundaryRoots()
{
    ensureConfig();

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string>    roots{loaded_.workspaceRoot};
    if (!loaded_.projectRoot.empty() && loaded_.projectRoot != loaded_.workspaceRoot &&
        withinWorkspace(loaded_.projectRoot, loaded_.workspaceRoot))
    {
        roots.push_back(loaded_.projectRoot);
    }
    return roots;
}

bool Orchestrator::getAllowExternalPaths()
{
    ensureConfig();
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_.config.allowExternalPaths;
}

std::string Orchestrator::getWorkspaceRoot()
{
    ensureConfig();
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_.workspaceRoot;
}

std::vector<std::string> Orchestrator::getWarnings()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string>    messages;
    for (const LoadWarning& warning : loaded_.warnings)
    {
        messages.push_back(warning.message);
    }
    return messages;
}

ServerRegistry Orchestrator::getConfiguredServers()
{
    ensureConfig();
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_;
}

std::map<std::string, llvm::json::Array> Orchestrator::diagnostics()
{
    ensureConfig();

    std::vector<std::shared_ptr<ProtocolClient>> active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, entry] : clients_)
        {
            if (isActiveLocked(entry.server, entry.client->root()))
            {
                active.push_back(entry.client);
            }
        }
    }

    std::map<std::string, llvm::json::Array> aggregated;
    for (const std::shared_ptr<ProtocolClient>& client : active)
    {
        for (auto& [uri, items] : client->diagnostics())
        {
            const std::optional<std::string> path = fileUriToPath(uri);
            if (!path)
            {
                continue;
            }
            llvm::json::Array& target = aggregated[*path];
            for (llvm::json::Value& item : items)
            {
                target.push_back(std::move(item));
            }
        }
    }
    return aggregated;
}

Snapshot Orchestrator::getSnapshot()
{
    ensureConfig();

    std::lock_guard<std::mutex> lock(mutex_);
    dropClosedClientsLocked();

    std::vector<SnapshotRow> rows;
    for (const auto& [id, server] : registry_)
    {
        SnapshotRow row;
        row.serverId        = id;
        row.source          = server.source;
        row.disabled        = server.disabled;
        row.extensions      = server.extensions;
        row.configuredRoots = server.roots;

        DiagnosticCounts counts;
        for (const auto& [key, entry] : clients_)
        {
            if (entry.server.id != id || !isActiveLocked(entry.server, entry.client->root()))
            {
                continue;
            }
            row.connectedRoots.push_back(entry.client->root());
            for (const auto& [uri, items] : entry.client->diagnostics())
            {
                accumulateDiagnostics(counts, items);
            }
            const auto seen = entry.client->lastSeen();
            if (!row.lastSeenAt || seen > *row.lastSeenAt)
            {
                row.lastSeenAt = seen;
            }
        }
        if (counts.total > 0)
        {
            row.diagnostics = counts;
        }

        for (const auto& [key, future] : spawning_)
        {
            const auto parsed = parseServerRootKey(key);
            if (parsed && parsed->first == id && withinWorkspace(parsed->second, loaded_.workspaceRoot))
            {
                row.spawningRoots.push_back(parsed->second);
            }
        }

        for (const auto& [key, broken] : broken_)
        {
            const auto parsed = parseServerRootKey(key);
            if (!parsed || parsed->first != id || !withinWorkspace(parsed->second, loaded_.workspaceRoot))
            {
                continue;
            }
            if (!row.broken || broken.attempts > row.broken->attempts)
            {
                row.broken = broken;
            }
        }
        rows.push_back(std::move(row));
    }
    return makeSnapshot(std::move(rows), std::chrono::system_clock::now());
}

std::optional<BrokenState> Orchestrator::brokenState(llvm::StringRef key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = broken_.find(key.str());
    if (it == broken_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void Orchestrator::shutdownAll()
{
    std::vector<std::shared_ptr<ProtocolClient>> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, entry] : clients_)
        {
            clients.push_back(entry.client);
        }
        clients_.clear();
        spawning_.clear();
        broken_.clear();
    }
    shutdownClients(clients);
}

void Orchestrator::shutdownClients(const std::vector<std::shared_ptr<ProtocolClient>>& clients)
{
    for (const std::shared_ptr<ProtocolClient>& client : clients)
    {
        client->shutdown();
    }
}

}  // namespace lspmux
