//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements binary resolution, npm bootstrap, and server process start.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Process/Spawner.h"

#include "lspmux/Support/Error.h"
#include "lspmux/Support/Paths.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Program.h"

#include <atomic>
#include <cstdint>
#include <utility>

extern char** environ;

namespace lspmux
{
namespace
{

bool isExecutableFile(llvm::StringRef path)
{
    return llvm::sys::fs::can_execute(path) && !llvm::sys::fs::is_directory(path);
}

std::vector<std::string> searchPathsFromEnvironment(const EnvironmentMap& environment)
{
    std::vector<std::string> paths;
    const auto               it = environment.find("PATH");
    if (it == environment.end())
    {
        return paths;
    }

    llvm::SmallVector<llvm::StringRef, 16> parts;
    llvm::StringRef(it->second).split(parts, ':', /*MaxSplit=*/-1, /*KeepEmpty=*/false);
    for (const llvm::StringRef part : parts)
    {
        paths.push_back(part.str());
    }
    return paths;
}

std::string nodeBinPath(llvm::StringRef managedDirectory, llvm::StringRef binary)
{
    llvm::SmallString<256> path(managedDirectory);
    llvm::sys::path::append(path, "node_modules", ".bin", binary);
    return std::string(path.str());
}

std::uint64_t nextBootstrapGeneration()
{
    static std::atomic<std::uint64_t> generation{0};
    return ++generation;
}

}  // namespace

std::map<std::string, NpmInstallSpec> builtinInstallSpecs()
{
    return {
        {"typescript", NpmInstallSpec{{"typescript", "typescript-language-server"}, "typescript-language-server"}},
        {"pyright", NpmInstallSpec{{"pyright"}, "pyright-langserver"}},
        {"bash", NpmInstallSpec{{"bash-language-server"}, "bash-language-server"}},
        {"css", NpmInstallSpec{{"vscode-langservers-extracted"}, "vscode-css-language-server"}},
    };
}

std::string defaultManagedBinDirectory()
{
    std::string home = homeDirectory();
    if (home.empty())
    {
        llvm::SmallString<256> cwd;
        if (!llvm::sys::fs::current_path(cwd))
        {
            home = std::string(cwd.str());
        }
    }
    llvm::SmallString<256> path(home);
    llvm::sys::path::append(path, ".local", "share", "lspmux");
    llvm::sys::path::append(path, "lsp-bin");
    return std::string(path.str());
}

bool isTruthyEnv(llvm::StringRef value)
{
    const std::string normalized = value.trim().lower();
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

EnvironmentMap currentEnvironment()
{
    EnvironmentMap environment;
    for (char** entry = environ; entry && *entry; ++entry)
    {
        const llvm::StringRef text(*entry);
        const std::size_t     separator = text.find('=');
        if (separator == llvm::StringRef::npos || separator == 0U)
        {
            continue;
        }
        environment[text.substr(0, separator).str()] = text.substr(separator + 1).str();
    }
    return environment;
}

EnvironmentMap buildSpawnEnvironment(const ServerDefinition& server, const EnvironmentMap& baseEnvironment)
{
    EnvironmentMap environment = baseEnvironment;
    for (const auto& [name, value] : server.env)
    {
        environment[name] = value;
    }
    return environment;
}

llvm::Error runNpmInstall(const NpmInstallSpec& spec, llvm::StringRef directory, const EnvironmentMap& environment)
{
    const std::vector<std::string> searchPaths = searchPathsFromEnvironment(environment);
    std::vector<llvm::StringRef>   searchRefs(searchPaths.begin(), searchPaths.end());
    if (searchRefs.empty())
    {
        return llvm::createStringError(std::make_error_code(std::errc::no_such_file_or_directory),
                                       "npm not found: PATH is empty");
    }
    llvm::ErrorOr<std::string> npm = llvm::sys::findProgramByName("npm", searchRefs);
    if (!npm)
    {
        return llvm::createStringError(npm.getError(), "npm not found: %s", npm.getError().message().c_str());
    }

    std::vector<std::string> arguments{*npm, "install", "--prefix", directory.str(), "--no-audit", "--no-fund"};
    arguments.insert(arguments.end(), spec.packages.begin(), spec.packages.end());
    std::vector<llvm::StringRef> argumentRefs(arguments.begin(), arguments.end());

    std::vector<std::string> envStrings;
    for (const auto& [name, value] : environment)
    {
        envStrings.push_back(name + "=" + value);
    }
    std::vector<llvm::StringRef> envRefs(envStrings.begin(), envStrings.end());

    std::string  message;
    bool         failedToExecute = false;
    const int    exitCode        = llvm::sys::ExecuteAndWait(*npm,
                                                   argumentRefs,
                                                   llvm::ArrayRef<llvm::StringRef>(envRefs),
                                                   {llvm::StringRef(""), llvm::StringRef(""), llvm::StringRef("")},
                                                   /*SecondsToWait=*/0,
                                                   /*MemoryLimit=*/0,
                                                   &message,
                                                   &failedToExecute);
    if (failedToExecute || exitCode != 0)
    {
        return llvm::createStringError(std::make_error_code(std::errc::io_error),
                                       "Command failed (%d): %s%s%s",
                                       exitCode,
                                       llvm::join(arguments, " ").c_str(),
                                       message.empty() ? "" : ": ",
                                       message.c_str());
    }
    return llvm::Error::success();
}

ServerSpawner::ServerSpawner(SpawnerOptions options, const Logger& logger)
    : options_(std::move(options))
    , logger_(logger)
{
    if (options_.managedBinDirectory.empty())
    {
        options_.managedBinDirectory = defaultManagedBinDirectory();
    }
    if (!options_.installer)
    {
        options_.installer = runNpmInstall;
    }
}

std::optional<std::string> ServerSpawner::resolveBinary(llvm::StringRef binary, const EnvironmentMap& environment) const
{
    if (binary.empty())
    {
        return std::nullopt;
    }
    if (binary.contains('/'))
    {
        const std::string absolute = realPathOrAbsolute(binary);
        return isExecutableFile(absolute) ? std::optional<std::string>(absolute) : std::nullopt;
    }

    std::vector<std::string> searchPaths = searchPathsFromEnvironment(environment);
    searchPaths.push_back(options_.managedBinDirectory);
    llvm::SmallString<256> nodeBin(options_.managedBinDirectory);
    llvm::sys::path::append(nodeBin, "node_modules", ".bin");
    searchPaths.push_back(std::string(nodeBin.str()));

    const std::vector<llvm::StringRef> searchRefs(searchPaths.begin(), searchPaths.end());
    llvm::ErrorOr<std::string>         found = llvm::sys::findProgramByName(binary, searchRefs);
    if (!found)
    {
        return std::nullopt;
    }
    return *found;
}

bool ServerSpawner::isDefaultCatalogCommand(const ServerDefinition& server) const
{
    const auto it = options_.catalog.find(server.id);
    if (it == options_.catalog.end() || !it->second.command)
    {
        return false;
    }
    return *it->second.command == server.command;
}

std::optional<std::string> ServerSpawner::installNow(const std::string& serverId, const EnvironmentMap& environment)
{
    const auto specIt = options_.installSpecs.find(serverId);
    if (specIt == options_.installSpecs.end())
    {
        return std::nullopt;
    }

    const std::string cached = nodeBinPath(options_.managedBinDirectory, specIt->second.binary);
    if (isExecutableFile(cached))
    {
        return cached;
    }

    if (const std::error_code ec = llvm::sys::fs::create_directories(options_.managedBinDirectory))
    {
        logger_.basic("auto-install for '" + serverId + "' could not create " + options_.managedBinDirectory + ": " +
                      ec.message());
        return std::nullopt;
    }

    logger_.basic("installing " + llvm::join(specIt->second.packages, " ") + " for '" + serverId + "'");
    if (llvm::Error error = options_.installer(specIt->second, options_.managedBinDirectory, environment))
    {
        logger_.basic("auto-install for '" + serverId + "' failed: " + llvm::toString(std::move(error)));
        return std::nullopt;
    }
    return isExecutableFile(cached) ? std::optional<std::string>(cached) : std::nullopt;
}

std::optional<std::string> ServerSpawner::bootstrap(const std::string& serverId, const EnvironmentMap& environment)
{
    std::shared_future<std::optional<std::string>> pending;
    std::promise<std::optional<std::string>>       promise;
    std::uint64_t                                  generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto it = inFlight_.find(serverId); it != inFlight_.end())
        {
            pending = it->second.result;
        }
        else
        {
            generation = nextBootstrapGeneration();
            inFlight_.emplace(serverId, PendingInstall{promise.get_future().share(), generation});
        }
    }

    if (generation == 0U)
    {
        return pending.get();
    }

    std::optional<std::string> installed = installNow(serverId, environment);
    promise.set_value(installed);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto it = inFlight_.find(serverId); it != inFlight_.end() && it->second.generation == generation)
        {
            inFlight_.erase(it);
        }
    }
    return installed;
}

void ServerSpawner::clearBootstrapCache()
{
    std::lock_guard<std::mutex> lock(mutex_);
    inFlight_.clear();
}

llvm::Expected<std::vector<std::string>> ServerSpawner::resolveCommand(const ServerDefinition& server,
                                                                       llvm::StringRef         root,
                                                                       const EnvironmentMap&   environment)
{
    if (server.command.empty())
    {
        return makeSpawnError("No command configured for LSP server '" + server.id + "'.", SpawnContext{root.str(), {}});
    }

    std::vector<std::string> command = server.command;
    if (std::optional<std::string> resolved = resolveBinary(command.front(), environment))
    {
        command.front() = std::move(*resolved);
        return command;
    }

    const auto envIt          = environment.find(DisableAutoInstallEnvVar.str());
    const bool autoInstallOff = envIt != environment.end() && isTruthyEnv(envIt->second);
    const bool hasStrategy    = options_.installSpecs.count(server.id) != 0U;
    const bool attempt        = isDefaultCatalogCommand(server) && !autoInstallOff && hasStrategy;

    if (attempt)
    {
        if (std::optional<std::string> installed = bootstrap(server.id, environment))
        {
            command.front() = std::move(*installed);
            return command;
        }
        if (std::optional<std::string> resolved = resolveBinary(command.front(), environment))
        {
            command.front() = std::move(*resolved);
            return command;
        }
    }

    std::string hint;
    if (autoInstallOff)
    {
        hint = "Auto-install is disabled (" + DisableAutoInstallEnvVar.str() + ").";
    }
    else if (attempt)
    {
        hint = "Attempted auto-install but binary is still unavailable.";
    }
    else
    {
        hint = "No auto-install strategy is available for this server.";
    }
    return makeSpawnError("Missing LSP binary '" + server.command.front() + "' for server '" + server.id + "' (root " +
                              root.str() + "). " + hint,
                          SpawnContext{root.str(), server.command});
}

llvm::Expected<SpawnedServer> ServerSpawner::spawn(const ServerDefinition& server,
                                                   llvm::StringRef         root,
                                                   const EnvironmentMap&   baseEnvironment)
{
    const EnvironmentMap environment = buildSpawnEnvironment(server, baseEnvironment);

    llvm::Expected<std::vector<std::string>> command = resolveCommand(server, root, environment);
    if (!command)
    {
        return command.takeError();
    }

    llvm::Expected<std::unique_ptr<ChildProcess>> process =
        ChildProcess::spawn(command->front(), *command, environment, root);
    if (!process)
    {
        return makeSpawnError("Failed to spawn " + server.id + " (" + llvm::join(*command, " ") + " in " + root.str() +
                                  "): " + llvm::toString(process.takeError()),
                              SpawnContext{root.str(), *command});
    }

    logger_.verbose("spawned " + server.id + " pid " + std::to_string((*process)->pid()) + " in " + root.str());
    SpawnedServer spawned;
    spawned.process = std::move(*process);
    spawned.command = std::move(*command);
    return spawned;
}

}  // namespace lspmux
