//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the builtin catalog and registry construction.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Registry/ServerRegistry.h"

#include "llvm/Support/Path.h"

#include <algorithm>
#include <set>
#include <utility>

namespace lspmux
{
namespace
{

ServerConfig catalogEntry(std::vector<std::string> command,
                          std::vector<std::string> extensions,
                          std::vector<std::string> roots)
{
    ServerConfig entry;
    entry.command    = std::move(command);
    entry.extensions = std::move(extensions);
    entry.roots      = std::move(roots);
    entry.rootMode   = RootMode::WorkspaceOrMarker;
    return entry;
}

ServerSource deriveSource(const bool hasBuiltin, const bool hasConfigured, const ServerSource configuredSource)
{
    if (hasBuiltin)
    {
        return hasConfigured ? ServerSource::Merged : ServerSource::Builtin;
    }
    return configuredSource;
}

}  // namespace

ServerCatalog builtinServerCatalog()
{
    ServerCatalog catalog;
    catalog.emplace("typescript",
                    catalogEntry({"typescript-language-server", "--stdio"},
                                 {".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs", ".mts", ".cts"},
                                 {"package-lock.json",
                                  "bun.lockb",
                                  "bun.lock",
                                  "pnpm-lock.yaml",
                                  "yarn.lock",
                                  "package.json",
                                  "tsconfig.json",
                                  "jsconfig.json"}));
    catalog.emplace("pyright",
                    catalogEntry({"pyright-langserver", "--stdio"},
                                 {".py", ".pyi"},
                                 {"pyproject.toml",
                                  "setup.py",
                                  "setup.cfg",
                                  "requirements.txt",
                                  "Pipfile",
                                  "pyrightconfig.json"}));
    catalog.emplace("gopls", catalogEntry({"gopls"}, {".go"}, {"go.work", "go.mod", "go.sum"}));
    catalog.emplace("rust-analyzer", catalogEntry({"rust-analyzer"}, {".rs"}, {"Cargo.toml", "rust-project.json"}));
    catalog.emplace("clangd",
                    catalogEntry({"clangd", "--background-index", "--clang-tidy"},
                                 {".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp", ".hxx", ".m", ".mm"},
                                 {"compile_commands.json",
                                  "compile_flags.txt",
                                  ".clangd",
                                  "CMakeLists.txt",
                                  "Makefile",
                                  "configure.ac"}));
    catalog.emplace("lua", catalogEntry({"lua-language-server"}, {".lua"}, {".luarc.json", ".luarc.jsonc", ".git"}));
    catalog.emplace("bash", catalogEntry({"bash-language-server", "start"}, {".sh", ".bash", ".zsh"}, {".git"}));
    catalog.emplace("css",
                    catalogEntry({"vscode-css-language-server", "--stdio"},
                                 {".css", ".scss", ".less"},
                                 {"package.json", ".git"}));
    return catalog;
}

std::string normalizeExtension(llvm::StringRef extension)
{
    const std::string trimmed = extension.trim().lower();
    if (trimmed.empty())
    {
        return {};
    }
    return trimmed.front() == '.' ? trimmed : "." + trimmed;
}

ServerRegistry buildServerRegistry(const LoadedConfig& loaded, const ServerCatalog& catalog)
{
    ServerRegistry registry;
    if (loaded.config.lspDisabled)
    {
        return registry;
    }

    std::set<std::string> serverIds;
    for (const auto& [serverId, _] : catalog)
    {
        serverIds.insert(serverId);
    }
    for (const auto& [serverId, _] : loaded.config.servers)
    {
        serverIds.insert(serverId);
    }

    for (const std::string& serverId : serverIds)
    {
        const auto builtinIt    = catalog.find(serverId);
        const auto configuredIt = loaded.config.servers.find(serverId);
        const bool hasBuiltin   = builtinIt != catalog.end();
        const bool hasConfig    = configuredIt != loaded.config.servers.end();

        const ServerConfig merged = mergeServerConfig(hasBuiltin ? builtinIt->second : ServerConfig{},
                                                      hasConfig ? configuredIt->second : ServerConfig{});

        ServerDefinition definition;
        definition.id = serverId;
        for (const std::string& extension : merged.extensions.value_or(std::vector<std::string>{}))
        {
            if (std::string normalized = normalizeExtension(extension); !normalized.empty())
            {
                definition.extensions.push_back(std::move(normalized));
            }
        }

        const auto sourceIt = loaded.serverSource.find(serverId);
        definition.source   = deriveSource(hasBuiltin,
                                         hasConfig,
                                         sourceIt != loaded.serverSource.end() ? sourceIt->second
                                                                                 : ServerSource::Global);
        definition.disabled = merged.disabled.value_or(false) || (!hasBuiltin && definition.extensions.empty());
        definition.command  = merged.command.value_or(std::vector<std::string>{});
        definition.env      = merged.env.value_or(EnvironmentMap{});
        if (merged.initialization)
        {
            definition.initialization = *merged.initialization;
        }
        definition.roots        = merged.roots.value_or(std::vector<std::string>{});
        definition.excludeRoots = merged.excludeRoots.value_or(std::vector<std::string>{});
        definition.rootMode     = merged.rootMode.value_or(RootMode::WorkspaceOrMarker);
        registry.emplace(serverId, std::move(definition));
    }
    return registry;
}

std::vector<const ServerDefinition*> candidatesForFile(llvm::StringRef filePath, const ServerRegistry& registry)
{
    std::vector<const ServerDefinition*> matches;
    const std::string                    extension = normalizeExtension(llvm::sys::path::extension(filePath));
    if (extension.empty())
    {
        return matches;
    }

    for (const auto& [_, server] : registry)
    {
        if (server.disabled)
        {
            continue;
        }
        if (std::find(server.extensions.begin(), server.extensions.end(), extension) != server.extensions.end())
        {
            matches.push_back(&server);
        }
    }
    return matches;
}

}  // namespace lspmux
