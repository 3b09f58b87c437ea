//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements layered config loading and project trust evaluation.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Config/ConfigLoader.h"

#include "lspmux/Support/Paths.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/GlobPattern.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <system_error>
#include <utility>

namespace lspmux
{
namespace
{

struct FileLoadResult final
{
    ConfigFile               config;
    std::vector<LoadWarning> warnings;
};

std::string errorMessage(llvm::Error error)
{
    std::string              text;
    llvm::raw_string_ostream stream(text);
    stream << error;
    stream.flush();
    return text;
}

LoadWarning parseWarning(llvm::StringRef path, std::string message)
{
    LoadWarning warning;
    warning.type     = "config-parse";
    warning.filePath = path.str();
    warning.message  = std::move(message);
    return warning;
}

FileLoadResult readAndValidateConfig(llvm::StringRef path)
{
    FileLoadResult result;
    if (!llvm::sys::fs::exists(path))
    {
        return result;
    }

    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
    if (!buffer)
    {
        result.warnings.push_back(parseWarning(path,
                                               "Failed to parse LSP config at " + path.str() + ": " +
                                                   buffer.getError().message()));
        return result;
    }

    llvm::Expected<llvm::json::Value> document = llvm::json::parse((*buffer)->getBuffer());
    if (!document)
    {
        result.warnings.push_back(
            parseWarning(path,
                         "Failed to parse LSP config at " + path.str() + ": " + errorMessage(document.takeError())));
        return result;
    }

    llvm::Expected<ConfigFile> parsed = parseConfigFile(*document);
    if (!parsed)
    {
        result.warnings.push_back(
            parseWarning(path,
                         "Invalid LSP config schema in " + path.str() + ": " + errorMessage(parsed.takeError())));
        return result;
    }

    result.config = std::move(*parsed);
    return result;
}

std::string expandTrustedRootEntry(llvm::StringRef entry, llvm::StringRef homeDir)
{
    if (entry == "~")
    {
        return homeDir.str();
    }
    if (entry.size() >= 2 && entry.substr(0, 2) == "~/")
    {
        llvm::SmallString<256> expanded(homeDir);
        llvm::sys::path::append(expanded, entry.drop_front(2));
        return std::string(expanded.str());
    }
    return entry.str();
}

bool unsafeOverridesAllowed(const ProjectConfigPolicy policy, const bool trustedProject)
{
    return policy == ProjectConfigPolicy::Always || (policy == ProjectConfigPolicy::TrustedOnly && trustedProject);
}

std::vector<LoadWarning> stripProjectSecurity(ConfigFile& project)
{
    std::vector<LoadWarning> warnings;
    auto                     block = [&warnings](llvm::StringRef field, llvm::StringRef detail) {
        LoadWarning warning;
        warning.type    = "project-security-override-blocked";
        warning.field   = field.str();
        warning.message = ("Blocked project security." + field + " override; " + detail).str();
        warnings.push_back(std::move(warning));
    };

    if (project.security.projectConfigPolicy)
    {
        block("projectConfigPolicy", "global policy is authoritative.");
    }
    if (project.security.trustedProjectRoots)
    {
        block("trustedProjectRoots", "global trust roots are authoritative.");
    }
    if (project.security.allowExternalPaths)
    {
        block("allowExternalPaths", "global path boundary is authoritative.");
    }
    project.security = SecuritySection{};
    return warnings;
}

std::vector<LoadWarning> stripUntrustedServerFields(ConfigFile& project, const ProjectConfigPolicy policy)
{
    std::vector<LoadWarning> warnings;
    const llvm::StringRef    policyName = projectConfigPolicyName(policy);
    auto                     block      = [&](const std::string& serverId, llvm::StringRef field) {
        LoadWarning warning;
        warning.type     = "project-override-blocked";
        warning.serverId = serverId;
        warning.field    = field.str();
        warning.message  = ("Blocked project " + field + " override for server '" + serverId + "' by policy '" +
                           policyName + "'.")
                              .str();
        warnings.push_back(std::move(warning));
    };

    for (auto& [serverId, server] : project.servers)
    {
        if (server.command)
        {
            server.command.reset();
            block(serverId, "command");
        }
        if (server.env)
        {
            server.env.reset();
            block(serverId, "env");
        }
    }
    return warnings;
}

std::map<std::string, ServerSource> deriveServerSource(const ConfigFile& global, const ConfigFile& project)
{
    std::map<std::string, ServerSource> sources;
    for (const auto& [serverId, _] : global.servers)
    {
        sources[serverId] = ServerSource::Global;
    }
    for (const auto& [serverId, _] : project.servers)
    {
        const auto it = sources.find(serverId);
        if (it == sources.end())
        {
            sources.emplace(serverId, ServerSource::Project);
        }
        else
        {
            it->second = ServerSource::Merged;
        }
    }
    return sources;
}

void appendWarnings(std::vector<LoadWarning>& target, std::vector<LoadWarning> source)
{
    for (LoadWarning& warning : source)
    {
        target.push_back(std::move(warning));
    }
}

}  // namespace

llvm::StringRef serverSourceName(const ServerSource source)
{
    switch (source)
    {
    case ServerSource::Builtin:
        return "builtin";
    case ServerSource::Global:
        return "global";
    case ServerSource::Project:
        return "project";
    case ServerSource::Merged:
        return "merged";
    }
    return "builtin";
}

std::string resolveWorkspaceRoot(llvm::StringRef cwd)
{
    const std::string start   = realPathOrAbsolute(cwd);
    std::string       current = start;
    while (true)
    {
        llvm::SmallString<256> git(current);
        llvm::sys::path::append(git, ".git");
        llvm::SmallString<256> jj(current);
        llvm::sys::path::append(jj, ".jj");
        if (llvm::sys::fs::exists(git) || llvm::sys::fs::exists(jj))
        {
            return current;
        }

        const std::string parent = parentDirectory(current);
        if (parent == current)
        {
            return start;
        }
        current = parent;
    }
}

std::optional<std::string> findNearestProjectConfig(llvm::StringRef cwd)
{
    std::string current = realPathOrAbsolute(cwd);
    while (true)
    {
        llvm::SmallString<256> candidate(current);
        llvm::sys::path::append(candidate, ".lspmux", "lsp.json");
        if (llvm::sys::fs::exists(candidate))
        {
            return std::string(candidate.str());
        }

        const std::string parent = parentDirectory(current);
        if (parent == current)
        {
            return std::nullopt;
        }
        current = parent;
    }
}

TrustMatchResult matchTrustedProjectRoot(llvm::StringRef                 projectRoot,
                                         const std::vector<std::string>& entries,
                                         llvm::StringRef                 homeDir)
{
    TrustMatchResult  result;
    const std::string candidate = stripTrailingSeparators(projectRoot);

    for (const std::string& rawEntry : entries)
    {
        const std::string expanded = expandTrustedRootEntry(rawEntry, homeDir);
        if (!llvm::sys::path::is_absolute(expanded))
        {
            LoadWarning warning;
            warning.type    = "invalid-trust-entry";
            warning.message = "Ignoring non-absolute trustedProjectRoots entry: " + rawEntry;
            result.warnings.push_back(std::move(warning));
            continue;
        }

        const std::string entry = stripTrailingSeparators(expanded);
        if (!hasGlobPattern(entry))
        {
            if (isWithinRoot(candidate, entry))
            {
                result.trusted = true;
                return result;
            }
            continue;
        }

        llvm::Expected<llvm::GlobPattern> pattern = llvm::GlobPattern::create(entry);
        if (!pattern)
        {
            LoadWarning warning;
            warning.type    = "trust-matcher-error";
            warning.message = "Trust matcher failed for entry '" + rawEntry + "': " + errorMessage(pattern.takeError());
            result.warnings.push_back(std::move(warning));
            result.trusted = false;
            return result;
        }
        if (pattern->match(candidate))
        {
            result.trusted = true;
            return result;
        }
    }
    return result;
}

LoadedConfig loadConfig(llvm::StringRef cwd, const LoaderOptions& options)
{
    LoadedConfig loaded;
    loaded.workspaceRoot = resolveWorkspaceRoot(cwd);
    loaded.projectPath   = findNearestProjectConfig(cwd);
    loaded.projectRoot   = loaded.projectPath
                               ? realPathOrAbsolute(parentDirectory(parentDirectory(*loaded.projectPath)))
                               : loaded.workspaceRoot;

    const std::string homeDir = options.homeDirectory.empty() ? homeDirectory() : options.homeDirectory;
    if (!options.globalConfigPath.empty())
    {
        loaded.globalPath = options.globalConfigPath;
    }
    else
    {
        llvm::SmallString<256> globalPath(homeDir);
        llvm::sys::path::append(globalPath, ".lspmux", "lsp.json");
        loaded.globalPath = std::string(globalPath.str());
    }

    FileLoadResult global  = readAndValidateConfig(loaded.globalPath);
    FileLoadResult project = loaded.projectPath ? readAndValidateConfig(*loaded.projectPath) : FileLoadResult{};
    appendWarnings(loaded.warnings, std::move(global.warnings));
    appendWarnings(loaded.warnings, std::move(project.warnings));

    const NormalizedConfig globalSecurity = normalizeConfig(global.config);
    const ProjectConfigPolicy policy      = globalSecurity.projectConfigPolicy;

    switch (policy)
    {
    case ProjectConfigPolicy::Always:
        loaded.trustedProject = true;
        break;
    case ProjectConfigPolicy::Never:
        loaded.trustedProject = false;
        break;
    case ProjectConfigPolicy::TrustedOnly: {
        TrustMatchResult match =
            matchTrustedProjectRoot(loaded.projectRoot, globalSecurity.trustedProjectRoots, homeDir);
        loaded.trustedProject = match.trusted;
        appendWarnings(loaded.warnings, std::move(match.warnings));
        if (!loaded.trustedProject)
        {
            LoadWarning warning;
            warning.type     = "project-config-untrusted";
            warning.filePath = loaded.projectPath.value_or("");
            warning.message  = "Project config overrides are not trusted for " + loaded.projectRoot;
            loaded.warnings.push_back(std::move(warning));
        }
        break;
    }
    }

    appendWarnings(loaded.warnings, stripProjectSecurity(project.config));
    if (!unsafeOverridesAllowed(policy, loaded.trustedProject))
    {
        appendWarnings(loaded.warnings, stripUntrustedServerFields(project.config, policy));
    }

    ConfigFile merged = mergeConfigFiles(global.config, project.config);
    merged.security   = global.config.security;

    loaded.config        = normalizeConfig(merged);
    loaded.serverSource  = deriveServerSource(global.config, project.config);
    loaded.globalConfig  = std::move(global.config);
    loaded.projectConfig = std::move(project.config);
    return loaded;
}

std::string configSignature(const LoadedConfig& loaded)
{
    std::string              signature;
    llvm::raw_string_ostream stream(signature);
    stream << toJSON(loaded.config) << '\n' << loaded.projectPath.value_or("");
    for (const LoadWarning& warning : loaded.warnings)
    {
        stream << '\n' << warning.message;
    }
    stream.flush();
    return signature;
}

}  // namespace lspmux
