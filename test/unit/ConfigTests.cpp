//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Config schema, merge, and trust policy tests.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Config/ConfigLoader.h"
#include "lspmux/Config/ConfigSchema.h"

#include "TestWorkspace.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

namespace
{

llvm::json::Value parseJson(const std::string& text)
{
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(text);
    if (!parsed)
    {
        std::cerr << "invalid JSON test fixture: " << llvm::toString(parsed.takeError()) << "\n";
        std::abort();
    }
    return std::move(*parsed);
}

bool hasWarning(const lspmux::LoadedConfig& loaded, const std::string& type, const std::string& field = {})
{
    return std::any_of(loaded.warnings.begin(), loaded.warnings.end(), [&](const lspmux::LoadWarning& warning) {
        return warning.type == type && (field.empty() || warning.field == field);
    });
}

bool runSchemaTests()
{
    {
        llvm::Expected<lspmux::ConfigFile> parsed = lspmux::parseConfigFile(parseJson(R"({
            "lsp": {"pyright": {"command": ["pyright-langserver", "--stdio"], "rootMode": "marker-only"}},
            "security": {"projectConfigPolicy": "always", "allowExternalPaths": true},
            "timing": {"requestTimeoutMs": 250}
        })"));
        if (!parsed)
        {
            std::cerr << "valid config rejected: " << llvm::toString(parsed.takeError()) << "\n";
            return false;
        }
        const auto server = parsed->servers.find("pyright");
        if (server == parsed->servers.end() || !server->second.command || server->second.command->size() != 2U ||
            server->second.rootMode != lspmux::RootMode::MarkerOnly)
        {
            std::cerr << "server entry not parsed\n";
            return false;
        }
        if (parsed->security.projectConfigPolicy != lspmux::ProjectConfigPolicy::Always ||
            parsed->security.allowExternalPaths != true || parsed->timing.requestTimeoutMs != 250)
        {
            std::cerr << "security/timing sections not parsed\n";
            return false;
        }
    }

    {
        llvm::Expected<lspmux::ConfigFile> parsed = lspmux::parseConfigFile(parseJson(R"({"lsp": false})"));
        if (!parsed || !parsed->lspDisabled || !parsed->servers.empty())
        {
            if (!parsed)
            {
                llvm::consumeError(parsed.takeError());
            }
            std::cerr << "lsp:false not recognized\n";
            return false;
        }
    }

    {
        llvm::Expected<lspmux::ConfigFile> parsed = lspmux::parseConfigFile(
            parseJson(R"({"lsp": {"x": {"command": [], "bogus": 1}}, "timing": {"requestTimeoutMs": 0}, "extra": {}})"));
        if (parsed)
        {
            std::cerr << "invalid config accepted\n";
            return false;
        }
        const std::string message = llvm::toString(parsed.takeError());
        for (const char* expected : {"/extra Unexpected property",
                                     "/lsp/x/bogus Unexpected property",
                                     "/lsp/x/command Expected array length >= 1",
                                     "/timing/requestTimeoutMs Expected integer >= 1"})
        {
            if (message.find(expected) == std::string::npos)
            {
                std::cerr << "schema error missing '" << expected << "' in: " << message << "\n";
                return false;
            }
        }
    }

    {
        llvm::Expected<lspmux::ConfigFile> parsed = lspmux::parseConfigFile(parseJson(R"({"lsp": true})"));
        if (parsed)
        {
            std::cerr << "lsp:true accepted\n";
            return false;
        }
        llvm::consumeError(parsed.takeError());
    }
    return true;
}

bool runMergeTests()
{
    const llvm::json::Value merged = lspmux::mergeJson(parseJson(R"({"a": {"b": 1, "c": [1, 2]}, "d": 1})"),
                                                       parseJson(R"({"a": {"c": [3], "e": true}})"));
    if (lspmux::test::toText(merged) != R"({"a":{"b":1,"c":[3],"e":true},"d":1})")
    {
        std::cerr << "deep merge mismatch: " << lspmux::test::toText(merged) << "\n";
        return false;
    }

    lspmux::ServerConfig base;
    base.extensions     = std::vector<std::string>{".a", ".b"};
    base.env            = lspmux::EnvironmentMap{{"A", "1"}, {"B", "1"}};
    base.initialization = llvm::json::Object{{"x", llvm::json::Object{{"y", 1}}}};

    lspmux::ServerConfig override;
    override.extensions     = std::vector<std::string>{".c"};
    override.env            = lspmux::EnvironmentMap{{"B", "2"}};
    override.initialization = llvm::json::Object{{"x", llvm::json::Object{{"z", 2}}}};

    const lspmux::ServerConfig server = lspmux::mergeServerConfig(base, override);
    if (!server.extensions || *server.extensions != std::vector<std::string>{".c"})
    {
        std::cerr << "array override should replace, not concatenate\n";
        return false;
    }
    if (!server.env || server.env->at("A") != "1" || server.env->at("B") != "2")
    {
        std::cerr << "env should merge per key\n";
        return false;
    }
    if (lspmux::test::toText(llvm::json::Object(*server.initialization)) != R"({"x":{"y":1,"z":2}})")
    {
        std::cerr << "initialization should deep merge\n";
        return false;
    }

    lspmux::ConfigFile global;
    global.servers["a"] = base;
    lspmux::ConfigFile project;
    project.lspDisabled = true;
    const lspmux::NormalizedConfig normalized = lspmux::normalizeConfig(lspmux::mergeConfigFiles(global, project));
    if (!normalized.lspDisabled || !normalized.servers.empty())
    {
        std::cerr << "lsp:false in either file should disable every server\n";
        return false;
    }
    if (normalized.timing.requestTimeoutMs != 10000 || normalized.timing.diagnosticsWaitTimeoutMs != 3000 ||
        normalized.timing.initializeTimeoutMs != 15000)
    {
        std::cerr << "timing defaults mismatch\n";
        return false;
    }
    return true;
}

bool runTrustTests()
{
    lspmux::test::TestWorkspace workspace("config");
    const std::string           projectConfig = R"({
        "lsp": {"pyright": {"command": ["evil"], "env": {"X": "1"}, "extensions": [".py"]}},
        "security": {"allowExternalPaths": true, "projectConfigPolicy": "always"}
    })";
    if (!lspmux::test::writeTextFile(workspace.root() + "/.lspmux/lsp.json", projectConfig))
    {
        std::cerr << "failed to write project config\n";
        return false;
    }

    lspmux::LoaderOptions options;
    options.globalConfigPath = workspace.globalConfigPath();
    options.homeDirectory    = workspace.homeDirectory();

    {
        if (!workspace.writeGlobalConfig(parseJson(R"({"lsp": {"pyright": {"command": ["pyright-langserver"]}}})")))
        {
            std::cerr << "failed to write global config\n";
            return false;
        }
        const lspmux::LoadedConfig loaded = lspmux::loadConfig(workspace.root(), options);
        if (loaded.trustedProject || !hasWarning(loaded, "project-config-untrusted"))
        {
            std::cerr << "project should be untrusted by default\n";
            return false;
        }
        if (!hasWarning(loaded, "project-override-blocked", "command") ||
            !hasWarning(loaded, "project-override-blocked", "env") ||
            !hasWarning(loaded, "project-security-override-blocked", "allowExternalPaths"))
        {
            std::cerr << "blocked overrides not reported\n";
            return false;
        }
        const auto& server = loaded.config.servers.at("pyright");
        if (!server.command || server.command->front() != "pyright-langserver" || server.env ||
            !server.extensions || server.extensions->front() != ".py")
        {
            std::cerr << "untrusted project command/env should be dropped but extensions kept\n";
            return false;
        }
        if (loaded.config.allowExternalPaths || loaded.config.projectConfigPolicy != lspmux::ProjectConfigPolicy::TrustedOnly)
        {
            std::cerr << "project security must never apply\n";
            return false;
        }
        if (loaded.serverSource.at("pyright") != lspmux::ServerSource::Merged)
        {
            std::cerr << "server configured by both files should be merged\n";
            return false;
        }
    }

    {
        llvm::json::Object global{
            {"security", llvm::json::Object{{"trustedProjectRoots", llvm::json::Array{workspace.root()}}}},
        };
        if (!workspace.writeGlobalConfig(llvm::json::Value(std::move(global))))
        {
            std::cerr << "failed to write global config\n";
            return false;
        }
        const lspmux::LoadedConfig loaded = lspmux::loadConfig(workspace.root() + "/sub", options);
        if (!loaded.trustedProject)
        {
            std::cerr << "trusted root should trust the project\n";
            return false;
        }
        const auto& server = loaded.config.servers.at("pyright");
        if (!server.command || server.command->front() != "evil" || !server.env)
        {
            std::cerr << "trusted project should keep command/env\n";
            return false;
        }
        if (loaded.config.allowExternalPaths || !hasWarning(loaded, "project-security-override-blocked"))
        {
            std::cerr << "project security should be stripped even when trusted\n";
            return false;
        }
        if (loaded.workspaceRoot != workspace.root() || loaded.projectRoot != workspace.root())
        {
            std::cerr << "workspace/project root mismatch: " << loaded.workspaceRoot << " " << loaded.projectRoot
                      << "\n";
            return false;
        }
    }

    {
        if (!workspace.writeGlobalConfig(parseJson(R"({"security": {"projectConfigPolicy": "never"}})")))
        {
            std::cerr << "failed to write global config\n";
            return false;
        }
        const lspmux::LoadedConfig loaded = lspmux::loadConfig(workspace.root(), options);
        if (loaded.trustedProject || !hasWarning(loaded, "project-override-blocked", "command"))
        {
            std::cerr << "policy never should block project command\n";
            return false;
        }
    }

    {
        const lspmux::TrustMatchResult relative =
            lspmux::matchTrustedProjectRoot("/work/repo", {"relative/path"}, "/home/u");
        if (relative.trusted || relative.warnings.size() != 1U || relative.warnings[0].type != "invalid-trust-entry")
        {
            std::cerr << "relative trust entry should be ignored with a warning\n";
            return false;
        }
        if (!lspmux::matchTrustedProjectRoot("/home/u/src/repo", {"~/src"}, "/home/u").trusted)
        {
            std::cerr << "~ trust entry should expand to the home directory\n";
            return false;
        }
        if (!lspmux::matchTrustedProjectRoot("/work/team-a", {"/work/team-*"}, "/home/u").trusted ||
            lspmux::matchTrustedProjectRoot("/other/team-a", {"/work/team-*"}, "/home/u").trusted)
        {
            std::cerr << "glob trust entry mismatch\n";
            return false;
        }
        if (lspmux::matchTrustedProjectRoot("/work/repository", {"/work/repo"}, "/home/u").trusted)
        {
            std::cerr << "prefix without separator must not match\n";
            return false;
        }
    }

    {
        if (!workspace.writeGlobalConfig(parseJson(R"({"lsp": {"x": {"command": 1}}})")))
        {
            std::cerr << "failed to write global config\n";
            return false;
        }
        const lspmux::LoadedConfig loaded = lspmux::loadConfig(workspace.root(), options);
        if (!hasWarning(loaded, "config-parse") || loaded.config.servers.count("x") != 0U)
        {
            std::cerr << "invalid global config should warn and be ignored\n";
            return false;
        }
        const std::string before = lspmux::configSignature(loaded);
        if (!workspace.writeGlobalConfig(parseJson(R"({"timing": {"requestTimeoutMs": 5}})")))
        {
            std::cerr << "failed to write global config\n";
            return false;
        }
        if (lspmux::configSignature(lspmux::loadConfig(workspace.root(), options)) == before)
        {
            std::cerr << "config signature should change with the config\n";
            return false;
        }
    }
    return true;
}

}  // namespace

bool runConfigTests()
{
    bool ok = true;
    ok      = runSchemaTests() && ok;
    ok      = runMergeTests() && ok;
    ok      = runTrustTests() && ok;
    return ok;
}
