//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements strict config validation, merging, and normalization.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Config/ConfigSchema.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/Twine.h"

#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace lspmux
{
namespace
{

using SchemaErrors = std::vector<std::string>;

std::string childPath(llvm::StringRef parent, llvm::StringRef key)
{
    return (parent + "/" + key).str();
}

llvm::StringRef kindName(const llvm::json::Value& value)
{
    switch (value.kind())
    {
    case llvm::json::Value::Null:
        return "null";
    case llvm::json::Value::Boolean:
        return "boolean";
    case llvm::json::Value::Number:
        return "number";
    case llvm::json::Value::String:
        return "string";
    case llvm::json::Value::Array:
        return "array";
    case llvm::json::Value::Object:
        return "object";
    }
    return "value";
}

void addError(SchemaErrors& errors, llvm::StringRef path, const llvm::Twine& message)
{
    errors.push_back((path.empty() ? llvm::Twine("/") : llvm::Twine(path)).str() + " " + message.str());
}

void rejectUnknownKeys(const llvm::json::Object&           object,
                       llvm::ArrayRef<llvm::StringLiteral> allowed,
                       llvm::StringRef                     path,
                       SchemaErrors&                       errors)
{
    std::vector<std::string> unknown;
    for (const auto& [key, _] : object)
    {
        bool known = false;
        for (const llvm::StringLiteral candidate : allowed)
        {
            if (llvm::StringRef(key) == candidate)
            {
                known = true;
                break;
            }
        }
        if (!known)
        {
            unknown.push_back(key.str());
        }
    }
    llvm::sort(unknown);
    for (const std::string& key : unknown)
    {
        addError(errors, childPath(path, key), "Unexpected property");
    }
}

std::optional<bool> readBoolean(const llvm::json::Value& value, llvm::StringRef path, SchemaErrors& errors)
{
    if (const auto parsed = value.getAsBoolean())
    {
        return *parsed;
    }
    addError(errors, path, "Expected boolean, got " + kindName(value));
    return std::nullopt;
}

std::optional<std::vector<std::string>> readStringArray(const llvm::json::Value& value,
                                                        llvm::StringRef          path,
                                                        SchemaErrors&            errors,
                                                        const std::size_t        minItems = 0)
{
    const auto* array = value.getAsArray();
    if (!array)
    {
        addError(errors, path, "Expected array, got " + kindName(value));
        return std::nullopt;
    }

    bool                     valid = true;
    std::vector<std::string> out;
    out.reserve(array->size());
    for (std::size_t index = 0; index < array->size(); ++index)
    {
        const auto text = (*array)[index].getAsString();
        if (!text)
        {
            addError(errors, childPath(path, std::to_string(index)), "Expected string");
            valid = false;
            continue;
        }
        out.emplace_back(text->str());
    }
    if (out.size() < minItems && valid)
    {
        addError(errors, path, "Expected array length >= " + llvm::Twine(minItems));
        valid = false;
    }
    if (!valid)
    {
        return std::nullopt;
    }
    return out;
}

std::optional<std::int64_t> readPositiveInteger(const llvm::json::Value& value,
                                                llvm::StringRef          path,
                                                SchemaErrors&            errors)
{
    const auto parsed = value.getAsInteger();
    if (!parsed)
    {
        addError(errors, path, "Expected integer, got " + kindName(value));
        return std::nullopt;
    }
    if (*parsed < 1)
    {
        addError(errors, path, "Expected integer >= 1");
        return std::nullopt;
    }
    return *parsed;
}

std::optional<ServerConfig> readServerConfig(const llvm::json::Value& value,
                                             llvm::StringRef          path,
                                             SchemaErrors&            errors)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        addError(errors, path, "Expected object, got " + kindName(value));
        return std::nullopt;
    }

    static constexpr llvm::StringLiteral Allowed[] =
        {"disabled", "command", "extensions", "env", "initialization", "roots", "excludeRoots", "rootMode"};
    const std::size_t before = errors.size();
    rejectUnknownKeys(*object, Allowed, path, errors);

    ServerConfig server;
    if (const auto* field = object->get("disabled"))
    {
        server.disabled = readBoolean(*field, childPath(path, "disabled"), errors);
    }
    if (const auto* field = object->get("command"))
    {
        server.command = readStringArray(*field, childPath(path, "command"), errors, 1);
    }
    if (const auto* field = object->get("extensions"))
    {
        server.extensions = readStringArray(*field, childPath(path, "extensions"), errors);
    }
    if (const auto* field = object->get("env"))
    {
        const std::string envPath = childPath(path, "env");
        if (const auto* envObject = field->getAsObject())
        {
            EnvironmentMap env;
            for (const auto& [name, envValue] : *envObject)
            {
                if (const auto text = envValue.getAsString())
                {
                    env.emplace(name.str(), text->str());
                }
                else
                {
                    addError(errors, childPath(envPath, name), "Expected string, got " + kindName(envValue));
                }
            }
            server.env = std::move(env);
        }
        else
        {
            addError(errors, envPath, "Expected object, got " + kindName(*field));
        }
    }
    if (const auto* field = object->get("initialization"))
    {
        if (const auto* initObject = field->getAsObject())
        {
            server.initialization = *initObject;
        }
        else
        {
            addError(errors, childPath(path, "initialization"), "Expected object, got " + kindName(*field));
        }
    }
    if (const auto* field = object->get("roots"))
    {
        server.roots = readStringArray(*field, childPath(path, "roots"), errors);
    }
    if (const auto* field = object->get("excludeRoots"))
    {
        server.excludeRoots = readStringArray(*field, childPath(path, "excludeRoots"), errors);
    }
    if (const auto* field = object->get("rootMode"))
    {
        const auto text = field->getAsString();
        if (text)
        {
            server.rootMode = parseRootMode(*text);
        }
        if (!server.rootMode)
        {
            addError(errors,
                     childPath(path, "rootMode"),
                     "Expected one of 'workspace-or-marker', 'marker-only'");
        }
    }

    if (errors.size() != before)
    {
        return std::nullopt;
    }
    return server;
}

void readSecurity(const llvm::json::Value& value, ConfigFile& file, SchemaErrors& errors)
{
    static constexpr llvm::StringRef Path   = "/security";
    const auto*                      object = value.getAsObject();
    if (!object)
    {
        addError(errors, Path, "Expected object, got " + kindName(value));
        return;
    }

    static constexpr llvm::StringLiteral Allowed[] = {"projectConfigPolicy", "trustedProjectRoots", "allowExternalPaths"};
    rejectUnknownKeys(*object, Allowed, Path, errors);

    if (const auto* field = object->get("projectConfigPolicy"))
    {
        const auto text = field->getAsString();
        if (text)
        {
            file.security.projectConfigPolicy = parseProjectConfigPolicy(*text);
        }
        if (!file.security.projectConfigPolicy)
        {
            addError(errors,
                     childPath(Path, "projectConfigPolicy"),
                     "Expected one of 'trusted-only', 'always', 'never'");
        }
    }
    if (const auto* field = object->get("trustedProjectRoots"))
    {
        file.security.trustedProjectRoots = readStringArray(*field, childPath(Path, "trustedProjectRoots"), errors);
    }
    if (const auto* field = object->get("allowExternalPaths"))
    {
        file.security.allowExternalPaths = readBoolean(*field, childPath(Path, "allowExternalPaths"), errors);
    }
}

void readTiming(const llvm::json::Value& value, ConfigFile& file, SchemaErrors& errors)
{
    static constexpr llvm::StringRef Path   = "/timing";
    const auto*                      object = value.getAsObject();
    if (!object)
    {
        addError(errors, Path, "Expected object, got " + kindName(value));
        return;
    }

    static constexpr llvm::StringLiteral Allowed[] = {"requestTimeoutMs",
                                                      "diagnosticsWaitTimeoutMs",
                                                      "initializeTimeoutMs"};
    rejectUnknownKeys(*object, Allowed, Path, errors);

    if (const auto* field = object->get("requestTimeoutMs"))
    {
        file.timing.requestTimeoutMs = readPositiveInteger(*field, childPath(Path, "requestTimeoutMs"), errors);
    }
    if (const auto* field = object->get("diagnosticsWaitTimeoutMs"))
    {
        file.timing.diagnosticsWaitTimeoutMs =
            readPositiveInteger(*field, childPath(Path, "diagnosticsWaitTimeoutMs"), errors);
    }
    if (const auto* field = object->get("initializeTimeoutMs"))
    {
        file.timing.initializeTimeoutMs = readPositiveInteger(*field, childPath(Path, "initializeTimeoutMs"), errors);
    }
}

llvm::json::Array toJSONArray(const std::vector<std::string>& values)
{
    llvm::json::Array array;
    for (const std::string& value : values)
    {
        array.push_back(value);
    }
    return array;
}

template <typename T>
void replaceIfSet(std::optional<T>& target, const std::optional<T>& override)
{
    if (override)
    {
        target = override;
    }
}

}  // namespace

llvm::StringRef projectConfigPolicyName(const ProjectConfigPolicy policy)
{
    switch (policy)
    {
    case ProjectConfigPolicy::TrustedOnly:
        return "trusted-only";
    case ProjectConfigPolicy::Always:
        return "always";
    case ProjectConfigPolicy::Never:
        return "never";
    }
    return "trusted-only";
}

std::optional<ProjectConfigPolicy> parseProjectConfigPolicy(llvm::StringRef text)
{
    if (text == "trusted-only")
    {
        return ProjectConfigPolicy::TrustedOnly;
    }
    if (text == "always")
    {
        return ProjectConfigPolicy::Always;
    }
    if (text == "never")
    {
        return ProjectConfigPolicy::Never;
    }
    return std::nullopt;
}

llvm::StringRef rootModeName(const RootMode mode)
{
    return mode == RootMode::MarkerOnly ? "marker-only" : "workspace-or-marker";
}

std::optional<RootMode> parseRootMode(llvm::StringRef text)
{
    if (text == "workspace-or-marker")
    {
        return RootMode::WorkspaceOrMarker;
    }
    if (text == "marker-only")
    {
        return RootMode::MarkerOnly;
    }
    return std::nullopt;
}

llvm::Expected<ConfigFile> parseConfigFile(const llvm::json::Value& document)
{
    SchemaErrors errors;
    ConfigFile   file;

    const auto* root = document.getAsObject();
    if (!root)
    {
        addError(errors, "", "Expected object, got " + kindName(document));
    }
    else
    {
        static constexpr llvm::StringLiteral Allowed[] = {"lsp", "security", "timing"};
        rejectUnknownKeys(*root, Allowed, "", errors);

        if (const auto* lsp = root->get("lsp"))
        {
            if (const auto flag = lsp->getAsBoolean(); flag && !*flag)
            {
                file.lspDisabled = true;
            }
            else if (const auto* servers = lsp->getAsObject())
            {
                for (const auto& [serverId, serverValue] : *servers)
                {
                    if (auto server = readServerConfig(serverValue, childPath("/lsp", serverId), errors))
                    {
                        file.servers.emplace(serverId.str(), std::move(*server));
                    }
                }
            }
            else
            {
                addError(errors, "/lsp", "Expected false or object, got " + kindName(*lsp));
            }
        }
        if (const auto* security = root->get("security"))
        {
            readSecurity(*security, file, errors);
        }
        if (const auto* timing = root->get("timing"))
        {
            readTiming(*timing, file, errors);
        }
    }

    if (!errors.empty())
    {
        llvm::sort(errors);
        return llvm::createStringError(std::make_error_code(std::errc::invalid_argument),
                                       llvm::join(errors, "; "));
    }
    return file;
}

llvm::json::Value mergeJson(const llvm::json::Value& base, const llvm::json::Value& override)
{
    const auto* baseObject     = base.getAsObject();
    const auto* overrideObject = override.getAsObject();
    if (!baseObject || !overrideObject)
    {
        return override;
    }

    llvm::json::Object merged = *baseObject;
    for (const auto& [key, value] : *overrideObject)
    {
        if (const auto* existing = merged.get(key))
        {
            merged[key] = mergeJson(*existing, value);
        }
        else
        {
            merged[key] = value;
        }
    }
    return merged;
}

ServerConfig mergeServerConfig(const ServerConfig& base, const ServerConfig& override)
{
    ServerConfig merged = base;
    replaceIfSet(merged.disabled, override.disabled);
    replaceIfSet(merged.command, override.command);
    replaceIfSet(merged.extensions, override.extensions);
    replaceIfSet(merged.roots, override.roots);
    replaceIfSet(merged.excludeRoots, override.excludeRoots);
    replaceIfSet(merged.rootMode, override.rootMode);

    if (override.env)
    {
        EnvironmentMap env = merged.env.value_or(EnvironmentMap{});
        for (const auto& [name, value] : *override.env)
        {
            env[name] = value;
        }
        merged.env = std::move(env);
    }
    if (override.initialization)
    {
        if (merged.initialization)
        {
            llvm::json::Value combined = mergeJson(llvm::json::Value(llvm::json::Object(*merged.initialization)),
                                                   llvm::json::Value(llvm::json::Object(*override.initialization)));
            merged.initialization = std::move(*combined.getAsObject());
        }
        else
        {
            merged.initialization = override.initialization;
        }
    }
    return merged;
}

ConfigFile mergeConfigFiles(const ConfigFile& base, const ConfigFile& override)
{
    ConfigFile merged  = base;
    merged.lspDisabled = base.lspDisabled || override.lspDisabled;
    for (const auto& [serverId, server] : override.servers)
    {
        const auto it = merged.servers.find(serverId);
        if (it == merged.servers.end())
        {
            merged.servers.emplace(serverId, server);
        }
        else
        {
            it->second = mergeServerConfig(it->second, server);
        }
    }

    replaceIfSet(merged.security.projectConfigPolicy, override.security.projectConfigPolicy);
    replaceIfSet(merged.security.trustedProjectRoots, override.security.trustedProjectRoots);
    replaceIfSet(merged.security.allowExternalPaths, override.security.allowExternalPaths);

    replaceIfSet(merged.timing.requestTimeoutMs, override.timing.requestTimeoutMs);
    replaceIfSet(merged.timing.diagnosticsWaitTimeoutMs, override.timing.diagnosticsWaitTimeoutMs);
    replaceIfSet(merged.timing.initializeTimeoutMs, override.timing.initializeTimeoutMs);
    return merged;
}

NormalizedConfig normalizeConfig(const ConfigFile& merged)
{
    NormalizedConfig config;
    config.lspDisabled = merged.lspDisabled;
    if (!merged.lspDisabled)
    {
        config.servers = merged.servers;
    }

    config.projectConfigPolicy = merged.security.projectConfigPolicy.value_or(ProjectConfigPolicy::TrustedOnly);
    config.trustedProjectRoots = merged.security.trustedProjectRoots.value_or(std::vector<std::string>{});
    config.allowExternalPaths  = merged.security.allowExternalPaths.value_or(false);

    const TimingConfig defaults;
    config.timing.requestTimeoutMs = merged.timing.requestTimeoutMs.value_or(defaults.requestTimeoutMs);
    config.timing.diagnosticsWaitTimeoutMs =
        merged.timing.diagnosticsWaitTimeoutMs.value_or(defaults.diagnosticsWaitTimeoutMs);
    config.timing.initializeTimeoutMs = merged.timing.initializeTimeoutMs.value_or(defaults.initializeTimeoutMs);
    return config;
}

llvm::json::Value toJSON(const ServerConfig& server)
{
    llvm::json::Object object;
    if (server.disabled)
    {
        object["disabled"] = *server.disabled;
    }
    if (server.command)
    {
        object["command"] = toJSONArray(*server.command);
    }
    if (server.extensions)
    {
        object["extensions"] = toJSONArray(*server.extensions);
    }
    if (server.env)
    {
        llvm::json::Object env;
        for (const auto& [name, value] : *server.env)
        {
            env[name] = value;
        }
        object["env"] = std::move(env);
    }
    if (server.initialization)
    {
        object["initialization"] = llvm::json::Object(*server.initialization);
    }
    if (server.roots)
    {
        object["roots"] = toJSONArray(*server.roots);
    }
    if (server.excludeRoots)
    {
        object["excludeRoots"] = toJSONArray(*server.excludeRoots);
    }
    if (server.rootMode)
    {
        object["rootMode"] = rootModeName(*server.rootMode);
    }
    return object;
}

llvm::json::Value toJSON(const NormalizedConfig& config)
{
    llvm::json::Object root;
    if (config.lspDisabled)
    {
        root["lsp"] = false;
    }
    else
    {
        llvm::json::Object servers;
        for (const auto& [serverId, server] : config.servers)
        {
            servers[serverId] = toJSON(server);
        }
        root["lsp"] = std::move(servers);
    }

    root["security"] = llvm::json::Object{
        {"projectConfigPolicy", projectConfigPolicyName(config.projectConfigPolicy)},
        {"trustedProjectRoots", toJSONArray(config.trustedProjectRoots)},
        {"allowExternalPaths", config.allowExternalPaths},
    };
    root["timing"] = llvm::json::Object{
        {"requestTimeoutMs", config.timing.requestTimeoutMs},
        {"diagnosticsWaitTimeoutMs", config.timing.diagnosticsWaitTimeoutMs},
        {"initializeTimeoutMs", config.timing.initializeTimeoutMs},
    };
    return root;
}

}  // namespace lspmux
