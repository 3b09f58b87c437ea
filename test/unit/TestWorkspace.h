//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Temporary workspace helpers shared by the unit tests.
///
/// A workspace is a unique temp directory carrying a `.git` marker, a global
/// config file outside of it, and a spawn log written by the fake server.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_TEST_UNIT_TEST_WORKSPACE_H
#define LSPMUX_TEST_UNIT_TEST_WORKSPACE_H

#include "lspmux/Runtime/Orchestrator.h"
#include "lspmux/Support/Paths.h"

#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#ifndef LSPMUX_FAKE_SERVER_PATH
#error "LSPMUX_FAKE_SERVER_PATH must name the fake language server binary"
#endif

namespace lspmux::test
{

inline std::filesystem::path makeUniqueTempDir(const std::string& prefix)
{
    static std::atomic<unsigned> counter{0};
    const auto                    now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           ("lspmux-" + prefix + "-" + std::to_string(now) + "-" + std::to_string(++counter));
}

inline bool writeTextFile(const std::filesystem::path& path, const std::string& text)
{
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.good())
    {
        return false;
    }
    out << text;
    return out.good();
}

inline std::string toText(const llvm::json::Value& value)
{
    std::string              text;
    llvm::raw_string_ostream stream(text);
    stream << value;
    stream.flush();
    return text;
}

inline std::string fakeServerPath()
{
    return LSPMUX_FAKE_SERVER_PATH;
}

/// @brief Builds a fake server config entry.
inline llvm::json::Object fakeServerEntry(const std::string&              name,
                                          const std::vector<std::string>& extraArguments,
                                          const std::string&              spawnLog)
{
    llvm::json::Array command{fakeServerPath(), "--name", name};
    for (const std::string& argument : extraArguments)
    {
        command.push_back(argument);
    }
    return llvm::json::Object{
        {"command", std::move(command)},
        {"extensions", llvm::json::Array{".fake"}},
        {"env", llvm::json::Object{{"FAKE_LSP_SPAWN_LOG", spawnLog}}},
        {"initialization", llvm::json::Object{{name, llvm::json::Object{{"enabled", true}}}}},
    };
}

class TestWorkspace final
{
public:
    explicit TestWorkspace(const std::string& prefix)
        : base_(makeUniqueTempDir(prefix))
    {
        std::error_code ec;
        std::filesystem::create_directories(base_ / "ws" / ".git", ec);
        std::filesystem::create_directories(base_ / "home", ec);
        root_     = realPathOrAbsolute((base_ / "ws").string());
        spawnLog_ = (base_ / "spawn.log").string();
    }

    ~TestWorkspace()
    {
        std::error_code ec;
        std::filesystem::remove_all(base_, ec);
    }

    TestWorkspace(const TestWorkspace&)            = delete;
    TestWorkspace& operator=(const TestWorkspace&) = delete;

    [[nodiscard]] const std::string& root() const
    {
        return root_;
    }

    [[nodiscard]] const std::string& spawnLog() const
    {
        return spawnLog_;
    }

    [[nodiscard]] std::string globalConfigPath() const
    {
        return (base_ / "global-lsp.json").string();
    }

    [[nodiscard]] std::string homeDirectory() const
    {
        return (base_ / "home").string();
    }

    /// @brief Writes a file below the workspace root and returns its path.
    std::string addFile(const std::string& relative, const std::string& text) const
    {
        const std::filesystem::path path = std::filesystem::path(root_) / relative;
        if (!writeTextFile(path, text))
        {
            return {};
        }
        return realPathOrAbsolute(path.string());
    }

    bool writeGlobalConfig(const llvm::json::Value& config) const
    {
        return writeTextFile(globalConfigPath(), toText(config));
    }

    /// @brief Writes a global config with one fake server per entry.
    bool writeFakeServers(const std::vector<std::pair<std::string, std::vector<std::string>>>& servers) const
    {
        llvm::json::Object lsp;
        for (const auto& [name, arguments] : servers)
        {
            lsp[name] = fakeServerEntry(name, arguments, spawnLog_);
        }
        return writeGlobalConfig(llvm::json::Object{
            {"lsp", std::move(lsp)},
            {"timing",
             llvm::json::Object{
                 {"requestTimeoutMs", 2000},
                 {"diagnosticsWaitTimeoutMs", 2000},
                 {"initializeTimeoutMs", 5000},
             }},
        });
    }

    [[nodiscard]] OrchestratorOptions orchestratorOptions() const
    {
        OrchestratorOptions options;
        options.loader.globalConfigPath = globalConfigPath();
        options.loader.homeDirectory    = homeDirectory();
        options.catalog                 = ServerCatalog{};
        options.environment             = EnvironmentMap{{"PATH", "/usr/bin:/bin"}, {"LSPMUX_DISABLE_AUTO_INSTALL", "1"}};
        options.diagnosticsDebounceMs   = 50;
        return options;
    }

    /// @brief Returns the spawn log lines starting with `name`.
    [[nodiscard]] std::size_t spawnCount(const std::string& name) const
    {
        std::ifstream in(spawnLog_);
        std::string   line;
        std::size_t   count = 0;
        while (std::getline(in, line))
        {
            if (line.rfind(name + " ", 0) == 0)
            {
                ++count;
            }
        }
        return count;
    }

    /// @brief Returns the process ids logged for `name`, oldest first.
    [[nodiscard]] std::vector<long> spawnedPids(const std::string& name) const
    {
        std::ifstream     in(spawnLog_);
        std::string       line;
        std::vector<long> pids;
        while (std::getline(in, line))
        {
            if (line.rfind(name + " ", 0) == 0)
            {
                pids.push_back(std::strtol(line.c_str() + name.size() + 1U, nullptr, 10));
            }
        }
        return pids;
    }

private:
    std::filesystem::path base_;
    std::string           root_;
    std::string           spawnLog_;
};

}  // namespace lspmux::test

#endif  // LSPMUX_TEST_UNIT_TEST_WORKSPACE_H
