//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `lspmux` command-line driver.
///
/// Each invocation loads the configuration for the working directory, starts
/// whichever language servers the command needs, prints the result as JSON on
/// stdout, and shuts the servers down before exiting.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Config/ConfigLoader.h"
#include "lspmux/Runtime/Operations.h"
#include "lspmux/Runtime/Orchestrator.h"
#include "lspmux/Support/Cancellation.h"
#include "lspmux/Support/Logging.h"
#include "lspmux/Support/Paths.h"
#include "lspmux/Version.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/raw_ostream.h"

#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace
{

lspmux::AbortController* activeAbort = nullptr;

extern "C" void handleInterrupt(int)
{
    if (activeAbort != nullptr)
    {
        activeAbort->abort();
    }
}

bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

void printUsage()
{
    llvm::errs() << "Usage: lspmux <operation|touch|diagnostics|status|config> [args] [options]\n"
                 << "Try: lspmux --help\n";
}

void printHelp()
{
    llvm::errs() << "NAME\n"
                 << "  lspmux - run code-intelligence queries across several language servers\n\n"
                 << "SYNOPSIS\n"
                 << "  lspmux <operation> <file> <line> <character> [options]\n"
                 << "  lspmux touch <file> [options]\n"
                 << "  lspmux diagnostics <file> [options]\n"
                 << "  lspmux status [--json] [options]\n"
                 << "  lspmux config [options]\n\n"
                 << "OPERATIONS\n"
                 << "  goToDefinition, findReferences, hover, documentSymbol, workspaceSymbol,\n"
                 << "  goToImplementation, prepareCallHierarchy, incomingCalls, outgoingCalls\n"
                 << "  Line and character are 1-based.\n\n"
                 << "OPTIONS\n"
                 << "  --cwd <dir>       Working directory for config discovery and relative paths.\n"
                 << "  --trace <level>   off, basic, or verbose. Defaults to $LSPMUX_TRACE.\n"
                 << "  --no-wait         Do not wait for diagnostics after opening a file.\n"
                 << "  --json            Print the status snapshot as JSON.\n"
                 << "  --version, -V     Print the version.\n\n"
                 << "FILES\n"
                 << "  ~/.lspmux/lsp.json        Global configuration.\n"
                 << "  <project>/.lspmux/lsp.json Project configuration.\n";
}

void printJson(const llvm::json::Value& value)
{
    llvm::outs() << llvm::formatv("{0:2}", value) << "\n";
}

llvm::json::Value errorsToJson(const std::vector<lspmux::StructuredError>& errors)
{
    llvm::json::Array out;
    for (const lspmux::StructuredError& error : errors)
    {
        out.push_back(lspmux::toJSON(error));
    }
    return out;
}

std::optional<std::int64_t> parsePositionToken(llvm::StringRef token)
{
    std::int64_t value = 0;
    if (token.getAsInteger(10, value))
    {
        return std::nullopt;
    }
    return value;
}

llvm::Expected<std::string> resolveFileArgument(lspmux::Orchestrator& orchestrator,
                                                llvm::StringRef       rawPath,
                                                const std::string&    cwd)
{
    lspmux::PathBoundaryOptions boundary;
    boundary.cwd                 = cwd;
    boundary.boundaryRoots       = orchestrator.getBoundaryRoots();
    boundary.allowExternalPaths  = orchestrator.getAllowExternalPaths();
    boundary.requireReadableFile = true;
    llvm::Expected<lspmux::NormalizedPath> normalized = lspmux::normalizeCallerPath(rawPath, boundary);
    if (!normalized)
    {
        return normalized.takeError();
    }
    return normalized->realPath;
}

}  // namespace

/// @brief Program entry point for `lspmux`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, 1 on usage errors or failed commands.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (isHelpToken(command) || command == "help")
    {
        printHelp();
        return 0;
    }
    if (command == "--version" || command == "-V")
    {
        llvm::outs() << "lspmux " << lspmux::kVersionString << "\n";
        return 0;
    }

    std::vector<std::string>   positional;
    std::string                cwd;
    std::optional<std::string> traceText;
    bool                       waitForDiagnostics = true;
    bool                       jsonOutput         = false;

    for (int i = 2; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::optional<std::string> {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--cwd" || arg == "--trace")
        {
            const std::optional<std::string> value = requireValue(arg);
            if (!value)
            {
                printUsage();
                return 1;
            }
            if (arg == "--cwd")
            {
                cwd = *value;
            }
            else
            {
                traceText = *value;
            }
        }
        else if (arg == "--no-wait")
        {
            waitForDiagnostics = false;
        }
        else if (arg == "--json")
        {
            jsonOutput = true;
        }
        else if (isHelpToken(arg))
        {
            printHelp();
            return 0;
        }
        else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0)
        {
            llvm::errs() << "Unknown option: " << arg << "\n";
            printUsage();
            return 1;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (!traceText)
    {
        if (const auto fromEnv = llvm::sys::Process::GetEnv("LSPMUX_TRACE"))
        {
            traceText = *fromEnv;
        }
    }
    lspmux::TraceLevel traceLevel = lspmux::TraceLevel::Off;
    if (traceText)
    {
        const std::optional<lspmux::TraceLevel> parsed = lspmux::parseTraceLevel(*traceText);
        if (!parsed)
        {
            llvm::errs() << "Invalid trace level: " << *traceText << "\n";
            return 1;
        }
        traceLevel = *parsed;
    }

    if (cwd.empty())
    {
        llvm::SmallString<256> current;
        if (const std::error_code ec = llvm::sys::fs::current_path(current))
        {
            llvm::errs() << "[lspmux] cannot determine working directory: " << ec.message() << "\n";
            return 1;
        }
        cwd = current.str().str();
    }
    cwd = lspmux::realPathOrAbsolute(cwd);

    const lspmux::Logger logger(
        [](lspmux::TraceLevel, llvm::StringRef message) { llvm::errs() << "[lspmux] " << message << "\n"; },
        traceLevel);
    lspmux::Orchestrator orchestrator(cwd, logger);
    if (traceLevel == lspmux::TraceLevel::Verbose)
    {
        orchestrator.telemetry().setSink([](const lspmux::RequestMetric& metric) {
            llvm::errs() << "[lspmux][telemetry] server=" << metric.serverId << " method=" << metric.method
                         << " latency_us=" << metric.latencyMicros << " ok=" << (metric.ok ? "true" : "false");
            if (!metric.ok)
            {
                llvm::errs() << " code=" << metric.code;
            }
            llvm::errs() << "\n";
        });
    }

    lspmux::AbortController abort;
    activeAbort = &abort;
    std::signal(SIGINT, handleInterrupt);

    int exitCode = 0;
    if (command == "status")
    {
        const lspmux::Snapshot snapshot = orchestrator.getSnapshot();
        if (jsonOutput)
        {
            printJson(lspmux::toJSON(snapshot));
        }
        else
        {
            llvm::outs() << lspmux::summarizeSnapshot(snapshot);
        }
    }
    else if (command == "config")
    {
        const lspmux::LoadedConfig loaded = lspmux::loadConfig(cwd);
        llvm::json::Array          warnings;
        for (const lspmux::LoadWarning& warning : loaded.warnings)
        {
            warnings.push_back(llvm::json::Object{{"type", warning.type}, {"message", warning.message}});
        }
        llvm::json::Object sources;
        for (const auto& [id, source] : loaded.serverSource)
        {
            sources[id] = lspmux::serverSourceName(source);
        }
        printJson(llvm::json::Object{
            {"workspaceRoot", loaded.workspaceRoot},
            {"projectRoot", loaded.projectRoot},
            {"globalPath", loaded.globalPath},
            {"projectPath", loaded.projectPath ? llvm::json::Value(*loaded.projectPath) : llvm::json::Value(nullptr)},
            {"trustedProject", loaded.trustedProject},
            {"config", lspmux::toJSON(loaded.config)},
            {"serverSource", std::move(sources)},
            {"warnings", std::move(warnings)},
        });
    }
    else if (command == "touch" || command == "diagnostics")
    {
        if (positional.size() != 1)
        {
            printUsage();
            exitCode = 1;
        }
        else if (llvm::Expected<std::string> path = resolveFileArgument(orchestrator, positional.front(), cwd); !path)
        {
            llvm::errs() << "[lspmux] " << llvm::toString(path.takeError()) << "\n";
            exitCode = 1;
        }
        else
        {
            const bool                 wait  = command == "diagnostics" || waitForDiagnostics;
            const lspmux::TouchSummary touch = orchestrator.touchFile(*path, wait, abort.signal());
            llvm::json::Object         out{
                {"touched", touch.touched},
                {"timedOut", touch.timedOut},
                {"aborted", touch.aborted},
                {"errors", errorsToJson(touch.errors)},
            };
            if (command == "diagnostics")
            {
                const auto all = orchestrator.diagnostics();
                const auto it  = all.find(*path);
                out["diagnostics"] = it == all.end() ? llvm::json::Array() : llvm::json::Array(it->second);
            }
            printJson(std::move(out));
            exitCode = touch.touched ? 0 : 1;
        }
    }
    else if (lspmux::isKnownOperation(command))
    {
        std::optional<std::int64_t> line;
        std::optional<std::int64_t> character;
        if (positional.size() == 3)
        {
            line      = parsePositionToken(positional[1]);
            character = parsePositionToken(positional[2]);
        }
        if (!line || !character)
        {
            llvm::errs() << command << " requires <file> <line> <character>\n";
            printUsage();
            exitCode = 1;
        }
        else
        {
            lspmux::OperationInput input;
            input.operation = command;
            input.filePath  = positional[0];
            input.line      = *line;
            input.character = *character;
            llvm::Expected<lspmux::OperationResult> result =
                lspmux::executeOperation(orchestrator, input, cwd, abort.signal());
            if (!result)
            {
                llvm::errs() << "[lspmux] " << llvm::toString(result.takeError()) << "\n";
                exitCode = 1;
            }
            else
            {
                printJson(lspmux::toJSON(*result));
                exitCode = result->errors.empty() || !result->results.empty() ? 0 : 1;
            }
        }
    }
    else
    {
        llvm::errs() << "Unknown command: " << command << "\n";
        printUsage();
        exitCode = 1;
    }

    orchestrator.shutdownAll();
    activeAbort = nullptr;
    return exitCode;
}
