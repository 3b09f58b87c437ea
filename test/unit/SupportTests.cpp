//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error taxonomy, path boundary, logging, and telemetry tests.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Support/Cancellation.h"
#include "lspmux/Support/Error.h"
#include "lspmux/Support/Logging.h"
#include "lspmux/Support/Paths.h"
#include "lspmux/Support/Telemetry.h"

#include "TestWorkspace.h"

#include "llvm/Support/Error.h"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace
{

bool runErrorTests()
{
    {
        const lspmux::StructuredError error =
            lspmux::toStructuredError("pyright", lspmux::makeError(lspmux::ErrorCode::TimedOut, "Request timed out: x"));
        if (error.serverId != "pyright" || error.code != "ETIMEDOUT" || !error.timedOut() ||
            error.message != "Request timed out: x")
        {
            std::cerr << "timeout error not structured\n";
            return false;
        }
    }

    {
        llvm::Error remote =
            llvm::make_error<lspmux::LspError>(lspmux::ErrorCode::Remote, "Method not found", -32601);
        const std::string text = llvm::toString(std::move(remote));
        if (text != "LSP_-32601: Method not found")
        {
            std::cerr << "remote error text mismatch: " << text << "\n";
            return false;
        }
    }

    {
        std::string bare;
        std::string described;
        llvm::Error unhandled = llvm::handleErrors(
            llvm::make_error<lspmux::LspError>(lspmux::ErrorCode::Remote, "Method not found", -32601),
            [&](const lspmux::LspError& payload) {
                bare      = payload.text();
                described = payload.message();
            });
        if (unhandled || bare != "Method not found" || described != "LSP_-32601: Method not found")
        {
            llvm::consumeError(std::move(unhandled));
            std::cerr << "payload text should omit the code prefix: " << bare << " / " << described << "\n";
            return false;
        }
    }

    {
        const lspmux::StructuredError error = lspmux::toStructuredError(
            "clangd",
            lspmux::makeSpawnError("Failed to spawn clangd", lspmux::SpawnContext{"/work", {"clangd", "--log=error"}}));
        const llvm::json::Value encoded = lspmux::toJSON(error);
        if (error.code != "ESPAWN" || error.root != "/work" || error.command.size() != 2U ||
            lspmux::test::toText(encoded) !=
                R"({"code":"ESPAWN","command":["clangd","--log=error"],"message":"Failed to spawn clangd","root":"/work","serverId":"clangd"})")
        {
            std::cerr << "spawn error context mismatch: " << lspmux::test::toText(encoded) << "\n";
            return false;
        }
    }

    {
        const lspmux::StructuredError error = lspmux::toStructuredError(
            "x",
            llvm::createStringError(std::make_error_code(std::errc::io_error), "disk on fire"));
        if (error.code != "EINTERNAL" || error.message != "disk on fire" || error.timedOut())
        {
            std::cerr << "foreign error should coerce to EINTERNAL\n";
            return false;
        }
    }

    {
        llvm::Error joined = llvm::joinErrors(lspmux::makeError(lspmux::ErrorCode::Pipe, "first"),
                                              lspmux::makeError(lspmux::ErrorCode::Spawn, "second"));
        const lspmux::StructuredError error = lspmux::toStructuredError("x", std::move(joined));
        if (error.code != "EPIPE" || error.message != "first; second")
        {
            std::cerr << "joined errors should keep the first code\n";
            return false;
        }
    }
    return true;
}

bool runPathTests()
{
    {
        const std::string uri = lspmux::pathToFileUri("/tmp/a b/c%d#.ts");
        if (uri != "file:///tmp/a%20b/c%25d%23.ts")
        {
            std::cerr << "file URI encoding mismatch: " << uri << "\n";
            return false;
        }
        const auto path = lspmux::fileUriToPath(uri);
        if (!path || *path != "/tmp/a b/c%d#.ts")
        {
            std::cerr << "file URI decoding mismatch\n";
            return false;
        }
        if (lspmux::fileUriToPath("https://example.com/x") || lspmux::fileUriToPath("file:///bad%zz"))
        {
            std::cerr << "non-file or malformed URI should not decode\n";
            return false;
        }
    }

    {
        if (!lspmux::isWithinRoot("/a/b", "/a") || lspmux::isWithinRoot("/ab", "/a") ||
            !lspmux::isWithinRoot("/a", "/a") || !lspmux::isWithinRoot("/x", "/"))
        {
            std::cerr << "isWithinRoot mismatch\n";
            return false;
        }
        if (lspmux::stripTrailingSeparators("/a/b//") != "/a/b" || lspmux::stripTrailingSeparators("/") != "/")
        {
            std::cerr << "stripTrailingSeparators mismatch\n";
            return false;
        }
    }

    lspmux::test::TestWorkspace workspace("paths");
    const std::string           file = workspace.addFile("src/main.ts", "let x = 1;\n");
    if (file.empty())
    {
        std::cerr << "failed to create path fixture\n";
        return false;
    }

    lspmux::PathBoundaryOptions options;
    options.cwd           = workspace.root();
    options.boundaryRoots = {workspace.root()};

    {
        llvm::Expected<lspmux::NormalizedPath> normalized = lspmux::normalizeCallerPath("@ src/./main.ts ", options);
        if (!normalized)
        {
            std::cerr << "relative path rejected: " << llvm::toString(normalized.takeError()) << "\n";
            return false;
        }
        if (normalized->normalizedInput != "src/./main.ts" || normalized->realPath != file)
        {
            std::cerr << "relative path normalization mismatch: " << normalized->realPath << "\n";
            return false;
        }
    }

    {
        llvm::Expected<lspmux::NormalizedPath> outside = lspmux::normalizeCallerPath("../../../etc/passwd", options);
        if (outside)
        {
            std::cerr << "path outside the boundary accepted\n";
            return false;
        }
        const std::string message = llvm::toString(outside.takeError());
        if (message.find("outside workspace boundary") == std::string::npos)
        {
            std::cerr << "unexpected boundary error: " << message << "\n";
            return false;
        }

        options.allowExternalPaths = true;
        llvm::Expected<lspmux::NormalizedPath> allowed = lspmux::normalizeCallerPath("/etc/hostname-missing", options);
        if (!allowed)
        {
            std::cerr << "allowExternalPaths should bypass the boundary\n";
            llvm::consumeError(allowed.takeError());
            return false;
        }
        options.allowExternalPaths = false;
    }

    {
        options.requireReadableFile = true;
        llvm::Expected<lspmux::NormalizedPath> missing = lspmux::normalizeCallerPath("src/missing.ts", options);
        if (missing)
        {
            std::cerr << "missing file accepted with requireReadableFile\n";
            return false;
        }
        const std::string message = llvm::toString(missing.takeError());
        if (message.find("File not found") == std::string::npos)
        {
            std::cerr << "unexpected missing-file error: " << message << "\n";
            return false;
        }
    }
    return true;
}

bool runLoggingTests()
{
    if (lspmux::parseTraceLevel(" Verbose ") != lspmux::TraceLevel::Verbose ||
        lspmux::parseTraceLevel("basic") != lspmux::TraceLevel::Basic || lspmux::parseTraceLevel("loud"))
    {
        std::cerr << "trace level parsing mismatch\n";
        return false;
    }

    std::vector<std::pair<lspmux::TraceLevel, std::string>> lines;
    const auto sink = [&lines](const lspmux::TraceLevel level, llvm::StringRef message) {
        lines.emplace_back(level, message.str());
    };

    const lspmux::Logger basic(sink, lspmux::TraceLevel::Basic);
    basic.basic("spawned");
    basic.verbose("request");
    if (lines.size() != 1U || lines[0].second != "spawned" || basic.verboseEnabled())
    {
        std::cerr << "basic logger should drop verbose traces\n";
        return false;
    }

    lines.clear();
    const lspmux::Logger verbose(sink, lspmux::TraceLevel::Verbose);
    verbose.basic("a");
    verbose.verbose("b");
    if (lines.size() != 2U || lines[1].first != lspmux::TraceLevel::Verbose || !verbose.verboseEnabled())
    {
        std::cerr << "verbose logger should forward both levels\n";
        return false;
    }

    lines.clear();
    const lspmux::Logger off(sink, lspmux::TraceLevel::Off);
    off.basic("x");
    if (!lines.empty())
    {
        std::cerr << "off logger should be silent\n";
        return false;
    }

    lspmux::AbortController controller;
    const lspmux::AbortSignal signal = controller.signal();
    if (signal.aborted() || lspmux::AbortSignal{}.aborted())
    {
        std::cerr << "fresh signals should not be aborted\n";
        return false;
    }
    controller.abort();
    if (!signal.aborted())
    {
        std::cerr << "abort should reach derived signals\n";
        return false;
    }
    return true;
}

bool runTelemetryTests()
{
    lspmux::Telemetry                  telemetry;
    std::vector<lspmux::RequestMetric> forwarded;
    telemetry.setSink([&forwarded](const lspmux::RequestMetric& metric) { forwarded.push_back(metric); });

    telemetry.record(lspmux::RequestMetric{"a", "textDocument/hover", 120, true, ""});
    telemetry.record(lspmux::RequestMetric{"a", "textDocument/hover", 80, false, "ETIMEDOUT"});
    telemetry.record(lspmux::RequestMetric{"b", "workspace/symbol", 10, true, ""});

    if (telemetry.requestCount("a", "textDocument/hover") != 2U || telemetry.requestCount("b", "textDocument/hover") != 0U ||
        telemetry.failureCount("a") != 1U || telemetry.failureCount("b") != 0U)
    {
        std::cerr << "telemetry counters mismatch\n";
        return false;
    }
    if (forwarded.size() != 3U || forwarded[1].code != "ETIMEDOUT")
    {
        std::cerr << "telemetry sink did not receive every sample\n";
        return false;
    }
    return true;
}

}  // namespace

bool runSupportTests()
{
    bool ok = true;
    ok      = runErrorTests() && ok;
    ok      = runPathTests() && ok;
    ok      = runLoggingTests() && ok;
    ok      = runTelemetryTests() && ok;
    return ok;
}
