//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements operation validation, request mapping, and result flattening.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Runtime/Operations.h"

#include "lspmux/Support/Paths.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/raw_ostream.h"

#include <system_error>
#include <utility>

namespace lspmux
{
namespace
{

constexpr llvm::StringLiteral OperationNameTable[] = {
    "goToDefinition",
    "findReferences",
    "hover",
    "documentSymbol",
    "workspaceSymbol",
    "goToImplementation",
    "prepareCallHierarchy",
    "incomingCalls",
    "outgoingCalls",
};

constexpr std::int64_t WorkspaceSymbolKinds[] = {5, 6, 10, 11, 12, 13, 14, 23};

llvm::json::Object textDocumentParams(const std::string& uri, const llvm::json::Object* position)
{
    llvm::json::Object params{{"textDocument", llvm::json::Object{{"uri", uri}}}};
    if (position != nullptr)
    {
        params["position"] = llvm::json::Object(*position);
    }
    return params;
}

/// Server-reported errors (`LSP_<n>`) yield `fallback`; transport failures propagate.
llvm::Expected<llvm::json::Value> requestOr(ProtocolClient&    client,
                                            llvm::StringRef    method,
                                            llvm::json::Object params,
                                            llvm::json::Value  fallback,
                                            const AbortSignal& signal)
{
    RequestOptions options;
    options.signal = signal;
    llvm::Expected<llvm::json::Value> reply = client.request(method, std::move(params), options);
    if (reply)
    {
        return reply;
    }

    llvm::Error remaining = llvm::handleErrors(reply.takeError(), [](std::unique_ptr<LspError> payload) -> llvm::Error {
        if (payload->code() == ErrorCode::Remote)
        {
            return llvm::Error::success();
        }
        return llvm::Error(std::move(payload));
    });
    if (remaining)
    {
        return std::move(remaining);
    }
    return fallback;
}

void appendFlattened(llvm::json::Array& out, const llvm::json::Value& value, const bool keepSingle)
{
    if (const llvm::json::Array* items = value.getAsArray())
    {
        for (const llvm::json::Value& item : *items)
        {
            if (item.kind() != llvm::json::Value::Null)
            {
                out.push_back(item);
            }
        }
        return;
    }
    if (keepSingle && value.kind() != llvm::json::Value::Null)
    {
        out.push_back(value);
    }
}

OperationResult collect(llvm::StringRef            operation,
                        RunSummary                 summary,
                        const bool                 keepSingle,
                        std::vector<std::string>   warnings)
{
    OperationResult result;
    result.operation = operation.str();
    result.warnings  = std::move(warnings);
    for (RequestOutcome& outcome : summary.outcomes)
    {
        if (outcome.ok)
        {
            appendFlattened(result.results, outcome.value, keepSingle);
            continue;
        }
        if (outcome.error)
        {
            result.timedOut = result.timedOut || outcome.timedOut || outcome.error->timedOut();
            result.errors.push_back(std::move(*outcome.error));
        }
    }
    result.partial = !result.errors.empty() && !result.results.empty();
    return result;
}

llvm::StringRef locationMethod(llvm::StringRef operation)
{
    if (operation == "goToDefinition")
    {
        return "textDocument/definition";
    }
    if (operation == "findReferences")
    {
        return "textDocument/references";
    }
    return "textDocument/implementation";
}

}  // namespace

llvm::ArrayRef<llvm::StringLiteral> operationNames()
{
    return OperationNameTable;
}

bool isKnownOperation(llvm::StringRef operation)
{
    return llvm::is_contained(OperationNameTable, operation);
}

bool isWorkspaceSymbolKind(const std::int64_t kind)
{
    return llvm::is_contained(WorkspaceSymbolKinds, kind);
}

llvm::json::Array filterWorkspaceSymbols(const llvm::json::Value& symbols)
{
    llvm::json::Array kept;
    const llvm::json::Array* items = symbols.getAsArray();
    if (items == nullptr)
    {
        return kept;
    }
    for (const llvm::json::Value& symbol : *items)
    {
        if (kept.size() >= WorkspaceSymbolLimit)
        {
            break;
        }
        const llvm::json::Object* object = symbol.getAsObject();
        if (object == nullptr)
        {
            continue;
        }
        const auto kind = object->getInteger("kind");
        if (kind && isWorkspaceSymbolKind(*kind))
        {
            kept.push_back(symbol);
        }
    }
    return kept;
}

llvm::Error validateOperationInput(const OperationInput& input)
{
    if (!isKnownOperation(input.operation))
    {
        return llvm::createStringError(std::make_error_code(std::errc::invalid_argument),
                                       "Unknown operation '%s'.",
                                       input.operation.c_str());
    }
    if (input.filePath.empty() || input.line < 1 || input.character < 1)
    {
        return llvm::createStringError(std::make_error_code(std::errc::invalid_argument),
                                       "%s requires filePath, line, and character (1-based).",
                                       input.operation.c_str());
    }
    return llvm::Error::success();
}

llvm::Expected<OperationResult> executeOperation(Orchestrator&         orchestrator,
                                                 const OperationInput& input,
                                                 llvm::StringRef       cwd,
                                                 const AbortSignal&    signal)
{
    orchestrator.setCwd(cwd);
    if (llvm::Error error = validateOperationInput(input))
    {
        return std::move(error);
    }

    PathBoundaryOptions boundary;
    boundary.cwd                = cwd.str();
    boundary.boundaryRoots      = orchestrator.getBoundaryRoots();
    boundary.allowExternalPaths = orchestrator.getAllowExternalPaths();
    llvm::Expected<NormalizedPath> normalized = normalizeCallerPath(input.filePath, boundary);
    if (!normalized)
    {
        return normalized.takeError();
    }
    const std::string path = normalized->realPath;

    if (!llvm::sys::fs::exists(path))
    {
        return llvm::createStringError(std::make_error_code(std::errc::no_such_file_or_directory),
                                       "File not found: %s",
                                       path.c_str());
    }
    if (!orchestrator.hasAvailableClientForFile(path))
    {
        return llvm::createStringError(std::make_error_code(std::errc::not_supported),
                                       "No LSP server available for this file type.");
    }

    // Warm-up failures are reported again by the request fan-out below.
    (void) orchestrator.touchFile(path, true, signal);

    const std::string              uri      = pathToFileUri(path);
    const llvm::json::Object       position = toProtocolPosition(TextPosition{input.line, input.character});
    const std::vector<std::string> warnings = orchestrator.getWarnings();
    const llvm::StringRef          op       = input.operation;

    if (op == "goToDefinition" || op == "findReferences" || op == "goToImplementation")
    {
        const bool            references = op == "findReferences";
        const llvm::StringRef method     = locationMethod(op);
        RunSummary            summary    = orchestrator.run(path, [&](ProtocolClient& client) {
            llvm::json::Object params = textDocumentParams(uri, &position);
            if (references)
            {
                params["context"] = llvm::json::Object{{"includeDeclaration", true}};
            }
            return requestOr(client,
                             method,
                             std::move(params),
                             references ? llvm::json::Value(llvm::json::Array{}) : llvm::json::Value(nullptr),
                             signal);
        });
        return collect(op, std::move(summary), true, warnings);
    }

    if (op == "hover")
    {
        RunSummary summary = orchestrator.run(path, [&](ProtocolClient& client) {
            return requestOr(client, "textDocument/hover", textDocumentParams(uri, &position), nullptr, signal);
        });
        return collect(op, std::move(summary), true, warnings);
    }

    if (op == "documentSymbol" || op == "prepareCallHierarchy")
    {
        const llvm::StringRef method =
            op == "documentSymbol" ? "textDocument/documentSymbol" : "textDocument/prepareCallHierarchy";
        const bool withPosition = op == "prepareCallHierarchy";
        RunSummary summary      = orchestrator.run(path, [&](ProtocolClient& client) {
            return requestOr(client,
                             method,
                             textDocumentParams(uri, withPosition ? &position : nullptr),
                             llvm::json::Array{},
                             signal);
        });
        return collect(op, std::move(summary), false, warnings);
    }

    if (op == "workspaceSymbol")
    {
        RunSummary summary = orchestrator.runAll([&](ProtocolClient& client) -> llvm::Expected<llvm::json::Value> {
            llvm::Expected<llvm::json::Value> symbols =
                requestOr(client, "workspace/symbol", llvm::json::Object{{"query", ""}}, llvm::json::Array{}, signal);
            if (!symbols)
            {
                return symbols.takeError();
            }
            return llvm::json::Value(filterWorkspaceSymbols(*symbols));
        });
        return collect(op, std::move(summary), false, warnings);
    }

    const llvm::StringRef method = op == "incomingCalls" ? "callHierarchy/incomingCalls" : "callHierarchy/outgoingCalls";
    RunSummary summary = orchestrator.run(path, [&](ProtocolClient& client) -> llvm::Expected<llvm::json::Value> {
        llvm::Expected<llvm::json::Value> prepared = requestOr(client,
                                                               "textDocument/prepareCallHierarchy",
                                                               textDocumentParams(uri, &position),
                                                               llvm::json::Array{},
                                                               signal);
        if (!prepared)
        {
            return prepared.takeError();
        }
        const llvm::json::Array* items = prepared->getAsArray();
        if (items == nullptr || items->empty())
        {
            return llvm::json::Value(llvm::json::Array{});
        }
        return requestOr(client, method, llvm::json::Object{{"item", (*items)[0]}}, llvm::json::Array{}, signal);
    });
    return collect(op, std::move(summary), false, warnings);
}

llvm::json::Value toJSON(const OperationResult& result)
{
    llvm::json::Array errors;
    for (const StructuredError& error : result.errors)
    {
        errors.push_back(toJSON(error));
    }
    llvm::json::Array warnings;
    for (const std::string& warning : result.warnings)
    {
        warnings.push_back(warning);
    }
    return llvm::json::Object{
        {"operation", result.operation},
        {"result", llvm::json::Array(result.results)},
        {"errors", std::move(errors)},
        {"timedOut", result.timedOut},
        {"partial", result.partial},
        {"warnings", std::move(warnings)},
    };
}

std::string formatOperationOutput(const OperationResult& result)
{
    if (result.results.empty())
    {
        return "No results found for " + result.operation;
    }
    std::string              out;
    llvm::raw_string_ostream os(out);
    os << llvm::formatv("{0:2}", llvm::json::Value(llvm::json::Array(result.results)));
    os.flush();
    return out;
}

}  // namespace lspmux
