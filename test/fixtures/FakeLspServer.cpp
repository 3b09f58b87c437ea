//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Scripted language server used by the end-to-end tests.
///
/// Options:
///   --name <id>          Label used in hover text and diagnostics.
///   --crash-on <method>  Exit with status 3 when the method arrives.
///   --hang-on <method>   Never answer the method.
///   --ignore-exit        Ignore `exit`, SIGTERM, and end of input.
///   --garble-on <method> Answer the method with a body that is not valid UTF-8.
///   --initialize-delay-ms <ms>
///                        Wait before answering `initialize`.
///
/// When `FAKE_LSP_SPAWN_LOG` names a file, one line per start is appended.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Protocol/JsonRpcIO.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <thread>

#include <unistd.h>

namespace
{

struct FakeOptions final
{
    std::string           name = "fake";
    std::set<std::string> crashOn;
    std::set<std::string> hangOn;
    std::set<std::string> garbleOn;
    bool                  ignoreExit{false};
    std::int64_t          initializeDelayMs{0};
};

llvm::json::Object range(std::int64_t line, std::int64_t character)
{
    return llvm::json::Object{
        {"start", llvm::json::Object{{"line", line}, {"character", character}}},
        {"end", llvm::json::Object{{"line", line}, {"character", character + 1}}},
    };
}

llvm::json::Object symbol(const std::string& name, std::int64_t kind, const std::string& uri)
{
    return llvm::json::Object{
        {"name", name},
        {"kind", kind},
        {"location", llvm::json::Object{{"uri", uri}, {"range", range(0, 0)}}},
    };
}

llvm::json::Object callItem(const std::string& name, const std::string& uri)
{
    return llvm::json::Object{
        {"name", name},
        {"kind", 12},
        {"uri", uri},
        {"range", range(0, 0)},
        {"selectionRange", range(0, 0)},
    };
}

class FakeServer final
{
public:
    FakeServer(FakeOptions options, lspmux::JsonRpcStdioTransport& transport)
        : options_(std::move(options))
        , transport_(transport)
    {
    }

    /// Returns false when the process should exit.
    bool handle(const llvm::json::Object& message)
    {
        const auto method = message.getString("method");
        const auto* id    = message.get("id");
        if (!method)
        {
            if (const llvm::json::Value* result = message.get("result"))
            {
                lastConfiguration_ = *result;
            }
            return true;
        }

        const std::string name = method->str();
        if (options_.crashOn.count(name) != 0)
        {
            std::_Exit(3);
        }
        if (options_.hangOn.count(name) != 0)
        {
            return true;
        }

        const llvm::json::Object* params = message.getObject("params");
        if (id != nullptr && options_.garbleOn.count(name) != 0)
        {
            garbledReply(*id);
            return true;
        }
        if (id == nullptr)
        {
            return notification(name, params);
        }
        request(*id, name, params);
        return true;
    }

private:
    bool notification(const std::string& method, const llvm::json::Object* params)
    {
        if (method == "initialized")
        {
            send(llvm::json::Object{
                {"jsonrpc", "2.0"},
                {"id", "fake-configuration"},
                {"method", "workspace/configuration"},
                {"params", llvm::json::Object{{"items", llvm::json::Array{llvm::json::Object{{"section", options_.name}}}}}},
            });
        }
        else if (method == "exit")
        {
            return options_.ignoreExit;
        }
        else if ((method == "textDocument/didOpen" || method == "textDocument/didChange") && params != nullptr)
        {
            const llvm::json::Object* document = params->getObject("textDocument");
            if (document != nullptr && method == "textDocument/didOpen")
            {
                const auto text = document->getString("text");
                lastText_       = text ? text->str() : "";
            }
            else if (const llvm::json::Array* changes = params->getArray("contentChanges"))
            {
                const llvm::json::Object* change = changes->empty() ? nullptr : changes->front().getAsObject();
                lastText_.clear();
                if (change != nullptr)
                {
                    const auto text = change->getString("text");
                    lastText_       = text ? text->str() : "";
                }
            }
            if (document != nullptr)
            {
                const std::string  uri     = document->getString("uri") ? document->getString("uri")->str() : "";
                const std::int64_t version = document->getInteger("version") ? *document->getInteger("version") : 0;
                publish(uri, llvm::json::Array{});
                publish(uri,
                        llvm::json::Array{llvm::json::Object{
                            {"range", range(0, 0)},
                            {"severity", 1},
                            {"source", options_.name},
                            {"message", options_.name + ": version " + std::to_string(version)},
                        }});
            }
        }
        return true;
    }

    void request(const llvm::json::Value& id, const std::string& method, const llvm::json::Object* params)
    {
        std::string uri;
        if (params != nullptr)
        {
            if (const llvm::json::Object* document = params->getObject("textDocument"))
            {
                if (const auto text = document->getString("uri"))
                {
                    uri = text->str();
                }
            }
        }

        if (method == "initialize")
        {
            if (options_.initializeDelayMs > 0)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(options_.initializeDelayMs));
            }
            reply(id,
                  llvm::json::Object{
                      {"capabilities",
                       llvm::json::Object{
                           {"hoverProvider", true},
                           {"definitionProvider", true},
                           {"referencesProvider", true},
                           {"workspaceSymbolProvider", true},
                           {"callHierarchyProvider", true},
                       }},
                      {"serverInfo", llvm::json::Object{{"name", options_.name}}},
                  });
        }
        else if (method == "shutdown")
        {
            reply(id, nullptr);
        }
        else if (method == "textDocument/hover")
        {
            std::int64_t line      = -1;
            std::int64_t character = -1;
            if (const llvm::json::Object* position = params != nullptr ? params->getObject("position") : nullptr)
            {
                line      = position->getInteger("line") ? *position->getInteger("line") : -1;
                character = position->getInteger("character") ? *position->getInteger("character") : -1;
            }
            reply(id,
                  llvm::json::Object{{"contents",
                                      llvm::json::Object{
                                          {"kind", "plaintext"},
                                          {"value",
                                           options_.name + " hover " + std::to_string(line) + ":" +
                                               std::to_string(character)},
                                      }}});
        }
        else if (method == "textDocument/definition")
        {
            reply(id, llvm::json::Object{{"uri", uri}, {"range", range(0, 0)}});
        }
        else if (method == "textDocument/references")
        {
            reply(id,
                  llvm::json::Array{
                      llvm::json::Object{{"uri", uri}, {"range", range(0, 0)}},
                      llvm::json::Object{{"uri", uri}, {"range", range(1, 0)}},
                  });
        }
        else if (method == "textDocument/implementation")
        {
            reply(id, nullptr);
        }
        else if (method == "textDocument/documentSymbol")
        {
            reply(id, llvm::json::Array{symbol(options_.name + "_main", 12, uri)});
        }
        else if (method == "workspace/symbol")
        {
            llvm::json::Array symbols;
            symbols.push_back(symbol(options_.name + "_field", 8, "file:///fake"));
            for (int index = 0; index < 12; ++index)
            {
                symbols.push_back(symbol(options_.name + "_fn" + std::to_string(index), 12, "file:///fake"));
            }
            reply(id, std::move(symbols));
        }
        else if (method == "textDocument/prepareCallHierarchy")
        {
            reply(id, llvm::json::Array{callItem(options_.name + "_target", uri)});
        }
        else if (method == "callHierarchy/incomingCalls")
        {
            reply(id,
                  llvm::json::Array{llvm::json::Object{
                      {"from", callItem(options_.name + "_caller", uri)},
                      {"fromRanges", llvm::json::Array{range(2, 0)}},
                  }});
        }
        else if (method == "callHierarchy/outgoingCalls")
        {
            reply(id,
                  llvm::json::Array{llvm::json::Object{
                      {"to", callItem(options_.name + "_callee", uri)},
                      {"fromRanges", llvm::json::Array{range(3, 0)}},
                  }});
        }
        else if (method == "fake/lastConfiguration")
        {
            reply(id, lastConfiguration_);
        }
        else if (method == "fake/lastText")
        {
            reply(id, lastText_);
        }
        else if (method == "fake/pid")
        {
            reply(id, static_cast<std::int64_t>(::getpid()));
        }
        else
        {
            send(llvm::json::Object{
                {"jsonrpc", "2.0"},
                {"id", id},
                {"error", llvm::json::Object{{"code", -32601}, {"message", "Method not found: " + method}}},
            });
        }
    }

    void publish(const std::string& uri, llvm::json::Array diagnostics)
    {
        send(llvm::json::Object{
            {"jsonrpc", "2.0"},
            {"method", "textDocument/publishDiagnostics"},
            {"params", llvm::json::Object{{"uri", uri}, {"diagnostics", std::move(diagnostics)}}},
        });
    }

    void reply(const llvm::json::Value& id, llvm::json::Value result)
    {
        send(llvm::json::Object{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}});
    }

    // Written by hand: the JSON writer refuses invalid UTF-8.
    void garbledReply(const llvm::json::Value& id)
    {
        std::string              encodedId;
        llvm::raw_string_ostream idStream(encodedId);
        idStream << id;
        idStream.flush();
        const std::string body = R"({"jsonrpc":"2.0","id":)" + encodedId + R"(,"result":")" + "\xff\xfe" + R"("})";
        std::cout << "Content-Length: " << body.size() << "\r\n\r\n" << body << std::flush;
        if (!std::cout)
        {
            std::_Exit(4);
        }
    }

    void send(llvm::json::Object message)
    {
        if (!transport_.writeMessage(llvm::json::Value(std::move(message))))
        {
            std::_Exit(4);
        }
    }

    FakeOptions                    options_;
    lspmux::JsonRpcStdioTransport& transport_;
    llvm::json::Value              lastConfiguration_ = nullptr;
    std::string                    lastText_;
};

}  // namespace

int main(int argc, char** argv)
{
    FakeOptions options;
    for (int i = 1; i < argc; ++i)
    {
        const llvm::StringRef arg(argv[i]);
        const bool            hasValue = i + 1 < argc;
        if (arg == "--name" && hasValue)
        {
            options.name = argv[++i];
        }
        else if (arg == "--crash-on" && hasValue)
        {
            options.crashOn.insert(argv[++i]);
        }
        else if (arg == "--hang-on" && hasValue)
        {
            options.hangOn.insert(argv[++i]);
        }
        else if (arg == "--garble-on" && hasValue)
        {
            options.garbleOn.insert(argv[++i]);
        }
        else if (arg == "--initialize-delay-ms" && hasValue)
        {
            options.initializeDelayMs = std::strtoll(argv[++i], nullptr, 10);
        }
        else if (arg == "--ignore-exit")
        {
            options.ignoreExit = true;
        }
        else
        {
            llvm::errs() << "fake-lsp: unknown argument " << arg << "\n";
            return 2;
        }
    }

    if (options.ignoreExit)
    {
        std::signal(SIGTERM, SIG_IGN);
    }
    if (const char* logPath = std::getenv("FAKE_LSP_SPAWN_LOG"))
    {
        std::ofstream log(logPath, std::ios::app);
        log << options.name << " " << ::getpid() << "\n";
    }

    lspmux::JsonRpcStdioTransport transport(std::cin, std::cout);
    FakeServer                    server(options, transport);
    while (true)
    {
        llvm::json::Value message(nullptr);
        std::string       error;
        if (!transport.readMessage(message, error))
        {
            if (!error.empty())
            {
                llvm::errs() << "fake-lsp: " << error << "\n";
            }
            break;
        }
        const llvm::json::Object* object = message.getAsObject();
        if (object != nullptr && !server.handle(*object))
        {
            break;
        }
    }
    while (options.ignoreExit)
    {
        ::pause();
    }
    return 0;
}
