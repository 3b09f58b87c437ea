//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the per-server JSON-RPC client.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Protocol/Client.h"

#include "lspmux/Protocol/JsonRpcIO.h"
#include "lspmux/Support/Paths.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <algorithm>
#include <csignal>
#include <utility>

#include <unistd.h>

namespace lspmux
{
namespace
{

constexpr std::chrono::milliseconds ReaderPollInterval{50};
constexpr std::int64_t              ShutdownRequestTimeoutMs = 1500;
constexpr std::chrono::milliseconds ExitGracePeriod{500};
constexpr std::chrono::milliseconds TerminateGracePeriod{2000};
constexpr std::chrono::milliseconds KillGracePeriod{1000};

constexpr int FileCreated = 1;
constexpr int FileChanged = 2;

/// Sleeps on `cv` until `deadline`, waking at least every abort poll interval.
void waitSlice(std::condition_variable&              cv,
               std::unique_lock<std::mutex>&         lock,
               std::chrono::steady_clock::time_point deadline)
{
    const auto now = std::chrono::steady_clock::now();
    if (deadline <= now)
    {
        return;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::steady_clock::duration>(deadline - now);
    cv.wait_for(lock, std::min<std::chrono::steady_clock::duration>(AbortPollInterval, remaining));
}

llvm::json::Object makeMessage(llvm::StringRef method, llvm::json::Value params)
{
    llvm::json::Object out{{"jsonrpc", "2.0"}, {"method", method.str()}};
    if (params.kind() != llvm::json::Value::Null)
    {
        out["params"] = std::move(params);
    }
    return out;
}

}  // namespace

llvm::StringRef clientStateName(const ClientState state)
{
    switch (state)
    {
    case ClientState::Spawned:
        return "spawned";
    case ClientState::Initializing:
        return "initializing";
    case ClientState::Ready:
        return "ready";
    case ClientState::ShuttingDown:
        return "shutting-down";
    case ClientState::Closed:
        return "closed";
    }
    return "closed";
}

std::string inferLanguageId(llvm::StringRef path)
{
    const std::string extension = llvm::StringRef(llvm::sys::path::extension(path)).lower();
    if (extension.empty())
    {
        return "plaintext";
    }
    static const std::map<std::string, std::string> known = {
        {".ts", "typescript"},
        {".tsx", "typescriptreact"},
        {".js", "javascript"},
        {".jsx", "javascriptreact"},
        {".py", "python"},
        {".rs", "rust"},
        {".go", "go"},
        {".java", "java"},
        {".c", "c"},
        {".cpp", "cpp"},
        {".cc", "cpp"},
    };
    const auto it = known.find(extension);
    if (it != known.end())
    {
        return it->second;
    }
    return extension.substr(1);
}

llvm::json::Object buildInitializeParams(llvm::StringRef root, const llvm::json::Object& settings)
{
    const std::string rootUri = pathToFileUri(root);
    std::string       name    = llvm::sys::path::filename(stripTrailingSeparators(root)).str();
    if (name.empty())
    {
        name = "workspace";
    }

    llvm::json::Object capabilities{
        {"window", llvm::json::Object{{"workDoneProgress", true}}},
        {"workspace",
         llvm::json::Object{
             {"configuration", true},
             {"didChangeWatchedFiles", llvm::json::Object{{"dynamicRegistration", true}}},
         }},
        {"textDocument",
         llvm::json::Object{
             {"synchronization", llvm::json::Object{{"didOpen", true}, {"didChange", true}}},
             {"publishDiagnostics", llvm::json::Object{{"versionSupport", true}}},
         }},
    };

    return llvm::json::Object{
        {"processId", static_cast<std::int64_t>(::getpid())},
        {"rootUri", rootUri},
        {"rootPath", root.str()},
        {"capabilities", std::move(capabilities)},
        {"initializationOptions", llvm::json::Object(settings)},
        {"workspaceFolders", llvm::json::Array{llvm::json::Object{{"uri", rootUri}, {"name", name}}}},
    };
}

ProtocolClient::ProtocolClient(std::string                   serverId,
                               std::string                   root,
                               std::unique_ptr<ChildProcess> process,
                               ClientTiming                  timing,
                               const Logger&                 logger,
                               Telemetry*                    telemetry)
    : serverId_(std::move(serverId))
    , root_(std::move(root))
    , process_(std::move(process))
    , timing_(timing)
    , logger_(logger)
    , telemetry_(telemetry)
    , lastSeen_(std::chrono::system_clock::now())
{
    reader_ = std::thread([this] { readerLoop(); });
}

ProtocolClient::~ProtocolClient()
{
    stopReader();
    markClosed("is closed");
}

llvm::Error ProtocolClient::initialize(const llvm::json::Object& settings)
{
    setState(ClientState::Initializing);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = settings;
    }

    RequestOptions options;
    options.timeoutMs = timing_.initializeTimeoutMs;
    llvm::Expected<llvm::json::Value> result =
        request("initialize", buildInitializeParams(root_, settings), options);
    if (!result)
    {
        return makeError(ErrorCode::Init,
                         "Failed to initialize " + serverId_ + ": " +
                             toStructuredError(serverId_, result.takeError()).message);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        capabilities_.clear();
        if (const llvm::json::Object* object = result->getAsObject())
        {
            if (const llvm::json::Object* caps = object->getObject("capabilities"))
            {
                capabilities_ = *caps;
            }
        }
    }

    if (llvm::Error error = notify("initialized", llvm::json::Object{}))
    {
        return makeError(ErrorCode::Init,
                         "Failed to initialize " + serverId_ + ": " +
                             toStructuredError(serverId_, std::move(error)).message);
    }
    if (!settings.empty())
    {
        if (llvm::Error error =
                notify("workspace/didChangeConfiguration", llvm::json::Object{{"settings", llvm::json::Object(settings)}}))
        {
            return makeError(ErrorCode::Init,
                             "Failed to initialize " + serverId_ + ": " +
                                 toStructuredError(serverId_, std::move(error)).message);
        }
    }

    setState(ClientState::Ready);
    logger_.basic(serverId_ + " initialized in " + root_);
    return llvm::Error::success();
}

llvm::Expected<llvm::json::Value> ProtocolClient::request(llvm::StringRef       method,
                                                          llvm::json::Value     params,
                                                          const RequestOptions& options)
{
    const auto start   = std::chrono::steady_clock::now();
    auto       pending = std::make_shared<PendingRequest>();
    pending->method    = method.str();

    const auto finish = [&](bool ok, llvm::StringRef code) {
        if (telemetry_ == nullptr)
        {
            return;
        }
        RequestMetric metric;
        metric.serverId      = serverId_;
        metric.method        = method.str();
        metric.latencyMicros = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count());
        metric.ok   = ok;
        metric.code = code.str();
        telemetry_->record(std::move(metric));
    };
    const auto fail = [&](ErrorCode code, std::string text, std::optional<std::int64_t> remoteCode) -> llvm::Error {
        const LspError payload(code, text, remoteCode);
        finish(false, payload.codeString());
        logger_.verbose(serverId_ + " " + method.str() + " failed: " + text);
        return llvm::make_error<LspError>(code, std::move(text), remoteCode);
    };

    std::int64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ClientState::Closed)
        {
            return fail(ErrorCode::Pipe, serverId_ + " is closed", std::nullopt);
        }
        id            = nextId_++;
        inFlight_[id] = pending;
    }

    llvm::json::Object outbound = makeMessage(method, std::move(params));
    outbound["id"]              = id;
    logger_.verbose(serverId_ + " -> " + method.str() + " #" + std::to_string(id));
    if (!send(llvm::json::Value(std::move(outbound))))
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_.erase(id);
        return fail(ErrorCode::Pipe, serverId_ + " stdin is closed", std::nullopt);
    }

    const std::int64_t timeoutMs = options.timeoutMs.value_or(timing_.requestTimeoutMs);
    const auto         deadline  = start + std::chrono::milliseconds(timeoutMs);

    std::unique_lock<std::mutex> lock(mutex_);
    bool                         timedOut = false;
    bool                         aborted  = false;
    while (!pending->settled)
    {
        if (options.signal.aborted())
        {
            aborted = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            timedOut = true;
            break;
        }
        waitSlice(changed_, lock, deadline);
    }

    if (timedOut || aborted)
    {
        pending->settled = true;
        inFlight_.erase(id);
        lock.unlock();
        (void) send(makeMessage("$/cancelRequest", llvm::json::Object{{"id", id}}));
        if (aborted)
        {
            return fail(ErrorCode::Aborted, "Request aborted: " + method.str(), std::nullopt);
        }
        return fail(ErrorCode::TimedOut, "Request timed out: " + method.str(), std::nullopt);
    }

    lock.unlock();
    if (!pending->ok)
    {
        return fail(pending->code, pending->message, pending->remoteCode);
    }
    finish(true, "");
    return std::move(pending->result);
}

llvm::Error ProtocolClient::notify(llvm::StringRef method, llvm::json::Value params)
{
    if (state() == ClientState::Closed)
    {
        return makeError(ErrorCode::Pipe, serverId_ + " is closed");
    }
    logger_.verbose(serverId_ + " -> " + method.str());
    if (!send(makeMessage(method, std::move(params))))
    {
        return makeError(ErrorCode::Pipe, serverId_ + " stdin is closed");
    }
    return llvm::Error::success();
}

llvm::Expected<TouchFileResult> ProtocolClient::touchFile(llvm::StringRef    path,
                                                          const bool         waitForDiagnostics,
                                                          const AbortSignal& signal)
{
    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return makeError(ErrorCode::Internal, "Failed to read " + path.str() + ": " + buffer.getError().message());
    }
    std::string text = (*buffer)->getBuffer().str();
    if (!llvm::json::isUTF8(text))
    {
        logger_.basic(path.str() + " is not valid UTF-8; invalid bytes are sent as U+FFFD");
        text = llvm::json::fixUTF8(text);
    }
    const std::string uri  = pathToFileUri(path);

    std::int64_t  version     = 0;
    std::uint64_t minSequence = 0;
    bool          firstTouch  = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        version     = ++documentVersions_[uri];
        firstTouch  = openedDocuments_.insert(uri).second;
        const auto it = diagnostics_.find(uri);
        minSequence = (it == diagnostics_.end() ? 0U : it->second.sequence) + 1U;
    }

    if (llvm::Error error = notify("workspace/didChangeWatchedFiles",
                                   llvm::json::Object{{"changes",
                                                       llvm::json::Array{llvm::json::Object{
                                                           {"uri", uri},
                                                           {"type", firstTouch ? FileCreated : FileChanged},
                                                       }}}}))
    {
        return std::move(error);
    }

    llvm::Error sent = firstTouch ? notify("textDocument/didOpen",
                                           llvm::json::Object{{"textDocument",
                                                               llvm::json::Object{
                                                                   {"uri", uri},
                                                                   {"languageId", inferLanguageId(path)},
                                                                   {"version", version},
                                                                   {"text", text},
                                                               }}})
                                  : notify("textDocument/didChange",
                                           llvm::json::Object{
                                               {"textDocument", llvm::json::Object{{"uri", uri}, {"version", version}}},
                                               {"contentChanges", llvm::json::Array{llvm::json::Object{{"text", text}}}},
                                           });
    if (sent)
    {
        return std::move(sent);
    }

    TouchFileResult result;
    if (!waitForDiagnostics)
    {
        return result;
    }

    llvm::Error remaining = llvm::handleErrors(
        this->waitForDiagnostics(uri, minSequence, timing_.diagnosticsWaitTimeoutMs, signal),
        [&result](std::unique_ptr<LspError> payload) -> llvm::Error {
            if (payload->code() == ErrorCode::TimedOut)
            {
                result.timedOut = true;
                return llvm::Error::success();
            }
            if (payload->code() == ErrorCode::Aborted)
            {
                result.aborted = true;
                return llvm::Error::success();
            }
            return llvm::Error(std::move(payload));
        });
    if (remaining)
    {
        return std::move(remaining);
    }
    return result;
}

llvm::Error ProtocolClient::waitForDiagnostics(llvm::StringRef    uri,
                                               const std::uint64_t minSequence,
                                               const std::int64_t timeoutMs,
                                               const AbortSignal& signal)
{
    const auto key      = uri.str();
    const auto debounce = std::chrono::milliseconds(timing_.diagnosticsDebounceMs);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    std::unique_lock<std::mutex> lock(mutex_);
    while (true)
    {
        const auto now    = std::chrono::steady_clock::now();
        auto       wakeAt = deadline;

        const auto it = diagnostics_.find(key);
        if (it != diagnostics_.end() && it->second.sequence >= minSequence)
        {
            const auto settleAt = it->second.lastPublish + debounce;
            if (now >= settleAt)
            {
                return llvm::Error::success();
            }
            wakeAt = std::min(wakeAt, settleAt);
        }

        if (state_ == ClientState::Closed)
        {
            return makeError(ErrorCode::Pipe, serverId_ + " " + closedReason_);
        }
        if (signal.aborted())
        {
            return makeError(ErrorCode::Aborted, "Diagnostics wait aborted: " + key);
        }
        if (now >= deadline)
        {
            return makeError(ErrorCode::TimedOut, "Timed out waiting for diagnostics: " + key);
        }
        waitSlice(changed_, lock, wakeAt);
    }
}

std::uint64_t ProtocolClient::diagnosticsSequence(llvm::StringRef uri) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = diagnostics_.find(uri.str());
    return it == diagnostics_.end() ? 0U : it->second.sequence;
}

std::map<std::string, llvm::json::Array> ProtocolClient::diagnostics() const
{
    std::lock_guard<std::mutex>              lock(mutex_);
    std::map<std::string, llvm::json::Array> out;
    for (const auto& [uri, entry] : diagnostics_)
    {
        out.emplace(uri, entry.items);
    }
    return out;
}

llvm::json::Object ProtocolClient::capabilities() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_;
}

ClientState ProtocolClient::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string ProtocolClient::closedReason() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closedReason_;
}

std::chrono::system_clock::time_point ProtocolClient::lastSeen() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lastSeen_;
}

void ProtocolClient::shutdown()
{
    bool wasOpen = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wasOpen = state_ != ClientState::Closed;
        if (wasOpen)
        {
            state_ = ClientState::ShuttingDown;
        }
    }

    if (wasOpen)
    {
        logger_.basic("shutting down " + serverId_ + " in " + root_);
        RequestOptions options;
        options.timeoutMs = ShutdownRequestTimeoutMs;
        if (llvm::Expected<llvm::json::Value> reply = request("shutdown", nullptr, options); !reply)
        {
            llvm::consumeError(reply.takeError());
        }
        if (llvm::Error error = notify("exit", nullptr))
        {
            llvm::consumeError(std::move(error));
        }
    }

    process_->closeStdin();
    if (!process_->waitForExit(ExitGracePeriod))
    {
        process_->kill(SIGTERM);
        if (!process_->waitForExit(TerminateGracePeriod))
        {
            logger_.basic(serverId_ + " ignored SIGTERM; sending SIGKILL");
            process_->kill(SIGKILL);
            (void) process_->waitForExit(KillGracePeriod);
        }
    }

    stopReader();
    markClosed("is closed");
}

void ProtocolClient::readerLoop()
{
    FrameDecoder decoder;
    std::string  chunk;
    while (!stopping_.load())
    {
        switch (process_->read(chunk, ReaderPollInterval))
        {
        case ReadStatus::Data:
        {
            const std::size_t droppedBefore = decoder.droppedFrames();
            for (llvm::json::Value& inbound : decoder.push(chunk))
            {
                dispatch(std::move(inbound));
            }
            if (decoder.droppedFrames() != droppedBefore)
            {
                // The lost reply cannot be matched to its request id.
                logger_.basic(serverId_ + " sent a malformed message");
                std::lock_guard<std::mutex> lock(mutex_);
                failInFlightLocked(ErrorCode::Internal, serverId_ + " sent a malformed message");
                changed_.notify_all();
            }
            break;
        }
        case ReadStatus::Timeout:
            if (!process_->running())
            {
                logger_.basic(serverId_ + " exited");
                markClosed("exited");
                return;
            }
            break;
        case ReadStatus::EndOfFile:
        case ReadStatus::Failed:
            logger_.basic(serverId_ + " exited");
            markClosed("exited");
            return;
        }
    }
}

void ProtocolClient::dispatch(llvm::json::Value inbound)
{
    const llvm::json::Object* object = inbound.getAsObject();
    if (object == nullptr)
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastSeen_ = std::chrono::system_clock::now();
    }

    const auto method = object->getString("method");
    const bool hasId  = object->get("id") != nullptr;
    if (method && hasId)
    {
        handleServerRequest(*object);
    }
    else if (method)
    {
        if (*method == "textDocument/publishDiagnostics")
        {
            handlePublishDiagnostics(object->getObject("params"));
        }
    }
    else if (hasId)
    {
        handleResponse(*object);
    }
}

void ProtocolClient::handleResponse(const llvm::json::Object& inbound)
{
    const auto id = inbound.getInteger("id");
    if (!id)
    {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = inFlight_.find(*id);
    if (it == inFlight_.end())
    {
        return;
    }
    PendingRequest& pending = *it->second;
    if (const llvm::json::Object* error = inbound.getObject("error"))
    {
        pending.ok         = false;
        pending.code       = ErrorCode::Remote;
        const auto code    = error->getInteger("code");
        const auto text    = error->getString("message");
        pending.remoteCode = code ? *code : 0;
        pending.message    = text ? text->str() : std::string();
    }
    else
    {
        pending.ok = true;
        if (const llvm::json::Value* result = inbound.get("result"))
        {
            pending.result = *result;
        }
    }
    pending.settled = true;
    inFlight_.erase(it);
    changed_.notify_all();
}

void ProtocolClient::handleServerRequest(const llvm::json::Object& inbound)
{
    const llvm::StringRef method = *inbound.getString("method");
    llvm::json::Value     result(nullptr);

    if (method == "workspace/configuration")
    {
        llvm::json::Value settings(nullptr);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!settings_.empty())
            {
                settings = llvm::json::Object(settings_);
            }
        }
        llvm::json::Array entries;
        if (const llvm::json::Object* params = inbound.getObject("params"))
        {
            if (const llvm::json::Array* items = params->getArray("items"))
            {
                for (std::size_t index = 0; index < items->size(); ++index)
                {
                    entries.push_back(settings);
                }
            }
        }
        result = std::move(entries);
    }

    logger_.verbose(serverId_ + " <- " + method.str() + " (answered)");
    (void) send(llvm::json::Object{{"jsonrpc", "2.0"}, {"id", *inbound.get("id")}, {"result", std::move(result)}});
}

void ProtocolClient::handlePublishDiagnostics(const llvm::json::Object* params)
{
    if (params == nullptr)
    {
        return;
    }
    const auto uri = params->getString("uri");
    if (!uri)
    {
        return;
    }

    llvm::json::Array items;
    if (const llvm::json::Array* published = params->getArray("diagnostics"))
    {
        items = *published;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    DocumentDiagnostics&        entry = diagnostics_[uri->str()];
    entry.items                       = std::move(items);
    ++entry.sequence;
    entry.lastPublish = std::chrono::steady_clock::now();
    changed_.notify_all();
}

void ProtocolClient::markClosed(llvm::StringRef reason)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ClientState::Closed)
    {
        return;
    }
    state_        = ClientState::Closed;
    closedReason_ = reason.str();
    failInFlightLocked(ErrorCode::Pipe, serverId_ + " " + closedReason_);
    changed_.notify_all();
}

void ProtocolClient::failInFlightLocked(const ErrorCode code, const std::string& message)
{
    for (auto& [id, pending] : inFlight_)
    {
        pending->settled = true;
        pending->ok      = false;
        pending->code    = code;
        pending->message = message;
    }
    inFlight_.clear();
}

void ProtocolClient::stopReader()
{
    stopping_.store(true);
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id())
    {
        reader_.join();
    }
}

bool ProtocolClient::send(const llvm::json::Value& outbound)
{
    return process_->write(encodeFrame(outbound));
}

void ProtocolClient::setState(const ClientState state)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ClientState::Closed)
    {
        state_ = state;
    }
}

}  // namespace lspmux
