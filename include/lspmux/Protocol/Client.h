//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// LSP client bound to one language server process.
///
/// A reader thread drains the server's stdout, settles in-flight requests by
/// id, answers server-to-client requests, and records published diagnostics.
/// Callers block on a condition variable while polling their abort signal.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_PROTOCOL_CLIENT_H
#define LSPMUX_PROTOCOL_CLIENT_H

#include "lspmux/Process/ChildProcess.h"
#include "lspmux/Support/Cancellation.h"
#include "lspmux/Support/Error.h"
#include "lspmux/Support/Logging.h"
#include "lspmux/Support/Telemetry.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace lspmux
{

/// @brief Client lifecycle state.
enum class ClientState
{
    Spawned,
    Initializing,
    Ready,
    ShuttingDown,
    Closed,
};

[[nodiscard]] llvm::StringRef clientStateName(ClientState state);

/// @brief Timeouts applied by a client.
struct ClientTiming final
{
    std::int64_t requestTimeoutMs{10000};
    std::int64_t diagnosticsWaitTimeoutMs{3000};
    std::int64_t initializeTimeoutMs{15000};

    /// @brief Quiet window required after the last matching publish.
    std::int64_t diagnosticsDebounceMs{150};
};

/// @brief Per-request overrides.
struct RequestOptions final
{
    /// @brief Timeout override; defaults to `ClientTiming::requestTimeoutMs`.
    std::optional<std::int64_t> timeoutMs;

    AbortSignal signal;
};

/// @brief Outcome of waiting for diagnostics after a touch.
struct TouchFileResult final
{
    bool timedOut{false};
    bool aborted{false};
};

/// @brief Maps a file extension to an LSP language identifier.
[[nodiscard]] std::string inferLanguageId(llvm::StringRef path);

/// @brief Builds the `initialize` request parameters for a root.
[[nodiscard]] llvm::json::Object buildInitializeParams(llvm::StringRef root, const llvm::json::Object& settings);

/// @brief JSON-RPC client for one language server.
class ProtocolClient final
{
public:
    /// @brief Takes ownership of a started process and begins reading its output.
    /// @param[in] serverId Server identifier used in error messages.
    /// @param[in] root Server root directory.
    /// @param[in] process Started server process.
    /// @param[in] timing Client timeouts.
    /// @param[in] logger Trace logger; must outlive the client.
    /// @param[in] telemetry Optional request telemetry recorder; must outlive the client.
    ProtocolClient(std::string                   serverId,
                   std::string                   root,
                   std::unique_ptr<ChildProcess> process,
                   ClientTiming                  timing,
                   const Logger&                 logger,
                   Telemetry*                    telemetry = nullptr);

    ~ProtocolClient();

    ProtocolClient(const ProtocolClient&)            = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    /// @brief Performs the `initialize` handshake.
    /// @param[in] settings Initialization options, also served for `workspace/configuration`.
    /// @return Success, or an `EINIT` error carrying the underlying message.
    [[nodiscard]] llvm::Error initialize(const llvm::json::Object& settings);

    /// @brief Sends a request and blocks until it settles.
    /// @return Response `result`, or `ETIMEDOUT`, `EABORTED`, `EPIPE`, or `LSP_<n>`.
    [[nodiscard]] llvm::Expected<llvm::json::Value> request(llvm::StringRef       method,
                                                            llvm::json::Value     params,
                                                            const RequestOptions& options = {});

    /// @brief Sends a notification.
    [[nodiscard]] llvm::Error notify(llvm::StringRef method, llvm::json::Value params);

    /// @brief Opens or refreshes a document and optionally waits for its diagnostics.
    /// @param[in] path Absolute file path.
    /// @param[in] waitForDiagnostics Whether to wait for a fresh publish.
    /// @param[in] signal Abort signal for the wait.
    /// @return Wait outcome, or an error when the file or the pipe fails.
    [[nodiscard]] llvm::Expected<TouchFileResult> touchFile(llvm::StringRef    path,
                                                            bool               waitForDiagnostics,
                                                            const AbortSignal& signal = {});

    /// @brief Waits until `uri` reaches `minSequence` and publishes settle.
    [[nodiscard]] llvm::Error waitForDiagnostics(llvm::StringRef    uri,
                                                 std::uint64_t      minSequence,
                                                 std::int64_t       timeoutMs,
                                                 const AbortSignal& signal = {});

    /// @brief Returns the publish sequence number for a URI (0 when none).
    [[nodiscard]] std::uint64_t diagnosticsSequence(llvm::StringRef uri) const;

    /// @brief Returns a copy of all diagnostics keyed by URI.
    [[nodiscard]] std::map<std::string, llvm::json::Array> diagnostics() const;

    /// @brief Returns the capabilities reported by `initialize`.
    [[nodiscard]] llvm::json::Object capabilities() const;

    [[nodiscard]] ClientState state() const;

    /// @brief Returns why the client closed, e.g. `exited`. Empty while open.
    [[nodiscard]] std::string closedReason() const;

    [[nodiscard]] bool isReady() const
    {
        return state() == ClientState::Ready;
    }

    /// @brief Returns the time of the last inbound message.
    [[nodiscard]] std::chrono::system_clock::time_point lastSeen() const;

    /// @brief Gracefully stops the server, escalating to signals when needed.
    void shutdown();

    [[nodiscard]] const std::string& serverId() const
    {
        return serverId_;
    }

    [[nodiscard]] const std::string& root() const
    {
        return root_;
    }

    [[nodiscard]] pid_t pid() const
    {
        return process_->pid();
    }

private:
    struct PendingRequest final
    {
        std::string                 method;
        bool                        settled{false};
        bool                        ok{false};
        llvm::json::Value           result = nullptr;
        ErrorCode                   code{ErrorCode::Internal};
        std::string                 message;
        std::optional<std::int64_t> remoteCode;
    };

    struct DocumentDiagnostics final
    {
        llvm::json::Array                     items;
        std::uint64_t                         sequence{0};
        std::chrono::steady_clock::time_point lastPublish;
    };

    void readerLoop();
    void dispatch(llvm::json::Value message);
    void handleResponse(const llvm::json::Object& message);
    void handleServerRequest(const llvm::json::Object& message);
    void handlePublishDiagnostics(const llvm::json::Object* params);
    void markClosed(llvm::StringRef reason);
    void failInFlightLocked(ErrorCode code, const std::string& message);
    void stopReader();
    bool send(const llvm::json::Value& message);
    void setState(ClientState state);

    std::string                   serverId_;
    std::string                   root_;
    std::unique_ptr<ChildProcess> process_;
    ClientTiming                  timing_;
    const Logger&                 logger_;
    Telemetry*                    telemetry_;

    mutable std::mutex                                      mutex_;
    std::condition_variable                                 changed_;
    ClientState                                             state_{ClientState::Spawned};
    std::string                                             closedReason_;
    std::int64_t                                            nextId_{1};
    std::map<std::int64_t, std::shared_ptr<PendingRequest>> inFlight_;
    std::map<std::string, DocumentDiagnostics>              diagnostics_;
    std::map<std::string, std::int64_t>                     documentVersions_;
    std::set<std::string>                                   openedDocuments_;
    llvm::json::Object                                      capabilities_;
    llvm::json::Object                                      settings_;
    std::chrono::system_clock::time_point                   lastSeen_;

    std::atomic_bool stopping_{false};
    std::thread      reader_;
};

}  // namespace lspmux

#endif  // LSPMUX_PROTOCOL_CLIENT_H
