//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Observability snapshot of configured and running servers.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_RUNTIME_SNAPSHOT_H
#define LSPMUX_RUNTIME_SNAPSHOT_H

#include "lspmux/Config/ConfigLoader.h"
#include "lspmux/Runtime/Backoff.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lspmux
{

/// @brief Diagnostic counts by LSP severity.
struct DiagnosticCounts final
{
    std::size_t error{0};
    std::size_t warning{0};
    std::size_t info{0};
    std::size_t hint{0};
    std::size_t total{0};
};

/// @brief Adds one published diagnostics array to `counts`.
///
/// A missing or unknown severity counts as info.
void accumulateDiagnostics(DiagnosticCounts& counts, const llvm::json::Array& diagnostics);

/// @brief Status of one configured server.
struct SnapshotRow final
{
    std::string                                          serverId;
    ServerSource                                         source{ServerSource::Builtin};
    bool                                                 disabled{false};
    std::vector<std::string>                             extensions;
    std::vector<std::string>                             configuredRoots;
    std::vector<std::string>                             connectedRoots;
    std::vector<std::string>                             spawningRoots;
    std::optional<BrokenState>                           broken;
    std::optional<DiagnosticCounts>                      diagnostics;
    std::optional<std::chrono::system_clock::time_point> lastSeenAt;
};

/// @brief Sort bucket, most actionable first.
enum class SnapshotBucket
{
    Broken,
    Spawning,
    Connected,
    Idle,
    Disabled,
};

[[nodiscard]] SnapshotBucket snapshotBucket(const SnapshotRow& row);

[[nodiscard]] llvm::StringRef snapshotBucketName(SnapshotBucket bucket);

struct SnapshotTotals final
{
    std::size_t configured{0};
    std::size_t connected{0};
    std::size_t spawning{0};
    std::size_t broken{0};
    std::size_t disabled{0};
};

struct Snapshot final
{
    std::chrono::system_clock::time_point generatedAt;
    std::vector<SnapshotRow>              rows;
    SnapshotTotals                        totals;
};

/// @brief Orders rows by bucket, then by server id.
void sortSnapshotRows(std::vector<SnapshotRow>& rows);

[[nodiscard]] SnapshotTotals computeSnapshotTotals(const std::vector<SnapshotRow>& rows);

/// @brief Sorts `rows`, computes totals, and stamps the snapshot.
[[nodiscard]] Snapshot makeSnapshot(std::vector<SnapshotRow> rows, std::chrono::system_clock::time_point now);

/// @brief Renders a plain-text status summary, one line per server.
[[nodiscard]] std::string summarizeSnapshot(const Snapshot& snapshot);

[[nodiscard]] llvm::json::Value toJSON(const Snapshot& snapshot);

}  // namespace lspmux

#endif  // LSPMUX_RUNTIME_SNAPSHOT_H
