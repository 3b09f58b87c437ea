//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements snapshot ordering, totals, and text rendering.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Runtime/Snapshot.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

namespace lspmux
{
namespace
{

llvm::json::Array toJSONArray(const std::vector<std::string>& values)
{
    llvm::json::Array out;
    for (const std::string& value : values)
    {
        out.push_back(value);
    }
    return out;
}

std::int64_t epochMillis(const std::chrono::system_clock::time_point time)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

}  // namespace

void accumulateDiagnostics(DiagnosticCounts& counts, const llvm::json::Array& diagnostics)
{
    for (const llvm::json::Value& diagnostic : diagnostics)
    {
        std::int64_t severity = 0;
        if (const llvm::json::Object* object = diagnostic.getAsObject())
        {
            if (const auto value = object->getInteger("severity"))
            {
                severity = *value;
            }
        }
        switch (severity)
        {
        case 1:
            ++counts.error;
            break;
        case 2:
            ++counts.warning;
            break;
        case 4:
            ++counts.hint;
            break;
        default:
            ++counts.info;
            break;
        }
        ++counts.total;
    }
}

SnapshotBucket snapshotBucket(const SnapshotRow& row)
{
    if (row.disabled)
    {
        return SnapshotBucket::Disabled;
    }
    if (row.broken)
    {
        return SnapshotBucket::Broken;
    }
    if (!row.spawningRoots.empty())
    {
        return SnapshotBucket::Spawning;
    }
    if (!row.connectedRoots.empty())
    {
        return SnapshotBucket::Connected;
    }
    return SnapshotBucket::Idle;
}

llvm::StringRef snapshotBucketName(const SnapshotBucket bucket)
{
    switch (bucket)
    {
    case SnapshotBucket::Broken:
        return "broken";
    case SnapshotBucket::Spawning:
        return "spawning";
    case SnapshotBucket::Connected:
        return "connected";
    case SnapshotBucket::Idle:
        return "idle";
    case SnapshotBucket::Disabled:
        return "disabled";
    }
    return "idle";
}

void sortSnapshotRows(std::vector<SnapshotRow>& rows)
{
    std::stable_sort(rows.begin(), rows.end(), [](const SnapshotRow& lhs, const SnapshotRow& rhs) {
        const auto lhsBucket = static_cast<int>(snapshotBucket(lhs));
        const auto rhsBucket = static_cast<int>(snapshotBucket(rhs));
        if (lhsBucket != rhsBucket)
        {
            return lhsBucket < rhsBucket;
        }
        return lhs.serverId < rhs.serverId;
    });
}

SnapshotTotals computeSnapshotTotals(const std::vector<SnapshotRow>& rows)
{
    SnapshotTotals totals;
    totals.configured = rows.size();
    for (const SnapshotRow& row : rows)
    {
        totals.connected += row.connectedRoots.empty() ? 0U : 1U;
        totals.spawning += row.spawningRoots.empty() ? 0U : 1U;
        totals.broken += row.broken ? 1U : 0U;
        totals.disabled += row.disabled ? 1U : 0U;
    }
    return totals;
}

Snapshot makeSnapshot(std::vector<SnapshotRow> rows, const std::chrono::system_clock::time_point now)
{
    Snapshot snapshot;
    snapshot.generatedAt = now;
    sortSnapshotRows(rows);
    snapshot.totals = computeSnapshotTotals(rows);
    snapshot.rows   = std::move(rows);
    return snapshot;
}

std::string summarizeSnapshot(const Snapshot& snapshot)
{
    std::string              out;
    llvm::raw_string_ostream os(out);

    const SnapshotTotals& totals = snapshot.totals;
    os << "LSP servers: " << totals.configured << " configured, " << totals.connected << " connected, "
       << totals.spawning << " spawning, " << totals.broken << " broken, " << totals.disabled << " disabled\n";

    for (const SnapshotRow& row : snapshot.rows)
    {
        const std::string badge = "[" + snapshotBucketName(snapshotBucket(row)).upper() + "]";
        os << llvm::left_justify(badge, 12) << row.serverId << " (" << serverSourceName(row.source) << ")";
        if (!row.extensions.empty())
        {
            os << " " << llvm::join(row.extensions, ",");
        }
        if (!row.connectedRoots.empty())
        {
            os << " connected: " << llvm::join(row.connectedRoots, ", ");
        }
        if (!row.spawningRoots.empty())
        {
            os << " spawning: " << llvm::join(row.spawningRoots, ", ");
        }
        if (row.diagnostics)
        {
            const DiagnosticCounts& counts = *row.diagnostics;
            os << " diagnostics: " << counts.error << " error, " << counts.warning << " warning, " << counts.info
               << " info, " << counts.hint << " hint";
        }
        if (row.broken)
        {
            os << " attempts=" << row.broken->attempts << " retry at " << formatTimestamp(row.broken->retryAt) << ": "
               << row.broken->lastError;
        }
        os << "\n";
    }
    os.flush();
    return out;
}

llvm::json::Value toJSON(const Snapshot& snapshot)
{
    llvm::json::Array rows;
    for (const SnapshotRow& row : snapshot.rows)
    {
        llvm::json::Object out{
            {"serverId", row.serverId},
            {"source", serverSourceName(row.source)},
            {"disabled", row.disabled},
            {"state", snapshotBucketName(snapshotBucket(row))},
            {"extensions", toJSONArray(row.extensions)},
            {"configuredRoots", toJSONArray(row.configuredRoots)},
            {"connectedRoots", toJSONArray(row.connectedRoots)},
            {"spawningRoots", toJSONArray(row.spawningRoots)},
        };
        if (row.broken)
        {
            out["broken"] = llvm::json::Object{
                {"attempts", static_cast<std::int64_t>(row.broken->attempts)},
                {"retryAt", formatTimestamp(row.broken->retryAt)},
                {"lastError", row.broken->lastError},
            };
        }
        if (row.diagnostics)
        {
            out["diagnostics"] = llvm::json::Object{
                {"error", static_cast<std::int64_t>(row.diagnostics->error)},
                {"warning", static_cast<std::int64_t>(row.diagnostics->warning)},
                {"info", static_cast<std::int64_t>(row.diagnostics->info)},
                {"hint", static_cast<std::int64_t>(row.diagnostics->hint)},
                {"total", static_cast<std::int64_t>(row.diagnostics->total)},
            };
        }
        if (row.lastSeenAt)
        {
            out["lastSeenAt"] = epochMillis(*row.lastSeenAt);
        }
        rows.push_back(std::move(out));
    }

    const SnapshotTotals& totals = snapshot.totals;
    return llvm::json::Object{
        {"generatedAt", epochMillis(snapshot.generatedAt)},
        {"rows", std::move(rows)},
        {"totals",
         llvm::json::Object{
             {"configured", static_cast<std::int64_t>(totals.configured)},
             {"connected", static_cast<std::int64_t>(totals.connected)},
             {"spawning", static_cast<std::int64_t>(totals.spawning)},
             {"broken", static_cast<std::int64_t>(totals.broken)},
             {"disabled", static_cast<std::int64_t>(totals.disabled)},
         }},
    };
}

}  // namespace lspmux
