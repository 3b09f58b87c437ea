//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Backoff schedule and status snapshot tests.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Runtime/Backoff.h"
#include "lspmux/Runtime/Snapshot.h"

#include "llvm/Support/JSON.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace
{

using std::chrono::milliseconds;

bool runBackoffScheduleTests()
{
    const std::vector<std::int64_t> expected{5000, 10000, 20000, 40000, 60000, 60000};
    milliseconds                    previous{0};
    for (unsigned attempt = 1; attempt <= expected.size(); ++attempt)
    {
        const milliseconds delay = lspmux::computeBackoffDelay(attempt, 1.0);
        if (delay.count() != expected[attempt - 1U] || delay < previous)
        {
            std::cerr << "backoff delay for attempt " << attempt << " was " << delay.count() << "ms\n";
            return false;
        }
        previous = delay;
    }
    if (lspmux::computeBackoffDelay(1000, 1.0) != lspmux::BackoffCapDelay)
    {
        std::cerr << "large attempt counts should stay at the cap\n";
        return false;
    }
    if (lspmux::computeBackoffDelay(1, 0.0).count() != 4000 || lspmux::computeBackoffDelay(1, 9.0).count() != 6000)
    {
        std::cerr << "jitter factor should be clamped to [0.8, 1.2]\n";
        return false;
    }
    if (lspmux::computeBackoffDelay(5, 1.2) != milliseconds(72000))
    {
        std::cerr << "jitter applies after the cap\n";
        return false;
    }
    for (int sample = 0; sample < 32; ++sample)
    {
        const double jitter = lspmux::randomJitterFactor();
        if (jitter < lspmux::BackoffJitterMin || jitter > lspmux::BackoffJitterMax)
        {
            std::cerr << "random jitter out of range: " << jitter << "\n";
            return false;
        }
    }

    const auto               now   = std::chrono::system_clock::now();
    const lspmux::BrokenState first = lspmux::nextBrokenState(nullptr, "exited", now, 1.0);
    const lspmux::BrokenState second =
        lspmux::nextBrokenState(&first, "exited again", now + milliseconds(6000), 1.0);
    if (first.attempts != 1U || first.retryAt != now + milliseconds(5000) || !first.backingOff(now) ||
        first.backingOff(now + milliseconds(5000)))
    {
        std::cerr << "first failure should back off for the base delay\n";
        return false;
    }
    if (second.attempts != 2U || second.lastError != "exited again" ||
        second.retryAt != now + milliseconds(6000) + milliseconds(10000))
    {
        std::cerr << "repeated failure should double the delay\n";
        return false;
    }

    const std::string stamp = lspmux::formatTimestamp(std::chrono::system_clock::time_point(milliseconds(1700000000123)));
    if (stamp != "2023-11-14T22:13:20.123Z")
    {
        std::cerr << "timestamp format mismatch: " << stamp << "\n";
        return false;
    }
    return true;
}

lspmux::SnapshotRow row(const std::string& id)
{
    lspmux::SnapshotRow out;
    out.serverId   = id;
    out.extensions = {".x"};
    return out;
}

bool runSnapshotTests()
{
    llvm::json::Array diagnostics{
        llvm::json::Object{{"severity", 1}},
        llvm::json::Object{{"severity", 2}},
        llvm::json::Object{{"severity", 4}},
        llvm::json::Object{{"message", "no severity"}},
        llvm::json::Object{{"severity", 9}},
    };
    lspmux::DiagnosticCounts counts;
    lspmux::accumulateDiagnostics(counts, diagnostics);
    if (counts.error != 1U || counts.warning != 1U || counts.hint != 1U || counts.info != 2U || counts.total != 5U)
    {
        std::cerr << "diagnostic severity counts mismatch\n";
        return false;
    }

    const auto now = std::chrono::system_clock::now();

    lspmux::SnapshotRow idle      = row("zeta");
    lspmux::SnapshotRow connected = row("beta");
    connected.connectedRoots = {"/w"};
    connected.diagnostics    = counts;
    lspmux::SnapshotRow spawning = row("alpha");
    spawning.spawningRoots = {"/w"};
    lspmux::SnapshotRow broken = row("gamma");
    broken.connectedRoots = {"/w"};
    broken.broken         = lspmux::nextBrokenState(nullptr, "exited", now, 1.0);
    lspmux::SnapshotRow disabled = row("aaa");
    disabled.disabled = true;
    disabled.broken   = broken.broken;

    const lspmux::Snapshot snapshot = lspmux::makeSnapshot({idle, connected, spawning, broken, disabled}, now);
    std::vector<std::string> order;
    for (const lspmux::SnapshotRow& entry : snapshot.rows)
    {
        order.push_back(entry.serverId);
    }
    if (order != std::vector<std::string>{"gamma", "alpha", "beta", "zeta", "aaa"})
    {
        std::cerr << "snapshot rows not ordered by state then id\n";
        return false;
    }
    if (snapshot.totals.configured != 5U || snapshot.totals.connected != 2U || snapshot.totals.spawning != 1U ||
        snapshot.totals.broken != 2U || snapshot.totals.disabled != 1U)
    {
        std::cerr << "snapshot totals mismatch\n";
        return false;
    }

    const std::string summary = lspmux::summarizeSnapshot(snapshot);
    if (summary.rfind("LSP servers: 5 configured, 2 connected, 1 spawning, 2 broken, 1 disabled\n", 0) != 0 ||
        summary.find("[BROKEN]    gamma (builtin)") == std::string::npos ||
        summary.find("attempts=1") == std::string::npos || summary.find("[DISABLED]  aaa") == std::string::npos ||
        summary.find("diagnostics: 1 error, 1 warning, 2 info, 1 hint") == std::string::npos)
    {
        std::cerr << "snapshot summary mismatch:\n" << summary;
        return false;
    }

    const llvm::json::Value json = lspmux::toJSON(snapshot);
    const auto*             rows = json.getAsObject() ? json.getAsObject()->getArray("rows") : nullptr;
    if (rows == nullptr || rows->size() != 5U)
    {
        std::cerr << "snapshot JSON rows missing\n";
        return false;
    }
    const auto* first = (*rows)[0].getAsObject();
    if (first == nullptr)
    {
        std::cerr << "snapshot JSON row is not an object\n";
        return false;
    }
    const auto state = first->getString("state");
    if (!state || *state != "broken" || first->getObject("broken") == nullptr)
    {
        std::cerr << "snapshot JSON row state mismatch\n";
        return false;
    }
    return true;
}

}  // namespace

bool runBackoffTests()
{
    bool ok = true;
    ok      = runBackoffScheduleTests() && ok;
    ok      = runSnapshotTests() && ok;
    return ok;
}
