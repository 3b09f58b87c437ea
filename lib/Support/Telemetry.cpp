//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Per-server request and failure counters.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Support/Telemetry.h"

namespace lspmux
{

void Telemetry::setSink(RequestMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(RequestMetric metric)
{
    RequestMetricSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++requestCounts_[{metric.serverId, metric.method}];
        if (!metric.ok)
        {
            ++failureCounts_[metric.serverId];
        }
        sink = sink_;
    }
    if (sink)
    {
        sink(metric);
    }
}

std::uint64_t Telemetry::requestCount(const std::string_view serverId, const std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = requestCounts_.find({std::string(serverId), std::string(method)});
    return it == requestCounts_.end() ? 0U : it->second;
}

std::uint64_t Telemetry::failureCount(const std::string_view serverId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = failureCounts_.find(std::string(serverId));
    return it == failureCounts_.end() ? 0U : it->second;
}

}  // namespace lspmux
