//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Request telemetry aggregation and sink integration.
///
/// Every request sent to a language server produces one metric sample. Samples
/// are counted per server and method and forwarded to an optional sink.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_SUPPORT_TELEMETRY_H
#define LSPMUX_SUPPORT_TELEMETRY_H

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace lspmux
{

/// @brief One settled request.
struct RequestMetric final
{
    /// @brief Server id the request was sent to.
    std::string serverId;

    std::string method;

    /// @brief Time from send to settlement.
    std::uint64_t latencyMicros{0};

    /// @brief Whether the request produced a result.
    bool ok{false};

    /// @brief Error code string when `ok` is false.
    std::string code;
};

/// @brief Receives every recorded sample.
using RequestMetricSink = std::function<void(const RequestMetric&)>;

/// @brief Request counters shared by all clients of an orchestrator.
class Telemetry final
{
public:
    /// @brief Replaces the forwarding sink; an empty function stops forwarding.
    void setSink(RequestMetricSink sink);

    /// @brief Counts a sample and forwards it outside the lock.
    void record(RequestMetric metric);

    /// @brief Returns the number of samples recorded for a server and method.
    [[nodiscard]] std::uint64_t requestCount(std::string_view serverId, std::string_view method) const;

    /// @brief Returns the number of failed samples recorded for a server.
    [[nodiscard]] std::uint64_t failureCount(std::string_view serverId) const;

private:
    mutable std::mutex                                         mutex_;
    RequestMetricSink                                          sink_;
    std::map<std::pair<std::string, std::string>, std::uint64_t> requestCounts_;
    std::map<std::string, std::uint64_t>                       failureCounts_;
};

}  // namespace lspmux

#endif  // LSPMUX_SUPPORT_TELEMETRY_H
