//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements retry backoff computation.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Runtime/Backoff.h"

#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <mutex>
#include <random>

namespace lspmux
{

std::chrono::milliseconds computeBackoffDelay(const unsigned attempts, const double jitterFactor)
{
    const unsigned exponent    = attempts == 0 ? 0U : std::min(attempts - 1U, 16U);
    const auto     exponential = std::min<std::int64_t>(BackoffCapDelay.count(), BackoffBaseDelay.count() << exponent);
    const double   jitter      = std::clamp(jitterFactor, BackoffJitterMin, BackoffJitterMax);
    const auto     scaled      = static_cast<std::int64_t>(std::llround(static_cast<double>(exponential) * jitter));
    return std::chrono::milliseconds(std::max<std::int64_t>(BackoffMinimumDelay.count(), scaled));
}

double randomJitterFactor()
{
    static std::mutex   mutex;
    static std::mt19937 engine{std::random_device{}()};

    std::lock_guard<std::mutex>            lock(mutex);
    std::uniform_real_distribution<double> distribution(BackoffJitterMin, BackoffJitterMax);
    return distribution(engine);
}

BrokenState nextBrokenState(const BrokenState*                          previous,
                            std::string                                 message,
                            const std::chrono::system_clock::time_point now,
                            const double                                jitterFactor)
{
    BrokenState next;
    next.attempts  = (previous == nullptr ? 0U : previous->attempts) + 1U;
    next.retryAt   = now + computeBackoffDelay(next.attempts, jitterFactor);
    next.lastError = std::move(message);
    return next;
}

std::string formatTimestamp(const std::chrono::system_clock::time_point time)
{
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    const auto        millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
    std::tm utc{};
    ::gmtime_r(&seconds, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

    std::string              out;
    llvm::raw_string_ostream stream(out);
    stream << date << "." << llvm::format("%03d", static_cast<int>(millis)) << "Z";
    stream.flush();
    return out;
}

}  // namespace lspmux
