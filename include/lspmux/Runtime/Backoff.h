//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Retry backoff for server instances that failed to spawn or lost their pipe.
///
/// The delay doubles per attempt from a 5 s base, is capped at 60 s, is scaled
/// by a jitter factor in [0.8, 1.2], and never drops below 1 s.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_RUNTIME_BACKOFF_H
#define LSPMUX_RUNTIME_BACKOFF_H

#include <chrono>
#include <string>

namespace lspmux
{

inline constexpr std::chrono::milliseconds BackoffBaseDelay{5000};
inline constexpr std::chrono::milliseconds BackoffCapDelay{60000};
inline constexpr std::chrono::milliseconds BackoffMinimumDelay{1000};
inline constexpr double                    BackoffJitterMin = 0.8;
inline constexpr double                    BackoffJitterMax = 1.2;

/// @brief Failure record for one server/root key.
struct BrokenState final
{
    unsigned                              attempts{0};
    std::chrono::system_clock::time_point retryAt;
    std::string                           lastError;

    [[nodiscard]] bool backingOff(std::chrono::system_clock::time_point now) const
    {
        return now < retryAt;
    }
};

/// @brief Computes the retry delay for the given attempt number.
/// @param[in] attempts Attempt count, starting at 1.
/// @param[in] jitterFactor Multiplier, clamped to [0.8, 1.2].
[[nodiscard]] std::chrono::milliseconds computeBackoffDelay(unsigned attempts, double jitterFactor);

/// @brief Draws a uniform jitter factor in [0.8, 1.2].
[[nodiscard]] double randomJitterFactor();

/// @brief Returns the state after one more failure.
/// @param[in] previous Prior record, or null for the first failure.
/// @param[in] message Failure message.
/// @param[in] now Current time.
/// @param[in] jitterFactor Jitter multiplier.
[[nodiscard]] BrokenState nextBrokenState(const BrokenState*                    previous,
                                          std::string                           message,
                                          std::chrono::system_clock::time_point now,
                                          double                                jitterFactor);

/// @brief Formats a time point as an ISO-8601 UTC timestamp.
[[nodiscard]] std::string formatTimestamp(std::chrono::system_clock::time_point time);

}  // namespace lspmux

#endif  // LSPMUX_RUNTIME_BACKOFF_H
