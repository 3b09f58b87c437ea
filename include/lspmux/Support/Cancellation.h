//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Cooperative cancellation for blocking requests and waits.
///
/// An `AbortController` owns the cancellation flag; any number of
/// `AbortSignal` copies observe it. Blocking operations poll the signal while
/// they wait, so an abort is honored within one poll interval.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_SUPPORT_CANCELLATION_H
#define LSPMUX_SUPPORT_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <memory>

namespace lspmux
{

/// @brief Poll interval used by waits that observe an `AbortSignal`.
inline constexpr std::chrono::milliseconds AbortPollInterval{10};

/// @brief Read-only view of a cancellation flag.
///
/// A default-constructed signal can never be aborted.
class AbortSignal final
{
public:
    AbortSignal() = default;

    /// @brief Returns whether cancellation has been requested.
    /// @return `true` when the owning controller aborted.
    [[nodiscard]] bool aborted() const;

private:
    friend class AbortController;
    explicit AbortSignal(std::shared_ptr<std::atomic_bool> state);

    std::shared_ptr<std::atomic_bool> state_;
};

/// @brief Owner of a cancellation flag.
class AbortController final
{
public:
    AbortController();

    /// @brief Requests cancellation for every derived signal.
    void abort();

    /// @brief Returns a signal observing this controller.
    /// @return Signal sharing this controller's flag.
    [[nodiscard]] AbortSignal signal() const;

private:
    std::shared_ptr<std::atomic_bool> state_;
};

}  // namespace lspmux

#endif  // LSPMUX_SUPPORT_CANCELLATION_H
