//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements cooperative cancellation flags.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Support/Cancellation.h"

#include <utility>

namespace lspmux
{

AbortSignal::AbortSignal(std::shared_ptr<std::atomic_bool> state)
    : state_(std::move(state))
{
}

bool AbortSignal::aborted() const
{
    return state_ && state_->load(std::memory_order_relaxed);
}

AbortController::AbortController()
    : state_(std::make_shared<std::atomic_bool>(false))
{
}

void AbortController::abort()
{
    state_->store(true, std::memory_order_relaxed);
}

AbortSignal AbortController::signal() const
{
    return AbortSignal(state_);
}

}  // namespace lspmux
