//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements trace-level filtered logging.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Support/Logging.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace lspmux
{

std::optional<TraceLevel> parseTraceLevel(llvm::StringRef text)
{
    std::string normalized(text.trim().str());
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](const unsigned char value) {
        return static_cast<char>(std::tolower(value));
    });

    if (normalized == "off")
    {
        return TraceLevel::Off;
    }
    if (normalized == "basic")
    {
        return TraceLevel::Basic;
    }
    if (normalized == "verbose")
    {
        return TraceLevel::Verbose;
    }
    return std::nullopt;
}

Logger::Logger(LogSink sink, const TraceLevel level)
    : sink_(std::move(sink))
    , level_(level)
{
}

void Logger::basic(llvm::StringRef message) const
{
    emit(TraceLevel::Basic, message);
}

void Logger::verbose(llvm::StringRef message) const
{
    emit(TraceLevel::Verbose, message);
}

void Logger::emit(const TraceLevel level, llvm::StringRef message) const
{
    if (!sink_ || level_ == TraceLevel::Off)
    {
        return;
    }
    if (level == TraceLevel::Verbose && level_ != TraceLevel::Verbose)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sink_(level, message);
}

}  // namespace lspmux
