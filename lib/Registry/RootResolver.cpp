//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements marker-based server root resolution.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Registry/RootResolver.h"

#include "lspmux/Support/Paths.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/GlobPattern.h"
#include "llvm/Support/Path.h"

#include <system_error>

namespace lspmux
{

bool markerMatchesDirectory(llvm::StringRef marker, llvm::StringRef directory)
{
    marker = marker.rtrim('/');
    if (marker.empty())
    {
        return false;
    }

    if (!hasGlobPattern(marker))
    {
        llvm::SmallString<256> candidate(directory);
        llvm::sys::path::append(candidate, marker);
        return llvm::sys::fs::exists(candidate);
    }

    llvm::Expected<llvm::GlobPattern> pattern = llvm::GlobPattern::create(marker);
    if (!pattern)
    {
        llvm::consumeError(pattern.takeError());
        return false;
    }

    std::error_code ec;
    for (llvm::sys::fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
    {
        if (pattern->match(llvm::sys::path::filename(it->path())))
        {
            return true;
        }
    }
    return false;
}

std::optional<std::string> findRootByMarkers(llvm::StringRef                 filePath,
                                             const std::vector<std::string>& markers,
                                             llvm::StringRef                 boundaryRoot)
{
    if (markers.empty())
    {
        return std::nullopt;
    }

    const std::string boundary = boundaryRoot.empty() ? std::string() : stripTrailingSeparators(boundaryRoot);
    std::string       current  = parentDirectory(filePath);
    while (true)
    {
        if (!boundary.empty() && !isWithinRoot(stripTrailingSeparators(current), boundary))
        {
            return std::nullopt;
        }

        for (const std::string& marker : markers)
        {
            if (markerMatchesDirectory(marker, current))
            {
                return current;
            }
        }

        const std::string parent = parentDirectory(current);
        if (parent == current)
        {
            return std::nullopt;
        }
        current = parent;
    }
}

std::optional<std::string> resolveServerRoot(llvm::StringRef         filePath,
                                             const ServerDefinition& server,
                                             llvm::StringRef         workspaceRoot)
{
    if (findRootByMarkers(filePath, server.excludeRoots, workspaceRoot))
    {
        return std::nullopt;
    }

    if (std::optional<std::string> markerRoot = findRootByMarkers(filePath, server.roots, workspaceRoot))
    {
        return markerRoot;
    }

    if (server.rootMode == RootMode::MarkerOnly)
    {
        return std::nullopt;
    }

    if (isWithinRoot(stripTrailingSeparators(filePath), stripTrailingSeparators(workspaceRoot)))
    {
        return workspaceRoot.str();
    }
    return parentDirectory(filePath);
}

std::string serverRootKey(llvm::StringRef serverId, llvm::StringRef root)
{
    return (serverId + "::" + root).str();
}

std::optional<std::pair<std::string, std::string>> parseServerRootKey(llvm::StringRef key)
{
    const std::size_t separator = key.find("::");
    if (separator == llvm::StringRef::npos)
    {
        return std::nullopt;
    }
    return std::make_pair(key.substr(0, separator).str(), key.substr(separator + 2).str());
}

}  // namespace lspmux
