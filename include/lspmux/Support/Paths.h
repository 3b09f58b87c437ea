//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Path, URI, and workspace-boundary helpers.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_SUPPORT_PATHS_H
#define LSPMUX_SUPPORT_PATHS_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <optional>
#include <string>
#include <vector>

namespace lspmux
{

/// @brief Resolves symlinks, falling back to the absolute dot-free path.
/// @param[in] path Input path.
/// @return Real path when resolvable, otherwise the absolute form of `path`.
[[nodiscard]] std::string realPathOrAbsolute(llvm::StringRef path);

/// @brief Returns `path` with trailing separators removed (`/` stays `/`).
/// @param[in] path Input path.
/// @return Normalized path.
[[nodiscard]] std::string stripTrailingSeparators(llvm::StringRef path);

/// @brief Returns whether `path` equals `root` or lies below it.
///
/// This is a lexical check; callers pass normalized paths.
///
/// @param[in] path Candidate path.
/// @param[in] root Root path.
/// @return `true` when contained.
[[nodiscard]] bool isWithinRoot(llvm::StringRef path, llvm::StringRef root);

/// @brief Returns the parent directory, or `path` itself at the filesystem root.
/// @param[in] path Input path.
/// @return Parent directory.
[[nodiscard]] std::string parentDirectory(llvm::StringRef path);

/// @brief Returns whether the text contains glob metacharacters.
/// @param[in] text Marker or path text.
/// @return `true` when any of `*?{}()[]!+@` is present.
[[nodiscard]] bool hasGlobPattern(llvm::StringRef text);

/// @brief Returns the current user's home directory, or empty when unknown.
[[nodiscard]] std::string homeDirectory();

/// @brief Converts an absolute path to a percent-encoded `file://` URI.
/// @param[in] path Absolute path.
/// @return File URI.
[[nodiscard]] std::string pathToFileUri(llvm::StringRef path);

/// @brief Converts a `file://` URI back to a path.
/// @param[in] uri File URI.
/// @return Decoded path, or `std::nullopt` for non-file or malformed URIs.
[[nodiscard]] std::optional<std::string> fileUriToPath(llvm::StringRef uri);

/// @brief Result of caller-path normalization.
struct NormalizedPath final
{
    /// @brief Path exactly as supplied.
    std::string raw;

    /// @brief Input after stripping a leading `@` and whitespace.
    std::string normalizedInput;

    /// @brief Absolute path resolved against the working directory.
    std::string absolutePath;

    /// @brief Symlink-resolved path.
    std::string realPath;
};

/// @brief Options for `normalizeCallerPath`.
struct PathBoundaryOptions final
{
    /// @brief Directory relative inputs are resolved against.
    std::string cwd;

    /// @brief Roots the resolved path must stay within.
    std::vector<std::string> boundaryRoots;

    /// @brief Disables the boundary check when `true`.
    bool allowExternalPaths{false};

    /// @brief Requires the resolved path to name a readable file.
    bool requireReadableFile{false};
};

/// @brief Resolves a caller-supplied path and enforces the workspace boundary.
/// @param[in] rawPath Caller path, relative or absolute, optionally `@`-prefixed.
/// @param[in] options Boundary options.
/// @return Normalized path, or an error when outside the boundary or unreadable.
[[nodiscard]] llvm::Expected<NormalizedPath> normalizeCallerPath(llvm::StringRef            rawPath,
                                                                 const PathBoundaryOptions& options);

}  // namespace lspmux

#endif  // LSPMUX_SUPPORT_PATHS_H
