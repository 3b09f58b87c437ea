//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements path, URI, and boundary helpers.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Support/Paths.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <cctype>
#include <cerrno>
#include <set>
#include <system_error>

#include <unistd.h>

namespace lspmux
{
namespace
{

bool isUriSafeCharacter(const unsigned char ch)
{
    if (std::isalnum(ch))
    {
        return true;
    }
    switch (ch)
    {
    case '-':
    case '.':
    case '_':
    case '~':
    case '/':
    case '!':
    case '$':
    case '&':
    case '\'':
    case '(':
    case ')':
    case '*':
    case '+':
    case ',':
    case ';':
    case '=':
    case ':':
    case '@':
        return true;
    default:
        return false;
    }
}

int hexDigitValue(const char ch)
{
    if (ch >= '0' && ch <= '9')
    {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f')
    {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F')
    {
        return ch - 'A' + 10;
    }
    return -1;
}

std::string absoluteDotFree(llvm::StringRef path, llvm::StringRef cwd)
{
    llvm::SmallString<256> buffer(path);
    if (!llvm::sys::path::is_absolute(buffer))
    {
        if (cwd.empty())
        {
            if (llvm::sys::fs::make_absolute(buffer))
            {
                return path.str();
            }
        }
        else
        {
            llvm::sys::fs::make_absolute(cwd, buffer);
        }
    }
    llvm::sys::path::remove_dots(buffer, /*remove_dot_dot=*/true);
    return std::string(buffer.str());
}

}  // namespace

std::string realPathOrAbsolute(llvm::StringRef path)
{
    llvm::SmallString<256> real;
    if (!llvm::sys::fs::real_path(path, real))
    {
        return std::string(real.str());
    }
    return absoluteDotFree(path, "");
}

std::string stripTrailingSeparators(llvm::StringRef path)
{
    std::string normalized = path.str();
    for (char& ch : normalized)
    {
        if (ch == '\\')
        {
            ch = '/';
        }
    }
    while (normalized.size() > 1 && normalized.back() == '/')
    {
        normalized.pop_back();
    }
    return normalized.empty() ? std::string("/") : normalized;
}

bool isWithinRoot(llvm::StringRef path, llvm::StringRef root)
{
    if (root.empty())
    {
        return false;
    }
    if (path == root)
    {
        return true;
    }
    if (root == "/")
    {
        return !path.empty() && path.front() == '/';
    }
    return path.size() > root.size() && path.substr(0, root.size()) == root && path[root.size()] == '/';
}

std::string parentDirectory(llvm::StringRef path)
{
    const llvm::StringRef parent = llvm::sys::path::parent_path(path);
    if (parent.empty())
    {
        return path.str();
    }
    return parent.str();
}

bool hasGlobPattern(llvm::StringRef text)
{
    return text.find_first_of("*?{}()[]!+@") != llvm::StringRef::npos;
}

std::string homeDirectory()
{
    llvm::SmallString<256> home;
    if (!llvm::sys::path::home_directory(home))
    {
        return {};
    }
    return std::string(home.str());
}

std::string pathToFileUri(llvm::StringRef path)
{
    static constexpr char Hex[] = "0123456789ABCDEF";
    std::string           uri   = "file://";
    if (path.empty() || path.front() != '/')
    {
        uri.push_back('/');
    }
    for (const char raw : path)
    {
        const auto ch = static_cast<unsigned char>(raw);
        if (isUriSafeCharacter(ch))
        {
            uri.push_back(raw);
            continue;
        }
        uri.push_back('%');
        uri.push_back(Hex[ch >> 4U]);
        uri.push_back(Hex[ch & 0x0FU]);
    }
    return uri;
}

std::optional<std::string> fileUriToPath(llvm::StringRef uri)
{
    if (!uri.consume_front("file://"))
    {
        return std::nullopt;
    }
    uri.consume_front("localhost");
    if (uri.empty() || uri.front() != '/')
    {
        return std::nullopt;
    }

    std::string path;
    path.reserve(uri.size());
    for (std::size_t index = 0; index < uri.size(); ++index)
    {
        const char ch = uri[index];
        if (ch != '%')
        {
            path.push_back(ch);
            continue;
        }
        if (index + 2 >= uri.size())
        {
            return std::nullopt;
        }
        const int high = hexDigitValue(uri[index + 1]);
        const int low  = hexDigitValue(uri[index + 2]);
        if (high < 0 || low < 0)
        {
            return std::nullopt;
        }
        path.push_back(static_cast<char>((high << 4) | low));
        index += 2;
    }
    return path;
}

llvm::Expected<NormalizedPath> normalizeCallerPath(llvm::StringRef rawPath, const PathBoundaryOptions& options)
{
    NormalizedPath result;
    result.raw = rawPath.str();

    llvm::StringRef input = rawPath;
    input.consume_front("@");
    input                  = input.trim();
    result.normalizedInput = input.str();
    result.absolutePath    = absoluteDotFree(input, options.cwd);

    llvm::SmallString<256> real;
    if (const std::error_code ec = llvm::sys::fs::real_path(result.absolutePath, real); !ec)
    {
        result.realPath = std::string(real.str());
    }
    else if (ec == std::errc::no_such_file_or_directory)
    {
        llvm::SmallString<256> realParent;
        if (!llvm::sys::fs::real_path(llvm::sys::path::parent_path(result.absolutePath), realParent))
        {
            llvm::sys::path::append(realParent, llvm::sys::path::filename(result.absolutePath));
            result.realPath = std::string(realParent.str());
        }
        else
        {
            result.realPath = result.absolutePath;
        }
    }
    else
    {
        return llvm::createStringError(ec, "Unable to resolve path '%s': %s", result.raw.c_str(), ec.message().c_str());
    }

    if (!options.allowExternalPaths)
    {
        std::set<std::string> roots;
        for (const std::string& root : options.boundaryRoots)
        {
            roots.insert(stripTrailingSeparators(root));
            roots.insert(stripTrailingSeparators(realPathOrAbsolute(root)));
        }

        bool withinBoundary = false;
        for (const std::string& root : roots)
        {
            if (isWithinRoot(result.realPath, root))
            {
                withinBoundary = true;
                break;
            }
        }
        if (!withinBoundary)
        {
            return llvm::createStringError(std::make_error_code(std::errc::permission_denied),
                                           "Path '%s' is outside workspace boundary.",
                                           result.raw.c_str());
        }
    }

    if (options.requireReadableFile)
    {
        if (!llvm::sys::fs::exists(result.realPath))
        {
            return llvm::createStringError(std::make_error_code(std::errc::no_such_file_or_directory),
                                           "File not found: %s",
                                           result.realPath.c_str());
        }
        if (::access(result.realPath.c_str(), R_OK) != 0)
        {
            const std::error_code ec(errno, std::generic_category());
            return llvm::createStringError(ec,
                                           "File is not readable: %s (%s)",
                                           result.realPath.c_str(),
                                           ec.message().c_str());
        }
    }

    return result;
}

}  // namespace lspmux
