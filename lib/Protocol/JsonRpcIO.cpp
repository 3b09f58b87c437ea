//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `Content-Length` framing, incremental decoding, and the stream transport.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Protocol/JsonRpcIO.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/raw_ostream.h"

#include <istream>
#include <ostream>
#include <utility>

namespace lspmux
{
namespace
{

constexpr llvm::StringLiteral HeaderTerminator = "\r\n\r\n";

std::optional<std::size_t> findContentLength(llvm::StringRef headerBlock)
{
    llvm::SmallVector<llvm::StringRef, 4> lines;
    headerBlock.split(lines, "\r\n");
    for (const llvm::StringRef line : lines)
    {
        if (const std::optional<std::size_t> length = parseContentLengthHeader(line))
        {
            return length;
        }
    }
    return std::nullopt;
}

}  // namespace

std::string encodeFrame(const llvm::json::Value& message)
{
    std::string              payload;
    llvm::raw_string_ostream payloadStream(payload);
    payloadStream << message;
    payloadStream.flush();
    return "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" + payload;
}

std::optional<std::size_t> parseContentLengthHeader(llvm::StringRef line)
{
    const std::size_t colon = line.find(':');
    if (colon == llvm::StringRef::npos || !line.substr(0, colon).trim().equals_insensitive("content-length"))
    {
        return std::nullopt;
    }

    const llvm::StringRef digits = line.substr(colon + 1).trim();
    if (digits.empty())
    {
        return std::nullopt;
    }
    std::size_t value = 0;
    for (const char ch : digits)
    {
        if (ch < '0' || ch > '9')
        {
            return std::nullopt;
        }
        value = value * 10U + static_cast<std::size_t>(ch - '0');
        if (value > MaxContentLength)
        {
            return std::nullopt;
        }
    }
    return value;
}

std::vector<llvm::json::Value> FrameDecoder::push(llvm::StringRef chunk)
{
    std::vector<llvm::json::Value> messages;
    buffer_.append(chunk.data(), chunk.size());

    std::size_t offset = 0;
    while (true)
    {
        const llvm::StringRef view(buffer_.data() + offset, buffer_.size() - offset);
        const std::size_t     headerEnd = view.find(HeaderTerminator);
        if (headerEnd == llvm::StringRef::npos)
        {
            break;
        }

        const std::optional<std::size_t> length = findContentLength(view.substr(0, headerEnd));
        if (!length)
        {
            ++droppedFrames_;
            buffer_.clear();
            return messages;
        }

        const std::size_t bodyStart = headerEnd + HeaderTerminator.size();
        if (view.size() - bodyStart < *length)
        {
            break;
        }

        llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(view.substr(bodyStart, *length));
        if (parsed)
        {
            messages.push_back(std::move(*parsed));
        }
        else
        {
            llvm::consumeError(parsed.takeError());
            ++droppedFrames_;
        }
        offset += bodyStart + *length;
    }

    buffer_.erase(0, offset);
    return messages;
}

JsonRpcStdioTransport::JsonRpcStdioTransport(std::istream& in, std::ostream& out)
    : input_(in)
    , output_(out)
{
}

bool JsonRpcStdioTransport::readMessage(llvm::json::Value& message, std::string& error)
{
    std::optional<std::size_t> contentLength;
    bool                       hasHeaders = false;
    std::string                line;
    while (std::getline(input_, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            break;
        }

        hasHeaders = true;
        if (const std::optional<std::size_t> parsedLength = parseContentLengthHeader(line))
        {
            contentLength = parsedLength;
        }
    }

    if (!hasHeaders)
    {
        return false;
    }

    if (!contentLength)
    {
        error = "missing Content-Length header";
        return false;
    }

    std::string payload(*contentLength, '\0');
    input_.read(payload.data(), static_cast<std::streamsize>(*contentLength));
    if (input_.gcount() != static_cast<std::streamsize>(*contentLength))
    {
        error = "truncated JSON-RPC payload";
        return false;
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(payload);
    if (!parsed)
    {
        error = "invalid JSON payload: " + llvm::toString(parsed.takeError());
        return false;
    }

    message = std::move(*parsed);
    return true;
}

bool JsonRpcStdioTransport::writeMessage(const llvm::json::Value& message)
{
    const std::string frame = encodeFrame(message);

    std::lock_guard<std::mutex> lock(writeMutex_);
    output_ << frame;
    output_.flush();
    return static_cast<bool>(output_);
}

}  // namespace lspmux
