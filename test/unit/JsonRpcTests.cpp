//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Content-Length framing tests for the stream decoder and stdio transport.
///
/// Frames are fed in arbitrary chunk boundaries and malformed headers to make
/// sure complete messages are recovered in order and bad input is dropped.
///
//===----------------------------------------------------------------------===//

#include "lspmux/Protocol/JsonRpcIO.h"

#include "llvm/Support/JSON.h"

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace
{

std::string frame(const std::string& payload)
{
    return "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" + payload;
}

std::int64_t idOf(const llvm::json::Value& message)
{
    const llvm::json::Object* object = message.getAsObject();
    if (object == nullptr)
    {
        return -1;
    }
    const auto id = object->getInteger("id");
    return id ? *id : -1;
}

}  // namespace

bool runJsonRpcTests()
{
    {
        if (lspmux::parseContentLengthHeader("Content-Length: 42") != 42U ||
            lspmux::parseContentLengthHeader("content-length:7") != 7U ||
            lspmux::parseContentLengthHeader("Content-Type: x") ||
            lspmux::parseContentLengthHeader("Content-Length: 4x"))
        {
            std::cerr << "Content-Length header parsing mismatch\n";
            return false;
        }
    }

    {
        const std::string stream = frame(R"({"id":1})") + frame(R"({"id":2,"text":"héllo"})") + frame(R"({"id":3})");
        lspmux::FrameDecoder           decoder;
        std::vector<llvm::json::Value> messages;
        for (std::size_t offset = 0; offset < stream.size(); offset += 3)
        {
            for (llvm::json::Value& message : decoder.push(llvm::StringRef(stream).substr(offset, 3)))
            {
                messages.push_back(std::move(message));
            }
        }
        if (messages.size() != 3U || idOf(messages[0]) != 1 || idOf(messages[1]) != 2 || idOf(messages[2]) != 3)
        {
            std::cerr << "chunked frames were not reassembled in order\n";
            return false;
        }
        if (decoder.pendingBytes() != 0U || decoder.droppedFrames() != 0U)
        {
            std::cerr << "decoder should be drained after complete frames\n";
            return false;
        }
    }

    {
        lspmux::FrameDecoder decoder;
        const auto           batch = decoder.push(frame(R"({"id":1})") + frame(R"({"id":2})"));
        if (batch.size() != 2U)
        {
            std::cerr << "two frames in one chunk should both decode\n";
            return false;
        }
        const auto partial = decoder.push("Content-Length: 10\r\n\r\n{\"id\"");
        if (!partial.empty() || decoder.pendingBytes() == 0U)
        {
            std::cerr << "partial body should stay buffered\n";
            return false;
        }
        const auto completed = decoder.push(":9}  ");
        if (completed.size() != 1U || idOf(completed[0]) != 9)
        {
            std::cerr << "buffered body should complete on the next chunk\n";
            return false;
        }
    }

    {
        lspmux::FrameDecoder decoder;
        const auto           noLength = decoder.push("X-Header: 1\r\n\r\n{}");
        if (!noLength.empty() || decoder.pendingBytes() != 0U || decoder.droppedFrames() != 1U)
        {
            std::cerr << "header without Content-Length should discard the buffer\n";
            return false;
        }
        const auto badJson = decoder.push(frame("{not json}") + frame(R"({"id":5})"));
        if (badJson.size() != 1U || idOf(badJson[0]) != 5 || decoder.droppedFrames() != 2U)
        {
            std::cerr << "invalid JSON body should be skipped without losing the next frame\n";
            return false;
        }
        const auto badUtf8 = decoder.push(frame("{\"id\":6,\"result\":\"\xff\xfe\"}") + frame(R"({"id":7})"));
        if (badUtf8.size() != 1U || idOf(badUtf8[0]) != 7 || decoder.droppedFrames() != 3U)
        {
            std::cerr << "body with invalid UTF-8 should be counted as dropped\n";
            return false;
        }
    }

    {
        const std::string limit = std::to_string(lspmux::MaxContentLength);
        if (lspmux::parseContentLengthHeader("Content-Length: " + limit) != lspmux::MaxContentLength ||
            lspmux::parseContentLengthHeader("Content-Length: " + std::to_string(lspmux::MaxContentLength + 1U)) ||
            lspmux::parseContentLengthHeader("Content-Length: 99999999999999999999999999"))
        {
            std::cerr << "oversized Content-Length should be rejected\n";
            return false;
        }

        lspmux::FrameDecoder decoder;
        const auto           oversized = decoder.push("Content-Length: 18446744073709551617\r\n\r\n{}");
        if (!oversized.empty() || decoder.pendingBytes() != 0U || decoder.droppedFrames() != 1U)
        {
            std::cerr << "decoder should discard a frame declaring an oversized body\n";
            return false;
        }
        const auto next = decoder.push(frame(R"({"id":8})"));
        if (next.size() != 1U || idOf(next[0]) != 8)
        {
            std::cerr << "decoder should recover after an oversized declaration\n";
            return false;
        }
    }

    {
        const llvm::json::Value message = llvm::json::Object{{"jsonrpc", "2.0"}, {"id", 4}, {"result", nullptr}};
        std::istringstream      in(lspmux::encodeFrame(message));
        std::ostringstream      out;
        lspmux::JsonRpcStdioTransport transport(in, out);

        llvm::json::Value read(nullptr);
        std::string       error;
        if (!transport.readMessage(read, error) || idOf(read) != 4)
        {
            std::cerr << "transport failed to read an encoded frame: " << error << "\n";
            return false;
        }
        if (transport.readMessage(read, error) || !error.empty())
        {
            std::cerr << "end of stream should return false without an error\n";
            return false;
        }
        if (!transport.writeMessage(message) || out.str() != lspmux::encodeFrame(message))
        {
            std::cerr << "transport output should match encodeFrame\n";
            return false;
        }
    }

    {
        std::istringstream            in("Content-Length: 10\r\n\r\n{}");
        std::ostringstream            out;
        lspmux::JsonRpcStdioTransport transport(in, out);
        llvm::json::Value             message(nullptr);
        std::string                   error;
        if (transport.readMessage(message, error) || error != "truncated JSON-RPC payload")
        {
            std::cerr << "expected truncated payload error\n";
            return false;
        }
    }
    return true;
}
