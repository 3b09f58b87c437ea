//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// `Content-Length` framing for JSON-RPC over byte streams.
///
/// `FrameDecoder` accepts arbitrarily chunked bytes from a pipe and yields
/// complete JSON messages. `JsonRpcStdioTransport` is a blocking stream
/// transport used by stdio-speaking processes.
///
//===----------------------------------------------------------------------===//
#ifndef LSPMUX_PROTOCOL_JSON_RPC_IO_H
#define LSPMUX_PROTOCOL_JSON_RPC_IO_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lspmux
{

/// Largest accepted `Content-Length`. Larger declarations are treated as malformed headers.
inline constexpr std::size_t MaxContentLength = 64U * 1024U * 1024U;

/// @brief Serializes a message with its `Content-Length` header.
/// @param[in] message JSON payload.
/// @return Framed bytes.
[[nodiscard]] std::string encodeFrame(const llvm::json::Value& message);

/// @brief Parses the value of a `Content-Length` header line (case-insensitive name).
/// @param[in] line Header line without CRLF.
/// @return Declared length, or `std::nullopt` when the line is not a valid length header.
[[nodiscard]] std::optional<std::size_t> parseContentLengthHeader(llvm::StringRef line);

/// @brief Incremental decoder for `Content-Length` framed messages.
class FrameDecoder final
{
public:
    /// @brief Appends bytes and extracts every complete message.
    ///
    /// A header block without a usable `Content-Length` (missing, or above `MaxContentLength`) discards the
    /// buffered bytes.
    /// Bodies that are not valid JSON are skipped and counted.
    ///
    /// @param[in] chunk Newly received bytes.
    /// @return Messages completed by this chunk, in order.
    [[nodiscard]] std::vector<llvm::json::Value> push(llvm::StringRef chunk);

    /// @brief Returns the number of bytes still buffered.
    [[nodiscard]] std::size_t pendingBytes() const
    {
        return buffer_.size();
    }

    /// @brief Returns how many frames were dropped as malformed.
    [[nodiscard]] std::size_t droppedFrames() const
    {
        return droppedFrames_;
    }

private:
    std::string buffer_;
    std::size_t droppedFrames_{0};
};

/// @brief Blocking JSON-RPC transport over input and output streams.
///
/// Used by processes that speak LSP on their own stdio, such as test servers.
class JsonRpcStdioTransport final
{
public:
    JsonRpcStdioTransport(std::istream& in, std::ostream& out);

    /// @brief Blocks until one frame is read.
    /// @param[out] message Decoded body.
    /// @param[out] error Reason when a frame was present but unusable; empty at end of input.
    /// @return `false` at end of input or on a bad frame.
    [[nodiscard]] bool readMessage(llvm::json::Value& message, std::string& error);

    /// @brief Frames and flushes one message; safe to call from several threads.
    [[nodiscard]] bool writeMessage(const llvm::json::Value& message);

private:
    std::istream& input_;
    std::ostream& output_;
    std::mutex    writeMutex_;
};

}  // namespace lspmux

#endif  // LSPMUX_PROTOCOL_JSON_RPC_IO_H
