//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Content-Length message framing and an incremental frame reader for byte streams
//========================================================================================================

#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>

namespace toolhost {

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // header+sep or full frame bytes to drop when appropriate
        std::size_t declaredLength{0};      // body length from the header (BodyTooLarge: bytes to skip)
        std::string detail;                 // diagnostic for InvalidHeader/BodyTooLarge
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 2 * 1024 * 1024);

//========================================================================================================
// FrameReader
// Purpose: Accumulates arbitrary chunks of a byte stream and yields complete messages or framing errors
//          in stream order. Only raw bytes are buffered between calls; every Next() re-parses from the
//          start of the buffer.
// Notes:
//   - An invalid header is dropped (header and separator) and reported. Bytes up to the next
//     "Content-Length:" (any case) are then discarded, so a body sent after a bad header is skipped.
//   - An oversized body is skipped in full, including bytes that have not arrived yet.
//   - A header block longer than MaxHeaderBytes with no terminator is discarded and reported.
//   - Not thread-safe; owned by a single reader thread.
//========================================================================================================
class FrameReader {
public:
    static constexpr std::size_t MaxHeaderBytes = 8 * 1024;

    struct FrameEvent {
        enum class Kind { Message, Error };
        Kind kind;
        std::string data; // payload for Message, diagnostic for Error
    };

    explicit FrameReader(std::size_t maxContentLength = 2 * 1024 * 1024);

    void Feed(const char* data, std::size_t n);
    void Feed(const std::string& chunk) { Feed(chunk.data(), chunk.size()); }

    // Next decoded event, or nullopt when more bytes are needed.
    std::optional<FrameEvent> Next();

    std::size_t BufferedBytes() const { return buffer.size(); }

private:
    std::unique_ptr<IContentFramer> framer;
    std::string buffer;
    std::size_t skipRemaining{0};
    bool resyncing{false};

    // Drops bytes before the next header start; returns true once one is at the front of the buffer.
    bool resynchronize();
};

} // namespace toolhost
