//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Concrete stdio-based transport with Content-Length framing
//==========================================================================================================
#pragma once

#include "toolhost/Transport.h"
#include <memory>
#include <cstddef>
#include <unistd.h>

namespace toolhost {

//==========================================================================================================
// StdioTransport
// Purpose: Framed message transport over a pair of file descriptors (stdin/stdout by default).
// Notes:
//   - A reader thread waits on epoll (input fd plus a wake eventfd) and feeds a FrameReader.
//   - A writer thread drains a byte-bounded queue; frames are never interleaved.
//   - The descriptors are not closed by the transport.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    explicit StdioTransport(int inFd = STDIN_FILENO, int outFd = STDOUT_FILENO);
    virtual ~StdioTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    bool SendMessage(const std::string& payload) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetFramingErrorHandler(FramingErrorHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetMaxContentLength
    // Purpose: Largest accepted inbound body; larger frames are skipped and reported as framing errors.
    //          Must be called before Start().
    //==========================================================================================================
    void SetMaxContentLength(std::size_t maxBytes);

    //==========================================================================================================
    // SetWriteQueueMaxBytes
    // Purpose: Backpressure clamp for pending write buffers.
    // Args:
    //   maxBytes: Maximum allowed bytes in write queue before emitting an error and closing.
    //==========================================================================================================
    void SetWriteQueueMaxBytes(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
