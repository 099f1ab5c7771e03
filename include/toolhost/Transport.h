//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Message-level transport interfaces. A transport moves opaque message bodies; it knows
//          framing but nothing about JSON-RPC.
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <cstdint>

namespace toolhost {

//==========================================================================================================
// Transport interface
// Purpose: Single-session bidirectional message channel.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loops.
    // Returns:
    //   A future that completes when the transport is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport. Messages already accepted by SendMessage are flushed before the future
    // completes (bounded by the transport's close flush limit).
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    // Indicates whether the transport can still send messages.
    virtual bool IsConnected() const = 0;

    // Returns a transport session identifier for diagnostics.
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Queues one message body for writing. Each body is written as one uninterrupted frame.
    // Args:
    //   payload: Serialized message body.
    // Returns:
    //   true when queued; false when the transport is closed or its write queue overflowed.
    // Notes:
    //   Safe to call from any thread.
    //==========================================================================================================
    virtual bool SendMessage(const std::string& payload) = 0;

    /////////////////////////////////////////// Inbound handling ///////////////////////////////////////////
    //==========================================================================================================
    // Registers the callback invoked once per complete inbound message body, in stream order, on the
    // transport's reader thread. Handlers must not block for long.
    //==========================================================================================================
    using MessageHandler = std::function<void(const std::string& payload)>;
    virtual void SetMessageHandler(MessageHandler handler) = 0;

    //==========================================================================================================
    // Registers the callback invoked for recoverable framing errors (bad header, oversized body).
    // The stream continues after the callback returns.
    //==========================================================================================================
    using FramingErrorHandler = std::function<void(const std::string& detail)>;
    virtual void SetFramingErrorHandler(FramingErrorHandler handler) = 0;

    /////////////////////////////////////////// Error handling ///////////////////////////////////////////
    //==========================================================================================================
    // Registers an error handler for terminal transport conditions (EOF, read/write failure, queue
    // overflow). After it fires no further inbound messages are delivered.
    //==========================================================================================================
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

} // namespace toolhost
