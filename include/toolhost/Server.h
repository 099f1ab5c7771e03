//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Server facade - owns the session transport and wires it to the dispatcher
//==========================================================================================================
#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

#include "toolhost/ServerContext.h"
#include "toolhost/Transport.h"

namespace toolhost {

//==========================================================================================================
// Server
// Purpose: Single-session server. One transport per Server lifetime.
//==========================================================================================================
class Server {
public:
    explicit Server(std::shared_ptr<ServerContext> context);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts serving on 'transport'.
    // Args:
    //   transport: Transport to own; its handlers are replaced.
    // Returns:
    //   A future that completes once the transport is running.
    // Throws:
    //   std::logic_error when already started.
    //==========================================================================================================
    std::future<void> Start(std::unique_ptr<ITransport> transport);

    //==========================================================================================================
    // Stops the session: cancels in-flight calls (their Cancelled responses are still sent), then closes
    // the transport after queued output is flushed. Idempotent.
    //==========================================================================================================
    std::future<void> Stop();

    //==========================================================================================================
    // Serve
    // Purpose: Start(), block until the transport ends (EOF, I/O failure) or Stop() is called, then
    //          stop.
    //==========================================================================================================
    void Serve(std::unique_ptr<ITransport> transport);

    bool IsRunning() const;

    // Observes terminal transport errors (called on the transport thread).
    void SetErrorHandler(std::function<void(const std::string&)> handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
