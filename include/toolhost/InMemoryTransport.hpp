//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport for tests and embedding
//==========================================================================================================
#pragma once

#include "toolhost/Transport.h"
#include <memory>
#include <utility>

namespace toolhost {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport used for tests and embedding. Delivers message bodies to a paired
//          instance without framing or I/O. Each side delivers inbound messages in order on its own
//          processing thread. Closing one side reports "peer closed" to the other after all messages
//          sent before the close have been delivered.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    virtual ~InMemoryTransport();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired transports wired to each other in-memory.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    bool SendMessage(const std::string& payload) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetFramingErrorHandler(FramingErrorHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
