//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Session lifecycle: transport wiring, serve loop and shutdown ordering
//==========================================================================================================

#include "toolhost/Server.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolhost/Dispatcher.h"

namespace toolhost {

class Server::Impl {
public:
    std::shared_ptr<ServerContext> context;
    // Declared before the transport so the reader thread is joined first
    std::unique_ptr<Dispatcher> dispatcher;
    std::unique_ptr<ITransport> transport;
    std::function<void(const std::string&)> errorCallback;

    std::atomic<bool> running{false};
    std::atomic<bool> stopped{false};
    std::mutex endMutex;
    std::condition_variable endCv;
    bool ended = false;

    explicit Impl(std::shared_ptr<ServerContext> ctx) : context(std::move(ctx)) {
        if (!context) {
            throw std::invalid_argument("Server requires a context");
        }
    }

    void signalEnd() {
        {
            std::lock_guard<std::mutex> lock(endMutex);
            ended = true;
        }
        endCv.notify_all();
    }

    void send(const std::string& payload) {
        if (!transport || !transport->SendMessage(payload)) {
            LOG_ERROR("Server: dropped outbound message ({} bytes): transport unavailable", payload.size());
        }
    }
};

Server::Server(std::shared_ptr<ServerContext> context)
    : pImpl(std::make_unique<Impl>(std::move(context))) {}

Server::~Server() {
    try {
        Stop().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Server: stop during destruction failed: {}", e.what());
    }
}

std::future<void> Server::Start(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    if (!transport) {
        throw std::invalid_argument("Server::Start requires a transport");
    }
    if (pImpl->transport) {
        throw std::logic_error("Server already started");
    }
    pImpl->transport = std::move(transport);
    pImpl->dispatcher = std::make_unique<Dispatcher>(*pImpl->context, [this](const std::string& payload) {
        pImpl->send(payload);
    });

    pImpl->transport->SetMessageHandler([this](const std::string& payload) {
        try {
            pImpl->dispatcher->HandleMessage(payload);
        } catch (const std::exception& e) {
            LOG_ERROR("Server: message handler exception: {}", e.what());
        }
    });
    pImpl->transport->SetFramingErrorHandler([this](const std::string& detail) {
        pImpl->dispatcher->HandleFramingError(detail);
    });
    pImpl->transport->SetErrorHandler([this](const std::string& err) {
        LOG_INFO("Server: transport ended: {}", err);
        if (pImpl->errorCallback) {
            try {
                pImpl->errorCallback(err);
            } catch (const std::exception& e) {
                LOG_ERROR("Server: error callback exception: {}", e.what());
            }
        }
        pImpl->signalEnd();
    });

    pImpl->running.store(true);
    LOG_INFO("Server: starting session {}", pImpl->transport->GetSessionId());
    return pImpl->transport->Start();
}

std::future<void> Server::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    if (pImpl->stopped.exchange(true) || !pImpl->transport) {
        pImpl->signalEnd();
        done.set_value();
        return fut;
    }
    LOG_INFO("Server: stopping");
    try {
        // Cancelled responses for in-flight calls go out before the transport closes
        pImpl->context->Supervisor().Shutdown();
        pImpl->transport->Close().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Server: stop failed: {}", e.what());
        pImpl->running.store(false);
        pImpl->signalEnd();
        done.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(false);
    pImpl->signalEnd();
    done.set_value();
    return fut;
}

void Server::Serve(std::unique_ptr<ITransport> transport) {
    Start(std::move(transport)).get();
    {
        std::unique_lock<std::mutex> lock(pImpl->endMutex);
        pImpl->endCv.wait(lock, [this]() { return pImpl->ended; });
    }
    Stop().get();
}

bool Server::IsRunning() const {
    return pImpl->running.load();
}

void Server::SetErrorHandler(std::function<void(const std::string&)> handler) {
    pImpl->errorCallback = std::move(handler);
}

} // namespace toolhost
